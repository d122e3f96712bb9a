/*
Beacon — AdaptivePerformanceController
Role: Keeps the current RenderPolicy in step with measured FPS, the device profile and the
      user's reduced-motion preference.
Inputs/Outputs: FrameRateSampler::fpsChanged, DeviceCapabilitySampler::profileChanged and
      setPrefersReducedMotion() in; policyChanged(RenderPolicy) out, only on actual change.
Threading: GUI thread only.
Integration: Views read policy() or bind to policyChanged; VirtualScrollController takes the
      recommended overscan from it.
Observability: bLog_Render on every policy transition.
Related: RenderPolicy.hpp, FrameRateSampler.hpp, DeviceCapabilities.hpp.
*/
#pragma once

#include "adaptive/DeviceCapabilities.hpp"
#include "adaptive/RenderPolicy.hpp"
#include "config/InteractionConfig.hpp"
#include <QObject>
#include <QPointer>

class FrameRateSampler;

class AdaptivePerformanceController : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool reducedMotion READ reducedMotion NOTIFY policyChanged)
    Q_PROPERTY(quint32 animationDurationMs READ animationDurationMs NOTIFY policyChanged)

public:
    explicit AdaptivePerformanceController(const AccessibilityConfig& accessibility = {},
                                           QObject* parent = nullptr);

    void attachFrameSampler(FrameRateSampler* sampler);
    void attachCapabilitySampler(DeviceCapabilitySampler* sampler);

    const RenderPolicy& policy() const { return m_policy; }
    bool reducedMotion() const { return m_policy.reducedMotion; }
    quint32 animationDurationMs() const { return m_policy.animationDurationMs; }

    double fps() const { return m_fps; }
    const CapabilityProfile& profile() const { return m_profile; }
    bool prefersReducedMotion() const { return m_prefersReducedMotion; }

public slots:
    void setFps(double fps);
    void setProfile(const CapabilityProfile& profile);
    void setPrefersReducedMotion(bool prefers);

signals:
    void policyChanged(const RenderPolicy& policy);

private:
    void recompute();

    QPointer<FrameRateSampler> m_frameSampler;
    QPointer<DeviceCapabilitySampler> m_capabilitySampler;

    double m_fps;
    CapabilityProfile m_profile;
    bool m_prefersReducedMotion;
    RenderPolicy m_policy;
};
