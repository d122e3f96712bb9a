#include "adaptive/AdaptivePerformanceController.hpp"
#include "adaptive/FrameRateSampler.hpp"
#include "BeaconLogging.hpp"

AdaptivePerformanceController::AdaptivePerformanceController(const AccessibilityConfig& accessibility, QObject* parent)
    : QObject(parent)
    , m_fps(FrameRateSampler::INITIAL_FPS)
    , m_prefersReducedMotion(accessibility.prefersReducedMotion) {
    m_policy = RenderPolicyResolver::resolve(m_fps, m_prefersReducedMotion, m_profile);
}

void AdaptivePerformanceController::attachFrameSampler(FrameRateSampler* sampler) {
    if (m_frameSampler) {
        disconnect(m_frameSampler, nullptr, this, nullptr);
    }
    m_frameSampler = sampler;
    if (!m_frameSampler) return;

    connect(m_frameSampler, &FrameRateSampler::fpsChanged, this, &AdaptivePerformanceController::setFps);
    setFps(m_frameSampler->fps());
}

void AdaptivePerformanceController::attachCapabilitySampler(DeviceCapabilitySampler* sampler) {
    if (m_capabilitySampler) {
        disconnect(m_capabilitySampler, nullptr, this, nullptr);
    }
    m_capabilitySampler = sampler;
    if (!m_capabilitySampler) return;

    connect(m_capabilitySampler, &DeviceCapabilitySampler::profileChanged,
            this, &AdaptivePerformanceController::setProfile);
    if (m_capabilitySampler->hasSampled()) {
        setProfile(m_capabilitySampler->profile());
    }
}

void AdaptivePerformanceController::setFps(double fps) {
    m_fps = fps;
    recompute();
}

void AdaptivePerformanceController::setProfile(const CapabilityProfile& profile) {
    m_profile = profile;
    recompute();
}

void AdaptivePerformanceController::setPrefersReducedMotion(bool prefers) {
    if (m_prefersReducedMotion == prefers) return;
    m_prefersReducedMotion = prefers;
    recompute();
}

void AdaptivePerformanceController::recompute() {
    const RenderPolicy next = RenderPolicyResolver::resolve(m_fps, m_prefersReducedMotion, m_profile);
    if (next == m_policy) return;

    m_policy = next;
    bLog_Render("🎚️ Render policy: reducedMotion" << m_policy.reducedMotion
                << "animation" << m_policy.animationDurationMs << "ms"
                << "budget" << m_policy.frameBudgetMs << "ms"
                << "overscan" << m_policy.recommendedOverscan
                << "(fps" << m_fps << ")");
    emit policyChanged(m_policy);
}
