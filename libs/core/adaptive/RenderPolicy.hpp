#pragma once

#include "adaptive/DeviceCapabilities.hpp"
#include <QMetaType>
#include <QtGlobal>

struct RenderPolicy {
    bool reducedMotion = false;
    quint32 animationDurationMs = 200;
    double frameBudgetMs = 1000.0 / 60.0;
    int recommendedOverscan = 5;

    bool operator==(const RenderPolicy& other) const = default;
};

Q_DECLARE_METATYPE(RenderPolicy)

class RenderPolicyResolver {
public:
    static constexpr double REDUCED_MOTION_FPS = 30.0;
    static constexpr double SLOW_ANIMATION_FPS = 45.0;
    static constexpr quint32 DEFAULT_ANIMATION_MS = 200;
    static constexpr quint32 SLOW_ANIMATION_MS = 300;
    static constexpr int DEFAULT_OVERSCAN = 5;
    static constexpr int LOW_END_OVERSCAN = 3;

    static RenderPolicy resolve(double fps, bool prefersReducedMotion,
                                const CapabilityProfile& profile = CapabilityProfile{});
};
