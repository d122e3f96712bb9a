#include "adaptive/RenderPolicy.hpp"

RenderPolicy RenderPolicyResolver::resolve(double fps, bool prefersReducedMotion, const CapabilityProfile& profile) {
    RenderPolicy policy;
    policy.reducedMotion = prefersReducedMotion || fps < REDUCED_MOTION_FPS;

    if (policy.reducedMotion) {
        policy.animationDurationMs = 0;
    } else {
        policy.animationDurationMs = fps < SLOW_ANIMATION_FPS ? SLOW_ANIMATION_MS : DEFAULT_ANIMATION_MS;
    }

    policy.frameBudgetMs = profile.isLowEnd ? 1000.0 / 30.0 : 1000.0 / 60.0;
    policy.recommendedOverscan = profile.isLowEnd ? LOW_END_OVERSCAN : DEFAULT_OVERSCAN;
    return policy;
}
