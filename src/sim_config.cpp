#include "sim_config.h"

static bool fail(const char** reason, const char* what) {
    if (reason) *reason = what;
    return false;
}

static bool positive(float x) { return std::isfinite(x) && x > 0.0f; }

bool validateConfig(const SimConfig& c, const char** reason) {
    if (c.gridWidth < 3 || c.gridHeight < 3)
        return fail(reason, "grid must be at least 3x3 (solid ring + 1 interior cell)");
    if (c.gridWidth > kMaxGridWidth || c.gridHeight > kMaxGridHeight)
        return fail(reason, "grid exceeds compile-time capacity");
    if (c.particleCount < 1 || c.particleCount > kMaxParticles)
        return fail(reason, "particleCount out of range");
    if (!positive(c.cellSpacing)) return fail(reason, "cellSpacing must be > 0");
    if (!positive(c.timestep)) return fail(reason, "timestep must be > 0");
    if (!std::isfinite(c.gravity)) return fail(reason, "gravity must be finite");
    if (c.projectionIterations < 1) return fail(reason, "projectionIterations must be >= 1");
    if (!(c.overrelaxation > 1.0f && c.overrelaxation < 2.0f))
        return fail(reason, "overrelaxation must be in (1,2)");
    if (!(c.flipPicBlend >= 0.0f && c.flipPicBlend <= 1.0f))
        return fail(reason, "flipPicBlend must be in [0,1]");
    if (!positive(c.particleRadius)) return fail(reason, "particleRadius must be > 0");
    if (!(c.minSeparation >= 0.0f) || !std::isfinite(c.minSeparation))
        return fail(reason, "minSeparation must be >= 0");
    if (c.collisionIterations < 0) return fail(reason, "collisionIterations must be >= 0");
    if (!(c.velocityDamping > 0.0f && c.velocityDamping <= 1.0f))
        return fail(reason, "velocityDamping must be in (0,1]");
    if (!(c.wallRestitution >= 0.0f && c.wallRestitution <= 1.0f))
        return fail(reason, "wallRestitution must be in [0,1]");

    // Interior must leave room for a particle between the clamp margins.
    const float interiorW = (c.gridWidth - 2) * c.cellSpacing;
    const float interiorH = (c.gridHeight - 2) * c.cellSpacing;
    if (interiorW <= 2.0f * c.particleRadius || interiorH <= 2.0f * c.particleRadius)
        return fail(reason, "particleRadius too large for the interior domain");

    if (!(c.seedMin.x >= 0.0f && c.seedMin.y >= 0.0f && c.seedMax.x <= 1.0f && c.seedMax.y <= 1.0f))
        return fail(reason, "seed region must lie inside [0,1]^2");
    if (!(c.seedMin.x < c.seedMax.x && c.seedMin.y < c.seedMax.y))
        return fail(reason, "seed region is empty");
    return true;
}
