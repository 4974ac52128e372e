#include "particle_set.h"
#include <algorithm>

bool ParticleSet::seed(int count, const Vec2& minPt, const Vec2& maxPt) {
    if (count < 0 || count > kMaxParticles) return false;
    const float w = maxPt.x - minPt.x;
    const float h = maxPt.y - minPt.y;
    if (!(w > 0.0f && h > 0.0f)) return false;

    // Choose a column count that keeps lattice spacing roughly isotropic.
    int cols = std::max(1, (int)std::ceil(std::sqrt((float)count * w / h)));
    cols = std::min(cols, std::max(1, count));
    int rows = std::max(1, (count + cols - 1) / cols);
    const float sx = w / (float)cols;
    const float sy = h / (float)rows;

    for (int k = 0; k < count; ++k) {
        int c = k % cols;
        int r = k / cols;
        Particle& prt = particles_[k];
        prt.p = Vec2(minPt.x + (c + 0.5f) * sx, maxPt.y - (r + 0.5f) * sy);
        prt.v = Vec2(0, 0);
    }
    count_ = count;
    return true;
}

bool ParticleSet::assign(const Particle* src, int count) {
    if (count < 0 || count > kMaxParticles) return false;
    std::copy(src, src + count, particles_.begin());
    count_ = count;
    return true;
}
