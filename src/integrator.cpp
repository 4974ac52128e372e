#include "integrator.h"
#include "particle_set.h"
#include <algorithm>

void ParticleBuckets::build(const ParticleSet& particles, const Vec2& origin, const Vec2& extent, float radius) {
    // Cells never narrower than the query radius
    nx_ = 1; ny_ = 1;
    if (radius > 0.0f) {
        nx_ = std::max(1, std::min(kMaxDim, (int)std::floor(extent.x / radius)));
        ny_ = std::max(1, std::min(kMaxDim, (int)std::floor(extent.y / radius)));
    }
    origin_ = origin;
    invCellX_ = extent.x > 0.0f ? (float)nx_ / extent.x : 0.0f;
    invCellY_ = extent.y > 0.0f ? (float)ny_ / extent.y : 0.0f;

    const int n = nx_ * ny_;
    std::fill(first_.begin(), first_.begin() + n + 1, 0);
    for (const auto& prt : particles) ++first_[bucketOf(prt.p)];
    int start = 0;
    for (int b = 0; b < n; ++b) {
        start += first_[b];
        first_[b] = start;
    }
    first_[n] = start;
    for (int i = 0; i < particles.size(); ++i) {
        int b = bucketOf(particles[i].p);
        bin_[i] = b;
        first_[b]--;
        ids_[first_[b]] = i;
    }
}

int ParticleBuckets::bucketOf(const Vec2& p) const {
    float fx = (p.x - origin_.x) * invCellX_;
    float fy = (p.y - origin_.y) * invCellY_;
    if (!std::isfinite(fx)) fx = 0.0f;
    if (!std::isfinite(fy)) fy = 0.0f;
    int bx = (int)clampf(std::floor(fx), 0.0f, (float)(nx_ - 1));
    int by = (int)clampf(std::floor(fy), 0.0f, (float)(ny_ - 1));
    return bx + nx_ * by;
}

void applyGravity(ParticleSet& particles, float dt, float g) {
    for (auto& prt : particles) prt.v.y += g * dt;
}

void applyAcceleration(ParticleSet& particles, float dt, const Vec2& accel) {
    for (auto& prt : particles) prt.v += accel * dt;
}

void applyDamping(ParticleSet& particles, float factor) {
    for (auto& prt : particles) prt.v *= factor;
}

void advect(ParticleSet& particles, float dt) {
    for (auto& prt : particles) {
        // Simple explicit Euler
        prt.p += prt.v * dt;
    }
}

static void separatePair(Particle& a, Particle& b, float minSeparation, CollisionVelocityPolicy policy) {
    Vec2 d = b.p - a.p;
    float d2 = dot(d, d);
    if (!(d2 < minSeparation * minSeparation)) return;
    Vec2 n;
    float dist;
    if (d2 > 1e-12f) {
        dist = std::sqrt(d2);
        n = d / dist;
    } else {
        // Coincident: split along +x so the pair cannot stay stacked
        dist = 0.0f;
        n = Vec2(1.0f, 0.0f);
    }
    Vec2 push = n * (0.5f * (minSeparation - dist));
    a.p -= push;
    b.p += push;

    if (policy == CollisionVelocityPolicy::ZeroApproach) {
        float vn = dot(b.v - a.v, n);
        if (vn < 0.0f) {
            a.v += n * (0.5f * vn);
            b.v -= n * (0.5f * vn);
        }
    }
}

void resolveParticleCollisions(ParticleSet& particles, float minSeparation,
                               CollisionVelocityPolicy policy, ParticleBuckets& buckets,
                               const Vec2& origin, const Vec2& extent) {
    if (particles.size() < 2 || !(minSeparation > 0.0f)) return;
    buckets.build(particles, origin, extent, minSeparation);
    const int nx = buckets.nx();
    const int ny = buckets.ny();
    const int* ids = buckets.ids();

    for (int a = 0; a < particles.size(); ++a) {
        int home = buckets.binOf(a);
        int bx = home % nx;
        int by = home / nx;
        for (int dj = -1; dj <= 1; ++dj) {
            int y = by + dj; if (y < 0 || y >= ny) continue;
            for (int di = -1; di <= 1; ++di) {
                int x = bx + di; if (x < 0 || x >= nx) continue;
                int cell = x + nx * y;
                for (int k = buckets.first(cell); k < buckets.first(cell + 1); ++k) {
                    int b = ids[k];
                    // Each unordered pair once
                    if (b <= a) continue;
                    separatePair(particles[a], particles[b], minSeparation, policy);
                }
            }
        }
    }
}

static void clampAxis(float& pos, float& vel, float lo, float hi, BoundaryPolicy policy, float restitution) {
    if (!std::isfinite(pos)) { pos = lo; vel = 0.0f; return; }
    if (pos < lo) {
        pos = lo;
        if (policy == BoundaryPolicy::Zero) vel = 0.0f;
        else if (vel < 0.0f) vel = -vel * restitution;
    } else if (pos > hi) {
        pos = hi;
        if (policy == BoundaryPolicy::Zero) vel = 0.0f;
        else if (vel > 0.0f) vel = -vel * restitution;
    }
}

void clampToBounds(ParticleSet& particles, const Vec2& domainMin, const Vec2& domainMax,
                   float radius, BoundaryPolicy policy, float restitution) {
    const Vec2 lo = domainMin + Vec2(radius, radius);
    const Vec2 hi = domainMax - Vec2(radius, radius);
    for (auto& prt : particles) {
        if (!isFinite(prt.v)) prt.v = Vec2(0, 0);
        clampAxis(prt.p.x, prt.v.x, lo.x, hi.x, policy, restitution);
        clampAxis(prt.p.y, prt.v.y, lo.y, hi.y, policy, restitution);
    }
}
