// Particle-side integration: external forces, advection, particle/particle
// separation and domain clamping.
#pragma once
#include <array>
#include "vec2.h"
#include "sim_config.h"

class ParticleSet;

// Counting-sort bucket grid for neighbor search. Buckets are at least as wide
// as the query radius, so every pair closer than that radius sits in the same
// or an adjacent bucket. Storage is fixed-capacity.
class ParticleBuckets {
public:
    static constexpr int kMaxDim = kMaxGridWidth > kMaxGridHeight ? kMaxGridWidth : kMaxGridHeight;

    // Bins every particle over [origin, origin + extent]; particles outside
    // the box land in the nearest edge bucket.
    void build(const ParticleSet& particles, const Vec2& origin, const Vec2& extent, float radius);

    int nx() const { return nx_; }
    int ny() const { return ny_; }
    int bucketOf(const Vec2& p) const;
    // Bucket particle i was binned into by the last build().
    int binOf(int i) const { return bin_[i]; }
    // Particle indices of bucket (bx,by) are ids()[first(b) .. first(b+1)).
    int first(int b) const { return first_[b]; }
    const int* ids() const { return ids_.data(); }

private:
    int nx_{1}, ny_{1};
    Vec2 origin_;
    float invCellX_{1.0f}, invCellY_{1.0f};
    std::array<int, kMaxDim * kMaxDim + 1> first_{};
    std::array<int, kMaxParticles> ids_{};
    std::array<int, kMaxParticles> bin_{};
};

void applyGravity(ParticleSet& particles, float dt, float g);
void applyAcceleration(ParticleSet& particles, float dt, const Vec2& accel);
void applyDamping(ParticleSet& particles, float factor);
void advect(ParticleSet& particles, float dt);

// One separation pass: every pair closer than minSeparation is pushed apart
// symmetrically along the line between them, half the overlap each.
// Neighbors are searched around the bucket each particle was binned into at
// the start of the pass, even after earlier pushes have moved it.
void resolveParticleCollisions(ParticleSet& particles, float minSeparation,
                               CollisionVelocityPolicy policy, ParticleBuckets& buckets,
                               const Vec2& origin, const Vec2& extent);

// Keeps every particle inside [domainMin + radius, domainMax - radius].
// Non-finite positions are pulled back to the lower bound and non-finite
// velocities reset to zero.
void clampToBounds(ParticleSet& particles, const Vec2& domainMin, const Vec2& domainMax,
                   float radius, BoundaryPolicy policy, float restitution);
