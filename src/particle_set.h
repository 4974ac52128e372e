#pragma once
#include <array>
#include "vec2.h"
#include "sim_config.h"

struct Particle {
    Vec2 p;
    Vec2 v;
};

// Fixed-capacity particle storage. The count is chosen once in seed() and
// stays constant for the lifetime of the set.
class ParticleSet {
public:
    ParticleSet() = default;

    // Lays out `count` particles on a lattice filling [minPt, maxPt], top rows
    // first, all at rest. Returns false if count is outside [0, kMaxParticles].
    bool seed(int count, const Vec2& minPt, const Vec2& maxPt);
    // Used by tests to place particles by hand.
    bool assign(const Particle* src, int count);

    int size() const { return count_; }
    bool empty() const { return count_ == 0; }
    Particle& operator[](int i) { return particles_[i]; }
    const Particle& operator[](int i) const { return particles_[i]; }

    Particle* begin() { return particles_.data(); }
    Particle* end() { return particles_.data() + count_; }
    const Particle* begin() const { return particles_.data(); }
    const Particle* end() const { return particles_.data() + count_; }

private:
    std::array<Particle, kMaxParticles> particles_{};
    int count_{0};
};
