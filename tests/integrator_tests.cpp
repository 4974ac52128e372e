// Forces, advection, separation and clamping
#include <limits>
#include "test_common.h"
#include "../src/particle_set.h"
#include "../src/integrator.h"

static const Vec2 kOrigin(1.0f, 1.0f);
static const Vec2 kExtent(5.0f, 5.0f);

int main() {
    // Gravity touches only the vertical component, every particle
    {
        Particle pts[2] = { {Vec2(2, 2), Vec2(1.0f, 0.5f)}, {Vec2(3, 3), Vec2(-2.0f, 0.0f)} };
        ParticleSet ps; ps.assign(pts, 2);
        const float dt = 1.0f / 30.0f, g = -9.8f;
        applyGravity(ps, dt, g);
        check(ps[0].v.x == 1.0f && near(ps[0].v.y, 0.5f + g * dt), "gravity adds g*dt to vy (particle 0)");
        check(ps[1].v.x == -2.0f && near(ps[1].v.y, g * dt), "gravity adds g*dt to vy (particle 1)");

        applyAcceleration(ps, 0.5f, Vec2(2.0f, 0.0f));
        check(ps[0].v.x == 2.0f, "tilt acceleration adds a*dt on x");
        applyDamping(ps, 0.5f);
        check(ps[0].v.x == 1.0f, "damping scales velocity");
    }

    // Advection is position += velocity * dt
    {
        Particle p = {Vec2(2.0f, 3.0f), Vec2(3.0f, -6.0f)};
        ParticleSet ps; ps.assign(&p, 1);
        advect(ps, 0.5f);
        check(ps[0].p.x == 3.5f && ps[0].p.y == 0.0f, "explicit Euler advection");
    }

    // Two overlapping particles at rest: one pass restores minSeparation symmetrically
    {
        const float minSep = 0.4f;
        Particle pts[2] = { {Vec2(3.0f, 3.0f), Vec2(0,0)}, {Vec2(3.1f, 3.0f), Vec2(0,0)} };
        ParticleSet ps; ps.assign(pts, 2);
        ParticleBuckets buckets;
        resolveParticleCollisions(ps, minSep, CollisionVelocityPolicy::Keep, buckets, kOrigin, kExtent);
        float dist = length(ps[1].p - ps[0].p);
        check(dist >= minSep - 1e-5f, "pair separated to at least minSeparation");
        float moved0 = length(ps[0].p - pts[0].p);
        float moved1 = length(ps[1].p - pts[1].p);
        check(near(moved0, moved1) && near(moved0, 0.15f), "each particle moved half the overlap");
        Vec2 mid = (ps[0].p + ps[1].p) * 0.5f;
        check(near(mid.x, 3.05f) && near(mid.y, 3.0f), "pair midpoint unchanged");
        check(ps[0].v.x == 0.0f && ps[1].v.x == 0.0f, "Keep policy leaves velocities alone");
    }

    // Diagonal pair
    {
        Particle pts[2] = { {Vec2(2.0f, 2.0f), Vec2(0,0)}, {Vec2(2.1f, 2.1f), Vec2(0,0)} };
        ParticleSet ps; ps.assign(pts, 2);
        ParticleBuckets buckets;
        resolveParticleCollisions(ps, 0.4f, CollisionVelocityPolicy::Keep, buckets, kOrigin, kExtent);
        check(near(length(ps[1].p - ps[0].p), 0.4f), "diagonal pair separated to minSeparation");
    }

    // Approaching pair with ZeroApproach loses its closing speed, keeps momentum
    {
        Particle pts[2] = { {Vec2(3.0f, 3.0f), Vec2(1.0f, 0.2f)}, {Vec2(3.2f, 3.0f), Vec2(-1.0f, 0.0f)} };
        ParticleSet ps; ps.assign(pts, 2);
        ParticleBuckets buckets;
        resolveParticleCollisions(ps, 0.4f, CollisionVelocityPolicy::ZeroApproach, buckets, kOrigin, kExtent);
        check(near(ps[1].v.x - ps[0].v.x, 0.0f), "relative normal velocity removed");
        check(near(ps[0].v.x + ps[1].v.x, 0.0f) && near(ps[0].v.y, 0.2f), "momentum and tangential velocity kept");
    }

    // Coincident particles do not stay stacked
    {
        Particle pts[2] = { {Vec2(3.0f, 3.0f), Vec2(0,0)}, {Vec2(3.0f, 3.0f), Vec2(0,0)} };
        ParticleSet ps; ps.assign(pts, 2);
        ParticleBuckets buckets;
        resolveParticleCollisions(ps, 0.4f, CollisionVelocityPolicy::Keep, buckets, kOrigin, kExtent);
        check(near(length(ps[1].p - ps[0].p), 0.4f), "coincident pair split apart");
    }

    // Pair straddling a bucket border is still found
    {
        ParticleBuckets buckets;
        Particle pts[2] = { {Vec2(1.80f, 2.0f), Vec2(0,0)}, {Vec2(1.86f, 2.0f), Vec2(0,0)} };
        ParticleSet ps; ps.assign(pts, 2);
        buckets.build(ps, kOrigin, kExtent, 0.4f);
        check(buckets.bucketOf(ps[0].p) != buckets.bucketOf(ps[1].p), "pair lands in different buckets");
        resolveParticleCollisions(ps, 0.4f, CollisionVelocityPolicy::Keep, buckets, kOrigin, kExtent);
        check(length(ps[1].p - ps[0].p) >= 0.4f - 1e-5f, "cross-bucket pair separated");
    }

    // A particle pushed out of its bucket early in the pass still meets its neighbors
    {
        Particle pts[4] = {
            {Vec2(1.83f, 2.28f), Vec2(0,0)},
            {Vec2(1.69f, 2.27f), Vec2(0,0)},
            {Vec2(1.61f, 2.22f), Vec2(0,0)},
            {Vec2(1.85f, 2.28f), Vec2(0,0)},
        };
        ParticleSet ps; ps.assign(pts, 4);
        ParticleBuckets buckets;
        resolveParticleCollisions(ps, 0.4f, CollisionVelocityPolicy::Keep, buckets, kOrigin, kExtent);
        check(buckets.binOf(2) == buckets.bucketOf(pts[2].p), "bin recorded from the pre-pass position");
        check(length(ps[3].p - ps[2].p) >= 0.4f - 1e-4f, "pair reached through the binned bucket is separated");
    }

    // Every particle is binned exactly once
    {
        Particle pts[kMaxParticles];
        for (int i = 0; i < kMaxParticles; ++i)
            pts[i] = { Vec2(1.0f + 0.037f * (float)((i * 13) % 131), 1.0f + 0.041f * (float)((i * 7) % 119)), Vec2(0,0) };
        ParticleSet ps; ps.assign(pts, kMaxParticles);
        ParticleBuckets buckets;
        buckets.build(ps, kOrigin, kExtent, 0.4f);
        int seen[kMaxParticles] = {0};
        int nb = buckets.nx() * buckets.ny();
        for (int b = 0; b < nb; ++b)
            for (int k = buckets.first(b); k < buckets.first(b + 1); ++k) seen[buckets.ids()[k]]++;
        bool once = true;
        for (int i = 0; i < kMaxParticles; ++i) if (seen[i] != 1) once = false;
        check(once && buckets.first(nb) == kMaxParticles, "bucket sort covers every particle once");
    }

    // Clamp: containment, perpendicular velocity zeroed, tangential kept
    {
        const Vec2 lo(1.0f, 1.0f), hi(6.0f, 6.0f);
        const float r = 0.2f;
        float nan = std::numeric_limits<float>::quiet_NaN();
        float inf = std::numeric_limits<float>::infinity();
        Particle pts[4] = {
            {Vec2(0.5f, 3.0f), Vec2(-2.0f, 1.0f)},
            {Vec2(3.0f, 9.0f), Vec2(0.5f, 4.0f)},
            {Vec2(nan, 2.0f), Vec2(1.0f, 1.0f)},
            {Vec2(3.0f, 3.0f), Vec2(inf, 1.0f)},
        };
        ParticleSet ps; ps.assign(pts, 4);
        clampToBounds(ps, lo, hi, r, BoundaryPolicy::Zero, 0.0f);
        bool inside = true;
        for (const auto& p : ps) {
            if (!(p.p.x >= lo.x + r && p.p.x <= hi.x - r && p.p.y >= lo.y + r && p.p.y <= hi.y - r)) inside = false;
            if (!isFinite(p.v)) inside = false;
        }
        check(inside, "all particles inside [min+r, max-r] with finite velocity");
        check(near(ps[0].p.x, 1.2f) && ps[0].v.x == 0.0f && ps[0].v.y == 1.0f, "left wall: vx zeroed, vy kept");
        check(near(ps[1].p.y, 5.8f) && ps[1].v.y == 0.0f && ps[1].v.x == 0.5f, "top wall: vy zeroed, vx kept");
        check(near(ps[2].p.x, 1.2f) && ps[2].v.x == 0.0f, "NaN position pulled back onto the wall");
    }

    // Reflect policy bounces with restitution
    {
        Particle p = {Vec2(3.0f, 0.9f), Vec2(0.0f, -4.0f)};
        ParticleSet ps; ps.assign(&p, 1);
        clampToBounds(ps, Vec2(1, 1), Vec2(6, 6), 0.2f, BoundaryPolicy::Reflect, 0.5f);
        check(near(ps[0].p.y, 1.2f) && ps[0].v.y == 2.0f, "reflect flips normal velocity with restitution");
    }

    return finish("integrator_tests");
}
