#pragma once

#include "config.hpp"
#include "geometry.hpp"
#include "host.hpp"
#include "scene.hpp"
#include "simulation_state.hpp"

#include <glm/glm.hpp>

// ============================================================
//  RenderTarget
// ============================================================

struct RenderTarget {
    IRenderSurface&          surface;
    const Scene&             scene;
    const PerspectiveCamera& camera;
    GeometryBuffers&         buffers;
};

// ============================================================
//  SimulationLoop
// ============================================================

/**
 * One call per presented frame:
 *
 *  1. Advance deferred timers (startup delay, pulse reschedule).
 *  2. Advance tweens (formation, glow fades).
 *  3. Phase motion:
 *       initializing → jitter ±cloudJitter/2, pull cloudPull → initialPosition
 *       forming      → none; the formation tweens own position
 *       stable       → jitter ±orbitJitter/2, pull orbitPull → targetPosition
 *  4. Project geometry into the render buffers.
 *  5. Render once.
 *
 * Jitter and pull are applied per frame, not scaled by dt.
 */
class SimulationLoop {
public:
    SimulationLoop(const MotionParams& motion, const Palette& palette) noexcept
        : motion_(motion), projector_(palette) {}

    /// Steps 1–3 only; no geometry or rendering.
    void step(SimulationState& state, double dt) {
        state.timers.advance(dt);
        state.animator.advance(static_cast<float>(dt));
        applyMotion(state);
    }

    void tick(SimulationState& state, double dt, RenderTarget target) {
        step(state, dt);
        projector_.project(state.graph, target.buffers);
        target.surface.render(target.scene, target.camera);
        ++state.frame;
    }

    [[nodiscard]] const GeometryProjector& projector() const noexcept { return projector_; }

private:
    MotionParams      motion_;
    GeometryProjector projector_;

    static void wander(Vertex& v, glm::vec3 jitter, float pull,
                       glm::vec3 anchor, IRandomSource& rng) {
        v.position.x += rng.centred(jitter.x);
        v.position.y += rng.centred(jitter.y);
        v.position.z += rng.centred(jitter.z);
        v.position    = glm::mix(v.position, anchor, pull);
    }

    void applyMotion(SimulationState& state) {
        auto& rng = state.rng();

        switch (state.phase) {
            case Phase::Initializing:
                for (Vertex& v : state.graph.vertices())
                    wander(v, motion_.cloudJitter, motion_.cloudPull, v.initialPosition, rng);
                break;
            case Phase::Stable:
                for (Vertex& v : state.graph.vertices())
                    wander(v, motion_.orbitJitter, motion_.orbitPull, v.targetPosition, rng);
                break;
            case Phase::Forming:
                break;
        }
    }
};
