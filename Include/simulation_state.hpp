#pragma once

#include "animator.hpp"
#include "graph.hpp"
#include "random.hpp"
#include "timer_queue.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

// ============================================================
//  Phase
// ============================================================

enum class Phase { Initializing, Forming, Stable };

[[nodiscard]] constexpr std::string_view to_string(Phase p) noexcept {
    switch (p) {
        case Phase::Initializing: return "initializing";
        case Phase::Forming:      return "forming";
        case Phase::Stable:       return "stable";
    }
    return "unknown";
}

// ============================================================
//  SimulationState
// ============================================================

/**
 * Everything the three asynchronous drivers share. Field ownership:
 *
 *   graph.vertices[].position         – SimulationLoop (motion + tweens)
 *   graph.vertices[].targetPosition   – LifecycleStateMachine
 *   glowing / glowIntensity           – GlowPropagator
 *   phase                             – LifecycleStateMachine
 *
 * The vertex and edge arrays never change size after construction, so
 * tweens may hold pointers into them.
 */
struct SimulationState {
    Graph                          graph;
    Phase                          phase { Phase::Initializing };
    Animator                       animator;
    TimerQueue                     timers;
    std::unique_ptr<IRandomSource> random;
    std::uint64_t                  frame { 0 };

    SimulationState(Graph g, std::unique_ptr<IRandomSource> rng)
        : graph(std::move(g)), random(std::move(rng)) {}

    [[nodiscard]] IRandomSource& rng() noexcept { return *random; }

    /// Drops every pending timer and in-flight tween.
    void haltAsync() noexcept {
        timers.clear();
        animator.clear();
    }
};
