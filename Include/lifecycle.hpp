#pragma once

#include "config.hpp"
#include "simulation_state.hpp"

#include <glm/glm.hpp>
#include <cmath>
#include <cstddef>
#include <functional>
#include <numbers>
#include <utility>

// ============================================================
//  Circle targets
// ============================================================

/**
 * Places vertex i of N at angle 2πi/N on a circle of `radius` in the
 * XY plane, with z drawn from [-jitter/2, jitter/2).
 */
inline void assignCircleTargets(Graph& g, float radius, float depthJitter, IRandomSource& rng) {
    auto& vertices  = g.vertices();
    const auto n    = static_cast<float>(vertices.size());

    for (std::size_t i = 0; i < vertices.size(); ++i) {
        const float angle = static_cast<float>(i) / n * 2.0f * std::numbers::pi_v<float>;
        vertices[i].targetPosition = { std::cos(angle) * radius,
                                       std::sin(angle) * radius,
                                       rng.centred(depthJitter) };
    }
}

// ============================================================
//  LifecycleStateMachine
// ============================================================

/**
 * initializing ──(formationDelay)──▶ forming ──(all tweens done)──▶ stable
 *
 * Each transition fires at most once; stable is terminal. Entering
 * forming assigns circle targets and starts one eased position tween
 * per vertex; a completion counter flips to stable only when every one
 * of them has finished.
 */
class LifecycleStateMachine {
public:
    using PhaseObserver = std::function<void(Phase from, Phase to)>;

    explicit LifecycleStateMachine(const LifecycleParams& params) : params_(params) {}

    void setPhaseObserver(PhaseObserver fn) { observer_ = std::move(fn); }

    /// Arms the startup delay. Calling start() twice has no further effect.
    void start(SimulationState& state) {
        if (started_) return;
        started_ = true;
        state.phase = Phase::Initializing;
        delayTimer_ = state.timers.schedule(params_.formationDelay,
                                            [this, &state] { beginForming(state); });
    }

    /// Cancels the startup delay and the formation tweens.
    void stop(SimulationState& state) noexcept {
        if (delayTimer_ != kInvalidTimer) state.timers.cancel(delayTimer_);
        delayTimer_ = kInvalidTimer;
        if (formationGroup_ != kNoTweenGroup) state.animator.cancelGroup(formationGroup_);
        formationGroup_ = kNoTweenGroup;
    }

    void beginForming(SimulationState& state) {
        delayTimer_ = kInvalidTimer;
        if (state.phase != Phase::Initializing) return;
        transition(state, Phase::Forming);

        assignCircleTargets(state.graph, params_.circleRadius,
                            params_.circleDepthJitter, state.rng());

        auto& vertices   = state.graph.vertices();
        remaining_       = vertices.size();
        formationGroup_  = state.animator.newGroup();

        if (remaining_ == 0) {
            transition(state, Phase::Stable);
            return;
        }

        for (Vertex& v : vertices) {
            state.animator.animate(v.position, v.targetPosition, TweenOptions{
                params_.formationDuration,
                Easing::EaseInOut,
                [this, &state] { onVertexArrived(state); },
                formationGroup_ });
        }
    }

    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] std::size_t remainingTweens() const noexcept { return remaining_; }
    [[nodiscard]] TweenGroup  formationGroup()  const noexcept { return formationGroup_; }
    [[nodiscard]] const LifecycleParams& params() const noexcept { return params_; }

private:
    LifecycleParams params_;
    PhaseObserver   observer_;
    bool            started_       { false };
    TimerId         delayTimer_    { kInvalidTimer };
    TweenGroup      formationGroup_{ kNoTweenGroup };
    std::size_t     remaining_     { 0 };

    void onVertexArrived(SimulationState& state) {
        if (remaining_ == 0) return;
        if (--remaining_ == 0 && state.phase == Phase::Forming)
            transition(state, Phase::Stable);
    }

    void transition(SimulationState& state, Phase to) {
        const Phase from = state.phase;
        state.phase = to;
        if (to == Phase::Stable) formationGroup_ = kNoTweenGroup;
        if (observer_) observer_(from, to);
    }
};
