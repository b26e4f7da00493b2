#pragma once

#include "config.hpp"
#include "simulation_state.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <utility>
#include <vector>

// ============================================================
//  GlowSelection
// ============================================================

struct GlowSelection {
    std::vector<Vertex::Index> vertices;   // seed first, no duplicates
    std::vector<std::size_t>   edges;      // indices into Graph::edges()

    [[nodiscard]] bool hasVertex(Vertex::Index v) const noexcept {
        return std::find(vertices.begin(), vertices.end(), v) != vertices.end();
    }
    [[nodiscard]] bool hasEdge(std::size_t e) const noexcept {
        return std::find(edges.begin(), edges.end(), e) != edges.end();
    }
};

// ============================================================
//  selectCluster  –  bounded breadth-first spark
// ============================================================

/**
 * Grows a random cluster around `seed`.
 *
 * Work items carry their depth; an item deeper than `maxDepth` is not
 * expanded. For each neighbour of an expanded vertex:
 *   - already selected  → the connecting edge is marked;
 *   - otherwise         → admitted iff the selection holds fewer than
 *                         `cap` vertices and rng.uniform() > threshold,
 *                         which also marks the edge and queues it one
 *                         level deeper.
 *
 * The draw is only taken for neighbours that could still be admitted.
 * Terminates on any graph: each vertex is queued at most once.
 */
[[nodiscard]] inline GlowSelection selectCluster(const Graph&   g,
                                                 Vertex::Index  seed,
                                                 std::size_t    cap,
                                                 int            maxDepth,
                                                 float          threshold,
                                                 IRandomSource& rng)
{
    GlowSelection sel;
    if (seed >= g.vertexCount()) return sel;

    std::vector<bool> selected(g.vertexCount(), false);
    std::vector<bool> marked  (g.edgeCount(),   false);

    auto markEdge = [&](Vertex::Index u, Vertex::Index v) {
        if (auto e = g.findEdge(u, v); e && !marked[*e]) {
            marked[*e] = true;
            sel.edges.push_back(*e);
        }
    };

    struct Item { Vertex::Index vertex; int depth; };
    std::deque<Item> work;

    selected[seed] = true;
    sel.vertices.push_back(seed);
    work.push_back({ seed, 0 });

    while (!work.empty()) {
        const Item item = work.front();
        work.pop_front();
        if (item.depth > maxDepth) continue;

        for (Vertex::Index nb : g.neighbours(item.vertex)) {
            if (selected[nb]) {
                markEdge(item.vertex, nb);
                continue;
            }
            if (sel.vertices.size() >= cap) continue;
            if (!(rng.uniform() > threshold)) continue;

            selected[nb] = true;
            sel.vertices.push_back(nb);
            markEdge(item.vertex, nb);
            work.push_back({ nb, item.depth + 1 });
        }
    }
    return sel;
}

/// Cluster cap drawn from [minClusterSize, maxClusterSize); equal bounds give min.
[[nodiscard]] inline std::size_t clusterCap(const GlowParams& params, IRandomSource& rng) {
    const std::size_t span = params.maxClusterSize - params.minClusterSize;
    if (span == 0) return params.minClusterSize;
    const auto offset = static_cast<std::size_t>(rng.uniform() * static_cast<float>(span));
    return params.minClusterSize + std::min(offset, span - 1);
}

// ============================================================
//  GlowPropagator
// ============================================================

/**
 * Self-rescheduling pulse source. Every 2–5 s (configurable) it clears
 * all glow, picks a random seed and cluster size, selects a cluster and
 * fades each selected vertex and edge 0 → 1 (ease-out) then 1 → 0
 * (ease-in) over `pulseDuration`, clearing `glowing` at the end.
 *
 * Each pulse's tweens share one animator group; the next pulse cancels
 * that group before resetting, so a fade from an older pulse can never
 * land on an element that has started glowing again.
 */
class GlowPropagator {
public:
    using PulseObserver = std::function<void(const GlowSelection&)>;

    explicit GlowPropagator(const GlowParams& params) : params_(params) {}

    void setPulseObserver(PulseObserver fn) { observer_ = std::move(fn); }

    /// Arms the first pulse timer.
    void start(SimulationState& state) {
        running_ = true;
        scheduleNext(state);
    }

    /// Cancels the pending reschedule timer and the in-flight pulse.
    void stop(SimulationState& state) noexcept {
        running_ = false;
        if (timer_ != kInvalidTimer) state.timers.cancel(timer_);
        timer_ = kInvalidTimer;
        if (pulseGroup_ != kNoTweenGroup) state.animator.cancelGroup(pulseGroup_);
        pulseGroup_ = kNoTweenGroup;
    }

    /// Fires one pulse from a random seed with a random cluster cap.
    const GlowSelection& trigger(SimulationState& state) {
        if (state.graph.vertexCount() == 0) {
            last_ = {};
            return last_;
        }
        auto& rng          = state.rng();
        const auto seed    = static_cast<Vertex::Index>(rng.index(0, state.graph.vertexCount() - 1));
        const auto cap     = clusterCap(params_, rng);
        return triggerAt(state, seed, cap);
    }

    /// Fires one pulse from `seed` with an explicit cluster cap.
    const GlowSelection& triggerAt(SimulationState& state, Vertex::Index seed, std::size_t cap) {
        reset(state);

        last_ = selectCluster(state.graph, seed, cap, params_.maxDepth,
                              params_.includeThreshold, state.rng());

        pulseGroup_ = state.animator.newGroup();
        for (Vertex::Index v : last_.vertices) {
            Vertex& vx = state.graph.vertex(v);
            pulse(state, vx.glowing, vx.glowIntensity);
        }
        for (std::size_t e : last_.edges) {
            Edge& ex = state.graph.edges()[e];
            pulse(state, ex.glowing, ex.glowIntensity);
        }

        ++pulseCount_;
        if (observer_) observer_(last_);
        return last_;
    }

    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] bool                 running()     const noexcept { return running_; }
    [[nodiscard]] TimerId              pendingTimer() const noexcept { return timer_; }
    [[nodiscard]] TweenGroup           pulseGroup()  const noexcept { return pulseGroup_; }
    [[nodiscard]] std::size_t          pulseCount()  const noexcept { return pulseCount_; }
    [[nodiscard]] const GlowSelection& lastPulse()   const noexcept { return last_; }

private:
    GlowParams    params_;
    PulseObserver observer_;
    bool          running_   { false };
    TimerId       timer_     { kInvalidTimer };
    TweenGroup    pulseGroup_{ kNoTweenGroup };
    std::size_t   pulseCount_{ 0 };
    GlowSelection last_;

    void scheduleNext(SimulationState& state) {
        const auto lo    = static_cast<float>(params_.minInterval);
        const auto hi    = static_cast<float>(params_.maxInterval);
        const double delay = state.rng().uniform(lo, hi);

        timer_ = state.timers.schedule(delay, [this, &state] {
            timer_ = kInvalidTimer;
            if (!running_) return;
            trigger(state);
            scheduleNext(state);
        });
    }

    void reset(SimulationState& state) {
        if (pulseGroup_ != kNoTweenGroup) state.animator.cancelGroup(pulseGroup_);
        state.graph.clearGlow();
    }

    /// 0 → 1 ease-out, then 1 → 0 ease-in, then `glowing` drops.
    void pulse(SimulationState& state, bool& glowing, float& intensity) {
        const float half        = params_.pulseDuration * 0.5f;
        const TweenGroup group  = pulseGroup_;
        Animator& animator      = state.animator;

        glowing = true;
        animator.animate(intensity, 1.0f, TweenOptions{
            half, Easing::EaseOut,
            [&animator, &glowing, &intensity, half, group] {
                animator.animate(intensity, 0.0f, TweenOptions{
                    half, Easing::EaseIn,
                    [&glowing, &intensity] { glowing = false; intensity = 0.0f; },
                    group });
            },
            group });
    }
};
