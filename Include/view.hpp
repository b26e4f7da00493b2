#pragma once

#include "config.hpp"
#include "geometry.hpp"
#include "glow.hpp"
#include "graph.hpp"
#include "host.hpp"
#include "lifecycle.hpp"
#include "random.hpp"
#include "scene.hpp"
#include "simulation.hpp"
#include "simulation_state.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

// ============================================================
//  GlowGraphView  –  mountable animated graph
// ============================================================

/**
 * Binds the simulation to a host. mount() attaches the render surface,
 * builds the graph, arms the lifecycle and glow timers and requests
 * the first frame; every frame then re-requests itself until
 * unmount(), which also runs from the destructor.
 *
 * The view is pinned in memory: timers, tweens and frame callbacks
 * capture `this` and references into its state.
 */
class GlowGraphView {
public:
    using FrameObserver = std::function<void(const SimulationState&, double timestampSeconds)>;

    // ── Construction ─────────────────────────────────────────
    /// @throws std::invalid_argument / std::domain_error on a bad config.
    GlowGraphView(Config cfg, IRenderSurface& surface, IFrameScheduler& frames)
        : cfg_(validated(std::move(cfg))),
          surface_(surface), frames_(frames),
          scene_(cfg_.palette.background),
          camera_(cfg_.camera),
          loop_(cfg_.motion, cfg_.palette),
          points_{ Primitive::Points, &buffers_.points, cfg_.render.pointSize, 1.0f },
          lines_ { Primitive::Lines,  &buffers_.lines,  1.0f, cfg_.render.lineOpacity }
    {}

    ~GlowGraphView() { unmount(); }

    GlowGraphView(const GlowGraphView&)            = delete;
    GlowGraphView& operator=(const GlowGraphView&) = delete;

    /// Random stream used by the next mount (or swapped in immediately when mounted).
    void setRandomSource(std::unique_ptr<IRandomSource> rng) {
        if (!rng) return;
        if (state_) state_->random = std::move(rng);
        else        pendingRandom_ = std::move(rng);
    }

    void setPhaseObserver(LifecycleStateMachine::PhaseObserver fn) {
        phaseObserver_ = std::move(fn);
        if (lifecycle_) lifecycle_->setPhaseObserver(phaseObserver_);
    }
    void setPulseObserver(GlowPropagator::PulseObserver fn) {
        pulseObserver_ = std::move(fn);
        if (glow_) glow_->setPulseObserver(pulseObserver_);
    }
    void setFrameObserver(FrameObserver fn)                        { frameObserver_ = std::move(fn); }

    // ── Mounting ─────────────────────────────────────────────
    /**
     * Starts the animation inside `container`.
     *
     * Returns false (and does nothing) when `container` is null; returns
     * true when already mounted. If any step throws, everything acquired
     * so far is released before the exception propagates.
     */
    bool mount(IHostContainer* container) {
        if (mounted_) return true;
        if (container == nullptr) return false;

        MountRollback rollback{ *this };

        surface_.attach(*container);
        surfaceAttached_ = true;

        const Viewport vp = container->viewport();
        resize(vp.width, vp.height);

        std::unique_ptr<IRandomSource> rng = std::move(pendingRandom_);
        if (!rng) rng = std::make_unique<MersenneRandom>(cfg_.seed);
        Graph graph = Graph::nearestNeighbour(cfg_.graph, *rng);
        state_      = std::make_unique<SimulationState>(std::move(graph), std::move(rng));

        loop_.projector().project(state_->graph, buffers_);
        scene_.add(&points_);
        scene_.add(&lines_);

        lifecycle_ = std::make_unique<LifecycleStateMachine>(cfg_.lifecycle);
        lifecycle_->setPhaseObserver(phaseObserver_);
        glow_      = std::make_unique<GlowPropagator>(cfg_.glow);
        glow_->setPulseObserver(pulseObserver_);

        lifecycle_->start(*state_);
        glow_->start(*state_);

        mounted_ = true;
        requestNextFrame();

        rollback.dismiss();
        return true;
    }

    /// Releases every host resource; safe to call repeatedly.
    void unmount() noexcept {
        if (frameId_ != kInvalidFrame) frames_.cancelFrame(frameId_);
        frameId_ = kInvalidFrame;

        if (state_) {
            if (glow_)      glow_->stop(*state_);
            if (lifecycle_) lifecycle_->stop(*state_);
            state_->haltAsync();
        }

        scene_.remove(&points_);
        scene_.remove(&lines_);

        if (surfaceAttached_) surface_.detach();
        surfaceAttached_ = false;

        mounted_ = false;
        lastTimestamp_.reset();
    }

    /// Tracks a host viewport change; zero sizes keep the old aspect.
    void resize(int width, int height) {
        camera_.resize(width, height);
        if (surfaceAttached_)
            surface_.setSize(std::max(width, 0), std::max(height, 0));
    }

    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] bool mounted()         const noexcept { return mounted_; }
    [[nodiscard]] bool surfaceAttached() const noexcept { return surfaceAttached_; }

    /// Null before the first mount; kept after unmount for inspection.
    [[nodiscard]] const SimulationState* state() const noexcept { return state_.get(); }
    [[nodiscard]]       SimulationState* state()       noexcept { return state_.get(); }

    [[nodiscard]] LifecycleStateMachine* lifecycle() noexcept { return lifecycle_.get(); }
    [[nodiscard]] GlowPropagator*        glow()      noexcept { return glow_.get(); }

    [[nodiscard]] const Config&            config()  const noexcept { return cfg_; }
    [[nodiscard]] const Scene&             scene()   const noexcept { return scene_; }
    [[nodiscard]] const PerspectiveCamera& camera()  const noexcept { return camera_; }
    [[nodiscard]] const GeometryBuffers&   buffers() const noexcept { return buffers_; }
    [[nodiscard]] FrameId pendingFrame() const noexcept { return frameId_; }

private:
    static Config validated(Config cfg) {
        cfg.validate();
        return cfg;
    }

    struct MountRollback {
        GlowGraphView& view;
        bool           armed{ true };

        void dismiss() noexcept { armed = false; }
        ~MountRollback() { if (armed) view.unmount(); }
    };

    Config             cfg_;
    IRenderSurface&    surface_;
    IFrameScheduler&   frames_;

    Scene              scene_;
    PerspectiveCamera  camera_;
    SimulationLoop     loop_;
    GeometryBuffers    buffers_;
    Renderable         points_;
    Renderable         lines_;

    std::unique_ptr<SimulationState>       state_;
    std::unique_ptr<LifecycleStateMachine> lifecycle_;
    std::unique_ptr<GlowPropagator>        glow_;
    std::unique_ptr<IRandomSource>         pendingRandom_;

    LifecycleStateMachine::PhaseObserver phaseObserver_;
    GlowPropagator::PulseObserver        pulseObserver_;
    FrameObserver                        frameObserver_;

    bool                  mounted_        { false };
    bool                  surfaceAttached_{ false };
    FrameId               frameId_        { kInvalidFrame };
    std::optional<double> lastTimestamp_;

    void requestNextFrame() {
        frameId_ = frames_.requestFrame([this](double ts) { onFrame(ts); });
    }

    void onFrame(double timestamp) {
        frameId_ = kInvalidFrame;
        if (!mounted_) return;
        requestNextFrame();

        double dt = 0.0;
        if (lastTimestamp_)
            dt = std::clamp(timestamp - *lastTimestamp_, 0.0, cfg_.motion.maxFrameStep);
        lastTimestamp_ = timestamp;

        loop_.tick(*state_, dt, RenderTarget{ surface_, scene_, camera_, buffers_ });
        if (frameObserver_) frameObserver_(*state_, timestamp);
    }
};
