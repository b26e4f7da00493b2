#pragma once

#include "host.hpp"
#include "scene.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

// ============================================================
//  Headless host  –  in-memory container, surface and clock
// ============================================================
//
//  Used by the capture tool and the tests: nothing is drawn, every
//  call is recorded, and frames advance only when pumped.

class HeadlessContainer final : public IHostContainer {
public:
    explicit HeadlessContainer(Viewport vp = { 800, 600 }) noexcept : viewport_(vp) {}

    [[nodiscard]] Viewport viewport() const override { return viewport_; }
    void setViewport(Viewport vp) noexcept { viewport_ = vp; }

private:
    Viewport viewport_;
};

class HeadlessSurface final : public IRenderSurface {
public:
    void attach(IHostContainer& container) override {
        if (container_ != nullptr)
            throw std::logic_error("HeadlessSurface: already attached.");
        container_ = &container;
    }

    void detach() noexcept override { container_ = nullptr; }

    void setSize(int width, int height) override { size_ = { width, height }; }

    void render(const Scene& scene, const PerspectiveCamera& camera) override {
        ++renderCount_;
        lastAspect_      = camera.aspect();
        lastRenderables_ = scene.renderables().size();
    }

    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] bool            attached()        const noexcept { return container_ != nullptr; }
    [[nodiscard]] IHostContainer* container()       const noexcept { return container_; }
    [[nodiscard]] Viewport        size()            const noexcept { return size_; }
    [[nodiscard]] std::size_t     renderCount()     const noexcept { return renderCount_; }
    [[nodiscard]] float           lastAspect()      const noexcept { return lastAspect_; }
    [[nodiscard]] std::size_t     lastRenderables() const noexcept { return lastRenderables_; }

private:
    IHostContainer* container_      { nullptr };
    Viewport        size_;
    std::size_t     renderCount_    { 0 };
    float           lastAspect_     { 0.0f };
    std::size_t     lastRenderables_{ 0 };
};

/**
 * Frame scheduler driven by explicit timestamps. present() fires every
 * callback requested before the call; callbacks requested while
 * presenting wait for the next present().
 */
class ManualFrameScheduler final : public IFrameScheduler {
public:
    FrameId requestFrame(FrameCallback callback) override {
        const FrameId id = nextId_++;
        pending_.emplace(id, std::move(callback));
        return id;
    }

    void cancelFrame(FrameId id) noexcept override { pending_.erase(id); }

    /// Presents one frame at `timestampSeconds`; returns callbacks fired.
    std::size_t present(double timestampSeconds) {
        auto batch = std::exchange(pending_, {});
        for (auto& [id, callback] : batch)
            if (callback) callback(timestampSeconds);
        now_ = timestampSeconds;
        return batch.size();
    }

    /// Presents `frames` frames at `hz`, continuing from the last timestamp.
    void run(std::size_t frames, double hz = 60.0) {
        const double step = 1.0 / hz;
        for (std::size_t i = 0; i < frames; ++i)
            present(now_ + step);
    }

    [[nodiscard]] std::size_t pending() const noexcept { return pending_.size(); }
    [[nodiscard]] double      now()     const noexcept { return now_; }

private:
    std::map<FrameId, FrameCallback> pending_;
    FrameId                          nextId_{ 1 };
    double                           now_   { 0.0 };
};
