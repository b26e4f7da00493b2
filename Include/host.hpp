#pragma once

#include "scene.hpp"

#include <cstdint>
#include <functional>

// ============================================================
//  Host seams
// ============================================================
//
//  The windowing system, the GPU draw call and the display-refresh
//  callback live outside the simulation. A host provides these three
//  interfaces; see headless_host.hpp for an in-memory one and
//  src/viewer.cpp for a GLFW/OpenGL one.

struct Viewport {
    int width { 0 };
    int height{ 0 };

    bool operator==(const Viewport&) const = default;
};

/// Region a render surface is attached to (a window, a panel, ...).
class IHostContainer {
public:
    virtual ~IHostContainer() = default;

    [[nodiscard]] virtual Viewport viewport() const = 0;
};

class IRenderSurface {
public:
    virtual ~IRenderSurface() = default;

    virtual void attach(IHostContainer& container) = 0;
    virtual void detach() noexcept = 0;
    virtual void setSize(int width, int height) = 0;

    /// Draws one frame of `scene` as seen through `camera`.
    virtual void render(const Scene& scene, const PerspectiveCamera& camera) = 0;
};

using FrameId = std::uint64_t;

inline constexpr FrameId kInvalidFrame = 0;

/**
 * Display-refresh callback source. A request fires once, on the next
 * presented frame, with a monotonic timestamp in seconds.
 */
class IFrameScheduler {
public:
    using FrameCallback = std::function<void(double timestampSeconds)>;

    virtual ~IFrameScheduler() = default;

    virtual FrameId requestFrame(FrameCallback callback) = 0;
    virtual void    cancelFrame(FrameId id) noexcept = 0;
};
