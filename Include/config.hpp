#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>

// ============================================================
//  Colour helpers
// ============================================================

/// Converts a packed 0xRRGGBB value to a linear [0,1] RGB triple.
[[nodiscard]] constexpr glm::vec3 colorFromHex(std::uint32_t hex) noexcept {
    return glm::vec3{ static_cast<float>((hex >> 16) & 0xFF) / 255.0f,
                      static_cast<float>((hex >>  8) & 0xFF) / 255.0f,
                      static_cast<float>( hex        & 0xFF) / 255.0f };
}

// ============================================================
//  Parameter blocks
// ============================================================

struct GraphParams {
    std::size_t vertexCount    = 50;
    std::size_t minConnections = 3;     // each vertex attempts K or K+1
    float       cloudRadius    = 5.0f;  // full spread on X/Y
    float       depthScale     = 0.5f;  // Z spread relative to X/Y
};

struct LifecycleParams {
    double formationDelay    = 2.0;     // seconds spent as a loose cloud
    float  formationDuration = 15.0f;   // seconds to converge on the circle
    float  circleRadius      = 4.0f;
    float  circleDepthJitter = 0.5f;
};

struct GlowParams {
    double      minInterval      = 2.0;
    double      maxInterval      = 5.0;
    float       pulseDuration    = 2.5f;   // fade-in + fade-out
    float       includeThreshold = 0.7f;   // neighbour joins iff u > threshold
    std::size_t minClusterSize   = 5;
    std::size_t maxClusterSize   = 15;     // exclusive
    int         maxDepth         = 2;
};

struct MotionParams {
    glm::vec3 cloudJitter { 0.03f,  0.03f,  0.01f  };
    float     cloudPull   { 0.02f };
    glm::vec3 orbitJitter { 0.005f, 0.005f, 0.002f };
    float     orbitPull   { 0.03f };
    double    maxFrameStep{ 0.25 };            // clamp on host frame delta
};

struct Palette {
    glm::vec3 matte      = colorFromHex(0x8a9ba8);
    glm::vec3 glow       = colorFromHex(0xffd700);
    glm::vec3 background = colorFromHex(0x050505);
};

struct CameraParams {
    float fieldOfView = 75.0f;   // degrees, vertical
    float nearPlane   = 0.1f;
    float farPlane    = 1000.0f;
    float distance    = 10.0f;   // camera sits on +Z looking at the origin
};

struct RenderParams {
    float pointSize   = 0.1f;
    float lineOpacity = 0.7f;
};

// ============================================================
//  Config
// ============================================================

struct Config {
    GraphParams     graph;
    LifecycleParams lifecycle;
    GlowParams      glow;
    MotionParams    motion;
    Palette         palette;
    CameraParams    camera;
    RenderParams    render;

    // Reproducibility (random_device when absent)
    std::optional<std::uint64_t> seed;

    /**
     * Rejects parameter combinations the simulation cannot honour.
     *
     * @throws std::invalid_argument  structural errors (empty graph,
     *                                inverted ranges).
     * @throws std::domain_error      values outside their valid range.
     */
    void validate() const {
        if (graph.vertexCount == 0)
            throw std::invalid_argument("Config: vertexCount must be positive.");
        if (graph.cloudRadius <= 0.0f || graph.depthScale < 0.0f)
            throw std::domain_error("Config: cloud extent must be positive.");

        if (lifecycle.formationDelay < 0.0 || lifecycle.formationDuration <= 0.0f)
            throw std::domain_error("Config: formation timing must be positive.");
        if (lifecycle.circleRadius <= 0.0f)
            throw std::domain_error("Config: circleRadius must be positive.");

        if (glow.minInterval <= 0.0 || glow.maxInterval < glow.minInterval)
            throw std::invalid_argument("Config: glow interval range is inverted or empty.");
        if (glow.pulseDuration <= 0.0f)
            throw std::domain_error("Config: pulseDuration must be positive.");
        if (glow.includeThreshold < 0.0f || glow.includeThreshold > 1.0f)
            throw std::domain_error("Config: includeThreshold must be in [0, 1].");
        if (glow.minClusterSize == 0 || glow.maxClusterSize < glow.minClusterSize)
            throw std::invalid_argument("Config: cluster size range is inverted or empty.");
        if (glow.maxDepth < 0)
            throw std::domain_error("Config: maxDepth must not be negative.");

        if (motion.cloudPull < 0.0f || motion.cloudPull > 1.0f
            || motion.orbitPull < 0.0f || motion.orbitPull > 1.0f)
            throw std::domain_error("Config: pull factors must be in [0, 1].");
        if (motion.maxFrameStep <= 0.0)
            throw std::domain_error("Config: maxFrameStep must be positive.");

        if (camera.nearPlane <= 0.0f || camera.farPlane <= camera.nearPlane)
            throw std::domain_error("Config: camera clip planes are invalid.");
    }
};
