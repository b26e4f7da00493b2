#pragma once

#include "config.hpp"
#include "geometry.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <vector>

// ============================================================
//  Renderable
// ============================================================

enum class Primitive { Points, Lines };

struct Renderable {
    Primitive           primitive{ Primitive::Points };
    const VertexBuffer* buffer   { nullptr };
    float               pointSize{ 1.0f };
    float               opacity  { 1.0f };
};

// ============================================================
//  Scene
// ============================================================

/// Ordered set of renderables drawn over a solid background.
class Scene {
public:
    explicit Scene(glm::vec3 background = glm::vec3{ 0.0f }) noexcept
        : background_(background) {}

    /// Returns false if `r` is already part of the scene.
    bool add(const Renderable* r) {
        if (r == nullptr || contains(r)) return false;
        renderables_.push_back(r);
        return true;
    }

    bool remove(const Renderable* r) noexcept {
        return std::erase(renderables_, r) > 0;
    }

    void clear() noexcept { renderables_.clear(); }

    [[nodiscard]] bool contains(const Renderable* r) const noexcept {
        return std::find(renderables_.begin(), renderables_.end(), r) != renderables_.end();
    }

    [[nodiscard]] const std::vector<const Renderable*>& renderables() const noexcept {
        return renderables_;
    }
    [[nodiscard]] glm::vec3 background() const noexcept { return background_; }

private:
    glm::vec3                        background_;
    std::vector<const Renderable*>   renderables_;
};

// ============================================================
//  PerspectiveCamera
// ============================================================

class PerspectiveCamera {
public:
    explicit PerspectiveCamera(const CameraParams& params, float aspect = 1.0f) noexcept
        : fov_(params.fieldOfView), near_(params.nearPlane), far_(params.farPlane),
          position_{ 0.0f, 0.0f, params.distance }, aspect_(aspect) {}

    /**
     * Updates the aspect ratio for a `width` × `height` viewport.
     * A degenerate viewport leaves the previous aspect in place.
     */
    void resize(int width, int height) noexcept {
        if (width <= 0 || height <= 0) return;
        aspect_ = static_cast<float>(width) / static_cast<float>(height);
    }

    [[nodiscard]] glm::mat4 projection() const {
        return glm::perspective(glm::radians(fov_), aspect_, near_, far_);
    }

    [[nodiscard]] glm::mat4 view() const {
        return glm::lookAt(position_, glm::vec3{ 0.0f }, glm::vec3{ 0.0f, 1.0f, 0.0f });
    }

    [[nodiscard]] float     aspect()   const noexcept { return aspect_; }
    [[nodiscard]] float     fov()      const noexcept { return fov_; }
    [[nodiscard]] glm::vec3 position() const noexcept { return position_; }

private:
    float     fov_, near_, far_;
    glm::vec3 position_;
    float     aspect_;
};
