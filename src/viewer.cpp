/**
 * viewer.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Interactive window: GLFW supplies the container, the vsync'd frame
 * callback and resize events; fixed-function OpenGL draws the point and
 * line buffers straight from client memory.
 */

#include "config.hpp"
#include "host.hpp"
#include "scene.hpp"
#include "view.hpp"

#include <GLFW/glfw3.h>
#include <glm/gtc/type_ptr.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

// ── GLFW host ────────────────────────────────────────────────────────────────

class GlfwContainer final : public IHostContainer {
public:
    explicit GlfwContainer(GLFWwindow* window) noexcept : window_(window) {}

    [[nodiscard]] Viewport viewport() const override {
        Viewport vp;
        glfwGetFramebufferSize(window_, &vp.width, &vp.height);
        return vp;
    }

    [[nodiscard]] GLFWwindow* window() const noexcept { return window_; }

private:
    GLFWwindow* window_;
};

class GlfwSurface final : public IRenderSurface {
public:
    void attach(IHostContainer& container) override {
        auto* glfw = dynamic_cast<GlfwContainer*>(&container);
        if (glfw == nullptr)
            throw std::invalid_argument("GlfwSurface: container is not a GLFW window.");
        window_ = glfw->window();
        glfwMakeContextCurrent(window_);
        glEnable(GL_BLEND);
        glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
        glEnable(GL_POINT_SMOOTH);
    }

    void detach() noexcept override { window_ = nullptr; }

    void setSize(int width, int height) override {
        if (window_ == nullptr) return;
        height_ = height;
        glViewport(0, 0, width, height);
    }

    void render(const Scene& scene, const PerspectiveCamera& camera) override {
        if (window_ == nullptr) return;

        const glm::vec3 bg = scene.background();
        glClearColor(bg.r, bg.g, bg.b, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        glMatrixMode(GL_PROJECTION);
        glLoadMatrixf(glm::value_ptr(camera.projection()));
        glMatrixMode(GL_MODELVIEW);
        glLoadMatrixf(glm::value_ptr(camera.view()));

        glEnableClientState(GL_VERTEX_ARRAY);
        glEnableClientState(GL_COLOR_ARRAY);

        for (const Renderable* r : scene.renderables()) {
            if (r->buffer == nullptr || r->buffer->count() == 0) continue;
            draw(*r, camera);
        }

        glDisableClientState(GL_COLOR_ARRAY);
        glDisableClientState(GL_VERTEX_ARRAY);

        glfwSwapBuffers(window_);
    }

private:
    GLFWwindow* window_{ nullptr };
    int         height_{ 1 };

    void draw(const Renderable& r, const PerspectiveCamera& camera) {
        const VertexBuffer& buf = *r.buffer;
        glVertexPointer(3, GL_FLOAT, 0, buf.positions.data());

        // Expand rgb to rgba so line opacity applies
        rgba_.resize(buf.count() * 4);
        for (std::size_t i = 0; i < buf.count(); ++i) {
            rgba_[i * 4]     = buf.colors[i * 3];
            rgba_[i * 4 + 1] = buf.colors[i * 3 + 1];
            rgba_[i * 4 + 2] = buf.colors[i * 3 + 2];
            rgba_[i * 4 + 3] = r.opacity;
        }
        glColorPointer(4, GL_FLOAT, 0, rgba_.data());

        if (r.primitive == Primitive::Points) {
            // World-space size at the camera distance, in pixels
            const float focal = static_cast<float>(height_) * 0.5f
                                / std::tan(glm::radians(camera.fov()) * 0.5f);
            glPointSize(std::max(1.0f, r.pointSize * focal / camera.position().z));
            glDrawArrays(GL_POINTS, 0, static_cast<GLsizei>(buf.count()));
        } else {
            glDrawArrays(GL_LINES, 0, static_cast<GLsizei>(buf.count()));
        }
    }

    std::vector<float> rgba_;
};

/// Hands pending frame callbacks to the render loop once per vsync.
class GlfwFrameScheduler final : public IFrameScheduler {
public:
    FrameId requestFrame(FrameCallback callback) override {
        const FrameId id = nextId_++;
        pending_.emplace(id, std::move(callback));
        return id;
    }

    void cancelFrame(FrameId id) noexcept override { pending_.erase(id); }

    void present() {
        auto batch = std::exchange(pending_, {});
        const double now = glfwGetTime();
        for (auto& [id, callback] : batch)
            if (callback) callback(now);
    }

private:
    std::map<FrameId, FrameCallback> pending_;
    FrameId                          nextId_{ 1 };
};

// ── Entry point ──────────────────────────────────────────────────────────────

static void errorCallback(int code, const char* desc) {
    std::fprintf(stderr, "[GLFW] error %d: %s\n", code, desc);
}

static void framebufferSizeCallback(GLFWwindow* window, int width, int height) {
    if (auto* view = static_cast<GlowGraphView*>(glfwGetWindowUserPointer(window)))
        view->resize(width, height);
}

int main() {
    glfwSetErrorCallback(errorCallback);
    if (!glfwInit()) {
        std::cerr << "[ERROR] Failed to initialise GLFW\n";
        return EXIT_FAILURE;
    }

    glfwWindowHint(GLFW_SAMPLES, 4);
    GLFWwindow* window = glfwCreateWindow(1280, 720, "glowgraph", nullptr, nullptr);
    if (window == nullptr) {
        std::cerr << "[ERROR] Failed to create window\n";
        glfwTerminate();
        return EXIT_FAILURE;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    int status = EXIT_SUCCESS;
    try {
        Config               cfg;
        GlfwContainer        container{ window };
        GlfwSurface          surface;
        GlfwFrameScheduler   frames;
        GlowGraphView        view{ cfg, surface, frames };

        view.setPhaseObserver([](Phase from, Phase to) {
            std::cout << "[phase] " << to_string(from) << " -> " << to_string(to) << '\n';
        });

        glfwSetWindowUserPointer(window, &view);
        glfwSetFramebufferSizeCallback(window, framebufferSizeCallback);

        if (!view.mount(&container)) {
            std::cerr << "[ERROR] No host container\n";
            status = EXIT_FAILURE;
        }

        while (view.mounted() && !glfwWindowShouldClose(window)) {
            frames.present();
            glfwPollEvents();
        }

        glfwSetWindowUserPointer(window, nullptr);
        view.unmount();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << '\n';
        status = EXIT_FAILURE;
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return status;
}
