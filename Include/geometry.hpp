#pragma once

#include "config.hpp"
#include "graph.hpp"

#include <glm/glm.hpp>
#include <algorithm>
#include <cstddef>
#include <vector>

// ============================================================
//  VertexBuffer  –  flat render-facing arrays
// ============================================================

struct VertexBuffer {
    std::vector<float> positions;   // x,y,z per element
    std::vector<float> colors;      // r,g,b per element

    [[nodiscard]] std::size_t count() const noexcept { return positions.size() / 3; }

    /// Sizes both arrays for `n` elements; capacity is kept across frames.
    void resize(std::size_t n) {
        positions.resize(n * 3);
        colors.resize(n * 3);
    }

    bool operator==(const VertexBuffer&) const = default;
};

struct GeometryBuffers {
    VertexBuffer points;   // one element per vertex
    VertexBuffer lines;    // two elements per edge (segment endpoints)

    bool operator==(const GeometryBuffers&) const = default;
};

// ============================================================
//  GeometryProjector
// ============================================================

/**
 * Stateless view of the graph as GPU-ready arrays.
 *
 *   point colour  = mix(matte, glow, vertex.glowIntensity)
 *   endpoint col. = mix(matte, glow, max(vertex.glowIntensity,
 *                                        edge.glowIntensity))
 *
 * so a glowing vertex bleeds onto every segment that touches it.
 * Buffers are resized to the exact element count; after the first
 * frame no reallocation happens while the graph size is unchanged.
 */
class GeometryProjector {
public:
    explicit GeometryProjector(const Palette& palette) noexcept
        : matte_(palette.matte), glow_(palette.glow) {}

    void project(const Graph& g, GeometryBuffers& out) const {
        projectPoints(g, out.points);
        projectLines (g, out.lines);
    }

    [[nodiscard]] glm::vec3 colorFor(float intensity) const noexcept {
        return glm::mix(matte_, glow_, std::clamp(intensity, 0.0f, 1.0f));
    }

private:
    glm::vec3 matte_;
    glm::vec3 glow_;

    static void write(std::vector<float>& dst, std::size_t slot, glm::vec3 v) noexcept {
        dst[slot * 3]     = v.x;
        dst[slot * 3 + 1] = v.y;
        dst[slot * 3 + 2] = v.z;
    }

    void projectPoints(const Graph& g, VertexBuffer& buf) const {
        const auto& vertices = g.vertices();
        buf.resize(vertices.size());

        for (std::size_t i = 0; i < vertices.size(); ++i) {
            write(buf.positions, i, vertices[i].position);
            write(buf.colors,    i, colorFor(vertices[i].glowIntensity));
        }
    }

    void projectLines(const Graph& g, VertexBuffer& buf) const {
        const auto& vertices = g.vertices();
        const auto& edges    = g.edges();
        buf.resize(edges.size() * 2);

        for (std::size_t i = 0; i < edges.size(); ++i) {
            const Edge&   e    = edges[i];
            const Vertex& from = vertices[e.from];
            const Vertex& to   = vertices[e.to];

            write(buf.positions, i * 2,     from.position);
            write(buf.positions, i * 2 + 1, to.position);

            write(buf.colors, i * 2,     colorFor(std::max(from.glowIntensity, e.glowIntensity)));
            write(buf.colors, i * 2 + 1, colorFor(std::max(to.glowIntensity,   e.glowIntensity)));
        }
    }
};
