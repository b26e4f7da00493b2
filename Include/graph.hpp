#pragma once

#include "config.hpp"
#include "random.hpp"

#include <glm/glm.hpp>
#include <glm/geometric.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

// ============================================================
//  Vertex
// ============================================================

struct Vertex {
    using Index = std::uint32_t;

    glm::vec3          position       { 0.0f };
    glm::vec3          initialPosition{ 0.0f };   // cloud attractor, never rewritten
    glm::vec3          targetPosition { 0.0f };   // orbit attractor
    std::vector<Index> connections;               // symmetric adjacency
    bool               glowing        { false };
    float              glowIntensity  { 0.0f  };

    explicit Vertex(glm::vec3 p)
        : position(p), initialPosition(p), targetPosition(p) {}

    [[nodiscard]] bool isConnectedTo(Index other) const noexcept {
        return std::find(connections.begin(), connections.end(), other)
               != connections.end();
    }
};

// ============================================================
//  Edge
// ============================================================

struct Edge {
    Vertex::Index from;
    Vertex::Index to;
    bool          glowing      { false };
    float         glowIntensity{ 0.0f  };

    Edge(Vertex::Index u, Vertex::Index v) : from(u), to(v) {}

    /// Canonical key: smaller index first – ensures undirected uniqueness.
    struct Key {
        Vertex::Index lo;
        Vertex::Index hi;

        Key(Vertex::Index u, Vertex::Index v) noexcept
            : lo(std::min(u, v)), hi(std::max(u, v)) {}

        bool operator==(const Key& o) const noexcept {
            return lo == o.lo && hi == o.hi;
        }
    };

    [[nodiscard]] Key key() const noexcept { return Key{ from, to }; }

    [[nodiscard]] bool touches(Vertex::Index v) const noexcept {
        return from == v || to == v;
    }
};

struct EdgeKeyHash {
    std::size_t operator()(const Edge::Key& k) const noexcept {
        // Szudzik pairing for two 32-bit indices (lo <= hi)
        std::size_t a = k.lo, b = k.hi;
        return a + b * b;
    }
};

// ============================================================
//  Graph
// ============================================================

class Graph {
public:
    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] std::size_t vertexCount() const noexcept { return vertices_.size(); }
    [[nodiscard]] std::size_t edgeCount()   const noexcept { return edges_.size(); }

    [[nodiscard]] const std::vector<Vertex>& vertices() const noexcept { return vertices_; }
    [[nodiscard]]       std::vector<Vertex>& vertices()       noexcept { return vertices_; }

    [[nodiscard]] const std::vector<Edge>& edges() const noexcept { return edges_; }
    [[nodiscard]]       std::vector<Edge>& edges()       noexcept { return edges_; }

    [[nodiscard]] const Vertex& vertex(Vertex::Index i) const { return vertices_.at(i); }
    [[nodiscard]]       Vertex& vertex(Vertex::Index i)       { return vertices_.at(i); }

    /// Returns the adjacency list for vertex `i` (neighbour indices).
    [[nodiscard]] const std::vector<Vertex::Index>& neighbours(Vertex::Index i) const {
        return vertices_.at(i).connections;
    }

    /// Index into edges() for the unordered pair (u, v), if present.
    [[nodiscard]] std::optional<std::size_t> findEdge(Vertex::Index u,
                                                      Vertex::Index v) const {
        auto it = edgeIndex_.find(Edge::Key{ u, v });
        if (it == edgeIndex_.end()) return std::nullopt;
        return it->second;
    }

    // ── Mutation ─────────────────────────────────────────────

    /// Appends a vertex at `position` and returns its index.
    Vertex::Index addVertex(glm::vec3 position) {
        vertices_.emplace_back(position);
        return static_cast<Vertex::Index>(vertices_.size() - 1);
    }

    /**
     * Adds an undirected edge (u, v). Both endpoints must already exist.
     * Returns false if the unordered pair is already connected.
     */
    bool addEdge(Vertex::Index u, Vertex::Index v) {
        requireVertex(u); requireVertex(v);
        if (u == v)
            throw std::invalid_argument("Self-loops are not allowed.");

        Edge::Key k{ u, v };
        if (edgeIndex_.contains(k)) return false;

        edgeIndex_.emplace(k, edges_.size());
        edges_.emplace_back(u, v);
        vertices_[u].connections.push_back(v);
        vertices_[v].connections.push_back(u);    // undirected: symmetric lists
        return true;
    }

    /// Drops every glow flag and intensity back to rest.
    void clearGlow() noexcept {
        for (Vertex& v : vertices_) { v.glowing = false; v.glowIntensity = 0.0f; }
        for (Edge&   e : edges_)    { e.glowing = false; e.glowIntensity = 0.0f; }
    }

    // ── Nearest-neighbour generator ──────────────────────────
    /**
     * Scatters `vertexCount` vertices uniformly inside the box
     * [-R/2, R/2]² × [-R·s/2, R·s/2] and greedily wires each vertex, in
     * index order, to its K or K+1 nearest not-yet-connected vertices.
     *
     * Connections made by earlier vertices count towards a later
     * vertex's adjacency but not towards its own K / K+1 attempts, so
     * every vertex ends with degree >= min(K, N-1). Connectivity of the
     * whole graph is not guaranteed.
     *
     * @param params  Vertex count, K, cloud radius and depth scale.
     * @param rng     Source for positions and per-vertex degree draws.
     */
    static Graph nearestNeighbour(const GraphParams& params, IRandomSource& rng) {
        Graph g;
        g.vertices_.reserve(params.vertexCount);

        const float R = params.cloudRadius;
        for (std::size_t i = 0; i < params.vertexCount; ++i) {
            const float x = rng.centred(R);
            const float y = rng.centred(R);
            const float z = rng.centred(R * params.depthScale);
            g.addVertex({ x, y, z });
        }

        const auto n = static_cast<Vertex::Index>(g.vertexCount());
        for (Vertex::Index i = 0; i < n; ++i) {
            const std::size_t wanted = params.minConnections + rng.index(0, 1);

            for (std::size_t c = 0; c < wanted; ++c) {
                auto nearest = g.nearestUnconnected(i);
                if (!nearest) break;          // already wired to everyone
                g.addEdge(i, *nearest);
            }
        }
        return g;
    }

private:
    std::vector<Vertex>                                    vertices_;
    std::vector<Edge>                                      edges_;
    std::unordered_map<Edge::Key, std::size_t, EdgeKeyHash> edgeIndex_;   // pair → edges_ index

    void requireVertex(Vertex::Index i) const {
        if (i >= vertices_.size())
            throw std::out_of_range("Vertex does not exist.");
    }

    /// Closest vertex to `i` that is neither `i` nor already adjacent; first found wins ties.
    [[nodiscard]] std::optional<Vertex::Index> nearestUnconnected(Vertex::Index i) const {
        const Vertex& self = vertices_[i];
        std::optional<Vertex::Index> best;
        float bestDist = std::numeric_limits<float>::infinity();

        for (Vertex::Index j = 0; j < vertices_.size(); ++j) {
            if (j == i || self.isConnectedTo(j)) continue;

            const float d = glm::distance(self.position, vertices_[j].position);
            if (d < bestDist) {
                bestDist = d;
                best     = j;
            }
        }
        return best;
    }
};
