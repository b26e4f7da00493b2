#pragma once

#include "graph.hpp"
#include "simulation_state.hpp"

#include <glm/geometric.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

// ============================================================
//  FrameSample  –  one row of the capture timeline
// ============================================================

struct FrameSample {
    std::uint64_t frame          { 0 };
    double        time           { 0.0 };
    Phase         phase          { Phase::Initializing };
    std::size_t   glowingVertices{ 0 };
    std::size_t   glowingEdges   { 0 };
    float         meanRadius     { 0.0f };   // mean XY distance from the origin

    static FrameSample capture(const SimulationState& state, double time) {
        FrameSample s;
        s.frame = state.frame;
        s.time  = time;
        s.phase = state.phase;

        const auto& vertices = state.graph.vertices();
        float radius = 0.0f;
        for (const Vertex& v : vertices) {
            if (v.glowing) ++s.glowingVertices;
            radius += glm::length(glm::vec2{ v.position.x, v.position.y });
        }
        for (const Edge& e : state.graph.edges())
            if (e.glowing) ++s.glowingEdges;

        if (!vertices.empty())
            s.meanRadius = radius / static_cast<float>(vertices.size());
        return s;
    }
};

/**
 * DataExporter
 * ─────────────────────────────────────────────────────────────
 * Header-only utility that dumps a graph snapshot and the per-frame
 * capture timeline to CSV for offline inspection.
 *
 * All methods are static; no instance state is required.
 * Every method throws std::runtime_error on I/O failure so the
 * caller can decide how to handle it.
 */
class DataExporter {
public:
    // ── Public API ────────────────────────────────────────────

    /**
     * Exports vertex positions, attractors, degree and glow level.
     *
     * Output format (vertices.csv):
     *   index,x,y,z,target_x,target_y,target_z,degree,glow
     *   0,3.998100,0.012300,-0.101200,4.000000,0.000000,-0.100400,4,0.000000
     *   ...
     */
    static void exportVertices(const Graph&    g,
                               const fs::path& outputDir)
    {
        const fs::path path = ensureDir(outputDir) / "vertices.csv";
        std::ofstream  file = openFile(path);

        file << "index,x,y,z,target_x,target_y,target_z,degree,glow\n";
        file << std::fixed << std::setprecision(6);

        const auto& vertices = g.vertices();
        for (std::size_t i = 0; i < vertices.size(); ++i) {
            const Vertex& v = vertices[i];
            file << i                   << ','
                 << v.position.x        << ','
                 << v.position.y        << ','
                 << v.position.z        << ','
                 << v.targetPosition.x  << ','
                 << v.targetPosition.y  << ','
                 << v.targetPosition.z  << ','
                 << v.connections.size()<< ','
                 << v.glowIntensity     << '\n';
        }

        checkStream(file, path);
    }

    /**
     * Exports the edge list in construction order.
     *
     * Output format (edges.csv):
     *   from,to,glow
     *   0,17,0.000000
     *   ...
     */
    static void exportEdges(const Graph&    g,
                            const fs::path& outputDir)
    {
        const fs::path path = ensureDir(outputDir) / "edges.csv";
        std::ofstream  file = openFile(path);

        file << "from,to,glow\n";
        file << std::fixed << std::setprecision(6);

        for (const Edge& e : g.edges())
            file << e.from << ',' << e.to << ',' << e.glowIntensity << '\n';

        checkStream(file, path);
    }

    /**
     * Exports the capture timeline.
     *
     * Output format (timeline.csv):
     *   frame,time,phase,glowing_vertices,glowing_edges,mean_radius
     *   0,0.016667,initializing,0,0,1.734512
     *   ...
     */
    static void exportTimeline(std::span<const FrameSample> samples,
                               const fs::path&              outputDir)
    {
        const fs::path path = ensureDir(outputDir) / "timeline.csv";
        std::ofstream  file = openFile(path);

        file << "frame,time,phase,glowing_vertices,glowing_edges,mean_radius\n";
        file << std::fixed << std::setprecision(6);

        for (const FrameSample& s : samples)
            file << s.frame           << ','
                 << s.time            << ','
                 << to_string(s.phase)<< ','
                 << s.glowingVertices << ','
                 << s.glowingEdges    << ','
                 << s.meanRadius      << '\n';

        checkStream(file, path);
    }

    /**
     * Convenience overload: exports all three files in one call.
     */
    static void exportAll(const Graph&                 g,
                          std::span<const FrameSample> samples,
                          const fs::path&              outputDir)
    {
        exportVertices(g, outputDir);
        exportEdges   (g, outputDir);
        exportTimeline(samples, outputDir);
    }

private:
    // ── Helpers ───────────────────────────────────────────────

    /// Creates the directory (and any parents) if it does not yet exist.
    static fs::path ensureDir(const fs::path& dir) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec)
            throw std::runtime_error("DataExporter: cannot create directory '"
                                     + dir.string() + "': " + ec.message());
        return dir;
    }

    /// Opens a file for writing; throws on failure.
    static std::ofstream openFile(const fs::path& path) {
        std::ofstream f{ path };
        if (!f.is_open())
            throw std::runtime_error("DataExporter: cannot open '"
                                     + path.string() + "' for writing.");
        return f;
    }

    /// Verifies the stream is still healthy after all writes.
    static void checkStream(const std::ofstream& f, const fs::path& path) {
        if (!f.good())
            throw std::runtime_error("DataExporter: I/O error while writing '"
                                     + path.string() + "'.");
    }
};
