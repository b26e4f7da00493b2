/**
 * benchmark.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Cost of the two per-graph hot paths as the vertex count grows:
 *
 *   - Graph::nearestNeighbour  (one-shot, O(|V|² · K))
 *   - GeometryProjector        (every frame, O(|V| + |E|))
 *
 * The animation ships with |V| = 50; larger N show how much headroom
 * the 60 Hz frame budget leaves.
 *
 * Output: output/benchmark.csv
 *   Columns: N, E, build_ms, project_us_per_frame
 */

#include "config.hpp"
#include "geometry.hpp"
#include "graph.hpp"
#include "random.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <vector>

namespace fs  = std::filesystem;
namespace chr = std::chrono;

// ── Configuration ─────────────────────────────────────────────────────────────

struct BenchConfig {
    std::vector<std::size_t> vertexCounts{ 50, 100, 250, 500, 1000, 2000 };

    GraphParams graph;
    Palette     palette;

    // Ten seconds of 60 Hz frames per size
    int frames = 600;

    std::uint64_t seed = 42;

    fs::path outputDir = "output";
};

// ── Result record ─────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t N;
    std::size_t E;
    double      buildMs;
    double      projectUs;
};

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    const BenchConfig cfg;

    std::cout << "Glow graph benchmark\n"
              << "====================\n"
              << "Frames per size    : " << cfg.frames               << '\n'
              << "Connections (K)    : " << cfg.graph.minConnections << "\n\n"
              << std::left
              << std::setw(8)  << "N"
              << std::setw(10) << "E"
              << std::setw(16) << "Build (ms)"
              << "Project (us/frame)\n"
              << std::string(60, '-') << '\n';

    std::vector<BenchResult> results;
    results.reserve(cfg.vertexCounts.size());

    const GeometryProjector projector{ cfg.palette };

    for (std::size_t N : cfg.vertexCounts) {
        GraphParams params  = cfg.graph;
        params.vertexCount  = N;
        MersenneRandom rng{ cfg.seed };

        // ── Build ─────────────────────────────────────────────
        const auto b0 = chr::high_resolution_clock::now();
        Graph g = Graph::nearestNeighbour(params, rng);
        const auto b1 = chr::high_resolution_clock::now();

        // ── Project ───────────────────────────────────────────
        GeometryBuffers buffers;
        const auto p0 = chr::high_resolution_clock::now();
        for (int f = 0; f < cfg.frames; ++f) {
            g.vertices()[static_cast<std::size_t>(f) % N].glowIntensity =
                static_cast<float>(f % 60) / 60.0f;
            projector.project(g, buffers);
        }
        const auto p1 = chr::high_resolution_clock::now();

        const double buildMs = static_cast<double>(
            chr::duration_cast<chr::microseconds>(b1 - b0).count()) / 1000.0;
        const double projectUs = static_cast<double>(
            chr::duration_cast<chr::nanoseconds>(p1 - p0).count()) / 1000.0 / cfg.frames;

        results.push_back({ N, g.edgeCount(), buildMs, projectUs });

        std::cout << std::left  << std::fixed << std::setprecision(2)
                  << std::setw(8)  << N
                  << std::setw(10) << g.edgeCount()
                  << std::setw(16) << buildMs
                  << projectUs << '\n';
    }

    // ── Export CSV ────────────────────────────────────────────
    std::error_code ec;
    fs::create_directories(cfg.outputDir, ec);
    const fs::path csvPath = cfg.outputDir / "benchmark.csv";
    std::ofstream  csv{ csvPath };

    if (!csv.is_open()) {
        std::cerr << "[ERROR] Cannot open " << csvPath << '\n';
        return EXIT_FAILURE;
    }

    csv << "N,E,build_ms,project_us_per_frame\n"
        << std::fixed << std::setprecision(4);

    for (const auto& r : results)
        csv << r.N         << ','
            << r.E         << ','
            << r.buildMs   << ','
            << r.projectUs << '\n';

    std::cout << "\nResults saved to: " << csvPath << '\n';
    return EXIT_SUCCESS;
}
