#include "config.hpp"
#include "exporter.hpp"
#include "headless_host.hpp"
#include "view.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace fs  = std::filesystem;
namespace chr = std::chrono;

// ── Capture parameters ───────────────────────────────────────────────────────

struct CaptureConfig {
    // Simulation (defaults match the interactive viewer)
    Config       sim;

    // Host
    Viewport     viewport     { 1280, 720 };
    double       frameRate    = 60.0;

    // 2 s cloud + 15 s formation + a few seconds of stable orbit
    std::size_t  frames       = 60 * 22;
    std::size_t  reportEvery  = 60 * 5;

    // I/O
    fs::path     outputDir    = "output";

    CaptureConfig() { sim.seed = 42; }
};

// ── Entry point ──────────────────────────────────────────────────────────────

int main(int argc, char** argv) {
    CaptureConfig cfg;
    if (argc > 1) cfg.outputDir = argv[1];

    HeadlessContainer    container{ cfg.viewport };
    HeadlessSurface      surface;
    ManualFrameScheduler frames;

    std::vector<FrameSample> timeline;
    timeline.reserve(cfg.frames);

    try {
        // ── 1. Mount view ────────────────────────────────────
        std::cout << "[1/4] Mounting headless view ("
                  << cfg.viewport.width << "x" << cfg.viewport.height << ") ... ";
        std::cout.flush();

        GlowGraphView view{ cfg.sim, surface, frames };

        view.setPhaseObserver([&frames](Phase from, Phase to) {
            std::cout << "       t = " << std::fixed << std::setprecision(2)
                      << frames.now() << " s  phase "
                      << to_string(from) << " -> " << to_string(to) << '\n';
        });
        std::size_t pulses = 0;
        std::size_t largestPulse = 0;
        view.setPulseObserver([&](const GlowSelection& sel) {
            ++pulses;
            largestPulse = std::max(largestPulse, sel.vertices.size());
        });
        view.setFrameObserver([&timeline](const SimulationState& s, double t) {
            timeline.push_back(FrameSample::capture(s, t));
        });

        if (!view.mount(&container)) {
            std::cerr << "\n[ERROR] No host container.\n";
            return EXIT_FAILURE;
        }

        const Graph& g = view.state()->graph;
        std::cout << "done.\n"
                  << "       |V| = " << g.vertexCount()
                  << "   |E| = "     << g.edgeCount() << '\n';

        // ── 2. Run frames ────────────────────────────────────
        std::cout << "[2/4] Presenting " << cfg.frames << " frames at "
                  << cfg.frameRate << " Hz ...\n";

        const auto timeStart = chr::high_resolution_clock::now();

        for (std::size_t f = 0; f < cfg.frames; ++f) {
            frames.run(1, cfg.frameRate);

            if ((f + 1) % cfg.reportEvery == 0 && !timeline.empty()) {
                const FrameSample& s = timeline.back();
                std::cout << "  frame " << std::setw(5) << (f + 1)
                          << "  |  " << std::setw(12) << to_string(s.phase)
                          << "  |  r = " << std::fixed << std::setprecision(3)
                          << s.meanRadius
                          << "  |  glowing " << s.glowingVertices << "v/"
                          << s.glowingEdges << "e\n";
            }
        }

        const chr::duration<double, std::milli> wallTime =
            chr::high_resolution_clock::now() - timeStart;

        std::cout << '\n'
                  << "  ┌─ Capture summary ────────────────────────────\n"
                  << "  │  Frames        : " << surface.renderCount() << '\n'
                  << "  │  Final phase   : " << to_string(view.state()->phase) << '\n'
                  << "  │  Pulses        : " << pulses << '\n'
                  << "  │  Largest pulse : " << largestPulse << " vertices\n"
                  << "  │  Wall time     : " << std::fixed << std::setprecision(1)
                                           << wallTime.count() << " ms\n"
                  << "  └──────────────────────────────────────────────\n\n";

        // ── 3. Unmount ───────────────────────────────────────
        std::cout << "[3/4] Unmounting ... ";
        view.unmount();
        std::cout << "done.\n";

        // ── 4. Export results ────────────────────────────────
        std::cout << "[4/4] Exporting results to " << cfg.outputDir << " ... ";
        std::cout.flush();

        DataExporter::exportAll(view.state()->graph, timeline, cfg.outputDir);

    } catch (const std::exception& e) {
        std::cerr << "\n[ERROR] " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    std::cout << "done.\n"
              << "  → " << (cfg.outputDir / "vertices.csv") << '\n'
              << "  → " << (cfg.outputDir / "edges.csv")    << '\n'
              << "  → " << (cfg.outputDir / "timeline.csv") << '\n';

    return EXIT_SUCCESS;
}
