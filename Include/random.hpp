#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

// ============================================================
//  IRandomSource  –  Strategy interface
// ============================================================

/**
 * Every random decision in the simulation (cloud positions, degree
 * draws, jitter, pulse seeds, cluster admission) pulls from one of
 * these, so a test can swap in a scripted stream and pin the outcome.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform sample in [0, 1).
    virtual float uniform() = 0;

    /// Uniform sample in [lo, hi).
    float uniform(float lo, float hi) { return lo + (hi - lo) * uniform(); }

    /// Uniform integer in [lo, hi] (inclusive).
    std::size_t index(std::size_t lo, std::size_t hi) {
        const auto span = static_cast<float>(hi - lo + 1);
        auto offset     = static_cast<std::size_t>(uniform() * span);
        if (offset > hi - lo) offset = hi - lo;  // guards u rounding to 1
        return lo + offset;
    }

    /// Centred sample in [-0.5, 0.5) scaled by `amplitude`.
    float centred(float amplitude) { return (uniform() - 0.5f) * amplitude; }
};

// ============================================================
//  MersenneRandom  –  default std::mt19937_64 stream
// ============================================================

class MersenneRandom final : public IRandomSource {
public:
    explicit MersenneRandom(std::optional<std::uint64_t> seed = std::nullopt)
        : rng_{ static_cast<std::uint64_t>(seed.value_or(std::random_device{}())) }
    {}

    using IRandomSource::uniform;
    float uniform() override { return dist_(rng_); }

private:
    std::mt19937_64                       rng_;
    std::uniform_real_distribution<float> dist_{ 0.0f, 1.0f };
};
