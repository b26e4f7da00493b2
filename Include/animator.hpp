#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

// ============================================================
//  Easing
// ============================================================

/// Cubic curves; EaseIn / EaseOut / EaseInOut match the "power2" family.
enum class Easing { Linear, EaseIn, EaseOut, EaseInOut };

[[nodiscard]] inline float ease(Easing curve, float t) noexcept {
    t = std::clamp(t, 0.0f, 1.0f);
    switch (curve) {
        case Easing::EaseIn:
            return t * t * t;
        case Easing::EaseOut: {
            const float u = 1.0f - t;
            return 1.0f - u * u * u;
        }
        case Easing::EaseInOut: {
            if (t < 0.5f) return 4.0f * t * t * t;
            const float u = -2.0f * t + 2.0f;
            return 1.0f - u * u * u * 0.5f;
        }
        case Easing::Linear:
        default:
            return t;
    }
}

// ============================================================
//  Animator  –  per-tick tween list
// ============================================================

using TweenId    = std::uint64_t;
using TweenGroup = std::uint32_t;

inline constexpr TweenGroup kNoTweenGroup = 0;

struct TweenOptions {
    float                 duration  { 1.0f };
    Easing                easing    { Easing::Linear };
    std::function<void()> onComplete;
    TweenGroup            group     { kNoTweenGroup };
};

/**
 * Owns every in-flight interpolation. Nothing moves on its own: the
 * simulation loop calls advance(dt) once per tick, which writes the
 * eased value into each target and then fires the completion callbacks
 * of tweens that reached their end.
 *
 * Completion callbacks run after all updates of the tick and may start
 * new tweens (chained fades) or cancel others, including tweens that
 * finished in the same tick: a finished tween keeps its callback until
 * its turn comes, so cancel(), cancelGroup() and clear() still reach it.
 * Targets are held by raw pointer; the caller guarantees they outlive
 * the tween or cancels it.
 */
class Animator {
public:
    /**
     * Interpolates `target` from its current value to `to`.
     * Works for any type glm::mix accepts (float, glm::vec3, ...).
     */
    template <typename T>
    TweenId animate(T& target, T to, TweenOptions opts) {
        const T from = target;
        T* ptr       = &target;

        Tween tw;
        tw.id         = nextId_++;
        tw.group      = opts.group;
        tw.duration   = std::max(opts.duration, 0.0f);
        tw.easing     = opts.easing;
        tw.apply      = [ptr, from, to](float e) { *ptr = glm::mix(from, to, e); };
        tw.onComplete = std::move(opts.onComplete);
        tweens_.push_back(std::move(tw));
        return tweens_.back().id;
    }

    /// Steps every live tween by `dt` seconds.
    void advance(float dt) {
        std::vector<TweenId> finished;

        for (Tween& tw : tweens_) {
            if (tw.cancelled || tw.finished) continue;

            tw.elapsed = std::min(tw.elapsed + dt, tw.duration);
            const float progress = (tw.duration > 0.0f) ? tw.elapsed / tw.duration : 1.0f;
            tw.apply(ease(tw.easing, progress));

            if (progress >= 1.0f) {
                tw.finished = true;
                finished.push_back(tw.id);
            }
        }

        // Looked up again per id: an earlier callback may have cancelled,
        // cleared or reallocated the list.
        for (TweenId id : finished) {
            auto it = std::find_if(tweens_.begin(), tweens_.end(),
                                   [id](const Tween& tw) { return tw.id == id; });
            if (it == tweens_.end() || it->cancelled) continue;

            std::function<void()> done = std::move(it->onComplete);
            it->onComplete = nullptr;
            it->cancelled  = true;            // retire
            if (done) done();
        }

        std::erase_if(tweens_, [](const Tween& tw) { return tw.cancelled || tw.finished; });
    }

    bool cancel(TweenId id) noexcept {
        for (Tween& tw : tweens_)
            if (tw.id == id && !tw.cancelled) { tw.cancelled = true; tw.onComplete = nullptr; return true; }
        return false;
    }

    /// Drops every tween tagged with `group`; returns how many were live.
    std::size_t cancelGroup(TweenGroup group) noexcept {
        std::size_t n = 0;
        for (Tween& tw : tweens_) {
            if (tw.group != group || tw.cancelled) continue;
            tw.cancelled  = true;
            tw.onComplete = nullptr;
            ++n;
        }
        return n;
    }

    void clear() noexcept { tweens_.clear(); }

    // ── Accessors ────────────────────────────────────────────
    [[nodiscard]] std::size_t activeCount() const noexcept {
        return static_cast<std::size_t>(std::count_if(tweens_.begin(), tweens_.end(),
            [](const Tween& tw) { return !tw.cancelled && !tw.finished; }));
    }

    [[nodiscard]] std::size_t activeCount(TweenGroup group) const noexcept {
        return static_cast<std::size_t>(std::count_if(tweens_.begin(), tweens_.end(),
            [group](const Tween& tw) { return !tw.cancelled && !tw.finished && tw.group == group; }));
    }

    /// Hands out a fresh group tag for a batch of related tweens.
    [[nodiscard]] TweenGroup newGroup() noexcept { return nextGroup_++; }

private:
    struct Tween {
        TweenId                    id       { 0 };
        TweenGroup                 group    { kNoTweenGroup };
        float                      elapsed  { 0.0f };
        float                      duration { 0.0f };
        Easing                     easing   { Easing::Linear };
        bool                       finished { false };   // reached its end, callback pending
        bool                       cancelled{ false };
        std::function<void(float)> apply;
        std::function<void()>      onComplete;
    };

    std::vector<Tween> tweens_;
    TweenId            nextId_   { 1 };
    TweenGroup         nextGroup_{ 1 };
};
