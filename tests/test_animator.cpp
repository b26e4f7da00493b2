#include <gtest/gtest.h>

#include "animator.hpp"

#include <glm/glm.hpp>
#include <string>

TEST(Easing, CurvesHitEndpoints)
{
    for (Easing c : { Easing::Linear, Easing::EaseIn, Easing::EaseOut, Easing::EaseInOut }) {
        EXPECT_FLOAT_EQ(ease(c, 0.0f), 0.0f);
        EXPECT_FLOAT_EQ(ease(c, 1.0f), 1.0f);
        EXPECT_FLOAT_EQ(ease(c, -3.0f), 0.0f);   // clamped
        EXPECT_FLOAT_EQ(ease(c,  3.0f), 1.0f);
    }
}

TEST(Easing, CubicShapes)
{
    EXPECT_FLOAT_EQ(ease(Easing::EaseIn,    0.5f), 0.125f);
    EXPECT_FLOAT_EQ(ease(Easing::EaseOut,   0.5f), 0.875f);
    EXPECT_FLOAT_EQ(ease(Easing::EaseInOut, 0.5f), 0.5f);
    EXPECT_FLOAT_EQ(ease(Easing::EaseInOut, 0.25f), 0.0625f);
}

TEST(Easing, Monotonic)
{
    for (Easing c : { Easing::Linear, Easing::EaseIn, Easing::EaseOut, Easing::EaseInOut }) {
        float prev = 0.0f;
        for (int i = 1; i <= 100; ++i) {
            const float v = ease(c, static_cast<float>(i) / 100.0f);
            EXPECT_GE(v, prev);
            prev = v;
        }
    }
}

TEST(Animator, TweenReachesTargetAndCompletesOnce)
{
    Animator anim;
    float x    = 0.0f;
    int   done = 0;

    anim.animate(x, 10.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { ++done; } });
    EXPECT_EQ(anim.activeCount(), 1u);

    anim.advance(0.5f);
    EXPECT_NEAR(x, 5.0f, 1e-5f);
    EXPECT_EQ(done, 0);

    anim.advance(0.5f);
    EXPECT_FLOAT_EQ(x, 10.0f);
    EXPECT_EQ(done, 1);
    EXPECT_EQ(anim.activeCount(), 0u);

    anim.advance(1.0f);
    EXPECT_EQ(done, 1);
}

TEST(Animator, OvershootingStepClampsToEnd)
{
    Animator anim;
    glm::vec3 p{ 0.0f };

    anim.animate(p, glm::vec3{ 1.0f, 2.0f, 3.0f }, TweenOptions{ 0.5f, Easing::EaseInOut });
    anim.advance(10.0f);

    EXPECT_FLOAT_EQ(p.x, 1.0f);
    EXPECT_FLOAT_EQ(p.y, 2.0f);
    EXPECT_FLOAT_EQ(p.z, 3.0f);
}

TEST(Animator, CompletionMayChainNextTween)
{
    Animator anim;
    float x        = 0.0f;
    bool  finished = false;

    anim.animate(x, 1.0f, TweenOptions{ 0.5f, Easing::Linear, [&] {
        anim.animate(x, 0.0f, TweenOptions{ 0.5f, Easing::Linear, [&] { finished = true; } });
    } });

    anim.advance(0.5f);
    EXPECT_FLOAT_EQ(x, 1.0f);
    EXPECT_EQ(anim.activeCount(), 1u);
    EXPECT_FALSE(finished);

    anim.advance(0.25f);
    EXPECT_NEAR(x, 0.5f, 1e-5f);

    anim.advance(0.25f);
    EXPECT_FLOAT_EQ(x, 0.0f);
    EXPECT_TRUE(finished);
}

TEST(Animator, CancelById)
{
    Animator anim;
    float x    = 0.0f;
    int   done = 0;

    const TweenId id = anim.animate(x, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { ++done; } });

    EXPECT_TRUE(anim.cancel(id));
    EXPECT_FALSE(anim.cancel(id));

    anim.advance(2.0f);
    EXPECT_EQ(x, 0.0f);
    EXPECT_EQ(done, 0);
    EXPECT_EQ(anim.activeCount(), 0u);
}

TEST(Animator, CancelGroupLeavesOthersRunning)
{
    Animator anim;
    const TweenGroup g = anim.newGroup();
    float a = 0.0f, b = 0.0f, c = 0.0f;
    int   done = 0;

    anim.animate(a, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { ++done; }, g });
    anim.animate(b, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { ++done; }, g });
    anim.animate(c, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { ++done; } });

    EXPECT_EQ(anim.activeCount(g), 2u);
    EXPECT_EQ(anim.cancelGroup(g), 2u);
    EXPECT_EQ(anim.activeCount(g), 0u);
    EXPECT_EQ(anim.activeCount(), 1u);

    anim.advance(1.0f);
    EXPECT_EQ(a, 0.0f);
    EXPECT_EQ(b, 0.0f);
    EXPECT_FLOAT_EQ(c, 1.0f);
    EXPECT_EQ(done, 1);
}

TEST(Animator, ZeroDurationCompletesOnNextAdvance)
{
    Animator anim;
    float x    = 2.0f;
    bool  done = false;

    anim.animate(x, 5.0f, TweenOptions{ 0.0f, Easing::EaseOut, [&] { done = true; } });
    anim.advance(0.0f);

    EXPECT_FLOAT_EQ(x, 5.0f);
    EXPECT_TRUE(done);
}

TEST(Animator, NewGroupsAreDistinct)
{
    Animator anim;
    const TweenGroup a = anim.newGroup();
    const TweenGroup b = anim.newGroup();

    EXPECT_NE(a, kNoTweenGroup);
    EXPECT_NE(b, kNoTweenGroup);
    EXPECT_NE(a, b);
}

TEST(Animator, CallbackCancelsTweenFinishingInSameTick)
{
    Animator anim;
    float x = 0.0f, y = 0.0f;
    int   fired = 0;
    TweenId second = 0;

    anim.animate(x, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { EXPECT_TRUE(anim.cancel(second)); } });
    second = anim.animate(y, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { ++fired; } });

    anim.advance(1.0f);

    EXPECT_EQ(fired, 0);
    EXPECT_FLOAT_EQ(y, 1.0f);   // value already written this tick
    EXPECT_EQ(anim.activeCount(), 0u);
}

TEST(Animator, CallbackCancelsGroupFinishingInSameTick)
{
    Animator anim;
    const TweenGroup g = anim.newGroup();
    float a = 0.0f, b = 0.0f;
    int   fired = 0;

    anim.animate(a, 1.0f, TweenOptions{ 0.5f, Easing::Linear, [&] { anim.cancelGroup(g); } });
    anim.animate(b, 1.0f, TweenOptions{ 0.5f, Easing::Linear, [&] { ++fired; }, g });

    anim.advance(0.5f);

    EXPECT_EQ(fired, 0);
}

TEST(Animator, ClearFromCallbackDropsPendingCompletions)
{
    Animator anim;
    float a = 0.0f, b = 0.0f, c = 0.0f;
    int   fired = 0;

    anim.animate(a, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { anim.clear(); } });
    anim.animate(b, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] {
        ++fired;
        anim.animate(c, 1.0f, TweenOptions{ 1.0f, Easing::Linear });
    } });

    anim.advance(1.0f);

    EXPECT_EQ(fired, 0);
    EXPECT_EQ(anim.activeCount(), 0u);
}

TEST(Animator, FinishedTweensStillCompleteInStartOrder)
{
    Animator anim;
    float a = 0.0f, b = 0.0f;
    std::string order;

    anim.animate(a, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { order += 'a'; } });
    anim.animate(b, 1.0f, TweenOptions{ 1.0f, Easing::Linear, [&] { order += 'b'; } });

    anim.advance(1.0f);

    EXPECT_EQ(order, "ab");
    EXPECT_EQ(anim.activeCount(), 0u);
}
