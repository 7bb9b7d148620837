#include "core/match_core.h"
#include <gtest/gtest.h>

namespace {

// Draw values that make the AI hold still outside its trigger zone
constexpr double kHold = 0.99;
constexpr double kBucketTop = 0.1;      // aim offset 0
constexpr double kBucketUpper = 0.3;    // aim offset 1
constexpr double kBucketCenter = 0.52;  // aim offset 3
constexpr double kBucketLower = 0.6;    // aim offset 5
constexpr double kBucketBottom = 0.9;   // aim offset 6

MatchState mid_field() {
    MatchState s;
    s.tick = 10;
    s.paddle_a_y = 9;
    s.paddle_b_y = 9;
    s.ball_x = 40;
    s.ball_y = 12;
    s.vx = 1;
    s.vy = 0;
    return s;
}

MatchState left_approach(int ball_y) {
    MatchState s = mid_field();
    s.ball_x = 2;
    s.vx = -1;
    s.ball_y = ball_y;
    s.vy = 0;
    return s;
}

} // namespace

TEST(MatchCore, InitialMatchIsCentred) {
    FieldConfig cfg;
    for (std::uint64_t seed = 1; seed < 50; ++seed) {
        MersenneRandom rng(seed);
        MatchState s = initial_match(cfg, rng);
        EXPECT_EQ(s.tick, 0u);
        EXPECT_EQ(s.score_a, 0);
        EXPECT_EQ(s.score_b, 0);
        EXPECT_EQ(s.paddle_a_y, 9);
        EXPECT_EQ(s.paddle_b_y, 9);
        EXPECT_EQ(s.ball_x, 40);
        EXPECT_GE(s.ball_y, 9);
        EXPECT_LE(s.ball_y, 15);
        EXPECT_TRUE(s.vx == 1 || s.vx == -1);
        EXPECT_GE(s.vy, -2);
        EXPECT_LE(s.vy, 2);
    }
}

TEST(MatchCore, BallAdvancesByVelocity) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.vy = 1;
    ScriptedRandom rng({kHold});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_EQ(n.tick, 11u);
    EXPECT_EQ(n.ball_x, 41);
    EXPECT_EQ(n.ball_y, 13);
    EXPECT_EQ(n.vx, 1);
    EXPECT_EQ(n.vy, 1);
    EXPECT_EQ(n.paddle_a_y, 9);
    EXPECT_EQ(n.paddle_b_y, 9);
}

TEST(MatchCore, TopWallBounceClampsAndInverts) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.ball_y = 0;
    s.vy = -2;
    ScriptedRandom rng({kHold});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_EQ(n.ball_y, 1);
    EXPECT_EQ(n.vy, 2);
}

TEST(MatchCore, BottomWallBounceClampsAndInverts) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.ball_y = 22;
    s.vy = 2;
    ScriptedRandom rng({kHold});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_EQ(n.ball_y, 23);
    EXPECT_EQ(n.vy, -2);
}

TEST(MatchCore, ReachingTheEdgeRowIsNotABounce) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.ball_y = 3;
    s.vy = -2;
    ScriptedRandom rng({kHold});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_EQ(n.ball_y, 1);
    EXPECT_EQ(n.vy, -2);
}

TEST(MatchCore, LeftPaddleTopRowBouncesSteepUp) {
    FieldConfig cfg;
    ScriptedRandom rng({kBucketTop, kHold});
    MatchState n = step_match(left_approach(10), cfg, rng);
    EXPECT_EQ(n.paddle_a_y, 10);
    EXPECT_EQ(n.ball_x, 1);
    EXPECT_EQ(n.ball_y, 10);
    EXPECT_EQ(n.vx, 1);
    EXPECT_EQ(n.vy, -2);
    EXPECT_EQ(n.score_b, 0);
}

TEST(MatchCore, LeftPaddleBottomRowBouncesSteepDown) {
    FieldConfig cfg;
    ScriptedRandom rng({kBucketBottom, kHold});
    MatchState n = step_match(left_approach(10), cfg, rng);
    EXPECT_EQ(n.paddle_a_y, 4);
    EXPECT_EQ(n.ball_y - n.paddle_a_y, 6);
    EXPECT_EQ(n.vx, 1);
    EXPECT_EQ(n.vy, 2);
}

TEST(MatchCore, LeftPaddleMiddleBouncesStraight) {
    FieldConfig cfg;
    ScriptedRandom rng({kBucketCenter, kHold});
    MatchState n = step_match(left_approach(10), cfg, rng);
    EXPECT_EQ(n.ball_y - n.paddle_a_y, 3);
    EXPECT_EQ(n.vx, 1);
    EXPECT_EQ(n.vy, 0);
}

TEST(MatchCore, IntermediateZonesGiveDiagonals) {
    FieldConfig cfg;
    ScriptedRandom upper({kBucketUpper, kHold});
    EXPECT_EQ(step_match(left_approach(10), cfg, upper).vy, -1);
    ScriptedRandom lower({kBucketLower, kHold});
    EXPECT_EQ(step_match(left_approach(10), cfg, lower).vy, 1);
}

TEST(MatchCore, BounceZoneTable) {
    EXPECT_EQ(bounce_vy_for_offset(0), -2);
    EXPECT_EQ(bounce_vy_for_offset(1), -1);
    EXPECT_EQ(bounce_vy_for_offset(2), -1);
    EXPECT_EQ(bounce_vy_for_offset(3), 0);
    EXPECT_EQ(bounce_vy_for_offset(4), 0);
    EXPECT_EQ(bounce_vy_for_offset(5), 1);
    EXPECT_EQ(bounce_vy_for_offset(6), 2);
    EXPECT_EQ(bounce_vy_for_offset(9), 2);
}

TEST(MatchCore, RightPaddleMirrorsLeft) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.ball_x = 77;
    s.vx = 1;
    s.ball_y = 8;
    ScriptedRandom rng({kHold, kBucketTop});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_EQ(n.paddle_b_y, 8);
    EXPECT_EQ(n.ball_x, 78);
    EXPECT_EQ(n.vx, -1);
    EXPECT_EQ(n.vy, -2);
}

TEST(MatchCore, MissOnLeftScoresForB) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.tick = 0;
    s.score_a = 0;
    s.score_b = 0;
    s.ball_x = 1;
    s.vx = -1;
    s.vy = 0;
    // A bucket, B hold, serve row 0.5 -> +0, serve angle 0.5 -> 0
    ScriptedRandom rng({kBucketTop, kHold, 0.5, 0.5});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_EQ(n.score_b, 1);
    EXPECT_EQ(n.score_a, 0);
    EXPECT_EQ(n.ball_x, cfg.width / 2 - 1);
    EXPECT_EQ(n.vx, 1);
    EXPECT_EQ(n.ball_y, 12);
    EXPECT_EQ(n.vy, 0);
    EXPECT_EQ(n.tick, 1u);
    EXPECT_EQ(rng.draws(), 4u);
}

TEST(MatchCore, MissOnRightScoresForA) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.ball_x = 78;
    s.vx = 1;
    s.vy = 1;
    ScriptedRandom rng({kHold, kHold, 0.0, 0.999});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_EQ(n.score_a, 1);
    EXPECT_EQ(n.score_b, 0);
    EXPECT_EQ(n.ball_x, cfg.width / 2 + 1);
    EXPECT_EQ(n.vx, -1);
    EXPECT_EQ(n.ball_y, 9);
    EXPECT_EQ(n.vy, 2);
}

TEST(MatchCore, PaddlesKeepAiPositionThroughScore) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.ball_x = 78;
    s.vx = 1;
    s.ball_y = 20;
    ScriptedRandom rng({kHold, kBucketCenter, 0.5, 0.5});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_EQ(n.score_a, 1);
    EXPECT_EQ(n.paddle_a_y, 9);
    EXPECT_EQ(n.paddle_b_y, 17);
}

TEST(MatchCore, ClampsHandBuiltOutOfRangeState) {
    FieldConfig cfg;
    MatchState s = mid_field();
    s.paddle_a_y = -10;
    s.paddle_b_y = 99;
    s.ball_y = -50;
    s.vy = 9;
    ScriptedRandom rng({kHold});
    MatchState n = step_match(s, cfg, rng);
    EXPECT_GE(n.paddle_a_y, cfg.paddle_min_y());
    EXPECT_LE(n.paddle_b_y, cfg.paddle_max_y());
    EXPECT_GE(n.ball_y, 0);
    EXPECT_LT(n.ball_y, cfg.height);
    EXPECT_GE(n.vy, -2);
    EXPECT_LE(n.vy, 2);
}

TEST(MatchCore, StepIsDeterministicForSameDraws) {
    FieldConfig cfg;
    MatchState s = left_approach(7);
    const MatchState before = s;
    ScriptedRandom r1({0.3, 0.6, 0.2, 0.8});
    ScriptedRandom r2({0.3, 0.6, 0.2, 0.8});
    EXPECT_EQ(step_match(s, cfg, r1), step_match(s, cfg, r2));
    EXPECT_EQ(s, before);
}

namespace {

FieldConfig make_config(int width, int height, int paddle_h, int paddle_speed) {
    FieldConfig cfg;
    cfg.width = width;
    cfg.height = height;
    cfg.paddle_h = paddle_h;
    cfg.paddle_speed = paddle_speed;
    return cfg;
}

} // namespace

class MatchCoreInvariants : public ::testing::TestWithParam<FieldConfig> {};

TEST_P(MatchCoreInvariants, HoldOverLongRandomRuns) {
    const FieldConfig cfg = GetParam();
    ASSERT_NO_THROW(validate_field_config(cfg));
    for (std::uint64_t seed = 1; seed <= 20; ++seed) {
        MersenneRandom rng(seed);
        MatchState s = initial_match(cfg, rng);
        for (int i = 0; i < 5000; ++i) {
            MatchState n = step_match(s, cfg, rng);
            ASSERT_EQ(n.tick, s.tick + 1);
            ASSERT_GE(n.paddle_a_y, 1);
            ASSERT_LE(n.paddle_a_y, cfg.height - cfg.paddle_h - 1);
            ASSERT_GE(n.paddle_b_y, 1);
            ASSERT_LE(n.paddle_b_y, cfg.height - cfg.paddle_h - 1);
            ASSERT_GE(n.ball_x, 0);
            ASSERT_LT(n.ball_x, cfg.width);
            ASSERT_GE(n.ball_y, 0);
            ASSERT_LT(n.ball_y, cfg.height);
            ASSERT_TRUE(n.vx == 1 || n.vx == -1);
            ASSERT_GE(n.vy, -2);
            ASSERT_LE(n.vy, 2);

            int da = n.score_a - s.score_a;
            int db = n.score_b - s.score_b;
            ASSERT_GE(da, 0);
            ASSERT_GE(db, 0);
            ASSERT_LE(da + db, 1);
            if (da == 1) {
                ASSERT_EQ(n.ball_x, cfg.width / 2 + 1);
                ASSERT_EQ(n.vx, -1);
            }
            if (db == 1) {
                ASSERT_EQ(n.ball_x, cfg.width / 2 - 1);
                ASSERT_EQ(n.vx, 1);
            }
            s = n;
        }
    }
}

INSTANTIATE_TEST_SUITE_P(FieldShapes, MatchCoreInvariants,
    ::testing::Values(
        make_config(80, 25, 7, 2),    // classic
        make_config(12, 5, 3, 1),     // smallest field
        make_config(12, 5, 1, 5),     // one-cell paddle, speed at the limit
        make_config(13, 6, 4, 6),     // odd width, even height
        make_config(31, 10, 8, 10),   // paddle fills the field
        make_config(200, 101, 3, 101) // large field, fast paddles
    ));

TEST(MatchCore, ImperfectAiEventuallyConcedes) {
    FieldConfig cfg;
    MersenneRandom rng(7);
    MatchState s = initial_match(cfg, rng);
    for (int i = 0; i < 20000; ++i) s = step_match(s, cfg, rng);
    EXPECT_GT(s.score_a + s.score_b, 0);
}

TEST(MatchCore, ClassifyStep) {
    MatchState a = mid_field();
    MatchState b = a;
    EXPECT_EQ(classify_step(a, b), StepEvent::None);
    b.vx = -a.vx;
    EXPECT_EQ(classify_step(a, b), StepEvent::PaddleBounce);
    b.score_b = a.score_b + 1;
    EXPECT_EQ(classify_step(a, b), StepEvent::Score);
}
