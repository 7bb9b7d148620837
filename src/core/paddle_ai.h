/**
 * @file paddle_ai.h
 * @brief Probabilistic paddle AI shared by both sides
 *
 * Far from its paddle the AI tracks the ball with a dead zone and misses a
 * fraction of frames on purpose. When the ball is approaching and close it
 * picks a trick shot: it places the paddle so the ball lands on a chosen
 * hit zone, which selects the bounce angle.
 */

#pragma once

#include "core/field_config.h"
#include "core/match_state.h"
#include "core/random_source.h"

#include <array>
#include <cstddef>

/// Which paddle a decision is made for
enum class Side { A, B };

/// Cells from the paddle edge within which an approaching ball triggers a trick shot
constexpr int kTriggerZone = 5;
/// Probability of tracking the ball on a frame outside the trigger zone
constexpr double kTrackProbability = 0.85;
/// Cumulative bucket probabilities for trick shot aim
constexpr std::array<double, 5> kTrickCumulative = {0.25, 0.50, 0.55, 0.75, 1.0};
/// Rows below ball_y the paddle top is placed at, per bucket
constexpr std::array<int, 5> kTrickAimOffsets = {0, 1, 3, 5, 6};

/**
 * @brief Select a bucket from a cumulative probability table
 *
 * Consumes exactly one draw. Returns the first index whose cumulative
 * bound exceeds the draw; a draw beyond the last bound selects the last
 * bucket.
 *
 * @param cumulative Non-decreasing cumulative probabilities ending at 1.0
 * @param count Number of entries in @p cumulative (must be > 0)
 * @param rng Random source
 * @return Bucket index in [0, count)
 */
std::size_t pick_weighted_bucket(const double *cumulative, std::size_t count, RandomSource &rng);

/**
 * @brief True when the ball approaches @p side inside its trigger zone
 */
bool in_trigger_zone(const MatchState &s, const FieldConfig &cfg, Side side);

/**
 * @brief Compute the next paddle top row for one side
 *
 * Consumes exactly one random draw. The result is always inside
 * [cfg.paddle_min_y(), cfg.paddle_max_y()].
 *
 * @param s State at the start of the tick
 * @param cfg Field configuration
 * @param side Paddle to decide for
 * @param rng Random source
 * @return New paddle top row
 */
int decide_paddle(const MatchState &s, const FieldConfig &cfg, Side side, RandomSource &rng);
