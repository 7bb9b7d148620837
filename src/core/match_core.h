/**
 * @file match_core.h
 * @brief One-step transition function for the self-playing match
 *
 * This file contains the platform-independent game simulation: AI paddle
 * decisions, integer ball motion, wall and paddle collisions with
 * hit-position dependent bounce angles, scoring and the serve.
 *
 * All functions are pure over their inputs plus the injected RandomSource.
 */

#pragma once

#include "core/field_config.h"
#include "core/match_state.h"
#include "core/random_source.h"

/**
 * @brief Outcome of a tick as seen by the presentation shell
 */
enum class StepEvent {
    None,          ///< Ball moved, no direction change
    PaddleBounce,  ///< Horizontal direction flipped without a score
    Score          ///< One of the players scored
};

/**
 * @brief Which player (if any) scored during a tick
 */
enum class PointTo { None, A, B };

/**
 * @brief Build the starting snapshot of a match
 *
 * Paddles are centred, the ball sits on the centre column with a random
 * row (centre +/- 3), a random horizontal direction and a random angle.
 * Draw order: row, direction, angle.
 *
 * @param cfg Validated field configuration
 * @param rng Random source
 * @return Initial MatchState with tick and scores at zero
 */
MatchState initial_match(const FieldConfig &cfg, RandomSource &rng);

/**
 * @brief Advance the match by one tick
 *
 * Steps, all computed from the entry snapshot:
 * - AI decision for A then B (one draw each)
 * - Ball advance by (vx, vy)
 * - Wall bounce: clamp to [1, H-2] and negate vy when the ball leaves it
 * - Paddle collision against the new paddle positions
 * - Scoring when the ball passes a paddle column
 * - Assembly, with a serve (two more draws) after a score
 *
 * @param s Entry snapshot
 * @param cfg Validated field configuration
 * @param rng Random source
 * @return Next snapshot; @p s is not modified
 */
MatchState step_match(const MatchState &s, const FieldConfig &cfg, RandomSource &rng);

/**
 * @brief Vertical speed after a paddle hit
 *
 * Zones by row offset from the paddle top: 0 gives -2, 1-2 give -1,
 * 3-4 give 0, 5 gives +1, 6 and beyond give +2.
 */
int bounce_vy_for_offset(int offset);

/**
 * @brief Serve snapshot fields after @p scorer won the point
 *
 * The ball restarts one column off centre and travels toward the scorer's
 * side: B scored gives x = W/2-1, vx = +1; A scored gives x = W/2+1,
 * vx = -1. Row and angle are re-randomized (row first).
 */
void apply_serve(MatchState &next, PointTo scorer, const FieldConfig &cfg, RandomSource &rng);

/**
 * @brief Classify the transition between two consecutive snapshots
 */
StepEvent classify_step(const MatchState &before, const MatchState &after);
