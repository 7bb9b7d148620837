/**
 * @file match_session.h
 * @brief Ownership of one running match
 *
 * MatchSession bundles the validated field configuration, the current
 * snapshot and the random source of a single match. The console loop holds
 * one by reference; nothing about a match lives in globals, so several
 * sessions can coexist (the tests create many).
 */

#pragma once

#include "core/field_config.h"
#include "core/match_core.h"
#include "core/match_state.h"
#include "core/random_source.h"

#include <cstdint>
#include <memory>

class MatchSession {
public:
    /**
     * @brief Start a match with a seeded Mersenne Twister
     *
     * @param cfg Field configuration, validated here
     * @param seed Generator seed
     * @throws ConfigError if @p cfg is degenerate
     */
    MatchSession(const FieldConfig &cfg, std::uint64_t seed);

    /**
     * @brief Start a match drawing from a caller-supplied source
     *
     * @param cfg Field configuration, validated here
     * @param rng Random source; the session takes ownership
     * @throws ConfigError if @p cfg is degenerate
     */
    MatchSession(const FieldConfig &cfg, std::unique_ptr<RandomSource> rng);

    /**
     * @brief Advance one tick and commit the new snapshot
     * @return What happened during the tick
     */
    StepEvent step();

    /// Replace the current snapshot (used to set up scenarios)
    void reset_to(const MatchState &s) { current = s; }

    const MatchState &state() const { return current; }
    const FieldConfig &config() const { return cfg; }

private:
    FieldConfig cfg;
    std::unique_ptr<RandomSource> rng;
    MatchState current;
};
