/**
 * @file random_source.h
 * @brief Injectable source of uniform random numbers
 *
 * The core never touches a global generator. Every random decision (AI
 * buckets, serve row and angle) pulls from a RandomSource handed in by the
 * caller, so tests can replay a match from a seed or a scripted sequence.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

/**
 * @brief Abstract uniform random source
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Next uniform value in [0, 1)
     */
    virtual double next_unit() = 0;

    /**
     * @brief Uniform integer in [lo, hi] built on next_unit()
     */
    int next_int(int lo, int hi);
};

/**
 * @brief Mersenne Twister backed source used by the running game
 */
class MersenneRandom : public RandomSource {
public:
    explicit MersenneRandom(std::uint64_t seed);
    double next_unit() override;

private:
    std::mt19937_64 rng;
    std::uniform_real_distribution<double> dist{0.0, 1.0};
};

/**
 * @brief Replays a fixed list of values, cycling when exhausted
 *
 * Values are clamped into [0, 1). An empty script always yields 0.
 */
class ScriptedRandom : public RandomSource {
public:
    ScriptedRandom() = default;
    explicit ScriptedRandom(std::vector<double> values);
    double next_unit() override;

    /// Number of values consumed so far
    std::size_t draws() const { return consumed; }

private:
    std::vector<double> script;
    std::size_t consumed = 0;
};
