/**
 * @file frame_pacer.h
 * @brief Frame rate control for the console loop
 *
 * The target rate moves along a doubling ladder between kMinFps and
 * kMaxFps. Doubling past kMaxFps switches to uncapped mode, where the loop
 * runs as fast as the host permits; halving from uncapped returns to
 * kMaxFps.
 */

#pragma once

#include <chrono>

class FramePacer {
public:
    static constexpr int kMinFps = 15;      ///< Slowest selectable rate
    static constexpr int kMaxFps = 120;     ///< Fastest capped rate
    static constexpr int kDefaultFps = 30;  ///< Rate at startup

    /**
     * @brief Construct a pacer at @p fps, snapped onto the ladder
     */
    explicit FramePacer(int fps = kDefaultFps);

    /// '+' key: double the rate, or enter uncapped mode at the cap
    void faster();
    /// '-' key: halve the rate down to the floor, or leave uncapped mode
    void slower();

    int fps() const { return target_fps; }
    bool uncapped() const { return max_mode; }

    /// Target seconds per frame; 0 when uncapped
    double frame_interval() const;

    /// Mark the start of a frame's work
    void begin_frame();

    /**
     * @brief Sleep out the rest of the frame interval
     *
     * Also updates the measured rate from the time spent since
     * begin_frame(). Does not sleep in uncapped mode.
     */
    void end_frame();

    /// Rate implied by the last frame's work time
    double measured_fps() const { return actual_fps; }

    /**
     * @brief Seconds still to wait, given elapsed seconds since the last frame ended
     */
    double remaining(double elapsed) const;

    /// Snap an arbitrary rate onto the ladder (15, 30, 60, 120)
    static int snap_to_ladder(int fps);

private:
    using clock = std::chrono::steady_clock;

    int target_fps;
    bool max_mode = false;
    double actual_fps;
    clock::time_point frame_start;
    clock::time_point last;
};
