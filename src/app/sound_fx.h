/**
 * @file sound_fx.h
 * @brief Decides when the console should beep or flash
 */

#pragma once

#include "core/match_core.h"

/// Alert the console should emit for a frame
enum class Alert { None, Beep, Flash };

/**
 * @brief Sound toggle plus bounce-beep rate limiting
 *
 * Alerts are only produced while sound is on and the loop is capped. A
 * score always flashes; a paddle bounce beeps at most kMaxBeepsPerSecond
 * times per second so beeps do not overlap at high frame rates.
 */
class SoundFx {
public:
    static constexpr double kMaxBeepsPerSecond = 120.0;
    static constexpr double kScorePauseSeconds = 0.5;  ///< Pause after a score flash

    explicit SoundFx(bool enabled = false) : on(enabled) {}

    void toggle() { on = !on; }
    bool enabled() const { return on; }

    /**
     * @brief Pick the alert for a tick
     *
     * @param ev Event reported by the step
     * @param uncapped True while the pacer is uncapped
     * @param now Monotonic time in seconds
     */
    Alert on_step(StepEvent ev, bool uncapped, double now);

private:
    bool on;
    double last_beep = -1.0e9;
};
