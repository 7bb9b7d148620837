/**
 * @file console/game.h
 * @brief Console game loop for autopong
 */
#pragma once

#include "app/frame_pacer.h"
#include "app/match_session.h"
#include "app/sound_fx.h"
#include "platform/platform.h"
#include "platform/screen_buffer.h"

/**
 * @brief Real-time loop driving one MatchSession on a terminal
 *
 * Each frame: read at most one key, step the session once, paint the frame,
 * emit any sound alert, then sleep out the frame interval.
 */
class Game {
public:
    /**
     * @param session Match to drive; must outlive the Game
     * @param platform Terminal to draw on and read keys from
     * @param fps Initial frame rate
     * @param sound Initial sound toggle
     */
    Game(MatchSession &session, Platform &platform, int fps, bool sound);

    /**
     * @brief Run until the quit key, or until @p max_frames frames when > 0
     * @return Process exit code
     */
    int run(unsigned long max_frames = 0);

    /**
     * @brief Apply one key press
     *
     * ESC or q quits, s toggles sound, + and - change the frame rate.
     */
    void handle_key(int c);

    bool is_running() const { return running; }
    const FramePacer &pacer() const { return frame_pacer; }
    const SoundFx &sound() const { return sound_fx; }
    unsigned long frames() const { return frame_count; }

private:
    void process_input();
    void update();
    void render();

    MatchSession &session;
    Platform &platform;
    FramePacer frame_pacer;
    SoundFx sound_fx;
    ScreenBuffer screen;
    StepEvent last_event = StepEvent::None;
    bool running = true;
    unsigned long frame_count = 0;
};
