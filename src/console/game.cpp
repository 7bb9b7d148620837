/**
 * @file console/game.cpp
 * @brief Implementation of the console game loop
 */

#include "console/game.h"
#include "console/frame_painter.h"
#include <chrono>
#include <thread>

namespace {
constexpr int kEsc = 0x1B;

double now_seconds() {
    using clock = std::chrono::steady_clock;
    return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
}
}

Game::Game(MatchSession &session, Platform &platform, int fps, bool sound)
: session(session), platform(platform), frame_pacer(fps), sound_fx(sound),
  screen(session.config().width, session.config().height + kStatusRows) {}

void Game::handle_key(int c) {
    switch (c) {
        case kEsc:
        case 'q': case 'Q': running = false; break;
        case 's': case 'S': sound_fx.toggle(); break;
        case '+': frame_pacer.faster(); break;
        case '-': frame_pacer.slower(); break;
        default: break;
    }
}

void Game::process_input() {
    // one key per frame, so a held key moves one step per frame
    if (!platform.kbhit()) return;
    int c = platform.getch();
    if (c < 0) return;
    if (c == kEsc && platform.kbhit()) {
        // ANSI sequence such as an arrow key: swallow it, not a quit
        int b1 = platform.getch();
        if (b1 == '[' || b1 == 'O') {
            while (platform.kbhit()) {
                int b = platform.getch();
                if (b < 0 || (b >= 0x40 && b <= 0x7E)) break;
            }
            return;
        }
        handle_key(kEsc);
        return;
    }
    handle_key(c);
}

void Game::update() { last_event = session.step(); }

void Game::render() {
    StatusInfo status;
    status.sound = sound_fx.enabled();
    status.uncapped = frame_pacer.uncapped();
    status.fps = frame_pacer.fps();
    status.measured_fps = frame_pacer.measured_fps();
    paint_frame(screen, session.state(), session.config(), status);
    platform.write(screen.to_ansi());

    switch (sound_fx.on_step(last_event, frame_pacer.uncapped(), now_seconds())) {
        case Alert::Flash:
            platform.flash();
            std::this_thread::sleep_for(std::chrono::duration<double>(SoundFx::kScorePauseSeconds));
            break;
        case Alert::Beep: platform.beep(); break;
        case Alert::None: break;
    }
}

int Game::run(unsigned long max_frames) {
    platform.set_cursor_visible(false);
    platform.clear_screen();
    while (running) {
        process_input();
        if (!running) break;
        frame_pacer.begin_frame();
        update();
        render();
        ++frame_count;
        if (max_frames > 0 && frame_count >= max_frames) running = false;
        frame_pacer.end_frame();
    }
    platform.set_cursor_visible(true);
    return 0;
}
