/**
 * @file console/main.cpp
 * @brief Entry point for autopong
 *
 * Usage: autopong [settings.json]
 */

#include "app/match_session.h"
#include "app/settings.h"
#include "console/game.h"
#include "platform/platform.h"
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char **argv) {
    Settings settings;
    if (argc > 1) {
        bool found = false;
        settings = SettingsManager().load(argv[1], &found);
        if (!found) std::cerr << "[INFO] Settings file " << argv[1] << " not found, using defaults\n";
    }
    if (settings.seed == 0)
        settings.seed = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());

    std::unique_ptr<MatchSession> session;
    try {
        session = std::make_unique<MatchSession>(settings.field, settings.seed);
    } catch (const std::exception &e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    int rc = 1;
    try {
        auto plat = createPlatform();
        if (!plat) {
            std::cerr << "[ERROR] Failed to create platform abstraction\n";
            return 1;
        }
        // unwinding out of this block destroys the platform, which restores the terminal
        Game g(*session, *plat, settings.fps, settings.sound != 0);
        rc = g.run();
    } catch (const std::exception &e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
    std::cout << "\x1b[2J\x1b[H" << std::flush;
    std::cerr << "[INFO] Final score " << session->state().score_a << " - " << session->state().score_b
              << " after " << session->state().tick << " ticks\n";
    return rc;
}
