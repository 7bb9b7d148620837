/**
 * @file platform/platform_posix.cpp
 * @brief termios implementation of the Platform interface
 */

#include "platform/platform.h"

#include <termios.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

constexpr auto kFlashDuration = std::chrono::milliseconds(60);

/**
 * @brief POSIX terminal in raw-ish mode
 *
 * Canonical input and echo are disabled for the lifetime of the object;
 * the original settings and the cursor are restored on destruction.
 */
class PosixPlatform : public Platform {
public:
    PosixPlatform() {
        enable_ansi();
        orig = {};
        have_orig = tcgetattr(STDIN_FILENO, &orig) == 0;
        if (have_orig) {
            term = orig;
            term.c_lflag &= ~(ICANON | ECHO);
            term.c_cc[VMIN] = 0;
            term.c_cc[VTIME] = 0;
            tcsetattr(STDIN_FILENO, TCSANOW, &term);
        }
    }

    ~PosixPlatform() override {
        if (have_orig) tcsetattr(STDIN_FILENO, TCSANOW, &orig);
        std::cout << "\x1b[0m";
        set_cursor_visible(true);
        std::cout << std::flush;
    }

    bool kbhit() override {
        int bytes = 0;
        if (ioctl(STDIN_FILENO, FIONREAD, &bytes) != 0) return false;
        return bytes > 0;
    }

    int getch() override {
        unsigned char c = 0;
        if (read(STDIN_FILENO, &c, 1) <= 0) return -1;
        return static_cast<int>(c);
    }

    void clear_screen() override { std::cout << "\x1b[2J\x1b[H"; }

    void set_cursor_visible(bool visible) override {
        if (visible) std::cout << "\x1b[?25h";
        else std::cout << "\x1b[?25l";
    }

    void enable_ansi() override {
        // POSIX terminals support ANSI by default
    }

    void write(const std::string &frame) override { std::cout << frame << std::flush; }

    void beep() override { std::cout << '\a' << std::flush; }

    void flash() override {
        std::cout << "\x1b[?5h" << std::flush;
        std::this_thread::sleep_for(kFlashDuration);
        std::cout << "\x1b[?5l" << std::flush;
    }

private:
    struct termios orig;
    struct termios term;
    bool have_orig = false;
};

} // namespace

std::unique_ptr<Platform> createPlatform() { return std::make_unique<PosixPlatform>(); }
