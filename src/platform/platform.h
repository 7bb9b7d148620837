/**
 * @file platform/platform.h
 * @brief Platform abstraction layer for terminal I/O
 *
 * The console game talks to the terminal only through this interface, so
 * the loop and the painting code stay free of termios details.
 */
#pragma once
#include <memory>
#include <string>

struct Platform {
    virtual ~Platform() = default;

    /**
     * @brief Non-blocking check for pending keyboard input
     */
    virtual bool kbhit() = 0;

    /**
     * @brief Read one byte of keyboard input
     * @return Byte value (0-255), or -1 when nothing could be read
     */
    virtual int getch() = 0;

    virtual void clear_screen() = 0;
    virtual void set_cursor_visible(bool visible) = 0;
    virtual void enable_ansi() = 0;

    /// Write a prepared frame and flush it
    virtual void write(const std::string &frame) = 0;

    /// Ring the terminal bell
    virtual void beep() = 0;

    /// Briefly invert the screen
    virtual void flash() = 0;
};

/**
 * @brief Create the platform implementation for this OS
 *
 * Puts the terminal into non-canonical, no-echo mode; the returned object
 * restores it when destroyed.
 */
std::unique_ptr<Platform> createPlatform();
