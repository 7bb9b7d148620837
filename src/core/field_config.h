/**
 * @file field_config.h
 * @brief Playing field geometry and paddle tuning for autopong
 *
 * The field is a fixed grid of character cells with (0,0) at the top-left
 * and Y increasing downward. Rows 0 and H-1 are the borders.
 */

#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Immutable field geometry shared by the core and the renderer
 */
struct FieldConfig {
    int width = 80;        ///< Field width in cells (W)
    int height = 25;       ///< Field height in cells (H)
    int paddle_h = 7;      ///< Paddle height in cells
    int paddle_speed = 2;  ///< Maximum paddle travel per tick while tracking

    /// Lowest valid paddle top row
    int paddle_min_y() const { return 1; }
    /// Highest valid paddle top row
    int paddle_max_y() const { return height - paddle_h - 1; }
    /// Column of the left paddle
    int left_paddle_x() const { return 1; }
    /// Column of the right paddle
    int right_paddle_x() const { return width - 2; }
};

/**
 * @brief Raised for degenerate field or paddle sizing
 *
 * Thrown once at startup; never raised from inside the frame loop.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Reject a configuration the simulation cannot honor
 *
 * Checks that the field is large enough for both paddles, the trigger zones
 * and the serve area, and that the paddle fits between the borders.
 *
 * @param cfg Configuration to check
 * @throws ConfigError describing the first violated constraint
 */
void validate_field_config(const FieldConfig &cfg);
