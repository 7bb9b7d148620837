#include "core/field_config.h"

namespace {
constexpr int kMinWidth = 12;  // two paddles, two 5-cell trigger zones
constexpr int kMinHeight = 5;
constexpr int kMaxWidth = 1000;
constexpr int kMaxHeight = 500;
}

void validate_field_config(const FieldConfig &cfg) {
    if (cfg.width < kMinWidth)
        throw ConfigError("field width " + std::to_string(cfg.width) + " is below the minimum of " + std::to_string(kMinWidth));
    if (cfg.width > kMaxWidth)
        throw ConfigError("field width " + std::to_string(cfg.width) + " exceeds the maximum of " + std::to_string(kMaxWidth));
    if (cfg.height < kMinHeight)
        throw ConfigError("field height " + std::to_string(cfg.height) + " is below the minimum of " + std::to_string(kMinHeight));
    if (cfg.height > kMaxHeight)
        throw ConfigError("field height " + std::to_string(cfg.height) + " exceeds the maximum of " + std::to_string(kMaxHeight));
    if (cfg.paddle_h < 1)
        throw ConfigError("paddle height must be at least 1");
    // paddle occupies rows [1, H-2] at most
    if (cfg.paddle_h > cfg.height - 2)
        throw ConfigError("paddle height " + std::to_string(cfg.paddle_h) + " does not fit a field of height " + std::to_string(cfg.height));
    if (cfg.paddle_speed < 1)
        throw ConfigError("paddle speed must be at least 1");
    if (cfg.paddle_speed > cfg.height)
        throw ConfigError("paddle speed " + std::to_string(cfg.paddle_speed) + " exceeds the field height " + std::to_string(cfg.height));
}
