#include "app/settings.h"
#include "app/frame_pacer.h"
#include <cstddef>
#include <fstream>
#include <iterator>
#include <limits>

Settings SettingsManager::load(const std::string &path, bool *found) {
    std::ifstream ifs(path, std::ios::binary);
    if (found) *found = static_cast<bool>(ifs);
    if (!ifs) return Settings{};
    std::string raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parse(raw);
}

Settings SettingsManager::parse(const std::string &raw) {
    Settings s; // defaults

    // "key" then ':' then optional whitespace then an optionally negative integer.
    // A magnitude that does not fit 64 bits counts as unparseable.
    auto extractInt = [&](const std::string &key, std::uint64_t &mag, bool &neg) {
        std::size_t pos = raw.find("\"" + key + "\"");
        if (pos == std::string::npos) return false;
        pos = raw.find(':', pos);
        if (pos == std::string::npos) return false;
        pos++;
        while (pos < raw.size() && (raw[pos] == ' ' || raw[pos] == '\t' || raw[pos] == '\n' || raw[pos] == '\r')) pos++;
        neg = false;
        if (pos < raw.size() && raw[pos] == '-') { neg = true; pos++; }
        std::uint64_t val = 0; bool any = false;
        while (pos < raw.size() && raw[pos] >= '0' && raw[pos] <= '9') {
            std::uint64_t digit = static_cast<std::uint64_t>(raw[pos] - '0');
            if (val > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) return false;
            any = true; val = val * 10 + digit; pos++;
        }
        if (!any) return false;
        mag = val;
        return true;
    };
    // values outside the int range keep the default
    auto extractField = [&](const std::string &key, int &dst) {
        std::uint64_t mag = 0; bool neg = false;
        if (!extractInt(key, mag, neg)) return;
        const std::uint64_t limit = neg ? static_cast<std::uint64_t>(std::numeric_limits<int>::max()) + 1
                                        : static_cast<std::uint64_t>(std::numeric_limits<int>::max());
        if (mag > limit) return;
        dst = neg ? static_cast<int>(-static_cast<long long>(mag)) : static_cast<int>(mag);
    };

    extractField("fps", s.fps);
    extractField("sound", s.sound);
    std::uint64_t seed = 0; bool seed_neg = false;
    if (extractInt("seed", seed, seed_neg) && !seed_neg) s.seed = seed;
    extractField("width", s.field.width);
    extractField("height", s.field.height);
    extractField("paddle_h", s.field.paddle_h);
    extractField("paddle_speed", s.field.paddle_speed);

    // Defensive clamp after load
    if (s.fps < FramePacer::kMinFps) s.fps = FramePacer::kMinFps;
    else if (s.fps > FramePacer::kMaxFps) s.fps = FramePacer::kMaxFps;
    s.fps = FramePacer::snap_to_ladder(s.fps);
    s.sound = s.sound ? 1 : 0;
    return s;
}
