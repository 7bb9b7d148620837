#include "core/random_source.h"
#include <algorithm>
#include <cmath>
#include <utility>

int RandomSource::next_int(int lo, int hi) {
    if (hi <= lo) return lo;
    int span = hi - lo + 1;
    int k = static_cast<int>(std::floor(next_unit() * span));
    return lo + std::min(std::max(k, 0), span - 1);
}

MersenneRandom::MersenneRandom(std::uint64_t seed) : rng(seed) {}

double MersenneRandom::next_unit() { return dist(rng); }

ScriptedRandom::ScriptedRandom(std::vector<double> values) : script(std::move(values)) {}

double ScriptedRandom::next_unit() {
    if (script.empty()) { ++consumed; return 0.0; }
    double v = script[consumed % script.size()];
    ++consumed;
    // keep strictly below 1 so bucket and integer mapping stay in range
    return std::min(std::max(v, 0.0), std::nextafter(1.0, 0.0));
}
