#include "app/match_session.h"
#include <utility>

MatchSession::MatchSession(const FieldConfig &cfg, std::uint64_t seed)
: MatchSession(cfg, std::make_unique<MersenneRandom>(seed)) {}

MatchSession::MatchSession(const FieldConfig &cfg, std::unique_ptr<RandomSource> rng)
: cfg(cfg), rng(std::move(rng)) {
    validate_field_config(this->cfg);
    if (!this->rng) this->rng = std::make_unique<MersenneRandom>(0);
    current = initial_match(this->cfg, *this->rng);
}

StepEvent MatchSession::step() {
    MatchState next = step_match(current, cfg, *rng);
    StepEvent ev = classify_step(current, next);
    current = next;
    return ev;
}
