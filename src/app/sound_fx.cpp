#include "app/sound_fx.h"

Alert SoundFx::on_step(StepEvent ev, bool uncapped, double now) {
    if (!on || uncapped) return Alert::None;
    if (ev == StepEvent::Score) return Alert::Flash;
    if (ev == StepEvent::PaddleBounce && now - last_beep >= 1.0 / kMaxBeepsPerSecond) {
        last_beep = now;
        return Alert::Beep;
    }
    return Alert::None;
}
