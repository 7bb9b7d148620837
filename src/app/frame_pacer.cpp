/**
 * @file frame_pacer.cpp
 * @brief Frame rate ladder and end-of-frame sleep
 */

#include "app/frame_pacer.h"
#include <thread>

FramePacer::FramePacer(int fps)
: target_fps(snap_to_ladder(fps)), actual_fps(target_fps), frame_start(clock::now()), last(clock::now()) {}

int FramePacer::snap_to_ladder(int fps) {
    int f = kMinFps;
    while (f * 2 <= kMaxFps && f * 2 <= fps) f *= 2;
    return f;
}

void FramePacer::faster() {
    if (max_mode) return;
    if (target_fps >= kMaxFps) { max_mode = true; return; }
    target_fps *= 2;
}

void FramePacer::slower() {
    if (max_mode) { max_mode = false; target_fps = kMaxFps; return; }
    if (target_fps / 2 >= kMinFps) target_fps /= 2;
}

double FramePacer::frame_interval() const { return max_mode ? 0.0 : 1.0 / target_fps; }

double FramePacer::remaining(double elapsed) const {
    double r = frame_interval() - elapsed;
    return r > 0.0 ? r : 0.0;
}

void FramePacer::begin_frame() { frame_start = clock::now(); }

void FramePacer::end_frame() {
    auto now = clock::now();
    std::chrono::duration<double> work = now - frame_start;
    if (work.count() > 0.0) actual_fps = 1.0 / work.count();
    if (!max_mode) {
        std::chrono::duration<double> since_last = now - last;
        double wait = remaining(since_last.count());
        if (wait > 0.0) std::this_thread::sleep_for(std::chrono::duration<double>(wait));
    }
    last = clock::now();
}
