#include "animation/frame_timer.hpp"
#include <algorithm>
#include <thread>

namespace braille {

namespace {

std::chrono::nanoseconds budget_for(int fps) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(1.0 / static_cast<double>(fps)));
}

}

FrameTimer::FrameTimer(int target_fps)
    : target_fps_(std::clamp(target_fps, MIN_FPS, MAX_FPS)),
      frame_duration_(budget_for(target_fps_)),
      last_frame_(Clock::now()) {}

void FrameTimer::set_target_fps(int fps) {
    target_fps_ = std::clamp(fps, MIN_FPS, MAX_FPS);
    frame_duration_ = budget_for(target_fps_);
}

void FrameTimer::wait_for_next_frame() {
    const auto elapsed = std::chrono::duration_cast<Duration>(Clock::now() - last_frame_);
    const auto remaining = frame_duration_ - elapsed;

    if (remaining > Duration::zero()) {
        std::this_thread::sleep_for(remaining);
    } else {
        ++overruns_;
    }

    // The next budget starts from here, never from where this frame should
    // have ended.
    const auto now = Clock::now();
    record(std::chrono::duration_cast<Duration>(now - last_frame_));
    last_frame_ = now;
}

void FrameTimer::record(Duration frame_time) {
    if (history_.size() >= HISTORY_SIZE) {
        history_.pop_front();
    }
    history_.push_back(frame_time);
}

double FrameTimer::actual_fps() const {
    if (history_.empty()) return 0.0;

    Duration total = Duration::zero();
    for (const auto& d : history_) {
        total += d;
    }
    const double avg_seconds = std::chrono::duration<double>(total).count() /
                               static_cast<double>(history_.size());
    return avg_seconds > 0.0 ? 1.0 / avg_seconds : 0.0;
}

FrameTimer::Duration FrameTimer::last_frame_duration() const {
    if (history_.empty()) return Duration::zero();
    return history_.back();
}

void FrameTimer::reset() {
    history_.clear();
    last_frame_ = Clock::now();
}

}
