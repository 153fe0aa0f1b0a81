#pragma once

#include <chrono>
#include <deque>
#include <cstddef>
#include <cstdint>

namespace braille {

class FrameTimer {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    static constexpr int MIN_FPS = 1;
    static constexpr int MAX_FPS = 240;
    static constexpr int DEFAULT_FPS = 60;
    static constexpr size_t HISTORY_SIZE = 60;

    explicit FrameTimer(int target_fps = DEFAULT_FPS);

    // Sleeps out whatever is left of the current frame budget. A frame that
    // already overran gets no sleep, and later frames are not shortened to
    // make up for it.
    void wait_for_next_frame();

    double actual_fps() const;
    Duration last_frame_duration() const;
    void reset();

    void set_target_fps(int fps);
    int target_fps() const { return target_fps_; }
    Duration target_frame_duration() const { return frame_duration_; }

    uint64_t overrun_count() const { return overruns_; }
    size_t history_size() const { return history_.size(); }

private:
    int target_fps_;
    Duration frame_duration_;
    Clock::time_point last_frame_;
    std::deque<Duration> history_;
    uint64_t overruns_ = 0;

    void record(Duration frame_time);
};

}
