#include "animation/animation_loop.hpp"
#include "terminal/input.hpp"

namespace braille {

AnimationLoop::AnimationLoop(OutputSink& out, const AnimationLoopConfig& config)
    : out_(out),
      config_(config),
      buffer_(config.cols, config.rows),
      timer_(config.fps) {}

void AnimationLoop::set_diagnostics(std::ostream* log) {
    log_ = log;
    renderer_.set_diagnostics(log);
}

Result AnimationLoop::run(const FrameCallback& on_frame) {
    stop_requested_ = false;
    timer_.reset();

    uint64_t frame_index = 0;
    while (!stop_requested_) {
        if (config_.max_frames > 0 && stats_.frames >= config_.max_frames) {
            break;
        }

        if (key_source_) {
            for (int key = key_source_(); key >= 0 && !stop_requested_; key = key_source_()) {
                handle_key(key);
            }
            if (stop_requested_) break;
        }

        if (size_source_) {
            const Size size = size_source_();
            if (DotGrid::valid_dimensions(size.width, size.height) && size != buffer_.size()) {
                Result r = handle_resize(size);
                if (r.failure()) return r;
            }
        }

        if (paused_) {
            timer_.wait_for_next_frame();
            continue;
        }

        DotGrid& back = buffer_.back();
        if (config_.clear_each_frame) {
            back.clear();
        }

        if (!on_frame(frame_index, back)) {
            break;
        }

        buffer_.swap();

        Result r = present_front();
        if (r.failure()) {
            if (log_) {
                *log_ << "Debug: frame " << frame_index << " output failed: " << r.message << "\n";
            }
            stats_.actual_fps = timer_.actual_fps();
            stats_.overruns = timer_.overrun_count();
            return r;
        }

        if (observer_) {
            observer_(frame_index, buffer_.front());
        }

        ++stats_.frames;
        ++frame_index;

        if (config_.max_frames > 0 && stats_.frames >= config_.max_frames) {
            break;
        }
        timer_.wait_for_next_frame();
    }

    stats_.actual_fps = timer_.actual_fps();
    stats_.overruns = timer_.overrun_count();
    return Result::ok();
}

Result AnimationLoop::present_front() {
    const DotGrid& front = buffer_.front();

    if (!config_.differential) {
        Result r = buffer_.present(out_);
        if (r.failure()) return r;
        stats_.cells_written += front.cell_count();
        ++stats_.full_redraws;
        return r;
    }

    Result r = renderer_.render(front, out_);
    if (r.failure()) return r;

    const RenderStats& rs = renderer_.last_stats();
    stats_.cells_written += rs.cells_written;
    if (rs.full_redraw) ++stats_.full_redraws;
    return r;
}

void AnimationLoop::handle_key(int key) {
    switch (key) {
        case 'q':
        case 'Q':
        case input::KEY_ESCAPE:
            stop_requested_ = true;
            break;
        case ' ':
            paused_ = !paused_;
            break;
        case 'r':
        case 'R':
            renderer_.invalidate();
            break;
        default:
            break;
    }
}

Result AnimationLoop::handle_resize(const Size& size) {
    if (log_) {
        *log_ << "Debug: resize " << buffer_.width() << "x" << buffer_.height()
              << " -> " << size.width << "x" << size.height << "\n";
    }

    config_.cols = size.width;
    config_.rows = size.height;
    buffer_ = FrameBuffer(size.width, size.height);
    renderer_.invalidate();
    timer_.reset();
    ++stats_.resizes;

    return out_.clear_screen();
}

}
