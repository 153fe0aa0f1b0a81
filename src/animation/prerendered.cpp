#include "animation/prerendered.hpp"
#include "core/replay.hpp"
#include "render/differential_renderer.hpp"
#include <algorithm>
#include <utility>

namespace braille {

PrerenderedAnimation::PrerenderedAnimation(int frame_rate)
    : frame_rate_(std::clamp(frame_rate, FrameTimer::MIN_FPS, FrameTimer::MAX_FPS)) {}

Result PrerenderedAnimation::check_dimensions(const DotGrid& grid) const {
    if (frames_.empty() || frames_.front().size() == grid.size()) {
        return Result::ok();
    }
    const DotGrid& first = frames_.front();
    return Result::fail(ErrorCode::INVALID_DIMENSIONS,
        "frame is " + std::to_string(grid.width()) + "x" + std::to_string(grid.height()) +
        ", animation is " + std::to_string(first.width()) + "x" + std::to_string(first.height()));
}

Result PrerenderedAnimation::add_frame(const DotGrid& grid) {
    Result r = check_dimensions(grid);
    if (r.failure()) return r;
    frames_.push_back(grid);
    return Result::ok();
}

Result PrerenderedAnimation::add_frame(DotGrid&& grid) {
    Result r = check_dimensions(grid);
    if (r.failure()) return r;
    frames_.push_back(std::move(grid));
    return Result::ok();
}

const DotGrid* PrerenderedAnimation::frame(size_t index) const {
    if (index >= frames_.size()) return nullptr;
    return &frames_[index];
}

std::optional<Size> PrerenderedAnimation::dimensions() const {
    if (frames_.empty()) return std::nullopt;
    return frames_.front().size();
}

Result PrerenderedAnimation::play(OutputSink& out, const StopPredicate& stop) const {
    if (frames_.empty()) return Result::ok();

    FrameTimer timer(frame_rate_);
    DifferentialRenderer renderer;

    for (const DotGrid& grid : frames_) {
        if (stop && stop()) break;
        Result r = renderer.render(grid, out);
        if (r.failure()) return r;
        timer.wait_for_next_frame();
    }
    return Result::ok();
}

Result PrerenderedAnimation::play_loop(OutputSink& out, const StopPredicate& stop) const {
    if (!stop) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "looped playback needs a stop predicate");
    }
    if (frames_.empty()) return Result::ok();

    FrameTimer timer(frame_rate_);
    DifferentialRenderer renderer;

    for (size_t i = 0; !stop(); i = (i + 1) % frames_.size()) {
        Result r = renderer.render(frames_[i], out);
        if (r.failure()) return r;
        timer.wait_for_next_frame();
    }
    return Result::ok();
}

bool PrerenderedAnimation::save(const std::string& path) const {
    if (frames_.empty()) return false;

    ReplayWriter writer;
    const DotGrid& first = frames_.front();
    if (!writer.open(path, first.width(), first.height(), frame_rate_, "")) {
        return false;
    }
    for (const DotGrid& grid : frames_) {
        if (!writer.write(grid)) {
            return false;
        }
    }
    writer.close();
    return true;
}

std::optional<PrerenderedAnimation> PrerenderedAnimation::load(const std::string& path) {
    ReplayReader reader;
    if (!reader.open(path)) {
        return std::nullopt;
    }

    PrerenderedAnimation anim(reader.fps());
    DotGrid grid(reader.cols(), reader.rows());
    for (uint32_t i = 0; i < reader.frame_count(); ++i) {
        if (!reader.read_frame(i, grid)) {
            return std::nullopt;
        }
        if (anim.add_frame(grid).failure()) {
            return std::nullopt;
        }
    }
    return anim;
}

}
