#pragma once

#include "animation/frame_timer.hpp"
#include "core/dot_grid.hpp"
#include "render/output_sink.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <cstddef>

namespace braille {

// A fixed sequence of equally sized grids played back at a set rate.
class PrerenderedAnimation {
public:
    using StopPredicate = std::function<bool()>;

    explicit PrerenderedAnimation(int frame_rate = FrameTimer::DEFAULT_FPS);

    // The first frame fixes the dimensions for the rest.
    Result add_frame(const DotGrid& grid);
    Result add_frame(DotGrid&& grid);

    size_t frame_count() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }
    const DotGrid* frame(size_t index) const;

    int frame_rate() const { return frame_rate_; }
    std::optional<Size> dimensions() const;

    // Plays every frame once. stop is checked before each frame.
    Result play(OutputSink& out, const StopPredicate& stop = StopPredicate()) const;
    // Repeats from the first frame until stop returns true.
    Result play_loop(OutputSink& out, const StopPredicate& stop) const;

    bool save(const std::string& path) const;
    static std::optional<PrerenderedAnimation> load(const std::string& path);

private:
    std::vector<DotGrid> frames_;
    int frame_rate_;

    Result check_dimensions(const DotGrid& grid) const;
};

}
