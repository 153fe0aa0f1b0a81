#pragma once

#include "animation/frame_buffer.hpp"
#include "animation/frame_timer.hpp"
#include "render/differential_renderer.hpp"
#include "render/output_sink.hpp"
#include <functional>
#include <ostream>
#include <utility>
#include <cstdint>

namespace braille {

struct AnimationLoopConfig {
    int cols = 80;
    int rows = 24;
    int fps = FrameTimer::DEFAULT_FPS;
    bool differential = true;
    // When false the callback sees the grid from two frames back.
    bool clear_each_frame = true;
    uint64_t max_frames = 0;
};

struct LoopStats {
    uint64_t frames = 0;
    uint64_t cells_written = 0;
    uint64_t full_redraws = 0;
    uint64_t resizes = 0;
    uint64_t overruns = 0;
    double actual_fps = 0.0;
};

// Drives draw -> swap -> render -> pace until the callback, a quit key,
// stop() or max_frames ends it. Keys: q/Esc quit, space pause, r redraw.
class AnimationLoop {
public:
    using FrameCallback = std::function<bool(uint64_t frame_index, DotGrid& back)>;
    using KeySource = std::function<int()>;
    using SizeSource = std::function<Size()>;
    using FrameObserver = std::function<void(uint64_t frame_index, const DotGrid& front)>;

    AnimationLoop(OutputSink& out, const AnimationLoopConfig& config);

    // Returns the first OUTPUT_FAILURE from the sink, otherwise ok.
    Result run(const FrameCallback& on_frame);
    void stop() { stop_requested_ = true; }

    void set_key_source(KeySource source) { key_source_ = std::move(source); }
    void set_size_source(SizeSource source) { size_source_ = std::move(source); }
    void set_frame_observer(FrameObserver observer) { observer_ = std::move(observer); }
    void set_diagnostics(std::ostream* log);

    const LoopStats& stats() const { return stats_; }
    const AnimationLoopConfig& config() const { return config_; }
    bool paused() const { return paused_; }

    const FrameBuffer& frame_buffer() const { return buffer_; }
    const FrameTimer& timer() const { return timer_; }
    const DifferentialRenderer& renderer() const { return renderer_; }

private:
    OutputSink& out_;
    AnimationLoopConfig config_;
    FrameBuffer buffer_;
    FrameTimer timer_;
    DifferentialRenderer renderer_;
    LoopStats stats_;

    KeySource key_source_;
    SizeSource size_source_;
    FrameObserver observer_;
    std::ostream* log_ = nullptr;

    bool stop_requested_ = false;
    bool paused_ = false;

    void handle_key(int key);
    Result handle_resize(const Size& size);
    Result present_front();
};

}
