#pragma once

#include "core/dot_grid.hpp"
#include "render/output_sink.hpp"

namespace braille {

// Front is what is on screen, back is what is being drawn. swap() exchanges
// the roles without touching cell data.
class FrameBuffer {
public:
    FrameBuffer(int width, int height);

    DotGrid& back() { return back_; }
    const DotGrid& front() const { return front_; }

    void swap();
    Result present(OutputSink& out) const;

    int width() const { return front_.width(); }
    int height() const { return front_.height(); }
    Size size() const { return front_.size(); }

private:
    DotGrid front_;
    DotGrid back_;
};

}
