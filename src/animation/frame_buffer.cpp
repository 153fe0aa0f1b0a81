#include "animation/frame_buffer.hpp"
#include "render/cell_writer.hpp"
#include <utility>

namespace braille {

FrameBuffer::FrameBuffer(int width, int height)
    : front_(width, height), back_(width, height) {}

void FrameBuffer::swap() {
    // std::swap on DotGrid moves the cell vectors, which only exchanges pointers.
    std::swap(front_, back_);
}

Result FrameBuffer::present(OutputSink& out) const {
    Result r = draw_full(front_, out);
    if (r.failure()) return r;
    return out.flush();
}

}
