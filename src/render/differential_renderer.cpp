#include "render/differential_renderer.hpp"
#include "render/cell_writer.hpp"

namespace braille {

Result DifferentialRenderer::render(const DotGrid& current, OutputSink& out) {
    stats_ = RenderStats{};
    stats_.cells_total = current.cell_count();

    Result r;
    if (!baseline_) {
        r = render_full(current, out);
    } else if (baseline_->size() != current.size()) {
        ++dimension_mismatches_;
        if (log_) {
            *log_ << "Debug: grid size changed " << baseline_->width() << "x" << baseline_->height()
                  << " -> " << current.width() << "x" << current.height()
                  << ", redrawing all cells\n";
        }
        r = render_full(current, out);
    } else {
        r = render_changes(current, out);
    }

    if (r.success()) {
        r = out.flush();
    }

    if (r.failure()) {
        // The screen no longer matches any known state.
        baseline_.reset();
        return r;
    }

    store_baseline(current);
    return Result::ok();
}

Result DifferentialRenderer::render_full(const DotGrid& current, OutputSink& out) {
    stats_.full_redraw = true;
    return draw_full(current, out, &stats_.cells_written);
}

Result DifferentialRenderer::render_changes(const DotGrid& current, OutputSink& out) {
    const std::vector<Cell>& cells = current.cells();
    const std::vector<Cell>& prev = baseline_->cells();
    const int cols = current.width();
    const int rows = current.height();

    int cursor_x = -1;
    int cursor_y = -1;
    size_t written = 0;

    for (int y = 0; y < rows; ++y) {
        const size_t row_start = static_cast<size_t>(y) * static_cast<size_t>(cols);
        for (int x = 0; x < cols; ++x) {
            const size_t idx = row_start + static_cast<size_t>(x);
            if (cells[idx] == prev[idx]) continue;

            if (cursor_x != x || cursor_y != y) {
                Result r = out.move_cursor(y, x);
                if (r.failure()) return r;
            }

            Result r = write_cell(out, cells[idx]);
            if (r.failure()) return r;
            ++written;

            // Unknown widths end cursor reuse.
            if (advances_one_column(cells[idx].character())) {
                cursor_x = x + 1;
                cursor_y = y;
            } else {
                cursor_x = -1;
                cursor_y = -1;
            }
        }
    }

    stats_.cells_written = written;
    return Result::ok();
}

void DifferentialRenderer::store_baseline(const DotGrid& current) {
    if (baseline_ && baseline_->size() == current.size()) {
        *baseline_ = current;
    } else {
        baseline_.emplace(current);
    }
}

void DifferentialRenderer::invalidate() {
    baseline_.reset();
}

size_t DifferentialRenderer::count_changed_cells(const DotGrid& current) const {
    if (!baseline_) return current.cell_count();
    return count_changed_cells(current, *baseline_);
}

size_t DifferentialRenderer::count_changed_cells(const DotGrid& current, const DotGrid& previous) {
    if (current.size() != previous.size()) {
        return current.cell_count();
    }

    const std::vector<Cell>& a = current.cells();
    const std::vector<Cell>& b = previous.cells();
    size_t count = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) ++count;
    }
    return count;
}

}
