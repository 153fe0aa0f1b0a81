#pragma once

#include "core/dot_grid.hpp"
#include "render/output_sink.hpp"
#include <optional>
#include <ostream>
#include <cstddef>
#include <cstdint>

namespace braille {

struct RenderStats {
    size_t cells_written = 0;
    size_t cells_total = 0;
    bool full_redraw = false;
};

// Emits only the cells that differ from the last grid it rendered. The
// baseline is an owned copy, so callers may keep mutating their grid.
class DifferentialRenderer {
public:
    DifferentialRenderer() = default;

    Result render(const DotGrid& current, OutputSink& out);
    void invalidate();

    bool has_baseline() const { return baseline_.has_value(); }
    const DotGrid* baseline() const { return baseline_ ? &*baseline_ : nullptr; }

    size_t count_changed_cells(const DotGrid& current) const;
    static size_t count_changed_cells(const DotGrid& current, const DotGrid& previous);

    const RenderStats& last_stats() const { return stats_; }
    uint64_t dimension_mismatches() const { return dimension_mismatches_; }

    void set_diagnostics(std::ostream* log) { log_ = log; }

private:
    std::optional<DotGrid> baseline_;
    RenderStats stats_;
    uint64_t dimension_mismatches_ = 0;
    std::ostream* log_ = nullptr;

    Result render_full(const DotGrid& current, OutputSink& out);
    Result render_changes(const DotGrid& current, OutputSink& out);
    void store_baseline(const DotGrid& current);
};

}
