#pragma once

#include "core/dot_grid.hpp"
#include "render/output_sink.hpp"
#include <cstddef>
#include <cstdint>

namespace braille {

// False for characters that may not take exactly one terminal column:
// zero-width marks and anything from U+1100 up except braille.
bool advances_one_column(uint32_t cp);

Result write_cell(OutputSink& out, const Cell& cell);

// Writes every cell row by row, moving the cursor to the start of each row
// and again after any cell that does not advance exactly one column.
// Does not flush.
Result draw_full(const DotGrid& grid, OutputSink& out, size_t* cells_written = nullptr);

}
