#pragma once

#include "render/output_sink.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace braille {

struct SinkOp {
    enum class Kind { Text, Char, Move, Foreground, Reset, Clear, Flush };

    Kind kind = Kind::Text;
    int row = 0;
    int col = 0;
    Color color;
    uint32_t codepoint = 0;
    std::string text;
};

// In-memory sink. Records every operation and, when given a size, keeps a
// virtual screen so tests can check what a terminal would be showing.
class RecordingSink : public OutputSink {
public:
    RecordingSink() = default;
    RecordingSink(int cols, int rows);

    Result write(const std::string& text) override;
    Result write_char(uint32_t codepoint) override;
    Result move_cursor(int row, int col) override;
    Result set_foreground(const Color& color) override;
    Result reset_colors() override;
    Result clear_screen() override;
    Result flush() override;

    const std::vector<SinkOp>& ops() const { return ops_; }
    void clear_ops();

    size_t chars_written() const { return chars_written_; }
    size_t cursor_moves() const { return cursor_moves_; }
    size_t color_changes() const { return color_changes_; }
    size_t flush_count() const { return flush_count_; }
    size_t clear_count() const { return clear_count_; }

    // Screen positions written by write_char since the last clear_ops().
    const std::vector<std::pair<int, int>>& touched() const { return touched_; }

    uint32_t screen_char(int col, int row) const;
    std::optional<Color> screen_color(int col, int row) const;

    // Every operation after the next `ops` succeeds fails with OUTPUT_FAILURE.
    void fail_after(size_t ops);
    void stop_failing() { fail_after_.reset(); }

private:
    std::vector<SinkOp> ops_;
    std::vector<std::pair<int, int>> touched_;
    size_t chars_written_ = 0;
    size_t cursor_moves_ = 0;
    size_t color_changes_ = 0;
    size_t flush_count_ = 0;
    size_t clear_count_ = 0;

    int cols_ = 0;
    int rows_ = 0;
    int cursor_row_ = 0;
    int cursor_col_ = 0;
    std::optional<Color> current_color_;
    std::vector<uint32_t> screen_;
    std::vector<std::optional<Color>> screen_colors_;

    std::optional<size_t> fail_after_;

    Result check_failure();
};

}
