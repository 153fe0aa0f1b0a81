#include "render/recording_sink.hpp"
#include <algorithm>
#include <utility>

namespace braille {

RecordingSink::RecordingSink(int cols, int rows) : cols_(cols), rows_(rows) {
    screen_.assign(static_cast<size_t>(cols) * static_cast<size_t>(rows), static_cast<uint32_t>(' '));
    screen_colors_.assign(screen_.size(), std::nullopt);
}

Result RecordingSink::check_failure() {
    if (!fail_after_) return Result::ok();
    if (*fail_after_ == 0) {
        return Result::fail(ErrorCode::OUTPUT_FAILURE, "simulated output failure");
    }
    --*fail_after_;
    return Result::ok();
}

void RecordingSink::fail_after(size_t ops) {
    fail_after_ = ops;
}

Result RecordingSink::write(const std::string& text) {
    Result r = check_failure();
    if (r.failure()) return r;

    SinkOp op;
    op.kind = SinkOp::Kind::Text;
    op.text = text;
    ops_.push_back(std::move(op));
    return Result::ok();
}

Result RecordingSink::write_char(uint32_t codepoint) {
    Result r = check_failure();
    if (r.failure()) return r;

    SinkOp op;
    op.kind = SinkOp::Kind::Char;
    op.row = cursor_row_;
    op.col = cursor_col_;
    op.codepoint = codepoint;
    if (current_color_) op.color = *current_color_;
    ops_.push_back(op);

    touched_.emplace_back(cursor_col_, cursor_row_);
    ++chars_written_;

    if (cursor_row_ >= 0 && cursor_row_ < rows_ && cursor_col_ >= 0 && cursor_col_ < cols_) {
        const size_t idx = static_cast<size_t>(cursor_row_) * static_cast<size_t>(cols_) +
                           static_cast<size_t>(cursor_col_);
        screen_[idx] = codepoint;
        screen_colors_[idx] = current_color_;
    }
    ++cursor_col_;
    return Result::ok();
}

Result RecordingSink::move_cursor(int row, int col) {
    Result r = check_failure();
    if (r.failure()) return r;

    SinkOp op;
    op.kind = SinkOp::Kind::Move;
    op.row = row;
    op.col = col;
    ops_.push_back(op);

    cursor_row_ = row;
    cursor_col_ = col;
    ++cursor_moves_;
    return Result::ok();
}

Result RecordingSink::set_foreground(const Color& color) {
    Result r = check_failure();
    if (r.failure()) return r;

    SinkOp op;
    op.kind = SinkOp::Kind::Foreground;
    op.color = color;
    ops_.push_back(op);

    current_color_ = color;
    ++color_changes_;
    return Result::ok();
}

Result RecordingSink::reset_colors() {
    Result r = check_failure();
    if (r.failure()) return r;

    SinkOp op;
    op.kind = SinkOp::Kind::Reset;
    ops_.push_back(op);

    current_color_.reset();
    return Result::ok();
}

Result RecordingSink::clear_screen() {
    Result r = check_failure();
    if (r.failure()) return r;

    SinkOp op;
    op.kind = SinkOp::Kind::Clear;
    ops_.push_back(op);

    std::fill(screen_.begin(), screen_.end(), static_cast<uint32_t>(' '));
    std::fill(screen_colors_.begin(), screen_colors_.end(), std::nullopt);
    cursor_row_ = 0;
    cursor_col_ = 0;
    ++clear_count_;
    return Result::ok();
}

Result RecordingSink::flush() {
    Result r = check_failure();
    if (r.failure()) return r;

    SinkOp op;
    op.kind = SinkOp::Kind::Flush;
    ops_.push_back(op);
    ++flush_count_;
    return Result::ok();
}

void RecordingSink::clear_ops() {
    ops_.clear();
    touched_.clear();
    chars_written_ = 0;
    cursor_moves_ = 0;
    color_changes_ = 0;
    flush_count_ = 0;
    clear_count_ = 0;
}

uint32_t RecordingSink::screen_char(int col, int row) const {
    if (col < 0 || col >= cols_ || row < 0 || row >= rows_) return 0;
    return screen_[static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(col)];
}

std::optional<Color> RecordingSink::screen_color(int col, int row) const {
    if (col < 0 || col >= cols_ || row < 0 || row >= rows_) return std::nullopt;
    return screen_colors_[static_cast<size_t>(row) * static_cast<size_t>(cols_) + static_cast<size_t>(col)];
}

}
