#include "core/dot_grid.hpp"
#include "core/utf8.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace braille {

DotGrid::DotGrid(int width, int height) {
    if (!valid_dimensions(width, height)) {
        throw std::invalid_argument("invalid grid dimensions: " + std::to_string(width) +
                                    "x" + std::to_string(height));
    }
    width_ = width;
    height_ = height;
    cells_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), Cell{});
}

Result DotGrid::cell_out_of_bounds(int cell_x, int cell_y) const {
    return Result::fail(ErrorCode::OUT_OF_BOUNDS,
        "cell (" + std::to_string(cell_x) + ", " + std::to_string(cell_y) +
        ") outside grid of " + std::to_string(width_) + "x" + std::to_string(height_) + " cells");
}

Result DotGrid::set_dot(int dot_x, int dot_y, bool value) {
    if (!dot_in_bounds(dot_x, dot_y)) {
        return Result::fail(ErrorCode::OUT_OF_BOUNDS,
            "dot (" + std::to_string(dot_x) + ", " + std::to_string(dot_y) +
            ") outside dot space of " + std::to_string(dot_width()) + "x" + std::to_string(dot_height()));
    }

    Cell& c = cells_[index(dot_x / DOTS_PER_CELL_X, dot_y / DOTS_PER_CELL_Y)];
    const uint8_t bit = dot_bit(dot_x % DOTS_PER_CELL_X, dot_y % DOTS_PER_CELL_Y);
    if (value) {
        c.bits = static_cast<uint8_t>(c.bits | bit);
    } else {
        c.bits = static_cast<uint8_t>(c.bits & ~bit);
    }
    return Result::ok();
}

Result DotGrid::toggle_dot(int dot_x, int dot_y) {
    if (!dot_in_bounds(dot_x, dot_y)) {
        return Result::fail(ErrorCode::OUT_OF_BOUNDS,
            "dot (" + std::to_string(dot_x) + ", " + std::to_string(dot_y) +
            ") outside dot space of " + std::to_string(dot_width()) + "x" + std::to_string(dot_height()));
    }
    return set_dot(dot_x, dot_y, !get_dot(dot_x, dot_y));
}

bool DotGrid::get_dot(int dot_x, int dot_y) const {
    if (!dot_in_bounds(dot_x, dot_y)) return false;
    const Cell& c = cells_[index(dot_x / DOTS_PER_CELL_X, dot_y / DOTS_PER_CELL_Y)];
    return (c.bits & dot_bit(dot_x % DOTS_PER_CELL_X, dot_y % DOTS_PER_CELL_Y)) != 0;
}

void DotGrid::clear() {
    std::fill(cells_.begin(), cells_.end(), Cell{});
}

Result DotGrid::clear_region(int cell_x, int cell_y, int w, int h) {
    if (w < 0 || h < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "region size must not be negative");
    }
    if (w == 0 || h == 0) {
        return Result::ok();
    }
    if (!in_bounds(cell_x, cell_y) || w > width_ - cell_x || h > height_ - cell_y) {
        return cell_out_of_bounds(cell_x + w - 1, cell_y + h - 1);
    }

    for (int y = cell_y; y < cell_y + h; ++y) {
        auto row = cells_.begin() + static_cast<std::ptrdiff_t>(index(cell_x, y));
        std::fill(row, row + w, Cell{});
    }
    return Result::ok();
}

const Cell& DotGrid::cell(int cell_x, int cell_y) const {
    static const Cell empty;
    if (!in_bounds(cell_x, cell_y)) return empty;
    return cells_[index(cell_x, cell_y)];
}

uint8_t DotGrid::cell_bitfield(int cell_x, int cell_y) const {
    if (!in_bounds(cell_x, cell_y)) return 0;
    return cells_[index(cell_x, cell_y)].bits;
}

uint32_t DotGrid::cell_character(int cell_x, int cell_y) const {
    if (!in_bounds(cell_x, cell_y)) return BRAILLE_BLANK;
    return cells_[index(cell_x, cell_y)].character();
}

std::optional<Color> DotGrid::cell_color(int cell_x, int cell_y) const {
    if (!in_bounds(cell_x, cell_y)) return std::nullopt;
    const Cell& c = cells_[index(cell_x, cell_y)];
    if (!c.has_color) return std::nullopt;
    return c.color;
}

std::optional<uint32_t> DotGrid::cell_override(int cell_x, int cell_y) const {
    if (!in_bounds(cell_x, cell_y)) return std::nullopt;
    const Cell& c = cells_[index(cell_x, cell_y)];
    if (!c.has_override()) return std::nullopt;
    return c.override_cp;
}

bool DotGrid::is_cell_empty(int cell_x, int cell_y) const {
    return cell_bitfield(cell_x, cell_y) == 0;
}

Result DotGrid::set_cell_bitfield(int cell_x, int cell_y, uint8_t bits) {
    if (!in_bounds(cell_x, cell_y)) return cell_out_of_bounds(cell_x, cell_y);
    cells_[index(cell_x, cell_y)].bits = bits;
    return Result::ok();
}

Result DotGrid::set_cell_color(int cell_x, int cell_y, const Color& color) {
    if (!in_bounds(cell_x, cell_y)) return cell_out_of_bounds(cell_x, cell_y);
    Cell& c = cells_[index(cell_x, cell_y)];
    c.has_color = true;
    c.color = color;
    return Result::ok();
}

Result DotGrid::clear_cell_color(int cell_x, int cell_y) {
    if (!in_bounds(cell_x, cell_y)) return cell_out_of_bounds(cell_x, cell_y);
    Cell& c = cells_[index(cell_x, cell_y)];
    c.has_color = false;
    c.color = Color();
    return Result::ok();
}

Result DotGrid::set_override_character(int cell_x, int cell_y, uint32_t cp) {
    if (!in_bounds(cell_x, cell_y)) return cell_out_of_bounds(cell_x, cell_y);
    if (!utf8::is_printable_scalar(cp)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
            std::string("override character ") + buf + " is not a printable code point");
    }
    cells_[index(cell_x, cell_y)].override_cp = cp;
    return Result::ok();
}

Result DotGrid::clear_override_character(int cell_x, int cell_y) {
    if (!in_bounds(cell_x, cell_y)) return cell_out_of_bounds(cell_x, cell_y);
    cells_[index(cell_x, cell_y)].override_cp = 0;
    return Result::ok();
}

DotGrid DotGrid::resized(int new_width, int new_height) const {
    DotGrid out(new_width, new_height);
    const int copy_w = std::min(width_, new_width);
    const int copy_h = std::min(height_, new_height);
    for (int y = 0; y < copy_h; ++y) {
        auto src = cells_.begin() + static_cast<std::ptrdiff_t>(index(0, y));
        auto dst = out.cells_.begin() + static_cast<std::ptrdiff_t>(out.index(0, y));
        std::copy(src, src + copy_w, dst);
    }
    return out;
}

std::vector<std::string> DotGrid::to_lines() const {
    std::vector<std::string> lines;
    lines.reserve(static_cast<size_t>(height_));
    for (int y = 0; y < height_; ++y) {
        std::string line;
        line.reserve(static_cast<size_t>(width_) * 3);
        for (int x = 0; x < width_; ++x) {
            utf8::append(line, cells_[index(x, y)].character());
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string DotGrid::to_string() const {
    std::string out;
    for (const auto& line : to_lines()) {
        out += line;
        out += '\n';
    }
    return out;
}

}
