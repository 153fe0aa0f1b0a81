#pragma once

#include "core/types.hpp"
#include "core/encoding.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace braille {

constexpr int MAX_GRID_WIDTH = 10000;
constexpr int MAX_GRID_HEIGHT = 10000;

struct Cell {
    uint8_t bits = 0;
    bool has_color = false;
    Color color;
    uint32_t override_cp = 0;

    bool has_override() const { return override_cp != 0; }

    uint32_t character() const {
        return override_cp != 0 ? override_cp : encode_bitfield(bits);
    }

    bool operator==(const Cell& other) const {
        if (bits != other.bits || has_color != other.has_color || override_cp != other.override_cp) {
            return false;
        }
        return !has_color || color == other.color;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

// Width and height are in cells. Dot space is width*2 by height*4.
// Storage is row-major and always holds exactly width*height cells.
class DotGrid {
public:
    DotGrid(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }
    int dot_width() const { return width_ * DOTS_PER_CELL_X; }
    int dot_height() const { return height_ * DOTS_PER_CELL_Y; }
    Size size() const { return {width_, height_}; }
    size_t cell_count() const { return cells_.size(); }

    bool in_bounds(int cell_x, int cell_y) const {
        return cell_x >= 0 && cell_x < width_ && cell_y >= 0 && cell_y < height_;
    }
    bool dot_in_bounds(int dot_x, int dot_y) const {
        return dot_x >= 0 && dot_x < dot_width() && dot_y >= 0 && dot_y < dot_height();
    }

    Result set_dot(int dot_x, int dot_y, bool value = true);
    Result toggle_dot(int dot_x, int dot_y);
    bool get_dot(int dot_x, int dot_y) const;

    void clear();
    Result clear_region(int cell_x, int cell_y, int w, int h);

    uint8_t cell_bitfield(int cell_x, int cell_y) const;
    uint32_t cell_character(int cell_x, int cell_y) const;
    std::optional<Color> cell_color(int cell_x, int cell_y) const;
    std::optional<uint32_t> cell_override(int cell_x, int cell_y) const;
    bool is_cell_empty(int cell_x, int cell_y) const;

    Result set_cell_bitfield(int cell_x, int cell_y, uint8_t bits);
    Result set_cell_color(int cell_x, int cell_y, const Color& color);
    Result clear_cell_color(int cell_x, int cell_y);
    Result set_override_character(int cell_x, int cell_y, uint32_t cp);
    Result clear_override_character(int cell_x, int cell_y);

    // Out-of-range positions read as an empty cell.
    const Cell& cell(int cell_x, int cell_y) const;
    const std::vector<Cell>& cells() const { return cells_; }

    DotGrid resized(int new_width, int new_height) const;

    std::vector<std::string> to_lines() const;
    std::string to_string() const;

    static bool valid_dimensions(int width, int height) {
        return width > 0 && height > 0 && width <= MAX_GRID_WIDTH && height <= MAX_GRID_HEIGHT;
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> cells_;

    size_t index(int cell_x, int cell_y) const {
        return static_cast<size_t>(cell_y) * static_cast<size_t>(width_) + static_cast<size_t>(cell_x);
    }

    Result cell_out_of_bounds(int cell_x, int cell_y) const;
};

}
