#include <iostream>
#include <cassert>
#include <algorithm>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/encoding.hpp"
#include "../src/core/utf8.hpp"
#include "../src/core/dot_grid.hpp"
#include "../src/animation/frame_buffer.hpp"
#include "../src/render/cell_writer.hpp"
#include "../src/render/differential_renderer.hpp"
#include "../src/render/recording_sink.hpp"
#include "../src/terminal/terminal.hpp"

using namespace braille;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static bool grid_is_blank(const DotGrid& grid) {
    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            if (grid.cell_character(x, y) != BRAILLE_BLANK) return false;
        }
    }
    return true;
}

static bool same_content(const DotGrid& a, const DotGrid& b) {
    return a.size() == b.size() && a.cells() == b.cells();
}

static std::set<std::pair<int, int>> touched_set(const RecordingSink& sink) {
    return std::set<std::pair<int, int>>(sink.touched().begin(), sink.touched().end());
}

TEST(encoding_all_256_bitfields) {
    DotGrid grid(1, 1);
    for (int b = 0; b < 256; ++b) {
        const uint8_t bits = static_cast<uint8_t>(b);
        assert(encode_bitfield(bits) == 0x2800u + static_cast<uint32_t>(b));
        assert(grid.set_cell_bitfield(0, 0, bits).success());
        assert(grid.cell_character(0, 0) == 0x2800u + static_cast<uint32_t>(b));
        assert(grid.cell_bitfield(0, 0) == bits);

        auto decoded = decode_character(encode_bitfield(bits));
        assert(decoded.has_value());
        assert(*decoded == bits);
    }
    assert(!decode_character(0x27FF).has_value());
    assert(!decode_character(0x2900).has_value());
    assert(!decode_character('a').has_value());
}

TEST(encoding_dot_table_matches_unicode_numbering) {
    // (x, y) -> braille dot number
    const int dot_number[4][2] = {{1, 4}, {2, 5}, {3, 6}, {7, 8}};
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 2; ++x) {
            DotGrid grid(1, 1);
            assert(grid.set_dot(x, y).success());
            const uint8_t expected = static_cast<uint8_t>(1u << (dot_number[y][x] - 1));
            assert(dot_bit(x, y) == expected);
            assert(grid.cell_bitfield(0, 0) == expected);
            assert(grid.cell_character(0, 0) == BRAILLE_BASE + expected);
        }
    }
}

TEST(encoding_full_cell) {
    DotGrid grid(1, 1);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 2; ++x) {
            assert(grid.set_dot(x, y).success());
        }
    }
    assert(grid.cell_bitfield(0, 0) == 0xFF);
    assert(grid.cell_character(0, 0) == 0x28FF);
}

TEST(grid_80x24_single_dot) {
    DotGrid grid(80, 24);
    assert(grid.dot_width() == 160);
    assert(grid.dot_height() == 96);
    assert(grid.cell_count() == 80u * 24u);

    assert(grid.set_dot(0, 0).success());
    assert(grid.cell_character(0, 0) == 0x2801);
    for (int y = 0; y < 24; ++y) {
        for (int x = 0; x < 80; ++x) {
            if (x == 0 && y == 0) continue;
            assert(grid.cell_character(x, y) == BRAILLE_BLANK);
        }
    }
}

TEST(grid_dot_bounds) {
    DotGrid grid(80, 24);
    assert(grid.set_dot(159, 95).success());
    assert(grid.get_dot(159, 95));
    assert(grid.cell_bitfield(79, 23) == 0x80);

    Result r = grid.set_dot(160, 0);
    assert(r.error == ErrorCode::OUT_OF_BOUNDS);
    r = grid.set_dot(0, 96);
    assert(r.error == ErrorCode::OUT_OF_BOUNDS);
    r = grid.set_dot(-1, 0);
    assert(r.error == ErrorCode::OUT_OF_BOUNDS);
    assert(!r.message.empty());
    assert(grid.toggle_dot(0, -1).error == ErrorCode::OUT_OF_BOUNDS);

    // Failed writes leave the grid untouched, only the earlier dot is set.
    size_t lit = 0;
    for (const Cell& c : grid.cells()) {
        if (c.bits != 0) ++lit;
    }
    assert(lit == 1);

    assert(!grid.get_dot(1000, 1000));
    assert(!grid.get_dot(-5, 3));
}

TEST(grid_set_clear_toggle) {
    DotGrid grid(4, 2);
    assert(grid.set_dot(3, 5).success());
    assert(grid.get_dot(3, 5));
    assert(grid.set_dot(3, 5, false).success());
    assert(!grid.get_dot(3, 5));

    assert(grid.toggle_dot(2, 2).success());
    assert(grid.get_dot(2, 2));
    assert(grid.toggle_dot(2, 2).success());
    assert(!grid.get_dot(2, 2));
    assert(grid_is_blank(grid));
}

TEST(grid_invalid_dimensions_throw) {
    const int bad[][2] = {{0, 10}, {10, 0}, {-1, 5}, {10001, 1}, {1, 10001}};
    for (const auto& dims : bad) {
        bool threw = false;
        try {
            DotGrid grid(dims[0], dims[1]);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    DotGrid ok(10000, 1);
    assert(ok.width() == 10000);
}

TEST(grid_cell_colors_and_overrides) {
    DotGrid grid(3, 3);
    assert(!grid.cell_color(1, 1).has_value());
    assert(grid.set_cell_color(1, 1, Color(10, 20, 30)).success());
    auto color = grid.cell_color(1, 1);
    assert(color.has_value());
    assert(*color == Color(10, 20, 30));
    assert(grid.clear_cell_color(1, 1).success());
    assert(!grid.cell_color(1, 1).has_value());

    assert(grid.set_cell_bitfield(2, 0, 0x0F).success());
    assert(grid.set_override_character(2, 0, 'A').success());
    assert(grid.cell_character(2, 0) == 'A');
    assert(grid.cell_bitfield(2, 0) == 0x0F);
    assert(grid.cell_override(2, 0).value() == static_cast<uint32_t>('A'));
    assert(grid.clear_override_character(2, 0).success());
    assert(grid.cell_character(2, 0) == BRAILLE_BASE + 0x0F);

    assert(grid.set_cell_color(3, 0, Color::white()).error == ErrorCode::OUT_OF_BOUNDS);
    assert(grid.set_cell_bitfield(0, -1, 1).error == ErrorCode::OUT_OF_BOUNDS);
    assert(grid.set_override_character(9, 9, 'x').error == ErrorCode::OUT_OF_BOUNDS);
}

TEST(grid_override_rejects_control_characters) {
    DotGrid grid(2, 1);
    const uint32_t bad[] = {0x00, 0x0A, 0x1B, 0x7F, 0x9B, 0xD800, 0xDFFF, 0x110000};
    for (uint32_t cp : bad) {
        Result r = grid.set_override_character(0, 0, cp);
        assert(r.error == ErrorCode::INVALID_ARGUMENT);
        assert(!grid.cell_override(0, 0).has_value());
    }
    assert(grid.set_override_character(0, 0, 0x2588).success());
    assert(grid.set_override_character(1, 0, ' ').success());
}

TEST(grid_out_of_range_reads_are_empty) {
    DotGrid grid(2, 2);
    assert(grid.set_cell_bitfield(0, 0, 0xFF).success());
    assert(grid.cell_bitfield(5, 5) == 0);
    assert(grid.cell_character(-1, 0) == BRAILLE_BLANK);
    assert(!grid.cell_color(2, 0).has_value());
    assert(!grid.cell_override(0, 2).has_value());
    assert(grid.is_cell_empty(9, 9));

    const Cell& outside = grid.cell(5, 5);
    assert(outside.bits == 0);
    assert(!outside.has_color);
    assert(!outside.has_override());
    assert(grid.cell(-1, 0).character() == BRAILLE_BLANK);
    assert(grid.cell(0, 0).bits == 0xFF);
}

TEST(grid_clear_and_clear_region) {
    DotGrid grid(4, 4);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            assert(grid.set_cell_bitfield(x, y, 0xFF).success());
            assert(grid.set_cell_color(x, y, Color(1, 2, 3)).success());
        }
    }

    assert(grid.clear_region(1, 1, 2, 2).success());
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            const bool inside = x >= 1 && x <= 2 && y >= 1 && y <= 2;
            assert(grid.is_cell_empty(x, y) == inside);
            assert(grid.cell_color(x, y).has_value() == !inside);
        }
    }

    assert(grid.clear_region(0, 0, 0, 0).success());
    assert(grid.clear_region(3, 3, 2, 1).error == ErrorCode::OUT_OF_BOUNDS);
    assert(grid.clear_region(0, 0, -1, 1).error == ErrorCode::INVALID_ARGUMENT);
    assert(!grid.is_cell_empty(3, 3));

    grid.clear();
    assert(grid_is_blank(grid));
    assert(grid.cell_count() == 16);
    for (const Cell& c : grid.cells()) {
        assert(!c.has_color);
        assert(!c.has_override());
    }
}

TEST(grid_resized_migrates_overlap) {
    DotGrid grid(4, 3);
    assert(grid.set_cell_bitfield(0, 0, 0x01).success());
    assert(grid.set_cell_bitfield(3, 2, 0x02).success());
    assert(grid.set_cell_bitfield(1, 1, 0x04).success());

    DotGrid smaller = grid.resized(2, 2);
    assert(smaller.width() == 2);
    assert(smaller.height() == 2);
    assert(smaller.cell_bitfield(0, 0) == 0x01);
    assert(smaller.cell_bitfield(1, 1) == 0x04);

    DotGrid larger = grid.resized(6, 5);
    assert(larger.cell_count() == 30);
    assert(larger.cell_bitfield(3, 2) == 0x02);
    assert(larger.cell_bitfield(5, 4) == 0);
    assert(grid.width() == 4);
}

TEST(grid_to_lines) {
    DotGrid grid(2, 2);
    assert(grid.set_dot(0, 0).success());
    assert(grid.set_override_character(1, 1, 'Z').success());
    auto lines = grid.to_lines();
    assert(lines.size() == 2);
    assert(lines[0] == utf8::encode(0x2801) + utf8::encode(0x2800));
    assert(lines[1] == utf8::encode(0x2800) + "Z");
    assert(grid.to_string() == lines[0] + "\n" + lines[1] + "\n");
}

TEST(framebuffer_front_blank_until_swap) {
    FrameBuffer fb(80, 24);
    DotGrid& back = fb.back();
    for (int i = 0; i < 80; ++i) {
        assert(back.set_dot(i * 2, i % 96).success());
    }
    assert(back.set_cell_color(5, 5, Color(255, 0, 0)).success());
    DotGrid expected = back;

    assert(grid_is_blank(fb.front()));
    fb.swap();
    assert(same_content(fb.front(), expected));
    assert(grid_is_blank(fb.back()));
}

TEST(framebuffer_swap_exchanges_roles) {
    FrameBuffer fb(10, 5);
    assert(fb.back().set_cell_bitfield(0, 0, 0xAA).success());
    fb.swap();
    DotGrid first = fb.front();

    assert(fb.back().set_cell_bitfield(9, 4, 0x55).success());
    DotGrid second = fb.back();
    fb.swap();

    assert(same_content(fb.front(), second));
    assert(same_content(fb.back(), first));
    assert(fb.size() == (Size{10, 5}));
}

TEST(framebuffer_swap_does_not_copy) {
    FrameBuffer fb(200, 100);
    const Cell* back_storage = fb.back().cells().data();
    const Cell* front_storage = fb.front().cells().data();
    fb.swap();
    assert(fb.front().cells().data() == back_storage);
    assert(fb.back().cells().data() == front_storage);
}

TEST(framebuffer_present_draws_every_cell) {
    FrameBuffer fb(5, 3);
    assert(fb.back().set_cell_bitfield(2, 1, 0x3F).success());
    fb.swap();

    RecordingSink sink(5, 3);
    assert(fb.present(sink).success());
    assert(sink.chars_written() == 15);
    assert(sink.flush_count() == 1);
    assert(sink.screen_char(2, 1) == 0x283F);
    assert(sink.screen_char(0, 0) == BRAILLE_BLANK);
}

TEST(renderer_first_render_is_full) {
    DotGrid grid(12, 6);
    DifferentialRenderer renderer;
    assert(!renderer.has_baseline());
    assert(renderer.count_changed_cells(grid) == 72);

    RecordingSink sink(12, 6);
    assert(renderer.render(grid, sink).success());
    assert(renderer.last_stats().full_redraw);
    assert(renderer.last_stats().cells_written == 72);
    assert(touched_set(sink).size() == 72);
    assert(sink.flush_count() == 1);
    assert(renderer.has_baseline());
}

TEST(renderer_touches_exactly_changed_cells) {
    DotGrid grid(20, 10);
    DifferentialRenderer renderer;
    RecordingSink sink(20, 10);
    assert(renderer.render(grid, sink).success());

    std::set<std::pair<int, int>> expected = {{3, 2}, {4, 2}, {19, 9}, {0, 5}};
    assert(grid.set_dot(3 * 2, 2 * 4).success());
    assert(grid.set_cell_color(4, 2, Color(0, 255, 0)).success());
    assert(grid.set_override_character(19, 9, '#').success());
    assert(grid.set_cell_bitfield(0, 5, 0x81).success());

    assert(renderer.count_changed_cells(grid) == expected.size());

    sink.clear_ops();
    assert(renderer.render(grid, sink).success());
    assert(!renderer.last_stats().full_redraw);
    assert(renderer.last_stats().cells_written == expected.size());
    assert(sink.chars_written() == expected.size());
    assert(touched_set(sink) == expected);

    assert(sink.screen_char(3, 2) == 0x2801);
    assert(sink.screen_char(19, 9) == '#');
    assert(sink.screen_color(4, 2).value() == Color(0, 255, 0));

    sink.clear_ops();
    assert(renderer.render(grid, sink).success());
    assert(renderer.last_stats().cells_written == 0);
    assert(sink.chars_written() == 0);
    assert(sink.cursor_moves() == 0);
}

TEST(renderer_k_changes_scale_with_k) {
    DotGrid grid(80, 24);
    DifferentialRenderer renderer;
    RecordingSink sink;
    assert(renderer.render(grid, sink).success());

    for (int k : {1, 7, 40, 300}) {
        for (int i = 0; i < k; ++i) {
            const int x = (i * 13) % 80;
            const int y = (i * 7 + k) % 24;
            const uint8_t bits = static_cast<uint8_t>(grid.cell_bitfield(x, y) ^ 0x01);
            assert(grid.set_cell_bitfield(x, y, bits).success());
        }
        const size_t expected = renderer.count_changed_cells(grid);
        sink.clear_ops();
        assert(renderer.render(grid, sink).success());
        assert(sink.chars_written() == expected);
        assert(sink.cursor_moves() <= expected);
    }
}

TEST(renderer_color_only_change_is_detected) {
    DotGrid a(4, 4);
    DotGrid b(4, 4);
    assert(a.set_cell_color(1, 1, Color(9, 9, 9)).success());
    assert(b.set_cell_color(1, 1, Color(9, 9, 10)).success());
    assert(DifferentialRenderer::count_changed_cells(a, b) == 1);

    assert(b.set_cell_color(1, 1, Color(9, 9, 9)).success());
    assert(DifferentialRenderer::count_changed_cells(a, b) == 0);
}

TEST(renderer_consecutive_cells_reuse_cursor) {
    DotGrid grid(10, 3);
    DifferentialRenderer renderer;
    RecordingSink sink(10, 3);
    assert(renderer.render(grid, sink).success());

    for (int x = 2; x < 7; ++x) {
        assert(grid.set_cell_bitfield(x, 1, 0x09).success());
    }
    sink.clear_ops();
    assert(renderer.render(grid, sink).success());
    assert(sink.chars_written() == 5);
    assert(sink.cursor_moves() == 1);
    for (int x = 2; x < 7; ++x) {
        assert(sink.screen_char(x, 1) == 0x2809);
    }
}

static std::vector<std::pair<int, int>> cursor_moves_of(const RecordingSink& sink) {
    std::vector<std::pair<int, int>> moves;
    for (const SinkOp& op : sink.ops()) {
        if (op.kind == SinkOp::Kind::Move) moves.emplace_back(op.row, op.col);
    }
    return moves;
}

TEST(renderer_wide_override_moves_cursor_in_full_draw) {
    DotGrid grid(4, 2);
    assert(grid.set_override_character(0, 0, 0x4E00).success());
    assert(grid.set_override_character(2, 1, 0x0301).success());
    assert(grid.set_dot(2, 0).success());

    DifferentialRenderer renderer;
    RecordingSink sink(4, 2);
    assert(renderer.render(grid, sink).success());

    const std::vector<std::pair<int, int>> expected = {{0, 0}, {0, 1}, {1, 0}, {1, 3}};
    assert(cursor_moves_of(sink) == expected);
    assert(sink.screen_char(1, 0) == 0x2801);

    sink.clear_ops();
    FrameBuffer fb(4, 2);
    assert(fb.back().set_override_character(3, 0, 0x4E00).success());
    assert(fb.back().set_override_character(1, 0, 0xFF21).success());
    fb.swap();
    assert(fb.present(sink).success());
    const std::vector<std::pair<int, int>> present_moves = {{0, 0}, {0, 2}, {1, 0}};
    assert(cursor_moves_of(sink) == present_moves);
}

TEST(renderer_zero_width_override_ends_cursor_reuse) {
    assert(!advances_one_column(0x0301));
    assert(!advances_one_column(0x200B));
    assert(!advances_one_column(0x4E00));
    assert(advances_one_column('A'));
    assert(advances_one_column(0x28FF));

    DotGrid grid(4, 1);
    DifferentialRenderer renderer;
    RecordingSink sink(4, 1);
    assert(renderer.render(grid, sink).success());

    assert(grid.set_override_character(0, 0, 0x0301).success());
    assert(grid.set_cell_bitfield(1, 0, 0x01).success());
    sink.clear_ops();
    assert(renderer.render(grid, sink).success());

    const std::vector<std::pair<int, int>> expected = {{0, 0}, {0, 1}};
    assert(cursor_moves_of(sink) == expected);
    assert(sink.screen_char(1, 0) == 0x2801);
}

TEST(renderer_invalidate_forces_full_draw) {
    DotGrid grid(8, 4);
    assert(grid.set_dot(1, 1).success());
    DifferentialRenderer renderer;
    RecordingSink sink;
    assert(renderer.render(grid, sink).success());

    renderer.invalidate();
    assert(!renderer.has_baseline());
    sink.clear_ops();
    assert(renderer.render(grid, sink).success());
    assert(renderer.last_stats().full_redraw);
    assert(sink.chars_written() == 32);
}

TEST(renderer_dimension_change_redraws) {
    DifferentialRenderer renderer;
    std::ostringstream log;
    renderer.set_diagnostics(&log);
    RecordingSink sink;

    DotGrid small(10, 5);
    assert(renderer.render(small, sink).success());
    assert(renderer.dimension_mismatches() == 0);

    DotGrid big(12, 6);
    sink.clear_ops();
    Result r = renderer.render(big, sink);
    assert(r.success());
    assert(renderer.last_stats().full_redraw);
    assert(sink.chars_written() == 72);
    assert(renderer.dimension_mismatches() == 1);
    assert(renderer.baseline()->size() == big.size());
    assert(log.str().find("10x5 -> 12x6") != std::string::npos);

    sink.clear_ops();
    assert(renderer.render(big, sink).success());
    assert(sink.chars_written() == 0);
}

TEST(renderer_baseline_is_independent_copy) {
    DotGrid grid(6, 3);
    DifferentialRenderer renderer;
    RecordingSink sink;
    assert(renderer.render(grid, sink).success());

    assert(grid.set_cell_bitfield(2, 2, 0x44).success());
    assert(renderer.baseline()->cell_bitfield(2, 2) == 0);
    assert(renderer.count_changed_cells(grid) == 1);
}

TEST(renderer_output_failure_propagates) {
    DotGrid grid(6, 3);
    DifferentialRenderer renderer;
    RecordingSink sink;
    assert(renderer.render(grid, sink).success());

    for (int x = 0; x < 6; ++x) {
        assert(grid.set_cell_bitfield(x, 0, 0xFF).success());
    }
    sink.fail_after(3);
    Result r = renderer.render(grid, sink);
    assert(r.error == ErrorCode::OUTPUT_FAILURE);
    assert(!renderer.has_baseline());

    sink.stop_failing();
    sink.clear_ops();
    assert(renderer.render(grid, sink).success());
    assert(renderer.last_stats().full_redraw);
    assert(sink.chars_written() == 18);
}

TEST(utf8_encoding) {
    assert(utf8::encode('A') == "A");
    assert(utf8::encode(0x2800) == "\xE2\xA0\x80");
    assert(utf8::encode(0x28FF) == "\xE2\xA3\xBF");
    auto cps = utf8::to_codepoints("a\xE2\xA0\x81" "b");
    assert(cps.size() == 3);
    assert(cps[1] == 0x2801);
    assert(utf8::to_codepoints("\xE2\xA0").empty());
}

TEST(terminal_rgb_to_256) {
    assert(Terminal::rgb_to_256(0, 0, 0) == 0);
    assert(Terminal::rgb_to_256(255, 255, 255) == 15);
    assert(Terminal::rgb_to_256(255, 0, 0) == 9);
}

TEST(terminal_rgb_to_16) {
    assert(Terminal::rgb_to_16(0, 0, 0) == 0);
    assert(Terminal::rgb_to_16(255, 255, 255) == 15);
    assert(Terminal::rgb_to_16(0, 0, 255) == 12);
}

TEST(terminal_color_codes) {
    assert(Terminal::color_code(ColorMode::Truecolor, 1, 2, 3, true) == "\033[38;2;1;2;3m");
    assert(Terminal::color_code(ColorMode::Ansi256, 255, 0, 0, true) == "\033[38;5;9m");
    assert(Terminal::color_code(ColorMode::Ansi16, 128, 0, 0, true) == "\033[31m");
    assert(Terminal::color_code(ColorMode::Ansi16, 255, 0, 0, true) == "\033[91m");
    assert(Terminal::color_code(ColorMode::None, 9, 9, 9, true).empty());
}

TEST(terminal_color_mode_names) {
    ColorMode mode = ColorMode::None;
    assert(parse_color_mode("256", mode) && mode == ColorMode::Ansi256);
    assert(parse_color_mode("ansi16", mode) && mode == ColorMode::Ansi16);
    assert(parse_color_mode("truecolor", mode) && mode == ColorMode::Truecolor);
    assert(parse_color_mode("none", mode) && mode == ColorMode::None);
    assert(!parse_color_mode("blockart", mode));
    assert(mode == ColorMode::None);
    assert(std::string(color_mode_name(ColorMode::Ansi256)) == "ansi256");
}

TEST(types_result_and_error_names) {
    Result ok = Result::ok();
    assert(ok.success());
    Result bad = Result::fail(ErrorCode::OUTPUT_FAILURE, "x");
    assert(bad.failure());
    assert(std::string(error_code_name(ErrorCode::OUT_OF_BOUNDS)) == "out of bounds");
    assert(std::string(error_code_name(ErrorCode::OUTPUT_FAILURE)) == "output failure");
}

int main() {
    std::cout << "=== Braille Engine Test Suite ===\n\n";

    std::cout << "--- Encoding Tests ---\n";
    RUN_TEST(encoding_all_256_bitfields);
    RUN_TEST(encoding_dot_table_matches_unicode_numbering);
    RUN_TEST(encoding_full_cell);

    std::cout << "\n--- DotGrid Tests ---\n";
    RUN_TEST(grid_80x24_single_dot);
    RUN_TEST(grid_dot_bounds);
    RUN_TEST(grid_set_clear_toggle);
    RUN_TEST(grid_invalid_dimensions_throw);
    RUN_TEST(grid_cell_colors_and_overrides);
    RUN_TEST(grid_override_rejects_control_characters);
    RUN_TEST(grid_out_of_range_reads_are_empty);
    RUN_TEST(grid_clear_and_clear_region);
    RUN_TEST(grid_resized_migrates_overlap);
    RUN_TEST(grid_to_lines);

    std::cout << "\n--- FrameBuffer Tests ---\n";
    RUN_TEST(framebuffer_front_blank_until_swap);
    RUN_TEST(framebuffer_swap_exchanges_roles);
    RUN_TEST(framebuffer_swap_does_not_copy);
    RUN_TEST(framebuffer_present_draws_every_cell);

    std::cout << "\n--- Differential Renderer Tests ---\n";
    RUN_TEST(renderer_first_render_is_full);
    RUN_TEST(renderer_touches_exactly_changed_cells);
    RUN_TEST(renderer_k_changes_scale_with_k);
    RUN_TEST(renderer_color_only_change_is_detected);
    RUN_TEST(renderer_consecutive_cells_reuse_cursor);
    RUN_TEST(renderer_wide_override_moves_cursor_in_full_draw);
    RUN_TEST(renderer_zero_width_override_ends_cursor_reuse);
    RUN_TEST(renderer_invalidate_forces_full_draw);
    RUN_TEST(renderer_dimension_change_redraws);
    RUN_TEST(renderer_baseline_is_independent_copy);
    RUN_TEST(renderer_output_failure_propagates);

    std::cout << "\n--- UTF-8 Tests ---\n";
    RUN_TEST(utf8_encoding);

    std::cout << "\n--- Terminal Tests ---\n";
    RUN_TEST(terminal_rgb_to_256);
    RUN_TEST(terminal_rgb_to_16);
    RUN_TEST(terminal_color_codes);
    RUN_TEST(terminal_color_mode_names);

    std::cout << "\n--- Types Tests ---\n";
    RUN_TEST(types_result_and_error_names);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll tests passed.\n";
        return 0;
    }

    std::cout << "\nSome tests failed.\n";
    return 1;
}
