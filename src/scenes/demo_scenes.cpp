#include "scenes/demo_scenes.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>

namespace braille {

namespace {

constexpr double PI = 3.14159265358979323846;

Color hue_color(double hue, double value = 1.0) {
    hue = hue - std::floor(hue);
    const double h6 = hue * 6.0;
    const int sector = static_cast<int>(h6) % 6;
    const double f = h6 - std::floor(h6);
    const double q = 1.0 - f;

    double r = 0.0, g = 0.0, b = 0.0;
    switch (sector) {
        case 0: r = 1.0; g = f;   b = 0.0; break;
        case 1: r = q;   g = 1.0; b = 0.0; break;
        case 2: r = 0.0; g = 1.0; b = f;   break;
        case 3: r = 0.0; g = q;   b = 1.0; break;
        case 4: r = f;   g = 0.0; b = 1.0; break;
        default: r = 1.0; g = 0.0; b = q;  break;
    }

    auto to_byte = [value](double c) {
        return static_cast<uint8_t>(std::clamp(c * value * 255.0, 0.0, 255.0));
    };
    return Color(to_byte(r), to_byte(g), to_byte(b));
}

// Points outside the grid are clipped.
void plot(DotGrid& grid, int x, int y, const std::optional<Color>& color) {
    if (grid.set_dot(x, y).success() && color) {
        grid.set_cell_color(x / DOTS_PER_CELL_X, y / DOTS_PER_CELL_Y, *color);
    }
}

void draw_line(DotGrid& grid, int x0, int y0, int x1, int y1, const std::optional<Color>& color) {
    const int dx = std::abs(x1 - x0);
    const int dy = -std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;

    while (true) {
        plot(grid, x0, y0, color);
        if (x0 == x1 && y0 == y1) break;
        const int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

void fill_circle(DotGrid& grid, int cx, int cy, int radius, const std::optional<Color>& color) {
    const int r2 = radius * radius;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= r2) {
                plot(grid, cx + dx, cy + dy, color);
            }
        }
    }
}

// Position along [0, span] that reflects at both ends.
double triangle(double t, double span) {
    if (span <= 0.0) return 0.0;
    const double m = std::fmod(t, 2.0 * span);
    return m < span ? m : 2.0 * span - m;
}

}

void WaveScene::draw(uint64_t frame, DotGrid& grid) {
    const int w = grid.dot_width();
    const int h = grid.dot_height();
    const double t = static_cast<double>(frame) * 0.12;
    const double mid = (h - 1) / 2.0;
    const double amp = (h - 1) * 0.4;
    const double k = 4.0 * PI / std::max(1, w);

    int prev_y = -1;
    for (int x = 0; x < w; ++x) {
        const double envelope = 0.6 + 0.4 * std::sin(t * 0.3 + x * 0.02);
        const int y = static_cast<int>(std::lround(mid + amp * envelope * std::sin(k * x + t)));
        const Color color = hue_color(static_cast<double>(x) / w + static_cast<double>(frame) * 0.005);

        if (prev_y < 0) {
            plot(grid, x, y, color);
        } else {
            draw_line(grid, x - 1, prev_y, x, y, color);
        }
        prev_y = y;
    }
}

void BounceScene::draw(uint64_t frame, DotGrid& grid) {
    const int w = grid.dot_width();
    const int h = grid.dot_height();
    const int radius = std::max(1, std::min(w, h) / 8);

    const double span_x = std::max(0, w - 1 - 2 * radius);
    const double span_y = std::max(0, h - 1 - 2 * radius);
    const double tx = static_cast<double>(frame) * 1.3;
    const double ty = static_cast<double>(frame) * 0.9;

    const int cx = radius + static_cast<int>(std::lround(triangle(tx, span_x)));
    const int cy = radius + static_cast<int>(std::lround(triangle(ty, span_y)));

    int bounces = 0;
    if (span_x > 0.0) bounces += static_cast<int>(tx / span_x);
    if (span_y > 0.0) bounces += static_cast<int>(ty / span_y);

    fill_circle(grid, cx, cy, radius, hue_color(bounces * 0.17));

    draw_line(grid, 0, h - 1, w - 1, h - 1, Color(90, 90, 90));
}

RainScene::RainScene(uint32_t seed) : rng_(seed) {}

void RainScene::reset_drop(Drop& drop, bool anywhere) {
    std::uniform_real_distribution<float> start(0.0f, static_cast<float>(std::max(1, dot_height_)));
    std::uniform_real_distribution<float> speed(0.5f, 2.0f);
    std::uniform_int_distribution<int> length(2, 8);

    drop.y = anywhere ? start(rng_) : -start(rng_) * 0.5f;
    drop.speed = speed(rng_);
    drop.length = length(rng_);
}

void RainScene::draw(uint64_t, DotGrid& grid) {
    const int w = grid.dot_width();
    const int h = grid.dot_height();
    const size_t columns = static_cast<size_t>((w + 1) / 2);

    if (drops_.size() != columns || dot_height_ != h) {
        dot_height_ = h;
        drops_.assign(columns, Drop{});
        for (Drop& d : drops_) reset_drop(d, true);
    }

    for (size_t i = 0; i < drops_.size(); ++i) {
        Drop& d = drops_[i];
        const int x = static_cast<int>(i) * 2 + static_cast<int>(i % 3 == 0);
        const int head = static_cast<int>(d.y);
        const auto shade = static_cast<uint8_t>(std::clamp(100.0f + d.speed * 70.0f, 0.0f, 255.0f));
        const Color color(static_cast<uint8_t>(shade / 3), static_cast<uint8_t>(shade / 2 + 40), shade);

        for (int y = head - d.length + 1; y <= head; ++y) {
            plot(grid, x, y, color);
        }

        d.y += d.speed;
        if (static_cast<int>(d.y) - d.length >= h) {
            reset_drop(d, false);
        }
    }
}

void SpinnerScene::draw(uint64_t frame, DotGrid& grid) {
    constexpr int SPOKES = 12;
    constexpr int TRAIL = 6;

    const int w = grid.dot_width();
    const int h = grid.dot_height();
    const int cx = w / 2;
    const int cy = h / 2;
    const int radius = std::min(w, h) / 2 - 1;

    if (radius < 3) {
        plot(grid, cx, cy, hue_color(static_cast<double>(frame % SPOKES) / SPOKES));
        return;
    }

    const int head = static_cast<int>((frame / 2) % SPOKES);
    const double inner = radius * 0.45;

    for (int step = 0; step < TRAIL; ++step) {
        const int spoke = (head - step + SPOKES) % SPOKES;
        const double angle = spoke * 2.0 * PI / SPOKES - PI / 2.0;
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        const double value = 1.0 - static_cast<double>(step) / TRAIL;
        const Color color = hue_color(0.55, std::max(0.25, value));

        draw_line(grid,
                  cx + static_cast<int>(std::lround(c * inner)), cy + static_cast<int>(std::lround(s * inner)),
                  cx + static_cast<int>(std::lround(c * radius)), cy + static_cast<int>(std::lround(s * radius)),
                  color);
    }
}

}
