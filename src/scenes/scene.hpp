#pragma once

#include "core/dot_grid.hpp"
#include <memory>
#include <optional>
#include <string>
#include <cstdint>

namespace braille {

// A scene draws one frame into a cleared grid. The grid may change size
// between calls when the terminal is resized.
class Scene {
public:
    virtual ~Scene() = default;

    virtual const char* name() const = 0;
    virtual void draw(uint64_t frame, DotGrid& grid) = 0;
};

std::unique_ptr<Scene> create_scene(const std::string& name);
bool is_scene_name(const std::string& name);
std::string scene_list();

// Writes text over the bottom row using override characters. Text longer
// than the grid is cut off; non-printable characters become '?'.
void draw_status_line(DotGrid& grid, const std::string& text,
                      const std::optional<Color>& color = std::nullopt);

}
