#include "scenes/scene.hpp"
#include "scenes/demo_scenes.hpp"
#include "core/utf8.hpp"

namespace braille {

namespace {
    const char* const SCENE_NAMES[] = {"wave", "bounce", "rain", "spinner"};
}

std::unique_ptr<Scene> create_scene(const std::string& name) {
    if (name == "wave") return std::make_unique<WaveScene>();
    if (name == "bounce") return std::make_unique<BounceScene>();
    if (name == "rain") return std::make_unique<RainScene>();
    if (name == "spinner") return std::make_unique<SpinnerScene>();
    return nullptr;
}

bool is_scene_name(const std::string& name) {
    for (const char* n : SCENE_NAMES) {
        if (name == n) return true;
    }
    return false;
}

std::string scene_list() {
    std::string out;
    for (const char* n : SCENE_NAMES) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

void draw_status_line(DotGrid& grid, const std::string& text, const std::optional<Color>& color) {
    const int row = grid.height() - 1;
    const std::vector<uint32_t> cps = utf8::to_codepoints(text);

    int x = 0;
    for (uint32_t cp : cps) {
        if (x >= grid.width()) break;
        if (!utf8::is_printable_scalar(cp)) cp = '?';
        if (grid.set_override_character(x, row, cp).failure()) break;
        if (color && grid.set_cell_color(x, row, *color).failure()) break;
        ++x;
    }
}

}
