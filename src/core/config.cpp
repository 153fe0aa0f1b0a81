#include "core/config.hpp"
#include "core/dot_grid.hpp"
#include "cli/args.hpp"
#include "animation/frame_timer.hpp"
#include "scenes/scene.hpp"
#include <toml++/toml.hpp>

#include <filesystem>
#include <sstream>
#include <iomanip>
#include <cstdlib>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace braille {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

uint32_t hash_combine(uint32_t a, uint32_t b) {
    a ^= b + 0x9e3779b9 + (a << 6) + (a >> 2);
    return a;
}

uint32_t hash_string(const std::string& s) {
    uint32_t h = 0;
    for (char c : s) {
        h = hash_combine(h, static_cast<uint32_t>(c));
    }
    return h;
}

uint32_t hash_int(int i) {
    return static_cast<uint32_t>(i);
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/braille-engine";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (version != CONFIG_VERSION) {
        error = "config_version must be " + std::to_string(CONFIG_VERSION);
        return false;
    }
    if (fps < FrameTimer::MIN_FPS || fps > FrameTimer::MAX_FPS) {
        error = "fps must be between 1 and 240";
        return false;
    }
    if (grid.cols < 0 || grid.cols > MAX_GRID_WIDTH) {
        error = "grid.cols must be between 0 and 10000";
        return false;
    }
    if (grid.rows < 0 || grid.rows > MAX_GRID_HEIGHT) {
        error = "grid.rows must be between 0 and 10000";
        return false;
    }
    if (!is_scene_name(scene)) {
        error = "scene must be one of: " + scene_list();
        return false;
    }
    return true;
}

std::string Config::compute_hash() const {
    uint32_t h = 0;

    h = hash_combine(h, hash_int(version));
    h = hash_combine(h, hash_string(scene));
    h = hash_combine(h, hash_int(fps));
    h = hash_combine(h, hash_int(grid.cols));
    h = hash_combine(h, hash_int(grid.rows));
    h = hash_combine(h, hash_int(static_cast<int>(render.color_mode)));
    h = hash_combine(h, hash_int(static_cast<int>(render.differential)));
    h = hash_combine(h, hash_int(static_cast<int>(render.show_status)));

    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << h;
    return ss.str();
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    auto fail = [error](const std::string& msg) -> std::optional<Config> {
        if (error) *error = msg;
        return std::nullopt;
    };

    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return fail("config file not found: " + path);
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) cfg.version = *v;
        if (auto v = tbl["scene"].value<std::string>()) cfg.scene = *v;
        if (auto v = tbl["fps"].value<int>()) cfg.fps = *v;

        if (auto grid = tbl["grid"]) {
            if (auto v = grid["cols"].value<int>()) cfg.grid.cols = *v;
            if (auto v = grid["rows"].value<int>()) cfg.grid.rows = *v;
        }

        if (auto render = tbl["render"]) {
            if (auto v = render["color_mode"].value<std::string>()) {
                if (!parse_color_mode(*v, cfg.render.color_mode)) {
                    return fail("render.color_mode must be 'none', 'ansi16', 'ansi256' or 'truecolor'");
                }
            }
            if (auto v = render["differential"].value<bool>()) cfg.render.differential = *v;
            if (auto v = render["show_status"].value<bool>()) cfg.render.show_status = *v;
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["replay_path"].value<std::string>()) cfg.output.replay_path = *v;
            if (auto v = output["dump_path"].value<std::string>()) cfg.output.dump_path = *v;
        }

        if (auto debug = tbl["debug"]) {
            if (auto v = debug["profile_live"].value<bool>()) cfg.debug.profile_live = *v;
            if (auto v = debug["log_diagnostics"].value<bool>()) cfg.debug.log_diagnostics = *v;
        }

        std::string reason;
        if (!cfg.validate(reason)) {
            return fail(reason);
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        std::ostringstream ss;
        ss << "failed to parse " << path << ": " << e.description()
           << " (line " << e.source().begin.line << ")";
        return fail(ss.str());
    }
}

std::optional<Config> Config::load_default(std::string* error) {
    const std::string path = default_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return std::nullopt;
    }
    return load(path, error);
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.scene.empty()) config.scene = args.scene;
    if (args.fps > 0) config.fps = args.fps;
    if (args.cols > 0) config.grid.cols = args.cols;
    if (args.rows > 0) config.grid.rows = args.rows;

    if (args.color_mode_set) config.render.color_mode = args.color_mode;
    if (args.no_diff) config.render.differential = false;
    if (args.no_status) config.render.show_status = false;

    if (!args.record_path.empty()) config.output.replay_path = args.record_path;
    if (!args.dump_path.empty()) config.output.dump_path = args.dump_path;

    if (args.profile_live) config.debug.profile_live = true;
    if (args.debug) config.debug.log_diagnostics = true;
    return config;
}

}
