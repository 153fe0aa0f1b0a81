#pragma once

#include "core/types.hpp"
#include "terminal/terminal.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace braille {

constexpr int CONFIG_VERSION = 1;

struct ConfigGrid {
    int cols = 0;
    int rows = 0;
};

struct ConfigRender {
    ColorMode color_mode = ColorMode::Truecolor;
    bool differential = true;
    bool show_status = true;
};

struct ConfigOutput {
    std::string replay_path;
    std::string dump_path;
};

struct ConfigDebug {
    bool profile_live = false;
    bool log_diagnostics = false;
};

struct Config {
    int version = CONFIG_VERSION;
    std::string scene = "wave";
    int fps = 60;
    ConfigGrid grid;
    ConfigRender render;
    ConfigOutput output;
    ConfigDebug debug;

    std::string config_path;

    std::string compute_hash() const;
    bool validate(std::string& error) const;

    static Config defaults();
    // Missing file, parse error and failed validation all give nullopt;
    // the reason goes to error when it is provided.
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    // Like load() on default_config_path(), except that a missing file gives
    // nullopt with error left empty.
    static std::optional<Config> load_default(std::string* error = nullptr);
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config apply_cli_overrides(Config config, const struct Args& args);

}
