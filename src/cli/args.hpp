#pragma once

#include "terminal/terminal.hpp"
#include <string>

namespace braille {

// Zero or negative numbers mean "not given on the command line".
struct Args {
    std::string scene;
    std::string config_path;
    std::string record_path;
    std::string play_path;
    std::string dump_path;
    ColorMode color_mode = ColorMode::Truecolor;
    bool color_mode_set = false;

    int fps = 0;
    int cols = -1;
    int rows = -1;
    int max_frames = 0;

    bool no_diff = false;
    bool no_status = false;
    bool profile_live = false;
    bool debug = false;

    bool show_help = false;
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
