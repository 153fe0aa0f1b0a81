#include "args.hpp"
#include "animation/frame_timer.hpp"
#include "core/dot_grid.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace braille {

static bool parse_int(const char* s, int min_val, int max_val, int& out) {
    char* end = nullptr;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') return false;
    if (v < min_val || v > max_val) return false;
    out = static_cast<int>(v);
    return true;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto need_value = [&](int& i, const char* flag) -> const char* {
        if (i + 1 >= argc) {
            args.error = std::string(flag) + " requires a value";
            return nullptr;
        }
        return argv[++i];
    };

    auto take_path = [&](int& i, const char* flag, std::string& out) {
        const char* v = need_value(i, flag);
        if (!v) return;
        out = v;
        if (!validate_path(out)) {
            args.error = std::string("invalid path for ") + flag;
            out.clear();
        }
    };

    auto take_int = [&](int& i, const char* flag, int min_val, int max_val, int& out) {
        const char* v = need_value(i, flag);
        if (!v) return;
        if (!parse_int(v, min_val, max_val, out)) {
            args.error = std::string(flag) + " expects an integer in " +
                         std::to_string(min_val) + ".." + std::to_string(max_val) +
                         ", got '" + v + "'";
        }
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-f") == 0 || strcmp(arg, "--fps") == 0) {
            take_int(i, "--fps", FrameTimer::MIN_FPS, FrameTimer::MAX_FPS, args.fps);
        }
        else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--cols") == 0) {
            take_int(i, "--cols", 1, MAX_GRID_WIDTH, args.cols);
        }
        else if (strcmp(arg, "-r") == 0 || strcmp(arg, "--rows") == 0) {
            take_int(i, "--rows", 1, MAX_GRID_HEIGHT, args.rows);
        }
        else if (strcmp(arg, "-n") == 0 || strcmp(arg, "--frames") == 0) {
            take_int(i, "--frames", 1, 100000000, args.max_frames);
        }
        else if (strcmp(arg, "--color") == 0) {
            const char* v = need_value(i, "--color");
            if (!v) break;
            if (parse_color_mode(v, args.color_mode)) {
                args.color_mode_set = true;
            } else {
                args.error = std::string("unknown color mode '") + v + "'";
            }
        }
        else if (strcmp(arg, "--config") == 0) {
            take_path(i, "--config", args.config_path);
        }
        else if (strcmp(arg, "--record") == 0) {
            take_path(i, "--record", args.record_path);
        }
        else if (strcmp(arg, "--play") == 0) {
            take_path(i, "--play", args.play_path);
        }
        else if (strcmp(arg, "--dump") == 0) {
            take_path(i, "--dump", args.dump_path);
        }
        else if (strcmp(arg, "--no-diff") == 0) {
            args.no_diff = true;
        }
        else if (strcmp(arg, "--no-status") == 0) {
            args.no_status = true;
        }
        else if (strcmp(arg, "--profile-live") == 0) {
            args.profile_live = true;
        }
        else if (strcmp(arg, "--debug") == 0) {
            args.debug = true;
        }
        else if (arg[0] != '-') {
            args.scene = arg;
        }
        else {
            args.error = std::string("unknown option '") + arg + "'";
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] [SCENE]\n\n", prog);
    printf("SCENE:\n");
    printf("  wave, bounce, rain, spinner (default: wave)\n\n");
    printf("OPTIONS:\n");
    printf("  -f, --fps <N>           Target FPS (default: 60, range: 1-240)\n");
    printf("  -c, --cols <N>          Grid columns (default: terminal width)\n");
    printf("  -r, --rows <N>          Grid rows (default: terminal height)\n");
    printf("  -n, --frames <N>        Stop after N frames\n");
    printf("      --color <MODE>      Color mode: none, 16, 256, truecolor\n");
    printf("      --no-diff           Redraw every cell on every frame\n");
    printf("      --no-status         Hide the status line\n");
    printf("      --record <FILE>     Record frames to a .brplay file\n");
    printf("      --play <FILE>       Play back a .brplay recording\n");
    printf("      --dump <FILE>       Write the last frame as plain text\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("      --profile-live      Output per-frame profiling as JSONL to stderr\n");
    printf("      --debug             Log renderer diagnostics to stderr\n");
    printf("  -h, --help              Show this help\n");
    printf("\nINTERACTIVE CONTROLS:\n");
    printf("  q/Esc                   Quit\n");
    printf("  Space                   Pause/resume\n");
    printf("  r                       Redraw every cell\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/braille-engine/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/braille-engine/config.toml\n");
    printf("    Windows: %%APPDATA%%\\braille-engine\\config.toml\n");
}

}
