#include "animation/animation_loop.hpp"
#include "animation/prerendered.hpp"
#include "cli/args.hpp"
#include "core/config.hpp"
#include "core/replay.hpp"
#include "scenes/scene.hpp"
#include "terminal/input.hpp"
#include "terminal/terminal.hpp"

#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
    g_interrupted = 1;
}

int next_key() {
    if (g_interrupted) return 'q';
    return braille::input::read_key();
}

bool write_dump(const std::string& path, const braille::DotGrid& grid) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << grid.to_string();
    return static_cast<bool>(out);
}

braille::Result setup_terminal(braille::Terminal& terminal) {
    braille::Result r = terminal.enter_alt_screen();
    if (r.success()) r = terminal.hide_cursor();
    if (r.success()) r = terminal.clear_screen();
    return r;
}

void teardown_terminal(braille::Terminal& terminal) {
    braille::input::restore_stdin();
    braille::Result r = terminal.restore();
    if (r.failure()) {
        std::cerr << "Warning: Failed to restore terminal: " << r.message << "\n";
    }
}

int play_recording(const std::string& path, braille::Terminal& terminal, const braille::Config& config) {
    auto anim = braille::PrerenderedAnimation::load(path);
    if (!anim) {
        std::cerr << "Error: Failed to read recording: " << path << "\n";
        return 1;
    }
    if (anim->empty()) {
        std::cerr << "Warning: Recording has no frames: " << path << "\n";
        return 0;
    }

    braille::input::setup_nonblocking_stdin();
    braille::Result r = setup_terminal(terminal);

    auto start = std::chrono::steady_clock::now();
    if (r.success()) {
        r = anim->play(terminal, []() {
            const int key = next_key();
            return key == 'q' || key == braille::input::KEY_ESCAPE;
        });
    }
    auto wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    teardown_terminal(terminal);

    if (r.failure()) {
        std::cerr << "Error: " << braille::error_code_name(r.error) << ": " << r.message << "\n";
        return 1;
    }

    if (!config.output.dump_path.empty()) {
        const braille::DotGrid* last = anim->frame(anim->frame_count() - 1);
        if (!write_dump(config.output.dump_path, *last)) {
            std::cerr << "Warning: Failed to write dump: " << config.output.dump_path << "\n";
        }
    }

    std::cerr << std::fixed << std::setprecision(2)
              << "[PERF] playback frames=" << anim->frame_count()
              << ", fps=" << anim->frame_rate()
              << ", wall_s=" << wall
              << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    braille::Args args = braille::parse_args(argc, argv);

    if (args.show_help) {
        braille::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        braille::print_help(argv[0]);
        return 1;
    }

    braille::Config config = braille::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = braille::Config::load(args.config_path, &load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << load_error << "\n";
            return 1;
        }
        config = *loaded;
    } else {
        std::string load_error;
        if (auto loaded = braille::Config::load_default(&load_error)) {
            config = *loaded;
        } else if (!load_error.empty()) {
            std::cerr << "Warning: Ignoring config file: " << load_error << "\n";
        }
    }
    config = braille::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    braille::Terminal terminal(config.render.color_mode);

    if (!args.play_path.empty()) {
        return play_recording(args.play_path, terminal, config);
    }

    auto scene = braille::create_scene(config.scene);
    if (!scene) {
        std::cerr << "Error: Unknown scene: " << config.scene << "\n";
        return 1;
    }

    const bool auto_cols = config.grid.cols == 0;
    const bool auto_rows = config.grid.rows == 0;
    auto grid_size = [&]() -> braille::Size {
        braille::Size term = terminal.get_size();
        return {auto_cols ? term.width : config.grid.cols,
                auto_rows ? term.height : config.grid.rows};
    };
    const braille::Size initial = grid_size();

    braille::AnimationLoopConfig loop_cfg;
    loop_cfg.cols = initial.width;
    loop_cfg.rows = initial.height;
    loop_cfg.fps = config.fps;
    loop_cfg.differential = config.render.differential;
    loop_cfg.max_frames = static_cast<uint64_t>(args.max_frames);

    braille::AnimationLoop loop(terminal, loop_cfg);
    loop.set_key_source(next_key);
    if (auto_cols || auto_rows) {
        loop.set_size_source(grid_size);
    }
    if (config.debug.log_diagnostics) {
        loop.set_diagnostics(&std::cerr);
    }

    braille::ReplayWriter replay_writer;
    bool replay_enabled = false;
    if (!config.output.replay_path.empty()) {
        if (replay_writer.open(config.output.replay_path, initial.width, initial.height,
                               config.fps, config.compute_hash())) {
            replay_enabled = true;
        } else {
            std::cerr << "Warning: Failed to open replay output: " << config.output.replay_path << "\n";
        }
    }

    std::optional<braille::DotGrid> last_frame;
    const bool keep_last = !config.output.dump_path.empty();

    loop.set_frame_observer([&](uint64_t frame_index, const braille::DotGrid& front) {
        if (replay_enabled && !replay_writer.write(front)) {
            std::cerr << "Warning: Replay write failed at frame " << frame_index << "\n";
            replay_writer.close();
            replay_enabled = false;
        }
        if (keep_last) {
            last_frame = front;
        }
        if (config.debug.profile_live) {
            const double ms = std::chrono::duration<double, std::milli>(
                loop.timer().last_frame_duration()).count();
            std::cerr << "{\"frame\":" << frame_index
                      << ",\"ms\":" << ms
                      << ",\"fps\":" << loop.timer().actual_fps()
                      << ",\"cells\":" << loop.renderer().last_stats().cells_written
                      << "}\n";
        }
    });

    const bool show_status = config.render.show_status;
    const std::string scene_name = scene->name();
    auto on_frame = [&](uint64_t frame_index, braille::DotGrid& back) {
        scene->draw(frame_index, back);
        if (show_status) {
            std::ostringstream status;
            status << ' ' << scene_name
                   << " | " << back.width() << 'x' << back.height()
                   << " | " << std::fixed << std::setprecision(1) << loop.timer().actual_fps()
                   << '/' << loop.config().fps << " fps"
                   << " | frame " << frame_index
                   << " | q quit, space pause";
            braille::draw_status_line(back, status.str(), braille::Color(200, 200, 200));
        }
        return true;
    };

    braille::input::setup_nonblocking_stdin();
    braille::Result result = setup_terminal(terminal);

    auto session_start = std::chrono::steady_clock::now();
    if (result.success()) {
        result = loop.run(on_frame);
    }
    double wall_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - session_start).count();

    teardown_terminal(terminal);
    replay_writer.close();

    if (result.failure()) {
        std::cerr << "Error: " << braille::error_code_name(result.error) << ": " << result.message << "\n";
    }

    if (keep_last && last_frame && !write_dump(config.output.dump_path, *last_frame)) {
        std::cerr << "Warning: Failed to write dump: " << config.output.dump_path << "\n";
    }

    const braille::LoopStats& stats = loop.stats();
    if (stats.frames > 0 && wall_seconds > 0.0) {
        std::cerr << std::fixed << std::setprecision(2)
                  << "[PERF] frames=" << stats.frames
                  << ", wall_s=" << wall_seconds
                  << ", effective_fps=" << static_cast<double>(stats.frames) / wall_seconds
                  << ", timer_fps=" << stats.actual_fps
                  << ", target_fps=" << loop.config().fps
                  << "\n";
        std::cerr << "[PERF_RENDER] cells_written=" << stats.cells_written
                  << ", cells_per_frame=" << static_cast<double>(stats.cells_written) / stats.frames
                  << ", full_redraws=" << stats.full_redraws
                  << ", resizes=" << stats.resizes
                  << ", overruns=" << stats.overruns
                  << ", bytes=" << terminal.bytes_written()
                  << "\n";
    } else {
        std::cerr << "[PERF] no frames rendered.\n";
    }

    return result.success() ? 0 : 1;
}
