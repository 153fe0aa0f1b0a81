#pragma once

#include "core/dot_grid.hpp"
#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace braille {

#pragma pack(push, 1)
struct ReplayHeader {
    char magic[8] = {'B', 'R', 'P', 'L', 'A', 'Y', '\0', '\0'};
    uint32_t version = 1;
    uint32_t cols = 0;
    uint32_t rows = 0;
    uint32_t frame_count = 0;
    uint32_t fps = 30;
    char config_hash[9] = {0};
    uint32_t reserved[4] = {0};
};

struct ReplayFrameHeader {
    uint32_t frame_index = 0;
    uint32_t data_size = 0;
    uint32_t changed_cells = 0;
    uint32_t flags = 0;
};

struct ReplayCellData {
    uint8_t bits = 0;
    uint8_t flags = 0;
    uint8_t r = 0, g = 0, b = 0;
    uint32_t override_cp = 0;
};
#pragma pack(pop)

constexpr uint32_t REPLAY_VERSION = 1;
constexpr uint32_t REPLAY_FRAME_FULL = 1u << 0;
constexpr uint32_t REPLAY_FRAME_DELTA = 1u << 1;

constexpr uint8_t REPLAY_CELL_COLOR = 1u << 0;
constexpr uint8_t REPLAY_CELL_OVERRIDE = 1u << 1;

class ReplayWriter {
public:
    ReplayWriter();
    ~ReplayWriter();

    ReplayWriter(const ReplayWriter&) = delete;
    ReplayWriter& operator=(const ReplayWriter&) = delete;

    bool open(const std::string& path, int cols, int rows, int fps, const std::string& config_hash);

    // Full frame for the first write, deltas against the previous write after.
    bool write(const DotGrid& grid);
    bool write_frame(uint32_t frame_index, const DotGrid& grid);
    bool write_frame_delta(uint32_t frame_index, const DotGrid& grid, const DotGrid& prev);
    void close();

    uint32_t frame_count() const { return frame_count_; }
    bool is_open() const { return file_ != nullptr; }

private:
    FILE* file_ = nullptr;
    uint32_t frame_count_ = 0;
    int cols_ = 0;
    int rows_ = 0;
    std::vector<uint8_t> compress_buffer_;
    std::optional<DotGrid> last_grid_;

    bool write_block(uint32_t frame_index, uint32_t flags, uint32_t changed,
                     const void* data, size_t size);
    bool update_frame_count();
};

class ReplayReader {
public:
    ReplayReader();
    ~ReplayReader();

    ReplayReader(const ReplayReader&) = delete;
    ReplayReader& operator=(const ReplayReader&) = delete;

    bool open(const std::string& path);
    bool read_frame(uint32_t frame_index, DotGrid& grid);
    void close();

    const ReplayHeader& header() const { return header_; }
    uint32_t frame_count() const { return static_cast<uint32_t>(frame_offsets_.size()); }
    int cols() const { return static_cast<int>(header_.cols); }
    int rows() const { return static_cast<int>(header_.rows); }
    int fps() const { return static_cast<int>(header_.fps); }
    // Empty when the recording was written without a config hash.
    std::string config_hash() const {
        const char* end = std::find(header_.config_hash, header_.config_hash + 8, '\0');
        return std::string(header_.config_hash, end);
    }
    bool is_open() const { return file_ != nullptr; }

private:
    FILE* file_ = nullptr;
    ReplayHeader header_;
    std::vector<uint8_t> decompress_buffer_;
    std::optional<DotGrid> last_grid_;
    int64_t last_index_ = -1;
    std::vector<uint64_t> frame_offsets_;
    std::vector<uint32_t> frame_flags_;

    bool read_header();
    bool build_frame_index();
    bool decode_frame(uint32_t frame_index, DotGrid& grid);
};

}
