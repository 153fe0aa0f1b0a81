#include "core/replay.hpp"
#include <zstd.h>
#include <cstddef>
#include <cstring>
#include <algorithm>
#include <utility>

namespace braille {

constexpr size_t COMPRESS_BUFFER_SIZE = 256 * 1024;
constexpr int ZSTD_COMPRESSION_LEVEL = 3;

namespace {

ReplayCellData pack_cell(const Cell& cell) {
    ReplayCellData cd;
    cd.bits = cell.bits;
    if (cell.has_color) {
        cd.flags |= REPLAY_CELL_COLOR;
        cd.r = cell.color.r;
        cd.g = cell.color.g;
        cd.b = cell.color.b;
    }
    if (cell.has_override()) {
        cd.flags |= REPLAY_CELL_OVERRIDE;
        cd.override_cp = cell.override_cp;
    }
    return cd;
}

bool unpack_cell(const ReplayCellData& cd, int x, int y, DotGrid& grid) {
    if (grid.set_cell_bitfield(x, y, cd.bits).failure()) return false;

    Result r = (cd.flags & REPLAY_CELL_COLOR)
        ? grid.set_cell_color(x, y, Color(cd.r, cd.g, cd.b))
        : grid.clear_cell_color(x, y);
    if (r.failure()) return false;

    r = (cd.flags & REPLAY_CELL_OVERRIDE)
        ? grid.set_override_character(x, y, cd.override_cp)
        : grid.clear_override_character(x, y);
    return r.success();
}

}

ReplayWriter::ReplayWriter() {
    compress_buffer_.resize(COMPRESS_BUFFER_SIZE);
}

ReplayWriter::~ReplayWriter() {
    close();
}

bool ReplayWriter::open(const std::string& path, int cols, int rows, int fps, const std::string& config_hash) {
    close();

    if (!DotGrid::valid_dimensions(cols, rows)) return false;

    cols_ = cols;
    rows_ = rows;
    frame_count_ = 0;
    last_grid_.reset();

    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) return false;

    ReplayHeader hdr;
    hdr.version = REPLAY_VERSION;
    hdr.cols = static_cast<uint32_t>(cols);
    hdr.rows = static_cast<uint32_t>(rows);
    hdr.fps = static_cast<uint32_t>(fps);
    std::strncpy(hdr.config_hash, config_hash.c_str(), 8);
    hdr.config_hash[8] = '\0';

    if (std::fwrite(&hdr, sizeof(hdr), 1, file_) != 1) {
        std::fclose(file_);
        file_ = nullptr;
        return false;
    }

    return true;
}

bool ReplayWriter::write(const DotGrid& grid) {
    if (!last_grid_) {
        return write_frame(frame_count_, grid);
    }
    return write_frame_delta(frame_count_, grid, *last_grid_);
}

bool ReplayWriter::write_frame(uint32_t frame_index, const DotGrid& grid) {
    if (!file_ || grid.width() != cols_ || grid.height() != rows_) {
        return false;
    }

    const std::vector<Cell>& cells = grid.cells();
    std::vector<ReplayCellData> cell_data(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        cell_data[i] = pack_cell(cells[i]);
    }

    if (!write_block(frame_index, REPLAY_FRAME_FULL, static_cast<uint32_t>(cells.size()),
                     cell_data.data(), cell_data.size() * sizeof(ReplayCellData))) {
        return false;
    }

    last_grid_ = grid;
    return true;
}

bool ReplayWriter::write_frame_delta(uint32_t frame_index, const DotGrid& grid, const DotGrid& prev) {
    if (!file_ || grid.width() != cols_ || grid.height() != rows_ || prev.size() != grid.size()) {
        return false;
    }

    const std::vector<Cell>& cells = grid.cells();
    const std::vector<Cell>& prev_cells = prev.cells();

    std::vector<uint8_t> payload;
    payload.reserve(cells.size() / 4 * (sizeof(uint32_t) + sizeof(ReplayCellData)));
    uint32_t changed = 0;

    for (size_t i = 0; i < cells.size(); ++i) {
        if (cells[i] == prev_cells[i]) continue;

        const uint32_t idx = static_cast<uint32_t>(i);
        const ReplayCellData cd = pack_cell(cells[i]);
        const size_t at = payload.size();
        payload.resize(at + sizeof(idx) + sizeof(cd));
        std::memcpy(payload.data() + at, &idx, sizeof(idx));
        std::memcpy(payload.data() + at + sizeof(idx), &cd, sizeof(cd));
        ++changed;
    }

    if (!write_block(frame_index, REPLAY_FRAME_DELTA, changed, payload.data(), payload.size())) {
        return false;
    }

    last_grid_ = grid;
    return true;
}

bool ReplayWriter::write_block(uint32_t frame_index, uint32_t flags, uint32_t changed,
                               const void* data, size_t size) {
    size_t bound = ZSTD_compressBound(size);
    if (bound > compress_buffer_.size()) {
        compress_buffer_.resize(bound);
    }

    size_t compressed_size = ZSTD_compress(
        compress_buffer_.data(), compress_buffer_.size(),
        data, size,
        ZSTD_COMPRESSION_LEVEL
    );

    if (ZSTD_isError(compressed_size)) {
        return false;
    }

    ReplayFrameHeader frame_hdr;
    frame_hdr.frame_index = frame_index;
    frame_hdr.data_size = static_cast<uint32_t>(compressed_size);
    frame_hdr.changed_cells = changed;
    frame_hdr.flags = flags;

    if (std::fwrite(&frame_hdr, sizeof(frame_hdr), 1, file_) != 1) {
        return false;
    }

    if (std::fwrite(compress_buffer_.data(), 1, compressed_size, file_) != compressed_size) {
        return false;
    }

    frame_count_++;
    return update_frame_count();
}

bool ReplayWriter::update_frame_count() {
    if (std::fseek(file_, static_cast<long>(offsetof(ReplayHeader, frame_count)), SEEK_SET) != 0) {
        return false;
    }
    if (std::fwrite(&frame_count_, sizeof(frame_count_), 1, file_) != 1) {
        return false;
    }
    return std::fseek(file_, 0, SEEK_END) == 0;
}

void ReplayWriter::close() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    last_grid_.reset();
}

ReplayReader::ReplayReader() {
    decompress_buffer_.resize(COMPRESS_BUFFER_SIZE);
}

ReplayReader::~ReplayReader() {
    close();
}

bool ReplayReader::open(const std::string& path) {
    close();

    file_ = std::fopen(path.c_str(), "rb");
    if (!file_) return false;

    if (!read_header() || !build_frame_index()) {
        close();
        return false;
    }

    return true;
}

bool ReplayReader::read_header() {
    if (std::fread(&header_, sizeof(header_), 1, file_) != 1) {
        return false;
    }

    if (std::memcmp(header_.magic, "BRPLAY", 6) != 0) {
        return false;
    }
    if (header_.version != REPLAY_VERSION) {
        return false;
    }
    if (header_.cols > static_cast<uint32_t>(MAX_GRID_WIDTH) ||
        header_.rows > static_cast<uint32_t>(MAX_GRID_HEIGHT) ||
        !DotGrid::valid_dimensions(static_cast<int>(header_.cols), static_cast<int>(header_.rows))) {
        return false;
    }

    return true;
}

bool ReplayReader::build_frame_index() {
    frame_offsets_.clear();
    frame_flags_.clear();

    if (std::fseek(file_, 0, SEEK_END) != 0) return false;
    const long file_size = std::ftell(file_);
    if (file_size < 0) return false;

    long offset = static_cast<long>(sizeof(ReplayHeader));
    if (std::fseek(file_, offset, SEEK_SET) != 0) return false;

    ReplayFrameHeader frame_hdr;
    while (std::fread(&frame_hdr, sizeof(frame_hdr), 1, file_) == 1) {
        const long data_end = offset + static_cast<long>(sizeof(frame_hdr)) +
                              static_cast<long>(frame_hdr.data_size);
        if (data_end > file_size) {
            // Truncated tail, typically a recording cut short. Keep what is whole.
            break;
        }
        frame_offsets_.push_back(static_cast<uint64_t>(offset));
        frame_flags_.push_back(frame_hdr.flags);

        offset = data_end;
        if (std::fseek(file_, offset, SEEK_SET) != 0) {
            break;
        }
    }

    if (!frame_flags_.empty() && (frame_flags_.front() & REPLAY_FRAME_FULL) == 0) {
        return false;
    }
    return true;
}

bool ReplayReader::read_frame(uint32_t frame_index, DotGrid& grid) {
    if (!file_ || frame_index >= frame_offsets_.size()) {
        return false;
    }

    uint32_t start = 0;
    std::optional<DotGrid> working;
    if (last_grid_ && last_index_ >= 0 && static_cast<int64_t>(frame_index) > last_index_) {
        start = static_cast<uint32_t>(last_index_ + 1);
        working = std::move(last_grid_);
    } else {
        start = frame_index;
        while (start > 0 && (frame_flags_[start] & REPLAY_FRAME_FULL) == 0) {
            --start;
        }
        working.emplace(cols(), rows());
    }
    last_grid_.reset();
    last_index_ = -1;

    for (uint32_t i = start; i <= frame_index; ++i) {
        if (!decode_frame(i, *working)) {
            return false;
        }
    }

    grid = *working;
    last_grid_ = std::move(working);
    last_index_ = frame_index;
    return true;
}

bool ReplayReader::decode_frame(uint32_t frame_index, DotGrid& grid) {
    if (std::fseek(file_, static_cast<long>(frame_offsets_[frame_index]), SEEK_SET) != 0) {
        return false;
    }

    ReplayFrameHeader frame_hdr;
    if (std::fread(&frame_hdr, sizeof(frame_hdr), 1, file_) != 1) {
        return false;
    }

    std::vector<uint8_t> compressed(frame_hdr.data_size);
    if (std::fread(compressed.data(), 1, frame_hdr.data_size, file_) != frame_hdr.data_size) {
        return false;
    }

    const size_t total_cells = static_cast<size_t>(header_.cols) * header_.rows;
    const bool is_delta = (frame_hdr.flags & REPLAY_FRAME_DELTA) != 0;
    const size_t record_size = is_delta ? sizeof(uint32_t) + sizeof(ReplayCellData)
                                        : sizeof(ReplayCellData);
    if (!is_delta && frame_hdr.changed_cells != total_cells) {
        return false;
    }
    if (frame_hdr.changed_cells > total_cells) {
        return false;
    }

    const size_t src_size = static_cast<size_t>(frame_hdr.changed_cells) * record_size;
    if (src_size > decompress_buffer_.size()) {
        decompress_buffer_.resize(src_size);
    }

    if (src_size > 0 || !compressed.empty()) {
        size_t result = ZSTD_decompress(
            decompress_buffer_.data(), decompress_buffer_.size(),
            compressed.data(), compressed.size()
        );

        if (ZSTD_isError(result) || result != src_size) {
            return false;
        }
    }

    const uint8_t* ptr = decompress_buffer_.data();
    const int cols = grid.width();
    for (uint32_t i = 0; i < frame_hdr.changed_cells; ++i) {
        uint32_t idx = i;
        if (is_delta) {
            std::memcpy(&idx, ptr, sizeof(idx));
            ptr += sizeof(idx);
            if (idx >= total_cells) return false;
        }

        ReplayCellData cd;
        std::memcpy(&cd, ptr, sizeof(cd));
        ptr += sizeof(cd);

        if (!unpack_cell(cd, static_cast<int>(idx % cols), static_cast<int>(idx / cols), grid)) {
            return false;
        }
    }

    return true;
}

void ReplayReader::close() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    frame_offsets_.clear();
    frame_flags_.clear();
    last_grid_.reset();
    last_index_ = -1;
}

}
