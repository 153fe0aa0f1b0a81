#pragma once

#include <cstdint>
#include <string>

namespace braille {

enum class ErrorCode {
    SUCCESS = 0,
    OUT_OF_BOUNDS,
    INVALID_ARGUMENT,
    INVALID_DIMENSIONS,
    OUTPUT_FAILURE,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    PROCESSING_ERROR
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    static Color white() { return Color(255, 255, 255); }
};

}
