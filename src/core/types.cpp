#include "core/types.hpp"

namespace braille {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::OUT_OF_BOUNDS: return "out of bounds";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::INVALID_DIMENSIONS: return "invalid dimensions";
        case ErrorCode::OUTPUT_FAILURE: return "output failure";
        case ErrorCode::FILE_NOT_FOUND: return "file not found";
        case ErrorCode::INVALID_FORMAT: return "invalid format";
        case ErrorCode::PROCESSING_ERROR: return "processing error";
    }
    return "unknown";
}

}
