// ChunkMacError.hpp
#ifndef CHUNKMAC_ERROR_HPP
#define CHUNKMAC_ERROR_HPP

#include <string>
#include <system_error>
#include <type_traits>

enum class ChunkMacError {
    Success = 0,
    StreamTruncated,
    IntegrityMismatch,
    DecryptionError,
    FileCreationError,
    FileReadError,
    FileWriteError,
    ParameterError,
};

inline std::string toString(ChunkMacError err) {
    switch (err) {
        case ChunkMacError::Success: return "Success";
        case ChunkMacError::StreamTruncated: return "Input stream ended before the chunk was complete";
        case ChunkMacError::IntegrityMismatch: return "File MAC does not match the expected tag";
        case ChunkMacError::DecryptionError: return "Decryption failed";
        case ChunkMacError::FileCreationError: return "Error creating file";
        case ChunkMacError::FileReadError: return "Error reading file";
        case ChunkMacError::FileWriteError: return "Error writing to file";
        case ChunkMacError::ParameterError: return "Invalid parameter";
        default: return "Unknown error";
    }
}

class ChunkMacErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "chunkmac"; }
    std::string message(int ev) const override { return toString(static_cast<ChunkMacError>(ev)); }
};

inline const std::error_category& chunkmac_category() {
    static const ChunkMacErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ChunkMacError err) {
    return {static_cast<int>(err), chunkmac_category()};
}

namespace std {
template <>
struct is_error_code_enum<ChunkMacError> : true_type {};
}

#endif // CHUNKMAC_ERROR_HPP
