#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>

namespace playout {

/**
 * @brief Error codes for the playout engine.
 *
 * Categories use upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: Decode / IO
 * - 0x2xxx: Resample
 * - 0x3xxx: Buffer / stereo layout
 * - 0x4xxx: Scheduling / queue
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Decode / IO (0x1000)
    IO_OPEN_FAILED = 0x1001,
    IO_SEEK_FAILED = 0x1002,
    IO_READ_FAILED = 0x1003,
    DECODE_FAILED = 0x1004,
    DECODE_UNSUPPORTED_FORMAT = 0x1005,
    DECODE_INVALID_CHUNK = 0x1006,

    // Resample (0x2000)
    RESAMPLE_INIT_FAILED = 0x2001,
    RESAMPLE_UNSUPPORTED_RATE = 0x2002,
    RESAMPLE_PROCESS_FAILED = 0x2003,

    // Buffer / stereo layout (0x3000)
    BUFFER_ODD_SAMPLE_COUNT = 0x3001,
    BUFFER_NOT_ALLOCATED = 0x3002,

    // Scheduling / queue (0x4000)
    QUEUE_ENTRY_NOT_FOUND = 0x4001,
    QUEUE_DUPLICATE_ENTRY = 0x4002,
    WORKER_CHAIN_NOT_FOUND = 0x4003,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_TIMING = 0x5002,
    VALIDATION_INVALID_SAMPLE_RATE = 0x5003,
    VALIDATION_FILE_NOT_FOUND = 0x5004,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Inner error details from lower layers.
 *
 * Used to propagate detailed error information from libsndfile and
 * libsamplerate up to the owner of a failed chain.
 */
struct InnerError {
    ErrorCode code = ErrorCode::OK;
    std::string cpp_code;                 // Error code as hex string (e.g., "0x1003")
    std::string cpp_message;              // Detailed C++ error message
    std::optional<int> sndfile_errno;     // sf_error() result
    std::optional<int> samplerate_error;  // src_process()/src_new() error

    InnerError() = default;

    // Convenience constructor for simple errors
    InnerError(ErrorCode code, const std::string& message);
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "IO_READ_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "decode_io"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x3001")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @param str Error code string (e.g., "BUFFER_ODD_SAMPLE_COUNT")
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isDecodeError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isResampleError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isBufferError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isQueueError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

}  // namespace playout

#endif  // ERROR_CODES_H
