#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace playout {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Decode / IO
    {ErrorCode::IO_OPEN_FAILED, "IO_OPEN_FAILED"},
    {ErrorCode::IO_SEEK_FAILED, "IO_SEEK_FAILED"},
    {ErrorCode::IO_READ_FAILED, "IO_READ_FAILED"},
    {ErrorCode::DECODE_FAILED, "DECODE_FAILED"},
    {ErrorCode::DECODE_UNSUPPORTED_FORMAT, "DECODE_UNSUPPORTED_FORMAT"},
    {ErrorCode::DECODE_INVALID_CHUNK, "DECODE_INVALID_CHUNK"},

    // Resample
    {ErrorCode::RESAMPLE_INIT_FAILED, "RESAMPLE_INIT_FAILED"},
    {ErrorCode::RESAMPLE_UNSUPPORTED_RATE, "RESAMPLE_UNSUPPORTED_RATE"},
    {ErrorCode::RESAMPLE_PROCESS_FAILED, "RESAMPLE_PROCESS_FAILED"},

    // Buffer
    {ErrorCode::BUFFER_ODD_SAMPLE_COUNT, "BUFFER_ODD_SAMPLE_COUNT"},
    {ErrorCode::BUFFER_NOT_ALLOCATED, "BUFFER_NOT_ALLOCATED"},

    // Scheduling / queue
    {ErrorCode::QUEUE_ENTRY_NOT_FOUND, "QUEUE_ENTRY_NOT_FOUND"},
    {ErrorCode::QUEUE_DUPLICATE_ENTRY, "QUEUE_DUPLICATE_ENTRY"},
    {ErrorCode::WORKER_CHAIN_NOT_FOUND, "WORKER_CHAIN_NOT_FOUND"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_INVALID_TIMING, "VALIDATION_INVALID_TIMING"},
    {ErrorCode::VALIDATION_INVALID_SAMPLE_RATE, "VALIDATION_INVALID_SAMPLE_RATE"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& entry : kErrorCodeStrings) {
        reverse.emplace(entry.second, entry.first);
    }
    return reverse;
}();

InnerError::InnerError(ErrorCode code, const std::string& message)
    : code(code), cpp_code(errorCodeToHex(code)), cpp_message(message) {}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isDecodeError(code)) {
        return "decode_io";
    }
    if (isResampleError(code)) {
        return "resample";
    }
    if (isBufferError(code)) {
        return "buffer";
    }
    if (isQueueError(code)) {
        return "queue";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace playout
