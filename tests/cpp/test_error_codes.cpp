/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error codes and category helpers.
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace playout;

// ============================================================
// ErrorCode to String Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::IO_READ_FAILED), "IO_READ_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::RESAMPLE_INIT_FAILED), "RESAMPLE_INIT_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::BUFFER_ODD_SAMPLE_COUNT),
                 "BUFFER_ODD_SAMPLE_COUNT");
    EXPECT_STREQ(errorCodeToString(ErrorCode::QUEUE_DUPLICATE_ENTRY), "QUEUE_DUPLICATE_ENTRY");
    EXPECT_STREQ(errorCodeToString(ErrorCode::VALIDATION_INVALID_TIMING),
                 "VALIDATION_INVALID_TIMING");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
}

// ============================================================
// Error Category Tests
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::IO_OPEN_FAILED), "decode_io");
    EXPECT_STREQ(getErrorCategory(ErrorCode::RESAMPLE_UNSUPPORTED_RATE), "resample");
    EXPECT_STREQ(getErrorCategory(ErrorCode::BUFFER_NOT_ALLOCATED), "buffer");
    EXPECT_STREQ(getErrorCategory(ErrorCode::WORKER_CHAIN_NOT_FOUND), "queue");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_CONFIG), "validation");
}

TEST(ErrorCodes, UnknownCategoryReturnsInternal) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(getErrorCategory(unknownCode), "internal");
}

// ============================================================
// Hex / String Conversion Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToHex) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
    EXPECT_EQ(errorCodeToHex(ErrorCode::IO_READ_FAILED), "0x1003");
    EXPECT_EQ(errorCodeToHex(ErrorCode::BUFFER_ODD_SAMPLE_COUNT), "0x3001");
    EXPECT_EQ(errorCodeToHex(ErrorCode::INTERNAL_UNKNOWN), "0xf001");
}

TEST(ErrorCodes, StringToErrorCodeRoundTrip) {
    EXPECT_EQ(stringToErrorCode("DECODE_INVALID_CHUNK"), ErrorCode::DECODE_INVALID_CHUNK);
    EXPECT_EQ(stringToErrorCode("OK"), ErrorCode::OK);
    EXPECT_EQ(stringToErrorCode("NOT_A_CODE"), ErrorCode::INTERNAL_UNKNOWN);
}

TEST(ErrorCodes, BufferCategoryHoldsOnlyLayoutCodes) {
    EXPECT_EQ(stringToErrorCode("BUFFER_NOT_FOUND"), ErrorCode::INTERNAL_UNKNOWN);
    EXPECT_STREQ(errorCodeToString(static_cast<ErrorCode>(0x3003)), "UNKNOWN_ERROR");
    EXPECT_TRUE(isBufferError(ErrorCode::BUFFER_NOT_ALLOCATED));
}

TEST(ErrorCodes, InnerErrorCarriesHexCode) {
    InnerError error(ErrorCode::IO_SEEK_FAILED, "seek past end");
    EXPECT_EQ(error.code, ErrorCode::IO_SEEK_FAILED);
    EXPECT_EQ(error.cpp_code, "0x1002");
    EXPECT_EQ(error.cpp_message, "seek past end");
    EXPECT_FALSE(error.sndfile_errno.has_value());
    EXPECT_FALSE(error.samplerate_error.has_value());
}
