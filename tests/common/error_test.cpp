// =============================================================================
// frw - Error Handling Framework Tests
// =============================================================================
// Unit tests for ErrorCode mapping, Result helpers, and the exception type
// thrown for each code.
// =============================================================================

#include "frw/common/error.h"

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <vector>

namespace frw {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesMatchEnumValues) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kFileNotFound), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kGapNotAllowed), 9);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidState), 12);
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kFileEmpty), "file empty");
    EXPECT_EQ(errorCodeToString(ErrorCode::kChunkReadFailed), "chunk read failed");
    EXPECT_EQ(errorCodeToString(ErrorCode::kSizeMismatch), "size mismatch");
}

// =============================================================================
// Result Helpers
// =============================================================================

TEST(ResultTest, MakeErrorFormatsMessage) {
    Result<int> result = makeError(ErrorCode::kInvalidArgument, "bad value {} at {}", 42, "x");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(result.error().message(), "bad value 42 at x");
    EXPECT_EQ(result.error().exitCode(), 10);
}

TEST(ResultTest, VoidSuccessAndError) {
    EXPECT_TRUE(makeVoidSuccess().has_value());

    VoidResult failed = makeError(ErrorCode::kFileEmpty, "file empty");
    ASSERT_FALSE(failed.has_value());
    EXPECT_TRUE(isFileEmpty(failed.error()));
    EXPECT_FALSE(isFileNotFound(failed.error()));
}

TEST(ResultTest, UnwrapOrThrowReturnsValue) {
    EXPECT_EQ(unwrapOrThrow(Result<int>{7}), 7);
    EXPECT_NO_THROW(unwrapOrThrow(makeVoidSuccess()));
}

TEST(ResultTest, UnwrapOrThrowThrowsMatchingException) {
    Result<int> notFound = makeError(ErrorCode::kFileNotFound, "missing");
    EXPECT_THROW((void)unwrapOrThrow(std::move(notFound)), FileNotFoundError);

    Result<int> gap = makeError(ErrorCode::kGapNotAllowed, "gap");
    EXPECT_THROW((void)unwrapOrThrow(std::move(gap)), GapError);

    Result<int> state = makeError(ErrorCode::kInvalidState, "closed");
    try {
        (void)unwrapOrThrow(std::move(state));
        FAIL() << "expected an exception";
    } catch (const FRWException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInvalidState);
        EXPECT_EQ(e.message(), "closed");
    }
}

// =============================================================================
// Exceptions and Error Conversion
// =============================================================================

TEST(ExceptionTest, WhatIncludesCode) {
    IOError error("read failed");
    EXPECT_STREQ(error.what(), "[I/O error] read failed");
    EXPECT_EQ(error.message(), "read failed");
    EXPECT_EQ(error.exitCode(), 2);
}

TEST(ExceptionTest, SizeMismatchMessage) {
    Result<int> result = makeError(ErrorCode::kSizeMismatch,
                                   SizeMismatchError::formatSizeMismatch(100, 90));
    try {
        (void)unwrapOrThrow(std::move(result));
        FAIL() << "expected SizeMismatchError";
    } catch (const SizeMismatchError& e) {
        EXPECT_EQ(e.message(), "file size error: expected [100], got [90] bytes");
        EXPECT_EQ(e.exitCode(), 8);
    }
}

TEST(ExceptionTest, ChunkFailuresSurviveThrow) {
    std::vector<ChunkFailure> failures{
        {1, 100, 100, ErrorCode::kIOError, "bad fd"},
        {4, 400, 100, ErrorCode::kIOError, "bad fd"},
    };
    Error error(ErrorCode::kChunkReadFailed, "2 chunk read(s) failed", failures);

    try {
        error.throwException();
    } catch (const ChunkReadError& e) {
        EXPECT_EQ(e.failures(), failures);
        EXPECT_EQ(e.code(), ErrorCode::kChunkReadFailed);
        return;
    }
    FAIL() << "expected ChunkReadError";
}

TEST(ExceptionTest, SystemErrorCarriesErrnoText) {
    const Error error = systemError(ErrorCode::kIOError, "cannot open x", ENOENT);
    EXPECT_EQ(error.code(), ErrorCode::kIOError);
    EXPECT_NE(error.message().find("cannot open x"), std::string::npos);
    EXPECT_NE(error.message().find(std::to_string(ENOENT)), std::string::npos);
}

}  // namespace
}  // namespace frw
