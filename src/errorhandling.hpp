// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <cstdint>
#include <cstdio>
#include <expected>

namespace chromapdf::internal {

enum class ErrorCode : int32_t {
    NoError,
    DynamicError,
    ParseError,
    UndefinedColorspace,
    UndefinedPattern,
    UndefinedShading,
    UndefinedXObject,
    UnsupportedColorspace,
    UnsupportedEncodingParameters,
    WrongOperandCount,

    WrongOperandType,
    UnsupportedFilter,
    CompressionFailure,
    DecompressionFailure,
    InvalidImageSize,
    MissingPixels,
    UnsupportedFunction,
    FunctionStackError,
    InvalidICCProfile,
    ProfileProblem,

    IndexOutOfBounds,
    NestingTooDeep,
    CouldNotOpenFile,
    FileReadError,
    Unreachable,
    // When you add an error code here, also add the string representation in the .cpp file.
    NumErrors,
};

const char *error_text(ErrorCode ec) noexcept;

// All errors are returned as std::unexpecteds and propagated manually.

// This error exists solely so you can put a breakpoint in it.
inline std::unexpected<ErrorCode> create_error(ErrorCode code) { return std::unexpected(code); }

#define RETERR(code) return create_error(ErrorCode::code)

#define RETOK                                                                                      \
    return NoReturnValue {}

// Return value or error.
template<typename T> using rvoe = std::expected<T, ErrorCode>;

#define ERC(varname, func)                                                                         \
    auto varname##_variant = func;                                                                 \
    if(!(varname##_variant)) {                                                                     \
        return std::unexpected(varname##_variant.error());                                         \
    }                                                                                              \
    auto &varname = varname##_variant.value();

// For void.

#define ERCV(func)                                                                                 \
    {                                                                                              \
        auto placeholder_name_variant = func;                                                      \
        if(!(placeholder_name_variant)) {                                                          \
            return std::unexpected(placeholder_name_variant.error());                              \
        }                                                                                          \
    }

struct NoReturnValue {};

} // namespace chromapdf::internal

#define CHECK_OPERAND_COUNT(op, count)                                                             \
    if((op).operands.size() != (size_t)(count)) {                                                  \
        fprintf(stderr,                                                                            \
                "Operator %s expects %d operands, got %d.\n",                                     \
                (op).name.c_str(),                                                                 \
                (int)(count),                                                                      \
                (int)(op).operands.size());                                                        \
        RETERR(WrongOperandCount);                                                                 \
    }
