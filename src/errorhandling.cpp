// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen
// Copyright 2026 The ChromaPDF authors

#include <errorhandling.hpp>
#include <array>
#include <cstdio>
#include <cstdlib>

namespace chromapdf::internal {

// clang-format off

const std::array<const char *, (std::size_t)ErrorCode::NumErrors> error_texts{
"No error.",
"Unexpected error, the real error message should be in stdout or stderr.",
"Malformed content stream.",
"Colorspace name not defined in resources.",
"Pattern name not defined in resources.",
"Shading name not defined in resources.",
"XObject name not defined in resources.",
"Colorspace has an unsupported number of components.",
"Image can not be encoded with the requested parameters.",
"Wrong number of operands for operator.",
"Operand has the wrong type.",
"Unsupported stream filter.",
"Compression failure.",
"Decompression failure.",
"Invalid image size.",
"Missing pixel data.",
"Unsupported function type.",
"PostScript function stack under- or overflow.",
"Invalid ICC profile data.",
"Unspecified color profile error.",
"Index out of bounds.",
"Forms or patterns nested too deeply.",
"Could not open file.",
"Failed to load data from file.",
"Unreachable code.",
};

// clang-format on

const char *error_text(ErrorCode ec) noexcept {
    const int index = (int32_t)ec;
    if(index < 0 || (std::size_t)index >= error_texts.size()) {
        return "Invalid error code.";
    }
    return error_texts[index];
}

} // namespace chromapdf::internal
