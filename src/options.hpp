// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <cstdint>
#include <string>

namespace chromapdf::internal {

struct ScanOptions {
    // Forms and patterns nested deeper than this are an error.
    int32_t max_nesting_depth = 32;
    // Print every operator and the resulting color state to stderr.
    bool verbose = false;
    // Output profile for the CIE based spaces. Empty means sRGB.
    std::string rgb_profile;
};

struct GrayscaleOptions {
    ScanOptions scan;
    bool convert_images = true;
    int32_t jpeg_quality = 90;
};

} // namespace chromapdf::internal
