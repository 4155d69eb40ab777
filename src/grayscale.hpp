// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <colorconverter.hpp>
#include <errorhandling.hpp>
#include <options.hpp>
#include <pdfobjects.hpp>
#include <resources.hpp>

namespace chromapdf::internal {

// Type 4 tint transforms from the shading components to DeviceGray.
extern const char rgb_to_gray_program[];
extern const char cmyk_to_gray_program[];

// Shading colors are functions of position so they can not be converted up
// front. Instead the shading gets a DeviceN space whose tint transform computes
// the gray value.
rvoe<Shading> shading_to_gray(const Shading &shading);

class GrayscaleTransformer {
public:
    static rvoe<GrayscaleTransformer> construct(GrayscaleOptions opts = {});

    // Returns the rewritten stream. Patterns, shadings, XObjects and pattern
    // colorspaces used by the stream are replaced in the resources.
    rvoe<ContentStream> to_grayscale(const ContentStream &ops, ResourceResolver &resources) const;

    // Uncolored tiling patterns come back unchanged.
    rvoe<Pattern> pattern_to_gray(const Pattern &pattern, ResourceResolver &resources) const;

private:
    GrayscaleTransformer(GrayscaleOptions opts, ColorConverter conv)
        : opts(std::move(opts)), conv(std::move(conv)) {}

    GrayscaleOptions opts;
    ColorConverter conv;
};

} // namespace chromapdf::internal
