// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <colorconverter.hpp>
#include <errorhandling.hpp>
#include <options.hpp>
#include <pdfobjects.hpp>
#include <resources.hpp>

namespace chromapdf::internal {

// Decided by the number of components alone, the shading function is not
// evaluated.
rvoe<bool> is_shading_colored(const Shading &shading);

// Does painting the stream put any non-gray color on the page.
class ColorDetector {
public:
    static rvoe<ColorDetector> construct(ScanOptions opts = {});

    rvoe<bool> is_colored(const ContentStream &ops, ResourceResolver &resources) const;

    // Resources are used for tiling patterns that have none of their own.
    rvoe<bool> is_pattern_colored(const Pattern &pattern, ResourceResolver &resources) const;

    const ColorConverter &converter() const { return conv; }

private:
    ColorDetector(ScanOptions opts, ColorConverter conv)
        : opts(std::move(opts)), conv(std::move(conv)) {}

    ScanOptions opts;
    ColorConverter conv;
};

} // namespace chromapdf::internal
