// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <options.hpp>
#include <pdfobjects.hpp>
#include <resources.hpp>

#include <string>

namespace chromapdf::internal {

struct OperatorMarking {
    bool marks = false;
    bool uses_stroke = false;
    bool uses_fill = false;
};

// Operators missing from the table never mark.
OperatorMarking operator_marking(const std::string &opname);

// Text that is nothing but spaces and control characters covers no area.
bool is_blank_text(const std::string &bytes);

// Is anything visible painted at all, regardless of hue. Images are assumed
// to be visible without decoding them.
class MarkDetector {
public:
    explicit MarkDetector(ScanOptions opts = {}) : opts(std::move(opts)) {}

    rvoe<bool> is_marked(const ContentStream &ops, ResourceResolver &resources) const;

    rvoe<bool> is_pattern_marked(const Pattern &pattern, ResourceResolver &resources) const;

private:
    ScanOptions opts;
};

} // namespace chromapdf::internal
