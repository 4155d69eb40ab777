// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <pdfobjects.hpp>

#include <iterator>
#include <string>

namespace chromapdf::internal {

class ContentStreamWriter {
public:
    ContentStreamWriter() : app{std::back_inserter(buf)} {}

    void append_operator(const Operator &op);
    void append_value(const PdfValue &val);

    const std::string &contents() const { return buf; }
    std::string steal() { return std::move(buf); }

private:
    void append_number(double d);
    void append_name(const std::string &name);
    void append_string(const PdfString &str);
    void append_dict(const PdfDict &dict);
    void append_inline_image(const InlineImage &image);

    std::string buf;
    std::back_insert_iterator<std::string> app;
};

std::string serialize(const ContentStream &ops);

// Shortest decimal form without exponent, as PDF syntax requires.
std::string format_number(double d);

} // namespace chromapdf::internal
