// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chromapdf::internal {

struct PdfValue;

// Without the leading slash, escapes already resolved.
struct PdfName {
    std::string name;

    bool operator==(const PdfName &) const = default;
};

// Raw bytes, escapes already resolved.
struct PdfString {
    std::string bytes;
    bool hex = false;

    bool operator==(const PdfString &) const = default;
};

// true, false and null.
struct PdfOther {
    std::string keyword;

    bool operator==(const PdfOther &) const = default;
};

typedef std::vector<PdfValue> PdfArray;
typedef std::map<std::string, PdfValue> PdfDict;

struct InlineImage {
    PdfDict params;
    std::string data;
};

// Only appears in standalone objects, e.g. a type 4 function or an ICC profile.
struct PdfStream {
    PdfDict dict;
    std::string data;
};

struct PdfValue {
    std::variant<int64_t,
                 double,
                 PdfString,
                 PdfName,
                 PdfArray,
                 PdfDict,
                 InlineImage,
                 PdfStream,
                 PdfOther>
        v;

    PdfValue() : v{PdfOther{"null"}} {}
    PdfValue(int64_t i) : v{i} {}
    PdfValue(int32_t i) : v{(int64_t)i} {}
    PdfValue(double d) : v{d} {}
    PdfValue(PdfString s) : v{std::move(s)} {}
    PdfValue(PdfName n) : v{std::move(n)} {}
    PdfValue(PdfArray a) : v{std::move(a)} {}
    PdfValue(PdfDict d) : v{std::move(d)} {}
    PdfValue(InlineImage i) : v{std::move(i)} {}
    PdfValue(PdfStream s) : v{std::move(s)} {}
    PdfValue(PdfOther o) : v{std::move(o)} {}
};

struct Operator {
    std::string name;
    std::vector<PdfValue> operands;
};

typedef std::vector<Operator> ContentStream;

std::optional<double> as_number(const PdfValue &val);
const PdfName *as_name(const PdfValue &val);
const PdfString *as_string(const PdfValue &val);
const PdfArray *as_array(const PdfValue &val);
const PdfDict *as_dict(const PdfValue &val);
const InlineImage *as_inline_image(const PdfValue &val);
const PdfStream *as_stream(const PdfValue &val);
// The dictionary itself or the dictionary of a stream.
const PdfDict *as_dict_or_stream_dict(const PdfValue &val);
std::optional<bool> as_bool(const PdfValue &val);

const PdfValue *dict_get(const PdfDict &d, const char *key);
// Inline image dictionaries use abbreviated keys.
const PdfValue *dict_get(const PdfDict &d, const char *key, const char *abbreviation);

std::optional<std::vector<double>> as_number_array(const PdfValue &val);

// Numeric operands of an operator, in order. Fails if any of them is not a number.
std::optional<std::vector<double>> numeric_operands(const Operator &op);

Operator make_operator(std::string name, std::vector<PdfValue> operands = {});

} // namespace chromapdf::internal
