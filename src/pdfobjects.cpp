// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <pdfobjects.hpp>

namespace chromapdf::internal {

std::optional<double> as_number(const PdfValue &val) {
    if(auto *i = std::get_if<int64_t>(&val.v)) {
        return (double)*i;
    }
    if(auto *d = std::get_if<double>(&val.v)) {
        return *d;
    }
    return {};
}

const PdfName *as_name(const PdfValue &val) { return std::get_if<PdfName>(&val.v); }

const PdfString *as_string(const PdfValue &val) { return std::get_if<PdfString>(&val.v); }

const PdfArray *as_array(const PdfValue &val) { return std::get_if<PdfArray>(&val.v); }

const PdfDict *as_dict(const PdfValue &val) { return std::get_if<PdfDict>(&val.v); }

const InlineImage *as_inline_image(const PdfValue &val) {
    return std::get_if<InlineImage>(&val.v);
}

const PdfStream *as_stream(const PdfValue &val) { return std::get_if<PdfStream>(&val.v); }

const PdfDict *as_dict_or_stream_dict(const PdfValue &val) {
    if(auto *s = as_stream(val)) {
        return &s->dict;
    }
    return as_dict(val);
}

std::optional<bool> as_bool(const PdfValue &val) {
    if(auto *o = std::get_if<PdfOther>(&val.v)) {
        if(o->keyword == "true") {
            return true;
        }
        if(o->keyword == "false") {
            return false;
        }
    }
    return {};
}

const PdfValue *dict_get(const PdfDict &d, const char *key) {
    auto it = d.find(key);
    if(it == d.end()) {
        return nullptr;
    }
    return &it->second;
}

const PdfValue *dict_get(const PdfDict &d, const char *key, const char *abbreviation) {
    if(auto *v = dict_get(d, key)) {
        return v;
    }
    return dict_get(d, abbreviation);
}

std::optional<std::vector<double>> as_number_array(const PdfValue &val) {
    auto *arr = as_array(val);
    if(!arr) {
        return {};
    }
    std::vector<double> result;
    result.reserve(arr->size());
    for(const auto &e : *arr) {
        auto num = as_number(e);
        if(!num) {
            return {};
        }
        result.push_back(*num);
    }
    return result;
}

std::optional<std::vector<double>> numeric_operands(const Operator &op) {
    std::vector<double> result;
    result.reserve(op.operands.size());
    for(const auto &e : op.operands) {
        auto num = as_number(e);
        if(!num) {
            return {};
        }
        result.push_back(*num);
    }
    return result;
}

Operator make_operator(std::string name, std::vector<PdfValue> operands) {
    return Operator{std::move(name), std::move(operands)};
}

} // namespace chromapdf::internal
