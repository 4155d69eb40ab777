// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <contentwriter.hpp>
#include <utils.hpp>

#include <cmath>

#include <fmt/core.h>

namespace chromapdf::internal {

namespace {

bool needs_name_escape(unsigned char c) {
    if(c < 0x21 || c > 0x7e || c == '#') {
        return true;
    }
    switch(c) {
    case '(':
    case ')':
    case '<':
    case '>':
    case '[':
    case ']':
    case '{':
    case '}':
    case '/':
    case '%':
        return true;
    default:
        return false;
    }
}

} // namespace

std::string format_number(double d) {
    if(std::isnan(d) || std::isinf(d)) {
        return "0";
    }
    if(d == std::floor(d) && std::fabs(d) < 1e15) {
        return fmt::format("{}", (int64_t)d);
    }
    auto s = fmt::format("{:.6f}", d);
    while(!s.empty() && s.back() == '0') {
        s.pop_back();
    }
    if(!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    if(s == "-0" || s.empty()) {
        return "0";
    }
    return s;
}

void ContentStreamWriter::append_number(double d) { buf += format_number(d); }

void ContentStreamWriter::append_name(const std::string &name) {
    buf += '/';
    for(const char c : name) {
        if(needs_name_escape((unsigned char)c)) {
            fmt::format_to(app, "#{:02X}", (unsigned char)c);
        } else {
            buf += c;
        }
    }
}

void ContentStreamWriter::append_string(const PdfString &str) {
    if(str.hex) {
        buf += '<';
        for(const char c : str.bytes) {
            fmt::format_to(app, "{:02X}", (unsigned char)c);
        }
        buf += '>';
        return;
    }
    buf += '(';
    for(const char c : str.bytes) {
        const auto uc = (unsigned char)c;
        if(c == '(' || c == ')' || c == '\\') {
            buf += '\\';
            buf += c;
        } else if(uc < 0x20 || uc > 0x7e) {
            fmt::format_to(app, "\\{:03o}", uc);
        } else {
            buf += c;
        }
    }
    buf += ')';
}

void ContentStreamWriter::append_dict(const PdfDict &dict) {
    buf += "<<";
    for(const auto &[key, value] : dict) {
        buf += ' ';
        append_name(key);
        buf += ' ';
        append_value(value);
    }
    buf += " >>";
}

void ContentStreamWriter::append_inline_image(const InlineImage &image) {
    buf += "BI\n";
    for(const auto &[key, value] : image.params) {
        append_name(key);
        buf += ' ';
        append_value(value);
        buf += '\n';
    }
    buf += "ID\n";
    buf += image.data;
    buf += "\nEI";
}

void ContentStreamWriter::append_value(const PdfValue &val) {
    std::visit(overloaded{
                   [&](int64_t i) { fmt::format_to(app, "{}", i); },
                   [&](double d) { append_number(d); },
                   [&](const PdfString &s) { append_string(s); },
                   [&](const PdfName &n) { append_name(n.name); },
                   [&](const PdfArray &a) {
                       buf += '[';
                       for(size_t i = 0; i < a.size(); ++i) {
                           if(i > 0) {
                               buf += ' ';
                           }
                           append_value(a[i]);
                       }
                       buf += ']';
                   },
                   [&](const PdfDict &d) { append_dict(d); },
                   [&](const InlineImage &im) { append_inline_image(im); },
                   [&](const PdfStream &st) {
                       append_dict(st.dict);
                       buf += "\nstream\n";
                       buf += st.data;
                       buf += "\nendstream";
                   },
                   [&](const PdfOther &o) { buf += o.keyword; },
               },
               val.v);
}

void ContentStreamWriter::append_operator(const Operator &op) {
    if(op.name == "BI" && op.operands.size() == 1 && as_inline_image(op.operands.front())) {
        append_inline_image(*as_inline_image(op.operands.front()));
        buf += '\n';
        return;
    }
    for(const auto &operand : op.operands) {
        append_value(operand);
        buf += ' ';
    }
    buf += op.name;
    buf += '\n';
}

std::string serialize(const ContentStream &ops) {
    ContentStreamWriter w;
    for(const auto &op : ops) {
        w.append_operator(op);
    }
    return w.steal();
}

} // namespace chromapdf::internal
