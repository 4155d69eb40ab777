// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <pdfobjects.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace chromapdf::internal {

struct TokenArrayStart {};

struct TokenArrayEnd {};

struct TokenDictStart {};

struct TokenDictEnd {};

struct TokenName {
    std::string text;
};

struct TokenLiteralString {
    std::string text;
};

struct TokenHexString {
    std::string text;
};

struct TokenInteger {
    int64_t value;
};

struct TokenReal {
    double value;
};

// Operators and the true/false/null constants.
struct TokenKeyword {
    std::string text;
};

struct TokenFinished {};

struct TokenError {};

typedef std::variant<TokenArrayStart,
                     TokenArrayEnd,
                     TokenDictStart,
                     TokenDictEnd,
                     TokenName,
                     TokenLiteralString,
                     TokenHexString,
                     TokenInteger,
                     TokenReal,
                     TokenKeyword,
                     TokenError,
                     TokenFinished>
    ContentToken;

class ContentLexer {
public:
    explicit ContentLexer(std::string_view t) : text(t), offset(0) {}

    ContentToken next();

    // Reads the binary payload that follows the ID keyword of an inline image.
    // The offset must be right after "ID".
    rvoe<std::string> inline_image_data();

    // Reads the payload between the stream and endstream keywords. The offset
    // must be right after "stream".
    rvoe<std::string> stream_data();

    size_t position() const { return offset; }

private:
    void skip_whitespace_and_comments();
    ContentToken lex_literal_string();
    ContentToken lex_hex_string();
    ContentToken lex_name();
    ContentToken lex_number_or_keyword();

    std::string_view text;
    size_t offset;
};

class ContentStreamParser {
public:
    explicit ContentStreamParser(std::string_view t) : lex(t) {}

    rvoe<ContentStream> parse();

    // A single object such as a colorspace array, nothing may follow it.
    rvoe<PdfValue> parse_object();

private:
    rvoe<PdfValue> parse_value();
    rvoe<PdfDict> parse_dict();
    rvoe<PdfArray> parse_array();
    rvoe<Operator> parse_inline_image();

    template<typename T> std::optional<T> accept() {
        if(!std::holds_alternative<T>(pending)) {
            return {};
        }
        auto retval = std::move(pending);
        pending = lex.next();
        return std::move(std::get<T>(retval));
    }

    bool pending_is_keyword(const char *kw) const {
        auto *k = std::get_if<TokenKeyword>(&pending);
        return k && k->text == kw;
    }

    void report_error(const char *msg) const;

    ContentLexer lex;
    ContentToken pending;
    bool allow_streams = false;
};

rvoe<ContentStream> parse_content_stream(std::string_view bytes);

rvoe<PdfValue> parse_object(std::string_view bytes);

} // namespace chromapdf::internal
