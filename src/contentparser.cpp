// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <contentparser.hpp>
#include <cstdio>
#include <cstdlib>

namespace chromapdf::internal {

namespace {

bool is_whitespace(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0';
}

bool is_delimiter(char c) {
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

bool is_regular(char c) { return !is_whitespace(c) && !is_delimiter(c); }

int hex_value(char c) {
    if(c >= '0' && c <= '9') {
        return c - '0';
    }
    if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if(c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool looks_like_number(std::string_view word) {
    bool has_digit = false;
    for(size_t i = 0; i < word.size(); ++i) {
        const char c = word[i];
        if(c >= '0' && c <= '9') {
            has_digit = true;
        } else if((c == '+' || c == '-') && i == 0) {
        } else if(c == '.') {
        } else {
            return false;
        }
    }
    return has_digit;
}

} // namespace

void ContentLexer::skip_whitespace_and_comments() {
    while(offset < text.size()) {
        if(is_whitespace(text[offset])) {
            ++offset;
        } else if(text[offset] == '%') {
            while(offset < text.size() && text[offset] != '\n' && text[offset] != '\r') {
                ++offset;
            }
        } else {
            break;
        }
    }
}

ContentToken ContentLexer::next() {
    skip_whitespace_and_comments();
    if(offset >= text.size()) {
        return TokenFinished{};
    }
    const char c = text[offset];
    switch(c) {
    case '[':
        ++offset;
        return TokenArrayStart{};
    case ']':
        ++offset;
        return TokenArrayEnd{};
    case '(':
        ++offset;
        return lex_literal_string();
    case '/':
        ++offset;
        return lex_name();
    case '<':
        if(offset + 1 < text.size() && text[offset + 1] == '<') {
            offset += 2;
            return TokenDictStart{};
        }
        ++offset;
        return lex_hex_string();
    case '>':
        if(offset + 1 < text.size() && text[offset + 1] == '>') {
            offset += 2;
            return TokenDictEnd{};
        }
        return TokenError{};
    case ')':
    case '{':
    case '}':
        return TokenError{};
    default:
        return lex_number_or_keyword();
    }
}

ContentToken ContentLexer::lex_literal_string() {
    std::string result;
    int num_parens = 1;
    while(offset < text.size()) {
        const char c = text[offset++];
        if(c == '\\') {
            if(offset >= text.size()) {
                return TokenError{};
            }
            const char e = text[offset++];
            switch(e) {
            case 'n':
                result += '\n';
                break;
            case 'r':
                result += '\r';
                break;
            case 't':
                result += '\t';
                break;
            case 'b':
                result += '\b';
                break;
            case 'f':
                result += '\f';
                break;
            case '\r':
                if(offset < text.size() && text[offset] == '\n') {
                    ++offset;
                }
                break;
            case '\n':
                break;
            default:
                if(e >= '0' && e <= '7') {
                    int value = e - '0';
                    for(int i = 0; i < 2 && offset < text.size() && text[offset] >= '0' &&
                                   text[offset] <= '7';
                        ++i) {
                        value = value * 8 + (text[offset++] - '0');
                    }
                    result += (char)(value & 0xFF);
                } else {
                    // Covers \( \) and \\ as well as unknown escapes.
                    result += e;
                }
            }
        } else if(c == '(') {
            ++num_parens;
            result += c;
        } else if(c == ')') {
            if(--num_parens == 0) {
                return TokenLiteralString{std::move(result)};
            }
            result += c;
        } else {
            result += c;
        }
    }
    return TokenError{};
}

ContentToken ContentLexer::lex_hex_string() {
    std::string result;
    int high = -1;
    while(offset < text.size()) {
        const char c = text[offset++];
        if(c == '>') {
            if(high >= 0) {
                result += (char)(high << 4);
            }
            return TokenHexString{std::move(result)};
        }
        if(is_whitespace(c)) {
            continue;
        }
        const int nibble = hex_value(c);
        if(nibble < 0) {
            return TokenError{};
        }
        if(high < 0) {
            high = nibble;
        } else {
            result += (char)((high << 4) | nibble);
            high = -1;
        }
    }
    return TokenError{};
}

ContentToken ContentLexer::lex_name() {
    std::string result;
    while(offset < text.size() && is_regular(text[offset])) {
        const char c = text[offset];
        if(c == '#' && offset + 2 < text.size() && hex_value(text[offset + 1]) >= 0 &&
           hex_value(text[offset + 2]) >= 0) {
            result += (char)((hex_value(text[offset + 1]) << 4) | hex_value(text[offset + 2]));
            offset += 3;
        } else {
            result += c;
            ++offset;
        }
    }
    return TokenName{std::move(result)};
}

ContentToken ContentLexer::lex_number_or_keyword() {
    const size_t start = offset;
    while(offset < text.size() && is_regular(text[offset])) {
        ++offset;
    }
    if(offset == start) {
        return TokenError{};
    }
    std::string word(text.substr(start, offset - start));
    if(looks_like_number(word)) {
        if(word.find('.') == std::string::npos) {
            return TokenInteger{strtoll(word.c_str(), nullptr, 10)};
        }
        return TokenReal{strtod(word.c_str(), nullptr)};
    }
    return TokenKeyword{std::move(word)};
}

rvoe<std::string> ContentLexer::inline_image_data() {
    // Exactly one whitespace byte separates ID from the data.
    if(offset < text.size() && is_whitespace(text[offset])) {
        ++offset;
    }
    const size_t start = offset;
    size_t search = offset;
    while(true) {
        const auto ei = text.find("EI", search);
        if(ei == std::string_view::npos) {
            fprintf(stderr, "Inline image at offset %d is not terminated with EI.\n", (int)start);
            RETERR(ParseError);
        }
        const bool preceded = ei > start && is_whitespace(text[ei - 1]);
        const bool followed = ei + 2 >= text.size() || is_whitespace(text[ei + 2]) ||
                              is_delimiter(text[ei + 2]);
        if(preceded && followed) {
            std::string data(text.substr(start, ei - 1 - start));
            offset = ei + 2;
            return data;
        }
        search = ei + 2;
    }
}

rvoe<std::string> ContentLexer::stream_data() {
    // The stream keyword is followed by CRLF or LF.
    if(text.substr(offset, 2) == "\r\n") {
        offset += 2;
    } else if(offset < text.size() && text[offset] == '\n') {
        ++offset;
    }
    const size_t start = offset;
    const auto end = text.find("endstream", start);
    if(end == std::string_view::npos) {
        fprintf(stderr, "Stream at offset %d is not terminated with endstream.\n", (int)start);
        RETERR(ParseError);
    }
    size_t data_end = end;
    if(data_end > start && text[data_end - 1] == '\n') {
        --data_end;
    }
    if(data_end > start && text[data_end - 1] == '\r') {
        --data_end;
    }
    offset = end + 9;
    return std::string(text.substr(start, data_end - start));
}

void ContentStreamParser::report_error(const char *msg) const {
    fprintf(stderr, "Content stream parse error at offset %d: %s\n", (int)lex.position(), msg);
}

rvoe<ContentStream> ContentStreamParser::parse() {
    ContentStream ops;
    std::vector<PdfValue> operands;
    pending = lex.next();
    while(true) {
        if(accept<TokenFinished>()) {
            if(!operands.empty()) {
                report_error("operands without an operator at end of stream");
                RETERR(ParseError);
            }
            return ops;
        }
        if(auto kw = std::get_if<TokenKeyword>(&pending);
           kw && kw->text != "true" && kw->text != "false" && kw->text != "null") {
            if(kw->text == "BI") {
                if(!operands.empty()) {
                    report_error("operands before BI");
                    RETERR(ParseError);
                }
                ERC(image_op, parse_inline_image());
                ops.emplace_back(std::move(image_op));
                continue;
            }
            auto op = accept<TokenKeyword>();
            ops.emplace_back(Operator{std::move(op->text), std::move(operands)});
            operands.clear();
            continue;
        }
        ERC(value, parse_value());
        operands.emplace_back(std::move(value));
    }
}

rvoe<PdfValue> ContentStreamParser::parse_object() {
    allow_streams = true;
    pending = lex.next();
    ERC(value, parse_value());
    if(!accept<TokenFinished>()) {
        report_error("trailing data after object");
        RETERR(ParseError);
    }
    return std::move(value);
}

rvoe<PdfValue> ContentStreamParser::parse_value() {
    if(auto intval = accept<TokenInteger>(); intval) {
        return PdfValue{intval->value};
    }
    if(auto realval = accept<TokenReal>(); realval) {
        return PdfValue{realval->value};
    }
    if(auto strval = accept<TokenLiteralString>(); strval) {
        return PdfValue{PdfString{std::move(strval->text), false}};
    }
    if(auto strval = accept<TokenHexString>(); strval) {
        return PdfValue{PdfString{std::move(strval->text), true}};
    }
    if(auto nameval = accept<TokenName>(); nameval) {
        return PdfValue{PdfName{std::move(nameval->text)}};
    }
    if(accept<TokenDictStart>()) {
        ERC(dict, parse_dict());
        if(allow_streams && pending_is_keyword("stream")) {
            // Do not prefetch, the lexer is positioned at the stream data.
            ERC(data, lex.stream_data());
            pending = lex.next();
            return PdfValue{PdfStream{std::move(dict), std::move(data)}};
        }
        return PdfValue{std::move(dict)};
    }
    if(accept<TokenArrayStart>()) {
        ERC(arr, parse_array());
        return PdfValue{std::move(arr)};
    }
    if(pending_is_keyword("true") || pending_is_keyword("false") || pending_is_keyword("null")) {
        auto kw = accept<TokenKeyword>();
        return PdfValue{PdfOther{std::move(kw->text)}};
    }
    if(std::holds_alternative<TokenFinished>(pending)) {
        report_error("unexpected end of stream");
    } else {
        report_error("unexpected token");
    }
    RETERR(ParseError);
}

rvoe<PdfDict> ContentStreamParser::parse_dict() {
    PdfDict dict;
    while(true) {
        if(accept<TokenDictEnd>()) {
            return dict;
        }
        auto k = accept<TokenName>();
        if(!k) {
            report_error("dictionary key is not a name");
            RETERR(ParseError);
        }
        ERC(v, parse_value());
        dict[k->text] = std::move(v);
    }
}

rvoe<PdfArray> ContentStreamParser::parse_array() {
    PdfArray arr;
    while(true) {
        if(accept<TokenArrayEnd>()) {
            return arr;
        }
        ERC(v, parse_value());
        arr.emplace_back(std::move(v));
    }
}

rvoe<Operator> ContentStreamParser::parse_inline_image() {
    // Pending is the BI keyword.
    pending = lex.next();
    InlineImage image;
    while(true) {
        if(pending_is_keyword("ID")) {
            // Do not prefetch, the lexer is positioned at the binary data.
            ERC(data, lex.inline_image_data());
            image.data = std::move(data);
            pending = lex.next();
            break;
        }
        auto k = accept<TokenName>();
        if(!k) {
            report_error("inline image key is not a name");
            RETERR(ParseError);
        }
        ERC(v, parse_value());
        image.params[k->text] = std::move(v);
    }
    Operator op;
    op.name = "BI";
    op.operands.emplace_back(std::move(image));
    return op;
}

rvoe<ContentStream> parse_content_stream(std::string_view bytes) {
    ContentStreamParser p(bytes);
    return p.parse();
}

rvoe<PdfValue> parse_object(std::string_view bytes) {
    ContentStreamParser p(bytes);
    return p.parse_object();
}

} // namespace chromapdf::internal
