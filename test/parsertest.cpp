// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include "testhelpers.hpp"

#include <colordetector.hpp>
#include <contentwriter.hpp>
#include <markdetector.hpp>
#include <pagesummary.hpp>

using namespace chromapdf::internal;

namespace {

int test_operands() {
    CHECK_OK(ops,
             parse_content_stream("q 1 0 0 1 72.5 -3 cm /F1 12 Tf (a\\(b\\)\\101) Tj <48 69> Tj "
                                  "[(x) -120 (y)] TJ /Na#20me Do Q"));
    CHECK(ops.size() == 7);
    CHECK(ops[0].name == "q" && ops[0].operands.empty());
    CHECK(ops[1].name == "cm" && ops[1].operands.size() == 6);
    CHECK(close_to(*as_number(ops[1].operands[4]), 72.5));
    CHECK(close_to(*as_number(ops[1].operands[5]), -3));
    CHECK(as_name(ops[2].operands[0])->name == "F1");
    CHECK(as_string(ops[3].operands[0])->bytes == "a(b)A");
    CHECK(as_string(ops[4].operands[0])->bytes == "Hi");
    CHECK(as_string(ops[4].operands[0])->hex);
    CHECK(as_array(ops[5].operands[0])->size() == 3);
    CHECK(as_name(ops[6].operands[0])->name == "Na me");
    return 0;
}

int test_comments_and_dicts() {
    CHECK_OK(ops,
             parse_content_stream("% comment\n/Span << /ActualText (x) /MCID 3 >> BDC EMC\n"
                                  "/OC /oc1 BDC true false null EMC"));
    CHECK(ops.size() == 4);
    auto *props = as_dict(ops[0].operands[1]);
    CHECK(props);
    CHECK(as_number(*dict_get(*props, "MCID")) == 3.0);
    CHECK(ops[3].operands.size() == 3);
    CHECK(as_bool(ops[3].operands[0]) == true);
    CHECK(as_bool(ops[3].operands[1]) == false);
    return 0;
}

int test_inline_image() {
    const std::string stream = std::string("q BI /W 2 /H 1 /CS /G /BPC 8 ID ") +
                               std::string("\x00 E", 3) + " EI Q";
    CHECK_OK(ops, parse_content_stream(stream));
    CHECK(ops.size() == 3);
    CHECK(ops[1].name == "BI");
    auto *ii = as_inline_image(ops[1].operands[0]);
    CHECK(ii);
    CHECK(ii->data == std::string("\x00 E", 3));
    CHECK(as_number(*dict_get(ii->params, "Width", "W")) == 2.0);
    const auto text = serialize(ops);
    CHECK(text == std::string("q\nBI\n/BPC 8\n/CS /G\n/H 1\n/W 2\nID\n") +
                      std::string("\x00 E", 3) + "\nEI\nQ\n");
    CHECK_OK(again, parse_content_stream(text));
    CHECK(as_inline_image(again[1].operands[0])->data == ii->data);
    return 0;
}

int test_parse_errors() {
    CHECK_ERROR(parse_content_stream("1 0 0 rg 0 0 1"), ParseError);
    CHECK_ERROR(parse_content_stream("(unterminated Tj"), ParseError);
    CHECK_ERROR(parse_content_stream("[1 2 re"), ParseError);
    CHECK_ERROR(parse_content_stream("BI /W 1 /H 1 ID abc"), ParseError);
    CHECK_ERROR(parse_content_stream("<< /A 1 >> >> gs"), ParseError);
    CHECK_ERROR(parse_object("/A /B"), ParseError);
    return 0;
}

int test_writer() {
    ContentStream ops;
    ops.push_back(make_operator("G", {0.5}));
    ops.push_back(make_operator("cs", {PdfName{"Odd Name/"}}));
    ops.push_back(make_operator("Tj", {PdfString{"a(b)\\", false}}));
    ops.push_back(make_operator("Tj", {PdfString{std::string("\x01\xff", 2), true}}));
    ops.push_back(make_operator("d", {PdfArray{PdfValue{int64_t(3)}, PdfValue{1.25}}, 0}));
    CHECK(serialize(ops) ==
          "0.5 G\n/Odd#20Name#2F cs\n(a\\(b\\)\\\\) Tj\n<01FF> Tj\n[3 1.25] 0 d\n");
    CHECK(format_number(1.0) == "1");
    CHECK(format_number(-0.25) == "-0.25");
    CHECK(format_number(0.1234567) == "0.123457");
    CHECK(format_number(-0.0000001) == "0");
    CHECK_OK(reparsed, parse_content_stream(serialize(ops)));
    CHECK(as_name(reparsed[1].operands[0])->name == "Odd Name/");
    CHECK(as_string(reparsed[2].operands[0])->bytes == "a(b)\\");
    return 0;
}

int test_stream_objects() {
    CHECK_OK(crlf, parse_object("<< /N 3 >>\r\nstream\r\nabc\r\nendstream"));
    auto *stream = as_stream(crlf);
    CHECK(stream);
    CHECK(stream->data == "abc");
    CHECK(as_number(*dict_get(stream->dict, "N")) == 3.0);
    CHECK(as_dict_or_stream_dict(crlf) == &stream->dict);

    CHECK_OK(empty, parse_object("<< >>\nstream\nendstream"));
    CHECK(as_stream(empty) && as_stream(empty)->data.empty());
    CHECK_OK(plain, parse_object("<< /N 1 >>"));
    CHECK(!as_stream(plain));
    CHECK(as_dict_or_stream_dict(plain));

    CHECK_ERROR(parse_object("<< /N 3 >>\nstream\nabc"), ParseError);
    CHECK_ERROR(parse_object("<< >>\nstream\nabc\nendstream 1"), ParseError);

    // In content streams the keyword stays an operator.
    CHECK_OK(ops, parse_content_stream("<< /A 1 >> stream"));
    CHECK(ops.size() == 1);
    CHECK(ops[0].name == "stream");
    CHECK(as_dict(ops[0].operands[0]));
    return 0;
}

int test_page_summary() {
    CHECK(close_to(points_to_mm(595.276), 210.0));
    CHECK(close_to(points_to_mm(-841.89), 297.0));
    CHECK(close_to(points_to_mm(612), 215.9));

    CHECK_OK(det, ColorDetector::construct());
    std::vector<PageDescription> pages(3);
    pages[0].media_box = {0, 0, 595.276, 841.89};
    pages[0].contents = parse_or_die("0 g 0 0 10 10 re f");
    pages[1].media_box = {0, 0, 612, 792};
    pages[1].contents = parse_or_die("1 0 0 rg 0 0 10 10 re f");
    pages[2].contents = parse_or_die("/Sh0 sh");
    pages[2].resources = std::make_shared<ResourceDictionary>();
    pages[2].resources->set_shading("Sh0", Shading{Colorspace{DeviceCMYKSpace{}}, {}});

    CHECK_OK(colors,
             summarize_pages(pages, [&det](const ContentStream &ops, ResourceResolver &r) {
                 return det.is_colored(ops, r);
             }));
    CHECK(colors.num_pages == 3);
    CHECK(colors.selected_pages == std::vector<int32_t>({2, 3}));
    CHECK(to_json(colors, PageSelection::Colored) ==
          R"({"NumPages":3,"Width":215.9,"Height":297,"ColorPages":[2,3]})");

    MarkDetector marks;
    CHECK_OK(marked,
             summarize_pages(pages, [&marks](const ContentStream &ops, ResourceResolver &r) {
                 return marks.is_marked(ops, r);
             }));
    CHECK(marked.selected_pages == std::vector<int32_t>({1, 2, 3}));
    CHECK(to_json(marked, PageSelection::Marked) ==
          R"({"NumPages":3,"Width":215.9,"Height":297,"MarkedPages":[1,2,3]})");

    pages[1].contents = parse_or_die("/Missing Do");
    CHECK_ERROR(summarize_pages(pages,
                                [&det](const ContentStream &ops, ResourceResolver &r) {
                                    return det.is_colored(ops, r);
                                }),
                UndefinedXObject);

    PageSummary empty;
    CHECK(to_json(empty, PageSelection::Colored) ==
          R"({"NumPages":0,"Width":0,"Height":0,"ColorPages":[]})");
    CHECK(to_json(empty, PageSelection::Marked) ==
          R"({"NumPages":0,"Width":0,"Height":0,"MarkedPages":[]})");
    return 0;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_operands();
    failures += test_comments_and_dicts();
    failures += test_inline_image();
    failures += test_parse_errors();
    failures += test_writer();
    failures += test_stream_objects();
    failures += test_page_summary();
    if(failures) {
        fprintf(stderr, "%d parser tests failed.\n", failures);
    }
    return failures ? 1 : 0;
}
