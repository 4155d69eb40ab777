// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <chromapdf.hpp>
#include <stdio.h>
#include <string>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        fprintf(stderr, "%s:%d: check failed: %s\n", __FILE__, __LINE__, #cond);                   \
        return 1;                                                                                  \
    }

namespace {

int test_detection() {
    chromapdf::Analyzer analyzer;
    chromapdf::Resources res;
    res.add_colorspace("CS0", "[/Indexed /DeviceRGB 1 <FF0000808080>]");
    res.add_image("Im0", 2, 1, "/DeviceRGB", 8, "", std::string("\xff\x00\x00\x00\x00\xff", 6));
    res.add_image("Im1", 2, 1, "/DeviceRGB", 8, "", std::string("\x10\x10\x10\xf0\xf0\xf0", 6));

    CHECK(!analyzer.is_colored("0.5 g 0 0 10 10 re f", res));
    CHECK(analyzer.is_colored("1 0 0 RG 0 0 m 10 10 l S", res));
    CHECK(analyzer.is_colored("/CS0 cs 0 sc 0 0 1 1 re f", res));
    CHECK(!analyzer.is_colored("/CS0 cs 1 sc 0 0 1 1 re f", res));
    CHECK(analyzer.is_colored("q 2 0 0 1 0 0 cm /Im0 Do Q", res));
    CHECK(!analyzer.is_colored("/Im1 Do", res));

    CHECK(!analyzer.is_marked("1 g 0 0 1 1 re f", res));
    CHECK(analyzer.is_marked("BT /F1 12 Tf (Hi) Tj ET", res));
    CHECK(!analyzer.is_marked("1 1 1 rg BT (Hi) Tj ET", res));
    CHECK(!analyzer.is_marked("BT (   ) Tj ET", res));
    CHECK(analyzer.is_marked("/Im1 Do", res));
    return 0;
}

int test_conversion() {
    chromapdf::Analyzer analyzer;
    chromapdf::Resources page;
    chromapdf::Resources form_res(&page);
    page.add_form("Fm0", "1 0 0 rg 0 0 1 1 re f", &form_res);
    page.add_image("Im0", 2, 1, "/DeviceRGB", 8, "", std::string("\xff\x00\x00\x00\x00\xff", 6));

    const auto gray = analyzer.to_grayscale("0 0 1 RG /Fm0 Do /Im0 Do", page);
    CHECK(gray == "0.11 G\n/Fm0 Do\n/Im0 Do\n");
    CHECK(page.form_content("Fm0") == "0.3 g\n0 0 1 1 re\nf\n");
    CHECK(page.image_components("Im0") == 1);
    CHECK(!analyzer.is_colored(gray, page));

    page.add_image_object("Im1",
                          "<< /Width 2 /Height 1 /ColorSpace /DeviceRGB /BitsPerComponent 8\n"
                          "/Filter /ASCIIHexDecode /Interpolate true >>\n"
                          "stream\nFF00000000FF>\nendstream");
    CHECK(analyzer.is_colored("/Im1 Do", page));
    CHECK(analyzer.to_grayscale("/Im1 Do", page) == "/Im1 Do\n");
    CHECK(page.image_components("Im1") == 1);
    CHECK(!analyzer.is_colored("/Im1 Do", page));

    chromapdf::Options opts;
    opts.convert_images = false;
    chromapdf::Analyzer keep_images(opts);
    chromapdf::Resources other;
    other.add_image("Im0", 2, 1, "/DeviceRGB", 8, "", std::string("\xff\x00\x00\x00\x00\xff", 6));
    CHECK(keep_images.to_grayscale("/Im0 Do", other) == "/Im0 Do\n");
    CHECK(other.image_components("Im0") == 3);
    return 0;
}

int test_pages() {
    chromapdf::Analyzer analyzer;
    std::vector<chromapdf::PageInput> pages(2);
    pages[0].width = 595.276;
    pages[0].height = 841.89;
    pages[0].content = "0 g 0 0 1 1 re f";
    pages[1].content = "0 0 1 rg 0 0 1 1 re f";
    CHECK(analyzer.describe_pages(pages, false) ==
          R"({"NumPages":2,"Width":215.9,"Height":297,"ColorPages":[2]})");
    CHECK(analyzer.describe_pages(pages, true) ==
          R"({"NumPages":2,"Width":215.9,"Height":297,"MarkedPages":[1,2]})");
    return 0;
}

int test_errors() {
    chromapdf::Analyzer analyzer;
    chromapdf::Resources res;
    bool thrown = false;
    try {
        analyzer.is_colored("/Nope sh", res);
    } catch(const chromapdf::PdfException &) {
        thrown = true;
    }
    CHECK(thrown);

    thrown = false;
    try {
        analyzer.to_grayscale("1 0 0 rg (unterminated", res);
    } catch(const chromapdf::PdfException &) {
        thrown = true;
    }
    CHECK(thrown);

    thrown = false;
    try {
        res.add_colorspace("Bad", "[/Indexed /DeviceRGB]");
    } catch(const chromapdf::PdfException &) {
        thrown = true;
    }
    CHECK(thrown);
    return 0;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_detection();
    failures += test_conversion();
    failures += test_pages();
    failures += test_errors();
    if(failures) {
        fprintf(stderr, "%d API tests failed.\n", failures);
    }
    return failures ? 1 : 0;
}
