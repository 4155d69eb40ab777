// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include "testhelpers.hpp"

#include <contentwriter.hpp>
#include <grayscale.hpp>
#include <imagecodec.hpp>
#include <utils.hpp>

using namespace chromapdf::internal;

namespace {

double number_at(const Operator &op, size_t i) {
    if(i >= op.operands.size()) {
        return -1;
    }
    return as_number(op.operands[i]).value_or(-1);
}

TilingPattern tiling(const char *content, bool colored) {
    TilingPattern tp;
    tp.content = parse_or_die(content);
    tp.colored = colored;
    return tp;
}

ImageXObject rgb_image(std::string data) {
    ImageXObject image;
    image.width = 2;
    image.height = 1;
    image.colorspace = Colorspace{DeviceRGBSpace{}};
    image.data = std::move(data);
    return image;
}

// Green and white pixels.
const std::string rgb_pixels("\x00\xff\x00\xff\xff\xff", 6);
const std::string gray_pixels("\x96\xff", 2);

int test_device_operators(const GrayscaleTransformer &gt) {
    ResourceDictionary res;
    CHECK_OK(red, gt.to_grayscale(parse_or_die("1 0 0 RG 10 10 100 100 re f"), res));
    CHECK(red.size() == 3);
    CHECK(red[0].name == "G");
    CHECK(red[0].operands.size() == 1);
    CHECK(close_to(number_at(red[0], 0), 0.3));
    CHECK(serialize(red) == "0.3 G\n10 10 100 100 re\nf\n");

    CHECK_OK(blue, gt.to_grayscale(parse_or_die("q 0 0 1 RG 10 10 100 100 re S Q"), res));
    CHECK(blue.size() == 5);
    CHECK(blue[1].name == "G");
    CHECK(close_to(number_at(blue[1], 0), 0.11));

    CHECK_OK(fills, gt.to_grayscale(parse_or_die("0 1 0 rg 1 0 0 0 k 0 0 0 1 k 0.25 g"), res));
    CHECK(fills.size() == 4);
    CHECK(fills[0].name == "g" && close_to(number_at(fills[0], 0), 0.59));
    CHECK(fills[1].name == "g" && close_to(number_at(fills[1], 0), 0.7));
    CHECK(fills[2].name == "g" && close_to(number_at(fills[2], 0), 0.0));
    CHECK(fills[3].name == "g" && close_to(number_at(fills[3], 0), 0.25));
    return 0;
}

int test_colorspace_operators(const GrayscaleTransformer &gt) {
    ResourceDictionary res;
    CHECK_OK(val, parse_object("[/Indexed /DeviceRGB 1 <000000FF0000>]"));
    CHECK_OK(indexed, parse_colorspace(val, &res));
    res.set_colorspace("CS0", indexed);
    CHECK_OK(out,
             gt.to_grayscale(parse_or_die("/DeviceRGB CS 0 1 0 SC /CS0 cs 1 sc 0 0 1 1 re B"),
                             res));
    CHECK(out.size() == 6);
    CHECK(out[0].name == "CS");
    CHECK(as_name(out[0].operands[0])->name == "DeviceGray");
    CHECK(out[1].name == "SC" && close_to(number_at(out[1], 0), 0.59));
    CHECK(as_name(out[2].operands[0])->name == "DeviceGray");
    CHECK(out[3].name == "sc" && out[3].operands.size() == 1);
    CHECK(close_to(number_at(out[3], 0), 0.3));
    // The resource itself is left alone.
    CHECK(std::holds_alternative<IndexedSpace>(res.get_colorspace("CS0")->v));
    return 0;
}

int test_patterns(const GrayscaleTransformer &gt) {
    CountingResolver res;
    res.set_pattern("P0", tiling("1 0 0 rg 0 0 1 1 re f", true));
    const char *stream = "/Pattern cs /P0 scn 0 0 10 10 re f /P0 scn 20 20 5 5 re f";
    CHECK_OK(out, gt.to_grayscale(parse_or_die(stream), res));
    CHECK(out.size() == 7);
    CHECK(res.pattern_lookups == 1);
    CHECK(out[0].name == "cs" && as_name(out[0].operands[0])->name == "Pattern");
    CHECK(out[1].operands.size() == 1 && as_name(out[1].operands[0])->name == "P0");
    const auto converted = res.ResourceDictionary::get_pattern("P0");
    CHECK(converted);
    const auto &content = std::get<TilingPattern>(*converted).content;
    CHECK(content[0].name == "g");
    CHECK(close_to(number_at(content[0], 0), 0.3));

    res.set_pattern("P2", ShadingPattern{Shading{Colorspace{DeviceCMYKSpace{}}, {}}, {}});
    CHECK_OK(shaded, gt.to_grayscale(parse_or_die("/Pattern CS /P2 SCN 0 0 m 1 1 l S"), res));
    CHECK(shaded.size() == 5);
    const auto shading_pattern = res.ResourceDictionary::get_pattern("P2");
    auto &sp = std::get<ShadingPattern>(*shading_pattern);
    auto *devn = std::get_if<DeviceNSpace>(&sp.shading.colorspace.v);
    CHECK(devn);
    CHECK(devn->colorants.size() == 4);

    CHECK_ERROR(gt.to_grayscale(parse_or_die("/Pattern cs /Missing scn"), res), UndefinedPattern);
    return 0;
}

int test_uncolored_pattern(const GrayscaleTransformer &gt) {
    ResourceDictionary res;
    res.set_colorspace("CS0",
                       Colorspace{PatternSpace{std::make_shared<const Colorspace>(
                           Colorspace{DeviceRGBSpace{}})}});
    res.set_pattern("P1", tiling("0 0 10 10 re f", false));
    const char *stream = "/CS0 cs 1 0 0 /P1 scn 0 0 10 10 re f /CS0 cs 0 0 1 /P1 scn f";
    CHECK_OK(out, gt.to_grayscale(parse_or_die(stream), res));
    CHECK(out.size() == 7);
    CHECK(as_name(out[0].operands[0])->name == "CS0");
    CHECK(out[1].operands.size() == 2);
    CHECK(close_to(number_at(out[1], 0), 0.3));
    CHECK(as_name(out[1].operands[1])->name == "P1");
    CHECK(out[5].operands.size() == 2);
    CHECK(close_to(number_at(out[5], 0), 0.11));
    // The underlying space turns gray once the whole stream is done.
    auto cs = res.get_colorspace("CS0");
    auto *pattern = std::get_if<PatternSpace>(&cs->v);
    CHECK(pattern && pattern->underlying);
    CHECK(std::holds_alternative<DeviceGraySpace>(pattern->underlying->v));
    // Uncolored patterns keep their content.
    auto p1 = res.get_pattern("P1");
    CHECK(std::get<TilingPattern>(*p1).content.size() == 2);
    // Running again over the converted resources takes the gray operands.
    CHECK_OK(again, gt.to_grayscale(out, res));
    CHECK(again.size() == 7);
    return 0;
}

int test_shadings(const GrayscaleTransformer &gt) {
    CountingResolver res;
    res.set_shading("Sh0", Shading{Colorspace{DeviceRGBSpace{}}, {}});
    res.set_shading("Sh1", Shading{Colorspace{DeviceGraySpace{}}, {}});
    CHECK_OK(out, gt.to_grayscale(parse_or_die("/Sh0 sh q /Sh0 sh Q /Sh1 sh"), res));
    CHECK(out.size() == 5);
    CHECK(out[0].name == "sh" && as_name(out[0].operands[0])->name == "Sh0");
    CHECK(res.shading_lookups == 2);
    auto sh0 = res.ResourceDictionary::get_shading("Sh0");
    auto *devn = std::get_if<DeviceNSpace>(&sh0->colorspace.v);
    CHECK(devn && devn->colorants.size() == 3);
    CHECK_OK(white, evaluate_function(devn->tint_transform, {1.0, 1.0, 1.0}));
    CHECK(close_to(white[0], 1.0));
    auto sh1 = res.ResourceDictionary::get_shading("Sh1");
    CHECK(std::holds_alternative<DeviceGraySpace>(sh1->colorspace.v));
    CHECK_ERROR(gt.to_grayscale(parse_or_die("/Missing sh"), res), UndefinedShading);
    return 0;
}

int test_image_xobjects(const GrayscaleTransformer &gt) {
    CountingResolver res;
    res.set_xobject("Raw", rgb_image(rgb_pixels));

    auto flate = rgb_image("");
    CHECK_OK(compressed, flate_compress(rgb_pixels));
    flate.data = compressed;
    flate.filters.push_back("FlateDecode");
    flate.decode_parms.emplace_back();
    res.set_xobject("Fl", flate);

    // A filter chain can not be reencoded as is.
    auto chain = rgb_image(ascii_hex_encode(compressed));
    chain.filters = {"ASCIIHexDecode", "FlateDecode"};
    chain.decode_parms = {PdfDict{}, PdfDict{}};
    res.set_xobject("Chain", chain);

    auto masked = rgb_image(run_length_encode(rgb_pixels));
    masked.filters.push_back("RunLengthDecode");
    masked.decode_parms.emplace_back();
    masked.smask = PdfStream{};
    res.set_xobject("Masked", masked);

    CHECK_OK(out, gt.to_grayscale(parse_or_die("/Raw Do /Fl Do /Chain Do /Masked Do /Raw Do"), res));
    CHECK(out.size() == 5);
    CHECK(res.xobject_lookups == 4);

    auto raw = std::get<ImageXObject>(*res.ResourceDictionary::get_xobject("Raw"));
    CHECK(raw.colorspace && std::holds_alternative<DeviceGraySpace>(raw.colorspace->v));
    CHECK(raw.bits_per_component == 8);
    CHECK(raw.filters.empty());
    CHECK(raw.data == gray_pixels);

    auto fl = std::get<ImageXObject>(*res.ResourceDictionary::get_xobject("Fl"));
    CHECK(fl.filters.size() == 1 && fl.filters[0] == "FlateDecode");
    CHECK_OK(inflated, flate_decompress(fl.data));
    CHECK(inflated == gray_pixels);

    auto ch = std::get<ImageXObject>(*res.ResourceDictionary::get_xobject("Chain"));
    CHECK(ch.filters.size() == 1 && ch.filters[0] == "FlateDecode");
    CHECK_OK(chain_inflated, flate_decompress(ch.data));
    CHECK(chain_inflated == gray_pixels);

    auto mk = std::get<ImageXObject>(*res.ResourceDictionary::get_xobject("Masked"));
    CHECK(std::holds_alternative<DeviceRGBSpace>(mk.colorspace->v));
    return 0;
}

int test_inline_images(const GrayscaleTransformer &gt) {
    ResourceDictionary res;
    CHECK_OK(out,
             gt.to_grayscale(
                 parse_or_die("BI /W 2 /H 1 /CS /RGB /BPC 8 /F /AHx ID 00FF00FFFFFF> EI"), res));
    CHECK(out.size() == 1);
    auto *ii = as_inline_image(out[0].operands[0]);
    CHECK(ii);
    CHECK(as_name(*dict_get(ii->params, "ColorSpace", "CS"))->name == "G");
    CHECK(as_name(*dict_get(ii->params, "Filter", "F"))->name == "AHx");
    CHECK(ii->data == "96FF>");

    CHECK_OK(already_gray,
             gt.to_grayscale(parse_or_die("BI /W 2 /H 1 /CS /G /BPC 8 /F /AHx ID 80FF> EI"), res));
    CHECK(as_inline_image(already_gray[0].operands[0])->data == "80FF>");
    return 0;
}

int test_images_disabled() {
    GrayscaleOptions opts;
    opts.convert_images = false;
    CHECK_OK(gt, GrayscaleTransformer::construct(opts));
    ResourceDictionary res;
    res.set_xobject("Raw", rgb_image(rgb_pixels));
    CHECK_OK(out, gt.to_grayscale(parse_or_die("/Raw Do 1 0 0 rg"), res));
    CHECK(out[1].name == "g");
    auto raw = std::get<ImageXObject>(*res.get_xobject("Raw"));
    CHECK(raw.data == rgb_pixels);
    return 0;
}

int test_forms(const GrayscaleTransformer &gt) {
    auto page = std::make_shared<ResourceDictionary>();
    auto form_res = std::make_shared<ResourceDictionary>(page);
    page->set_shading("Sh0", Shading{Colorspace{DeviceRGBSpace{}}, {}});
    FormXObject form;
    form.content = parse_or_die("0 0 1 rg 0 0 1 1 re f /Sh0 sh");
    form.resources = form_res;
    page->set_xobject("Fm0", form);
    CHECK_OK(out, gt.to_grayscale(parse_or_die("/Fm0 Do /Fm0 Do"), *page));
    CHECK(serialize(out) == "/Fm0 Do\n/Fm0 Do\n");
    auto converted = std::get<FormXObject>(*page->get_xobject("Fm0"));
    CHECK(converted.content.size() == 4);
    CHECK(converted.content[0].name == "g");
    CHECK(close_to(number_at(converted.content[0], 0), 0.11));
    CHECK(converted.resources == form_res);
    // Set through the form scope, stored where it is defined.
    CHECK(std::holds_alternative<DeviceNSpace>(page->get_shading("Sh0")->colorspace.v));
    CHECK(form_res->shadings().empty());
    return 0;
}

} // namespace

int main() {
    auto gt = GrayscaleTransformer::construct();
    if(!gt) {
        fprintf(stderr, "Could not create transformer: %s\n", error_text(gt.error()));
        return 1;
    }
    int failures = 0;
    failures += test_device_operators(*gt);
    failures += test_colorspace_operators(*gt);
    failures += test_patterns(*gt);
    failures += test_uncolored_pattern(*gt);
    failures += test_shadings(*gt);
    failures += test_image_xobjects(*gt);
    failures += test_inline_images(*gt);
    failures += test_images_disabled();
    failures += test_forms(*gt);
    if(failures) {
        fprintf(stderr, "%d grayscale tests failed.\n", failures);
    }
    return failures ? 1 : 0;
}
