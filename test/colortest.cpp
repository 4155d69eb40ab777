// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include "testhelpers.hpp"

#include <colordetector.hpp>
#include <colormodel.hpp>
#include <function.hpp>
#include <grayscale.hpp>

using namespace chromapdf::internal;

namespace {

int test_gray_never_colored() {
    for(double v : {0.0, 0.25, 0.5, 1.0}) {
        CHECK(!is_colored(DeviceGrayColor{v}));
        CHECK(!is_colored(CalGrayColor{v}));
    }
    return 0;
}

int test_rgb_tolerance() {
    CHECK(!is_colored(DeviceRGBColor{0.4, 0.4, 0.4}));
    CHECK(!is_colored(DeviceRGBColor{1.0, 1.0, 1.0}));
    // Both sides of the boundary.
    const double below = COLOR_TOLERANCE - 1e-6;
    const double above = COLOR_TOLERANCE + 1e-6;
    CHECK(!is_colored(DeviceRGBColor{0.5, 0.5 + below, 0.5}));
    CHECK(is_colored(DeviceRGBColor{0.5, 0.5 + above, 0.5}));
    CHECK(!is_colored(DeviceRGBColor{0.5, 0.5, 0.5 - below}));
    CHECK(is_colored(DeviceRGBColor{0.5 - above, 0.5, 0.5}));
    CHECK(is_colored(DeviceRGBColor{1.0, 0.0, 0.0}));
    CHECK(is_colored(CalRGBColor{0.0, 0.0, 1.0}));
    CHECK(!is_colored(CalRGBColor{0.3, 0.3, 0.3}));
    return 0;
}

int test_cmyk() {
    CHECK(!is_colored(DeviceCMYKColor{0.0, 0.0, 0.0, 1.0}));
    CHECK(!is_colored(DeviceCMYKColor{0.0, 0.0, 0.0, 0.3}));
    CHECK(!is_colored(DeviceCMYKColor{0.2, 0.2, 0.2, 0.0}));
    CHECK(is_colored(DeviceCMYKColor{1.0, 0.0, 0.0, 0.0}));
    const auto rgb = cmyk_to_rgb(DeviceCMYKColor{0.5, 0.0, 0.0, 0.5});
    CHECK(close_to(rgb.r.v(), 0.25));
    CHECK(close_to(rgb.g.v(), 0.5));
    CHECK(close_to(rgb.b.v(), 0.5));
    return 0;
}

int test_lab() {
    // Lightness alone is not a color.
    CHECK(!is_colored(LabColor{50.0, 0.0, 0.0}));
    CHECK(!is_colored(LabColor{100.0, 0.001, -0.001}));
    CHECK(is_colored(LabColor{50.0, 20.0, 0.0}));
    CHECK(is_colored(LabColor{50.0, 0.0, -20.0}));
    // The ink check only looks at lightness.
    CHECK(is_visible_mark(LabColor{50.0, 0.0, 0.0}));
    CHECK(!is_visible_mark(LabColor{100.0, 80.0, 80.0}));
    return 0;
}

int test_visibility() {
    CHECK(is_visible_mark(DeviceGrayColor{0.0}));
    CHECK(!is_visible_mark(DeviceGrayColor{1.0}));
    CHECK(!is_visible_mark(DeviceRGBColor{1.0, 1.0, 1.0}));
    CHECK(is_visible_mark(DeviceRGBColor{1.0, 1.0, 0.9}));
    CHECK(!is_visible_mark(DeviceCMYKColor{0.0, 0.0, 0.0, 0.0}));
    CHECK(is_visible_mark(DeviceCMYKColor{0.0, 0.0, 0.0, 0.1}));
    CHECK(visible_additive({0.5}));
    CHECK(!visible_additive({1.0, 0.999}));
    CHECK(visible_subtractive({0.0, 0.02}));
    CHECK(!visible_subtractive({0.0, 0.01}));
    return 0;
}

int test_gray_round_trip() {
    for(double v : {0.0, 0.1, 0.5, 0.77, 1.0}) {
        CHECK(close_to(rgb_to_gray(DeviceRGBColor{v, v, v}).v.v(), v));
    }
    CHECK(close_to(rgb_to_gray(DeviceRGBColor{1.0, 0.0, 0.0}).v.v(), 0.3));
    CHECK(close_to(rgb_to_gray(DeviceRGBColor{0.0, 1.0, 0.0}).v.v(), 0.59));
    CHECK(close_to(rgb_to_gray(DeviceRGBColor{0.0, 0.0, 1.0}).v.v(), 0.11));
    return 0;
}

int test_indexed_and_separation() {
    CHECK_OK(conv, ColorConverter::construct());
    ResourceDictionary res;
    CHECK_OK(indexed_val, parse_object("[/Indexed /DeviceRGB 1 <808080FF0000>]"));
    CHECK_OK(indexed, parse_colorspace(indexed_val, &res));
    CHECK(num_components(indexed) == 1);
    CHECK_OK(first, color_from_components(indexed, {0}));
    CHECK(!is_colored(to_color(first)));
    CHECK_OK(second, color_from_components(indexed, {1}));
    CHECK(is_colored(to_color(second)));
    CHECK_OK(gray, to_gray(second, indexed, conv));
    CHECK(close_to(gray.v.v(), 0.3));
    CHECK_ERROR(color_from_components(indexed, {0, 1}), WrongOperandCount);

    CHECK_OK(sep_val,
             parse_object("[/Separation /Spot /DeviceCMYK << /FunctionType 2 /Domain [0 1] "
                          "/C0 [0 0 0 0] /C1 [0 1 0 0] /N 1 >>]"));
    CHECK_OK(sep, parse_colorspace(sep_val, &res));
    CHECK(num_components(sep) == 1);
    CHECK_OK(tint, color_from_components(sep, {1.0}));
    CHECK(is_colored(to_color(tint)));
    CHECK_OK(none, color_from_components(sep, {0.0}));
    CHECK(!is_colored(to_color(none)));
    return 0;
}

int test_type4_tint_stream() {
    ResourceDictionary res;
    CHECK_OK(sep_val,
             parse_object("[/Separation /Spot /DeviceRGB\n"
                          "<< /FunctionType 4 /Domain [0 1] /Range [0 1 0 1 0 1] /Length 14 >>\n"
                          "stream\n{ dup 0 exch }\nendstream\n]"));
    auto *arr = as_array(sep_val);
    CHECK(arr && arr->size() == 4);
    auto *stream = as_stream((*arr)[3]);
    CHECK(stream);
    CHECK(stream->data == "{ dup 0 exch }");
    CHECK_OK(sep, parse_colorspace(sep_val, &res));
    CHECK_OK(magenta, color_from_components(sep, {1.0}));
    CHECK(is_colored(to_color(magenta)));
    CHECK_OK(none, color_from_components(sep, {0.0}));
    CHECK(!is_colored(to_color(none)));

    // Without the program a type 4 tint can not be built.
    CHECK_OK(bare_val,
             parse_object("[/Separation /Spot /DeviceRGB << /FunctionType 4 /Domain [0 1] "
                          "/Range [0 1 0 1 0 1] >>]"));
    CHECK_ERROR(parse_colorspace(bare_val, &res), UnsupportedFunction);
    return 0;
}

int test_cie_conversion() {
    CHECK_OK(conv, ColorConverter::construct());
    // Lab white maps to white.
    CHECK_OK(white, conv.to_rgb(LabColor{100.0, 0.0, 0.0}, LabSpace{}));
    CHECK(white.r.v() > 0.95 && white.g.v() > 0.95 && white.b.v() > 0.95);
    CHECK_OK(red, conv.to_rgb(LabColor{50.0, 70.0, 50.0}, LabSpace{}));
    CHECK(is_rgb_colored(red.r.v(), red.g.v(), red.b.v()));
    CHECK(red.r.v() > red.g.v());
    CalGraySpace calgray;
    calgray.gamma = 2.0;
    CHECK_OK(cg, to_rgb(CalGrayColor{0.5}, Colorspace{calgray}, conv));
    CHECK(close_to(cg.r.v(), 0.25));
    return 0;
}

int test_lab_transform_reuse() {
    CHECK_OK(conv, ColorConverter::construct());
    CHECK(conv.num_lab_transforms() == 0);
    CHECK_OK(first, conv.to_rgb(LabColor{50.0, 70.0, 50.0}, LabSpace{}));
    CHECK_OK(second, conv.to_rgb(LabColor{50.0, 70.0, 50.0}, LabSpace{}));
    CHECK(conv.num_lab_transforms() == 1);
    CHECK(close_to(first.r.v(), second.r.v()));
    CHECK(close_to(first.g.v(), second.g.v()));
    CHECK(close_to(first.b.v(), second.b.v()));
    const double pixels[6] = {100.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    CHECK_OK(rgb, conv.lab_to_rgb(pixels, LabSpace{}));
    CHECK(rgb.size() == 6);
    CHECK(conv.num_lab_transforms() == 1);

    LabSpace d50;
    d50.whitepoint = {0.9642, 1.0, 0.8249};
    CHECK_OK(warm, conv.to_rgb(LabColor{50.0, 70.0, 50.0}, d50));
    CHECK(is_rgb_colored(warm.r.v(), warm.g.v(), warm.b.v()));
    CHECK(conv.num_lab_transforms() == 2);

    auto moved = std::move(conv);
    CHECK(moved.num_lab_transforms() == 2);
    CHECK_OK(again, moved.to_rgb(LabColor{50.0, 70.0, 50.0}, LabSpace{}));
    CHECK(close_to(again.r.v(), first.r.v()));
    return 0;
}

int test_shading_components() {
    CHECK_OK(gray, is_shading_colored(Shading{Colorspace{DeviceGraySpace{}}, {}}));
    CHECK(!gray);
    CHECK_OK(rgb, is_shading_colored(Shading{Colorspace{DeviceRGBSpace{}}, {}}));
    CHECK(rgb);
    CHECK_OK(cmyk, is_shading_colored(Shading{Colorspace{DeviceCMYKSpace{}}, {}}));
    CHECK(cmyk);
    DeviceNSpace two;
    two.colorants = {"A", "B"};
    two.alternate = std::make_shared<const Colorspace>(Colorspace{DeviceGraySpace{}});
    CHECK_ERROR(is_shading_colored(Shading{Colorspace{two}, {}}), UnsupportedColorspace);
    DeviceNSpace five = two;
    five.colorants = {"A", "B", "C", "D", "E"};
    CHECK_ERROR(is_shading_colored(Shading{Colorspace{five}, {}}), UnsupportedColorspace);
    CHECK_ERROR(shading_to_gray(Shading{Colorspace{five}, {}}), UnsupportedColorspace);
    return 0;
}

int test_gray_programs() {
    CHECK_OK(rgb_calc, PostScriptCalculator::compile(rgb_to_gray_program));
    CHECK_OK(red, rgb_calc.execute({1.0, 0.0, 0.0}));
    CHECK(red.size() == 1);
    CHECK(close_to(red[0], 0.3));
    CHECK_OK(mixed, rgb_calc.execute({0.2, 0.4, 0.6}));
    CHECK(close_to(mixed[0], 0.3 * 0.2 + 0.59 * 0.4 + 0.11 * 0.6));

    CHECK_OK(cmyk_calc, PostScriptCalculator::compile(cmyk_to_gray_program));
    CHECK_OK(paper, cmyk_calc.execute({0.0, 0.0, 0.0, 0.0}));
    CHECK(close_to(paper[0], 1.0));
    CHECK_OK(black, cmyk_calc.execute({0.0, 0.0, 0.0, 1.0}));
    CHECK(close_to(black[0], 0.0));
    CHECK_OK(cyan, cmyk_calc.execute({1.0, 0.0, 0.0, 0.0}));
    CHECK(close_to(cyan[0], 0.7));
    // Ink coverage saturates at black.
    CHECK_OK(heavy, cmyk_calc.execute({1.0, 1.0, 1.0, 1.0}));
    CHECK(close_to(heavy[0], 0.0));

    CHECK_OK(shading, shading_to_gray(Shading{Colorspace{DeviceRGBSpace{}}, {}}));
    auto *devn = std::get_if<DeviceNSpace>(&shading.colorspace.v);
    CHECK(devn);
    CHECK(devn->colorants.size() == 3);
    CHECK(std::holds_alternative<DeviceGraySpace>(devn->alternate->v));
    CHECK_OK(green, color_from_components(shading.colorspace, {0.0, 1.0, 0.0}));
    CHECK(close_to(std::get<DeviceGrayColor>(green).v.v(), 0.59));
    CHECK_OK(unchanged, shading_to_gray(Shading{Colorspace{DeviceGraySpace{}}, {}}));
    CHECK(std::holds_alternative<DeviceGraySpace>(unchanged.colorspace.v));
    return 0;
}

int test_postscript_functions() {
    CHECK_OK(ifelse, PostScriptCalculator::compile("{ dup 0.5 gt { pop 1 } { pop 0 } ifelse }"));
    CHECK_OK(hi, ifelse.execute({0.7}));
    CHECK(close_to(hi.back(), 1.0));
    CHECK_OK(lo, ifelse.execute({0.2}));
    CHECK(close_to(lo.back(), 0.0));
    CHECK_OK(trig, PostScriptCalculator::compile("{ 90 sin 3 2 roll pop }"));
    CHECK_OK(trig_out, trig.execute({5.0, 7.0}));
    CHECK(trig_out.size() == 2);
    CHECK(close_to(trig_out[1], 1.0));
    CHECK_OK(underflow, PostScriptCalculator::compile("{ add }"));
    CHECK_ERROR(underflow.execute({}), FunctionStackError);
    CHECK_ERROR(PostScriptCalculator::compile("{ 1 2 frobnicate }"), UnsupportedFunction);
    return 0;
}

int test_postscript_integer_ranges() {
    CHECK_OK(shift, PostScriptCalculator::compile("{ bitshift }"));
    CHECK_OK(wide, shift.execute({1.0, 100.0}));
    CHECK(close_to(wide[0], 0.0));
    CHECK_OK(negative_left, shift.execute({-8.0, 1.0}));
    CHECK(close_to(negative_left[0], -16.0));
    CHECK_OK(negative_right, shift.execute({-8.0, -100.0}));
    CHECK(close_to(negative_right[0], -1.0));
    CHECK_OK(positive_right, shift.execute({8.0, -2.0}));
    CHECK(close_to(positive_right[0], 2.0));
    CHECK_ERROR(shift.execute({1e30, 1.0}), FunctionStackError);
    CHECK_ERROR(shift.execute({std::nan(""), 1.0}), FunctionStackError);

    CHECK_OK(bits, PostScriptCalculator::compile("{ 1 and }"));
    CHECK_ERROR(bits.execute({-1e19}), FunctionStackError);
    CHECK_OK(odd, bits.execute({7.0}));
    CHECK(close_to(odd[0], 1.0));

    CHECK_OK(idiv, PostScriptCalculator::compile("{ -1 idiv }"));
    CHECK_OK(most_negative, idiv.execute({-9223372036854775808.0}));
    CHECK(most_negative[0] > 9.2e18);
    CHECK_OK(copy, PostScriptCalculator::compile("{ copy }"));
    CHECK_ERROR(copy.execute({1.0, 1e300}), FunctionStackError);
    return 0;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_gray_never_colored();
    failures += test_rgb_tolerance();
    failures += test_cmyk();
    failures += test_lab();
    failures += test_visibility();
    failures += test_gray_round_trip();
    failures += test_indexed_and_separation();
    failures += test_type4_tint_stream();
    failures += test_cie_conversion();
    failures += test_lab_transform_reuse();
    failures += test_shading_components();
    failures += test_gray_programs();
    failures += test_postscript_functions();
    failures += test_postscript_integer_ranges();
    if(failures) {
        fprintf(stderr, "%d color tests failed.\n", failures);
    }
    return failures ? 1 : 0;
}
