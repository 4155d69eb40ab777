// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <colorconverter.hpp>
#include <errorhandling.hpp>
#include <pdfcommon.hpp>

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace chromapdf::internal {

// Smallest color component difference visible on a typical mid-range color laser printer.
constexpr double COLOR_TOLERANCE = 3.1 / 255.0;

// Additive channels at or above this are indistinguishable from white paper.
constexpr double ADDITIVE_ZERO = 1.0 - COLOR_TOLERANCE;

// For a Pattern space this is the count of its underlying space, 0 for colored patterns.
int32_t num_components(const Colorspace &cs);

Color initial_color(const Colorspace &cs);

Color to_color(const SolidColor &c);

// Empty for pattern colors.
std::optional<SolidColor> as_solid(const Color &c);

bool is_pattern_space(const Colorspace &cs);

// Components of a non-Pattern space into a color. Indexed colors resolve to their
// base space and DeviceN colors to their alternate space.
rvoe<SolidColor> color_from_components(const Colorspace &cs, const std::vector<double> &comps);

// Operands of SC/SCN/sc/scn in a Pattern space: optional components and a name.
rvoe<PatternColor> pattern_color_from_components(const PatternSpace &cs,
                                                 const std::vector<double> &comps,
                                                 std::string name);

// The colorspace gives the parameters of CIE based colors and can be any space
// that contains the color's own space.
rvoe<DeviceRGBColor>
to_rgb(const SolidColor &c, const Colorspace &cs, const ColorConverter &conv);

DeviceRGBColor cmyk_to_rgb(const DeviceCMYKColor &cmyk);

DeviceGrayColor rgb_to_gray(const DeviceRGBColor &rgb);

rvoe<DeviceGrayColor>
to_gray(const SolidColor &c, const Colorspace &cs, const ColorConverter &conv);

bool is_rgb_colored(double r, double g, double b);

// Hue check. Gray values are never colored.
bool is_colored(const Color &c);

// Ink check. Additive spaces are visible when darker than paper, CMYK when any ink is present.
bool is_visible_mark(const Color &c);

bool visible_additive(std::initializer_list<double> components);

bool visible_subtractive(std::initializer_list<double> components);

std::string color_to_string(const Color &c);

} // namespace chromapdf::internal
