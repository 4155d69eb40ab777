// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <function.hpp>

#include <array>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chromapdf::internal {

class LimitDouble {
public:
    LimitDouble() : value(minval) {}

    // No "explicit" because we want the following to work for convenience:
    // DeviceRGBColor{0.0, 0.3, 1.0}
    LimitDouble(double new_val) : value(new_val) { clamp(); }

    double v() const { return value; }

    LimitDouble &operator=(double d) {
        value = d;
        clamp();
        return *this;
    }

private:
    constexpr static double maxval = 1.0;
    constexpr static double minval = 0.0;

    void clamp() {
        if(std::isnan(value)) {
            value = minval;
        } else if(value < minval) {
            value = minval;
        } else if(value > maxval) {
            value = maxval;
        }
    }

    double value;
};

struct DeviceGrayColor {
    LimitDouble v;
};

struct DeviceRGBColor {
    LimitDouble r;
    LimitDouble g;
    LimitDouble b;
};

struct DeviceCMYKColor {
    LimitDouble c;
    LimitDouble m;
    LimitDouble y;
    LimitDouble k;
};

// L is in [0, 100], a and b are bounded by the colorspace's Range.
struct LabColor {
    double l;
    double a;
    double b;
};

struct CalRGBColor {
    LimitDouble a;
    LimitDouble b;
    LimitDouble c;
};

struct CalGrayColor {
    LimitDouble v;
};

typedef std::variant<DeviceGrayColor,
                     DeviceRGBColor,
                     DeviceCMYKColor,
                     LabColor,
                     CalRGBColor,
                     CalGrayColor>
    SolidColor;

// An empty name means no pattern has been selected yet.
struct PatternColor {
    std::string name;
    std::optional<SolidColor> underlying;
};

typedef std::variant<DeviceGrayColor,
                     DeviceRGBColor,
                     DeviceCMYKColor,
                     LabColor,
                     CalRGBColor,
                     CalGrayColor,
                     PatternColor>
    Color;

struct Colorspace;

struct DeviceGraySpace {};

struct DeviceRGBSpace {};

struct DeviceCMYKSpace {};

struct CalGraySpace {
    std::array<double, 3> whitepoint{0.9505, 1.0, 1.089};
    std::array<double, 3> blackpoint{0, 0, 0};
    double gamma = 1.0;
};

struct CalRGBSpace {
    std::array<double, 3> whitepoint{0.9505, 1.0, 1.089};
    std::array<double, 3> blackpoint{0, 0, 0};
    std::array<double, 3> gamma{1.0, 1.0, 1.0};
    std::array<double, 9> matrix{1, 0, 0, 0, 1, 0, 0, 0, 1};
};

struct LabSpace {
    std::array<double, 3> whitepoint{0.9505, 1.0, 1.089};
    std::array<double, 3> blackpoint{0, 0, 0};
    // amin amax bmin bmax
    std::array<double, 4> range{-100, 100, -100, 100};
};

struct IndexedSpace {
    std::shared_ptr<const Colorspace> base;
    int32_t hival = 0;
    // hival+1 entries of base-space components, one byte each.
    std::string lookup;
};

// A null underlying space means a colored pattern.
struct PatternSpace {
    std::shared_ptr<const Colorspace> underlying;
};

struct DeviceNSpace {
    std::vector<std::string> colorants;
    std::shared_ptr<const Colorspace> alternate;
    PdfFunction tint_transform;
};

struct Colorspace {
    std::variant<DeviceGraySpace,
                 DeviceRGBSpace,
                 DeviceCMYKSpace,
                 CalGraySpace,
                 CalRGBSpace,
                 LabSpace,
                 IndexedSpace,
                 PatternSpace,
                 DeviceNSpace>
        v;
};

} // namespace chromapdf::internal
