// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <pdfcommon.hpp>

#include <array>
#include <map>
#include <span>
#include <string>
#include <vector>

// To avoid pulling all of LittleCMS in this file.
typedef void *cmsHPROFILE;
typedef void *cmsHTRANSFORM;

namespace chromapdf::internal {

struct LcmsHolder {
    cmsHPROFILE h;

    LcmsHolder() : h(nullptr) {}
    explicit LcmsHolder(cmsHPROFILE h) : h(h) {}
    LcmsHolder(LcmsHolder &&o) : h(o.h) { o.h = nullptr; }
    ~LcmsHolder();
    void deallocate();

    LcmsHolder &operator=(const LcmsHolder &) = delete;
    LcmsHolder &operator=(LcmsHolder &&o) {
        if(this == &o) {
            return *this;
        }
        deallocate();
        h = o.h;
        o.h = nullptr;
        return *this;
    }
};

struct LcmsTransformHolder {
    cmsHTRANSFORM h;

    LcmsTransformHolder() : h(nullptr) {}
    explicit LcmsTransformHolder(cmsHTRANSFORM h) : h(h) {}
    LcmsTransformHolder(LcmsTransformHolder &&o) : h(o.h) { o.h = nullptr; }
    ~LcmsTransformHolder();
    void deallocate();

    LcmsTransformHolder &operator=(const LcmsTransformHolder &) = delete;
    LcmsTransformHolder &operator=(LcmsTransformHolder &&o) {
        if(this == &o) {
            return *this;
        }
        deallocate();
        h = o.h;
        o.h = nullptr;
        return *this;
    }
};

// Converts the CIE based colorspaces into the output RGB space. The device
// spaces use fixed formulas and do not go through here.
class ColorConverter {
public:
    static rvoe<ColorConverter> construct(const std::string &rgb_profile_fname = {});

    ColorConverter(ColorConverter &&o) noexcept = default;
    ~ColorConverter();

    // Interleaved L*a*b* triplets in, interleaved RGB triplets in [0, 1] out.
    rvoe<std::vector<double>> lab_to_rgb(std::span<const double> lab, const LabSpace &cs) const;

    // Interleaved XYZ triplets in, interleaved RGB triplets in [0, 1] out.
    rvoe<std::vector<double>> xyz_to_rgb(std::span<const double> xyz) const;

    rvoe<DeviceRGBColor> to_rgb(const LabColor &lab, const LabSpace &cs) const;
    rvoe<DeviceRGBColor> to_rgb(const CalRGBColor &color, const CalRGBSpace &cs) const;

    ColorConverter &operator=(ColorConverter &&o) noexcept = default;

    size_t num_lab_transforms() const { return lab_transforms.size(); }

private:
    ColorConverter() noexcept;

    rvoe<cmsHTRANSFORM> lab_transform(const std::array<double, 3> &whitepoint) const;

    rvoe<std::vector<double>> transform_to_rgb(cmsHTRANSFORM transform,
                                               std::span<const double> values) const;

    LcmsHolder rgb_profile;
    LcmsTransformHolder xyz_transform;
    // One per Lab whitepoint, created on first use.
    mutable std::map<std::array<double, 3>, LcmsTransformHolder> lab_transforms;
    std::string rgb_profile_data;
};

} // namespace chromapdf::internal
