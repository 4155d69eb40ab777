// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen
// Copyright 2026 The ChromaPDF authors

#include <colorconverter.hpp>
#include <utils.hpp>
#include <lcms2.h>

#include <algorithm>
#include <cmath>

namespace {

void print_lcms_errors(cmsContext /*ContextID*/, cmsUInt32Number ErrorCode, const char *Text) {
    fprintf(stderr, "LCMS error: %d %s\n", (int)ErrorCode, Text);
}

} // namespace

namespace chromapdf::internal {

LcmsHolder::~LcmsHolder() { deallocate(); }

void LcmsHolder::deallocate() {
    if(h) {
        cmsCloseProfile(h);
    }
    h = nullptr;
}

LcmsTransformHolder::~LcmsTransformHolder() { deallocate(); }

void LcmsTransformHolder::deallocate() {
    if(h) {
        cmsDeleteTransform(h);
    }
    h = nullptr;
}

rvoe<ColorConverter> ColorConverter::construct(const std::string &rgb_profile_fname) {
    ColorConverter conv;
    if(!rgb_profile_fname.empty()) {
        ERC(rgb, load_file_as_bytes(rgb_profile_fname.c_str()));
        conv.rgb_profile_data = std::move(rgb);
        cmsHPROFILE h =
            cmsOpenProfileFromMem(conv.rgb_profile_data.data(), conv.rgb_profile_data.size());
        if(!h) {
            RETERR(InvalidICCProfile);
        }
        conv.rgb_profile.h = h;
        auto num_channels = (int32_t)cmsChannelsOf(cmsGetColorSpace(h));
        if(num_channels != 3) {
            fprintf(stderr, "RGB profile does not have exactly 3 channels.\n");
            RETERR(InvalidICCProfile);
        }
    } else {
        conv.rgb_profile.h = cmsCreate_sRGBProfile();
    }
    if(!conv.rgb_profile.h) {
        RETERR(ProfileProblem);
    }
    cmsSetLogErrorHandler(print_lcms_errors);
    LcmsHolder xyz_profile(cmsCreateXYZProfile());
    if(!xyz_profile.h) {
        RETERR(ProfileProblem);
    }
    conv.xyz_transform.h = cmsCreateTransform(xyz_profile.h,
                                              TYPE_XYZ_DBL,
                                              conv.rgb_profile.h,
                                              TYPE_RGB_DBL,
                                              INTENT_RELATIVE_COLORIMETRIC,
                                              0);
    if(!conv.xyz_transform.h) {
        RETERR(ProfileProblem);
    }
    return rvoe<ColorConverter>(std::move(conv));
}

ColorConverter::ColorConverter() noexcept {}

ColorConverter::~ColorConverter() {}

rvoe<cmsHTRANSFORM>
ColorConverter::lab_transform(const std::array<double, 3> &whitepoint) const {
    auto it = lab_transforms.find(whitepoint);
    if(it != lab_transforms.end()) {
        return it->second.h;
    }
    cmsCIEXYZ white_xyz{whitepoint[0], whitepoint[1], whitepoint[2]};
    cmsCIExyY white_xyy;
    cmsXYZ2xyY(&white_xyy, &white_xyz);
    LcmsHolder lab_profile(cmsCreateLab4Profile(&white_xyy));
    if(!lab_profile.h) {
        RETERR(ProfileProblem);
    }
    LcmsTransformHolder transform(cmsCreateTransform(lab_profile.h,
                                                     TYPE_Lab_DBL,
                                                     rgb_profile.h,
                                                     TYPE_RGB_DBL,
                                                     INTENT_RELATIVE_COLORIMETRIC,
                                                     0));
    if(!transform.h) {
        RETERR(ProfileProblem);
    }
    cmsHTRANSFORM h = transform.h;
    lab_transforms.emplace(whitepoint, std::move(transform));
    return h;
}

rvoe<std::vector<double>> ColorConverter::transform_to_rgb(cmsHTRANSFORM transform,
                                                           std::span<const double> values) const {
    if(values.size() % 3 != 0) {
        RETERR(WrongOperandCount);
    }
    const auto num_pixels = (cmsUInt32Number)(values.size() / 3);
    std::vector<double> rgb(values.size(), 0.0);
    cmsDoTransform(transform, values.data(), rgb.data(), num_pixels);
    for(auto &v : rgb) {
        v = std::clamp(v, 0.0, 1.0);
    }
    return rgb;
}

rvoe<std::vector<double>> ColorConverter::lab_to_rgb(std::span<const double> lab,
                                                     const LabSpace &cs) const {
    ERC(transform, lab_transform(cs.whitepoint));
    std::vector<double> clamped(lab.begin(), lab.end());
    for(size_t i = 0; i + 2 < clamped.size(); i += 3) {
        clamped[i] = std::clamp(clamped[i], 0.0, 100.0);
        clamped[i + 1] = std::clamp(clamped[i + 1], cs.range[0], cs.range[1]);
        clamped[i + 2] = std::clamp(clamped[i + 2], cs.range[2], cs.range[3]);
    }
    return transform_to_rgb(transform, clamped);
}

rvoe<std::vector<double>> ColorConverter::xyz_to_rgb(std::span<const double> xyz) const {
    return transform_to_rgb(xyz_transform.h, xyz);
}

rvoe<DeviceRGBColor> ColorConverter::to_rgb(const LabColor &lab, const LabSpace &cs) const {
    const double values[3] = {lab.l, lab.a, lab.b};
    ERC(rgb, lab_to_rgb(values, cs));
    return DeviceRGBColor{rgb[0], rgb[1], rgb[2]};
}

rvoe<DeviceRGBColor> ColorConverter::to_rgb(const CalRGBColor &color,
                                            const CalRGBSpace &cs) const {
    const double abc[3] = {std::pow(color.a.v(), cs.gamma[0]),
                           std::pow(color.b.v(), cs.gamma[1]),
                           std::pow(color.c.v(), cs.gamma[2])};
    // The matrix is stored column by column: X = XA*A + XB*B + XC*C.
    double xyz[3];
    for(int i = 0; i < 3; ++i) {
        xyz[i] = cs.matrix[i] * abc[0] + cs.matrix[3 + i] * abc[1] + cs.matrix[6 + i] * abc[2];
    }
    ERC(rgb, xyz_to_rgb(xyz));
    return DeviceRGBColor{rgb[0], rgb[1], rgb[2]};
}

} // namespace chromapdf::internal
