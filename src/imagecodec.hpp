// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <colorconverter.hpp>
#include <errorhandling.hpp>
#include <pdfobjects.hpp>
#include <resources.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace chromapdf::internal {

// Decoded samples, rows padded to full bytes as in PDF image data.
struct RawImage {
    int32_t width = 0;
    int32_t height = 0;
    int32_t components = 0;
    int32_t bits_per_component = 8;
    std::string samples;
};

// 8 bits per channel, interleaved.
struct RgbImage {
    int32_t width = 0;
    int32_t height = 0;
    std::string pixels;
};

bool has_filter(const ImageXObject &image, const char *filter);

// Colors can not be changed without touching pixels the masks make visible or
// formats we can not decode.
enum class ImageHandling : uint8_t {
    Convert,
    AlreadyGray,
    Bilevel,
    Jpeg2000,
    RunLengthWithSoftMask,
};

ImageHandling classify_image(const ImageXObject &image);

rvoe<std::string> run_length_decode(std::string_view data);
std::string run_length_encode(std::string_view data);
rvoe<std::string> ascii_hex_decode(std::string_view data);
std::string ascii_hex_encode(std::string_view data);
rvoe<std::string> ascii85_decode(std::string_view data);

rvoe<RawImage> dct_decode(std::string_view data);
rvoe<std::string> dct_encode_gray(std::string_view pixels, int32_t w, int32_t h, int32_t quality);

rvoe<RawImage> decode_image(const ImageXObject &image);

rvoe<RgbImage> image_to_rgb(const RawImage &raw,
                            const Colorspace &cs,
                            const std::vector<double> &decode,
                            const ColorConverter &conv);

std::string rgb_to_gray_pixels(const RgbImage &rgb);

bool has_colored_pixels(const RgbImage &rgb);

// Encodes 8 bit gray pixels with the filter of the original image. A DCT image
// becomes a one component JPEG. Filter chains, predictors and filters without an
// encoder give UnsupportedEncodingParameters.
rvoe<ImageXObject> encode_gray_image(const ImageXObject &original,
                                     std::string gray_pixels,
                                     int32_t jpeg_quality);

rvoe<ImageXObject> encode_gray_image_flate(const ImageXObject &original, std::string gray_pixels);

rvoe<ImageXObject> image_from_inline(const InlineImage &inline_image,
                                     const ResourceResolver *resources);

// An image XObject given as a stream object.
rvoe<ImageXObject> image_from_stream(const PdfStream &stream, const ResourceResolver *resources);

InlineImage inline_from_image(const ImageXObject &image, const InlineImage &original);

} // namespace chromapdf::internal
