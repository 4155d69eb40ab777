// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

// The functionality in this header is neither ABI nor API stable.

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace chromapdf {

namespace internal {
class ResourceDictionary;
}

class PdfException : public std::runtime_error {
public:
    PdfException(const char *msg) : std::runtime_error(msg) {}
};

struct Options {
    int32_t max_nesting_depth = 32;
    bool verbose = false;
    // ICC profile file for the output RGB space, empty for sRGB.
    std::string rgb_profile;
    bool convert_images = true;
    int32_t jpeg_quality = 90;
};

// Named resources of a page, form or pattern. Colorspaces are given in
// content stream syntax, e.g. "[/Indexed /DeviceRGB 1 <FF000000FF00>]".
class Resources {
public:
    Resources();
    // Names not found here are looked up in the parent.
    explicit Resources(const Resources *parent);
    ~Resources();

    void add_colorspace(const std::string &name, std::string_view definition);
    void add_shading(const std::string &name, std::string_view colorspace);
    void add_shading_pattern(const std::string &name, std::string_view colorspace);
    // Without own resources the pattern uses those of the stream that paints with it.
    void add_tiling_pattern(const std::string &name,
                            std::string_view content,
                            bool colored,
                            const Resources *own = nullptr);
    void add_form(const std::string &name,
                  std::string_view content,
                  const Resources *own = nullptr);
    // An empty filter means raw samples.
    void add_image(const std::string &name,
                   int32_t width,
                   int32_t height,
                   std::string_view colorspace,
                   int32_t bits_per_component,
                   std::string filter,
                   std::string data);
    // An image XObject in object syntax, "<< /Width 2 ... >>\nstream\n...\nendstream".
    // Entries such as SMask or Interpolate survive conversion.
    void add_image_object(const std::string &name, std::string_view object);

    std::string form_content(const std::string &name) const;
    std::string tiling_pattern_content(const std::string &name) const;
    int32_t shading_components(const std::string &name) const;
    int32_t image_components(const std::string &name) const;

    internal::ResourceDictionary &get_internal() { return *d; }

private:
    friend class Analyzer;

    std::shared_ptr<internal::ResourceDictionary> d;
};

struct PageInput {
    double width = 612;
    double height = 792;
    std::string content;
    Resources *resources = nullptr;
};

class Analyzer {
public:
    explicit Analyzer(const Options &opts = Options{});
    ~Analyzer();

    bool is_colored(std::string_view content, Resources &resources);
    bool is_marked(std::string_view content, Resources &resources);
    // The resources are modified in place.
    std::string to_grayscale(std::string_view content, Resources &resources);

    // JSON record of page sizes and the pages that are colored, or marked
    // when mark_only is set.
    std::string describe_pages(const std::vector<PageInput> &pages, bool mark_only);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace chromapdf
