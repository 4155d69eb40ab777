// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <chromapdf.hpp>
#include <colordetector.hpp>
#include <colormodel.hpp>
#include <contentparser.hpp>
#include <contentwriter.hpp>
#include <grayscale.hpp>
#include <imagecodec.hpp>
#include <markdetector.hpp>
#include <pagesummary.hpp>

#include <cstdio>
#include <cstdlib>

#if defined(__cpp_exceptions)
#define CHROMA_ERROR_HAPPENED(error_string) throw PdfException(error_string)
#else
#define CHROMA_ERROR_HAPPENED(error_string)                                                        \
    fprintf(stderr, "ChromaPDF error: %s\n", error_string);                                       \
    std::abort()
#endif

namespace chromapdf {

namespace {

template<typename T> T unwrap(internal::rvoe<T> rc) {
    if(!rc) {
        CHROMA_ERROR_HAPPENED(internal::error_text(rc.error()));
    }
    return std::move(rc.value());
}

internal::Colorspace parse_cs(std::string_view definition, const internal::ResourceResolver *r) {
    auto value = unwrap(internal::parse_object(definition));
    return unwrap(internal::parse_colorspace(value, r));
}

internal::ScanOptions scan_options(const Options &opts) {
    internal::ScanOptions scan;
    scan.max_nesting_depth = opts.max_nesting_depth;
    scan.verbose = opts.verbose;
    scan.rgb_profile = opts.rgb_profile;
    return scan;
}

} // namespace

Resources::Resources() : d(std::make_shared<internal::ResourceDictionary>()) {}

Resources::Resources(const Resources *parent)
    : d(std::make_shared<internal::ResourceDictionary>(parent ? parent->d : nullptr)) {}

Resources::~Resources() = default;

void Resources::add_colorspace(const std::string &name, std::string_view definition) {
    d->set_colorspace(name, parse_cs(definition, d.get()));
}

void Resources::add_shading(const std::string &name, std::string_view colorspace) {
    d->set_shading(name, internal::Shading{parse_cs(colorspace, d.get()), {}});
}

void Resources::add_shading_pattern(const std::string &name, std::string_view colorspace) {
    internal::ShadingPattern sp;
    sp.shading.colorspace = parse_cs(colorspace, d.get());
    d->set_pattern(name, std::move(sp));
}

void Resources::add_tiling_pattern(const std::string &name,
                                   std::string_view content,
                                   bool colored,
                                   const Resources *own) {
    internal::TilingPattern tp;
    tp.content = unwrap(internal::parse_content_stream(content));
    tp.colored = colored;
    if(own) {
        tp.resources = own->d;
    }
    d->set_pattern(name, std::move(tp));
}

void Resources::add_form(const std::string &name, std::string_view content, const Resources *own) {
    internal::FormXObject form;
    form.content = unwrap(internal::parse_content_stream(content));
    if(own) {
        form.resources = own->d;
    }
    d->set_xobject(name, std::move(form));
}

void Resources::add_image(const std::string &name,
                          int32_t width,
                          int32_t height,
                          std::string_view colorspace,
                          int32_t bits_per_component,
                          std::string filter,
                          std::string data) {
    internal::ImageXObject image;
    image.width = width;
    image.height = height;
    image.bits_per_component = bits_per_component;
    image.colorspace = parse_cs(colorspace, d.get());
    if(!filter.empty()) {
        image.filters.push_back(std::move(filter));
        image.decode_parms.emplace_back();
    }
    image.data = std::move(data);
    d->set_xobject(name, std::move(image));
}

void Resources::add_image_object(const std::string &name, std::string_view object) {
    auto value = unwrap(internal::parse_object(object));
    auto *stream = internal::as_stream(value);
    if(!stream) {
        CHROMA_ERROR_HAPPENED(internal::error_text(internal::ErrorCode::WrongOperandType));
    }
    d->set_xobject(name, unwrap(internal::image_from_stream(*stream, d.get())));
}

std::string Resources::form_content(const std::string &name) const {
    auto xobj = d->get_xobject(name);
    if(!xobj || !std::holds_alternative<internal::FormXObject>(*xobj)) {
        CHROMA_ERROR_HAPPENED(internal::error_text(internal::ErrorCode::UndefinedXObject));
    }
    return internal::serialize(std::get<internal::FormXObject>(*xobj).content);
}

std::string Resources::tiling_pattern_content(const std::string &name) const {
    auto pattern = d->get_pattern(name);
    if(!pattern || !std::holds_alternative<internal::TilingPattern>(*pattern)) {
        CHROMA_ERROR_HAPPENED(internal::error_text(internal::ErrorCode::UndefinedPattern));
    }
    return internal::serialize(std::get<internal::TilingPattern>(*pattern).content);
}

int32_t Resources::shading_components(const std::string &name) const {
    auto shading = d->get_shading(name);
    if(!shading) {
        CHROMA_ERROR_HAPPENED(internal::error_text(internal::ErrorCode::UndefinedShading));
    }
    return internal::num_components(shading->colorspace);
}

int32_t Resources::image_components(const std::string &name) const {
    auto xobj = d->get_xobject(name);
    if(!xobj || !std::holds_alternative<internal::ImageXObject>(*xobj)) {
        CHROMA_ERROR_HAPPENED(internal::error_text(internal::ErrorCode::UndefinedXObject));
    }
    const auto &image = std::get<internal::ImageXObject>(*xobj);
    return image.colorspace ? internal::num_components(*image.colorspace) : 1;
}

struct Analyzer::Impl {
    Impl(internal::ColorDetector c, internal::MarkDetector m, internal::GrayscaleTransformer g)
        : colors(std::move(c)), marks(std::move(m)), gray(std::move(g)) {}

    internal::ColorDetector colors;
    internal::MarkDetector marks;
    internal::GrayscaleTransformer gray;
};

Analyzer::Analyzer(const Options &opts) {
    internal::GrayscaleOptions gopts;
    gopts.scan = scan_options(opts);
    gopts.convert_images = opts.convert_images;
    gopts.jpeg_quality = opts.jpeg_quality;
    impl = std::make_unique<Impl>(unwrap(internal::ColorDetector::construct(gopts.scan)),
                                  internal::MarkDetector(gopts.scan),
                                  unwrap(internal::GrayscaleTransformer::construct(gopts)));
}

Analyzer::~Analyzer() = default;

bool Analyzer::is_colored(std::string_view content, Resources &resources) {
    auto ops = unwrap(internal::parse_content_stream(content));
    return unwrap(impl->colors.is_colored(ops, resources.get_internal()));
}

bool Analyzer::is_marked(std::string_view content, Resources &resources) {
    auto ops = unwrap(internal::parse_content_stream(content));
    return unwrap(impl->marks.is_marked(ops, resources.get_internal()));
}

std::string Analyzer::to_grayscale(std::string_view content, Resources &resources) {
    auto ops = unwrap(internal::parse_content_stream(content));
    auto gray = unwrap(impl->gray.to_grayscale(ops, resources.get_internal()));
    return internal::serialize(gray);
}

std::string Analyzer::describe_pages(const std::vector<PageInput> &pages, bool mark_only) {
    std::vector<internal::PageDescription> descriptions;
    for(const auto &page : pages) {
        internal::PageDescription desc;
        desc.media_box = {0, 0, page.width, page.height};
        desc.contents = unwrap(internal::parse_content_stream(page.content));
        desc.resources = page.resources ? page.resources->d
                                        : std::make_shared<internal::ResourceDictionary>();
        descriptions.emplace_back(std::move(desc));
    }
    internal::PagePredicate predicate;
    if(mark_only) {
        predicate = [this](const internal::ContentStream &ops, internal::ResourceResolver &r) {
            return impl->marks.is_marked(ops, r);
        };
    } else {
        predicate = [this](const internal::ContentStream &ops, internal::ResourceResolver &r) {
            return impl->colors.is_colored(ops, r);
        };
    }
    return internal::to_json(unwrap(internal::summarize_pages(descriptions, predicate)),
                             mark_only ? internal::PageSelection::Marked
                                       : internal::PageSelection::Colored);
}

} // namespace chromapdf
