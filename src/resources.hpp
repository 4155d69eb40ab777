// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <pdfcommon.hpp>
#include <pdfobjects.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chromapdf::internal {

class ResourceResolver;

struct TilingPattern {
    ContentStream content;
    // Null means the pattern uses the resources of the stream that paints with it.
    std::shared_ptr<ResourceResolver> resources;
    // PaintType 1. Uncolored patterns get their color from the painting operator.
    bool colored = true;
    // BBox, XStep, Matrix and friends, passed through unchanged.
    PdfDict extra;
};

struct Shading {
    Colorspace colorspace;
    // ShadingType, Coords, Function etc. Not interpreted.
    PdfDict params;
};

struct ShadingPattern {
    Shading shading;
    PdfDict extra;
};

typedef std::variant<TilingPattern, ShadingPattern> Pattern;

struct ImageXObject {
    int32_t width = 0;
    int32_t height = 0;
    int32_t bits_per_component = 8;
    // Absent for stencil masks and for JPX images that carry their own.
    std::optional<Colorspace> colorspace;
    std::vector<std::string> filters;
    // One entry per filter, empty dicts where there are no parameters.
    std::vector<PdfDict> decode_parms;
    std::vector<double> decode;
    bool image_mask = false;
    // Carried over unchanged when the image is converted.
    std::optional<PdfStream> smask;
    // Entries not modeled above, e.g. Interpolate, Intent or Mask.
    PdfDict extra;
    // Encoded stream data.
    std::string data;
};

struct FormXObject {
    ContentStream content;
    std::shared_ptr<ResourceResolver> resources;
    PdfDict extra;
};

typedef std::variant<ImageXObject, FormXObject> XObject;

// Lookup of named resources within one resource scope.
class ResourceResolver {
public:
    virtual ~ResourceResolver() = default;

    virtual std::optional<Colorspace> get_colorspace(const std::string &name) const = 0;
    virtual void set_colorspace(const std::string &name, Colorspace cs) = 0;

    virtual std::optional<Pattern> get_pattern(const std::string &name) const = 0;
    virtual void set_pattern(const std::string &name, Pattern pattern) = 0;

    virtual std::optional<Shading> get_shading(const std::string &name) const = 0;
    virtual void set_shading(const std::string &name, Shading shading) = 0;

    virtual std::optional<XObject> get_xobject(const std::string &name) const = 0;
    virtual void set_xobject(const std::string &name, XObject xobj) = 0;
};

// In-memory resource dictionary. Names not defined here are looked up in the
// parent scope. Updates go to the scope that defines the name.
class ResourceDictionary : public ResourceResolver {
public:
    ResourceDictionary() = default;
    explicit ResourceDictionary(std::shared_ptr<ResourceResolver> parent)
        : parent(std::move(parent)) {}

    std::optional<Colorspace> get_colorspace(const std::string &name) const override;
    void set_colorspace(const std::string &name, Colorspace cs) override;

    std::optional<Pattern> get_pattern(const std::string &name) const override;
    void set_pattern(const std::string &name, Pattern pattern) override;

    std::optional<Shading> get_shading(const std::string &name) const override;
    void set_shading(const std::string &name, Shading shading) override;

    std::optional<XObject> get_xobject(const std::string &name) const override;
    void set_xobject(const std::string &name, XObject xobj) override;

    const std::map<std::string, Colorspace> &colorspaces() const { return colorspace_table; }
    const std::map<std::string, Pattern> &patterns() const { return pattern_table; }
    const std::map<std::string, Shading> &shadings() const { return shading_table; }
    const std::map<std::string, XObject> &xobjects() const { return xobject_table; }

private:
    std::shared_ptr<ResourceResolver> parent;
    std::map<std::string, Colorspace> colorspace_table;
    std::map<std::string, Pattern> pattern_table;
    std::map<std::string, Shading> shading_table;
    std::map<std::string, XObject> xobject_table;
};

// Builds a colorspace from its content stream or dictionary form: a name
// (device spaces, Pattern or a resource name) or an array such as
// [/Indexed /DeviceRGB 1 <...>]. Abbreviated inline image names are accepted.
rvoe<Colorspace> parse_colorspace(const PdfValue &val, const ResourceResolver *resources);

// Resolves the name operand of CS/cs.
rvoe<Colorspace> resolve_colorspace_name(const std::string &name,
                                         const ResourceResolver *resources);

} // namespace chromapdf::internal
