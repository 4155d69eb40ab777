// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <grayscale.hpp>
#include <colormodel.hpp>
#include <imagecodec.hpp>
#include <interpreter.hpp>
#include <scancontext.hpp>

#include <cstdio>
#include <memory>
#include <set>

namespace chromapdf::internal {

const char rgb_to_gray_program[] = "{ 0.11 mul exch 0.59 mul add exch 0.3 mul add }";

const char cmyk_to_gray_program[] = "{ exch 0.11 mul add exch 0.59 mul add exch 0.3 mul add "
                                    "dup 1.0 ge { pop 1.0 } if 1.0 exch sub }";

namespace {

struct GrayContext {
    const ColorConverter *conv;
    const GrayscaleOptions *opts;
    NestingTracker nesting;
    VisitedSet<bool> visited;
    // Pattern colorspaces whose underlying space becomes DeviceGray once the
    // whole stream is done. Changing them earlier would break the color
    // operands that still follow in the input.
    std::set<std::pair<ResourceResolver *, std::string>> pattern_colorspaces;
    // Keeps nested resource scopes alive until the rewrites above are done.
    std::vector<std::shared_ptr<ResourceResolver>> scopes;
    ContentStream *out = nullptr;
};

const HandlerSet<GrayContext> &gray_handlers();

rvoe<ContentStream> transform_stream(GrayContext &ctx,
                                     const ContentStream &ops,
                                     ResourceResolver &resources,
                                     GraphicsState initial) {
    ContentStream result;
    result.reserve(ops.size());
    auto *outer = ctx.out;
    ctx.out = &result;
    auto rc = process(
        ops, resources, gray_handlers(), ctx, std::move(initial), ctx.opts->scan.verbose);
    ctx.out = outer;
    if(!rc) {
        return std::unexpected(rc.error());
    }
    return result;
}

rvoe<NoReturnValue> finish_pattern_colorspaces(GrayContext &ctx) {
    for(const auto &[scope, name] : ctx.pattern_colorspaces) {
        auto cs = scope->get_colorspace(name);
        if(!cs) {
            fprintf(stderr, "Colorspace /%s is not defined.\n", name.c_str());
            RETERR(UndefinedColorspace);
        }
        auto *pattern = std::get_if<PatternSpace>(&cs->v);
        if(!pattern || !pattern->underlying ||
           std::holds_alternative<DeviceGraySpace>(pattern->underlying->v)) {
            continue;
        }
        pattern->underlying = std::make_shared<const Colorspace>(Colorspace{DeviceGraySpace{}});
        scope->set_colorspace(name, std::move(*cs));
    }
    ctx.pattern_colorspaces.clear();
    RETOK;
}

rvoe<Pattern> convert_pattern(GrayContext &ctx,
                              const ScopedName &key,
                              const Pattern &pattern,
                              ResourceResolver &resources) {
    if(auto *sp = std::get_if<ShadingPattern>(&pattern)) {
        ERC(gray, shading_to_gray(sp->shading));
        ShadingPattern result = *sp;
        result.shading = std::move(gray);
        return result;
    }
    const auto &tiling = std::get<TilingPattern>(pattern);
    if(!tiling.colored) {
        return pattern;
    }
    ERC(entered, ctx.nesting.enter(key));
    if(!entered) {
        return pattern;
    }
    NestingGuard guard(ctx.nesting, key);
    if(tiling.resources) {
        ctx.scopes.push_back(tiling.resources);
    }
    ResourceResolver &scope = tiling.resources ? *tiling.resources : resources;
    ERC(content, transform_stream(ctx, tiling.content, scope, GraphicsState{}));
    TilingPattern result = tiling;
    result.content = std::move(content);
    return result;
}

rvoe<ImageXObject> convert_image(GrayContext &ctx, const ImageXObject &image) {
    ERC(raw, decode_image(image));
    ERC(rgb, image_to_rgb(raw, *image.colorspace, image.decode, *ctx.conv));
    auto gray_pixels = rgb_to_gray_pixels(rgb);
    auto encoded = encode_gray_image(image, gray_pixels, ctx.opts->jpeg_quality);
    if(!encoded && encoded.error() == ErrorCode::UnsupportedEncodingParameters) {
        if(ctx.opts->scan.verbose) {
            fprintf(stderr, "Can not reencode image with its own filters, using Flate.\n");
        }
        return encode_gray_image_flate(image, std::move(gray_pixels));
    }
    return encoded;
}

rvoe<std::string> name_operand(const Operator &op) {
    CHECK_OPERAND_COUNT(op, 1);
    auto *name = as_name(op.operands.front());
    if(!name) {
        fprintf(stderr, "Operator %s needs a name operand.\n", op.name.c_str());
        RETERR(WrongOperandType);
    }
    return name->name;
}

rvoe<NoReturnValue> copy_operator(GrayContext &ctx,
                                  const Operator &op,
                                  const GraphicsState &,
                                  ResourceResolver &) {
    ctx.out->push_back(op);
    RETOK;
}

rvoe<NoReturnValue> on_set_colorspace(GrayContext &ctx,
                                      const Operator &op,
                                      const GraphicsState &gs,
                                      ResourceResolver &resources) {
    ERC(name, name_operand(op));
    const auto &cs = op.name == "CS" ? gs.stroking_colorspace : gs.nonstroking_colorspace;
    if(is_pattern_space(cs)) {
        if(name != "Pattern") {
            ctx.pattern_colorspaces.emplace(&resources, name);
        }
        RETOK;
    }
    ctx.out->back() = make_operator(op.name, {PdfName{"DeviceGray"}});
    RETOK;
}

rvoe<NoReturnValue> convert_named_pattern(GrayContext &ctx,
                                          const std::string &name,
                                          ResourceResolver &resources) {
    const ScopedName key{&resources, name};
    if(ctx.visited.patterns.contains(key)) {
        RETOK;
    }
    ctx.visited.patterns[key] = true;
    auto pattern = resources.get_pattern(name);
    if(!pattern) {
        fprintf(stderr, "Pattern /%s is not defined.\n", name.c_str());
        RETERR(UndefinedPattern);
    }
    ERC(gray, convert_pattern(ctx, key, *pattern, resources));
    resources.set_pattern(name, std::move(gray));
    RETOK;
}

rvoe<NoReturnValue> on_set_color(GrayContext &ctx,
                                 const Operator &op,
                                 const GraphicsState &gs,
                                 ResourceResolver &resources) {
    const bool stroking = op.name == "SC" || op.name == "SCN";
    const auto &cs = stroking ? gs.stroking_colorspace : gs.nonstroking_colorspace;
    const auto &color = stroking ? gs.stroking_color : gs.nonstroking_color;
    if(auto solid = as_solid(color)) {
        ERC(gray, to_gray(*solid, cs, *ctx.conv));
        ctx.out->back() = make_operator(op.name, {gray.v.v()});
        RETOK;
    }
    const auto &pc = std::get<PatternColor>(color);
    std::vector<PdfValue> operands;
    if(pc.underlying) {
        ERC(gray, to_gray(*pc.underlying, cs, *ctx.conv));
        operands.emplace_back(gray.v.v());
    }
    operands.emplace_back(PdfName{pc.name});
    ctx.out->back() = make_operator(op.name, std::move(operands));
    if(!pc.name.empty()) {
        ERCV(convert_named_pattern(ctx, pc.name, resources));
    }
    RETOK;
}

rvoe<NoReturnValue> on_device_color(GrayContext &ctx,
                                    const Operator &op,
                                    const GraphicsState &gs,
                                    ResourceResolver &) {
    const bool stroking = op.name == "RG" || op.name == "K";
    const auto &cs = stroking ? gs.stroking_colorspace : gs.nonstroking_colorspace;
    const auto solid = as_solid(stroking ? gs.stroking_color : gs.nonstroking_color);
    if(!solid) {
        RETERR(Unreachable);
    }
    ERC(gray, to_gray(*solid, cs, *ctx.conv));
    ctx.out->back() = make_operator(stroking ? "G" : "g", {gray.v.v()});
    RETOK;
}

rvoe<NoReturnValue> on_shading(GrayContext &ctx,
                               const Operator &op,
                               const GraphicsState &,
                               ResourceResolver &resources) {
    ERC(name, name_operand(op));
    const ScopedName key{&resources, name};
    if(ctx.visited.shadings.contains(key)) {
        RETOK;
    }
    ctx.visited.shadings[key] = true;
    auto shading = resources.get_shading(name);
    if(!shading) {
        fprintf(stderr, "Shading /%s is not defined.\n", name.c_str());
        RETERR(UndefinedShading);
    }
    ERC(gray, shading_to_gray(*shading));
    resources.set_shading(name, std::move(gray));
    RETOK;
}

rvoe<NoReturnValue> on_inline_image(GrayContext &ctx,
                                    const Operator &op,
                                    const GraphicsState &,
                                    ResourceResolver &resources) {
    if(!ctx.opts->convert_images) {
        RETOK;
    }
    CHECK_OPERAND_COUNT(op, 1);
    auto *ii = as_inline_image(op.operands.front());
    if(!ii) {
        RETERR(WrongOperandType);
    }
    ERC(image, image_from_inline(*ii, &resources));
    if(classify_image(image) != ImageHandling::Convert) {
        RETOK;
    }
    ERC(gray, convert_image(ctx, image));
    ctx.out->back() = make_operator("BI", {inline_from_image(gray, *ii)});
    RETOK;
}

rvoe<NoReturnValue> on_xobject(GrayContext &ctx,
                               const Operator &op,
                               const GraphicsState &gs,
                               ResourceResolver &resources) {
    ERC(name, name_operand(op));
    const ScopedName key{&resources, name};
    if(ctx.visited.xobjects.contains(key)) {
        RETOK;
    }
    ctx.visited.xobjects[key] = true;
    auto xobj = resources.get_xobject(name);
    if(!xobj) {
        fprintf(stderr, "XObject /%s is not defined.\n", name.c_str());
        RETERR(UndefinedXObject);
    }
    if(auto *image = std::get_if<ImageXObject>(&*xobj)) {
        if(!ctx.opts->convert_images) {
            RETOK;
        }
        const auto handling = classify_image(*image);
        if(handling == ImageHandling::RunLengthWithSoftMask && ctx.opts->scan.verbose) {
            fprintf(stderr, "Leaving run length image /%s with a soft mask as is.\n", name.c_str());
        }
        if(handling != ImageHandling::Convert) {
            RETOK;
        }
        ERC(gray, convert_image(ctx, *image));
        resources.set_xobject(name, std::move(gray));
        RETOK;
    }
    const auto &form = std::get<FormXObject>(*xobj);
    ERC(entered, ctx.nesting.enter(key));
    if(!entered) {
        RETOK;
    }
    NestingGuard guard(ctx.nesting, key);
    if(form.resources) {
        ctx.scopes.push_back(form.resources);
    }
    ResourceResolver &scope = form.resources ? *form.resources : resources;
    ERC(content, transform_stream(ctx, form.content, scope, gs));
    FormXObject gray = form;
    gray.content = std::move(content);
    resources.set_xobject(name, std::move(gray));
    RETOK;
}

const HandlerSet<GrayContext> &gray_handlers() {
    static const HandlerSet<GrayContext> handlers = [] {
        HandlerSet<GrayContext> h;
        h.set_all_operators(copy_operator);
        h.add({"CS", "cs"}, on_set_colorspace);
        h.add({"SC", "SCN", "sc", "scn"}, on_set_color);
        h.add({"RG", "K", "rg", "k"}, on_device_color);
        h.add("sh", on_shading);
        h.add("BI", on_inline_image);
        h.add("Do", on_xobject);
        return h;
    }();
    return handlers;
}

rvoe<Shading> gray_shading(const Shading &shading,
                           std::vector<std::string> colorants,
                           const char *program) {
    std::vector<double> domain;
    for(size_t i = 0; i < colorants.size(); ++i) {
        domain.push_back(0.0);
        domain.push_back(1.0);
    }
    ERC(func, make_type4_function(std::move(domain), {0.0, 1.0}, program));
    DeviceNSpace devn;
    devn.colorants = std::move(colorants);
    devn.alternate = std::make_shared<const Colorspace>(Colorspace{DeviceGraySpace{}});
    devn.tint_transform = PdfFunction{std::move(func)};
    Shading result = shading;
    result.colorspace = Colorspace{std::move(devn)};
    return result;
}

} // namespace

rvoe<Shading> shading_to_gray(const Shading &shading) {
    const auto n = num_components(shading.colorspace);
    switch(n) {
    case 1:
        return shading;
    case 3:
        return gray_shading(shading, {"R", "G", "B"}, rgb_to_gray_program);
    case 4:
        return gray_shading(shading, {"C", "M", "Y", "K"}, cmyk_to_gray_program);
    default:
        fprintf(stderr, "Can not convert a shading with %d components to gray.\n", (int)n);
        RETERR(UnsupportedColorspace);
    }
}

rvoe<GrayscaleTransformer> GrayscaleTransformer::construct(GrayscaleOptions opts) {
    ERC(conv, ColorConverter::construct(opts.scan.rgb_profile));
    return GrayscaleTransformer(std::move(opts), std::move(conv));
}

rvoe<ContentStream> GrayscaleTransformer::to_grayscale(const ContentStream &ops,
                                                       ResourceResolver &resources) const {
    GrayContext ctx{&conv, &opts, NestingTracker(opts.scan.max_nesting_depth), {}, {}, {}};
    ERC(result, transform_stream(ctx, ops, resources, GraphicsState{}));
    ERCV(finish_pattern_colorspaces(ctx));
    return std::move(result);
}

rvoe<Pattern> GrayscaleTransformer::pattern_to_gray(const Pattern &pattern,
                                                    ResourceResolver &resources) const {
    GrayContext ctx{&conv, &opts, NestingTracker(opts.scan.max_nesting_depth), {}, {}, {}};
    ERC(result, convert_pattern(ctx, ScopedName{&resources, std::string{}}, pattern, resources));
    ERCV(finish_pattern_colorspaces(ctx));
    return std::move(result);
}

} // namespace chromapdf::internal
