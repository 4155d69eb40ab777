// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <colordetector.hpp>
#include <colormodel.hpp>
#include <imagecodec.hpp>
#include <interpreter.hpp>
#include <scancontext.hpp>
#include <utils.hpp>

#include <cstdio>

namespace chromapdf::internal {

namespace {

struct ColorScanContext {
    const ColorConverter *conv;
    const ScanOptions *opts;
    NestingTracker nesting;
    VisitedSet<bool> visited;
    // Result of the stream being processed at the moment.
    bool colored = false;
};

const HandlerSet<ColorScanContext> &color_handlers();

rvoe<bool> scan_stream(ColorScanContext &ctx,
                       const ContentStream &ops,
                       ResourceResolver &resources,
                       GraphicsState initial) {
    const bool outer = ctx.colored;
    ctx.colored = false;
    ERCV(process(ops, resources, color_handlers(), ctx, std::move(initial), ctx.opts->verbose));
    const bool result = ctx.colored;
    ctx.colored = outer;
    return result;
}

rvoe<bool> pattern_colored(ColorScanContext &ctx,
                           const ScopedName &key,
                           const Pattern &pattern,
                           ResourceResolver &resources) {
    if(auto *shading = std::get_if<ShadingPattern>(&pattern)) {
        return is_shading_colored(shading->shading);
    }
    const auto &tiling = std::get<TilingPattern>(pattern);
    // The painting operator gives the color of an uncolored pattern and it
    // has already been checked.
    if(!tiling.colored) {
        return false;
    }
    ERC(entered, ctx.nesting.enter(key));
    if(!entered) {
        return false;
    }
    NestingGuard guard(ctx.nesting, key);
    ResourceResolver &scope = tiling.resources ? *tiling.resources : resources;
    return scan_stream(ctx, tiling.content, scope, GraphicsState{});
}

rvoe<bool> image_colored(ColorScanContext &ctx, const ImageXObject &image) {
    switch(classify_image(image)) {
    case ImageHandling::Jpeg2000:
        // Not decoded, assume the worst.
        return true;
    case ImageHandling::Bilevel:
    case ImageHandling::AlreadyGray:
        return false;
    case ImageHandling::Convert:
    case ImageHandling::RunLengthWithSoftMask:
        break;
    }
    ERC(raw, decode_image(image));
    ERC(rgb, image_to_rgb(raw, *image.colorspace, image.decode, *ctx.conv));
    return has_colored_pixels(rgb);
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

rvoe<NoReturnValue> on_set_color(ColorScanContext &ctx,
                                 const Operator &op,
                                 const GraphicsState &gs,
                                 ResourceResolver &resources) {
    const bool stroking = op.name == "SC" || op.name == "SCN";
    const auto &color = stroking ? gs.stroking_color : gs.nonstroking_color;
    auto *pc = std::get_if<PatternColor>(&color);
    if(!pc) {
        ctx.colored |= is_colored(color);
        RETOK;
    }
    if(pc->underlying && is_colored(to_color(*pc->underlying))) {
        ctx.colored = true;
        RETOK;
    }
    if(pc->name.empty()) {
        RETOK;
    }
    const ScopedName key{&resources, pc->name};
    auto memo = ctx.visited.patterns.find(key);
    if(memo != ctx.visited.patterns.end()) {
        ctx.colored |= memo->second;
        RETOK;
    }
    auto pattern = resources.get_pattern(pc->name);
    if(!pattern) {
        fprintf(stderr, "Pattern /%s is not defined.\n", pc->name.c_str());
        RETERR(UndefinedPattern);
    }
    ERC(result, pattern_colored(ctx, key, *pattern, resources));
    ctx.visited.patterns[key] = result;
    ctx.colored |= result;
    RETOK;
}

rvoe<NoReturnValue> on_device_color(ColorScanContext &ctx,
                                    const Operator &op,
                                    const GraphicsState &gs,
                                    ResourceResolver &) {
    const bool stroking = op.name == "RG" || op.name == "K";
    ctx.colored |= is_colored(stroking ? gs.stroking_color : gs.nonstroking_color);
    RETOK;
}

rvoe<NoReturnValue> on_shading(ColorScanContext &ctx,
                               const Operator &op,
                               const GraphicsState &,
                               ResourceResolver &resources) {
    ERC(name, name_operand(op));
    const ScopedName key{&resources, name};
    auto memo = ctx.visited.shadings.find(key);
    if(memo != ctx.visited.shadings.end()) {
        ctx.colored |= memo->second;
        RETOK;
    }
    auto shading = resources.get_shading(name);
    if(!shading) {
        fprintf(stderr, "Shading /%s is not defined.\n", name.c_str());
        RETERR(UndefinedShading);
    }
    ERC(result, is_shading_colored(*shading));
    ctx.visited.shadings[key] = result;
    ctx.colored |= result;
    RETOK;
}

rvoe<NoReturnValue> on_inline_image(ColorScanContext &ctx,
                                    const Operator &op,
                                    const GraphicsState &,
                                    ResourceResolver &resources) {
    CHECK_OPERAND_COUNT(op, 1);
    auto *ii = as_inline_image(op.operands.front());
    if(!ii) {
        RETERR(WrongOperandType);
    }
    ERC(image, image_from_inline(*ii, &resources));
    if(ctx.colored) {
        RETOK;
    }
    ERC(result, image_colored(ctx, image));
    ctx.colored |= result;
    RETOK;
}

rvoe<NoReturnValue> on_xobject(ColorScanContext &ctx,
                               const Operator &op,
                               const GraphicsState &gs,
                               ResourceResolver &resources) {
    ERC(name, name_operand(op));
    const ScopedName key{&resources, name};
    auto memo = ctx.visited.xobjects.find(key);
    if(memo != ctx.visited.xobjects.end()) {
        ctx.colored |= memo->second;
        RETOK;
    }
    auto xobj = resources.get_xobject(name);
    if(!xobj) {
        fprintf(stderr, "XObject /%s is not defined.\n", name.c_str());
        RETERR(UndefinedXObject);
    }
    if(auto *image = std::get_if<ImageXObject>(&*xobj)) {
        if(ctx.colored) {
            RETOK;
        }
        ERC(result, image_colored(ctx, *image));
        ctx.visited.xobjects[key] = result;
        ctx.colored |= result;
        RETOK;
    }
    const auto &form = std::get<FormXObject>(*xobj);
    ERC(entered, ctx.nesting.enter(key));
    if(!entered) {
        RETOK;
    }
    NestingGuard guard(ctx.nesting, key);
    ResourceResolver &scope = form.resources ? *form.resources : resources;
    ERC(result, scan_stream(ctx, form.content, scope, gs));
    ctx.visited.xobjects[key] = result;
    ctx.colored |= result;
    RETOK;
}

const HandlerSet<ColorScanContext> &color_handlers() {
    static const HandlerSet<ColorScanContext> handlers = [] {
        HandlerSet<ColorScanContext> h;
        h.add({"SC", "SCN", "sc", "scn"}, on_set_color);
        h.add({"RG", "K", "rg", "k"}, on_device_color);
        h.add("sh", on_shading);
        h.add("BI", on_inline_image);
        h.add("Do", on_xobject);
        return h;
    }();
    return handlers;
}

} // namespace

rvoe<bool> is_shading_colored(const Shading &shading) {
    const auto n = num_components(shading.colorspace);
    if(n == 1) {
        return false;
    }
    if(n == 3 || n == 4) {
        return true;
    }
    fprintf(stderr, "Shading colorspace has %d components.\n", (int)n);
    RETERR(UnsupportedColorspace);
}

rvoe<ColorDetector> ColorDetector::construct(ScanOptions opts) {
    ERC(conv, ColorConverter::construct(opts.rgb_profile));
    return ColorDetector(std::move(opts), std::move(conv));
}

rvoe<bool> ColorDetector::is_colored(const ContentStream &ops, ResourceResolver &resources) const {
    ColorScanContext ctx{&conv, &opts, NestingTracker(opts.max_nesting_depth), {}};
    return scan_stream(ctx, ops, resources, GraphicsState{});
}

rvoe<bool> ColorDetector::is_pattern_colored(const Pattern &pattern,
                                             ResourceResolver &resources) const {
    ColorScanContext ctx{&conv, &opts, NestingTracker(opts.max_nesting_depth), {}};
    return pattern_colored(ctx, ScopedName{&resources, std::string{}}, pattern, resources);
}

} // namespace chromapdf::internal
