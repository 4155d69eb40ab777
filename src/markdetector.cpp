// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <markdetector.hpp>
#include <colormodel.hpp>
#include <interpreter.hpp>
#include <scancontext.hpp>

#include <algorithm>
#include <cstdio>
#include <unordered_map>

namespace chromapdf::internal {

namespace {

const std::unordered_map<std::string, OperatorMarking> marking_table{
    {"b", {true, true, true}},
    {"B", {true, true, true}},
    {"b*", {true, true, true}},
    {"B*", {true, true, true}},
    {"BI", {true, false, false}},
    {"ID", {true, false, false}},
    {"EI", {true, false, false}},
    {"f", {true, false, true}},
    {"F", {true, false, true}},
    {"f*", {true, false, true}},
    {"s", {true, true, false}},
    {"S", {true, true, false}},
    {"sh", {true, true, true}},
    {"Tj", {true, true, true}},
    {"TJ", {true, true, true}},
    {"'", {true, true, true}},
    {"\"", {true, true, true}},
};

struct MarkScanContext {
    const ScanOptions *opts;
    NestingTracker nesting;
    VisitedSet<bool> visited;
    bool marked = false;
};

const HandlerSet<MarkScanContext> &mark_handlers();

rvoe<bool> scan_stream(MarkScanContext &ctx,
                       const ContentStream &ops,
                       ResourceResolver &resources,
                       GraphicsState initial) {
    const bool outer = ctx.marked;
    ctx.marked = false;
    ERCV(process(ops, resources, mark_handlers(), ctx, std::move(initial), ctx.opts->verbose));
    const bool result = ctx.marked;
    ctx.marked = outer;
    return result;
}

rvoe<bool> pattern_marked(MarkScanContext &ctx,
                          const ScopedName &key,
                          const Pattern &pattern,
                          ResourceResolver &resources) {
    if(std::holds_alternative<ShadingPattern>(pattern)) {
        return true;
    }
    const auto &tiling = std::get<TilingPattern>(pattern);
    ERC(entered, ctx.nesting.enter(key));
    if(!entered) {
        return false;
    }
    NestingGuard guard(ctx.nesting, key);
    ResourceResolver &scope = tiling.resources ? *tiling.resources : resources;
    return scan_stream(ctx, tiling.content, scope, GraphicsState{});
}

rvoe<bool> color_visible(MarkScanContext &ctx, const Color &color, ResourceResolver &resources) {
    auto *pc = std::get_if<PatternColor>(&color);
    if(!pc) {
        return is_visible_mark(color);
    }
    if(pc->underlying) {
        return is_visible_mark(to_color(*pc->underlying));
    }
    // No pattern selected yet, nothing gets painted.
    if(pc->name.empty()) {
        return false;
    }
    const ScopedName key{&resources, pc->name};
    auto memo = ctx.visited.patterns.find(key);
    if(memo != ctx.visited.patterns.end()) {
        return memo->second;
    }
    auto pattern = resources.get_pattern(pc->name);
    if(!pattern) {
        fprintf(stderr, "Pattern /%s is not defined.\n", pc->name.c_str());
        RETERR(UndefinedPattern);
    }
    ERC(result, pattern_marked(ctx, key, *pattern, resources));
    ctx.visited.patterns[key] = result;
    return result;
}

rvoe<bool> has_area(const Operator &op) {
    if(op.name == "Tj" || op.name == "'" || op.name == "\"") {
        if(op.operands.empty()) {
            return false;
        }
        auto *str = as_string(op.operands.back());
        if(!str) {
            fprintf(stderr, "Operator %s needs a string operand.\n", op.name.c_str());
            RETERR(WrongOperandType);
        }
        return !is_blank_text(str->bytes);
    }
    if(op.name == "TJ") {
        if(op.operands.empty()) {
            return false;
        }
        auto *arr = as_array(op.operands.front());
        if(!arr) {
            fprintf(stderr, "Operator TJ needs an array operand.\n");
            RETERR(WrongOperandType);
        }
        for(const auto &e : *arr) {
            if(auto *str = as_string(e); str && !is_blank_text(str->bytes)) {
                return true;
            }
        }
        return false;
    }
    return true;
}

rvoe<NoReturnValue> on_any_operator(MarkScanContext &ctx,
                                    const Operator &op,
                                    const GraphicsState &gs,
                                    ResourceResolver &resources) {
    if(ctx.marked) {
        RETOK;
    }
    const auto marking = operator_marking(op.name);
    if(!marking.marks) {
        RETOK;
    }
    if(!marking.uses_stroke && !marking.uses_fill) {
        ctx.marked = true;
        RETOK;
    }
    ERC(area, has_area(op));
    if(!area) {
        RETOK;
    }
    if(marking.uses_stroke) {
        ERC(visible, color_visible(ctx, gs.stroking_color, resources));
        if(visible) {
            ctx.marked = true;
            RETOK;
        }
    }
    if(marking.uses_fill) {
        ERC(visible, color_visible(ctx, gs.nonstroking_color, resources));
        ctx.marked |= visible;
    }
    RETOK;
}

rvoe<NoReturnValue> on_xobject(MarkScanContext &ctx,
                               const Operator &op,
                               const GraphicsState &gs,
                               ResourceResolver &resources) {
    CHECK_OPERAND_COUNT(op, 1);
    auto *name = as_name(op.operands.front());
    if(!name) {
        RETERR(WrongOperandType);
    }
    const ScopedName key{&resources, name->name};
    auto memo = ctx.visited.xobjects.find(key);
    if(memo != ctx.visited.xobjects.end()) {
        ctx.marked |= memo->second;
        RETOK;
    }
    auto xobj = resources.get_xobject(name->name);
    if(!xobj) {
        fprintf(stderr, "XObject /%s is not defined.\n", name->name.c_str());
        RETERR(UndefinedXObject);
    }
    if(std::holds_alternative<ImageXObject>(*xobj)) {
        ctx.visited.xobjects[key] = true;
        ctx.marked = true;
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
    ctx.marked |= result;
    RETOK;
}

const HandlerSet<MarkScanContext> &mark_handlers() {
    static const HandlerSet<MarkScanContext> handlers = [] {
        HandlerSet<MarkScanContext> h;
        h.set_all_operators(on_any_operator);
        h.add("Do", on_xobject);
        return h;
    }();
    return handlers;
}

} // namespace

OperatorMarking operator_marking(const std::string &opname) {
    auto it = marking_table.find(opname);
    if(it == marking_table.end()) {
        return OperatorMarking{};
    }
    return it->second;
}

bool is_blank_text(const std::string &bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](char c) {
        const auto u = (unsigned char)c;
        return u <= 32 || u == 127;
    });
}

rvoe<bool> MarkDetector::is_marked(const ContentStream &ops, ResourceResolver &resources) const {
    MarkScanContext ctx{&opts, NestingTracker(opts.max_nesting_depth), {}};
    return scan_stream(ctx, ops, resources, GraphicsState{});
}

rvoe<bool> MarkDetector::is_pattern_marked(const Pattern &pattern,
                                           ResourceResolver &resources) const {
    MarkScanContext ctx{&opts, NestingTracker(opts.max_nesting_depth), {}};
    return pattern_marked(ctx, ScopedName{&resources, std::string{}}, pattern, resources);
}

} // namespace chromapdf::internal
