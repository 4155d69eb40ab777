// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <graphicsstate.hpp>
#include <colormodel.hpp>

#include <array>
#include <cstdio>

namespace chromapdf::internal {

namespace {

const std::array<const char *, 14> color_operators{
    "CS", "cs", "SC", "SCN", "sc", "scn", "RG", "rg", "K", "k", "G", "g", "q", "Q"};

} // namespace

bool is_color_operator(const std::string &name) {
    for(const auto *c : color_operators) {
        if(name == c) {
            return true;
        }
    }
    return false;
}

rvoe<NoReturnValue> GraphicsStateStack::apply(const Operator &op,
                                              const ResourceResolver &resources) {
    const auto &name = op.name;
    if(name == "q") {
        stack.push_back(stack.back());
    } else if(name == "Q") {
        if(stack.size() <= 1) {
            fprintf(stderr, "Warning: Q without matching q, ignored.\n");
        } else {
            stack.pop_back();
        }
    } else if(name == "CS") {
        ERCV(set_colorspace(op, resources, true));
    } else if(name == "cs") {
        ERCV(set_colorspace(op, resources, false));
    } else if(name == "SC" || name == "SCN") {
        ERCV(set_color(op, true));
    } else if(name == "sc" || name == "scn") {
        ERCV(set_color(op, false));
    } else if(name == "RG") {
        ERCV(set_device_color(op, Colorspace{DeviceRGBSpace{}}, true));
    } else if(name == "rg") {
        ERCV(set_device_color(op, Colorspace{DeviceRGBSpace{}}, false));
    } else if(name == "K") {
        ERCV(set_device_color(op, Colorspace{DeviceCMYKSpace{}}, true));
    } else if(name == "k") {
        ERCV(set_device_color(op, Colorspace{DeviceCMYKSpace{}}, false));
    } else if(name == "G") {
        ERCV(set_device_color(op, Colorspace{DeviceGraySpace{}}, true));
    } else if(name == "g") {
        ERCV(set_device_color(op, Colorspace{DeviceGraySpace{}}, false));
    }
    RETOK;
}

rvoe<NoReturnValue> GraphicsStateStack::set_colorspace(const Operator &op,
                                                       const ResourceResolver &resources,
                                                       bool stroking) {
    CHECK_OPERAND_COUNT(op, 1);
    auto *n = as_name(op.operands.front());
    if(!n) {
        fprintf(stderr, "Operand of %s must be a name.\n", op.name.c_str());
        RETERR(WrongOperandType);
    }
    // Only resource names here, the abbreviations belong to inline images.
    if(n->name != "DeviceGray" && n->name != "DeviceRGB" && n->name != "DeviceCMYK" &&
       n->name != "Pattern" && !resources.get_colorspace(n->name)) {
        fprintf(stderr, "Colorspace %s is not defined.\n", n->name.c_str());
        RETERR(UndefinedColorspace);
    }
    ERC(cs, resolve_colorspace_name(n->name, &resources));
    auto color = initial_color(cs);
    if(stroking) {
        top().stroking_colorspace = std::move(cs);
        top().stroking_color = std::move(color);
    } else {
        top().nonstroking_colorspace = std::move(cs);
        top().nonstroking_color = std::move(color);
    }
    RETOK;
}

rvoe<NoReturnValue> GraphicsStateStack::set_color(const Operator &op, bool stroking) {
    const Colorspace &cs = stroking ? top().stroking_colorspace : top().nonstroking_colorspace;
    Color new_color;
    if(auto *pattern = std::get_if<PatternSpace>(&cs.v)) {
        if(op.operands.empty() || !as_name(op.operands.back())) {
            fprintf(stderr, "Last operand of %s must be a pattern name.\n", op.name.c_str());
            RETERR(WrongOperandType);
        }
        std::vector<double> comps;
        for(size_t i = 0; i + 1 < op.operands.size(); ++i) {
            auto num = as_number(op.operands[i]);
            if(!num) {
                RETERR(WrongOperandType);
            }
            comps.push_back(*num);
        }
        ERC(pc,
            pattern_color_from_components(*pattern, comps, as_name(op.operands.back())->name));
        new_color = std::move(pc);
    } else {
        auto comps = numeric_operands(op);
        if(!comps) {
            fprintf(stderr, "Operands of %s must be numbers.\n", op.name.c_str());
            RETERR(WrongOperandType);
        }
        ERC(c, color_from_components(cs, *comps));
        new_color = to_color(c);
    }
    if(stroking) {
        top().stroking_color = std::move(new_color);
    } else {
        top().nonstroking_color = std::move(new_color);
    }
    RETOK;
}

rvoe<NoReturnValue>
GraphicsStateStack::set_device_color(const Operator &op, Colorspace cs, bool stroking) {
    CHECK_OPERAND_COUNT(op, num_components(cs));
    auto comps = numeric_operands(op);
    if(!comps) {
        fprintf(stderr, "Operands of %s must be numbers.\n", op.name.c_str());
        RETERR(WrongOperandType);
    }
    ERC(c, color_from_components(cs, *comps));
    if(stroking) {
        top().stroking_colorspace = std::move(cs);
        top().stroking_color = to_color(c);
    } else {
        top().nonstroking_colorspace = std::move(cs);
        top().nonstroking_color = to_color(c);
    }
    RETOK;
}

} // namespace chromapdf::internal
