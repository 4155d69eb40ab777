// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <pdfcommon.hpp>
#include <pdfobjects.hpp>
#include <resources.hpp>

#include <vector>

namespace chromapdf::internal {

struct GraphicsState {
    Colorspace stroking_colorspace{DeviceGraySpace{}};
    Color stroking_color{DeviceGrayColor{0.0}};
    Colorspace nonstroking_colorspace{DeviceGraySpace{}};
    Color nonstroking_color{DeviceGrayColor{0.0}};
};

// Operators that change the tracked color state.
bool is_color_operator(const std::string &name);

class GraphicsStateStack {
public:
    explicit GraphicsStateStack(GraphicsState initial) { stack.emplace_back(std::move(initial)); }

    rvoe<NoReturnValue> apply(const Operator &op, const ResourceResolver &resources);

    const GraphicsState &current() const { return stack.back(); }

    size_t depth() const { return stack.size(); }

private:
    rvoe<NoReturnValue> set_colorspace(const Operator &op,
                                       const ResourceResolver &resources,
                                       bool stroking);
    rvoe<NoReturnValue> set_color(const Operator &op, bool stroking);
    rvoe<NoReturnValue> set_device_color(const Operator &op, Colorspace cs, bool stroking);

    GraphicsState &top() { return stack.back(); }

    std::vector<GraphicsState> stack;
};

} // namespace chromapdf::internal
