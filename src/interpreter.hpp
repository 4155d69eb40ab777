// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <colormodel.hpp>
#include <errorhandling.hpp>
#include <graphicsstate.hpp>
#include <pdfobjects.hpp>
#include <resources.hpp>

#include <cstdio>
#include <initializer_list>
#include <string>
#include <unordered_map>

namespace chromapdf::internal {

// Handlers see the state after the operator has been applied. They must not
// change the state, all scan results go into the context.
template<typename Context>
using OperatorHandler = rvoe<NoReturnValue> (*)(Context &ctx,
                                                const Operator &op,
                                                const GraphicsState &gs,
                                                ResourceResolver &resources);

template<typename Context> class HandlerSet {
public:
    void set_all_operators(OperatorHandler<Context> h) { all = h; }

    void add(const char *opname, OperatorHandler<Context> h) { by_name[opname] = h; }

    void add(std::initializer_list<const char *> opnames, OperatorHandler<Context> h) {
        for(const auto *name : opnames) {
            by_name[name] = h;
        }
    }

    OperatorHandler<Context> all_operators() const { return all; }

    OperatorHandler<Context> find(const std::string &opname) const {
        auto it = by_name.find(opname);
        if(it == by_name.end()) {
            return nullptr;
        }
        return it->second;
    }

private:
    OperatorHandler<Context> all = nullptr;
    std::unordered_map<std::string, OperatorHandler<Context>> by_name;
};

// Walks the operators in order. Each operator first updates the graphics
// state, then the all-operators handler runs, then the handler registered for
// its name. Never recurses by itself, that is up to the handlers.
template<typename Context>
rvoe<NoReturnValue> process(const ContentStream &ops,
                            ResourceResolver &resources,
                            const HandlerSet<Context> &handlers,
                            Context &ctx,
                            GraphicsState initial = GraphicsState{},
                            bool verbose = false) {
    GraphicsStateStack states(std::move(initial));
    for(const auto &op : ops) {
        ERCV(states.apply(op, resources));
        if(verbose) {
            if(is_color_operator(op.name)) {
                fprintf(stderr,
                        "%s: stroke %s, fill %s, depth %d\n",
                        op.name.c_str(),
                        color_to_string(states.current().stroking_color).c_str(),
                        color_to_string(states.current().nonstroking_color).c_str(),
                        (int)states.depth());
            } else {
                fprintf(stderr, "%s\n", op.name.c_str());
            }
        }
        if(auto h = handlers.all_operators()) {
            ERCV(h(ctx, op, states.current(), resources));
        }
        if(auto h = handlers.find(op.name)) {
            ERCV(h(ctx, op, states.current(), resources));
        }
    }
    RETOK;
}

} // namespace chromapdf::internal
