// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <contentparser.hpp>
#include <resources.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        fprintf(stderr, "%s:%d: check failed: %s\n", __FILE__, __LINE__, #cond);                   \
        return 1;                                                                                  \
    }

// Unwraps an rvoe, failing the test on error.
#define CHECK_OK(varname, func)                                                                    \
    auto varname##_rc = func;                                                                      \
    if(!(varname##_rc)) {                                                                          \
        fprintf(stderr,                                                                            \
                "%s:%d: %s failed: %s\n",                                                          \
                __FILE__,                                                                          \
                __LINE__,                                                                          \
                #func,                                                                             \
                chromapdf::internal::error_text(varname##_rc.error()));                            \
        return 1;                                                                                  \
    }                                                                                              \
    auto &varname = varname##_rc.value();

#define CHECK_ERROR(func, code)                                                                    \
    {                                                                                              \
        auto rc_ = func;                                                                           \
        if(rc_ || rc_.error() != chromapdf::internal::ErrorCode::code) {                           \
            fprintf(stderr, "%s:%d: %s did not fail with %s\n", __FILE__, __LINE__, #func, #code); \
            return 1;                                                                              \
        }                                                                                          \
    }

namespace chromapdf::internal {

inline bool close_to(double a, double b, double eps = 1e-6) { return std::fabs(a - b) < eps; }

inline ContentStream parse_or_die(const char *text) {
    auto ops = parse_content_stream(text);
    if(!ops) {
        fprintf(stderr, "Could not parse test stream: %s\n", text);
        std::abort();
    }
    return std::move(ops.value());
}

// Counts lookups so memoization can be observed.
class CountingResolver : public ResourceDictionary {
public:
    std::optional<Pattern> get_pattern(const std::string &name) const override {
        ++pattern_lookups;
        return ResourceDictionary::get_pattern(name);
    }

    std::optional<Shading> get_shading(const std::string &name) const override {
        ++shading_lookups;
        return ResourceDictionary::get_shading(name);
    }

    std::optional<XObject> get_xobject(const std::string &name) const override {
        ++xobject_lookups;
        return ResourceDictionary::get_xobject(name);
    }

    mutable int pattern_lookups = 0;
    mutable int shading_lookups = 0;
    mutable int xobject_lookups = 0;
};

} // namespace chromapdf::internal
