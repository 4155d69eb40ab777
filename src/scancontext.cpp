// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <scancontext.hpp>

#include <cstdio>

namespace chromapdf::internal {

rvoe<bool> NestingTracker::enter(const ScopedName &key) {
    if(active.contains(key)) {
        fprintf(stderr, "Warning: /%s refers to itself, skipping.\n", key.second.c_str());
        return false;
    }
    if((int32_t)active.size() >= max_depth) {
        fprintf(stderr, "Nesting deeper than %d levels at /%s.\n", (int)max_depth, key.second.c_str());
        RETERR(NestingTooDeep);
    }
    active.insert(key);
    return true;
}

void NestingTracker::leave(const ScopedName &key) { active.erase(key); }

} // namespace chromapdf::internal
