// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <resources.hpp>

#include <map>
#include <set>
#include <string>
#include <utility>

namespace chromapdf::internal {

// The same name means different objects in different resource scopes.
typedef std::pair<const ResourceResolver *, std::string> ScopedName;

// Results already computed during one top level call.
template<typename T> struct VisitedSet {
    std::map<ScopedName, T> patterns;
    std::map<ScopedName, T> shadings;
    std::map<ScopedName, T> xobjects;
};

// Forms and patterns whose content is being processed right now.
class NestingTracker {
public:
    explicit NestingTracker(int32_t max_depth) : max_depth(max_depth) {}

    // False when the stream is already active, i.e. it refers to itself.
    rvoe<bool> enter(const ScopedName &key);
    void leave(const ScopedName &key);

    int32_t depth() const { return (int32_t)active.size(); }

private:
    int32_t max_depth;
    std::set<ScopedName> active;
};

class NestingGuard {
public:
    NestingGuard(NestingTracker &tracker, ScopedName key)
        : tracker(&tracker), key(std::move(key)) {}
    NestingGuard(const NestingGuard &) = delete;
    NestingGuard &operator=(const NestingGuard &) = delete;
    ~NestingGuard() { tracker->leave(key); }

private:
    NestingTracker *tracker;
    ScopedName key;
};

} // namespace chromapdf::internal
