// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <pdfobjects.hpp>
#include <resources.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chromapdf::internal {

struct PageDescription {
    // llx, lly, urx, ury in points.
    std::array<double, 4> media_box{0, 0, 612, 792};
    ContentStream contents;
    std::shared_ptr<ResourceResolver> resources;
};

struct PageSummary {
    int32_t num_pages = 0;
    // Largest page extents in millimeters.
    double width = 0;
    double height = 0;
    // One based.
    std::vector<int32_t> selected_pages;
};

// Decides the name of the page list in the summary.
enum class PageSelection { Colored, Marked };

typedef std::function<rvoe<bool>(const ContentStream &, ResourceResolver &)> PagePredicate;

// Absolute value in points to millimeters rounded to 0.1 mm.
double points_to_mm(double x);

// Stops at the first page that fails.
rvoe<PageSummary> summarize_pages(const std::vector<PageDescription> &pages,
                                  const PagePredicate &predicate);

std::string to_json(const PageSummary &summary, PageSelection selection);

} // namespace chromapdf::internal
