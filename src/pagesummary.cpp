// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <pagesummary.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>

#include <fmt/core.h>
#include <fmt/format.h>

namespace chromapdf::internal {

double points_to_mm(double x) {
    const double mm = std::fabs(x) / 72.0 * 25.4;
    return std::floor(mm * 10 + 0.5) / 10.0;
}

rvoe<PageSummary> summarize_pages(const std::vector<PageDescription> &pages,
                                  const PagePredicate &predicate) {
    PageSummary summary;
    summary.num_pages = (int32_t)pages.size();
    for(size_t i = 0; i < pages.size(); ++i) {
        const auto &page = pages[i];
        const auto &box = page.media_box;
        summary.width = std::max(summary.width, points_to_mm(box[2] - box[0]));
        summary.height = std::max(summary.height, points_to_mm(box[3] - box[1]));
        ResourceDictionary empty;
        ResourceResolver &resources = page.resources ? *page.resources : empty;
        auto rc = predicate(page.contents, resources);
        if(!rc) {
            fprintf(stderr,
                    "Page %d failed: %s\n",
                    (int)(i + 1),
                    error_text(rc.error()));
            return std::unexpected(rc.error());
        }
        if(rc.value()) {
            summary.selected_pages.push_back((int32_t)(i + 1));
        }
    }
    return summary;
}

std::string to_json(const PageSummary &summary, PageSelection selection) {
    std::string buf;
    auto app = std::back_inserter(buf);
    fmt::format_to(app,
                   R"({{"NumPages":{},"Width":{},"Height":{},"{}":[)",
                   summary.num_pages,
                   summary.width,
                   summary.height,
                   selection == PageSelection::Marked ? "MarkedPages" : "ColorPages");
    for(size_t i = 0; i < summary.selected_pages.size(); ++i) {
        fmt::format_to(app, "{}{}", i == 0 ? "" : ",", summary.selected_pages[i]);
    }
    buf += "]}";
    return buf;
}

} // namespace chromapdf::internal
