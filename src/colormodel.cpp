// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <colormodel.hpp>
#include <utils.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include <fmt/core.h>

namespace chromapdf::internal {

namespace {

template<typename T> const T *find_space(const Colorspace &cs) {
    if(auto *s = std::get_if<T>(&cs.v)) {
        return s;
    }
    if(auto *indexed = std::get_if<IndexedSpace>(&cs.v); indexed && indexed->base) {
        return find_space<T>(*indexed->base);
    }
    if(auto *devn = std::get_if<DeviceNSpace>(&cs.v); devn && devn->alternate) {
        return find_space<T>(*devn->alternate);
    }
    if(auto *pattern = std::get_if<PatternSpace>(&cs.v); pattern && pattern->underlying) {
        return find_space<T>(*pattern->underlying);
    }
    return nullptr;
}

rvoe<NoReturnValue> check_count(const std::vector<double> &comps, size_t expected) {
    if(comps.size() != expected) {
        fprintf(stderr,
                "Colorspace expects %d components, got %d.\n",
                (int)expected,
                (int)comps.size());
        RETERR(WrongOperandCount);
    }
    RETOK;
}

[[noreturn]] void unknown_color_type(const char *predicate) {
    fprintf(stderr, "%s: unknown color type, pattern colors have no components.\n", predicate);
    std::abort();
}

} // namespace

int32_t num_components(const Colorspace &cs) {
    return std::visit(overloaded{
                          [](const DeviceGraySpace &) -> int32_t { return 1; },
                          [](const DeviceRGBSpace &) -> int32_t { return 3; },
                          [](const DeviceCMYKSpace &) -> int32_t { return 4; },
                          [](const CalGraySpace &) -> int32_t { return 1; },
                          [](const CalRGBSpace &) -> int32_t { return 3; },
                          [](const LabSpace &) -> int32_t { return 3; },
                          [](const IndexedSpace &) -> int32_t { return 1; },
                          [](const PatternSpace &p) -> int32_t {
                              return p.underlying ? num_components(*p.underlying) : 0;
                          },
                          [](const DeviceNSpace &d) -> int32_t {
                              return (int32_t)d.colorants.size();
                          },
                      },
                      cs.v);
}

bool is_pattern_space(const Colorspace &cs) { return std::holds_alternative<PatternSpace>(cs.v); }

Color to_color(const SolidColor &c) {
    return std::visit([](const auto &solid) -> Color { return solid; }, c);
}

std::optional<SolidColor> as_solid(const Color &c) {
    return std::visit(overloaded{
                          [](const PatternColor &) -> std::optional<SolidColor> { return {}; },
                          [](const auto &solid) -> std::optional<SolidColor> { return solid; },
                      },
                      c);
}

Color initial_color(const Colorspace &cs) {
    return std::visit(
        overloaded{
            [](const DeviceGraySpace &) -> Color { return DeviceGrayColor{0.0}; },
            [](const DeviceRGBSpace &) -> Color { return DeviceRGBColor{0.0, 0.0, 0.0}; },
            [](const DeviceCMYKSpace &) -> Color { return DeviceCMYKColor{0.0, 0.0, 0.0, 1.0}; },
            [](const CalGraySpace &) -> Color { return CalGrayColor{0.0}; },
            [](const CalRGBSpace &) -> Color { return CalRGBColor{0.0, 0.0, 0.0}; },
            [](const LabSpace &lab) -> Color {
                return LabColor{0.0,
                                std::clamp(0.0, lab.range[0], lab.range[1]),
                                std::clamp(0.0, lab.range[2], lab.range[3])};
            },
            [&cs](const IndexedSpace &indexed) -> Color {
                auto c = color_from_components(cs, std::vector<double>{0.0});
                if(c) {
                    return to_color(*c);
                }
                return indexed.base ? initial_color(*indexed.base) : Color{DeviceGrayColor{0.0}};
            },
            [](const PatternSpace &) -> Color { return PatternColor{}; },
            [&cs](const DeviceNSpace &devn) -> Color {
                auto c = color_from_components(cs, std::vector<double>(devn.colorants.size(), 1.0));
                if(c) {
                    return to_color(*c);
                }
                return devn.alternate ? initial_color(*devn.alternate)
                                      : Color{DeviceGrayColor{0.0}};
            },
        },
        cs.v);
}

rvoe<SolidColor> color_from_components(const Colorspace &cs, const std::vector<double> &comps) {
    if(auto *indexed = std::get_if<IndexedSpace>(&cs.v)) {
        ERCV(check_count(comps, 1));
        if(!indexed->base) {
            RETERR(UnsupportedColorspace);
        }
        const auto index = std::clamp((int32_t)std::lround(comps[0]), 0, indexed->hival);
        const auto n = num_components(*indexed->base);
        const size_t offset = (size_t)index * n;
        if(n <= 0 || offset + n > indexed->lookup.size()) {
            fprintf(stderr, "Index %d is outside of the color lookup table.\n", (int)index);
            RETERR(IndexOutOfBounds);
        }
        std::vector<double> base_comps;
        for(int32_t i = 0; i < n; ++i) {
            base_comps.push_back((unsigned char)indexed->lookup[offset + i] / 255.0);
        }
        if(auto *lab = std::get_if<LabSpace>(&indexed->base->v)) {
            base_comps[0] *= 100.0;
            base_comps[1] = lab->range[0] + base_comps[1] * (lab->range[1] - lab->range[0]);
            base_comps[2] = lab->range[2] + base_comps[2] * (lab->range[3] - lab->range[2]);
        }
        return color_from_components(*indexed->base, base_comps);
    }
    if(auto *devn = std::get_if<DeviceNSpace>(&cs.v)) {
        ERCV(check_count(comps, devn->colorants.size()));
        if(!devn->alternate) {
            RETERR(UnsupportedColorspace);
        }
        ERC(alt_comps, evaluate_function(devn->tint_transform, comps));
        return color_from_components(*devn->alternate, alt_comps);
    }
    if(std::holds_alternative<PatternSpace>(cs.v)) {
        fprintf(stderr, "Pattern colors need a pattern name.\n");
        RETERR(WrongOperandType);
    }
    ERCV(check_count(comps, num_components(cs)));
    if(std::holds_alternative<DeviceGraySpace>(cs.v)) {
        return DeviceGrayColor{comps[0]};
    }
    if(std::holds_alternative<DeviceRGBSpace>(cs.v)) {
        return DeviceRGBColor{comps[0], comps[1], comps[2]};
    }
    if(std::holds_alternative<DeviceCMYKSpace>(cs.v)) {
        return DeviceCMYKColor{comps[0], comps[1], comps[2], comps[3]};
    }
    if(std::holds_alternative<CalGraySpace>(cs.v)) {
        return CalGrayColor{comps[0]};
    }
    if(std::holds_alternative<CalRGBSpace>(cs.v)) {
        return CalRGBColor{comps[0], comps[1], comps[2]};
    }
    if(auto *lab = std::get_if<LabSpace>(&cs.v)) {
        return LabColor{std::clamp(comps[0], 0.0, 100.0),
                        std::clamp(comps[1], lab->range[0], lab->range[1]),
                        std::clamp(comps[2], lab->range[2], lab->range[3])};
    }
    RETERR(Unreachable);
}

rvoe<PatternColor> pattern_color_from_components(const PatternSpace &cs,
                                                 const std::vector<double> &comps,
                                                 std::string name) {
    PatternColor pc;
    pc.name = std::move(name);
    if(comps.empty()) {
        return pc;
    }
    if(!cs.underlying) {
        fprintf(stderr, "Colored pattern given color components.\n");
        RETERR(WrongOperandCount);
    }
    ERC(underlying, color_from_components(*cs.underlying, comps));
    pc.underlying = std::move(underlying);
    return pc;
}

DeviceRGBColor cmyk_to_rgb(const DeviceCMYKColor &cmyk) {
    const double k = cmyk.k.v();
    const double c = cmyk.c.v() * (1 - k) + k;
    const double m = cmyk.m.v() * (1 - k) + k;
    const double y = cmyk.y.v() * (1 - k) + k;
    return DeviceRGBColor{1 - c, 1 - m, 1 - y};
}

DeviceGrayColor rgb_to_gray(const DeviceRGBColor &rgb) {
    return DeviceGrayColor{0.3 * rgb.r.v() + 0.59 * rgb.g.v() + 0.11 * rgb.b.v()};
}

rvoe<DeviceRGBColor>
to_rgb(const SolidColor &c, const Colorspace &cs, const ColorConverter &conv) {
    if(auto *gray = std::get_if<DeviceGrayColor>(&c)) {
        return DeviceRGBColor{gray->v, gray->v, gray->v};
    }
    if(auto *rgb = std::get_if<DeviceRGBColor>(&c)) {
        return *rgb;
    }
    if(auto *cmyk = std::get_if<DeviceCMYKColor>(&c)) {
        return cmyk_to_rgb(*cmyk);
    }
    if(auto *calgray = std::get_if<CalGrayColor>(&c)) {
        const auto *space = find_space<CalGraySpace>(cs);
        const double v = std::pow(calgray->v.v(), space ? space->gamma : 1.0);
        return DeviceRGBColor{v, v, v};
    }
    if(auto *calrgb = std::get_if<CalRGBColor>(&c)) {
        const auto *space = find_space<CalRGBSpace>(cs);
        return conv.to_rgb(*calrgb, space ? *space : CalRGBSpace{});
    }
    if(auto *lab = std::get_if<LabColor>(&c)) {
        const auto *space = find_space<LabSpace>(cs);
        return conv.to_rgb(*lab, space ? *space : LabSpace{});
    }
    RETERR(Unreachable);
}

rvoe<DeviceGrayColor>
to_gray(const SolidColor &c, const Colorspace &cs, const ColorConverter &conv) {
    if(auto *gray = std::get_if<DeviceGrayColor>(&c)) {
        return *gray;
    }
    ERC(rgb, to_rgb(c, cs, conv));
    return rgb_to_gray(rgb);
}

bool is_rgb_colored(double r, double g, double b) {
    return std::fabs(r - g) > COLOR_TOLERANCE || std::fabs(r - b) > COLOR_TOLERANCE ||
           std::fabs(g - b) > COLOR_TOLERANCE;
}

bool is_colored(const Color &c) {
    return std::visit(overloaded{
                          [](const DeviceGrayColor &) { return false; },
                          [](const CalGrayColor &) { return false; },
                          [](const DeviceRGBColor &rgb) {
                              return is_rgb_colored(rgb.r.v(), rgb.g.v(), rgb.b.v());
                          },
                          [](const CalRGBColor &cal) {
                              return is_rgb_colored(cal.a.v(), cal.b.v(), cal.c.v());
                          },
                          [](const DeviceCMYKColor &cmyk) {
                              const auto rgb = cmyk_to_rgb(cmyk);
                              return is_rgb_colored(rgb.r.v(), rgb.g.v(), rgb.b.v());
                          },
                          [](const LabColor &lab) {
                              return std::fabs(lab.a) > COLOR_TOLERANCE ||
                                     std::fabs(lab.b) > COLOR_TOLERANCE;
                          },
                          [](const PatternColor &) -> bool { unknown_color_type("is_colored"); },
                      },
                      c);
}

bool visible_additive(std::initializer_list<double> components) {
    return std::any_of(components.begin(), components.end(), [](double x) {
        return std::fabs(x) < ADDITIVE_ZERO;
    });
}

bool visible_subtractive(std::initializer_list<double> components) {
    return std::any_of(components.begin(), components.end(), [](double x) {
        return std::fabs(x) > COLOR_TOLERANCE;
    });
}

bool is_visible_mark(const Color &c) {
    return std::visit(
        overloaded{
            [](const DeviceGrayColor &gray) { return visible_additive({gray.v.v()}); },
            [](const CalGrayColor &gray) { return visible_additive({gray.v.v()}); },
            [](const DeviceRGBColor &rgb) {
                return visible_additive({rgb.r.v(), rgb.g.v(), rgb.b.v()});
            },
            [](const CalRGBColor &cal) {
                return visible_additive({cal.a.v(), cal.b.v(), cal.c.v()});
            },
            [](const DeviceCMYKColor &cmyk) {
                return visible_subtractive({cmyk.c.v(), cmyk.m.v(), cmyk.y.v(), cmyk.k.v()});
            },
            // Lightness only, scaled to [0, 1].
            [](const LabColor &lab) { return visible_additive({lab.l / 100.0}); },
            [](const PatternColor &) -> bool { unknown_color_type("is_visible_mark"); },
        },
        c);
}

std::string color_to_string(const Color &c) {
    return std::visit(
        overloaded{
            [](const DeviceGrayColor &gray) { return fmt::format("gray {}", gray.v.v()); },
            [](const CalGrayColor &gray) { return fmt::format("calgray {}", gray.v.v()); },
            [](const DeviceRGBColor &rgb) {
                return fmt::format("rgb {} {} {}", rgb.r.v(), rgb.g.v(), rgb.b.v());
            },
            [](const CalRGBColor &cal) {
                return fmt::format("calrgb {} {} {}", cal.a.v(), cal.b.v(), cal.c.v());
            },
            [](const DeviceCMYKColor &cmyk) {
                return fmt::format(
                    "cmyk {} {} {} {}", cmyk.c.v(), cmyk.m.v(), cmyk.y.v(), cmyk.k.v());
            },
            [](const LabColor &lab) { return fmt::format("lab {} {} {}", lab.l, lab.a, lab.b); },
            [](const PatternColor &pc) {
                if(pc.underlying) {
                    return fmt::format("pattern /{} over {}",
                                       pc.name,
                                       color_to_string(to_color(*pc.underlying)));
                }
                return fmt::format("pattern /{}", pc.name);
            },
        },
        c);
}

} // namespace chromapdf::internal
