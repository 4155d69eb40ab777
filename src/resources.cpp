// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <resources.hpp>
#include <algorithm>

#include <cstdio>

namespace chromapdf::internal {

namespace {

template<typename T>
std::optional<T> lookup(const std::map<std::string, T> &table, const std::string &name) {
    auto it = table.find(name);
    if(it == table.end()) {
        return {};
    }
    return it->second;
}

rvoe<std::array<double, 3>> read_triplet(const PdfDict &dict, const char *key,
                                         std::array<double, 3> fallback) {
    auto *val = dict_get(dict, key);
    if(!val) {
        return fallback;
    }
    auto arr = as_number_array(*val);
    if(!arr || arr->size() != 3) {
        fprintf(stderr, "%s must be an array of three numbers.\n", key);
        RETERR(WrongOperandType);
    }
    return std::array<double, 3>{(*arr)[0], (*arr)[1], (*arr)[2]};
}

const PdfDict *array_dict(const PdfArray &arr, size_t index) {
    if(arr.size() <= index) {
        return nullptr;
    }
    return as_dict(arr[index]);
}

rvoe<Colorspace> parse_cie_space(const std::string &family, const PdfArray &arr) {
    const PdfDict empty;
    const PdfDict *dict = array_dict(arr, 1);
    if(!dict) {
        dict = &empty;
    }
    if(family == "CalGray") {
        CalGraySpace cs;
        ERC(wp, read_triplet(*dict, "WhitePoint", cs.whitepoint));
        ERC(bp, read_triplet(*dict, "BlackPoint", cs.blackpoint));
        cs.whitepoint = wp;
        cs.blackpoint = bp;
        if(auto *g = dict_get(*dict, "Gamma"); g && as_number(*g)) {
            cs.gamma = *as_number(*g);
        }
        return Colorspace{cs};
    }
    if(family == "CalRGB") {
        CalRGBSpace cs;
        ERC(wp, read_triplet(*dict, "WhitePoint", cs.whitepoint));
        ERC(bp, read_triplet(*dict, "BlackPoint", cs.blackpoint));
        ERC(gamma, read_triplet(*dict, "Gamma", cs.gamma));
        cs.whitepoint = wp;
        cs.blackpoint = bp;
        cs.gamma = gamma;
        if(auto *m = dict_get(*dict, "Matrix")) {
            auto arr = as_number_array(*m);
            if(!arr || arr->size() != 9) {
                RETERR(WrongOperandType);
            }
            std::copy(arr->begin(), arr->end(), cs.matrix.begin());
        }
        return Colorspace{cs};
    }
    LabSpace cs;
    ERC(wp, read_triplet(*dict, "WhitePoint", cs.whitepoint));
    ERC(bp, read_triplet(*dict, "BlackPoint", cs.blackpoint));
    cs.whitepoint = wp;
    cs.blackpoint = bp;
    if(auto *r = dict_get(*dict, "Range")) {
        auto arr = as_number_array(*r);
        if(!arr || arr->size() != 4) {
            RETERR(WrongOperandType);
        }
        std::copy(arr->begin(), arr->end(), cs.range.begin());
    }
    return Colorspace{cs};
}

rvoe<Colorspace> parse_colorspace_array(const PdfArray &arr, const ResourceResolver *resources) {
    if(arr.empty() || !as_name(arr[0])) {
        fprintf(stderr, "Colorspace array does not start with a name.\n");
        RETERR(WrongOperandType);
    }
    const std::string &family = as_name(arr[0])->name;
    if(arr.size() == 1) {
        return resolve_colorspace_name(family, resources);
    }
    if(family == "CalGray" || family == "CalRGB" || family == "Lab") {
        return parse_cie_space(family, arr);
    }
    if(family == "Indexed" || family == "I") {
        if(arr.size() != 4) {
            RETERR(WrongOperandCount);
        }
        ERC(base, parse_colorspace(arr[1], resources));
        auto hival = as_number(arr[2]);
        auto *lookup_str = as_string(arr[3]);
        if(!hival || !lookup_str) {
            RETERR(WrongOperandType);
        }
        IndexedSpace cs;
        cs.base = std::make_shared<const Colorspace>(std::move(base));
        cs.hival = (int32_t)*hival;
        cs.lookup = lookup_str->bytes;
        return Colorspace{std::move(cs)};
    }
    if(family == "Pattern") {
        ERC(underlying, parse_colorspace(arr[1], resources));
        return Colorspace{PatternSpace{std::make_shared<const Colorspace>(std::move(underlying))}};
    }
    if(family == "DeviceN" || family == "Separation") {
        if(arr.size() < 4) {
            RETERR(WrongOperandCount);
        }
        DeviceNSpace cs;
        if(family == "Separation") {
            auto *n = as_name(arr[1]);
            if(!n) {
                RETERR(WrongOperandType);
            }
            cs.colorants.push_back(n->name);
        } else {
            auto *names = as_array(arr[1]);
            if(!names) {
                RETERR(WrongOperandType);
            }
            for(const auto &e : *names) {
                auto *n = as_name(e);
                if(!n) {
                    RETERR(WrongOperandType);
                }
                cs.colorants.push_back(n->name);
            }
        }
        ERC(alternate, parse_colorspace(arr[2], resources));
        ERC(func, function_from_value(arr[3]));
        cs.alternate = std::make_shared<const Colorspace>(std::move(alternate));
        cs.tint_transform = std::move(func);
        return Colorspace{std::move(cs)};
    }
    if(family == "ICCBased") {
        // No profile handling here, the alternate or the device space with
        // the same number of components stands in for it.
        auto *dict = as_dict_or_stream_dict(arr[1]);
        if(!dict) {
            RETERR(WrongOperandType);
        }
        if(auto *alt = dict_get(*dict, "Alternate")) {
            return parse_colorspace(*alt, resources);
        }
        auto *n = dict_get(*dict, "N");
        const int ncomp = n && as_number(*n) ? (int)*as_number(*n) : 0;
        switch(ncomp) {
        case 1:
            return Colorspace{DeviceGraySpace{}};
        case 3:
            return Colorspace{DeviceRGBSpace{}};
        case 4:
            return Colorspace{DeviceCMYKSpace{}};
        default:
            RETERR(UnsupportedColorspace);
        }
    }
    fprintf(stderr, "Unsupported colorspace family %s.\n", family.c_str());
    RETERR(UnsupportedColorspace);
}

} // namespace

std::optional<Colorspace> ResourceDictionary::get_colorspace(const std::string &name) const {
    if(auto local = lookup(colorspace_table, name)) {
        return local;
    }
    return parent ? parent->get_colorspace(name) : std::nullopt;
}

void ResourceDictionary::set_colorspace(const std::string &name, Colorspace cs) {
    if(!colorspace_table.contains(name) && parent && parent->get_colorspace(name)) {
        parent->set_colorspace(name, std::move(cs));
        return;
    }
    colorspace_table.insert_or_assign(name, std::move(cs));
}

std::optional<Pattern> ResourceDictionary::get_pattern(const std::string &name) const {
    if(auto local = lookup(pattern_table, name)) {
        return local;
    }
    return parent ? parent->get_pattern(name) : std::nullopt;
}

void ResourceDictionary::set_pattern(const std::string &name, Pattern pattern) {
    if(!pattern_table.contains(name) && parent && parent->get_pattern(name)) {
        parent->set_pattern(name, std::move(pattern));
        return;
    }
    pattern_table.insert_or_assign(name, std::move(pattern));
}

std::optional<Shading> ResourceDictionary::get_shading(const std::string &name) const {
    if(auto local = lookup(shading_table, name)) {
        return local;
    }
    return parent ? parent->get_shading(name) : std::nullopt;
}

void ResourceDictionary::set_shading(const std::string &name, Shading shading) {
    if(!shading_table.contains(name) && parent && parent->get_shading(name)) {
        parent->set_shading(name, std::move(shading));
        return;
    }
    shading_table.insert_or_assign(name, std::move(shading));
}

std::optional<XObject> ResourceDictionary::get_xobject(const std::string &name) const {
    if(auto local = lookup(xobject_table, name)) {
        return local;
    }
    return parent ? parent->get_xobject(name) : std::nullopt;
}

void ResourceDictionary::set_xobject(const std::string &name, XObject xobj) {
    if(!xobject_table.contains(name) && parent && parent->get_xobject(name)) {
        parent->set_xobject(name, std::move(xobj));
        return;
    }
    xobject_table.insert_or_assign(name, std::move(xobj));
}

rvoe<Colorspace> resolve_colorspace_name(const std::string &name,
                                         const ResourceResolver *resources) {
    if(name == "DeviceGray") {
        return Colorspace{DeviceGraySpace{}};
    }
    if(name == "DeviceRGB") {
        return Colorspace{DeviceRGBSpace{}};
    }
    if(name == "DeviceCMYK") {
        return Colorspace{DeviceCMYKSpace{}};
    }
    if(name == "Pattern") {
        return Colorspace{PatternSpace{}};
    }
    if(resources) {
        if(auto cs = resources->get_colorspace(name)) {
            return std::move(*cs);
        }
    }
    // Inline image abbreviations, only when no resource has the same name.
    if(name == "G") {
        return Colorspace{DeviceGraySpace{}};
    }
    if(name == "RGB") {
        return Colorspace{DeviceRGBSpace{}};
    }
    if(name == "CMYK") {
        return Colorspace{DeviceCMYKSpace{}};
    }
    fprintf(stderr, "Colorspace %s is not defined.\n", name.c_str());
    RETERR(UndefinedColorspace);
}

rvoe<Colorspace> parse_colorspace(const PdfValue &val, const ResourceResolver *resources) {
    if(auto *n = as_name(val)) {
        return resolve_colorspace_name(n->name, resources);
    }
    if(auto *arr = as_array(val)) {
        return parse_colorspace_array(*arr, resources);
    }
    fprintf(stderr, "Colorspace must be a name or an array.\n");
    RETERR(WrongOperandType);
}

} // namespace chromapdf::internal
