// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <stdio.h>

#include <string>
#include <string_view>

namespace chromapdf::internal {

template<class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
#if defined __APPLE__
// This should not be needed, but Xcode 15 still requires it.
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
#endif

rvoe<std::string> flate_compress(std::string_view data);

rvoe<std::string> flate_decompress(std::string_view data);

rvoe<std::string> load_file_as_bytes(const char *fname);

rvoe<std::string> load_file_as_bytes(FILE *f);

struct FileCloser {
    void operator()(FILE *f) const {
        if(f) {
            fclose(f);
        }
    }
};

} // namespace chromapdf::internal
