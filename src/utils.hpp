// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <filesystem>
#include <string_view>
#include <cstdio>

namespace chunkpdf {

template<class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
#if defined __APPLE__
// This should not be needed, but Xcode 15 still requires it.
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
#endif

rvoe<NoReturnValue> write_file(const std::filesystem::path &ofname, std::string_view contents);

struct FileCloser {
    void operator()(FILE *f) const {
        if(f) {
            fclose(f);
        }
    }
};

} // namespace chunkpdf
