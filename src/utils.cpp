// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <utils.hpp>
#include <memory>

namespace chunkpdf {

rvoe<NoReturnValue> write_file(const std::filesystem::path &ofname, std::string_view contents) {
    FILE *f = fopen(ofname.string().c_str(), "wb");
    if(!f) {
        perror(nullptr);
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, FileCloser> fcloser(f);
    if(fwrite(contents.data(), 1, contents.size(), f) != contents.size()) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    if(fflush(f) != 0) {
        perror(nullptr);
        RETERR(FileWriteError);
    }
    RETOK;
}

} // namespace chunkpdf
