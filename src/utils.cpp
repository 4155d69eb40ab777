// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2024 Jussi Pakkanen
// Copyright 2026 The ChromaPDF authors

#include <utils.hpp>

#include <memory>

#include <zlib.h>

namespace chromapdf::internal {

namespace {

struct DeflateCloser {
    void operator()(z_stream *zs) const {
        if(zs) {
            auto rc = deflateEnd(zs);
            if(rc != Z_OK && rc != Z_DATA_ERROR) {
                fprintf(stderr, "Zlib error when closing: %s\n", zs->msg ? zs->msg : "");
            }
        }
    }
};

struct InflateCloser {
    void operator()(z_stream *zs) const {
        if(zs) {
            inflateEnd(zs);
        }
    }
};

} // namespace

rvoe<std::string> flate_compress(std::string_view data) {
    std::string compressed;
    const int CHUNK = 1024 * 1024;
    std::string buf;
    z_stream strm;
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    auto ret = deflateInit(&strm, Z_BEST_COMPRESSION);
    if(ret != Z_OK) {
        RETERR(CompressionFailure);
    }
    std::unique_ptr<z_stream, DeflateCloser> zcloser(&strm);
    strm.avail_in = data.size();
    strm.next_in = (Bytef *)(data.data()); // Very unsafe.

    do {
        buf.resize(CHUNK);
        strm.avail_out = CHUNK;
        strm.next_out = (Bytef *)buf.data();
        ret = deflate(&strm, Z_FINISH);
        if(ret == Z_STREAM_ERROR) {
            RETERR(CompressionFailure);
        }
        const int write_size = CHUNK - strm.avail_out;
        buf.resize(write_size);
        compressed += buf;
    } while(strm.avail_out == 0);
    if(strm.avail_in != 0) {
        RETERR(CompressionFailure);
    }
    if(ret != Z_STREAM_END) {
        RETERR(CompressionFailure);
    }
    return compressed;
}

rvoe<std::string> flate_decompress(std::string_view data) {
    std::string decompressed;
    const int CHUNK = 1024 * 1024;
    std::string buf;
    z_stream strm;
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = 0;
    strm.next_in = Z_NULL;

    auto ret = inflateInit(&strm);
    if(ret != Z_OK) {
        RETERR(DecompressionFailure);
    }
    std::unique_ptr<z_stream, InflateCloser> zcloser(&strm);
    strm.avail_in = data.size();
    strm.next_in = (Bytef *)(data.data());

    do {
        buf.resize(CHUNK);
        strm.avail_out = CHUNK;
        strm.next_out = (Bytef *)buf.data();
        ret = inflate(&strm, Z_NO_FLUSH);
        if(ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
           ret == Z_STREAM_ERROR) {
            fprintf(stderr, "Zlib error: %s\n", strm.msg ? strm.msg : "unknown");
            RETERR(DecompressionFailure);
        }
        const int write_size = CHUNK - strm.avail_out;
        buf.resize(write_size);
        decompressed += buf;
        if(ret == Z_BUF_ERROR && strm.avail_in == 0) {
            // Truncated stream, keep what we got.
            break;
        }
    } while(ret != Z_STREAM_END);
    return decompressed;
}

rvoe<std::string> load_file_as_bytes(const char *fname) {
    FILE *f = fopen(fname, "rb");
    if(!f) {
        perror(nullptr);
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, FileCloser> fcloser(f);
    return load_file_as_bytes(f);
}

rvoe<std::string> load_file_as_bytes(FILE *f) {
    if(fseek(f, 0, SEEK_END) != 0) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    auto fsize = ftell(f);
    if(fsize < 0) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    std::string contents;
    contents.resize(fsize);
    if(fseek(f, 0, SEEK_SET) != 0) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    auto rc = fread(contents.data(), 1, fsize, f);
    if(rc != (size_t)fsize) {
        perror(nullptr);
        RETERR(FileReadError);
    }
    return contents;
}

} // namespace chromapdf::internal
