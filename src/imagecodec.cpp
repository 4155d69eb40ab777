// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <imagecodec.hpp>
#include <colormodel.hpp>
#include <utils.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <unordered_map>

#include <jpeglib.h>

namespace chromapdf::internal {

namespace {

struct JpegError {
    struct jpeg_error_mgr jmgr;
    jmp_buf buf;
};

void jpegErrorExit(j_common_ptr cinfo) {
    JpegError *e = (JpegError *)cinfo->err;
    char msg[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, msg);
    fprintf(stderr, "Libjpeg error: %s\n", msg);
    longjmp(e->buf, 1);
}

struct JpegDecompressCloser {
    void operator()(jpeg_decompress_struct *j) const {
        if(j) {
            jpeg_destroy_decompress(j);
        }
    }
};

struct JpegCompressCloser {
    void operator()(jpeg_compress_struct *j) const {
        if(j) {
            jpeg_destroy_compress(j);
        }
    }
};

struct FreeCloser {
    void operator()(unsigned char *p) const { free(p); }
};

// Inline images may use the abbreviated forms.
std::string full_filter_name(const std::string &name) {
    if(name == "AHx") {
        return "ASCIIHexDecode";
    }
    if(name == "A85") {
        return "ASCII85Decode";
    }
    if(name == "LZW") {
        return "LZWDecode";
    }
    if(name == "Fl") {
        return "FlateDecode";
    }
    if(name == "RL") {
        return "RunLengthDecode";
    }
    if(name == "CCF") {
        return "CCITTFaxDecode";
    }
    if(name == "DCT") {
        return "DCTDecode";
    }
    return name;
}

std::string abbreviated_filter_name(const std::string &name) {
    if(name == "ASCIIHexDecode") {
        return "AHx";
    }
    if(name == "ASCII85Decode") {
        return "A85";
    }
    if(name == "LZWDecode") {
        return "LZW";
    }
    if(name == "FlateDecode") {
        return "Fl";
    }
    if(name == "RunLengthDecode") {
        return "RL";
    }
    if(name == "CCITTFaxDecode") {
        return "CCF";
    }
    if(name == "DCTDecode") {
        return "DCT";
    }
    return name;
}

int64_t dict_int(const PdfDict &d, const char *key, int64_t fallback) {
    auto *v = dict_get(d, key);
    if(!v || !as_number(*v)) {
        return fallback;
    }
    return (int64_t)*as_number(*v);
}

uint8_t paeth(uint8_t a, uint8_t b, uint8_t c) {
    const int p = (int)a + (int)b - (int)c;
    const int pa = std::abs(p - (int)a);
    const int pb = std::abs(p - (int)b);
    const int pc = std::abs(p - (int)c);
    if(pa <= pb && pa <= pc) {
        return a;
    }
    if(pb <= pc) {
        return b;
    }
    return c;
}

rvoe<std::string> undo_predictor(std::string data, const PdfDict &parms) {
    const auto predictor = dict_int(parms, "Predictor", 1);
    if(predictor == 1) {
        return data;
    }
    const auto colors = dict_int(parms, "Colors", 1);
    const auto bpc = dict_int(parms, "BitsPerComponent", 8);
    const auto columns = dict_int(parms, "Columns", 1);
    if(colors < 1 || bpc < 1 || columns < 1) {
        RETERR(UnsupportedFilter);
    }
    const size_t bytes_per_pixel = std::max<size_t>(1, (colors * bpc + 7) / 8);
    const size_t row_bytes = (columns * colors * bpc + 7) / 8;
    if(predictor == 2) {
        if(bpc != 8) {
            fprintf(stderr, "TIFF predictor only supported for 8 bit samples.\n");
            RETERR(UnsupportedFilter);
        }
        for(size_t row = 0; row + row_bytes <= data.size(); row += row_bytes) {
            for(size_t i = bytes_per_pixel; i < row_bytes; ++i) {
                data[row + i] = (char)((uint8_t)data[row + i] + (uint8_t)data[row + i - bytes_per_pixel]);
            }
        }
        return data;
    }
    if(predictor < 10 || predictor > 15) {
        fprintf(stderr, "Unknown predictor %d.\n", (int)predictor);
        RETERR(UnsupportedFilter);
    }
    std::string result;
    std::string prev(row_bytes, '\0');
    size_t offset = 0;
    while(offset + 1 + row_bytes <= data.size()) {
        const auto filter_type = (uint8_t)data[offset];
        std::string row = data.substr(offset + 1, row_bytes);
        offset += row_bytes + 1;
        for(size_t i = 0; i < row_bytes; ++i) {
            const uint8_t left = i >= bytes_per_pixel ? (uint8_t)row[i - bytes_per_pixel] : 0;
            const uint8_t up = (uint8_t)prev[i];
            const uint8_t upleft = i >= bytes_per_pixel ? (uint8_t)prev[i - bytes_per_pixel] : 0;
            uint8_t add;
            switch(filter_type) {
            case 0:
                add = 0;
                break;
            case 1:
                add = left;
                break;
            case 2:
                add = up;
                break;
            case 3:
                add = (uint8_t)(((int)left + (int)up) / 2);
                break;
            case 4:
                add = paeth(left, up, upleft);
                break;
            default:
                fprintf(stderr, "Invalid PNG row filter %d.\n", (int)filter_type);
                RETERR(DecompressionFailure);
            }
            row[i] = (char)((uint8_t)row[i] + add);
        }
        result += row;
        prev = std::move(row);
    }
    return result;
}

const PdfDict &parms_for(const ImageXObject &image, size_t i) {
    static const PdfDict empty;
    if(i < image.decode_parms.size()) {
        return image.decode_parms[i];
    }
    return empty;
}

// Default Decode array of a colorspace for the given sample depth.
std::vector<double> default_decode(const Colorspace &cs, int32_t bpc) {
    if(std::holds_alternative<IndexedSpace>(cs.v)) {
        return {0.0, std::pow(2.0, bpc) - 1};
    }
    if(auto *lab = std::get_if<LabSpace>(&cs.v)) {
        return {0.0, 100.0, lab->range[0], lab->range[1], lab->range[2], lab->range[3]};
    }
    std::vector<double> d;
    for(int32_t i = 0; i < num_components(cs); ++i) {
        d.push_back(0.0);
        d.push_back(1.0);
    }
    return d;
}

uint32_t read_sample(const std::string &samples, size_t bit_offset, int32_t bpc) {
    if(bpc == 8) {
        return (uint8_t)samples[bit_offset / 8];
    }
    if(bpc == 16) {
        const size_t byte = bit_offset / 8;
        return ((uint32_t)(uint8_t)samples[byte] << 8) | (uint8_t)samples[byte + 1];
    }
    const auto byte = (uint8_t)samples[bit_offset / 8];
    const int shift = 8 - bpc - (int)(bit_offset % 8);
    return (byte >> shift) & ((1u << bpc) - 1);
}

bool is_gray_space(const Colorspace &cs) {
    if(std::holds_alternative<DeviceGraySpace>(cs.v) || std::holds_alternative<CalGraySpace>(cs.v)) {
        return true;
    }
    if(auto *indexed = std::get_if<IndexedSpace>(&cs.v)) {
        return indexed->base && is_gray_space(*indexed->base);
    }
    if(auto *devn = std::get_if<DeviceNSpace>(&cs.v)) {
        return devn->alternate && is_gray_space(*devn->alternate);
    }
    return false;
}

ImageXObject gray_image_base(const ImageXObject &original) {
    ImageXObject gray;
    gray.width = original.width;
    gray.height = original.height;
    gray.bits_per_component = 8;
    gray.colorspace = Colorspace{DeviceGraySpace{}};
    gray.smask = original.smask;
    for(const auto &[key, value] : original.extra) {
        // Color key masking is given in the original components.
        if(key == "Mask" && as_array(value)) {
            continue;
        }
        gray.extra[key] = value;
    }
    return gray;
}

bool is_modeled_image_key(const std::string &key) {
    static const std::array<const char *, 20> modeled{"Type",
                                                       "Subtype",
                                                       "Width",
                                                       "W",
                                                       "Height",
                                                       "H",
                                                       "BitsPerComponent",
                                                       "BPC",
                                                       "ImageMask",
                                                       "IM",
                                                       "ColorSpace",
                                                       "CS",
                                                       "Filter",
                                                       "F",
                                                       "DecodeParms",
                                                       "DP",
                                                       "Decode",
                                                       "D",
                                                       "Length",
                                                       "SMask"};
    return std::find(modeled.begin(), modeled.end(), key) != modeled.end();
}

rvoe<ImageXObject>
image_from_params(const PdfDict &p, std::string data, const ResourceResolver *resources) {
    ImageXObject image;
    auto *w = dict_get(p, "Width", "W");
    auto *h = dict_get(p, "Height", "H");
    if(!w || !h || !as_number(*w) || !as_number(*h)) {
        RETERR(InvalidImageSize);
    }
    image.width = (int32_t)*as_number(*w);
    image.height = (int32_t)*as_number(*h);
    if(auto *bpc = dict_get(p, "BitsPerComponent", "BPC"); bpc && as_number(*bpc)) {
        image.bits_per_component = (int32_t)*as_number(*bpc);
    }
    if(auto *im = dict_get(p, "ImageMask", "IM")) {
        image.image_mask = as_bool(*im).value_or(false);
    }
    if(auto *cs = dict_get(p, "ColorSpace", "CS")) {
        ERC(parsed, parse_colorspace(*cs, resources));
        image.colorspace = std::move(parsed);
    }
    if(auto *f = dict_get(p, "Filter", "F")) {
        if(auto *n = as_name(*f)) {
            image.filters.push_back(full_filter_name(n->name));
        } else if(auto *arr = as_array(*f)) {
            for(const auto &e : *arr) {
                auto *fn = as_name(e);
                if(!fn) {
                    RETERR(WrongOperandType);
                }
                image.filters.push_back(full_filter_name(fn->name));
            }
        } else {
            RETERR(WrongOperandType);
        }
    }
    if(auto *dp = dict_get(p, "DecodeParms", "DP")) {
        if(auto *dict = as_dict(*dp)) {
            image.decode_parms.push_back(*dict);
        } else if(auto *arr = as_array(*dp)) {
            for(const auto &e : *arr) {
                auto *dict = as_dict(e);
                image.decode_parms.push_back(dict ? *dict : PdfDict{});
            }
        }
    }
    if(auto *d = dict_get(p, "Decode", "D")) {
        auto arr = as_number_array(*d);
        if(!arr) {
            RETERR(WrongOperandType);
        }
        image.decode = std::move(*arr);
    }
    if(auto *sm = dict_get(p, "SMask")) {
        auto *stream = as_stream(*sm);
        if(!stream) {
            fprintf(stderr, "Soft mask must be an image stream.\n");
            RETERR(WrongOperandType);
        }
        image.smask = *stream;
    }
    for(const auto &[key, value] : p) {
        if(!is_modeled_image_key(key)) {
            image.extra[key] = value;
        }
    }
    image.data = std::move(data);
    return image;
}

} // namespace

bool has_filter(const ImageXObject &image, const char *filter) {
    return std::find(image.filters.begin(), image.filters.end(), filter) != image.filters.end();
}

ImageHandling classify_image(const ImageXObject &image) {
    if(has_filter(image, "JPXDecode")) {
        return ImageHandling::Jpeg2000;
    }
    if(has_filter(image, "CCITTFaxDecode") || has_filter(image, "JBIG2Decode")) {
        return ImageHandling::Bilevel;
    }
    if(image.image_mask || !image.colorspace || is_gray_space(*image.colorspace)) {
        return ImageHandling::AlreadyGray;
    }
    if(has_filter(image, "RunLengthDecode") && image.smask) {
        return ImageHandling::RunLengthWithSoftMask;
    }
    return ImageHandling::Convert;
}

rvoe<std::string> run_length_decode(std::string_view data) {
    std::string result;
    size_t i = 0;
    while(i < data.size()) {
        const auto length = (uint8_t)data[i++];
        if(length == 128) {
            return result;
        }
        if(length < 128) {
            const size_t count = length + 1;
            if(i + count > data.size()) {
                RETERR(DecompressionFailure);
            }
            result.append(data.substr(i, count));
            i += count;
        } else {
            if(i >= data.size()) {
                RETERR(DecompressionFailure);
            }
            result.append(257 - length, data[i++]);
        }
    }
    return result;
}

std::string run_length_encode(std::string_view data) {
    std::string result;
    size_t i = 0;
    while(i < data.size()) {
        size_t run = 1;
        while(i + run < data.size() && run < 128 && data[i + run] == data[i]) {
            ++run;
        }
        if(run > 1) {
            result += (char)(257 - run);
            result += data[i];
            i += run;
            continue;
        }
        size_t literal = 1;
        while(i + literal < data.size() && literal < 128 &&
              !(i + literal + 1 < data.size() && data[i + literal] == data[i + literal + 1])) {
            ++literal;
        }
        result += (char)(literal - 1);
        result.append(data.substr(i, literal));
        i += literal;
    }
    result += (char)128;
    return result;
}

rvoe<std::string> ascii_hex_decode(std::string_view data) {
    std::string result;
    int high = -1;
    for(const char c : data) {
        if(c == '>') {
            break;
        }
        int nibble;
        if(c >= '0' && c <= '9') {
            nibble = c - '0';
        } else if(c >= 'a' && c <= 'f') {
            nibble = c - 'a' + 10;
        } else if(c >= 'A' && c <= 'F') {
            nibble = c - 'A' + 10;
        } else if(c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0') {
            continue;
        } else {
            RETERR(DecompressionFailure);
        }
        if(high < 0) {
            high = nibble;
        } else {
            result += (char)((high << 4) | nibble);
            high = -1;
        }
    }
    if(high >= 0) {
        result += (char)(high << 4);
    }
    return result;
}

std::string ascii_hex_encode(std::string_view data) {
    static const char digits[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(data.size() * 2 + 1);
    for(const char c : data) {
        result += digits[((uint8_t)c) >> 4];
        result += digits[((uint8_t)c) & 0xF];
    }
    result += '>';
    return result;
}

rvoe<std::string> ascii85_decode(std::string_view data) {
    std::string result;
    uint32_t tuple = 0;
    int count = 0;
    for(size_t i = 0; i < data.size(); ++i) {
        const char c = data[i];
        if(c == '~') {
            break;
        }
        if(c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0') {
            continue;
        }
        if(c == 'z' && count == 0) {
            result.append(4, '\0');
            continue;
        }
        if(c < '!' || c > 'u') {
            RETERR(DecompressionFailure);
        }
        tuple = tuple * 85 + (uint32_t)(c - '!');
        if(++count == 5) {
            for(int shift = 24; shift >= 0; shift -= 8) {
                result += (char)((tuple >> shift) & 0xFF);
            }
            tuple = 0;
            count = 0;
        }
    }
    if(count == 1) {
        RETERR(DecompressionFailure);
    }
    if(count > 0) {
        for(int i = count; i < 5; ++i) {
            tuple = tuple * 85 + 84;
        }
        for(int i = 0; i < count - 1; ++i) {
            result += (char)((tuple >> (24 - 8 * i)) & 0xFF);
        }
    }
    return result;
}

rvoe<RawImage> dct_decode(std::string_view data) {
    RawImage im;
    struct jpeg_decompress_struct cinfo {};
    JpegError jerr;
    std::unique_ptr<jpeg_decompress_struct, JpegDecompressCloser> jpgcloser(&cinfo);

    // Libjpeg kills the process on invalid input unless the error
    // handler jumps out.
    cinfo.err = jpeg_std_error(&jerr.jmgr);
    jerr.jmgr.error_exit = jpegErrorExit;
    if(setjmp(jerr.buf)) {
        RETERR(DecompressionFailure);
    }
    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, (const unsigned char *)data.data(), data.size());
    if(jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        RETERR(DecompressionFailure);
    }
    jpeg_start_decompress(&cinfo);
    im.width = cinfo.output_width;
    im.height = cinfo.output_height;
    im.components = cinfo.output_components;
    im.bits_per_component = 8;
    const size_t row_stride = (size_t)cinfo.output_width * cinfo.output_components;
    im.samples.resize(row_stride * cinfo.output_height);
    while(cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = (JSAMPROW)im.samples.data() + row_stride * cinfo.output_scanline;
        jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    return im;
}

rvoe<std::string>
dct_encode_gray(std::string_view pixels, int32_t w, int32_t h, int32_t quality) {
    if(w <= 0 || h <= 0) {
        RETERR(InvalidImageSize);
    }
    if(pixels.size() < (size_t)w * h) {
        RETERR(MissingPixels);
    }
    struct jpeg_compress_struct cinfo {};
    JpegError jerr;
    unsigned char *outbuf = nullptr;
    unsigned long outsize = 0;
    std::unique_ptr<jpeg_compress_struct, JpegCompressCloser> jpgcloser(&cinfo);

    cinfo.err = jpeg_std_error(&jerr.jmgr);
    jerr.jmgr.error_exit = jpegErrorExit;
    if(setjmp(jerr.buf)) {
        free(outbuf);
        RETERR(CompressionFailure);
    }
    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &outbuf, &outsize);
    cinfo.image_width = w;
    cinfo.image_height = h;
    cinfo.input_components = 1;
    cinfo.in_color_space = JCS_GRAYSCALE;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);
    while(cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = (JSAMPROW)pixels.data() + (size_t)cinfo.next_scanline * w;
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    std::unique_ptr<unsigned char, FreeCloser> bufcloser(outbuf);
    return std::string((const char *)outbuf, outsize);
}

rvoe<RawImage> decode_image(const ImageXObject &image) {
    if(image.width <= 0 || image.height <= 0) {
        RETERR(InvalidImageSize);
    }
    RawImage raw;
    raw.width = image.width;
    raw.height = image.height;
    raw.bits_per_component = image.image_mask ? 1 : image.bits_per_component;
    raw.components = image.colorspace ? num_components(*image.colorspace) : 1;
    std::string data = image.data;
    for(size_t i = 0; i < image.filters.size(); ++i) {
        const auto filter = full_filter_name(image.filters[i]);
        if(filter == "FlateDecode") {
            ERC(inflated, flate_decompress(data));
            ERC(unpredicted, undo_predictor(std::move(inflated), parms_for(image, i)));
            data = std::move(unpredicted);
        } else if(filter == "RunLengthDecode") {
            ERC(decoded, run_length_decode(data));
            data = std::move(decoded);
        } else if(filter == "ASCIIHexDecode") {
            ERC(decoded, ascii_hex_decode(data));
            data = std::move(decoded);
        } else if(filter == "ASCII85Decode") {
            ERC(decoded, ascii85_decode(data));
            data = std::move(decoded);
        } else if(filter == "DCTDecode") {
            if(i + 1 != image.filters.size()) {
                RETERR(UnsupportedFilter);
            }
            ERC(jpeg, dct_decode(data));
            if(jpeg.width != image.width || jpeg.height != image.height) {
                RETERR(InvalidImageSize);
            }
            if(jpeg.components != raw.components) {
                fprintf(stderr,
                        "JPEG has %d components, colorspace needs %d.\n",
                        (int)jpeg.components,
                        (int)raw.components);
                RETERR(UnsupportedColorspace);
            }
            return jpeg;
        } else {
            fprintf(stderr, "Unsupported filter %s.\n", filter.c_str());
            RETERR(UnsupportedFilter);
        }
    }
    const size_t row_bytes =
        ((size_t)raw.width * raw.components * raw.bits_per_component + 7) / 8;
    const size_t needed = row_bytes * raw.height;
    if(data.size() < needed) {
        fprintf(stderr,
                "Image needs %d bytes of samples, got %d.\n",
                (int)needed,
                (int)data.size());
        RETERR(MissingPixels);
    }
    data.resize(needed);
    raw.samples = std::move(data);
    return raw;
}

rvoe<RgbImage> image_to_rgb(const RawImage &raw,
                            const Colorspace &cs,
                            const std::vector<double> &decode,
                            const ColorConverter &conv) {
    const int32_t bpc = raw.bits_per_component;
    if(bpc != 1 && bpc != 2 && bpc != 4 && bpc != 8 && bpc != 16) {
        RETERR(UnsupportedFilter);
    }
    const int32_t ncomp = num_components(cs);
    if(ncomp != raw.components || ncomp <= 0) {
        RETERR(UnsupportedColorspace);
    }
    const auto d = decode.size() == 2 * (size_t)ncomp ? decode : default_decode(cs, bpc);
    const double max_sample = std::pow(2.0, bpc) - 1;
    const size_t row_bits = (((size_t)raw.width * ncomp * bpc + 7) / 8) * 8;
    if(raw.samples.size() * 8 < row_bits * raw.height) {
        RETERR(MissingPixels);
    }

    RgbImage rgb;
    rgb.width = raw.width;
    rgb.height = raw.height;
    rgb.pixels.resize((size_t)raw.width * raw.height * 3);

    const bool device_space = std::holds_alternative<DeviceGraySpace>(cs.v) ||
                              std::holds_alternative<DeviceRGBSpace>(cs.v) ||
                              std::holds_alternative<DeviceCMYKSpace>(cs.v);
    std::unordered_map<std::string, std::array<uint8_t, 3>> cache;
    std::vector<double> comps(ncomp);
    std::string key(ncomp * sizeof(uint32_t), '\0');
    size_t out = 0;
    for(int32_t y = 0; y < raw.height; ++y) {
        size_t bit = row_bits * y;
        for(int32_t x = 0; x < raw.width; ++x) {
            for(int32_t c = 0; c < ncomp; ++c) {
                const uint32_t s = read_sample(raw.samples, bit, bpc);
                bit += bpc;
                memcpy(key.data() + c * sizeof(uint32_t), &s, sizeof(uint32_t));
                comps[c] = d[2 * c] + s * (d[2 * c + 1] - d[2 * c]) / max_sample;
            }
            std::array<uint8_t, 3> px;
            auto it = device_space ? cache.end() : cache.find(key);
            if(it != cache.end()) {
                px = it->second;
            } else {
                ERC(color, color_from_components(cs, comps));
                ERC(converted, to_rgb(color, cs, conv));
                px = {(uint8_t)std::lround(converted.r.v() * 255),
                      (uint8_t)std::lround(converted.g.v() * 255),
                      (uint8_t)std::lround(converted.b.v() * 255)};
                if(!device_space) {
                    cache[key] = px;
                }
            }
            rgb.pixels[out++] = (char)px[0];
            rgb.pixels[out++] = (char)px[1];
            rgb.pixels[out++] = (char)px[2];
        }
    }
    return rgb;
}

std::string rgb_to_gray_pixels(const RgbImage &rgb) {
    std::string gray;
    gray.reserve(rgb.pixels.size() / 3);
    for(size_t i = 0; i + 2 < rgb.pixels.size(); i += 3) {
        const DeviceRGBColor c{(uint8_t)rgb.pixels[i] / 255.0,
                               (uint8_t)rgb.pixels[i + 1] / 255.0,
                               (uint8_t)rgb.pixels[i + 2] / 255.0};
        gray += (char)std::lround(rgb_to_gray(c).v.v() * 255);
    }
    return gray;
}

bool has_colored_pixels(const RgbImage &rgb) {
    for(size_t i = 0; i + 2 < rgb.pixels.size(); i += 3) {
        if(is_rgb_colored((uint8_t)rgb.pixels[i] / 255.0,
                          (uint8_t)rgb.pixels[i + 1] / 255.0,
                          (uint8_t)rgb.pixels[i + 2] / 255.0)) {
            return true;
        }
    }
    return false;
}

rvoe<ImageXObject>
encode_gray_image(const ImageXObject &original, std::string gray_pixels, int32_t jpeg_quality) {
    auto gray = gray_image_base(original);
    if(original.filters.empty()) {
        gray.data = std::move(gray_pixels);
        return gray;
    }
    if(original.filters.size() > 1) {
        RETERR(UnsupportedEncodingParameters);
    }
    if(dict_int(parms_for(original, 0), "Predictor", 1) != 1) {
        RETERR(UnsupportedEncodingParameters);
    }
    const auto filter = full_filter_name(original.filters.front());
    if(filter == "FlateDecode") {
        ERC(compressed, flate_compress(gray_pixels));
        gray.data = std::move(compressed);
    } else if(filter == "DCTDecode") {
        ERC(jpeg, dct_encode_gray(gray_pixels, gray.width, gray.height, jpeg_quality));
        gray.data = std::move(jpeg);
    } else if(filter == "RunLengthDecode") {
        gray.data = run_length_encode(gray_pixels);
    } else if(filter == "ASCIIHexDecode") {
        gray.data = ascii_hex_encode(gray_pixels);
    } else {
        RETERR(UnsupportedEncodingParameters);
    }
    gray.filters.push_back(original.filters.front());
    gray.decode_parms.emplace_back();
    return gray;
}

rvoe<ImageXObject> encode_gray_image_flate(const ImageXObject &original, std::string gray_pixels) {
    auto gray = gray_image_base(original);
    ERC(compressed, flate_compress(gray_pixels));
    gray.data = std::move(compressed);
    gray.filters.push_back("FlateDecode");
    gray.decode_parms.emplace_back();
    return gray;
}

rvoe<ImageXObject> image_from_inline(const InlineImage &inline_image,
                                     const ResourceResolver *resources) {
    return image_from_params(inline_image.params, inline_image.data, resources);
}

rvoe<ImageXObject> image_from_stream(const PdfStream &stream, const ResourceResolver *resources) {
    return image_from_params(stream.dict, stream.data, resources);
}

InlineImage inline_from_image(const ImageXObject &image, const InlineImage &original) {
    InlineImage result;
    for(const auto &[key, value] : original.params) {
        if(key == "ColorSpace" || key == "CS" || key == "BitsPerComponent" || key == "BPC" ||
           key == "Filter" || key == "F" || key == "DecodeParms" || key == "DP" ||
           key == "Decode" || key == "D") {
            continue;
        }
        result.params[key] = value;
    }
    result.params["CS"] = PdfName{"G"};
    result.params["BPC"] = PdfValue{(int64_t)image.bits_per_component};
    if(image.filters.size() == 1) {
        result.params["F"] = PdfName{abbreviated_filter_name(image.filters.front())};
    } else if(!image.filters.empty()) {
        PdfArray arr;
        for(const auto &f : image.filters) {
            arr.emplace_back(PdfName{abbreviated_filter_name(f)});
        }
        result.params["F"] = std::move(arr);
    }
    result.data = image.data;
    return result;
}

} // namespace chromapdf::internal
