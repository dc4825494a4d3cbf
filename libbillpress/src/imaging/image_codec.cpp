//
// Created by Giuseppe Francione on 14/01/26.
//

#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <vector>
// jpeglib.h needs size_t and FILE declared first
#include <jpeglib.h>
#include <png.h>

namespace billpress {

namespace {

// --- libjpeg plumbing ---

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(err->msg);
}

void jpeg_warning_to_log(const j_common_ptr cinfo, const int msg_level) {
    // only corrupt-data warnings (level -1) are worth reporting
    if (msg_level >= 0) return;
    char buf[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buf);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + buf, "libjpeg");
}

/**
 * @brief Owns a jpeg_decompress_struct and destroys it on scope exit.
 */
struct JpegDecompressor {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegDecompressor() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.emit_message = jpeg_warning_to_log;
        jpeg_create_decompress(&cinfo);
    }
    ~JpegDecompressor() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompressor(const JpegDecompressor&) = delete;
    JpegDecompressor& operator=(const JpegDecompressor&) = delete;
};

/**
 * @brief Owns a jpeg_compress_struct plus the libjpeg-allocated output buffer.
 */
struct JpegCompressor {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};
    unsigned char* buffer = nullptr;
    unsigned long size = 0;

    JpegCompressor() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        jpeg_create_compress(&cinfo);
    }
    ~JpegCompressor() {
        jpeg_destroy_compress(&cinfo);
        std::free(buffer);
    }

    JpegCompressor(const JpegCompressor&) = delete;
    JpegCompressor& operator=(const JpegCompressor&) = delete;
};

// --- libpng plumbing ---

void png_error_throw(png_structp, const png_const_charp msg) {
    throw std::runtime_error(msg);
}

void png_warning_to_log(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
}

/**
 * @brief Cursor over an in-memory PNG stream.
 */
struct PngMemoryReader {
    std::span<const std::uint8_t> data;
    std::size_t offset = 0;
};

void png_read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
    auto* reader = static_cast<PngMemoryReader*>(png_get_io_ptr(png));
    if (reader->offset + length > reader->data.size()) {
        png_error(png, "unexpected end of PNG data");
    }
    std::memcpy(out, reader->data.data() + reader->offset, length);
    reader->offset += length;
}

/**
 * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    PngRead() {
        png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_throw, png_warning_to_log);
        if (!png) throw std::runtime_error("png_create_read_struct failed");
        info = png_create_info_struct(png);
        if (!info) {
            png_destroy_read_struct(&png, nullptr, nullptr);
            throw std::runtime_error("png_create_info_struct failed");
        }
    }
    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }

    PngRead(const PngRead&) = delete;
    PngRead& operator=(const PngRead&) = delete;
};

} // namespace

ImageFormat sniff_image_format(const std::span<const std::uint8_t> data) noexcept {
    static constexpr std::uint8_t kPngSig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (data.size() >= 8 && std::memcmp(data.data(), kPngSig, 8) == 0) {
        return ImageFormat::Png;
    }
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    return ImageFormat::Unknown;
}

RasterImage decode_png(const std::span<const std::uint8_t> data) {
    try {
        PngRead rd;
        PngMemoryReader reader{data, 0};
        png_set_read_fn(rd.png, &reader, png_read_from_memory);
        png_read_info(rd.png, rd.info);

        png_uint_32 width = 0, height = 0;
        int bit_depth = 0, color_type = 0;
        png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        if (bit_depth == 16) png_set_strip_16(rd.png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
        if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(rd.png);
        png_set_interlace_handling(rd.png);
        png_read_update_info(rd.png, rd.info);

        ColorMode mode;
        switch (png_get_color_type(rd.png, rd.info)) {
            case PNG_COLOR_TYPE_GRAY:       mode = ColorMode::Grayscale; break;
            case PNG_COLOR_TYPE_GRAY_ALPHA: mode = ColorMode::GrayscaleAlpha; break;
            case PNG_COLOR_TYPE_RGB:        mode = ColorMode::Rgb; break;
            case PNG_COLOR_TYPE_RGB_ALPHA:  mode = ColorMode::Rgba; break;
            default:
                throw std::runtime_error("unsupported PNG color type");
        }

        RasterImage image(static_cast<int>(width), static_cast<int>(height), mode);
        if (png_get_rowbytes(rd.png, rd.info) != image.stride()) {
            throw std::runtime_error("unexpected PNG row size");
        }

        std::vector<png_bytep> rows(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            rows[y] = image.row(static_cast<int>(y));
        }
        png_read_image(rd.png, rows.data());
        png_read_end(rd.png, nullptr);
        return image;
    } catch (const std::exception& e) {
        throw DecodeError(std::string("PNG decode failed: ") + e.what());
    }
}

RasterImage decode_jpeg(const std::span<const std::uint8_t> data) {
    try {
        JpegDecompressor dec;
        jpeg_mem_src(&dec.cinfo, const_cast<unsigned char*>(data.data()),
                     static_cast<unsigned long>(data.size()));

        if (jpeg_read_header(&dec.cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("invalid JPEG header");
        }

        ColorMode mode;
        switch (dec.cinfo.jpeg_color_space) {
            case JCS_GRAYSCALE:
                dec.cinfo.out_color_space = JCS_GRAYSCALE;
                mode = ColorMode::Grayscale;
                break;
            case JCS_CMYK:
            case JCS_YCCK:
                dec.cinfo.out_color_space = JCS_CMYK;
                mode = ColorMode::Cmyk;
                break;
            default:
                dec.cinfo.out_color_space = JCS_RGB;
                mode = ColorMode::Rgb;
                break;
        }

        jpeg_start_decompress(&dec.cinfo);
        if (static_cast<int>(dec.cinfo.output_components) != channel_count(mode)) {
            throw std::runtime_error("unexpected JPEG component count");
        }

        RasterImage image(static_cast<int>(dec.cinfo.output_width),
                          static_cast<int>(dec.cinfo.output_height), mode);
        while (dec.cinfo.output_scanline < dec.cinfo.output_height) {
            JSAMPROW row = image.row(static_cast<int>(dec.cinfo.output_scanline));
            jpeg_read_scanlines(&dec.cinfo, &row, 1);
        }

        // Adobe writes inverted CMYK
        if (mode == ColorMode::Cmyk && dec.cinfo.saw_Adobe_marker) {
            for (auto& v : image.pixels) v = static_cast<std::uint8_t>(255 - v);
        }

        jpeg_finish_decompress(&dec.cinfo);
        return image;
    } catch (const std::exception& e) {
        throw DecodeError(std::string("JPEG decode failed: ") + e.what());
    }
}

RasterImage decode_image(const std::span<const std::uint8_t> data) {
    switch (sniff_image_format(data)) {
        case ImageFormat::Png:  return decode_png(data);
        case ImageFormat::Jpeg: return decode_jpeg(data);
        case ImageFormat::Unknown: break;
    }
    throw DecodeError("unrecognized image format");
}

EncodedBlob encode_jpeg(const RasterImage& image, const int quality) {
    if (image.mode != ColorMode::Rgb && image.mode != ColorMode::Grayscale) {
        throw std::invalid_argument("JPEG encoder needs RGB or grayscale input, got " +
                                    std::string(to_string(image.mode)));
    }
    if (image.empty()) {
        throw std::invalid_argument("cannot encode an empty image");
    }

    JpegCompressor enc;
    jpeg_mem_dest(&enc.cinfo, &enc.buffer, &enc.size);

    enc.cinfo.image_width = static_cast<JDIMENSION>(image.width);
    enc.cinfo.image_height = static_cast<JDIMENSION>(image.height);
    enc.cinfo.input_components = image.channels();
    enc.cinfo.in_color_space = image.mode == ColorMode::Rgb ? JCS_RGB : JCS_GRAYSCALE;

    jpeg_set_defaults(&enc.cinfo);
    jpeg_set_quality(&enc.cinfo, std::clamp(quality, 1, 100), TRUE);
    enc.cinfo.optimize_coding = TRUE;

    jpeg_start_compress(&enc.cinfo, TRUE);
    while (enc.cinfo.next_scanline < enc.cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(image.row(static_cast<int>(enc.cinfo.next_scanline)));
        jpeg_write_scanlines(&enc.cinfo, &row, 1);
    }
    jpeg_finish_compress(&enc.cinfo);

    EncodedBlob blob;
    blob.bytes.assign(enc.buffer, enc.buffer + enc.size);
    return blob;
}

} // namespace billpress
