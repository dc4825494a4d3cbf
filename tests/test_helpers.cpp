//
// Created by Giuseppe Francione on 25/01/26.
//

#include "test_helpers.hpp"
#include "../libbillpress/include/file_utils.hpp"
#include "../libbillpress/include/image_codec.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <png.h>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <algorithm>
#include <cstdio>
#include <memory>
#include <random>
#include <span>
#include <stdexcept>
#include <system_error>

namespace billpress::test {

namespace {

std::string random_suffix() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static constexpr char kChars[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kChars) - 2);
    std::string out(8, '0');
    for (auto& c : out) c = kChars[pick(rng)];
    return out;
}

} // namespace

TempDir::TempDir(const std::string& prefix)
    : dir_(std::filesystem::temp_directory_path() / "billpress-tests" / (prefix + "_" + random_suffix())) {
    std::filesystem::create_directories(dir_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
}

RasterImage make_test_image(const int width, const int height, const ColorMode mode, const unsigned seed) {
    RasterImage image(width, height, mode);
    unsigned state = seed * 2654435761u + 12345u;
    const int channels = image.channels();

    for (int y = 0; y < height; ++y) {
        std::uint8_t* row = image.row(y);
        for (int x = 0; x < width; ++x) {
            for (int c = 0; c < channels; ++c) {
                state = state * 1103515245u + 12345u;
                const int grain = static_cast<int>((state >> 16) & 0x3F) - 32;
                int v = (x * 255 / width + y * 255 / height) / 2 + c * 40 + grain;
                if (has_alpha(mode) && c == channels - 1) {
                    v = (x * 255) / width; // alpha ramp
                }
                row[x * channels + c] = static_cast<std::uint8_t>(std::clamp(v, 0, 255));
            }
        }
    }
    return image;
}

void write_png(const std::filesystem::path& path, const RasterImage& image) {
    int color_type = 0;
    switch (image.mode) {
        case ColorMode::Grayscale:      color_type = PNG_COLOR_TYPE_GRAY; break;
        case ColorMode::GrayscaleAlpha: color_type = PNG_COLOR_TYPE_GRAY_ALPHA; break;
        case ColorMode::Rgb:            color_type = PNG_COLOR_TYPE_RGB; break;
        case ColorMode::Rgba:           color_type = PNG_COLOR_TYPE_RGB_ALPHA; break;
        case ColorMode::Cmyk:           throw std::invalid_argument("PNG cannot hold CMYK");
    }

    const std::unique_ptr<FILE, decltype(&std::fclose)> fp(open_file(path, "wb"), &std::fclose);
    if (!fp) throw std::runtime_error("cannot create " + path.string());

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png ? png_create_info_struct(png) : nullptr;
    if (!png || !info) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("png_create_write_struct failed");
    }
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("libpng write failed");
    }

    png_init_io(png, fp.get());
    png_set_IHDR(png, info, static_cast<png_uint_32>(image.width), static_cast<png_uint_32>(image.height), 8,
                 color_type, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    for (int y = 0; y < image.height; ++y) {
        png_write_row(png, const_cast<png_bytep>(image.row(y)));
    }
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
}

void write_jpeg(const std::filesystem::path& path, const RasterImage& image, const int quality) {
    write_file_bytes(path, encode_jpeg(image, quality).bytes);
}

void write_bytes(const std::filesystem::path& path, const std::string& content) {
    write_file_bytes(path, std::span(reinterpret_cast<const unsigned char*>(content.data()), content.size()));
}

void write_image_pdf(const std::filesystem::path& path, const std::vector<RasterImage>& pages, const int quality) {
    QPDF pdf;
    pdf.emptyPDF();
    QPDFPageDocumentHelper page_helper(pdf);

    for (const auto& raster : pages) {
        const EncodedBlob jpeg = encode_jpeg(raster, quality);

        QPDFObjectHandle image = QPDFObjectHandle::newStream(&pdf);
        QPDFObjectHandle dict = image.getDict();
        dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
        dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
        dict.replaceKey("/Width", QPDFObjectHandle::newInteger(raster.width));
        dict.replaceKey("/Height", QPDFObjectHandle::newInteger(raster.height));
        dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(
                            raster.mode == ColorMode::Grayscale ? "/DeviceGray" : "/DeviceRGB"));
        dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
        image.replaceStreamData(std::string(reinterpret_cast<const char*>(jpeg.bytes.data()), jpeg.byte_length()),
                                QPDFObjectHandle::newName("/DCTDecode"),
                                QPDFObjectHandle::newNull());

        // 96 dpi page
        const int w_pt = raster.width * 3 / 4;
        const int h_pt = raster.height * 3 / 4;
        QPDFObjectHandle contents = QPDFObjectHandle::newStream(
            &pdf, "q " + std::to_string(w_pt) + " 0 0 " + std::to_string(h_pt) + " 0 0 cm /Im0 Do Q\n");

        QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
        xobjects.replaceKey("/Im0", image);
        QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
        resources.replaceKey("/XObject", xobjects);

        QPDFObjectHandle media_box = QPDFObjectHandle::newArray();
        media_box.appendItem(QPDFObjectHandle::newInteger(0));
        media_box.appendItem(QPDFObjectHandle::newInteger(0));
        media_box.appendItem(QPDFObjectHandle::newInteger(w_pt));
        media_box.appendItem(QPDFObjectHandle::newInteger(h_pt));

        QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox", media_box);
        page.replaceKey("/Contents", contents);
        page.replaceKey("/Resources", resources);
        page_helper.addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);
    }

    QPDFWriter writer(pdf, path.string().c_str());
    writer.write();
}

namespace {

// "r g b rg x y w h re f" lines with pseudo-random colors and positions inside w x h
std::string random_rect_ops(unsigned& state, const int w, const int h, const int count) {
    const auto next = [&state](const unsigned mod) {
        state = state * 1103515245u + 12345u;
        return (state >> 8) % mod;
    };

    std::string ops;
    ops.reserve(static_cast<std::size_t>(count) * 48);
    for (int i = 0; i < count; ++i) {
        ops += "0." + std::to_string(next(1000)) + " 0." + std::to_string(next(1000)) + " 0." +
               std::to_string(next(1000)) + " rg " + std::to_string(next(static_cast<unsigned>(w))) + " " +
               std::to_string(next(static_cast<unsigned>(h))) + " " + std::to_string(2 + next(9)) + " " +
               std::to_string(2 + next(9)) + " re f\n";
    }
    return ops;
}

QPDFObjectHandle media_box_of(const int w, const int h) {
    QPDFObjectHandle box = QPDFObjectHandle::newArray();
    box.appendItem(QPDFObjectHandle::newInteger(0));
    box.appendItem(QPDFObjectHandle::newInteger(0));
    box.appendItem(QPDFObjectHandle::newInteger(w));
    box.appendItem(QPDFObjectHandle::newInteger(h));
    return box;
}

} // namespace

void write_vector_pdf(const std::filesystem::path& path,
                      const std::vector<std::pair<int, int>>& sizes,
                      const int rects_per_page,
                      const bool compress_streams) {
    QPDF pdf;
    pdf.emptyPDF();
    QPDFPageDocumentHelper page_helper(pdf);
    unsigned state = 7;

    for (const auto& [w, h] : sizes) {
        const std::string ops = random_rect_ops(state, w, h, rects_per_page);

        QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox", media_box_of(w, h));
        page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, ops));
        page.replaceKey("/Resources", QPDFObjectHandle::newDictionary());
        page_helper.addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);
    }

    QPDFWriter writer(pdf, path.string().c_str());
    writer.setCompressStreams(compress_streams);
    writer.write();
}

void write_tiled_pdf(const std::filesystem::path& path,
                     const int width, const int height, const int tile, const int rects_per_tile) {
    QPDF pdf;
    pdf.emptyPDF();
    unsigned state = 11;

    QPDFObjectHandle form = QPDFObjectHandle::newStream(&pdf, random_rect_ops(state, tile, tile, rects_per_tile));
    QPDFObjectHandle form_dict = form.getDict();
    form_dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    form_dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));
    form_dict.replaceKey("/BBox", media_box_of(tile, tile));

    std::string ops;
    for (int y = 0; y < height; y += tile) {
        for (int x = 0; x < width; x += tile) {
            ops += "q 1 0 0 1 " + std::to_string(x) + " " + std::to_string(y) + " cm /Tile Do Q\n";
        }
    }

    QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/Tile", form);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/XObject", xobjects);

    QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
    page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page.replaceKey("/MediaBox", media_box_of(width, height));
    page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, ops));
    page.replaceKey("/Resources", resources);
    QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);

    QPDFWriter writer(pdf, path.string().c_str());
    writer.setCompressStreams(false);
    writer.write();
}

std::size_t pdf_page_count(const std::vector<unsigned char>& bytes) {
    QPDF pdf;
    pdf.processMemoryFile("test output", reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return QPDFPageDocumentHelper(pdf).getAllPages().size();
}

std::vector<std::pair<double, double>> pdf_page_sizes(const std::vector<unsigned char>& bytes) {
    QPDF pdf;
    pdf.processMemoryFile("test output", reinterpret_cast<const char*>(bytes.data()), bytes.size());

    std::vector<std::pair<double, double>> sizes;
    for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
        QPDFObjectHandle box = page.getObjectHandle().getKey("/MediaBox");
        sizes.emplace_back(box.getArrayItem(2).getNumericValue() - box.getArrayItem(0).getNumericValue(),
                           box.getArrayItem(3).getNumericValue() - box.getArrayItem(1).getNumericValue());
    }
    return sizes;
}

std::vector<std::string> zip_entry_names(const std::filesystem::path& zip_path) {
    const std::unique_ptr<archive, decltype(&archive_read_free)> a(archive_read_new(), &archive_read_free);
    archive_read_support_format_zip(a.get());
    if (archive_read_open_filename(a.get(), zip_path.string().c_str(), 10240) != ARCHIVE_OK) {
        throw std::runtime_error("cannot open " + zip_path.string());
    }

    std::vector<std::string> names;
    archive_entry* entry = nullptr;
    while (archive_read_next_header(a.get(), &entry) == ARCHIVE_OK) {
        names.emplace_back(archive_entry_pathname(entry));
        archive_read_data_skip(a.get());
    }
    return names;
}

} // namespace billpress::test
