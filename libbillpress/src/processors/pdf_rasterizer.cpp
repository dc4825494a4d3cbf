//
// Created by Giuseppe Francione on 16/01/26.
//

#include "../../include/pdf_rasterizer.hpp"
#include "../../include/logger.hpp"
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <mupdf/fitz.h>

namespace billpress {

namespace {

// fz_caught_message() points into the context, copy it before leaving fz_catch
void copy_message(fz_context* ctx, char (&buf)[256]) {
    std::strncpy(buf, fz_caught_message(ctx), sizeof(buf) - 1);
    buf[sizeof(buf) - 1] = '\0';
}

} // namespace

PdfRasterizer::PdfRasterizer(const std::filesystem::path& pdf_path) {
    ctx_ = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx_) {
        throw std::runtime_error("cannot create MuPDF context");
    }

    const std::string path = pdf_path.string();
    fz_document* doc = nullptr;
    bool failed = false;
    char error[256] = {};

    fz_try(ctx_) {
        fz_register_document_handlers(ctx_);
        doc = fz_open_document(ctx_, path.c_str());
    }
    fz_catch(ctx_) {
        copy_message(ctx_, error);
        failed = true;
    }

    if (failed) {
        fz_drop_context(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("MuPDF cannot open " + path + ": " + error);
    }
    doc_ = doc;
}

PdfRasterizer::~PdfRasterizer() {
    if (ctx_) {
        fz_drop_document(ctx_, doc_);
        fz_drop_context(ctx_);
    }
}

int PdfRasterizer::page_count() const {
    int count = 0;
    bool failed = false;
    char error[256] = {};

    fz_try(ctx_) {
        count = fz_count_pages(ctx_, doc_);
    }
    fz_catch(ctx_) {
        copy_message(ctx_, error);
        failed = true;
    }

    if (failed) {
        throw std::runtime_error(std::string("MuPDF page count failed: ") + error);
    }
    return count;
}

PageSize PdfRasterizer::page_size(const int page_index) const {
    fz_page* page = nullptr;
    fz_rect box{};
    bool failed = false;
    char error[256] = {};

    fz_var(page);
    fz_try(ctx_) {
        page = fz_load_page(ctx_, doc_, page_index);
        box = fz_bound_page(ctx_, page);
    }
    fz_always(ctx_) {
        fz_drop_page(ctx_, page);
    }
    fz_catch(ctx_) {
        copy_message(ctx_, error);
        failed = true;
    }

    if (failed) {
        throw std::runtime_error("MuPDF cannot load page " + std::to_string(page_index + 1) + ": " + error);
    }
    return {static_cast<double>(box.x1 - box.x0), static_cast<double>(box.y1 - box.y0)};
}

RasterImage PdfRasterizer::render_page(const int page_index, const int dpi) const {
    if (dpi <= 0) {
        throw std::invalid_argument("render DPI must be positive");
    }

    const float zoom = static_cast<float>(dpi) / 72.0f;
    fz_pixmap* pix = nullptr;
    bool failed = false;
    char error[256] = {};

    fz_var(pix);
    fz_try(ctx_) {
        pix = fz_new_pixmap_from_page_number(ctx_, doc_, page_index, fz_scale(zoom, zoom), fz_device_rgb(ctx_), 0);
    }
    fz_catch(ctx_) {
        copy_message(ctx_, error);
        failed = true;
    }

    if (failed) {
        throw std::runtime_error("MuPDF cannot render page " + std::to_string(page_index + 1) + ": " + error);
    }

    const auto drop = [this](fz_pixmap* p) { fz_drop_pixmap(ctx_, p); };
    const std::unique_ptr<fz_pixmap, decltype(drop)> guard(pix, drop);

    const int w = fz_pixmap_width(ctx_, pix);
    const int h = fz_pixmap_height(ctx_, pix);
    const int n = fz_pixmap_components(ctx_, pix);
    const auto stride = static_cast<std::size_t>(fz_pixmap_stride(ctx_, pix));
    const unsigned char* samples = fz_pixmap_samples(ctx_, pix);

    if (n != 3 || w <= 0 || h <= 0) {
        throw std::runtime_error("unexpected pixmap layout from MuPDF");
    }

    RasterImage image(w, h, ColorMode::Rgb);
    for (int y = 0; y < h; ++y) {
        std::memcpy(image.row(y), samples + stride * y, image.stride());
    }

    Logger::log(LogLevel::Debug,
                "rendered page " + std::to_string(page_index + 1) + " at " + std::to_string(dpi) +
                " dpi (" + std::to_string(w) + "x" + std::to_string(h) + ")",
                "pdf_rasterizer");
    return image;
}

} // namespace billpress
