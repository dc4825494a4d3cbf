//
// Created by Giuseppe Francione on 16/01/26.
//

/**
 * @file pdf_rasterizer.hpp
 * @brief Renders PDF pages to RGB pixel buffers using MuPDF.
 */

#ifndef BILLPRESS_PDF_RASTERIZER_HPP
#define BILLPRESS_PDF_RASTERIZER_HPP

#include "raster_image.hpp"
#include <filesystem>

// forward declarations, mupdf headers stay out of the public interface
struct fz_context;
struct fz_document;

namespace billpress {

/**
 * @brief Page box in PDF points (1/72 inch), as displayed (rotation applied).
 */
struct PageSize {
    double width_pt = 0.0;
    double height_pt = 0.0;
};

/**
 * @brief Owns a MuPDF context and an open document.
 *
 * @details One instance per document and per thread: MuPDF contexts are not
 * shared. Every MuPDF failure caught in fz_try/fz_catch is rethrown as
 * std::runtime_error once the MuPDF error scope has been left.
 */
class PdfRasterizer {
public:
    /**
     * @brief Opens the document read-only.
     * @throws std::runtime_error if MuPDF cannot open it.
     */
    explicit PdfRasterizer(const std::filesystem::path& pdf_path);
    ~PdfRasterizer();

    PdfRasterizer(const PdfRasterizer&) = delete;
    PdfRasterizer& operator=(const PdfRasterizer&) = delete;

    [[nodiscard]] int page_count() const;

    [[nodiscard]] PageSize page_size(int page_index) const;

    /**
     * @brief Renders a page at @p dpi without alpha.
     * @return An Rgb image of round(page_size * dpi / 72) pixels.
     * @throws std::runtime_error on render failure or a bad page index.
     */
    [[nodiscard]] RasterImage render_page(int page_index, int dpi) const;

private:
    fz_context* ctx_ = nullptr;
    fz_document* doc_ = nullptr;
};

} // namespace billpress

#endif // BILLPRESS_PDF_RASTERIZER_HPP
