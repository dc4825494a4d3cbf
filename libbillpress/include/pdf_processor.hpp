//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file pdf_processor.hpp
 * @brief Defines the IProcessor implementation for PDF invoices using qpdf, Zopfli and MuPDF.
 */

#ifndef BILLPRESS_PDF_PROCESSOR_HPP
#define BILLPRESS_PDF_PROCESSOR_HPP

#include "processor.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace billpress {

/**
 * @brief Strategy that produced a compressed PDF.
 */
enum class PdfStrategy {
    Passthrough,     ///< source already within budget, copied unchanged
    Lossless,        ///< streams recompressed with Zopfli, nothing else touched
    EmbeddedImages,  ///< embedded images re-encoded as JPEG
    Rasterized,      ///< every page replaced by one full-page JPEG
    RasterizedRetry, ///< second rasterization at lower DPI and floor
    LosslessGuard,   ///< aggressive rewrite rejected, lossless result kept
    FallbackCopy     ///< a stage failed, source copied unchanged
};

[[nodiscard]] std::string_view to_string(PdfStrategy strategy) noexcept;

/**
 * @brief Result of PdfProcessor::compress().
 */
struct PdfCompression {
    std::vector<unsigned char> bytes; ///< complete output document
    bool within_target = false;       ///< bytes.size() <= budget
    PdfStrategy strategy = PdfStrategy::Passthrough;
};

/**
 * @brief Implements IProcessor for PDF files.
 *
 * @details Tries, in order, until the output fits the budget:
 * 1. Passthrough: the source is copied when it already fits.
 * 2. Lossless rewrite (qpdf): every generalized-filter stream without
 *    /DecodeParms is decoded and recompressed with Zopfli, object streams are
 *    generated.
 * 3. Embedded-image recompression: 8-bit RGB/gray image XObjects are
 *    re-encoded through the image ladder with a per-image share of the budget.
 * 4. Full-page rasterization (MuPDF): every page is rendered at a DPI chosen
 *    from the source size and compressed to a per-page budget; a new document
 *    with one JPEG per page is assembled with qpdf. One retry at lower DPI and
 *    floor follows if the result is still too large.
 *
 * If the aggressive rewrite ends above the budget and above half the source
 * size, the lossless result is kept instead. Any exception from stages 2-4
 * falls back to an unmodified copy. Page count and order are preserved.
 */
class PdfProcessor final : public IProcessor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "PdfProcessor";
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 2> kMimes = { "application/pdf", "application/x-pdf" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 1> kExts = { ".pdf" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] std::string_view output_extension() const noexcept override { return ".pdf"; }

    [[nodiscard]] FileKind kind() const noexcept override { return FileKind::Pdf; }

    /**
     * @brief Runs compress() and writes the bytes to @p output_path.
     * @throws std::runtime_error if the source cannot be read or the output written.
     */
    ProcessOutcome process(const std::filesystem::path& input_path,
                           const std::filesystem::path& output_path,
                           const CompressionSettings& settings) override;

    /**
     * @brief Size-targeted compression of one PDF, in memory.
     * @throws std::runtime_error only if the source file itself cannot be read.
     */
    [[nodiscard]] static PdfCompression compress(const std::filesystem::path& input_path,
                                                 const CompressionSettings& settings);

    /**
     * @brief Rendering DPI for a source of @p source_size bytes.
     */
    [[nodiscard]] static int dpi_for_size(std::uintmax_t source_size, const CompressionSettings& settings) noexcept;

    /**
     * @brief DPI of the single rasterization retry: max(dpi * factor, minimum).
     */
    [[nodiscard]] static int retry_dpi(int dpi, const CompressionSettings& settings) noexcept;

private:
    static std::vector<unsigned char> lossless_rewrite(const std::filesystem::path& input_path,
                                                       const CompressionSettings& settings);

    static std::optional<std::vector<unsigned char>> recompress_images(const std::vector<unsigned char>& lossless,
                                                                       const CompressionSettings& settings);

    static std::vector<unsigned char> rasterize(const std::filesystem::path& input_path,
                                                int dpi,
                                                std::size_t page_floor,
                                                const CompressionSettings& settings);
};

} // namespace billpress

#endif // BILLPRESS_PDF_PROCESSOR_HPP
