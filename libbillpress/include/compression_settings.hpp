//
// Created by Giuseppe Francione on 13/01/26.
//

/**
 * @file compression_settings.hpp
 * @brief Tunables for the size-targeting compressors and the batch layout.
 */

#ifndef BILLPRESS_COMPRESSION_SETTINGS_HPP
#define BILLPRESS_COMPRESSION_SETTINGS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace billpress {

inline constexpr std::size_t kKiB = 1024;

/**
 * @brief Per-file byte budget.
 */
struct CompressionTarget {
    std::size_t max_bytes = 200 * kKiB;

    CompressionTarget() = default;

    /// @throws std::invalid_argument if max_bytes is zero.
    explicit CompressionTarget(const std::size_t bytes) : max_bytes(bytes) {
        if (bytes == 0) {
            throw std::invalid_argument("compression target must be positive");
        }
    }

    [[nodiscard]] bool fits(const std::uintmax_t size) const noexcept { return size <= max_bytes; }
};

/**
 * @brief Which ladder attempt is returned when no rung meets the budget.
 */
enum class BestResultPolicy {
    Latest,  ///< The last rung tried (default)
    Smallest ///< The smallest encoding seen across all rungs
};

/**
 * @brief Parameters of the quality/scale degradation ladder.
 */
struct LadderOptions {
    int initial_quality = 80;
    int min_quality = 25;
    double min_scale = 0.3;
    int high_quality_threshold = 40; ///< above it quality drops by large_step only
    int large_step = 10;
    int small_step = 5;
    double scale_step = 0.1;
    BestResultPolicy policy = BestResultPolicy::Latest;
};

/**
 * @brief Every knob of a batch run, filled by the CLI or by API callers.
 */
struct CompressionSettings {
    CompressionTarget target{};

    /// ladder used for standalone image files
    LadderOptions image_ladder{};
    /// ladder used for images embedded in PDFs and rasterized pages
    LadderOptions pdf_ladder{80, 20, 0.3, 40, 10, 5, 0.1, BestResultPolicy::Latest};

    /// bytes reserved for PDF structure when budgeting images/pages
    std::size_t pdf_fixed_overhead = 20 * kKiB;
    std::size_t embedded_image_floor = 10 * kKiB;
    std::size_t page_floor = 15 * kKiB;
    std::size_t retry_page_floor = 8 * kKiB;

    /// rasterization DPI tiers keyed on the source PDF size
    int dpi_small = 150;  ///< <= 1 MiB
    int dpi_medium = 120; ///< <= 5 MiB
    int dpi_large = 100;  ///< <= 15 MiB
    int dpi_huge = 72;
    double retry_dpi_factor = 0.7;
    int retry_min_dpi = 50;

    /// Zopfli iterations for the lossless PDF rewrite
    int zopfli_iterations = 15;
    /// decoded streams above this size skip Zopfli and keep qpdf's own deflate
    std::size_t zopfli_max_stream_bytes = 2 * 1024 * kKiB;

    /// where the timestamped output folder is created (empty: next to the inputs)
    std::filesystem::path output_parent;
    std::string output_prefix = "compressed_invoices";

    /// max characters of an exception message kept in a FileResult
    std::size_t error_message_limit = 30;
};

} // namespace billpress

#endif // BILLPRESS_COMPRESSION_SETTINGS_HPP
