//
// Created by Giuseppe Francione on 15/01/26.
//

/**
 * @file image_compressor.hpp
 * @brief Size-targeted JPEG compression driven by a quality/scale ladder.
 */

#ifndef BILLPRESS_IMAGE_COMPRESSOR_HPP
#define BILLPRESS_IMAGE_COMPRESSOR_HPP

#include "compression_settings.hpp"
#include "raster_image.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace billpress {

/**
 * @brief One rung of the degradation ladder.
 */
struct Rung {
    int quality = 0;
    double scale = 1.0;

    bool operator==(const Rung&) const = default;
};

/**
 * @brief A rung together with what it produced.
 */
struct CompressionAttempt {
    Rung rung;
    EncodedBlob result;
};

/**
 * @brief Result of ImageCompressor::compress().
 */
struct LadderOutcome {
    EncodedBlob blob;         ///< the returned encoding
    Rung rung;                ///< rung that produced blob
    int width = 0;            ///< pixel size of the encoded image
    int height = 0;
    std::size_t rungs_tried = 0;
    bool within_target = false;
};

/**
 * @brief Re-encodes raster images as JPEG until they fit a byte budget.
 *
 * @details Starting at (initial_quality, 1.0) each rung encodes the image
 * (resampled when scale < 1) and returns as soon as one fits. Above the
 * high-quality threshold only quality drops, by large_step; at or below it
 * quality drops by small_step and scale by scale_step on every rung. The
 * ladder ends when quality < min_quality or scale < min_scale, so it always
 * terminates. When nothing fits, the attempt selected by the
 * BestResultPolicy is returned (the latest one by default); callers compare
 * the size with their budget to decide success.
 *
 * The compressor is stateless.
 */
class ImageCompressor {
public:
    explicit ImageCompressor(LadderOptions options = {});

    [[nodiscard]] const LadderOptions& options() const noexcept { return options_; }

    /**
     * @brief Full rung sequence the ladder would walk if nothing ever fit.
     */
    [[nodiscard]] static std::vector<Rung> ladder(const LadderOptions& options);

    /**
     * @brief Runs the ladder over a decoded image.
     *
     * Alpha is flattened on white and non RGB/grayscale modes converted to RGB
     * before the first rung.
     *
     * @param image Source image, not modified.
     * @param target_bytes Budget for the encoded size.
     * @throws std::invalid_argument if the image is empty.
     */
    [[nodiscard]] LadderOutcome compress(const RasterImage& image, std::size_t target_bytes) const;

    /**
     * @brief Decodes PNG/JPEG bytes and runs the ladder on them.
     *
     * @return The compressed JPEG, or a copy of @p data when it cannot be
     * decoded.
     */
    [[nodiscard]] std::vector<std::uint8_t> compress_bytes(std::span<const std::uint8_t> data,
                                                           std::size_t target_bytes) const;

private:
    LadderOptions options_;
};

} // namespace billpress

#endif // BILLPRESS_IMAGE_COMPRESSOR_HPP
