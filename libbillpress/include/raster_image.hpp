//
// Created by Giuseppe Francione on 13/01/26.
//

/**
 * @file raster_image.hpp
 * @brief Decoded pixel buffers and the pixel operations the ladder needs.
 */

#ifndef BILLPRESS_RASTER_IMAGE_HPP
#define BILLPRESS_RASTER_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace billpress {

/**
 * @brief Pixel layout of a RasterImage. All modes use 8 bits per channel.
 */
enum class ColorMode {
    Rgb,            ///< 3 channels
    Rgba,           ///< 4 channels, straight (non-premultiplied) alpha
    Grayscale,      ///< 1 channel
    GrayscaleAlpha, ///< 2 channels
    Cmyk            ///< 4 channels, 0 = no ink
};

[[nodiscard]] constexpr int channel_count(const ColorMode mode) noexcept {
    switch (mode) {
        case ColorMode::Grayscale:      return 1;
        case ColorMode::GrayscaleAlpha: return 2;
        case ColorMode::Rgb:            return 3;
        case ColorMode::Rgba:
        case ColorMode::Cmyk:           return 4;
    }
    return 0;
}

[[nodiscard]] constexpr bool has_alpha(const ColorMode mode) noexcept {
    return mode == ColorMode::Rgba || mode == ColorMode::GrayscaleAlpha;
}

std::string_view to_string(ColorMode mode) noexcept;

/**
 * @brief A decoded, tightly packed (no row padding) 8-bit image.
 *
 * Instances are treated as values: every transformation below returns a new
 * image and leaves its input untouched.
 */
struct RasterImage {
    int width = 0;
    int height = 0;
    ColorMode mode = ColorMode::Rgb;
    std::vector<std::uint8_t> pixels;

    RasterImage() = default;

    /// Allocates a zero-filled buffer. @throws std::invalid_argument on non-positive dimensions.
    RasterImage(int width, int height, ColorMode mode);

    [[nodiscard]] int channels() const noexcept { return channel_count(mode); }
    [[nodiscard]] std::size_t stride() const noexcept { return static_cast<std::size_t>(width) * channels(); }
    [[nodiscard]] bool empty() const noexcept { return width <= 0 || height <= 0 || pixels.empty(); }

    [[nodiscard]] std::uint8_t* row(const int y) noexcept { return pixels.data() + stride() * y; }
    [[nodiscard]] const std::uint8_t* row(const int y) const noexcept { return pixels.data() + stride() * y; }
};

/**
 * @brief An encoded image (always JPEG in billpress). Immutable once produced.
 */
struct EncodedBlob {
    std::vector<std::uint8_t> bytes;

    [[nodiscard]] std::size_t byte_length() const noexcept { return bytes.size(); }
};

/**
 * @brief Composites an image with alpha onto an opaque white background.
 *
 * out = alpha * fg + (1 - alpha) * 255, computed per channel with rounding.
 * Rgba becomes Rgb, GrayscaleAlpha becomes Rgb. Images without alpha are returned as a copy.
 */
[[nodiscard]] RasterImage flatten_on_white(const RasterImage& image);

/**
 * @brief Converts any mode to Rgb (alpha is flattened on white first).
 */
[[nodiscard]] RasterImage to_rgb(const RasterImage& image);

/**
 * @brief Brings an image into a mode a baseline JPEG encoder accepts.
 *
 * Rgb and Grayscale pass through unchanged, alpha modes are flattened on white,
 * anything else is converted to Rgb.
 */
[[nodiscard]] RasterImage normalize_for_jpeg(const RasterImage& image);

/**
 * @brief Area-averaging resample to an exact size.
 *
 * Each destination pixel is the coverage-weighted mean of the source pixels
 * under its footprint, computed separably (rows, then columns). For
 * downscaling this behaves like a box filter with exact fractional edges;
 * upscaling degrades to nearest-neighbour-like replication.
 *
 * @throws std::invalid_argument on non-positive target dimensions or an empty source.
 */
[[nodiscard]] RasterImage resample_area(const RasterImage& image, int new_width, int new_height);

/**
 * @brief Target dimensions for a scale factor: round(dim * scale), each at least 1.
 */
[[nodiscard]] std::pair<int, int> scaled_dimensions(int width, int height, double scale) noexcept;

} // namespace billpress

#endif // BILLPRESS_RASTER_IMAGE_HPP
