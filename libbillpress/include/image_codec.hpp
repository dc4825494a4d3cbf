//
// Created by Giuseppe Francione on 14/01/26.
//

/**
 * @file image_codec.hpp
 * @brief PNG/JPEG decoding (libpng, libjpeg) and quality-parameterized JPEG encoding.
 */

#ifndef BILLPRESS_IMAGE_CODEC_HPP
#define BILLPRESS_IMAGE_CODEC_HPP

#include "raster_image.hpp"
#include <span>
#include <stdexcept>
#include <string>

namespace billpress {

/**
 * @brief Thrown when input bytes cannot be decoded into a RasterImage.
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ImageFormat {
    Png,
    Jpeg,
    Unknown
};

/**
 * @brief Identifies PNG or JPEG from the leading signature bytes.
 */
[[nodiscard]] ImageFormat sniff_image_format(std::span<const std::uint8_t> data) noexcept;

/**
 * @brief Decodes PNG data into Rgb, Rgba, Grayscale or GrayscaleAlpha (8 bit).
 *
 * Palettes are expanded, 16-bit samples stripped and tRNS turned into alpha.
 * @throws DecodeError on malformed data.
 */
[[nodiscard]] RasterImage decode_png(std::span<const std::uint8_t> data);

/**
 * @brief Decodes JPEG data into Rgb, Grayscale or Cmyk.
 *
 * Adobe inverted CMYK/YCCK data is normalized so that 0 means "no ink".
 * @throws DecodeError on malformed data.
 */
[[nodiscard]] RasterImage decode_jpeg(std::span<const std::uint8_t> data);

/**
 * @brief Sniffs the format and dispatches to decode_png() or decode_jpeg().
 * @throws DecodeError for unknown formats or malformed data.
 */
[[nodiscard]] RasterImage decode_image(std::span<const std::uint8_t> data);

/**
 * @brief Encodes a baseline JPEG with optimized Huffman tables.
 *
 * @param image Rgb or Grayscale image (use normalize_for_jpeg() first).
 * @param quality libjpeg quality, clamped to [1, 100].
 * @throws std::invalid_argument for other color modes, std::runtime_error on libjpeg failure.
 */
[[nodiscard]] EncodedBlob encode_jpeg(const RasterImage& image, int quality);

} // namespace billpress

#endif // BILLPRESS_IMAGE_CODEC_HPP
