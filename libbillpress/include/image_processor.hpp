//
// Created by Giuseppe Francione on 16/01/26.
//

/**
 * @file image_processor.hpp
 * @brief Defines the IProcessor implementation for PNG and JPEG invoices.
 */

#ifndef BILLPRESS_IMAGE_PROCESSOR_HPP
#define BILLPRESS_IMAGE_PROCESSOR_HPP

#include "processor.hpp"
#include <array>
#include <span>
#include <string_view>

namespace billpress {

/**
 * @brief Re-encodes PNG/JPEG files as JPEG within the byte budget.
 *
 * @details Decodes with libpng/libjpeg and hands the pixels to an
 * ImageCompressor configured with settings.image_ladder. The output is
 * always a JPEG, even for PNG input.
 */
class ImageProcessor final : public IProcessor {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override {
        return "ImageProcessor";
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
        static constexpr std::array<std::string_view, 3> kMimes = { "image/png", "image/jpeg", "image/pjpeg" };
        return {kMimes.data(), kMimes.size()};
    }

    [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
        static constexpr std::array<std::string_view, 3> kExts = { ".png", ".jpg", ".jpeg" };
        return {kExts.data(), kExts.size()};
    }

    [[nodiscard]] std::string_view output_extension() const noexcept override { return ".jpg"; }

    [[nodiscard]] FileKind kind() const noexcept override { return FileKind::Image; }

    /**
     * @brief Decodes the input and writes the ladder's JPEG to @p output_path.
     *
     * @throws DecodeError if the input is not a readable PNG/JPEG; nothing is
     * written in that case.
     * @throws std::runtime_error on I/O failure.
     */
    ProcessOutcome process(const std::filesystem::path& input_path,
                           const std::filesystem::path& output_path,
                           const CompressionSettings& settings) override;
};

} // namespace billpress

#endif // BILLPRESS_IMAGE_PROCESSOR_HPP
