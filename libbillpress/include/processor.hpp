//
// Created by Giuseppe Francione on 16/01/26.
//

#ifndef BILLPRESS_PROCESSOR_HPP
#define BILLPRESS_PROCESSOR_HPP

#include "compression_settings.hpp"
#include "file_kind.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

/**
 * @namespace billpress
 * @brief The main namespace for the billpress library.
 *
 * @details This namespace holds the size-targeting compressors, the
 * IProcessor interface with its image and PDF implementations, the batch
 * executor with its events, and the public Billpress facade.
 */
namespace billpress {

/**
 * @brief What a processor produced for one input file.
 */
struct ProcessOutcome {
    std::filesystem::path output_path; ///< File written by the processor
    std::uintmax_t output_size = 0;    ///< On-disk size of output_path in bytes
    bool within_target = false;        ///< output_size <= the configured budget
    std::string strategy;              ///< Which strategy produced the output (e.g. "jpeg-ladder", "raster")
};

/**
 * @brief Interface for a size-targeting compressor of one input format.
 *
 * Each implementation describes the formats it handles (MIME types,
 * extensions) and the extension of what it writes. Implementations are
 * stateless: everything a run needs comes in through process(). The
 * ProcessorRegistry owns the instances.
 */
class IProcessor {
public:
    virtual ~IProcessor() = default;

    // --- self-description ---

    /// @return Human-readable name of the processor (e.g. "PdfProcessor").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view, std::dynamic_extent>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of supported file extensions (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view, std::dynamic_extent>
    get_supported_extensions() const noexcept = 0;

    /// @return Extension of the files this processor writes (e.g. ".jpg").
    [[nodiscard]] virtual std::string_view output_extension() const noexcept = 0;

    /// @return Kind of batch job this processor serves.
    [[nodiscard]] virtual FileKind kind() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Compress @p input_path towards settings.target and write @p output_path.
     *
     * @param input_path Source file, never modified.
     * @param output_path Destination file, overwritten.
     * @param settings Budget and ladder parameters.
     * @return The outcome; within_target tells whether the budget was met.
     * @throws std::exception subclasses when no output could be produced.
     */
    virtual ProcessOutcome process(const std::filesystem::path& input_path,
                                   const std::filesystem::path& output_path,
                                   const CompressionSettings& settings) = 0;
};

} // namespace billpress

#endif // BILLPRESS_PROCESSOR_HPP
