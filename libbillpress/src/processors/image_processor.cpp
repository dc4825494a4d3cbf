//
// Created by Giuseppe Francione on 16/01/26.
//

#include "../../include/image_processor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/image_compressor.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace billpress {

ProcessOutcome ImageProcessor::process(const std::filesystem::path& input_path,
                                       const std::filesystem::path& output_path,
                                       const CompressionSettings& settings) {
    const auto data = read_file_bytes(input_path);
    const RasterImage image = decode_image(data);

    Logger::log(LogLevel::Debug,
                input_path.filename().string() + ": " + std::to_string(image.width) + "x" +
                std::to_string(image.height) + " " + std::string(to_string(image.mode)),
                "image_processor");

    const ImageCompressor compressor(settings.image_ladder);
    const auto result = compressor.compress(image, settings.target.max_bytes);
    write_file_bytes(output_path, result.blob.bytes);

    ProcessOutcome outcome;
    outcome.output_path = output_path;
    outcome.output_size = std::filesystem::file_size(output_path);
    outcome.within_target = settings.target.fits(outcome.output_size);
    outcome.strategy = "jpeg q" + std::to_string(result.rung.quality) + " x" +
                       std::to_string(static_cast<int>(result.rung.scale * 100 + 0.5)) + "%";

    Logger::log(outcome.within_target ? LogLevel::Info : LogLevel::Warning,
                input_path.filename().string() + " -> " + std::to_string(outcome.output_size) +
                " bytes after " + std::to_string(result.rungs_tried) + " rung(s)",
                "image_processor");
    return outcome;
}

} // namespace billpress
