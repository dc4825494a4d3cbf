//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file processor_registry.hpp
 * @brief Defines the registry for discovering and managing IProcessor instances.
 */

#ifndef BILLPRESS_PROCESSOR_REGISTRY_HPP
#define BILLPRESS_PROCESSOR_REGISTRY_HPP

#include "processor.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace billpress {

/**
 * @brief Registry of the processors billpress can dispatch to.
 *
 * @details Owns one ImageProcessor and one PdfProcessor and finds the one
 * that handles a MIME type or file extension.
 */
class ProcessorRegistry {
public:
    /**
     * @brief Construct and register all built-in processors.
     */
    ProcessorRegistry();

    /**
     * @brief Find all processors that support a given MIME type.
     * @param mime MIME type string (e.g. "image/png").
     * @return Non-owning pointers to the matching processors.
     */
    [[nodiscard]] std::vector<IProcessor*> find_by_mime(const std::string& mime) const;

    /**
     * @brief Find all processors that support a given file extension.
     *
     * Comparison is case-insensitive.
     *
     * @param ext File extension (including the dot, e.g. ".png").
     * @return Non-owning pointers to the matching processors.
     */
    [[nodiscard]] std::vector<IProcessor*> find_by_extension(const std::string& ext) const;

    /**
     * @brief Picks the processor for a file: by detected MIME type first,
     * then by extension.
     * @return nullptr if nothing handles the file.
     */
    [[nodiscard]] IProcessor* resolve(const std::filesystem::path& path) const;

    [[nodiscard]] const std::vector<std::unique_ptr<IProcessor>>& all() const { return processors_; }

private:
    ///< Owned instances of all registered processors.
    std::vector<std::unique_ptr<IProcessor>> processors_;
};

} // namespace billpress

#endif // BILLPRESS_PROCESSOR_REGISTRY_HPP
