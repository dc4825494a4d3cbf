//
// Created by Giuseppe Francione on 11/10/25.
//

#ifndef BILLPRESS_MIME_DETECTOR_HPP
#define BILLPRESS_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace billpress {

    /**
     * @brief Content-based file type detection.
     *
     * This class abstracts the underlying mechanism for detecting MIME types.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its content.
         *
         * @param path The filesystem path to the file.
         * @return A string representing the MIME type (e.g., "application/pdf"),
         * or an empty string if libmagic is unavailable or cannot tell.
         *
         * @note Uses libmagic with the system magic database.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace billpress
#endif //BILLPRESS_MIME_DETECTOR_HPP
