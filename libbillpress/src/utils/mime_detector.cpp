//
// Created by Giuseppe Francione on 11/10/25.
//
#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <memory>

std::string billpress::MimeDetector::detect(const std::filesystem::path& path)
{
    const std::unique_ptr<magic_set, decltype(&magic_close)> magic(
        magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR), &magic_close);
    if (!magic) return {};
    if (magic_load(magic.get(), nullptr) != 0)
    {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + (err ? err : "unknown error"), "libmagic");
        return {};
    }
    const char* mime = magic_file(magic.get(), path.string().c_str());
    if (!mime)
    {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Debug, path.filename().string() + ": " + (err ? err : "no match"), "libmagic");
        return {};
    }
    return mime;
}
