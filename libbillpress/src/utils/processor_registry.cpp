//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/processor_registry.hpp"
#include "../../include/image_processor.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/pdf_processor.hpp"
#include <algorithm>
#include <cctype>

namespace billpress {

ProcessorRegistry::ProcessorRegistry() {
    processors_.push_back(std::make_unique<PdfProcessor>());
    processors_.push_back(std::make_unique<ImageProcessor>());
}

std::vector<IProcessor*> ProcessorRegistry::find_by_mime(const std::string& mime) const {
    std::vector<IProcessor*> result;
    for (const auto& proc_ptr : processors_) {
        for (const auto supported_mime : proc_ptr->get_supported_mime_types()) {
            if (supported_mime == mime) {
                result.push_back(proc_ptr.get());
            }
        }
    }
    return result;
}

std::vector<IProcessor*> ProcessorRegistry::find_by_extension(const std::string& ext) const {
    std::vector<IProcessor*> result;
    if (ext.empty() || ext[0] != '.') return result;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& proc_ptr : processors_) {
        for (const auto supported_ext : proc_ptr->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                result.push_back(proc_ptr.get());
            }
        }
    }
    return result;
}

IProcessor* ProcessorRegistry::resolve(const std::filesystem::path& path) const {
    const auto mime = MimeDetector::detect(path);
    auto procs = find_by_mime(mime);
    if (procs.empty()) {
        Logger::log(LogLevel::Debug,
                    path.filename().string() + ": no processor for MIME '" + mime + "', trying extension",
                    "registry");
        procs = find_by_extension(path.extension().string());
    }
    return procs.empty() ? nullptr : procs.front();
}

} // namespace billpress
