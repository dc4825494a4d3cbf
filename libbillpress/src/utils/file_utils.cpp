//
// Created by Giuseppe Francione on 12/01/26.
//

#include "../../include/file_utils.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace billpress {

    namespace {
        struct FileCloser {
            void operator()(FILE *f) const { if (f) std::fclose(f); }
        };
        using unique_FILE = std::unique_ptr<FILE, FileCloser>;
    }

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // long path prefix bypasses MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_file_bytes(const std::filesystem::path& path) {
        unique_FILE f(open_file(path, "rb"));
        if (!f) {
            throw std::runtime_error("Cannot open " + path.filename().string());
        }

        std::vector<unsigned char> data;
        unsigned char chunk[64 * 1024];
        size_t n = 0;
        while ((n = std::fread(chunk, 1, sizeof(chunk), f.get())) > 0) {
            data.insert(data.end(), chunk, chunk + n);
        }
        if (std::ferror(f.get())) {
            throw std::runtime_error("Read error on " + path.filename().string());
        }
        return data;
    }

    void write_file_bytes(const std::filesystem::path& path, const std::span<const unsigned char> data) {
        unique_FILE f(open_file(path, "wb"));
        if (!f) {
            throw std::runtime_error("Cannot create " + path.string());
        }
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) {
            throw std::runtime_error("Short write on " + path.string());
        }
        if (std::fflush(f.get()) != 0) {
            throw std::runtime_error("fflush failed for " + path.string());
        }
    }

    std::uintmax_t file_size_kb(const std::filesystem::path& path) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : size / 1024;
    }

} // namespace billpress
