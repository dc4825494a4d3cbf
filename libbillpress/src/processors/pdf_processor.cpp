//
// Created by Giuseppe Francione on 19/10/25.
//

#include "../../include/pdf_processor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_compressor.hpp"
#include "../../include/logger.hpp"
#include "../../include/pdf_rasterizer.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <zopfli.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using billpress::Logger;
using billpress::LogLevel;

// helper: custom streambuf to redirect qpdf messages into our logger
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        std::string s = str();
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        if (!s.empty()) {
            Logger::log(level, s, module);
        }
        str("");
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

/**
 * @brief A QPDF instance whose warnings and errors go to the Logger.
 */
struct QuietQpdf {
    LoggerStreamBuf info_buf{LogLevel::Debug, "qpdf"};
    LoggerStreamBuf warn_buf{LogLevel::Warning, "qpdf"};
    std::ostream info_os{&info_buf};
    std::ostream warn_os{&warn_buf};
    QPDF pdf;

    QuietQpdf() {
        const auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&info_os, &warn_os);
        pdf.setLogger(qlogger);
    }

    QuietQpdf(const QuietQpdf&) = delete;
    QuietQpdf& operator=(const QuietQpdf&) = delete;
};

// helper: recompress data with zopfli into a zlib stream
std::vector<unsigned char> recompress_with_zopfli(const unsigned char* data, const size_t size, const int iterations) {
    ZopfliOptions opts;
    ZopfliInitOptions(&opts);
    opts.numiterations = iterations;
    opts.blocksplitting = 1;
    unsigned char* out_data = nullptr;
    size_t out_size = 0;
    ZopfliCompress(&opts, ZOPFLI_FORMAT_ZLIB, data, size, &out_data, &out_size);
    std::vector<unsigned char> result(out_data, out_data + out_size);
    free(out_data);
    return result;
}

std::string object_label(QPDFObjGen const& og) {
    return std::to_string(og.getObj()) + " " + std::to_string(og.getGen());
}

bool is_generalized_filter(const std::string& name) {
    static const std::set<std::string> kFilters = {
        "/FlateDecode", "/Fl", "/LZWDecode", "/LZW", "/ASCIIHexDecode", "/AHx", "/ASCII85Decode", "/A85"
    };
    return kFilters.contains(name);
}

// helper: true if the stream has no filter or only generalized (lossless, parameter-free) ones
bool stream_is_recompressible(QPDFObjectHandle const& stream) {
    if (!stream.isStream()) return false;
    const QPDFObjectHandle dict = stream.getDict();
    if (!dict.isDictionary()) return false;
    if (dict.hasKey("/DecodeParms") && !dict.getKey("/DecodeParms").isNull()) return false;
    if (dict.hasKey("/Type") && dict.getKey("/Type").isName() &&
        dict.getKey("/Type").getName() == "/Metadata") {
        return false;
    }

    const QPDFObjectHandle filter = dict.getKey("/Filter");
    if (filter.isNull()) return true;
    if (filter.isName()) return is_generalized_filter(filter.getName());
    if (filter.isArray()) {
        for (int i = 0; i < filter.getArrayNItems(); ++i) {
            const QPDFObjectHandle item = filter.getArrayItem(i);
            if (!item.isName() || !is_generalized_filter(item.getName())) return false;
        }
        return true;
    }
    return false;
}

// recompress every eligible stream of the document in place, returns how many were replaced
int zopfli_all_streams(QPDF& pdf, const int iterations, const std::size_t max_stream_bytes) {
    int replaced = 0;
    for (auto& obj : pdf.getAllObjects()) {
        if (!stream_is_recompressible(obj)) continue;

        std::shared_ptr<Buffer> decoded;
        std::size_t raw_size = 0;
        try {
            raw_size = obj.getRawStreamData()->getSize();
            decoded = obj.getStreamData(qpdf_dl_generalized);
        } catch (const QPDFExc& e) {
            Logger::log(LogLevel::Debug,
                        "Skipping stream " + object_label(obj.getObjGen()) + " (not decodable): " + e.what(),
                        "pdf_processor");
            continue;
        }

        if (decoded->getSize() > max_stream_bytes) {
            Logger::log(LogLevel::Debug,
                        "Stream " + object_label(obj.getObjGen()) + " too large for Zopfli (" +
                        std::to_string(decoded->getSize()) + " bytes)",
                        "pdf_processor");
            continue;
        }

        auto recompressed = recompress_with_zopfli(decoded->getBuffer(), decoded->getSize(), iterations);
        if (recompressed.size() >= raw_size) continue;

        obj.replaceStreamData(
            std::string(reinterpret_cast<const char*>(recompressed.data()), recompressed.size()),
            QPDFObjectHandle::newName("/FlateDecode"),
            QPDFObjectHandle::newNull());
        ++replaced;
    }
    return replaced;
}

// serialize with generated object streams, keeping already-filtered stream data as is
std::vector<unsigned char> write_pdf(QPDF& pdf) {
    QPDFWriter writer(pdf);
    writer.setOutputMemory();
    writer.setCompressStreams(true);
    writer.setDecodeLevel(qpdf_dl_none);
    writer.setObjectStreamMode(qpdf_o_generate);
    // same input, same bytes; qpdf cannot derive the ID of an encrypted output
    writer.setDeterministicID(!pdf.isEncrypted());
    writer.write();

    const std::shared_ptr<Buffer> buf = writer.getBufferSharedPointer();
    return {buf->getBuffer(), buf->getBuffer() + buf->getSize()};
}

// components of an 8-bit image colorspace we can re-encode, 0 if unsupported
int image_components(QPDFObjectHandle const& dict) {
    const QPDFObjectHandle cs = dict.getKey("/ColorSpace");
    if (cs.isName()) {
        if (cs.getName() == "/DeviceRGB") return 3;
        if (cs.getName() == "/DeviceGray") return 1;
        return 0;
    }
    if (cs.isArray() && cs.getArrayNItems() == 2) {
        const QPDFObjectHandle family = cs.getArrayItem(0);
        const QPDFObjectHandle profile = cs.getArrayItem(1);
        if (family.isName() && family.getName() == "/ICCBased" && profile.isStream()) {
            const QPDFObjectHandle n = profile.getDict().getKey("/N");
            if (n.isInteger() && (n.getIntValue() == 1 || n.getIntValue() == 3)) {
                return static_cast<int>(n.getIntValue());
            }
        }
    }
    return 0;
}

/**
 * @brief An embedded image that can go through the ladder.
 */
struct EmbeddedImage {
    QPDFObjectHandle stream;
    int width = 0;
    int height = 0;
    int components = 0;
    std::size_t stored_size = 0;
};

std::optional<EmbeddedImage> as_recompressible_image(QPDFObjectHandle image) {
    const QPDFObjectHandle dict = image.getDict();
    const QPDFObjectHandle mask = dict.getKey("/ImageMask");
    if (mask.isBool() && mask.getBoolValue()) return std::nullopt;
    if (dict.hasKey("/Decode")) return std::nullopt;

    const QPDFObjectHandle bpc = dict.getKey("/BitsPerComponent");
    if (!bpc.isInteger() || bpc.getIntValue() != 8) return std::nullopt;

    const QPDFObjectHandle w = dict.getKey("/Width");
    const QPDFObjectHandle h = dict.getKey("/Height");
    if (!w.isInteger() || !h.isInteger() || w.getIntValue() <= 0 || h.getIntValue() <= 0) return std::nullopt;

    const int comps = image_components(dict);
    if (comps == 0) return std::nullopt;

    EmbeddedImage out;
    out.width = static_cast<int>(w.getIntValue());
    out.height = static_cast<int>(h.getIntValue());
    out.components = comps;
    out.stored_size = image.getRawStreamData()->getSize();
    out.stream = std::move(image);
    return out;
}

std::string format_real(const double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v;
    return os.str();
}

std::size_t budget_share(const std::size_t target, const std::size_t overhead,
                         const std::size_t parts, const std::size_t floor) {
    const std::size_t available = target > overhead ? target - overhead : 0;
    return std::max(parts > 0 ? available / parts : available, floor);
}

} // namespace

namespace billpress {

std::string_view to_string(const PdfStrategy strategy) noexcept {
    switch (strategy) {
        case PdfStrategy::Passthrough:     return "passthrough";
        case PdfStrategy::Lossless:        return "lossless";
        case PdfStrategy::EmbeddedImages:  return "embedded-images";
        case PdfStrategy::Rasterized:      return "rasterized";
        case PdfStrategy::RasterizedRetry: return "rasterized-retry";
        case PdfStrategy::LosslessGuard:   return "lossless-guard";
        case PdfStrategy::FallbackCopy:    return "fallback-copy";
    }
    return "unknown";
}

int PdfProcessor::dpi_for_size(const std::uintmax_t source_size, const CompressionSettings& settings) noexcept {
    constexpr std::uintmax_t kMiB = 1024 * 1024;
    if (source_size <= kMiB) return settings.dpi_small;
    if (source_size <= 5 * kMiB) return settings.dpi_medium;
    if (source_size <= 15 * kMiB) return settings.dpi_large;
    return settings.dpi_huge;
}

int PdfProcessor::retry_dpi(const int dpi, const CompressionSettings& settings) noexcept {
    return std::max(static_cast<int>(dpi * settings.retry_dpi_factor), settings.retry_min_dpi);
}

ProcessOutcome PdfProcessor::process(const std::filesystem::path& input_path,
                                     const std::filesystem::path& output_path,
                                     const CompressionSettings& settings) {
    const auto result = compress(input_path, settings);
    write_file_bytes(output_path, result.bytes);

    ProcessOutcome outcome;
    outcome.output_path = output_path;
    outcome.output_size = std::filesystem::file_size(output_path);
    outcome.within_target = settings.target.fits(outcome.output_size);
    outcome.strategy = std::string(to_string(result.strategy));
    return outcome;
}

PdfCompression PdfProcessor::compress(const std::filesystem::path& input_path,
                                      const CompressionSettings& settings) {
    const std::string name = input_path.filename().string();
    const auto source_size = std::filesystem::file_size(input_path);
    const auto& target = settings.target;

    if (target.fits(source_size)) {
        Logger::log(LogLevel::Info, name + " already fits, copied unchanged", "pdf_processor");
        return {read_file_bytes(input_path), true, PdfStrategy::Passthrough};
    }

    try {
        auto lossless = lossless_rewrite(input_path, settings);
        Logger::log(LogLevel::Debug,
                    name + ": lossless rewrite " + std::to_string(source_size) + " -> " +
                    std::to_string(lossless.size()) + " bytes",
                    "pdf_processor");
        if (target.fits(lossless.size())) {
            return {std::move(lossless), true, PdfStrategy::Lossless};
        }

        std::optional<PdfCompression> best;
        const auto consider = [&](std::vector<unsigned char> bytes, const PdfStrategy strategy) {
            Logger::log(LogLevel::Debug,
                        name + ": " + std::string(to_string(strategy)) + " -> " + std::to_string(bytes.size()) + " bytes",
                        "pdf_processor");
            if (!best || bytes.size() <= best->bytes.size()) {
                const bool fits = target.fits(bytes.size());
                best = PdfCompression{std::move(bytes), fits, strategy};
            }
        };

        if (auto images = recompress_images(lossless, settings)) {
            consider(std::move(*images), PdfStrategy::EmbeddedImages);
        }

        if (!best || !best->within_target) {
            const int dpi = dpi_for_size(source_size, settings);
            consider(rasterize(input_path, dpi, settings.page_floor, settings), PdfStrategy::Rasterized);

            if (!best->within_target) {
                consider(rasterize(input_path, retry_dpi(dpi, settings), settings.retry_page_floor, settings),
                         PdfStrategy::RasterizedRetry);
            }
        }

        if (!best->within_target && best->bytes.size() * 2 > source_size) {
            Logger::log(LogLevel::Info,
                        name + ": rewrite still " + std::to_string(best->bytes.size()) +
                        " bytes, keeping the lossless result",
                        "pdf_processor");
            return {std::move(lossless), false, PdfStrategy::LosslessGuard};
        }
        return std::move(*best);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, name + ": compression failed, copying source: " + e.what(), "pdf_processor");
    }

    return {read_file_bytes(input_path), target.fits(source_size), PdfStrategy::FallbackCopy};
}

std::vector<unsigned char> PdfProcessor::lossless_rewrite(const std::filesystem::path& input_path,
                                                          const CompressionSettings& settings) {
    QuietQpdf doc;
    doc.pdf.processFile(input_path.string().c_str());
    const int replaced = zopfli_all_streams(doc.pdf, settings.zopfli_iterations,
                                            settings.zopfli_max_stream_bytes);
    Logger::log(LogLevel::Debug, "Zopfli replaced " + std::to_string(replaced) + " stream(s)", "pdf_processor");
    return write_pdf(doc.pdf);
}

std::optional<std::vector<unsigned char>> PdfProcessor::recompress_images(const std::vector<unsigned char>& lossless,
                                                                          const CompressionSettings& settings) {
    QuietQpdf doc;
    doc.pdf.processMemoryFile("lossless rewrite",
                              reinterpret_cast<const char*>(lossless.data()), lossless.size());

    std::map<QPDFObjGen, EmbeddedImage> images;
    for (auto& page : QPDFPageDocumentHelper(doc.pdf).getAllPages()) {
        for (auto& [key, image] : page.getImages()) {
            if (images.contains(image.getObjGen())) continue;
            if (auto candidate = as_recompressible_image(image)) {
                images.emplace(image.getObjGen(), std::move(*candidate));
            }
        }
    }
    if (images.empty()) {
        Logger::log(LogLevel::Debug, "No re-encodable embedded images", "pdf_processor");
        return std::nullopt;
    }

    const std::size_t target = settings.target.max_bytes;
    const std::size_t image_budget = target > settings.pdf_fixed_overhead ? target - settings.pdf_fixed_overhead : 0;
    std::size_t stored_total = 0;
    for (const auto& [og, image] : images) stored_total += image.stored_size;

    if (stored_total <= image_budget) {
        Logger::log(LogLevel::Debug,
                    "Embedded images already within budget (" + std::to_string(stored_total) + " bytes)",
                    "pdf_processor");
        return std::nullopt;
    }

    const std::size_t per_image = budget_share(target, settings.pdf_fixed_overhead, images.size(),
                                               settings.embedded_image_floor);
    const ImageCompressor compressor(settings.pdf_ladder);
    int replaced = 0;

    for (auto& [og, image] : images) {
        std::shared_ptr<Buffer> pixels;
        try {
            pixels = image.stream.getStreamData(qpdf_dl_all);
        } catch (const QPDFExc& e) {
            Logger::log(LogLevel::Debug, "Skipping image " + object_label(og) + ": " + e.what(), "pdf_processor");
            continue;
        }

        RasterImage raster(image.width, image.height,
                           image.components == 1 ? ColorMode::Grayscale : ColorMode::Rgb);
        if (pixels->getSize() < raster.pixels.size()) {
            Logger::log(LogLevel::Debug, "Skipping image " + object_label(og) + ": short sample data", "pdf_processor");
            continue;
        }
        std::memcpy(raster.pixels.data(), pixels->getBuffer(), raster.pixels.size());

        const auto result = compressor.compress(raster, per_image);
        if (result.blob.byte_length() >= image.stored_size) continue;

        QPDFObjectHandle dict = image.stream.getDict();
        dict.replaceKey("/Width", QPDFObjectHandle::newInteger(result.width));
        dict.replaceKey("/Height", QPDFObjectHandle::newInteger(result.height));
        image.stream.replaceStreamData(
            std::string(reinterpret_cast<const char*>(result.blob.bytes.data()), result.blob.byte_length()),
            QPDFObjectHandle::newName("/DCTDecode"),
            QPDFObjectHandle::newNull());
        ++replaced;
    }

    Logger::log(LogLevel::Debug,
                "Re-encoded " + std::to_string(replaced) + " of " + std::to_string(images.size()) +
                " image(s) at " + std::to_string(per_image) + " bytes each",
                "pdf_processor");
    if (replaced == 0) return std::nullopt;
    return write_pdf(doc.pdf);
}

std::vector<unsigned char> PdfProcessor::rasterize(const std::filesystem::path& input_path,
                                                   const int dpi,
                                                   const std::size_t page_floor,
                                                   const CompressionSettings& settings) {
    const PdfRasterizer rasterizer(input_path);
    const int pages = rasterizer.page_count();
    if (pages <= 0) {
        throw std::runtime_error("document has no pages");
    }

    const std::size_t per_page = budget_share(settings.target.max_bytes, settings.pdf_fixed_overhead,
                                              static_cast<std::size_t>(pages), page_floor);
    Logger::log(LogLevel::Info,
                "Rasterizing " + std::to_string(pages) + " page(s) at " + std::to_string(dpi) +
                " dpi, " + std::to_string(per_page) + " bytes per page",
                "pdf_processor");

    QuietQpdf out;
    out.pdf.emptyPDF();
    QPDFPageDocumentHelper page_helper(out.pdf);
    const ImageCompressor compressor(settings.pdf_ladder);

    for (int i = 0; i < pages; ++i) {
        const PageSize size = rasterizer.page_size(i);
        const auto result = compressor.compress(rasterizer.render_page(i, dpi), per_page);

        QPDFObjectHandle image = QPDFObjectHandle::newStream(&out.pdf);
        QPDFObjectHandle image_dict = image.getDict();
        image_dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
        image_dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
        image_dict.replaceKey("/Width", QPDFObjectHandle::newInteger(result.width));
        image_dict.replaceKey("/Height", QPDFObjectHandle::newInteger(result.height));
        image_dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceRGB"));
        image_dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
        image.replaceStreamData(
            std::string(reinterpret_cast<const char*>(result.blob.bytes.data()), result.blob.byte_length()),
            QPDFObjectHandle::newName("/DCTDecode"),
            QPDFObjectHandle::newNull());

        const std::string width = format_real(size.width_pt);
        const std::string height = format_real(size.height_pt);
        QPDFObjectHandle contents = QPDFObjectHandle::newStream(
            &out.pdf, "q " + width + " 0 0 " + height + " 0 0 cm /Im0 Do Q\n");

        QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
        xobjects.replaceKey("/Im0", image);
        QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
        resources.replaceKey("/XObject", xobjects);

        QPDFObjectHandle media_box = QPDFObjectHandle::newArray();
        media_box.appendItem(QPDFObjectHandle::newInteger(0));
        media_box.appendItem(QPDFObjectHandle::newInteger(0));
        media_box.appendItem(QPDFObjectHandle::newReal(size.width_pt, 2));
        media_box.appendItem(QPDFObjectHandle::newReal(size.height_pt, 2));

        QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox", media_box);
        page.replaceKey("/Contents", contents);
        page.replaceKey("/Resources", resources);
        page_helper.addPage(QPDFPageObjectHelper(out.pdf.makeIndirectObject(page)), false);
    }

    // document info is copied best-effort; the source must outlive the write
    QuietQpdf source;
    try {
        source.pdf.processFile(input_path.string().c_str());
        const QPDFObjectHandle info = source.pdf.getTrailer().getKey("/Info");
        if (info.isIndirect() && info.isDictionary()) {
            out.pdf.getTrailer().replaceKey("/Info", out.pdf.copyForeignObject(info));
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, std::string("Document info not copied: ") + e.what(), "pdf_processor");
    }

    return write_pdf(out.pdf);
}

} // namespace billpress
