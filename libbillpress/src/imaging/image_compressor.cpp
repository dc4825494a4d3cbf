//
// Created by Giuseppe Francione on 15/01/26.
//

#include "../../include/image_compressor.hpp"
#include "../../include/image_codec.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace billpress {

namespace {

// scales are accumulated by repeated subtraction, compare with some slack
constexpr double kScaleEpsilon = 1e-9;

bool rung_in_range(const Rung& rung, const LadderOptions& opts) noexcept {
    return rung.quality >= opts.min_quality && rung.scale >= opts.min_scale - kScaleEpsilon;
}

Rung next_rung(Rung rung, const LadderOptions& opts) noexcept {
    if (rung.quality > opts.high_quality_threshold) {
        rung.quality -= opts.large_step;
    } else {
        rung.quality -= opts.small_step;
        rung.scale -= opts.scale_step;
    }
    return rung;
}

void validate(const LadderOptions& opts) {
    if (opts.large_step <= 0 || opts.small_step <= 0 || opts.scale_step <= 0.0) {
        throw std::invalid_argument("ladder steps must be positive");
    }
}

} // namespace

ImageCompressor::ImageCompressor(LadderOptions options) : options_(std::move(options)) {
    validate(options_);
}

std::vector<Rung> ImageCompressor::ladder(const LadderOptions& options) {
    validate(options);
    std::vector<Rung> rungs;
    for (Rung r{options.initial_quality, 1.0}; rung_in_range(r, options); r = next_rung(r, options)) {
        rungs.push_back(r);
    }
    return rungs;
}

LadderOutcome ImageCompressor::compress(const RasterImage& image, const std::size_t target_bytes) const {
    if (image.empty()) {
        throw std::invalid_argument("cannot compress an empty image");
    }

    const RasterImage base = normalize_for_jpeg(image);
    LadderOutcome outcome;
    bool have_best = false;

    for (Rung r{options_.initial_quality, 1.0}; rung_in_range(r, options_); r = next_rung(r, options_)) {
        ++outcome.rungs_tried;

        EncodedBlob blob;
        int w = base.width;
        int h = base.height;
        if (r.scale < 1.0 - kScaleEpsilon) {
            std::tie(w, h) = scaled_dimensions(base.width, base.height, r.scale);
            blob = encode_jpeg(resample_area(base, w, h), r.quality);
        } else {
            blob = encode_jpeg(base, r.quality);
        }

        Logger::log(LogLevel::Debug,
                    "rung q=" + std::to_string(r.quality) + " scale=" + std::to_string(r.scale) +
                    " -> " + std::to_string(blob.byte_length()) + " bytes (target " +
                    std::to_string(target_bytes) + ")",
                    "image_compressor");

        if (blob.byte_length() <= target_bytes) {
            outcome.blob = std::move(blob);
            outcome.rung = r;
            outcome.width = w;
            outcome.height = h;
            outcome.within_target = true;
            return outcome;
        }

        const bool keep = !have_best ||
                          options_.policy == BestResultPolicy::Latest ||
                          blob.byte_length() < outcome.blob.byte_length();
        if (keep) {
            outcome.blob = std::move(blob);
            outcome.rung = r;
            outcome.width = w;
            outcome.height = h;
            have_best = true;
        }
    }

    if (!have_best) {
        // degenerate options with an empty ladder: encode once at the floor quality
        outcome.rung = Rung{options_.min_quality, 1.0};
        outcome.width = base.width;
        outcome.height = base.height;
        outcome.blob = encode_jpeg(base, options_.min_quality);
        outcome.rungs_tried = 1;
        outcome.within_target = outcome.blob.byte_length() <= target_bytes;
    }

    return outcome;
}

std::vector<std::uint8_t> ImageCompressor::compress_bytes(const std::span<const std::uint8_t> data,
                                                          const std::size_t target_bytes) const {
    RasterImage image;
    try {
        image = decode_image(data);
    } catch (const DecodeError& e) {
        Logger::log(LogLevel::Warning, std::string("keeping original bytes: ") + e.what(), "image_compressor");
        return {data.begin(), data.end()};
    }
    return compress(image, target_bytes).blob.bytes;
}

} // namespace billpress
