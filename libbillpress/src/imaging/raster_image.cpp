//
// Created by Giuseppe Francione on 13/01/26.
//

#include "../../include/raster_image.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace billpress {

namespace {

inline std::uint8_t clamp_u8(const double v) {
    return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

// blend one channel value over white
inline std::uint8_t over_white(const unsigned value, const unsigned alpha) {
    return static_cast<std::uint8_t>((value * alpha + 255U * (255U - alpha) + 127U) / 255U);
}

/**
 * @brief Source span of one destination sample along an axis.
 */
struct Contribution {
    int first = 0;              ///< first source index
    std::vector<double> weights; ///< normalized weights for first, first+1, ...
};

// area coverage of [d*ratio, (d+1)*ratio) over integer source cells
std::vector<Contribution> make_contributions(const int src_len, const int dst_len) {
    std::vector<Contribution> out(dst_len);
    const double ratio = static_cast<double>(src_len) / dst_len;

    for (int d = 0; d < dst_len; ++d) {
        const double begin = d * ratio;
        const double end = std::min(static_cast<double>(src_len), (d + 1) * ratio);
        const int first = std::min(src_len - 1, static_cast<int>(std::floor(begin)));
        const int last = std::clamp(static_cast<int>(std::ceil(end)) - 1, first, src_len - 1);

        auto& c = out[d];
        c.first = first;
        double total = 0.0;
        for (int s = first; s <= last; ++s) {
            const double overlap = std::min(end, s + 1.0) - std::max(begin, static_cast<double>(s));
            const double w = std::max(overlap, 0.0);
            c.weights.push_back(w);
            total += w;
        }
        if (total <= 0.0) {
            c.weights.assign(1, 1.0);
            continue;
        }
        for (auto& w : c.weights) w /= total;
    }
    return out;
}

} // namespace

std::string_view to_string(const ColorMode mode) noexcept {
    switch (mode) {
        case ColorMode::Rgb:            return "RGB";
        case ColorMode::Rgba:           return "RGBA";
        case ColorMode::Grayscale:      return "L";
        case ColorMode::GrayscaleAlpha: return "LA";
        case ColorMode::Cmyk:           return "CMYK";
    }
    return "?";
}

RasterImage::RasterImage(const int w, const int h, const ColorMode m)
    : width(w), height(h), mode(m) {
    if (w <= 0 || h <= 0) {
        throw std::invalid_argument("invalid image dimensions " + std::to_string(w) + "x" + std::to_string(h));
    }
    pixels.assign(stride() * static_cast<std::size_t>(h), 0);
}

RasterImage flatten_on_white(const RasterImage& image) {
    if (!has_alpha(image.mode)) {
        return image;
    }

    RasterImage out(image.width, image.height, ColorMode::Rgb);
    const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
    const std::uint8_t* src = image.pixels.data();
    std::uint8_t* dst = out.pixels.data();

    if (image.mode == ColorMode::Rgba) {
        for (std::size_t i = 0; i < count; ++i, src += 4, dst += 3) {
            const unsigned a = src[3];
            dst[0] = over_white(src[0], a);
            dst[1] = over_white(src[1], a);
            dst[2] = over_white(src[2], a);
        }
    } else {
        for (std::size_t i = 0; i < count; ++i, src += 2, dst += 3) {
            const std::uint8_t v = over_white(src[0], src[1]);
            dst[0] = dst[1] = dst[2] = v;
        }
    }
    return out;
}

RasterImage to_rgb(const RasterImage& image) {
    switch (image.mode) {
        case ColorMode::Rgb:
            return image;
        case ColorMode::Rgba:
        case ColorMode::GrayscaleAlpha:
            return flatten_on_white(image);
        case ColorMode::Grayscale: {
            RasterImage out(image.width, image.height, ColorMode::Rgb);
            const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
            for (std::size_t i = 0; i < count; ++i) {
                const std::uint8_t v = image.pixels[i];
                out.pixels[i * 3] = out.pixels[i * 3 + 1] = out.pixels[i * 3 + 2] = v;
            }
            return out;
        }
        case ColorMode::Cmyk: {
            RasterImage out(image.width, image.height, ColorMode::Rgb);
            const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
            for (std::size_t i = 0; i < count; ++i) {
                const std::uint8_t* p = &image.pixels[i * 4];
                const unsigned k = 255U - p[3];
                out.pixels[i * 3]     = static_cast<std::uint8_t>((255U - p[0]) * k / 255U);
                out.pixels[i * 3 + 1] = static_cast<std::uint8_t>((255U - p[1]) * k / 255U);
                out.pixels[i * 3 + 2] = static_cast<std::uint8_t>((255U - p[2]) * k / 255U);
            }
            return out;
        }
    }
    throw std::logic_error("unknown color mode");
}

RasterImage normalize_for_jpeg(const RasterImage& image) {
    if (image.mode == ColorMode::Rgb || image.mode == ColorMode::Grayscale) {
        return image;
    }
    return to_rgb(image);
}

std::pair<int, int> scaled_dimensions(const int width, const int height, const double scale) noexcept {
    const int w = static_cast<int>(std::lround(width * scale));
    const int h = static_cast<int>(std::lround(height * scale));
    return {std::max(1, w), std::max(1, h)};
}

RasterImage resample_area(const RasterImage& image, const int new_width, const int new_height) {
    if (image.empty()) {
        throw std::invalid_argument("cannot resample an empty image");
    }
    if (new_width <= 0 || new_height <= 0) {
        throw std::invalid_argument("invalid resample target");
    }
    if (new_width == image.width && new_height == image.height) {
        return image;
    }

    const int ch = image.channels();
    const auto xs = make_contributions(image.width, new_width);
    const auto ys = make_contributions(image.height, new_height);

    // horizontal pass into a float buffer of new_width x height
    std::vector<float> tmp(static_cast<std::size_t>(new_width) * image.height * ch);
    for (int y = 0; y < image.height; ++y) {
        const std::uint8_t* src = image.row(y);
        float* dst = tmp.data() + static_cast<std::size_t>(y) * new_width * ch;
        for (int x = 0; x < new_width; ++x) {
            const auto& c = xs[x];
            for (int k = 0; k < ch; ++k) {
                double acc = 0.0;
                for (std::size_t i = 0; i < c.weights.size(); ++i) {
                    acc += c.weights[i] * src[(c.first + i) * ch + k];
                }
                dst[x * ch + k] = static_cast<float>(acc);
            }
        }
    }

    // vertical pass
    RasterImage out(new_width, new_height, image.mode);
    const std::size_t tmp_stride = static_cast<std::size_t>(new_width) * ch;
    for (int y = 0; y < new_height; ++y) {
        const auto& c = ys[y];
        std::uint8_t* dst = out.row(y);
        for (std::size_t i = 0; i < tmp_stride; ++i) {
            double acc = 0.0;
            for (std::size_t j = 0; j < c.weights.size(); ++j) {
                acc += c.weights[j] * tmp[(c.first + j) * tmp_stride + i];
            }
            dst[i] = clamp_u8(acc);
        }
    }
    return out;
}

} // namespace billpress
