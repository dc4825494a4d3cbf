//
// Created by Giuseppe Francione on 25/01/26.
//

#include <catch2/catch.hpp>
#include "../libbillpress/include/file_utils.hpp"
#include "../libbillpress/include/image_codec.hpp"
#include "test_helpers.hpp"

using namespace billpress;

TEST_CASE("Image formats are sniffed from magic bytes", "[codec]") {
    const std::vector<std::uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0};
    const std::vector<std::uint8_t> jpg = {0xFF, 0xD8, 0xFF, 0xE0};
    const std::vector<std::uint8_t> txt = {'h', 'e', 'l', 'l', 'o'};

    REQUIRE(sniff_image_format(png) == ImageFormat::Png);
    REQUIRE(sniff_image_format(jpg) == ImageFormat::Jpeg);
    REQUIRE(sniff_image_format(txt) == ImageFormat::Unknown);
    REQUIRE(sniff_image_format({}) == ImageFormat::Unknown);
}

TEST_CASE("PNG files decode with their color mode", "[codec]") {
    const test::TempDir dir("codec");

    SECTION("RGBA") {
        const auto src = test::make_test_image(40, 30, ColorMode::Rgba);
        test::write_png(dir / "a.png", src);
        const RasterImage img = decode_image(read_file_bytes(dir / "a.png"));
        REQUIRE(img.mode == ColorMode::Rgba);
        REQUIRE(img.width == 40);
        REQUIRE(img.height == 30);
        REQUIRE(img.pixels == src.pixels);
    }

    SECTION("grayscale") {
        const auto src = test::make_test_image(17, 9, ColorMode::Grayscale);
        test::write_png(dir / "g.png", src);
        const RasterImage img = decode_png(read_file_bytes(dir / "g.png"));
        REQUIRE(img.mode == ColorMode::Grayscale);
        REQUIRE(img.pixels == src.pixels);
    }
}

TEST_CASE("JPEG encoding honors quality", "[codec]") {
    const auto img = test::make_test_image(160, 120);
    const EncodedBlob high = encode_jpeg(img, 90);
    const EncodedBlob low = encode_jpeg(img, 30);

    REQUIRE(sniff_image_format(high.bytes) == ImageFormat::Jpeg);
    REQUIRE(low.byte_length() < high.byte_length());

    const RasterImage back = decode_jpeg(low.bytes);
    REQUIRE(back.mode == ColorMode::Rgb);
    REQUIRE(back.width == 160);
    REQUIRE(back.height == 120);
}

TEST_CASE("JPEG encoder rejects modes it cannot store", "[codec]") {
    REQUIRE_THROWS_AS(encode_jpeg(RasterImage(2, 2, ColorMode::Rgba), 80), std::invalid_argument);
    REQUIRE_THROWS_AS(encode_jpeg(RasterImage{}, 80), std::invalid_argument);
}

TEST_CASE("Malformed bytes raise DecodeError", "[codec]") {
    const std::vector<std::uint8_t> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    REQUIRE_THROWS_AS(decode_image(garbage), DecodeError);

    // valid signature, truncated body
    auto jpeg = encode_jpeg(test::make_test_image(32, 32), 80).bytes;
    jpeg.resize(20);
    REQUIRE_THROWS_AS(decode_image(jpeg), DecodeError);

    const std::vector<std::uint8_t> png_head = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0, 0, 0};
    REQUIRE_THROWS_AS(decode_image(png_head), DecodeError);
}
