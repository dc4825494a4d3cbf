//
// Created by Giuseppe Francione on 27/01/26.
//

#include <catch2/catch.hpp>
#include "../libbillpress/include/file_utils.hpp"
#include "../libbillpress/include/image_codec.hpp"
#include "../libbillpress/include/pdf_processor.hpp"
#include "../libbillpress/include/pdf_rasterizer.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <filesystem>

using namespace billpress;
namespace fs = std::filesystem;

namespace {

CompressionSettings with_target(const std::size_t bytes) {
    CompressionSettings s;
    s.target = CompressionTarget(bytes);
    return s;
}

} // namespace

TEST_CASE("DPI follows the source size", "[pdf]") {
    const CompressionSettings s;
    constexpr std::uintmax_t MiB = 1024 * 1024;

    CHECK(PdfProcessor::dpi_for_size(300 * 1024, s) == 150);
    CHECK(PdfProcessor::dpi_for_size(MiB, s) == 150);
    CHECK(PdfProcessor::dpi_for_size(MiB + 1, s) == 120);
    CHECK(PdfProcessor::dpi_for_size(5 * MiB, s) == 120);
    CHECK(PdfProcessor::dpi_for_size(10 * MiB, s) == 100);
    CHECK(PdfProcessor::dpi_for_size(40 * MiB, s) == 72);

    CHECK(PdfProcessor::retry_dpi(150, s) == 105);
    CHECK(PdfProcessor::retry_dpi(72, s) == 50);
    CHECK(PdfProcessor::retry_dpi(60, s) == 50);
}

TEST_CASE("Strategies have stable names", "[pdf]") {
    CHECK(to_string(PdfStrategy::Passthrough) == "passthrough");
    CHECK(to_string(PdfStrategy::RasterizedRetry) == "rasterized-retry");
    CHECK(to_string(PdfStrategy::FallbackCopy) == "fallback-copy");
}

TEST_CASE("A PDF already within budget is copied byte for byte", "[pdf]") {
    const test::TempDir dir("pdf");
    test::write_image_pdf(dir / "small.pdf", {test::make_test_image(120, 160)}, 60);
    const auto original = read_file_bytes(dir / "small.pdf");

    const auto result = PdfProcessor::compress(dir / "small.pdf", with_target(original.size()));
    REQUIRE(result.strategy == PdfStrategy::Passthrough);
    REQUIRE(result.within_target);
    REQUIRE(result.bytes == original);
}

TEST_CASE("Oversized embedded images are re-encoded", "[pdf]") {
    const test::TempDir dir("pdf");
    const auto page = test::make_test_image(600, 800);
    test::write_image_pdf(dir / "scan.pdf", {page}, 95);

    // room for roughly a q50 copy of the page image plus the fixed overhead
    const CompressionSettings defaults;
    const std::size_t q50 = encode_jpeg(page, 50).byte_length();
    const std::size_t target = defaults.pdf_fixed_overhead + q50 + q50 / 10;
    REQUIRE(fs::file_size(dir / "scan.pdf") > target);

    const auto result = PdfProcessor::compress(dir / "scan.pdf", with_target(target));
    CHECK(result.strategy == PdfStrategy::EmbeddedImages);
    CHECK(result.within_target);
    CHECK(result.bytes.size() <= target);
    CHECK(test::pdf_page_count(result.bytes) == 1);
}

TEST_CASE("Rasterization keeps page count and order", "[pdf][raster]") {
    const test::TempDir dir("pdf");
    // portrait then landscape, drawn with vector fills only
    test::write_vector_pdf(dir / "drawing.pdf", {{400, 560}, {560, 400}}, 8000);
    const auto source_size = fs::file_size(dir / "drawing.pdf");

    CompressionSettings s = with_target(std::max<std::uintmax_t>(source_size / 4, 64 * 1024));
    s.zopfli_iterations = 1;
    REQUIRE_FALSE(s.target.fits(source_size));

    const auto result = PdfProcessor::compress(dir / "drawing.pdf", s);
    REQUIRE((result.strategy == PdfStrategy::Rasterized || result.strategy == PdfStrategy::RasterizedRetry));
    REQUIRE(result.bytes.size() < source_size);

    const auto sizes = test::pdf_page_sizes(result.bytes);
    REQUIRE(sizes.size() == 2);
    CHECK(sizes[0].first == Approx(400));
    CHECK(sizes[0].second == Approx(560));
    CHECK(sizes[1].first == Approx(560));
    CHECK(sizes[1].second == Approx(400));
}

TEST_CASE("Unfiltered content streams fit after the lossless rewrite", "[pdf]") {
    const test::TempDir dir("pdf");
    test::write_vector_pdf(dir / "plain.pdf", {{400, 560}}, 3000, false);
    const auto source_size = fs::file_size(dir / "plain.pdf");

    CompressionSettings s = with_target(source_size / 2);
    s.zopfli_iterations = 1;

    SECTION("streams recompressed with Zopfli") {
        const auto result = PdfProcessor::compress(dir / "plain.pdf", s);
        REQUIRE(result.strategy == PdfStrategy::Lossless);
        CHECK(result.within_target);
        CHECK(result.bytes.size() <= s.target.max_bytes);
        CHECK(test::pdf_page_count(result.bytes) == 1);
    }

    SECTION("streams above the Zopfli limit are still deflated on write") {
        s.zopfli_max_stream_bytes = 0;
        const auto result = PdfProcessor::compress(dir / "plain.pdf", s);
        REQUIRE(result.strategy == PdfStrategy::Lossless);
        CHECK(result.within_target);
        CHECK(test::pdf_page_count(result.bytes) == 1);
    }
}

TEST_CASE("Rasterization that cannot halve the source keeps the lossless rewrite", "[pdf][raster]") {
    const test::TempDir dir("pdf");
    // a few KB of drawing operators that render to a full page of detail
    test::write_tiled_pdf(dir / "tiles.pdf", 600, 800, 40, 150);
    const auto source_size = fs::file_size(dir / "tiles.pdf");

    CompressionSettings s = with_target(1024);
    s.zopfli_iterations = 1;

    const auto guarded = PdfProcessor::compress(dir / "tiles.pdf", s);
    REQUIRE(guarded.strategy == PdfStrategy::LosslessGuard);
    CHECK_FALSE(guarded.within_target);
    REQUIRE(guarded.bytes.size() > s.target.max_bytes);
    REQUIRE(guarded.bytes.size() < source_size);
    CHECK(test::pdf_page_count(guarded.bytes) == 1);

    // with exactly that much room the lossless stage itself succeeds
    s.target = CompressionTarget(guarded.bytes.size());
    const auto lossless = PdfProcessor::compress(dir / "tiles.pdf", s);
    REQUIRE(lossless.strategy == PdfStrategy::Lossless);
    CHECK(lossless.bytes == guarded.bytes);
}

TEST_CASE("A missed first rasterization is retried at lower DPI", "[pdf][raster]") {
    const test::TempDir dir("pdf");
    test::write_vector_pdf(dir / "drawing.pdf", {{400, 560}, {560, 400}}, 8000);
    const auto source_size = fs::file_size(dir / "drawing.pdf");

    // one rung only, so each page costs exactly a q80 encode at the render DPI
    CompressionSettings s;
    s.pdf_ladder.min_quality = 80;
    s.retry_dpi_factor = 0.2;
    s.retry_min_dpi = 24;
    s.zopfli_iterations = 1;
    const int dpi = PdfProcessor::dpi_for_size(source_size, s);
    const int low_dpi = PdfProcessor::retry_dpi(dpi, s);
    REQUIRE(low_dpi < dpi);

    const PdfRasterizer rasterizer(dir / "drawing.pdf");
    std::size_t first_pass = 0, retry_pass = 0;
    for (int i = 0; i < rasterizer.page_count(); ++i) {
        first_pass += encode_jpeg(rasterizer.render_page(i, dpi), 80).byte_length();
        retry_pass += encode_jpeg(rasterizer.render_page(i, low_dpi), 80).byte_length();
    }

    // page dictionaries and xref fit easily in the margin
    const std::size_t target = retry_pass + 16 * 1024;
    REQUIRE(first_pass > target);
    REQUIRE(source_size > target * 3 / 2);
    s.target = CompressionTarget(target);

    const auto result = PdfProcessor::compress(dir / "drawing.pdf", s);
    REQUIRE(result.strategy == PdfStrategy::RasterizedRetry);
    CHECK(result.within_target);
    CHECK(result.bytes.size() <= target);

    const auto sizes = test::pdf_page_sizes(result.bytes);
    REQUIRE(sizes.size() == 2);
    CHECK(sizes[0].first == Approx(400));
    CHECK(sizes[1].first == Approx(560));
}

TEST_CASE("Embedded images already within their share are left alone", "[pdf]") {
    const test::TempDir dir("pdf");
    const auto picture = test::make_test_image(100, 100);
    test::write_image_pdf(dir / "stamp.pdf", {picture}, 60);
    const std::size_t stored = encode_jpeg(picture, 60).byte_length();
    const auto source_size = fs::file_size(dir / "stamp.pdf");

    // the image alone fits, the document around it does not
    CompressionSettings s = with_target(stored + 64);
    s.pdf_fixed_overhead = 0;
    s.zopfli_iterations = 1;
    REQUIRE(source_size > s.target.max_bytes);

    const auto result = PdfProcessor::compress(dir / "stamp.pdf", s);
    CHECK(result.strategy != PdfStrategy::EmbeddedImages);
    CHECK((result.strategy == PdfStrategy::Rasterized ||
           result.strategy == PdfStrategy::RasterizedRetry ||
           result.strategy == PdfStrategy::LosslessGuard));
    CHECK(test::pdf_page_count(result.bytes) == 1);
}

TEST_CASE("Unreadable PDF falls back to a copy", "[pdf]") {
    const test::TempDir dir("pdf");
    const std::string junk = "%PDF-1.7\n" + std::string(8192, 'x');
    test::write_bytes(dir / "broken.pdf", junk);

    const auto result = PdfProcessor::compress(dir / "broken.pdf", with_target(1024));
    REQUIRE(result.strategy == PdfStrategy::FallbackCopy);
    REQUIRE_FALSE(result.within_target);
    REQUIRE(result.bytes == read_file_bytes(dir / "broken.pdf"));

    SECTION("process() still writes the copy") {
        PdfProcessor proc;
        const auto outcome = proc.process(dir / "broken.pdf", dir / "out.pdf", with_target(1024));
        REQUIRE(outcome.strategy == "fallback-copy");
        REQUIRE_FALSE(outcome.within_target);
        REQUIRE(outcome.output_size == junk.size());
    }
}

TEST_CASE("Missing PDF is an error, not a copy", "[pdf]") {
    REQUIRE_THROWS(PdfProcessor::compress("/nonexistent/billpress/x.pdf", CompressionSettings{}));
}

TEST_CASE("Rasterizer renders pages at the requested DPI", "[raster]") {
    const test::TempDir dir("pdf");
    test::write_image_pdf(dir / "two.pdf",
                          {test::make_test_image(200, 300), test::make_test_image(300, 200)}, 80);

    const PdfRasterizer rasterizer(dir / "two.pdf");
    REQUIRE(rasterizer.page_count() == 2);

    const PageSize size = rasterizer.page_size(1);
    CHECK(size.width_pt == Approx(225.0));
    CHECK(size.height_pt == Approx(150.0));

    const RasterImage img = rasterizer.render_page(0, 144);
    CHECK(img.mode == ColorMode::Rgb);
    CHECK(img.width == Approx(300).margin(1));
    CHECK(img.height == Approx(450).margin(1));

    REQUIRE_THROWS(rasterizer.render_page(5, 72));
    REQUIRE_THROWS_AS(PdfRasterizer(dir / "missing.pdf"), std::runtime_error);
}
