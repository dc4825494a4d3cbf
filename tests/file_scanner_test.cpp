//
// Created by Giuseppe Francione on 26/01/26.
//

#include <catch2/catch.hpp>
#include "../libbillpress/include/file_kind.hpp"
#include "../libbillpress/include/file_scanner.hpp"
#include "test_helpers.hpp"
#include <filesystem>

using namespace billpress;
namespace fs = std::filesystem;

TEST_CASE("Kinds come from the extension", "[kind]") {
    REQUIRE(kind_from_extension(".PDF") == FileKind::Pdf);
    REQUIRE(kind_from_extension(".Jpeg") == FileKind::Image);
    REQUIRE(kind_from_extension(".png") == FileKind::Image);
    REQUIRE(kind_from_extension(".tiff") == FileKind::Unsupported);
    REQUIRE(kind_from_extension("") == FileKind::Unsupported);
}

TEST_CASE("Junk files are recognized", "[scanner]") {
    REQUIRE(is_junk("x/.DS_Store"));
    REQUIRE(is_junk("Desktop.ini"));
    REQUIRE(is_junk("._invoice.pdf"));
    REQUIRE_FALSE(is_junk("invoice.pdf"));
}

TEST_CASE("scan_folder keeps supported files sorted by name", "[scanner]") {
    const test::TempDir dir("scan");
    test::write_bytes(dir / "b.PDF", "%PDF-1.4\n");
    test::write_bytes(dir / "a.jpg", "not really a jpeg");
    test::write_bytes(dir / "c.png", "12345");
    test::write_bytes(dir / "notes.txt", "skip me");
    test::write_bytes(dir / "._a.jpg", "resource fork");
    test::write_bytes(dir / ".DS_Store", "finder");
    fs::create_directory(dir / "nested.pdf");
    test::write_bytes(dir / "nested.pdf" / "inner.pdf", "%PDF-1.4\n");

    const ScanResult scan = scan_folder(dir.path());

    REQUIRE(scan.files.size() == 3);
    CHECK(scan.files[0].filename() == "a.jpg");
    CHECK(scan.files[1].filename() == "b.PDF");
    CHECK(scan.files[2].filename() == "c.png");
    CHECK(scan.total_bytes == 9 + 17 + 5);
}

TEST_CASE("scan_folder rejects non-directories", "[scanner]") {
    const test::TempDir dir("scan");
    test::write_bytes(dir / "file.pdf", "%PDF");
    REQUIRE_THROWS_AS(scan_folder(dir / "file.pdf"), std::runtime_error);
    REQUIRE_THROWS_AS(scan_folder(dir / "missing"), std::runtime_error);

    REQUIRE(scan_folder(dir.path()).files.size() == 1);
}
