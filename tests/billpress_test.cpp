//
// Created by Giuseppe Francione on 29/01/26.
//

#include <catch2/catch.hpp>
#include "../libbillpress/include/billpress.hpp"
#include "../libbillpress/include/logger.hpp"
#include "test_helpers.hpp"
#include <ctime>
#include <filesystem>
#include <future>
#include <regex>

using namespace billpress;
namespace fs = std::filesystem;

namespace {

struct RecordingObserver final : BillpressObserver {
    std::vector<std::string> started;
    std::size_t finished = 0;
    std::size_t errors = 0;
    std::size_t logs = 0;

    void onFileStart(const fs::path& path, std::size_t, std::size_t) override {
        started.push_back(path.filename().string());
    }
    void onFileFinish(const fs::path&, std::uintmax_t, std::uintmax_t, bool) override { ++finished; }
    void onFileError(const fs::path&, const std::string&) override { ++errors; }
    void onLog(int, const std::string&, const std::string&) override { ++logs; }
};

// holds the batch thread in its first callback until released
struct GateObserver final : BillpressObserver {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();

    void onFileStart(const fs::path&, std::size_t, std::size_t) override { opened.wait(); }
};

void fill_folder(const fs::path& folder) {
    fs::create_directory(folder);
    test::write_png(folder / "invoice_1.png", test::make_test_image(120, 90));
    test::write_jpeg(folder / "invoice_2.jpg", test::make_test_image(90, 120), 85);
    test::write_bytes(folder / "invoice_3.png", "corrupted");
}

} // namespace

TEST_CASE("Output folder name carries the start time", "[billpress]") {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 7;
    tm.tm_hour = 9;
    tm.tm_min = 5;
    tm.tm_sec = 3;
    tm.tm_isdst = -1;
    const auto when = std::chrono::system_clock::from_time_t(std::mktime(&tm));

    const fs::path dir = Billpress::output_dir_for("/data", "compressed_invoices", when);
    CHECK(dir == fs::path("/data/compressed_invoices_20240307_090503"));

    const auto now = Billpress::output_dir_for("out", "p", std::chrono::system_clock::now());
    CHECK(std::regex_match(now.filename().string(), std::regex(R"(p_\d{8}_\d{6})")));
}

TEST_CASE("Output folder names already taken get a numeric suffix", "[billpress]") {
    const test::TempDir dir("api");
    const fs::path base = dir / "compressed_invoices_20240307_090503";
    CHECK(Billpress::first_free_output_dir(base) == base);

    fs::create_directory(base);
    const fs::path second = dir / "compressed_invoices_20240307_090503_2";
    CHECK(Billpress::first_free_output_dir(base) == second);

    // a leftover archive blocks the name as well
    test::write_bytes(dir / "compressed_invoices_20240307_090503_2.zip", "PK");
    CHECK(Billpress::first_free_output_dir(base) == dir / "compressed_invoices_20240307_090503_3");
}

TEST_CASE("Back-to-back runs on one folder both succeed", "[billpress]") {
    const test::TempDir dir("api");
    const fs::path folder = dir / "invoices";
    fill_folder(folder);

    Billpress billpress;
    const BatchReport first = billpress.run(folder);
    const BatchReport second = billpress.run(folder);

    CHECK(first.output_dir != second.output_dir);
    CHECK(first.archive_path != second.archive_path);
    CHECK(second.total == first.total);
    CHECK(second.success_count == first.success_count);
    CHECK(fs::exists(first.archive_path));
    CHECK(fs::exists(second.archive_path));
}

TEST_CASE("run() compresses a folder next to the inputs", "[billpress]") {
    const test::TempDir dir("api");
    const fs::path folder = dir / "invoices";
    fill_folder(folder);

    Billpress billpress;
    RecordingObserver observer;
    billpress.setObserver(&observer);

    const BatchReport report = billpress.run(folder);
    CHECK_FALSE(billpress.is_running());

    REQUIRE(report.total == 3);
    CHECK(report.success_count == 2);
    CHECK(report.failed_count == 1);
    CHECK(report.output_dir.parent_path() == folder);
    CHECK(report.output_dir.filename().string().rfind("compressed_invoices_", 0) == 0);
    CHECK(fs::exists(report.archive_path));

    CHECK(observer.started == std::vector<std::string>{"invoice_1.png", "invoice_2.jpg", "invoice_3.png"});
    CHECK(observer.finished == 2);
    CHECK(observer.errors == 1);
    CHECK(observer.logs > 0);
}

TEST_CASE("run() on a missing folder throws", "[billpress]") {
    Billpress billpress;
    REQUIRE_THROWS_AS(billpress.run("/nonexistent/billpress/folder"), std::runtime_error);
    REQUIRE_FALSE(billpress.is_running());
}

TEST_CASE("Explicit file lists go under the given parent", "[billpress]") {
    const test::TempDir dir("api");
    fill_folder(dir / "in");
    fs::create_directory(dir / "parent");

    CompressionSettings settings;
    settings.output_prefix = "batch";
    Billpress billpress(settings);
    const auto report = billpress.run({dir / "in" / "invoice_2.jpg"}, dir / "parent");

    CHECK(report.total == 1);
    CHECK(report.output_dir.parent_path() == dir / "parent");
    CHECK(report.output_dir.filename().string().rfind("batch_", 0) == 0);
}

TEST_CASE("Background batch reports through its channel", "[billpress][background]") {
    const test::TempDir dir("api");
    const fs::path folder = dir / "invoices";
    fill_folder(folder);

    CompressionSettings settings;
    settings.output_parent = dir / "results";
    fs::create_directory(settings.output_parent);
    Billpress billpress(settings);
    GateObserver gate;
    billpress.setObserver(&gate);

    BatchTask task = billpress.start(folder);
    REQUIRE(billpress.is_running());
    CHECK_THROWS_AS(billpress.start(folder), std::logic_error);
    CHECK_THROWS_AS(billpress.settings(CompressionSettings{}), std::logic_error);
    gate.gate.set_value();

    std::vector<BatchEvent> events;
    while (auto e = task.next()) events.push_back(std::move(*e));
    task.wait();

    REQUIRE(events.size() == 4);
    for (std::size_t i = 0; i < 3; ++i) {
        REQUIRE(std::holds_alternative<BatchProgress>(events[i]));
        CHECK(std::get<BatchProgress>(events[i]).current == i + 1);
        CHECK(std::get<BatchProgress>(events[i]).total == 3);
    }
    REQUIRE(std::holds_alternative<BatchFinished>(events.back()));
    const auto& report = std::get<BatchFinished>(events.back()).report;
    CHECK(report.success_count == 2);
    CHECK(report.output_dir.parent_path() == settings.output_parent);

    CHECK_FALSE(billpress.is_running());
    CHECK_NOTHROW(billpress.settings(settings));
}

TEST_CASE("Background batch on a missing folder ends with BatchFailed", "[billpress][background]") {
    Billpress billpress;
    BatchTask task = billpress.start("/nonexistent/billpress/folder");

    std::vector<BatchEvent> events;
    while (auto e = task.next()) events.push_back(std::move(*e));
    task.wait();

    REQUIRE(events.size() == 1);
    REQUIRE(std::holds_alternative<BatchFailed>(events.front()));
    CHECK_FALSE(std::get<BatchFailed>(events.front()).message.empty());
    CHECK_FALSE(billpress.is_running());
}
