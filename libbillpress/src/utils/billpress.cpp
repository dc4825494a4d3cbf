//
// Created by Giuseppe Francione on 09/12/25.
//

/**
 * @file billpress.cpp
 * @brief Implementation of the public Billpress API.
 */

#include "../../include/billpress.hpp"

#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_scanner.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"
#include "../../include/processor_registry.hpp"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace billpress {

namespace {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    BillpressObserver* observer_;
public:
    explicit BridgeLogSink(BillpressObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

/**
 * @brief Installs a sink for the lifetime of the scope.
 */
class ScopedSink {
public:
    explicit ScopedSink(std::unique_ptr<ILogSink> sink) : sink_(Logger::add_sink(std::move(sink))) {}
    ~ScopedSink() {
        if (sink_) Logger::remove_sink(sink_);
    }

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

private:
    ILogSink* sink_;
};

/**
 * @brief Clears the running flag on scope exit.
 */
struct RunningGuard {
    std::atomic<bool>& flag;
    ~RunningGuard() { flag.store(false); }
};

} // namespace

struct Billpress::Impl {
    ProcessorRegistry registry;
    CompressionSettings settings;
    BillpressObserver* observer = nullptr;
    std::atomic<bool> running{false};

    void acquire() {
        bool expected = false;
        if (!running.compare_exchange_strong(expected, true)) {
            throw std::logic_error("a batch is already running");
        }
    }

    [[nodiscard]] std::filesystem::path parent_for(const std::filesystem::path& folder) const {
        return settings.output_parent.empty() ? folder : settings.output_parent;
    }

    void setupEventBridging(EventBus& bus) const {
        if (!observer) return;
        BillpressObserver* obs = observer;

        bus.subscribe<FileProcessStartEvent>([obs](const FileProcessStartEvent& e) {
            obs->onFileStart(e.path, e.index, e.total);
        });

        bus.subscribe<FileProcessCompleteEvent>([obs](const FileProcessCompleteEvent& e) {
            obs->onFileFinish(e.path, e.original_size, e.new_size, e.within_target);
        });

        bus.subscribe<FileProcessErrorEvent>([obs](const FileProcessErrorEvent& e) {
            obs->onFileError(e.path, e.error_message);
        });
    }

    BatchReport execute(const std::vector<std::filesystem::path>& files,
                        const std::filesystem::path& output_parent,
                        const ProgressCallback& on_progress) {
        EventBus bus;
        setupEventBridging(bus);

        // inject bridge sink if observer is present
        std::unique_ptr<ScopedSink> bridge;
        if (observer) {
            bridge = std::make_unique<ScopedSink>(std::make_unique<BridgeLogSink>(observer));
        }

        const auto output_dir = first_free_output_dir(
            output_dir_for(output_parent, settings.output_prefix, std::chrono::system_clock::now()));
        BatchExecutor executor(registry, settings, bus);
        return executor.run(files, output_dir, on_progress);
    }
};

Billpress::Billpress() : impl_(std::make_shared<Impl>()) {}

Billpress::Billpress(CompressionSettings settings) : impl_(std::make_shared<Impl>()) {
    impl_->settings = std::move(settings);
}

Billpress::~Billpress() = default;

Billpress::Billpress(Billpress&&) noexcept = default;
Billpress& Billpress::operator=(Billpress&&) noexcept = default;

Billpress& Billpress::settings(const CompressionSettings& settings) {
    if (is_running()) {
        throw std::logic_error("cannot change settings while a batch is running");
    }
    impl_->settings = settings;
    return *this;
}

const CompressionSettings& Billpress::settings() const {
    return impl_->settings;
}

void Billpress::setObserver(BillpressObserver* observer) {
    impl_->observer = observer;
}

bool Billpress::is_running() const noexcept {
    return impl_ && impl_->running.load();
}

BatchReport Billpress::run(const std::filesystem::path& folder, const ProgressCallback& on_progress) {
    impl_->acquire();
    RunningGuard guard{impl_->running};
    const auto scan = scan_folder(folder);
    return impl_->execute(scan.files, impl_->parent_for(folder), on_progress);
}

BatchReport Billpress::run(const std::vector<std::filesystem::path>& files,
                           const std::filesystem::path& output_parent,
                           const ProgressCallback& on_progress) {
    impl_->acquire();
    RunningGuard guard{impl_->running};
    return impl_->execute(files, output_parent, on_progress);
}

BatchTask Billpress::start(const std::filesystem::path& folder) {
    impl_->acquire();
    auto channel = std::make_shared<Channel<BatchEvent>>();

    auto body = [impl = impl_, channel, folder] {
        BatchEvent last;
        try {
            const auto scan = scan_folder(folder);
            auto report = impl->execute(scan.files, impl->parent_for(folder),
                                        [&channel](const std::size_t current, const std::size_t total,
                                                   const std::string& filename) {
                                            channel->push(BatchProgress{current, total, filename});
                                        });
            last = BatchFinished{std::move(report)};
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Batch failed: ") + e.what(), "billpress");
            last = BatchFailed{e.what()};
        }
        // a consumer reacting to the last event may start the next batch
        impl->running.store(false);
        channel->push(std::move(last));
        channel->close();
    };

    try {
        return BatchTask(channel, std::jthread(std::move(body)));
    } catch (const std::system_error&) {
        impl_->running.store(false);
        throw;
    }
}

std::filesystem::path Billpress::output_dir_for(const std::filesystem::path& parent,
                                                const std::string& prefix,
                                                const std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream os;
    os << prefix << '_' << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return parent / os.str();
}

std::filesystem::path Billpress::first_free_output_dir(const std::filesystem::path& base) {
    const auto taken = [](const std::filesystem::path& dir) {
        std::error_code ec;
        return std::filesystem::exists(dir, ec) ||
               std::filesystem::exists(BatchExecutor::archive_path_for(dir), ec);
    };

    // two batches started within the same second share a timestamp
    std::filesystem::path candidate = base;
    for (int n = 2; taken(candidate); ++n) {
        candidate = base;
        candidate += "_" + std::to_string(n);
    }
    return candidate;
}

} // namespace billpress
