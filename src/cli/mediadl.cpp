/*
 * mediadl/src/cli/mediadl.cpp
 *
 * `mediadl [options] URL...`
 * - Submits each URL as a single transfer, or all of them as one batch with --batch
 * - Prints progress to stderr and one result per item (human-readable or --json on stdout)
 * - Finished staging files are moved into --output-dir/<kind>/ through DirectorySaveSink
 * - Exit code 0 only when every item succeeded and was saved
 */

#include <mediadl/config/config_helpers.h>
#include <mediadl/downloader/download_service.hpp>
#include <mediadl/downloader/downloader_config.hpp>
#include <mediadl/downloader/save_sink.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace mediadl::cli {

namespace {

using namespace mediadl::downloader;

struct CliOpts {
    std::vector<std::string> urls;
    std::string kind{"photo"};
    bool batch{false};
    std::optional<std::size_t> concurrency;
    std::optional<int> retries;
    std::optional<std::uint64_t> timeout_ms;
    std::optional<std::uint64_t> rate_limit_bps;
    std::optional<std::uint64_t> expected_size;
    std::optional<std::string> checksum; // "<algo>:<hex>"
    std::vector<std::string> headers;
    std::string config_path;
    fs::path output_dir{"."};
    bool emit_json{false};
    bool verbose{false};
    bool quiet{false};
};

// Validate checksum format "algo:hex"
bool valid_checksum_format(const std::string& s) {
    static const std::regex re(R"(^(sha256|sha512):[0-9a-fA-F]+$)");
    return std::regex_match(s, re);
}

Checksum parse_checksum(const std::string& s) {
    auto colon = s.find(':');
    Checksum c;
    c.algo = s.substr(0, colon) == "sha512" ? HashAlgo::Sha512 : HashAlgo::Sha256;
    c.hex = s.substr(colon + 1);
    return c;
}

std::optional<Header> parse_header(const std::string& raw) {
    auto colon = raw.find(':');
    if (colon == std::string::npos || colon == 0)
        return std::nullopt;
    Header h;
    h.name = raw.substr(0, colon);
    h.value = raw.substr(colon + 1);
    config::trim(h.name);
    config::trim(h.value);
    return h;
}

struct ItemResult {
    std::string id;
    std::string url;
    TransferState state{TransferState::Pending};
    std::optional<Error> error;
    bool retryable{false};
    std::uint64_t bytes{0};
    std::optional<fs::path> savedPath;
    std::optional<Error> saveError;
};

/**
 * Progress sink for the terminal. Saves every succeeded transfer as soon as it is reported.
 */
class ConsoleProgressSink final : public IProgressSink {
public:
    ConsoleProgressSink(std::shared_ptr<ISaveSink> saver, MediaKind kind, bool showProgress)
        : saver_(std::move(saver)), kind_(kind), showProgress_(showProgress) {}

    void setUrl(const std::string& id, const std::string& url) {
        std::lock_guard<std::mutex> lk(mutex_);
        urls_[id] = url;
    }

    void onProgress(const TransferId& id, double fraction) override {
        printProgress(id, fraction);
    }

    void onTerminal(const TransferId& id, const TransferOutcome& outcome) override {
        record(id, lookupUrl(id), outcome.state, outcome.error, outcome.retryable,
               outcome.bytesReceived, outcome.location);
    }

    void onBatchProgress(const BatchId& id, double fraction) override {
        printProgress(id, fraction);
    }

    void onBatchTerminal(const BatchId& id, const BatchOutcome& outcome) override {
        spdlog::info("Batch {}: {} ({}/{} succeeded)", id, to_string(outcome.state),
                     outcome.succeededCount(), outcome.members.size());
        for (const auto& m : outcome.members) {
            record(m.id, m.url, m.state, m.error, m.retryable, m.bytesReceived, m.location);
        }
    }

    std::vector<ItemResult> results() const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto out = results_;
        // A fast transfer may finish before setUrl() ran
        for (auto& r : out) {
            if (r.url.empty()) {
                auto it = urls_.find(r.id);
                if (it != urls_.end())
                    r.url = it->second;
            }
        }
        return out;
    }

private:
    std::string lookupUrl(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = urls_.find(id);
        return it == urls_.end() ? std::string{} : it->second;
    }

    void printProgress(const std::string& id, double fraction) {
        if (!showProgress_)
            return;
        const int pct = static_cast<int>(fraction * 100.0);
        std::lock_guard<std::mutex> lk(mutex_);
        auto& last = lastPct_[id];
        if (pct < last + 10 && pct != 100)
            return;
        last = pct;
        fmt::print(stderr, "{}: {:3d}%\n", id, pct);
    }

    void record(const std::string& id, const std::string& url, TransferState state,
                const std::optional<Error>& error, bool retryable, std::uint64_t bytes,
                const fs::path& location) {
        ItemResult r;
        r.id = id;
        r.url = url;
        r.state = state;
        r.error = error;
        r.retryable = retryable;
        r.bytes = bytes;
        if (state == TransferState::Succeeded && saver_) {
            auto saved = saver_->save(location, kind_);
            if (saved.ok()) {
                r.savedPath = saved.value();
            } else {
                r.saveError = saved.error();
                spdlog::error("Failed to save {}: {}", location.string(), saved.error().message);
            }
        }
        std::lock_guard<std::mutex> lk(mutex_);
        results_.push_back(std::move(r));
    }

    std::shared_ptr<ISaveSink> saver_;
    MediaKind kind_;
    bool showProgress_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> urls_;
    std::map<std::string, int> lastPct_;
    std::vector<ItemResult> results_;
};

json to_json(const ItemResult& r) {
    json j = {{"id", r.id},
              {"url", r.url},
              {"state", to_string(r.state)},
              {"bytes", r.bytes},
              {"success", r.state == TransferState::Succeeded && r.savedPath.has_value()}};
    j["path"] = r.savedPath ? json(r.savedPath->string()) : json(nullptr);
    if (r.error) {
        j["error"] = {{"code", to_string(r.error->code)},
                      {"message", r.error->message},
                      {"retryable", r.retryable}};
        if (r.error->httpStatus)
            j["error"]["http_status"] = *r.error->httpStatus;
    } else if (r.saveError) {
        j["error"] = {{"code", to_string(r.saveError->code)}, {"message", r.saveError->message}};
    } else {
        j["error"] = nullptr;
    }
    return j;
}

void print_human(const ItemResult& r) {
    if (r.state == TransferState::Succeeded && r.savedPath) {
        fmt::print("OK      {} -> {} ({} bytes)\n", r.url, r.savedPath->string(), r.bytes);
    } else if (r.state == TransferState::Succeeded) {
        fmt::print("UNSAVED {}: {}\n", r.url, r.saveError ? r.saveError->message : "");
    } else if (r.state == TransferState::Cancelled) {
        fmt::print("CANCEL  {}\n", r.url);
    } else {
        std::string detail = r.error ? std::string(to_string(r.error->code)) : "failed";
        if (r.error && r.error->httpStatus)
            detail += " (HTTP " + std::to_string(*r.error->httpStatus) + ")";
        if (r.error && !r.error->message.empty())
            detail += ": " + config::sanitize_for_terminal(r.error->message);
        fmt::print("FAILED  {} - {}\n", r.url, detail);
    }
}

int run(const CliOpts& opts) {
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    auto kind = parseMediaKind(opts.kind);
    if (!kind) {
        spdlog::error("Unknown --kind '{}'", opts.kind);
        return 2;
    }
    if (opts.expected_size && opts.urls.size() != 1) {
        spdlog::error("--expected-size applies to a single URL only");
        return 2;
    }
    if (opts.checksum && opts.urls.size() != 1) {
        spdlog::error("--checksum applies to a single URL only");
        return 2;
    }

    auto loaded = loadDownloaderConfig(config::get_config_path(opts.config_path));
    if (!loaded.ok()) {
        spdlog::error("Invalid configuration: {}", loaded.error().message);
        return 2;
    }
    DownloaderConfig cfg = loaded.value();
    if (opts.concurrency)
        cfg.maxConcurrent = *opts.concurrency;
    if (opts.retries)
        cfg.retry.maxRetries = *opts.retries;
    if (opts.timeout_ms)
        cfg.timeout = std::chrono::milliseconds(*opts.timeout_ms);
    if (opts.rate_limit_bps)
        cfg.rateLimit.globalBps = *opts.rate_limit_bps;

    std::vector<Header> headers;
    for (const auto& raw : opts.headers) {
        auto h = parse_header(raw);
        if (!h) {
            spdlog::error("Malformed header '{}', expected 'Name: value'", raw);
            return 2;
        }
        headers.push_back(*h);
    }

    std::vector<MediaRequest> requests;
    for (const auto& url : opts.urls) {
        MediaRequest r;
        r.url = url;
        r.kind = *kind;
        r.expectedBytes = opts.expected_size;
        if (opts.checksum)
            r.checksum = parse_checksum(*opts.checksum);
        r.headers = headers;
        requests.push_back(std::move(r));
    }

    auto saver = std::make_shared<DirectorySaveSink>(opts.output_dir);
    auto sink = std::make_shared<ConsoleProgressSink>(saver, *kind, !opts.quiet && !opts.emit_json);
    DownloadService service(cfg, sink);

    std::size_t rejected = 0;
    if (opts.batch) {
        auto b = service.submitBatch(requests);
        if (!b.ok()) {
            spdlog::error("Batch rejected: {}", b.error().message);
            return 1;
        }
        spdlog::info("Submitted batch {} with {} item(s)", b.value(), requests.size());
    } else {
        for (const auto& r : requests) {
            auto id = service.submitSingle(r);
            if (!id.ok()) {
                spdlog::error("{}: {}", r.url, id.error().message);
                ++rejected;
                continue;
            }
            sink->setUrl(id.value(), r.url);
        }
    }

    while (!service.waitIdle(std::chrono::milliseconds(500))) {
    }
    service.shutdown();

    const auto results = sink->results();
    bool allOk = rejected == 0 && results.size() == requests.size();
    json out = json::array();
    for (const auto& r : results) {
        allOk = allOk && r.state == TransferState::Succeeded && r.savedPath.has_value();
        if (opts.emit_json) {
            out.push_back(to_json(r));
        } else {
            print_human(r);
        }
    }
    if (opts.emit_json) {
        fmt::print("{}\n", out.dump(2));
    }
    return allOk ? 0 : 1;
}

} // namespace

} // namespace mediadl::cli

int main(int argc, char** argv) {
    // Logs go to stderr so stdout stays machine-readable
    spdlog::set_default_logger(spdlog::stderr_color_mt("mediadl"));

    CLI::App app{"mediadl - download video, photo and audio assets"};
    mediadl::cli::CliOpts opts;

    app.add_option("urls", opts.urls, "Source URL(s)")->required();
    app.add_option("--kind", opts.kind, "Media kind: video|photo|audio (default: photo)")
        ->check(CLI::IsMember({"video", "photo", "audio"}));
    app.add_flag("--batch", opts.batch, "Track all URLs as one batch");
    app.add_option("-c,--concurrency", opts.concurrency, "Maximum parallel transfers")
        ->check(CLI::Range(1, 64));
    app.add_option("--retries", opts.retries, "Retry budget for retryable failures")
        ->check(CLI::Range(0, 20));
    app.add_option("--timeout-ms", opts.timeout_ms, "Per-attempt timeout in ms (0 = none)");
    app.add_option("--rate-limit", opts.rate_limit_bps, "Global rate limit (bytes/sec, 0=unlimited)");
    app.add_option("--expected-size", opts.expected_size, "Expected size in bytes (single URL)");
    app.add_option("--checksum", opts.checksum, "Expected checksum '<algo>:<hex>' (sha256|sha512)")
        ->check(CLI::Validator(
            [](std::string& s) {
                return mediadl::cli::valid_checksum_format(s)
                           ? std::string{}
                           : std::string{"invalid checksum format (expected '<algo>:<hex>')"};
            },
            "checksum"));
    app.add_option("-H,--header", opts.headers, "Extra request header (repeatable)");
    app.add_option("--config", opts.config_path, "Config file (default: XDG config.toml)");
    app.add_option("-o,--output-dir", opts.output_dir, "Directory for saved media (default: .)");
    app.add_flag("--json", opts.emit_json, "Emit results as JSON on stdout");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Only warnings and errors");

    CLI11_PARSE(app, argc, argv);
    return mediadl::cli::run(opts);
}
