/*
 * mediadl/src/downloader/downloader_config.cpp
 *
 * [downloader] config section -> DownloaderConfig
 */

#include <mediadl/config/config_helpers.h>
#include <mediadl/downloader/downloader_config.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <system_error>

namespace mediadl::downloader {

namespace {

constexpr const char* kSection = "downloader";

Error invalid(const std::string& key, const std::string& value, const std::string& why) {
    return Error{ErrorCode::InvalidArgument,
                 "[downloader] " + key + " = '" + value + "': " + why};
}

Expected<std::uint64_t> parseUnsigned(const std::string& key, const std::string& value) {
    std::uint64_t out = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto res = std::from_chars(first, last, out);
    if (value.empty() || res.ec != std::errc() || res.ptr != last) {
        return invalid(key, value, "expected a non-negative integer");
    }
    return out;
}

Expected<double> parseDouble(const std::string& key, const std::string& value) {
    if (value.empty()) {
        return invalid(key, value, "expected a number");
    }
    char* end = nullptr;
    const double d = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !std::isfinite(d)) {
        return invalid(key, value, "expected a number");
    }
    return d;
}

Expected<bool> parseBool(const std::string& key, const std::string& value) {
    std::string v;
    for (unsigned char c : value)
        v.push_back(static_cast<char>(std::tolower(c)));
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return invalid(key, value, "expected true or false");
}

} // namespace

Expected<DownloaderConfig> applyDownloaderSettings(DownloaderConfig cfg,
                                                   const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        if (key == "max_concurrent") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            if (n.value() == 0)
                return invalid(key, value, "must be at least 1");
            cfg.maxConcurrent = static_cast<std::size_t>(n.value());
        } else if (key == "max_retries") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            if (n.value() > 100)
                return invalid(key, value, "must be at most 100");
            cfg.retry.maxRetries = static_cast<int>(n.value());
        } else if (key == "retry_backoff_ms") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            cfg.retry.initialBackoff = std::chrono::milliseconds(n.value());
        } else if (key == "retry_backoff_multiplier") {
            auto d = parseDouble(key, value);
            if (!d.ok())
                return d.error();
            if (d.value() < 1.0)
                return invalid(key, value, "must be >= 1.0");
            cfg.retry.multiplier = d.value();
        } else if (key == "retry_max_backoff_ms") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            cfg.retry.maxBackoff = std::chrono::milliseconds(n.value());
        } else if (key == "timeout_ms") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            cfg.timeout = std::chrono::milliseconds(n.value());
        } else if (key == "connect_timeout_ms") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            cfg.connectTimeout = std::chrono::milliseconds(n.value());
        } else if (key == "stall_timeout_s") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            cfg.stallTimeout = std::chrono::seconds(n.value());
        } else if (key == "progress_interval_ms") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            cfg.progressInterval = std::chrono::milliseconds(n.value());
        } else if (key == "staging_dir") {
            if (value.empty())
                return invalid(key, value, "must not be empty");
            cfg.stagingDir = config::expand_tilde(value);
        } else if (key == "rate_limit_bps") {
            auto n = parseUnsigned(key, value);
            if (!n.ok())
                return n.error();
            cfg.rateLimit.globalBps = n.value();
        } else if (key == "follow_redirects") {
            auto b = parseBool(key, value);
            if (!b.ok())
                return b.error();
            cfg.followRedirects = b.value();
        } else if (key == "tls_insecure") {
            auto b = parseBool(key, value);
            if (!b.ok())
                return b.error();
            cfg.tls.insecure = b.value();
        } else if (key == "tls_ca") {
            cfg.tls.caPath = config::expand_tilde(value).string();
        } else if (key == "proxy") {
            if (value.empty())
                cfg.proxy.reset();
            else
                cfg.proxy = value;
        } else if (key == "user_agent") {
            cfg.userAgent = value;
        } else {
            spdlog::warn("Ignoring unknown config key [downloader] {}", key);
        }
    }

    if (cfg.retry.maxBackoff.count() > 0 && cfg.retry.maxBackoff < cfg.retry.initialBackoff) {
        return invalid("retry_max_backoff_ms", std::to_string(cfg.retry.maxBackoff.count()),
                       "must not be below retry_backoff_ms");
    }
    return cfg;
}

Expected<DownloaderConfig> loadDownloaderConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using downloader defaults", path.string());
        return DownloaderConfig{};
    }
    auto values = config::parse_config_section(path, kSection);
    spdlog::debug("Loaded {} [downloader] key(s) from {}", values.size(), path.string());
    return applyDownloaderSettings(DownloaderConfig{}, values);
}

} // namespace mediadl::downloader
