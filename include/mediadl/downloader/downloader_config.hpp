#pragma once

#include <mediadl/downloader/downloader.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace mediadl::downloader {

/**
 * Load DownloaderConfig from the [downloader] section of a TOML-style config file.
 *
 * Recognized keys:
 *   max_concurrent, max_retries, retry_backoff_ms, retry_backoff_multiplier,
 *   retry_max_backoff_ms, timeout_ms, connect_timeout_ms, stall_timeout_s,
 *   progress_interval_ms, staging_dir, rate_limit_bps, follow_redirects, tls_insecure,
 *   tls_ca, proxy, user_agent
 *
 * A missing file yields the defaults. A malformed or out-of-range value yields
 * ErrorCode::InvalidArgument naming the key. Unknown keys are logged and ignored.
 */
Expected<DownloaderConfig> loadDownloaderConfig(const std::filesystem::path& path);

/**
 * Apply already-parsed key/value pairs on top of base (same keys and rules as above).
 */
Expected<DownloaderConfig> applyDownloaderSettings(DownloaderConfig base,
                                                   const std::map<std::string, std::string>& values);

} // namespace mediadl::downloader
