#pragma once

/*
 * mediadl Downloader - Public Types and Collaborator Interfaces (C++20)
 *
 * This header defines the value types, configuration and abstract interfaces of the
 * download subsystem. Scheduling lives in transfer_queue.hpp, batch aggregation in
 * batch_coordinator.hpp and the submission facade in download_service.hpp.
 *
 * Design principles:
 * - Every transfer stages its bytes in a private temporary file; moving the file into
 *   permanent storage is the job of an ISaveSink owned by the caller
 * - Exactly one terminal outcome per transfer, delivered through observer interfaces
 * - Clear separation of concerns (HTTP adapter, disk writer, integrity, rate limit)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mediadl::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Destination kind of a transfer. Decides where a save sink files the result.
 */
enum class MediaKind { Video, Photo, Audio };

/**
 * Lifecycle of a single transfer. Succeeded, Failed and Cancelled are terminal.
 */
enum class TransferState { Pending, Active, Succeeded, Failed, Cancelled };

/**
 * Terminal classification of a batch. Running until every member is terminal.
 */
enum class BatchState { Running, Succeeded, PartiallyFailed, Failed };

/**
 * Hash algorithms supported for optional checksum verification.
 */
enum class HashAlgo { Sha256, Sha512 };

/**
 * Progress stages during a single execution attempt.
 */
enum class ProgressStage { Connecting, Downloading, Verifying };

/**
 * Canonical error codes for downloader operations.
 * Retryability is derived from the code (and HTTP status), see isRetryable().
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NotFound,
    QueueStopped,
    NetworkUnreachable,
    Timeout,
    HttpStatus,
    TlsVerificationFailed,
    IntegrityMismatch,
    StorageWriteFailure,
    Cancelled, // internal signal between adapter and executor, never a Failed outcome
    Unknown
};

[[nodiscard]] const char* to_string(MediaKind kind) noexcept;
[[nodiscard]] const char* to_string(TransferState state) noexcept;
[[nodiscard]] const char* to_string(BatchState state) noexcept;
[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

[[nodiscard]] std::optional<MediaKind> parseMediaKind(std::string_view s);

[[nodiscard]] constexpr bool isTerminal(TransferState state) noexcept {
    return state == TransferState::Succeeded || state == TransferState::Failed ||
           state == TransferState::Cancelled;
}

using TransferId = std::string;
using BatchId = std::string;

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + lower-case hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex;
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> httpStatus{};
};

/**
 * NetworkUnreachable and Timeout are retryable; HttpStatus only for 5xx.
 */
[[nodiscard]] bool isRetryable(const Error& error) noexcept;

/**
 * Retry/backoff policy. maxRetries counts re-executions after the first attempt.
 */
struct RetryPolicy {
    int maxRetries{2};
    std::chrono::milliseconds initialBackoff{250};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{5000};

    /// Delay before retry number `retry` (1-based).
    [[nodiscard]] std::chrono::milliseconds backoffFor(int retry) const;
};

/**
 * Rate limit configuration (0 = unlimited). Shared by all transfers of one queue.
 */
struct RateLimit {
    std::uint64_t globalBps{0};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Downloader configuration. Loaded from the [downloader] config section, see
 * loadDownloaderConfig() in downloader_config.hpp.
 */
struct DownloaderConfig {
    std::size_t maxConcurrent{3};
    RetryPolicy retry{};
    std::chrono::milliseconds timeout{0}; // per attempt, 0 = no overall limit
    std::chrono::milliseconds connectTimeout{15000};
    std::chrono::seconds stallTimeout{30};
    std::chrono::milliseconds progressInterval{100};
    std::filesystem::path stagingDir{std::filesystem::temp_directory_path() / "mediadl" /
                                     "staging"};
    bool followRedirects{true};
    RateLimit rateLimit{};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent{"mediadl/0.1"};
};

/**
 * One logical fetch of a single remote asset. Immutable once created; the queue only
 * ever hands out const references.
 */
struct Transfer {
    TransferId id;
    std::string url;
    MediaKind kind{MediaKind::Photo};
    std::optional<std::uint64_t> expectedBytes{};
    std::optional<Checksum> checksum{};
    std::vector<Header> headers;
    std::chrono::system_clock::time_point createdAt{};
};

/**
 * Create a transfer with a fresh UUID identity and the current timestamp.
 */
[[nodiscard]] Transfer makeTransfer(std::string url, MediaKind kind,
                                    std::optional<std::uint64_t> expectedBytes = std::nullopt);

/**
 * Streaming progress event emitted by an executor during one attempt.
 */
struct ProgressEvent {
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    ProgressStage stage{ProgressStage::Downloading};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

/**
 * Terminal report of a transfer (or of one execution attempt).
 */
struct TransferOutcome {
    TransferState state{TransferState::Failed};
    std::filesystem::path location;  // staging file, Succeeded only
    std::uint64_t bytesReceived{0};
    std::optional<Error> error{};     // Failed only
    bool retryable{false};

    static TransferOutcome succeeded(std::filesystem::path location, std::uint64_t bytes);
    static TransferOutcome failed(Error error, std::uint64_t bytes = 0);
    static TransferOutcome cancelled(std::uint64_t bytes = 0);

    /// Human-readable one-line summary, e.g. "failed: HTTP status error (HTTP 404)".
    [[nodiscard]] std::string summary() const;
};

/**
 * Per-transfer progress as published by the queue. fraction is 0 while the total is
 * unknown and reaches exactly 1 before a Succeeded terminal notification.
 */
struct TransferProgress {
    std::uint64_t bytesReceived{0};
    std::optional<std::uint64_t> totalBytes{};
    double fraction{0.0};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Parameters of one HTTP GET.
 */
struct FetchRequest {
    std::string url;
    std::vector<Header> headers;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connectTimeout{15000};
    std::chrono::seconds stallTimeout{30};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
    std::string userAgent;
};

/**
 * Response metadata. Reported through onResponse before the first body byte and
 * returned again when the fetch completes.
 */
struct FetchInfo {
    long httpStatus{0};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::string> contentType{};
};

/**
 * HTTP adapter abstraction (libcurl-based implementation in http_adapter_curl.cpp).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Stream the body of request.url into sink. Errors returned by the sink abort the
     * transfer and are returned unchanged. Cancellation is reported as ErrorCode::Cancelled.
     */
    virtual Expected<FetchInfo> fetch(const FetchRequest& request, const ByteSink& sink,
                                      const ShouldCancel& shouldCancel,
                                      const std::function<void(const FetchInfo&)>& onResponse) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Disk writer for private staging files.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    /**
     * Create a new empty staging file for a transfer. Must be created with restrictive
     * permissions inside stagingDir.
     */
    virtual Expected<std::filesystem::path> createStagingFile(const std::filesystem::path& stagingDir,
                                                              std::string_view transferId,
                                                              std::string_view tempExtension) = 0;

    /**
     * Write a contiguous block at a specific offset.
     */
    virtual Expected<void> writeAt(const std::filesystem::path& stagingFile, std::uint64_t offset,
                                   std::span<const std::byte> data) = 0;

    /**
     * Ensure data durability (fsync file).
     */
    virtual Expected<void> sync(const std::filesystem::path& stagingFile) = 0;

    /**
     * Best-effort removal of a staging file.
     */
    virtual void cleanup(const std::filesystem::path& stagingFile) noexcept = 0;
};

/**
 * Token-bucket style limiter interface.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Blocks until 'bytes' tokens are available. Returns early when shouldCancel fires.
     */
    virtual void acquire(std::uint64_t bytes, const ShouldCancel& shouldCancel) = 0;

    /**
     * Set runtime limits (0 = unlimited).
     */
    virtual void setLimits(const RateLimit& limit) = 0;
};

/**
 * Performs one execution attempt of a transfer. A fresh executor is created for every
 * dispatch, so implementations may keep per-attempt state.
 */
class ITransferExecutor {
public:
    virtual ~ITransferExecutor() = default;

    /**
     * Run the transfer to a terminal outcome. Progress byte counts are non-decreasing.
     * On Failed or Cancelled no staging file is left behind.
     */
    virtual TransferOutcome execute(const Transfer& transfer, const ProgressCallback& onProgress,
                                    const ShouldCancel& shouldCancel) = 0;
};

using ExecutorFactory = std::function<std::unique_ptr<ITransferExecutor>()>;

/**
 * Subscriber to the state of individual transfers, fed by the TransferQueue.
 * Notifications for one transfer never overlap and the terminal one is last.
 */
class ITransferObserver {
public:
    virtual ~ITransferObserver() = default;

    virtual void onTransferStateChanged(const TransferId& /*id*/, TransferState /*state*/) {}
    virtual void onTransferProgress(const TransferId& id, const TransferProgress& progress) = 0;
    virtual void onTransferTerminal(const TransferId& id, const TransferOutcome& outcome) = 0;
};

/**
 * Result of one member of a finished batch.
 */
struct BatchMemberResult {
    TransferId id;
    std::string url;
    TransferState state{TransferState::Pending};
    std::optional<Error> error{};
    bool retryable{false};
    std::filesystem::path location;
    std::uint64_t bytesReceived{0};
};

/**
 * Terminal report of a batch. Members keep insertion order.
 */
struct BatchOutcome {
    BatchState state{BatchState::Running};
    std::vector<BatchMemberResult> members;

    [[nodiscard]] std::size_t succeededCount() const noexcept;
    /// Every Failed or Cancelled member, in insertion order.
    [[nodiscard]] std::vector<BatchMemberResult> failedMembers() const;
};

/**
 * Progress and completion notifications for the UI layer.
 */
class IProgressSink {
public:
    virtual ~IProgressSink() = default;

    virtual void onProgress(const TransferId& id, double fraction) = 0;
    virtual void onTerminal(const TransferId& id, const TransferOutcome& outcome) = 0;
    virtual void onBatchProgress(const BatchId& id, double fraction) = 0;
    virtual void onBatchTerminal(const BatchId& id, const BatchOutcome& outcome) = 0;
};

/**
 * Moves a finished staging file into permanent storage. Implemented by the caller; the
 * core never calls it on its own.
 */
class ISaveSink {
public:
    virtual ~ISaveSink() = default;
    virtual Expected<std::filesystem::path> save(const std::filesystem::path& stagingFile,
                                                 MediaKind kind) = 0;
};

// ==========
// Factories
// ==========

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier();
std::unique_ptr<IRateLimiter> makeRateLimiter();

/**
 * Executor over explicit collaborators. The collaborators are shared between all
 * executors of one queue and must be thread-safe.
 */
std::unique_ptr<ITransferExecutor>
makeTransferExecutor(const DownloaderConfig& config, std::shared_ptr<IHttpAdapter> http,
                     std::shared_ptr<IDiskWriter> disk, std::shared_ptr<IRateLimiter> limiter);

/**
 * Default factory: libcurl adapter, disk writer and a rate limiter configured from config.
 */
ExecutorFactory makeDefaultExecutorFactory(const DownloaderConfig& config);

} // namespace mediadl::downloader
