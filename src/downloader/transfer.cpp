/*
 * mediadl/src/downloader/transfer.cpp
 *
 * Value-type helpers shared by every downloader component: enum names, retry
 * classification, backoff computation, transfer construction and outcome summaries.
 */

#include <mediadl/core/uuid.h>
#include <mediadl/downloader/downloader.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace mediadl::downloader {

const char* to_string(MediaKind kind) noexcept {
    switch (kind) {
        case MediaKind::Video:
            return "video";
        case MediaKind::Photo:
            return "photo";
        case MediaKind::Audio:
            return "audio";
    }
    return "unknown";
}

const char* to_string(TransferState state) noexcept {
    switch (state) {
        case TransferState::Pending:
            return "pending";
        case TransferState::Active:
            return "active";
        case TransferState::Succeeded:
            return "succeeded";
        case TransferState::Failed:
            return "failed";
        case TransferState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

const char* to_string(BatchState state) noexcept {
    switch (state) {
        case BatchState::Running:
            return "running";
        case BatchState::Succeeded:
            return "succeeded";
        case BatchState::PartiallyFailed:
            return "partially failed";
        case BatchState::Failed:
            return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "no error";
        case ErrorCode::InvalidArgument:
            return "invalid argument";
        case ErrorCode::NotFound:
            return "not found";
        case ErrorCode::QueueStopped:
            return "queue stopped";
        case ErrorCode::NetworkUnreachable:
            return "network unreachable";
        case ErrorCode::Timeout:
            return "timed out";
        case ErrorCode::HttpStatus:
            return "HTTP status error";
        case ErrorCode::TlsVerificationFailed:
            return "TLS verification failed";
        case ErrorCode::IntegrityMismatch:
            return "integrity mismatch";
        case ErrorCode::StorageWriteFailure:
            return "storage write failure";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::Unknown:
            return "unknown error";
    }
    return "unknown error";
}

std::optional<MediaKind> parseMediaKind(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (unsigned char c : s)
        lower.push_back(static_cast<char>(std::tolower(c)));
    if (lower == "video")
        return MediaKind::Video;
    if (lower == "photo" || lower == "image")
        return MediaKind::Photo;
    if (lower == "audio")
        return MediaKind::Audio;
    return std::nullopt;
}

bool isRetryable(const Error& error) noexcept {
    switch (error.code) {
        case ErrorCode::NetworkUnreachable:
        case ErrorCode::Timeout:
            return true;
        case ErrorCode::HttpStatus:
            return error.httpStatus && *error.httpStatus >= 500 && *error.httpStatus <= 599;
        default:
            return false;
    }
}

std::chrono::milliseconds RetryPolicy::backoffFor(int retry) const {
    if (retry <= 0 || initialBackoff.count() <= 0)
        return std::chrono::milliseconds{0};
    const double factor = std::pow(std::max(multiplier, 1.0), retry - 1);
    const double ms = static_cast<double>(initialBackoff.count()) * factor;
    const double cap = static_cast<double>(maxBackoff.count());
    if (maxBackoff.count() > 0 && ms > cap)
        return maxBackoff;
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(ms)};
}

Transfer makeTransfer(std::string url, MediaKind kind, std::optional<std::uint64_t> expectedBytes) {
    Transfer t;
    t.id = core::generateUUID();
    t.url = std::move(url);
    t.kind = kind;
    t.expectedBytes = expectedBytes;
    t.createdAt = std::chrono::system_clock::now();
    return t;
}

TransferOutcome TransferOutcome::succeeded(std::filesystem::path location, std::uint64_t bytes) {
    TransferOutcome out;
    out.state = TransferState::Succeeded;
    out.location = std::move(location);
    out.bytesReceived = bytes;
    return out;
}

TransferOutcome TransferOutcome::failed(Error error, std::uint64_t bytes) {
    TransferOutcome out;
    out.state = TransferState::Failed;
    out.bytesReceived = bytes;
    out.retryable = isRetryable(error);
    out.error = std::move(error);
    return out;
}

TransferOutcome TransferOutcome::cancelled(std::uint64_t bytes) {
    TransferOutcome out;
    out.state = TransferState::Cancelled;
    out.bytesReceived = bytes;
    return out;
}

std::string TransferOutcome::summary() const {
    switch (state) {
        case TransferState::Succeeded:
            return "succeeded: " + std::to_string(bytesReceived) + " bytes staged at " +
                   location.string();
        case TransferState::Cancelled:
            return "cancelled";
        case TransferState::Failed: {
            if (!error)
                return "failed";
            std::string s = std::string("failed: ") + to_string(error->code);
            if (error->httpStatus)
                s += " (HTTP " + std::to_string(*error->httpStatus) + ")";
            if (!error->message.empty())
                s += " - " + error->message;
            if (retryable)
                s += " [retryable]";
            return s;
        }
        default:
            return to_string(state);
    }
}

std::size_t BatchOutcome::succeededCount() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(members.begin(), members.end(), [](const BatchMemberResult& m) {
            return m.state == TransferState::Succeeded;
        }));
}

std::vector<BatchMemberResult> BatchOutcome::failedMembers() const {
    std::vector<BatchMemberResult> out;
    for (const auto& m : members) {
        if (m.state == TransferState::Failed || m.state == TransferState::Cancelled)
            out.push_back(m);
    }
    return out;
}

} // namespace mediadl::downloader
