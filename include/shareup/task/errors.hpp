#pragma once

namespace shareup::task {

/**
 * @brief Terminal failure reported to an upload listener
 *
 * Each value names the stage that failed, so callers can tell transient
 * failures (ConnectionFailed, UploadFailed) from permanent ones
 * (FileNotFound, DirectoryDownloaded).
 */
enum class UploadError {
    Cancelled,
    ConnectionFailed,    ///< Share connect or remote open failed
    FileNotFound,        ///< Local source unreadable or remote name invalid
    ServerNotFound,      ///< Reserved for session bootstrap
    DirectoryDownloaded, ///< Remote target is a directory
    UploadFailed         ///< Write, resume or publish failed
};

const char* to_string(UploadError error) noexcept;

/// True for failures worth retrying with the same parameters
bool is_retryable(UploadError error) noexcept;

} // namespace shareup::task
