#pragma once

/**
 * @file types.hpp
 * @brief Addressing and handle types for files on a remote share
 *
 * A share (volume) is a named namespace exposed by a file server. Files
 * are addressed by a RemotePath (volume + directories) and a file name.
 * Paths inside a volume always use '/' as separator.
 */

#include "shareup/core/result.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace shareup::remote {

using TreeHandle = std::uint32_t;
using FileHandle = std::uint32_t;

enum class ChannelErrorCode {
    NotFound,
    AccessDenied,
    ConnectionFailed,
    InvalidHandle,
    IoError,
    IsDirectory
};

const char* to_string(ChannelErrorCode code) noexcept;

struct ChannelError {
    ChannelErrorCode code = ChannelErrorCode::IoError;
    std::string message;
};

template<typename T>
using ChannelResult = Result<T, ChannelError>;

template<typename T>
ChannelResult<T> channel_ok(T value) {
    return Ok<T, ChannelError>(std::move(value));
}

inline ChannelResult<void> channel_ok() {
    return Ok<ChannelError>();
}

template<typename T>
ChannelResult<T> channel_error(ChannelErrorCode code, std::string message) {
    return Err<T>(ChannelError{code, std::move(message)});
}

/**
 * @brief Access flags passed to RemoteFileChannel::open_file
 *
 * Create without Truncate opens an existing file as is, or creates it.
 * Without Create the file must already exist.
 */
enum AccessMode : std::uint32_t {
    kAccessRead     = 1u << 0,
    kAccessWrite    = 1u << 1,
    kAccessAppend   = 1u << 2,
    kAccessCreate   = 1u << 3,
    kAccessTruncate = 1u << 4,
};

// Fresh upload: starts from an empty file whatever was there before
constexpr std::uint32_t kNewFileMode =
    kAccessRead | kAccessWrite | kAccessAppend | kAccessCreate | kAccessTruncate;

// Resumed upload: the file must exist and is never truncated
constexpr std::uint32_t kExistingFileMode = kAccessRead | kAccessWrite | kAccessAppend;

struct FileMetadata {
    std::string name;
    std::uint64_t size = 0;
    bool is_directory = false;
    std::time_t modified_time = 0;
};

/**
 * @brief A directory on a share, e.g. "photos/2017/trip"
 */
class RemotePath {
public:
    RemotePath() = default;
    RemotePath(std::string volume, std::vector<std::string> directories);

    /// Parses "volume/dir/sub". Accepts '/' and '\\', ignores empty segments.
    static Result<RemotePath> parse(const std::string& text);

    [[nodiscard]] const std::string& volume() const noexcept { return volume_; }
    [[nodiscard]] const std::vector<std::string>& directories() const noexcept { return directories_; }

    /// In-share path of the directory, "" for the volume root
    [[nodiscard]] std::string directory_path() const;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const RemotePath& other) const {
        return volume_ == other.volume_ && directories_ == other.directories_;
    }
    bool operator!=(const RemotePath& other) const { return !(*this == other); }

private:
    std::string volume_;
    std::vector<std::string> directories_;
};

/**
 * @brief Identity of a single file on a share
 */
class RemoteFileRef {
public:
    static Result<RemoteFileRef> make(RemotePath path, std::string name);

    [[nodiscard]] const RemotePath& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// In-share path used by open/move/delete, e.g. "2017/trip/a.jpg"
    [[nodiscard]] std::string upload_path() const;

    /// Same directory, name + suffix
    [[nodiscard]] RemoteFileRef with_suffix(const std::string& suffix) const;

private:
    RemoteFileRef(RemotePath path, std::string name)
        : path_(std::move(path)), name_(std::move(name)) {}

    RemotePath path_;
    std::string name_;
};

} // namespace shareup::remote
