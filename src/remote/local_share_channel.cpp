#include "shareup/remote/local_share_channel.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>

namespace shareup::remote {
namespace fs = std::filesystem;

namespace {

std::time_t to_time_t(fs::file_time_type file_time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        file_time - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(system_time);
}

} // namespace

LocalShareChannel::LocalShareChannel(std::map<std::string, fs::path> shares)
    : shares_(std::move(shares)) {}

void LocalShareChannel::add_share(const std::string& volume, fs::path root) {
    std::lock_guard lock(mutex_);
    shares_[volume] = std::move(root);
}

ChannelResult<TreeHandle> LocalShareChannel::connect(const std::string& volume) {
    std::lock_guard lock(mutex_);
    auto root = volume_root(volume);
    if (root.is_error()) {
        return channel_error<TreeHandle>(ChannelErrorCode::ConnectionFailed, root.error().message);
    }

    std::error_code ec;
    if (!fs::is_directory(root.value(), ec)) {
        return channel_error<TreeHandle>(ChannelErrorCode::ConnectionFailed,
                                         "Share root is not a directory: " + root.value().string());
    }

    const TreeHandle tree = next_tree_++;
    trees_.emplace(tree, volume);
    spdlog::debug("Connected tree {} to volume '{}'", tree, volume);
    return channel_ok(tree);
}

void LocalShareChannel::disconnect(TreeHandle tree) {
    std::lock_guard lock(mutex_);
    if (trees_.erase(tree) > 0) {
        spdlog::debug("Disconnected tree {}", tree);
    }
}

ChannelResult<FileHandle> LocalShareChannel::open_file(TreeHandle tree,
                                                       const std::string& path,
                                                       std::uint32_t mode) {
    std::lock_guard lock(mutex_);
    const auto tree_it = trees_.find(tree);
    if (tree_it == trees_.end()) {
        return channel_error<FileHandle>(ChannelErrorCode::InvalidHandle,
                                         "Unknown tree handle " + std::to_string(tree));
    }

    auto resolved = resolve(tree_it->second, path);
    if (resolved.is_error()) {
        return Err<FileHandle>(resolved.error());
    }
    const fs::path& target = resolved.value();

    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        return channel_error<FileHandle>(ChannelErrorCode::IsDirectory, target.string());
    }
    if (!fs::is_directory(target.parent_path(), ec)) {
        return channel_error<FileHandle>(ChannelErrorCode::NotFound,
                                         "Parent directory missing: " + target.parent_path().string());
    }

    const bool exists = fs::exists(target, ec);
    if (!exists && (mode & kAccessCreate) == 0) {
        return channel_error<FileHandle>(ChannelErrorCode::NotFound, target.string());
    }

    if (!exists || (mode & kAccessTruncate) != 0) {
        std::ofstream create(target, std::ios::binary | std::ios::trunc);
        if (!create) {
            return channel_error<FileHandle>(ChannelErrorCode::AccessDenied,
                                             "Failed to create file: " + target.string());
        }
    }

    auto open = std::make_unique<OpenFile>();
    open->path = target;
    open->stream.open(target, std::ios::in | std::ios::out | std::ios::binary);
    if (!open->stream) {
        return channel_error<FileHandle>(ChannelErrorCode::AccessDenied,
                                         "Failed to open file: " + target.string());
    }

    const FileHandle file = next_file_++;
    files_.emplace(file, std::move(open));
    return channel_ok(file);
}

ChannelResult<std::uint64_t> LocalShareChannel::seek(FileHandle file, std::uint64_t offset) {
    std::lock_guard lock(mutex_);
    const auto it = files_.find(file);
    if (it == files_.end()) {
        return channel_error<std::uint64_t>(ChannelErrorCode::InvalidHandle,
                                            "Unknown file handle " + std::to_string(file));
    }

    auto& stream = it->second->stream;
    stream.clear();
    stream.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    const auto position = stream.tellp();
    if (!stream || position < 0) {
        return channel_error<std::uint64_t>(ChannelErrorCode::IoError,
                                            "Seek failed on " + it->second->path.string());
    }
    return channel_ok(static_cast<std::uint64_t>(position));
}

ChannelResult<std::size_t> LocalShareChannel::write(FileHandle file,
                                                    const std::uint8_t* data,
                                                    std::size_t length) {
    std::lock_guard lock(mutex_);
    const auto it = files_.find(file);
    if (it == files_.end()) {
        return channel_error<std::size_t>(ChannelErrorCode::InvalidHandle,
                                          "Unknown file handle " + std::to_string(file));
    }

    auto& stream = it->second->stream;
    stream.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    stream.flush();
    if (!stream) {
        return channel_error<std::size_t>(ChannelErrorCode::IoError,
                                          "Write failed on " + it->second->path.string());
    }
    return channel_ok(length);
}

void LocalShareChannel::close(FileHandle file) {
    std::lock_guard lock(mutex_);
    files_.erase(file);
}

ChannelResult<FileMetadata> LocalShareChannel::stat(TreeHandle tree, const std::string& path) {
    std::lock_guard lock(mutex_);
    const auto tree_it = trees_.find(tree);
    if (tree_it == trees_.end()) {
        return channel_error<FileMetadata>(ChannelErrorCode::InvalidHandle,
                                           "Unknown tree handle " + std::to_string(tree));
    }

    auto resolved = resolve(tree_it->second, path);
    if (resolved.is_error()) {
        return Err<FileMetadata>(resolved.error());
    }
    const fs::path& target = resolved.value();

    std::error_code ec;
    const auto status = fs::status(target, ec);
    if (ec || !fs::exists(status)) {
        return channel_error<FileMetadata>(ChannelErrorCode::NotFound, target.string());
    }

    FileMetadata metadata;
    metadata.name = target.filename().string();
    metadata.is_directory = fs::is_directory(status);
    if (!metadata.is_directory) {
        metadata.size = fs::file_size(target, ec);
        if (ec) {
            return channel_error<FileMetadata>(ChannelErrorCode::IoError, ec.message());
        }
    }
    const auto mtime = fs::last_write_time(target, ec);
    if (!ec) {
        metadata.modified_time = to_time_t(mtime);
    }
    return channel_ok(metadata);
}

ChannelResult<void> LocalShareChannel::move(const std::string& volume,
                                            const std::string& old_path,
                                            const std::string& new_path) {
    std::lock_guard lock(mutex_);
    auto from = resolve(volume, old_path);
    if (from.is_error()) {
        return Err<void>(from.error());
    }
    auto to = resolve(volume, new_path);
    if (to.is_error()) {
        return Err<void>(to.error());
    }

    std::error_code ec;
    if (!fs::exists(from.value(), ec)) {
        return channel_error<void>(ChannelErrorCode::NotFound, from.value().string());
    }
    if (fs::is_directory(to.value(), ec)) {
        return channel_error<void>(ChannelErrorCode::IsDirectory, to.value().string());
    }

    fs::rename(from.value(), to.value(), ec);
    if (ec) {
        return channel_error<void>(ChannelErrorCode::IoError,
                                   "Failed to move " + old_path + " -> " + new_path + ": " + ec.message());
    }
    return channel_ok();
}

ChannelResult<void> LocalShareChannel::remove(const std::string& volume, const std::string& path) {
    std::lock_guard lock(mutex_);
    auto resolved = resolve(volume, path);
    if (resolved.is_error()) {
        return Err<void>(resolved.error());
    }

    std::error_code ec;
    if (fs::is_directory(resolved.value(), ec)) {
        return channel_error<void>(ChannelErrorCode::IsDirectory, resolved.value().string());
    }
    if (!fs::remove(resolved.value(), ec)) {
        if (ec) {
            return channel_error<void>(ChannelErrorCode::IoError, ec.message());
        }
        return channel_error<void>(ChannelErrorCode::NotFound, resolved.value().string());
    }
    return channel_ok();
}

std::size_t LocalShareChannel::open_file_count() const {
    std::lock_guard lock(mutex_);
    return files_.size();
}

std::size_t LocalShareChannel::connected_tree_count() const {
    std::lock_guard lock(mutex_);
    return trees_.size();
}

ChannelResult<fs::path> LocalShareChannel::volume_root(const std::string& volume) const {
    const auto it = shares_.find(volume);
    if (it == shares_.end()) {
        return channel_error<fs::path>(ChannelErrorCode::NotFound, "Unknown volume: " + volume);
    }
    return channel_ok(it->second);
}

ChannelResult<fs::path> LocalShareChannel::resolve(const std::string& volume,
                                                   const std::string& path) const {
    auto root = volume_root(volume);
    if (root.is_error()) {
        return root;
    }

    fs::path resolved = root.value();
    std::string segment;
    auto append_segment = [&]() -> bool {
        if (segment.empty() || segment == ".") {
            segment.clear();
            return true;
        }
        if (segment == "..") {
            return false;
        }
        resolved /= segment;
        segment.clear();
        return true;
    };

    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!append_segment()) {
                return channel_error<fs::path>(ChannelErrorCode::AccessDenied,
                                               "Path escapes volume: " + path);
            }
        } else {
            segment.push_back(c);
        }
    }
    if (!append_segment()) {
        return channel_error<fs::path>(ChannelErrorCode::AccessDenied, "Path escapes volume: " + path);
    }
    return channel_ok(resolved);
}

} // namespace shareup::remote
