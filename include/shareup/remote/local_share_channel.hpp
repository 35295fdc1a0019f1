#pragma once

#include "shareup/remote/channel.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace shareup::remote {

/**
 * @brief RemoteFileChannel serving shares from local directories
 *
 * Each volume name maps to a root directory. Used by the upload tool to
 * publish into mounted shares and by the tests as the remote side.
 *
 * Paths are resolved inside the volume root; anything that would escape
 * it ("..") is refused with AccessDenied.
 */
class LocalShareChannel : public RemoteFileChannel {
public:
    LocalShareChannel() = default;
    explicit LocalShareChannel(std::map<std::string, std::filesystem::path> shares);

    LocalShareChannel(const LocalShareChannel&) = delete;
    LocalShareChannel& operator=(const LocalShareChannel&) = delete;

    void add_share(const std::string& volume, std::filesystem::path root);

    ChannelResult<TreeHandle> connect(const std::string& volume) override;
    void disconnect(TreeHandle tree) override;

    ChannelResult<FileHandle> open_file(TreeHandle tree,
                                        const std::string& path,
                                        std::uint32_t mode) override;
    ChannelResult<std::uint64_t> seek(FileHandle file, std::uint64_t offset) override;
    ChannelResult<std::size_t> write(FileHandle file,
                                     const std::uint8_t* data,
                                     std::size_t length) override;
    void close(FileHandle file) override;

    ChannelResult<FileMetadata> stat(TreeHandle tree, const std::string& path) override;
    ChannelResult<void> move(const std::string& volume,
                             const std::string& old_path,
                             const std::string& new_path) override;
    ChannelResult<void> remove(const std::string& volume, const std::string& path) override;

    [[nodiscard]] std::size_t open_file_count() const;
    [[nodiscard]] std::size_t connected_tree_count() const;

private:
    struct OpenFile {
        std::filesystem::path path;
        std::fstream stream;
    };

    ChannelResult<std::filesystem::path> volume_root(const std::string& volume) const;
    ChannelResult<std::filesystem::path> resolve(const std::string& volume,
                                                 const std::string& path) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::filesystem::path> shares_;
    std::unordered_map<TreeHandle, std::string> trees_;
    std::unordered_map<FileHandle, std::unique_ptr<OpenFile>> files_;
    TreeHandle next_tree_ = 1;
    FileHandle next_file_ = 1;
};

} // namespace shareup::remote
