#pragma once

#include "shareup/remote/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace shareup::remote {

/**
 * @brief Blocking file primitives of a connection-oriented remote share
 *
 * Implementations talk to a file server (or, for LocalShareChannel, to a
 * local directory). All calls block the calling thread.
 *
 * THREAD SAFETY:
 * - One channel may be used by several tasks concurrently
 * - A tree or file handle belongs to the task that opened it
 */
class RemoteFileChannel {
public:
    virtual ~RemoteFileChannel() = default;

    /// Connects to a share and returns a tree handle for it
    virtual ChannelResult<TreeHandle> connect(const std::string& volume) = 0;
    virtual void disconnect(TreeHandle tree) = 0;

    /// `mode` is a combination of AccessMode flags
    virtual ChannelResult<FileHandle> open_file(TreeHandle tree,
                                                const std::string& path,
                                                std::uint32_t mode) = 0;

    /// Moves the write cursor, returns the position actually reached
    virtual ChannelResult<std::uint64_t> seek(FileHandle file, std::uint64_t offset) = 0;

    /// Writes at the cursor, returns the number of bytes accepted
    virtual ChannelResult<std::size_t> write(FileHandle file,
                                             const std::uint8_t* data,
                                             std::size_t length) = 0;

    virtual void close(FileHandle file) = 0;

    virtual ChannelResult<FileMetadata> stat(TreeHandle tree, const std::string& path) = 0;

    /// Renames within a volume, replacing an existing destination file
    virtual ChannelResult<void> move(const std::string& volume,
                                     const std::string& old_path,
                                     const std::string& new_path) = 0;

    virtual ChannelResult<void> remove(const std::string& volume, const std::string& path) = 0;
};

} // namespace shareup::remote
