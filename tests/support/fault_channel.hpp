#pragma once

#include "shareup/remote/channel.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace shareup::test_support {

/**
 * @brief Channel decorator that counts calls and injects failures
 *
 * Configure before starting a task; the knobs are read from the worker.
 */
class FaultInjectingChannel : public remote::RemoteFileChannel {
public:
    explicit FaultInjectingChannel(std::shared_ptr<remote::RemoteFileChannel> inner)
        : inner_(std::move(inner)) {}

    std::atomic<bool> fail_connect{false};
    std::atomic<bool> fail_open{false};
    std::atomic<bool> fail_move{false};
    std::atomic<std::size_t> fail_write_at{0};     ///< 1-based write call to fail, 0 = never
    std::atomic<std::size_t> max_write_length{0};  ///< Accept at most this many bytes per write, 0 = all
    std::atomic<std::int64_t> seek_skew{0};        ///< Added to the reported seek position

    /// Called after every write reaching the inner channel, with its 1-based index
    std::function<void(std::size_t)> on_write;

    std::size_t connect_calls() const { return connect_calls_.load(); }
    std::size_t write_calls() const { return write_calls_.load(); }
    std::size_t move_calls() const { return move_calls_.load(); }

    std::vector<std::string> removed_paths() const {
        std::lock_guard lock(mutex_);
        return removed_paths_;
    }

    std::vector<std::uint32_t> open_modes() const {
        std::lock_guard lock(mutex_);
        return open_modes_;
    }

    remote::ChannelResult<remote::TreeHandle> connect(const std::string& volume) override {
        ++connect_calls_;
        if (fail_connect.load()) {
            return remote::channel_error<remote::TreeHandle>(remote::ChannelErrorCode::ConnectionFailed,
                                                             "injected connect failure");
        }
        return inner_->connect(volume);
    }

    void disconnect(remote::TreeHandle tree) override { inner_->disconnect(tree); }

    remote::ChannelResult<remote::FileHandle> open_file(remote::TreeHandle tree,
                                                        const std::string& path,
                                                        std::uint32_t mode) override {
        {
            std::lock_guard lock(mutex_);
            open_modes_.push_back(mode);
        }
        if (fail_open.load()) {
            return remote::channel_error<remote::FileHandle>(remote::ChannelErrorCode::AccessDenied,
                                                             "injected open failure");
        }
        return inner_->open_file(tree, path, mode);
    }

    remote::ChannelResult<std::uint64_t> seek(remote::FileHandle file, std::uint64_t offset) override {
        auto result = inner_->seek(file, offset);
        if (result.is_error() || seek_skew.load() == 0) {
            return result;
        }
        return remote::channel_ok(static_cast<std::uint64_t>(
            static_cast<std::int64_t>(result.value()) + seek_skew.load()));
    }

    remote::ChannelResult<std::size_t> write(remote::FileHandle file,
                                             const std::uint8_t* data,
                                             std::size_t length) override {
        const std::size_t index = ++write_calls_;
        if (fail_write_at.load() == index) {
            return remote::channel_error<std::size_t>(remote::ChannelErrorCode::IoError,
                                                      "injected write failure");
        }
        const std::size_t limit = max_write_length.load();
        auto result = inner_->write(file, data, limit != 0 && length > limit ? limit : length);
        if (on_write) {
            on_write(index);
        }
        return result;
    }

    void close(remote::FileHandle file) override { inner_->close(file); }

    remote::ChannelResult<remote::FileMetadata> stat(remote::TreeHandle tree, const std::string& path) override {
        return inner_->stat(tree, path);
    }

    remote::ChannelResult<void> move(const std::string& volume,
                                     const std::string& old_path,
                                     const std::string& new_path) override {
        ++move_calls_;
        if (fail_move.load()) {
            return remote::channel_error<void>(remote::ChannelErrorCode::AccessDenied, "injected move failure");
        }
        return inner_->move(volume, old_path, new_path);
    }

    remote::ChannelResult<void> remove(const std::string& volume, const std::string& path) override {
        {
            std::lock_guard lock(mutex_);
            removed_paths_.push_back(path);
        }
        return inner_->remove(volume, path);
    }

private:
    std::shared_ptr<remote::RemoteFileChannel> inner_;
    std::atomic<std::size_t> connect_calls_{0};
    std::atomic<std::size_t> write_calls_{0};
    std::atomic<std::size_t> move_calls_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> removed_paths_;
    std::vector<std::uint32_t> open_modes_;
};

} // namespace shareup::test_support
