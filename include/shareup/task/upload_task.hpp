#pragma once

#include "shareup/remote/types.hpp"
#include "shareup/task/errors.hpp"
#include "shareup/task/session_task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace shareup::task {

class UploadTask;

/**
 * @brief Observer of one upload
 *
 * Called on the task's Dispatcher, never on the worker. Per run: zero or
 * more progress calls with strictly increasing `bytes_sent`, then exactly
 * one of finished/failed.
 */
class UploadListener {
public:
    virtual ~UploadListener() = default;

    virtual void on_upload_progress(UploadTask& task, std::uint64_t bytes_sent, std::uint64_t bytes_expected) = 0;
    virtual void on_upload_finished(UploadTask& task) = 0;
    virtual void on_upload_failed(UploadTask& task, UploadError error) = 0;
};

struct UploadOptions {
    static constexpr std::size_t kDefaultChunkSize = 63488;

    remote::RemotePath destination;
    std::string file_name;
    /// When set, bytes go to `file_name + suffix` and are renamed on success
    std::optional<std::string> temporary_suffix;
    std::filesystem::path source;
    std::size_t chunk_size = kDefaultChunkSize;
};

/**
 * @brief Resumable, chunked upload of one local file to a share
 *
 * Run: open source -> connect -> resolve target -> resume check -> open
 * remote -> write chunks -> close -> publish (rename from the temporary
 * name). The final name only appears once every byte is written.
 *
 * Failures leave the temporary file in place for a later resume; only
 * cancel() deletes partial artifacts.
 */
class UploadTask : public SessionTask {
public:
    static std::shared_ptr<UploadTask> create(std::shared_ptr<remote::RemoteFileChannel> channel,
                                              WorkQueue& queue,
                                              Dispatcher& dispatcher,
                                              UploadOptions options,
                                              std::weak_ptr<UploadListener> listener = {},
                                              events::EventBus* bus = nullptr);

    UploadTask(std::shared_ptr<remote::RemoteFileChannel> channel,
               WorkQueue& queue,
               Dispatcher& dispatcher,
               UploadOptions options,
               std::weak_ptr<UploadListener> listener,
               events::EventBus* bus);

    [[nodiscard]] const UploadOptions& options() const noexcept { return options_; }

    /// Set once the run has addressed the remote file
    [[nodiscard]] std::optional<remote::RemoteFileRef> remote_file() const;

    [[nodiscard]] std::string description() const override;

protected:
    void perform(const WorkItem& operation) override;
    void cleanup_after_cancel() override;

private:
    struct Failure {
        UploadError error;
        std::string detail;
    };
    using RunResult = Result<void, Failure>;

    RunResult run(const WorkItem& operation);
    RunResult transfer(const WorkItem& operation,
                       std::ifstream& source,
                       remote::FileHandle file,
                       std::uint64_t resume_offset,
                       std::uint64_t total_bytes);

    Result<remote::RemoteFileRef> resolve_target() const;
    [[nodiscard]] remote::RemoteFileRef write_target(const remote::RemoteFileRef& target) const;

    void complete();
    void fail(const Failure& failure);

    void notify_progress(std::uint64_t bytes_sent, std::uint64_t bytes_expected);
    void notify_failed(UploadError error);

    std::shared_ptr<UploadTask> self();

    const UploadOptions options_;
    const std::weak_ptr<UploadListener> listener_;

    mutable std::mutex file_mutex_;
    std::optional<remote::RemoteFileRef> remote_file_;

    // Touched only by the execution unit
    std::uint64_t total_bytes_ = 0;
    std::uint64_t bytes_sent_ = 0;
    std::uint64_t bytes_written_this_run_ = 0;
    std::chrono::steady_clock::time_point started_at_{};
};

/// Same destination directory and file name, whatever the source
bool operator==(const UploadTask& lhs, const UploadTask& rhs);
bool operator!=(const UploadTask& lhs, const UploadTask& rhs);

} // namespace shareup::task
