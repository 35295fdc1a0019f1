#include "shareup/task/upload_task.hpp"

#include "shareup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <system_error>
#include <vector>

namespace shareup::task {
namespace fs = std::filesystem;

namespace {

// Tree handle released on every exit path of a run
class ScopedTree {
public:
    ScopedTree(remote::RemoteFileChannel& channel, remote::TreeHandle tree)
        : channel_(channel), tree_(tree) {}
    ~ScopedTree() { channel_.disconnect(tree_); }

    ScopedTree(const ScopedTree&) = delete;
    ScopedTree& operator=(const ScopedTree&) = delete;

private:
    remote::RemoteFileChannel& channel_;
    remote::TreeHandle tree_;
};

class ScopedFile {
public:
    ScopedFile(remote::RemoteFileChannel& channel, remote::FileHandle file)
        : channel_(channel), file_(file) {}
    ~ScopedFile() { close(); }

    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    void close() {
        if (open_) {
            channel_.close(file_);
            open_ = false;
        }
    }

private:
    remote::RemoteFileChannel& channel_;
    remote::FileHandle file_;
    bool open_ = true;
};

} // namespace

std::shared_ptr<UploadTask> UploadTask::create(std::shared_ptr<remote::RemoteFileChannel> channel,
                                               WorkQueue& queue,
                                               Dispatcher& dispatcher,
                                               UploadOptions options,
                                               std::weak_ptr<UploadListener> listener,
                                               events::EventBus* bus) {
    return std::make_shared<UploadTask>(std::move(channel), queue, dispatcher,
                                        std::move(options), std::move(listener), bus);
}

UploadTask::UploadTask(std::shared_ptr<remote::RemoteFileChannel> channel,
                       WorkQueue& queue,
                       Dispatcher& dispatcher,
                       UploadOptions options,
                       std::weak_ptr<UploadListener> listener,
                       events::EventBus* bus)
    : SessionTask(std::move(channel), queue, dispatcher, bus),
      options_(std::move(options)),
      listener_(std::move(listener)) {}

std::optional<remote::RemoteFileRef> UploadTask::remote_file() const {
    std::lock_guard lock(file_mutex_);
    return remote_file_;
}

std::string UploadTask::description() const {
    return options_.destination.to_string() + "/" + options_.file_name;
}

void UploadTask::perform(const WorkItem& operation) {
    RunResult outcome = Ok<Failure>();
    try {
        outcome = run(operation);
    } catch (const std::exception& e) {
        spdlog::error("Upload {} aborted by exception: {}", description(), e.what());
        outcome = Err<void>(Failure{UploadError::UploadFailed, e.what()});
    }

    if (outcome.is_ok()) {
        complete();
        return;
    }

    const Failure& failure = outcome.error();
    if (failure.error != UploadError::Cancelled) {
        fail(failure);
        return;
    }

    emit(events::UploadCancelledEvent{description(), bytes_sent_});
    spdlog::debug("Upload {} stopped: {}", description(), failure.detail);
    // cancel() already moved the state; the cleanup unit reports it
    if (task_state().finish(TaskState::Cancelled)) {
        notify_failed(UploadError::Cancelled);
    }
}

UploadTask::RunResult UploadTask::run(const WorkItem& operation) {
    if (options_.chunk_size == 0) {
        return Err<void>(Failure{UploadError::UploadFailed, "chunk size must be > 0"});
    }

    std::error_code ec;
    if (fs::is_directory(options_.source, ec)) {
        return Err<void>(Failure{UploadError::FileNotFound,
                                 "Source is a directory: " + options_.source.string()});
    }
    std::ifstream source(options_.source, std::ios::binary);
    if (!source) {
        return Err<void>(Failure{UploadError::FileNotFound,
                                 "Cannot open source: " + options_.source.string()});
    }

    if (operation.is_cancelled()) {
        return Err<void>(Failure{UploadError::Cancelled, "cancelled before connect"});
    }

    const std::string& volume = options_.destination.volume();
    auto tree = channel().connect(volume);
    if (tree.is_error()) {
        return Err<void>(Failure{UploadError::ConnectionFailed, tree.error().message});
    }
    ScopedTree tree_guard(channel(), tree.value());

    auto target = resolve_target();
    if (target.is_error()) {
        return Err<void>(Failure{UploadError::FileNotFound, target.error()});
    }
    {
        std::lock_guard lock(file_mutex_);
        remote_file_ = target.value();
    }
    const std::string final_path = target.value().upload_path();
    const std::string write_path = write_target(target.value()).upload_path();

    source.seekg(0, std::ios::end);
    const auto end = source.tellg();
    if (end < 0) {
        return Err<void>(Failure{UploadError::FileNotFound,
                                 "Cannot size source: " + options_.source.string()});
    }
    total_bytes_ = static_cast<std::uint64_t>(end);
    source.seekg(0, std::ios::beg);

    // Without a temporary name a partial file cannot be told from a
    // finished one, so only staged uploads resume.
    std::uint64_t resume_offset = 0;
    if (options_.temporary_suffix) {
        auto existing = channel().stat(tree.value(), write_path);
        if (existing.is_ok()) {
            if (existing.value().is_directory) {
                return Err<void>(Failure{UploadError::DirectoryDownloaded, write_path + " is a directory"});
            }
            resume_offset = existing.value().size;
            if (resume_offset > total_bytes_) {
                spdlog::warn("Stale partial upload {} ({} bytes > {}), restarting",
                             write_path, resume_offset, total_bytes_);
                resume_offset = 0;
            }
        } else if (existing.error().code != remote::ChannelErrorCode::NotFound) {
            spdlog::warn("Resume check for {} failed ({}), starting from zero",
                         write_path, existing.error().message);
        }
    }

    const auto mode = resume_offset == 0 ? remote::kNewFileMode : remote::kExistingFileMode;
    auto opened = channel().open_file(tree.value(), write_path, mode);
    if (opened.is_error()) {
        const auto error = opened.error().code == remote::ChannelErrorCode::IsDirectory
            ? UploadError::DirectoryDownloaded
            : UploadError::ConnectionFailed;
        return Err<void>(Failure{error, "Cannot open " + write_path + ": " + opened.error().message});
    }
    ScopedFile file_guard(channel(), opened.value());

    if (operation.is_cancelled()) {
        return Err<void>(Failure{UploadError::Cancelled, "cancelled after open"});
    }

    if (resume_offset > 0) {
        auto position = channel().seek(opened.value(), resume_offset);
        if (position.is_error()) {
            return Err<void>(Failure{UploadError::UploadFailed,
                                     "Resume seek failed: " + position.error().message});
        }
        // Partial file is kept; a later run retries the resume
        if (position.value() != resume_offset) {
            return Err<void>(Failure{UploadError::UploadFailed,
                                     "Resume seek reached " + std::to_string(position.value()) +
                                     " instead of " + std::to_string(resume_offset)});
        }
        source.seekg(static_cast<std::streamoff>(resume_offset), std::ios::beg);
    }

    started_at_ = std::chrono::steady_clock::now();
    bytes_sent_ = resume_offset;
    emit(events::UploadStartedEvent{description(), total_bytes_});
    if (resume_offset > 0) {
        emit(events::UploadResumedEvent{description(), resume_offset, total_bytes_});
    }

    auto transferred = transfer(operation, source, opened.value(), resume_offset, total_bytes_);
    file_guard.close();
    source.close();
    if (transferred.is_error()) {
        return transferred;
    }

    if (operation.is_cancelled()) {
        return Err<void>(Failure{UploadError::Cancelled, "cancelled before publish"});
    }

    if (options_.temporary_suffix) {
        auto moved = channel().move(volume, write_path, final_path);
        if (moved.is_error()) {
            return Err<void>(Failure{UploadError::UploadFailed,
                                     "Publish " + write_path + " -> " + final_path + " failed: " +
                                     moved.error().message});
        }
    }
    return Ok<Failure>();
}

UploadTask::RunResult UploadTask::transfer(const WorkItem& operation,
                                           std::ifstream& source,
                                           remote::FileHandle file,
                                           std::uint64_t resume_offset,
                                           std::uint64_t total_bytes) {
    std::vector<std::uint8_t> buffer(options_.chunk_size);
    std::uint64_t sent = resume_offset;

    while (sent < total_bytes) {
        const auto length = static_cast<std::size_t>(
            std::min<std::uint64_t>(total_bytes - sent, buffer.size()));

        source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::size_t>(source.gcount()) != length) {
            return Err<void>(Failure{UploadError::UploadFailed,
                                     "Short read from source at offset " + std::to_string(sent)});
        }

        auto written = channel().write(file, buffer.data(), length);

        if (operation.is_cancelled()) {
            return Err<void>(Failure{UploadError::Cancelled, "cancelled at offset " + std::to_string(sent)});
        }
        if (written.is_error()) {
            return Err<void>(Failure{UploadError::UploadFailed,
                                     "Write at offset " + std::to_string(sent) + " failed: " +
                                     written.error().message});
        }
        const std::size_t accepted = written.value();
        if (accepted == 0 || accepted > length) {
            return Err<void>(Failure{UploadError::UploadFailed,
                                     "Remote accepted " + std::to_string(accepted) + " of " +
                                     std::to_string(length) + " bytes"});
        }

        sent += accepted;
        bytes_sent_ = sent;
        bytes_written_this_run_ += accepted;
        if (accepted < length) {
            // Re-read whatever the remote did not take
            source.seekg(static_cast<std::streamoff>(sent), std::ios::beg);
        }

        notify_progress(sent, total_bytes);
        emit(events::UploadChunkWrittenEvent{description(), sent, total_bytes});
    }
    return Ok<Failure>();
}

Result<remote::RemoteFileRef> UploadTask::resolve_target() const {
    return remote::RemoteFileRef::make(options_.destination, options_.file_name);
}

remote::RemoteFileRef UploadTask::write_target(const remote::RemoteFileRef& target) const {
    return options_.temporary_suffix ? target.with_suffix(*options_.temporary_suffix) : target;
}

void UploadTask::complete() {
    if (!task_state().finish(TaskState::Completed)) {
        spdlog::info("Upload {} finished after cancel, cleanup will remove it", description());
        return;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    emit(events::UploadCompletedEvent{description(), total_bytes_, bytes_written_this_run_, elapsed});

    auto task = self();
    notify([task]() {
        if (auto listener = task->listener_.lock()) {
            listener->on_upload_finished(*task);
        }
    });
}

void UploadTask::fail(const Failure& failure) {
    if (!task_state().finish(TaskState::Failed)) {
        spdlog::debug("Upload {} failure after cancel ignored: {}", description(), failure.detail);
        return;
    }
    emit(events::UploadFailedEvent{description(), failure.error, failure.detail});
    notify_failed(failure.error);
}

void UploadTask::cleanup_after_cancel() {
    // Unset when the run stopped before addressing the share: nothing of
    // ours is there, and an existing file under the name is not ours to delete.
    const auto target = remote_file();

    std::size_t removed = 0;
    if (target) {
        const std::string& volume = options_.destination.volume();
        auto try_remove = [&](const std::string& path) {
            auto result = channel().remove(volume, path);
            if (result.is_ok()) {
                ++removed;
            } else if (result.error().code != remote::ChannelErrorCode::NotFound) {
                spdlog::warn("Cleanup of {} could not delete {}: {}", description(), path, result.error().message);
            }
        };

        if (options_.temporary_suffix) {
            try_remove(target->upload_path());
        }
        try_remove(write_target(*target).upload_path());
    }

    emit(events::UploadCleanupEvent{description(), removed});
    notify_failed(UploadError::Cancelled);
}

void UploadTask::notify_progress(std::uint64_t bytes_sent, std::uint64_t bytes_expected) {
    auto task = self();
    notify([task, bytes_sent, bytes_expected]() {
        if (auto listener = task->listener_.lock()) {
            listener->on_upload_progress(*task, bytes_sent, bytes_expected);
        }
    });
}

void UploadTask::notify_failed(UploadError error) {
    auto task = self();
    notify([task, error]() {
        if (auto listener = task->listener_.lock()) {
            listener->on_upload_failed(*task, error);
        }
    });
}

std::shared_ptr<UploadTask> UploadTask::self() {
    return std::static_pointer_cast<UploadTask>(shared_from_this());
}

bool operator==(const UploadTask& lhs, const UploadTask& rhs) {
    return lhs.options().destination == rhs.options().destination &&
           lhs.options().file_name == rhs.options().file_name;
}

bool operator!=(const UploadTask& lhs, const UploadTask& rhs) {
    return !(lhs == rhs);
}

} // namespace shareup::task
