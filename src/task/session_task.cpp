#include "shareup/task/session_task.hpp"

#include <spdlog/spdlog.h>

namespace shareup::task {

SessionTask::SessionTask(std::shared_ptr<remote::RemoteFileChannel> channel,
                         WorkQueue& queue,
                         Dispatcher& dispatcher,
                         events::EventBus* bus)
    : channel_(std::move(channel)),
      queue_(queue),
      dispatcher_(dispatcher),
      bus_(bus) {}

Result<void> SessionTask::resume() {
    std::lock_guard lock(execution_mutex_);
    auto started = state_.start();
    if (started.is_error()) {
        return started;
    }

    auto self = shared_from_this();
    execution_ = std::make_shared<WorkItem>(
        [self](const WorkItem& operation) { self->perform(operation); },
        description());
    queue_.submit(execution_);
    spdlog::debug("Task {} submitted", description());
    return Ok();
}

void SessionTask::cancel() {
    std::lock_guard lock(execution_mutex_);
    const bool cancelled = state_.finish_with(TaskState::Cancelled, [this]() {
        auto self = shared_from_this();
        auto cleanup = std::make_shared<WorkItem>(
            [self](const WorkItem&) { self->cleanup_after_cancel(); },
            description() + " (cleanup)");
        if (execution_) {
            cleanup->add_dependency(execution_);
        }
        queue_.submit(cleanup);

        if (execution_) {
            execution_->cancel();
        }
    });

    if (!cancelled) {
        spdlog::debug("Cancel ignored for {} in state {}", description(), to_string(state_.get()));
        return;
    }
    execution_.reset();
}

} // namespace shareup::task
