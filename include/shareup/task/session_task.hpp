#pragma once

#include "shareup/core/result.hpp"
#include "shareup/events/event_bus.hpp"
#include "shareup/remote/channel.hpp"
#include "shareup/task/dispatcher.hpp"
#include "shareup/task/state.hpp"
#include "shareup/task/work_queue.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace shareup::task {

/**
 * @brief Lifecycle shared by the transfer tasks of a session
 *
 * A task is created idle, started once with resume(), and ends in exactly
 * one terminal state. Its execution unit runs on the WorkQueue; listener
 * callbacks go through the Dispatcher.
 *
 * Tasks must be owned by a std::shared_ptr: queued work keeps the task
 * alive until it has run. The queue, dispatcher and bus must outlive
 * every run.
 */
class SessionTask : public std::enable_shared_from_this<SessionTask> {
public:
    SessionTask(std::shared_ptr<remote::RemoteFileChannel> channel,
                WorkQueue& queue,
                Dispatcher& dispatcher,
                events::EventBus* bus = nullptr);
    virtual ~SessionTask() = default;

    SessionTask(const SessionTask&) = delete;
    SessionTask& operator=(const SessionTask&) = delete;

    /// idle -> running, submits the execution unit. Errors if already started.
    Result<void> resume();

    /**
     * @brief Cooperative cancel, only effective while running
     *
     * Schedules the cleanup unit after the execution unit, raises the
     * stop flag, moves to cancelled and forgets the execution unit. Does
     * not wait for either unit.
     */
    virtual void cancel();

    [[nodiscard]] TaskState state() const { return state_.get(); }

    /// Human-readable target, used in logs and events
    [[nodiscard]] virtual std::string description() const = 0;

protected:
    /// Body of the execution unit; poll `operation.is_cancelled()`
    virtual void perform(const WorkItem& operation) = 0;

    /// Body of the unit scheduled by cancel(); runs after perform() returns
    virtual void cleanup_after_cancel() = 0;

    template<typename EventType>
    void emit(const EventType& event) const {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    void notify(std::function<void()> callback) { dispatcher_.dispatch(std::move(callback)); }

    remote::RemoteFileChannel& channel() { return *channel_; }
    TransferTaskState& task_state() { return state_; }

private:
    std::shared_ptr<remote::RemoteFileChannel> channel_;
    WorkQueue& queue_;
    Dispatcher& dispatcher_;
    events::EventBus* bus_;

    TransferTaskState state_;
    std::mutex execution_mutex_;
    std::shared_ptr<WorkItem> execution_;
};

} // namespace shareup::task
