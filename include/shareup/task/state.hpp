#pragma once

#include "shareup/core/result.hpp"

#include <mutex>

namespace shareup::task {

enum class TaskState {
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

const char* to_string(TaskState state) noexcept;

[[nodiscard]] bool is_terminal(TaskState state) noexcept;

/**
 * @brief Lifecycle shared by transfer tasks
 *
 * idle -> running -> {completed | cancelled | failed}
 *
 * The value is read and written under one mutex so that a cancel racing
 * the end of a run resolves to exactly one terminal state. Terminal
 * states never change.
 */
class TransferTaskState {
public:
    TransferTaskState() = default;

    TransferTaskState(const TransferTaskState&) = delete;
    TransferTaskState& operator=(const TransferTaskState&) = delete;

    [[nodiscard]] TaskState get() const;

    /// idle -> running
    Result<void> start();

    /**
     * @brief running -> terminal
     *
     * RETURNS: true if this call made the transition. False when the
     * state was not running, e.g. a cancel already won.
     */
    bool finish(TaskState terminal);

    /// Runs `action` under the state lock if the transition succeeds
    template<typename Action>
    bool finish_with(TaskState terminal, Action&& action) {
        std::lock_guard lock(mutex_);
        if (!can_transition(terminal)) {
            return false;
        }
        action();
        apply(terminal);
        return true;
    }

private:
    // Caller holds mutex_
    [[nodiscard]] bool can_transition(TaskState target) const;
    void apply(TaskState target);

    mutable std::mutex mutex_;
    TaskState state_ = TaskState::Idle;
};

} // namespace shareup::task
