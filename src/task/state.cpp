#include "shareup/task/state.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace shareup::task {
namespace {

bool is_allowed(TaskState current, TaskState target) {
    static const std::unordered_map<TaskState, std::vector<TaskState>> transitions {
        {TaskState::Idle, {TaskState::Running}},
        {TaskState::Running, {TaskState::Completed, TaskState::Cancelled, TaskState::Failed}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Idle: return "idle";
        case TaskState::Running: return "running";
        case TaskState::Completed: return "completed";
        case TaskState::Cancelled: return "cancelled";
        case TaskState::Failed: return "failed";
    }
    return "unknown";
}

bool is_terminal(TaskState state) noexcept {
    return state == TaskState::Completed || state == TaskState::Cancelled || state == TaskState::Failed;
}

TaskState TransferTaskState::get() const {
    std::lock_guard lock(mutex_);
    return state_;
}

Result<void> TransferTaskState::start() {
    std::lock_guard lock(mutex_);
    if (!can_transition(TaskState::Running)) {
        return Err<void>(std::string("Task cannot start from state ") + to_string(state_));
    }
    apply(TaskState::Running);
    return Ok();
}

bool TransferTaskState::finish(TaskState terminal) {
    return finish_with(terminal, [] {});
}

bool TransferTaskState::can_transition(TaskState target) const {
    return is_allowed(state_, target);
}

void TransferTaskState::apply(TaskState target) {
    state_ = target;
}

} // namespace shareup::task
