#include "shareup/task/work_queue.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace shareup::task {

// ──────────────────────────────────────────────────────────
// WorkItem
// ──────────────────────────────────────────────────────────

WorkItem::WorkItem(Body body, std::string name)
    : body_(std::move(body)), name_(std::move(name)) {}

bool WorkItem::is_finished() const {
    std::lock_guard lock(mutex_);
    return finished_;
}

void WorkItem::add_dependency(const std::shared_ptr<WorkItem>& dependency) {
    if (!dependency || dependency.get() == this) {
        return;
    }
    // Lock order: dependency before dependent. run() never holds both.
    std::lock_guard dependency_lock(dependency->mutex_);
    if (dependency->finished_) {
        return;
    }
    std::lock_guard lock(mutex_);
    ++pending_dependencies_;
    dependency->dependents_.push_back(shared_from_this());
}

void WorkItem::wait() const {
    std::unique_lock lock(mutex_);
    finished_cv_.wait(lock, [this]() { return finished_; });
}

void WorkItem::run() {
    // Dropped after the run so captures cannot keep their owners alive
    Body body = std::move(body_);
    body_ = nullptr;
    try {
        if (body) {
            body(*this);
        }
    } catch (const std::exception& e) {
        spdlog::error("Work item '{}' threw: {}", name_, e.what());
    }

    std::vector<std::shared_ptr<WorkItem>> dependents;
    WorkQueue* queue = nullptr;
    {
        std::lock_guard lock(mutex_);
        finished_ = true;
        dependents.swap(dependents_);
        queue = queue_;
    }
    finished_cv_.notify_all();

    for (const auto& dependent : dependents) {
        dependent->dependency_finished();
    }
    if (queue != nullptr) {
        queue->item_finished();
    }
}

void WorkItem::dependency_finished() {
    WorkQueue* queue = nullptr;
    {
        std::lock_guard lock(mutex_);
        if (pending_dependencies_ == 0 || --pending_dependencies_ > 0) {
            return;
        }
        queue = queue_;
    }
    // Not submitted yet: submit() posts it once it sees no pending dependency
    if (queue != nullptr) {
        queue->post(shared_from_this());
    }
}

// ──────────────────────────────────────────────────────────
// WorkQueue
// ──────────────────────────────────────────────────────────

WorkQueue::WorkQueue(std::size_t worker_threads)
    : pool_(worker_threads == 0 ? 1 : worker_threads) {}

WorkQueue::~WorkQueue() {
    wait();
    pool_.join();
}

void WorkQueue::submit(const std::shared_ptr<WorkItem>& item) {
    if (!item) {
        return;
    }
    bool ready = false;
    {
        std::lock_guard lock(item->mutex_);
        if (item->queue_ != nullptr || item->finished_) {
            spdlog::warn("Work item '{}' submitted twice, ignoring", item->name());
            return;
        }
        item->queue_ = this;
        ready = item->pending_dependencies_ == 0;
        ++outstanding_;
    }
    if (ready) {
        post(item);
    }
}

std::shared_ptr<WorkItem> WorkQueue::submit(WorkItem::Body body, std::string name) {
    auto item = std::make_shared<WorkItem>(std::move(body), std::move(name));
    submit(item);
    return item;
}

void WorkQueue::wait() {
    std::unique_lock lock(idle_mutex_);
    idle_cv_.wait(lock, [this]() { return outstanding_.load() == 0; });
}

void WorkQueue::post(const std::shared_ptr<WorkItem>& item) {
    boost::asio::post(pool_, [item]() { item->run(); });
}

void WorkQueue::item_finished() {
    std::lock_guard lock(idle_mutex_);
    --outstanding_;
    idle_cv_.notify_all();
}

} // namespace shareup::task
