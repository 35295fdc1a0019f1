#pragma once

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace shareup::task {

class WorkQueue;

/**
 * @brief One unit of work for a WorkQueue
 *
 * Cancellation is cooperative: cancel() only raises a flag, the body
 * decides where to look at it. A cancelled item still runs and still
 * releases its dependents when it returns.
 *
 * Always owned by a shared_ptr. Dependencies must be added before the
 * item is submitted.
 */
class WorkItem : public std::enable_shared_from_this<WorkItem> {
public:
    using Body = std::function<void(const WorkItem&)>;

    explicit WorkItem(Body body, std::string name = {});

    WorkItem(const WorkItem&) = delete;
    WorkItem& operator=(const WorkItem&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(); }

    [[nodiscard]] bool is_finished() const;

    /// This item will not start before `dependency` has returned
    void add_dependency(const std::shared_ptr<WorkItem>& dependency);

    /// Blocks until the body has returned
    void wait() const;

private:
    friend class WorkQueue;

    void run();
    void dependency_finished();

    Body body_;
    std::string name_;
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    mutable std::condition_variable finished_cv_;
    bool finished_ = false;
    std::size_t pending_dependencies_ = 0;
    std::vector<std::shared_ptr<WorkItem>> dependents_;
    WorkQueue* queue_ = nullptr;  ///< Set by WorkQueue::submit
};

/**
 * @brief Concurrent queue of WorkItems on a fixed pool of threads
 *
 * Items without pending dependencies are posted to the pool at once;
 * the others are parked until their last dependency returns.
 *
 * THREAD SAFETY: submit() and wait() may be called from any thread,
 * including from inside a running item (wait() excepted).
 */
class WorkQueue {
public:
    explicit WorkQueue(std::size_t worker_threads = 2);

    /// Waits for outstanding work, then joins the pool
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void submit(const std::shared_ptr<WorkItem>& item);

    /// Convenience for a one-off body without dependencies
    std::shared_ptr<WorkItem> submit(WorkItem::Body body, std::string name = {});

    /// Blocks until every submitted item has returned
    void wait();

    [[nodiscard]] std::size_t outstanding() const noexcept { return outstanding_.load(); }

private:
    friend class WorkItem;

    void post(const std::shared_ptr<WorkItem>& item);
    void item_finished();

    boost::asio::thread_pool pool_;
    std::atomic<std::size_t> outstanding_{0};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};

} // namespace shareup::task
