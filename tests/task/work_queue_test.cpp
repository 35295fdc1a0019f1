#include "shareup/task/work_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using shareup::task::WorkItem;
using shareup::task::WorkQueue;

TEST(WorkQueueTest, RunsSubmittedItems) {
    WorkQueue queue(2);
    std::atomic<int> sum{0};
    for (int i = 1; i <= 10; ++i) {
        queue.submit([&sum, i](const WorkItem&) { sum += i; });
    }
    queue.wait();
    EXPECT_EQ(sum.load(), 55);
    EXPECT_EQ(queue.outstanding(), 0u);
}

TEST(WorkQueueTest, DependentWaitsForDependency) {
    WorkQueue queue(4);
    std::mutex mutex;
    std::vector<int> order;

    auto first = std::make_shared<WorkItem>([&](const WorkItem&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::lock_guard lock(mutex);
        order.push_back(1);
    });
    auto second = std::make_shared<WorkItem>([&](const WorkItem&) {
        std::lock_guard lock(mutex);
        order.push_back(2);
    });
    second->add_dependency(first);

    queue.submit(second);
    queue.submit(first);
    queue.wait();

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(WorkQueueTest, DependencyOnFinishedItemDoesNotBlock) {
    WorkQueue queue(1);
    auto done = queue.submit([](const WorkItem&) {});
    done->wait();

    std::atomic<bool> ran{false};
    auto later = std::make_shared<WorkItem>([&](const WorkItem&) { ran = true; });
    later->add_dependency(done);
    queue.submit(later);
    queue.wait();

    EXPECT_TRUE(ran.load());
}

TEST(WorkQueueTest, CancelledItemStillRunsAndSeesFlag) {
    WorkQueue queue(1);
    std::atomic<bool> saw_cancel{false};
    std::atomic<bool> release{false};

    // Occupy the only worker so the next item is still queued when cancelled
    queue.submit([&](const WorkItem&) {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    auto item = std::make_shared<WorkItem>([&](const WorkItem& self) { saw_cancel = self.is_cancelled(); });
    queue.submit(item);
    item->cancel();
    release = true;
    queue.wait();

    EXPECT_TRUE(item->is_finished());
    EXPECT_TRUE(saw_cancel.load());
}

TEST(WorkQueueTest, ThrowingItemReleasesDependents) {
    WorkQueue queue(2);
    auto failing = std::make_shared<WorkItem>([](const WorkItem&) {
        throw std::runtime_error("boom");
    }, "failing");
    std::atomic<bool> ran{false};
    auto after = std::make_shared<WorkItem>([&](const WorkItem&) { ran = true; });
    after->add_dependency(failing);

    queue.submit(after);
    queue.submit(failing);
    queue.wait();

    EXPECT_TRUE(ran.load());
}

TEST(WorkQueueTest, DuplicateSubmitIsIgnored) {
    WorkQueue queue(2);
    std::atomic<int> runs{0};
    auto item = std::make_shared<WorkItem>([&](const WorkItem&) { runs++; });
    queue.submit(item);
    queue.submit(item);
    queue.wait();
    EXPECT_EQ(runs.load(), 1);
}
