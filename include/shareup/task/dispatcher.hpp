#pragma once

#include "shareup/events/event_queue.hpp"

#include <functional>
#include <thread>

namespace shareup::task {

/**
 * @brief Notification context for listener callbacks
 *
 * Tasks never call listeners on their worker thread; they hand each
 * callback to a Dispatcher so a slow listener cannot stall a transfer.
 */
class Dispatcher {
public:
    virtual ~Dispatcher() = default;
    virtual void dispatch(std::function<void()> callback) = 0;
};

/**
 * @brief Runs callbacks one at a time, in dispatch order, on its own thread
 *
 * Plays the role of a UI queue: callbacks dispatched in order A, B are
 * delivered in order A, B.
 */
class SerialDispatcher : public Dispatcher {
public:
    SerialDispatcher();

    /// Delivers what is already queued, then stops the thread
    ~SerialDispatcher() override;

    SerialDispatcher(const SerialDispatcher&) = delete;
    SerialDispatcher& operator=(const SerialDispatcher&) = delete;

    void dispatch(std::function<void()> callback) override;

    /**
     * @brief Block until every callback dispatched so far has run
     *
     * Must not be called from a callback.
     */
    void flush();

private:
    void run();

    events::ThreadSafeQueue<std::function<void()>> queue_;
    std::thread thread_;
};

} // namespace shareup::task
