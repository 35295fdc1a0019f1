#include "shareup/task/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <future>
#include <memory>

namespace shareup::task {

SerialDispatcher::SerialDispatcher()
    : thread_([this]() { run(); }) {}

SerialDispatcher::~SerialDispatcher() {
    queue_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SerialDispatcher::dispatch(std::function<void()> callback) {
    if (!queue_.push(std::move(callback))) {
        spdlog::warn("Dispatcher closed, dropping callback");
    }
}

void SerialDispatcher::flush() {
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    if (!queue_.push([done]() { done->set_value(); })) {
        return;
    }
    future.wait();
}

void SerialDispatcher::run() {
    while (auto callback = queue_.pop()) {
        try {
            (*callback)();
        } catch (const std::exception& e) {
            spdlog::error("Listener callback threw: {}", e.what());
        }
    }
}

} // namespace shareup::task
