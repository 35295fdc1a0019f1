/**
 * @file components.hpp
 * @brief Logging and metrics subscribers for transfer events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // tasks constructed with &bus are now logged and counted
 */

#pragma once

#include "shareup/events/event_bus.hpp"
#include "shareup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace shareup::events {

/**
 * @brief Logs every upload event with spdlog
 *
 * Chunk events go to debug level, everything else to info/warn/error.
 * Unsubscribes on destruction, so it may be shorter-lived than the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<UploadStartedEvent>([](const UploadStartedEvent& e) {
            spdlog::info("[UploadStarted] dest={} bytes={}", e.destination, e.total_bytes);
        }));
        ids_.push_back(bus_.subscribe<UploadResumedEvent>([](const UploadResumedEvent& e) {
            spdlog::info("[UploadResumed] dest={} offset={}/{}", e.destination, e.resume_offset, e.total_bytes);
        }));
        ids_.push_back(bus_.subscribe<UploadChunkWrittenEvent>([](const UploadChunkWrittenEvent& e) {
            spdlog::debug("[ChunkWritten] dest={} sent={}/{}", e.destination, e.bytes_sent, e.total_bytes);
        }));
        ids_.push_back(bus_.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] dest={} bytes={} written={} duration={}ms",
                         e.destination, e.total_bytes, e.bytes_written, e.duration.count());
        }));
        ids_.push_back(bus_.subscribe<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[UploadFailed] dest={} error={} detail={}",
                          e.destination, task::to_string(e.error), e.detail);
        }));
        ids_.push_back(bus_.subscribe<UploadCancelledEvent>([](const UploadCancelledEvent& e) {
            spdlog::warn("[UploadCancelled] dest={} sent={}", e.destination, e.bytes_sent);
        }));
        ids_.push_back(bus_.subscribe<UploadCleanupEvent>([](const UploadCleanupEvent& e) {
            spdlog::info("[UploadCleanup] dest={} removed={}", e.destination, e.files_removed);
        }));
    }

    ~LoggerComponent() {
        for (auto id : ids_) {
            bus_.unsubscribe(id);
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    std::vector<EventBus::SubscriptionId> ids_;
};

/**
 * @brief Counts uploads and bytes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // ...
 * metrics.get_stats().uploads_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_resumed{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> uploads_cancelled{0};
        std::atomic<uint64_t> chunks_written{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> bytes_skipped_by_resume{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        }));
        ids_.push_back(bus_.subscribe<UploadResumedEvent>([this](const UploadResumedEvent& e) {
            stats_.uploads_resumed++;
            stats_.bytes_skipped_by_resume += e.resume_offset;
        }));
        ids_.push_back(bus_.subscribe<UploadChunkWrittenEvent>([this](const UploadChunkWrittenEvent&) {
            stats_.chunks_written++;
        }));
        ids_.push_back(bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_uploaded += e.bytes_written;
        }));
        ids_.push_back(bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        }));
        ids_.push_back(bus_.subscribe<UploadCancelledEvent>([this](const UploadCancelledEvent&) {
            stats_.uploads_cancelled++;
        }));
    }

    ~MetricsComponent() {
        for (auto id : ids_) {
            bus_.unsubscribe(id);
        }
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Uploads started:   {}", stats_.uploads_started.load());
        spdlog::info("  Uploads resumed:   {}", stats_.uploads_resumed.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Uploads cancelled: {}", stats_.uploads_cancelled.load());
        spdlog::info("  Chunks written:    {}", stats_.chunks_written.load());
        spdlog::info("  Bytes uploaded:    {}", stats_.bytes_uploaded.load());
        spdlog::info("  Bytes resumed:     {}", stats_.bytes_skipped_by_resume.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    std::vector<EventBus::SubscriptionId> ids_;
    Stats stats_;
};

} // namespace shareup::events
