/**
 * @file events.hpp
 * @brief Events emitted by transfer tasks
 *
 * NAMING CONVENTION:
 * - Past tense, one struct per fact: UploadStartedEvent, UploadFailedEvent
 * - `destination` is the final remote location "volume/dir/name"
 *
 * Emitted on the worker thread running the task. Subscribers must be
 * quick; anything slow belongs on a Dispatcher.
 */

#pragma once

#include "shareup/task/errors.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace shareup::events {

/**
 * @brief The execution unit connected and is about to write
 *
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct UploadStartedEvent {
    std::string destination;
    std::uint64_t total_bytes;
    std::chrono::system_clock::time_point timestamp;

    UploadStartedEvent(std::string dest, std::uint64_t total)
        : destination(std::move(dest)),
          total_bytes(total),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief A partial temporary file was found and will be continued
 */
struct UploadResumedEvent {
    std::string destination;
    std::uint64_t resume_offset;
    std::uint64_t total_bytes;
};

struct UploadChunkWrittenEvent {
    std::string destination;
    std::uint64_t bytes_sent;
    std::uint64_t total_bytes;
};

struct UploadCompletedEvent {
    std::string destination;
    std::uint64_t total_bytes;
    std::uint64_t bytes_written;  ///< Excludes bytes skipped by resume
    std::chrono::milliseconds duration;
};

struct UploadFailedEvent {
    std::string destination;
    task::UploadError error;
    std::string detail;
};

struct UploadCancelledEvent {
    std::string destination;
    std::uint64_t bytes_sent;
};

/**
 * @brief Best-effort removal of partial artifacts after a cancel
 *
 * WHO EMITS: the cleanup unit scheduled by UploadTask::cancel()
 */
struct UploadCleanupEvent {
    std::string destination;
    std::size_t files_removed;
};

} // namespace shareup::events
