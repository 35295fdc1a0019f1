#include "shareup/events/components.hpp"
#include "shareup/events/event_bus.hpp"
#include "shareup/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using shareup::events::EventBus;
using shareup::events::LoggerComponent;
using shareup::events::MetricsComponent;
using shareup::events::UploadCancelledEvent;
using shareup::events::UploadChunkWrittenEvent;
using shareup::events::UploadCompletedEvent;
using shareup::events::UploadFailedEvent;
using shareup::events::UploadResumedEvent;
using shareup::events::UploadStartedEvent;
using shareup::task::UploadError;

TEST(MetricsComponentTest, CountsUploadOutcomes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadStartedEvent{"share/a.bin", 2048});
    bus.emit(UploadResumedEvent{"share/a.bin", 1024, 2048});
    bus.emit(UploadChunkWrittenEvent{"share/a.bin", 2048, 2048});
    bus.emit(UploadCompletedEvent{"share/a.bin", 2048, 1024, std::chrono::milliseconds{5}});
    bus.emit(UploadFailedEvent{"share/b.bin", UploadError::UploadFailed, "write failed"});
    bus.emit(UploadCancelledEvent{"share/c.bin", 0});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_started.load(), 1u);
    EXPECT_EQ(stats.uploads_resumed.load(), 1u);
    EXPECT_EQ(stats.bytes_skipped_by_resume.load(), 1024u);
    EXPECT_EQ(stats.chunks_written.load(), 1u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 1024u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.uploads_cancelled.load(), 1u);
}

TEST(MetricsComponentTest, ComponentsUnsubscribeWhenDestroyed) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(UploadStartedEvent{"share/a.bin", 1}));
}
