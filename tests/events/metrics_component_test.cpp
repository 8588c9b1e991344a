#include "rv/events/components.hpp"
#include "rv/events/events.hpp"
#include "rv/events/notification_hub.hpp"

#include <gtest/gtest.h>

using rv::events::DownloadProgress;
using rv::events::MetricsComponent;
using rv::events::Notification;
using rv::events::NotificationHub;
using rv::events::NotificationKind;
using rv::events::NotificationLog;
using rv::events::UploadProgress;

TEST(MetricsComponentTest, CountsTerminalNotificationsByKind) {
    NotificationHub hub;
    MetricsComponent metrics(hub);

    hub.publish(Notification("job-1", NotificationKind::Upload, "completed", "archive/a.mov"));
    hub.publish(Notification("job-2", NotificationKind::Upload, "failed", "AccessDenied"));
    hub.publish(Notification("job-3", NotificationKind::Upload, "cancelled", ""));
    hub.publish(Notification("archive/a.mov", NotificationKind::Restore, "completed", ""));
    hub.publish(Notification("archive/b.mov", NotificationKind::Restore, "failed", "expired"));
    hub.publish(Notification("archive/a.mov", NotificationKind::Download, "completed", "/tmp/a.mov"));
    hub.publish(UploadProgress{});
    hub.publish(UploadProgress{});
    hub.publish(DownloadProgress{});
    hub.flush();

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.uploads_cancelled.load(), 1u);
    EXPECT_EQ(stats.restores_completed.load(), 1u);
    EXPECT_EQ(stats.restores_failed.load(), 1u);
    EXPECT_EQ(stats.restores_cancelled.load(), 0u);
    EXPECT_EQ(stats.downloads_completed.load(), 1u);
    EXPECT_EQ(stats.upload_progress_ticks.load(), 2u);
    EXPECT_EQ(stats.download_progress_ticks.load(), 1u);
}

TEST(MetricsComponentTest, UnsubscribesOnDestruction) {
    NotificationHub hub;
    {
        MetricsComponent metrics(hub);
        EXPECT_EQ(hub.subscriber_count<Notification>(), 1u);
    }
    EXPECT_EQ(hub.subscriber_count<Notification>(), 0u);
}

TEST(NotificationLogTest, KeepsOnlyRequestedKind) {
    NotificationHub hub;
    NotificationLog restores(hub, NotificationKind::Restore);
    NotificationLog everything(hub);

    hub.publish(Notification("job-1", NotificationKind::Upload, "completed", ""));
    hub.publish(Notification("archive/a.mov", NotificationKind::Restore, "failed", "boom"));
    hub.flush();

    ASSERT_EQ(restores.size(), 1u);
    EXPECT_EQ(restores.entries()[0].subject, "archive/a.mov");
    EXPECT_EQ(restores.entries()[0].message, "boom");
    EXPECT_EQ(everything.size(), 2u);

    restores.clear();
    EXPECT_EQ(restores.size(), 0u);
}
