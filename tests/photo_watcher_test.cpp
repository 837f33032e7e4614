#include "photo_watcher.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <set>
#include <thread>

namespace fs = std::filesystem;
using testing_support::TempDir;
using namespace std::chrono_literals;

namespace {

void writeBytes(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << bytes;
}

WatcherSettings settingsFor(const TempDir& dir, int debounceMs = 500, size_t capacity = 32) {
    WatcherSettings s;
    s.photosDir = dir.path().string();
    s.pollIntervalMs = 20;
    s.debounceMs = debounceMs;
    s.eventQueueCapacity = capacity;
    return s;
}

}

TEST(PhotoWatcher, RecognizesImageExtensions) {
    EXPECT_TRUE(PhotoWatcher::isSupportedImage("a.jpg"));
    EXPECT_TRUE(PhotoWatcher::isSupportedImage("a.JPEG"));
    EXPECT_TRUE(PhotoWatcher::isSupportedImage("dir/b.Png"));
    EXPECT_TRUE(PhotoWatcher::isSupportedImage("c.heic"));
    EXPECT_FALSE(PhotoWatcher::isSupportedImage("notes.txt"));
    EXPECT_FALSE(PhotoWatcher::isSupportedImage("a.png.part"));
    EXPECT_FALSE(PhotoWatcher::isSupportedImage("noext"));
}

TEST(PhotoWatcher, OpenFailsOnMissingDirectory) {
    TempDir dir;
    WatcherSettings s = settingsFor(dir);
    s.photosDir = dir.file("nope");
    PhotoLedger ledger;
    BoundedQueue<IngestEvent> events(4);
    PhotoWatcher watcher(s, ledger, events);
    std::string error;
    EXPECT_FALSE(watcher.open(error));
    EXPECT_NE(error.find("nope"), std::string::npos);
    EXPECT_FALSE(watcher.start(error));
    EXPECT_FALSE(watcher.running());
}

TEST(PhotoWatcher, EmitsOnceAfterDebounce) {
    TempDir dir;
    PhotoLedger ledger;
    BoundedQueue<IngestEvent> events(4);
    PhotoWatcher watcher(settingsFor(dir), ledger, events);

    const std::string photo = dir.file("fish.png");
    writeBytes(photo, "not really a png");
    writeBytes(dir.file("readme.txt"), "ignored");

    const auto t0 = PhotoWatcher::Clock::now();
    EXPECT_EQ(watcher.scanOnce(t0), 0u);
    EXPECT_EQ(watcher.scanOnce(t0 + 200ms), 0u);
    EXPECT_EQ(watcher.scanOnce(t0 + 600ms), 1u);
    EXPECT_EQ(watcher.scanOnce(t0 + 1200ms), 0u);
    EXPECT_EQ(watcher.scanOnce(t0 + 5000ms), 0u);

    IngestEvent ev;
    ASSERT_TRUE(events.tryPop(ev));
    EXPECT_EQ(ev.path, photo);
    EXPECT_FALSE(events.tryPop(ev));

    PhotoRecord rec;
    ASSERT_TRUE(ledger.find(photo, rec));
    EXPECT_EQ(rec.status, PhotoStatus::Pending);
    EXPECT_EQ(rec.mtime, ev.mtime);
    EXPECT_EQ(ledger.size(), 1u);
}

TEST(PhotoWatcher, GrowingFileRestartsDebounce) {
    TempDir dir;
    PhotoLedger ledger;
    BoundedQueue<IngestEvent> events(4);
    PhotoWatcher watcher(settingsFor(dir), ledger, events);

    const std::string photo = dir.file("slow.jpg");
    writeBytes(photo, "part");
    const auto t0 = PhotoWatcher::Clock::now();
    EXPECT_EQ(watcher.scanOnce(t0), 0u);

    writeBytes(photo, "partial write continues");
    EXPECT_EQ(watcher.scanOnce(t0 + 400ms), 0u);
    EXPECT_EQ(watcher.scanOnce(t0 + 700ms), 0u);
    EXPECT_EQ(watcher.scanOnce(t0 + 950ms), 1u);
}

TEST(PhotoWatcher, EmptyFileIsNotReported) {
    TempDir dir;
    PhotoLedger ledger;
    BoundedQueue<IngestEvent> events(4);
    PhotoWatcher watcher(settingsFor(dir), ledger, events);

    writeBytes(dir.file("empty.png"), "");
    const auto t0 = PhotoWatcher::Clock::now();
    EXPECT_EQ(watcher.scanOnce(t0), 0u);
    EXPECT_EQ(watcher.scanOnce(t0 + 2s), 0u);
    EXPECT_EQ(ledger.size(), 0u);
}

TEST(PhotoWatcher, NewTimestampIsReportedAgain) {
    TempDir dir;
    PhotoLedger ledger;
    BoundedQueue<IngestEvent> events(4);
    PhotoWatcher watcher(settingsFor(dir), ledger, events);

    const std::string photo = dir.file("fish.png");
    writeBytes(photo, "first");
    const auto t0 = PhotoWatcher::Clock::now();
    watcher.scanOnce(t0);
    ASSERT_EQ(watcher.scanOnce(t0 + 600ms), 1u);
    IngestEvent first;
    ASSERT_TRUE(events.tryPop(first));
    ledger.setStatus(photo, first.mtime, PhotoStatus::Rejected);

    fs::last_write_time(photo, fs::last_write_time(photo) + 5s);
    EXPECT_EQ(watcher.scanOnce(t0 + 700ms), 0u);
    EXPECT_EQ(watcher.scanOnce(t0 + 1300ms), 1u);

    IngestEvent second;
    ASSERT_TRUE(events.tryPop(second));
    EXPECT_NE(second.mtime, first.mtime);
    PhotoRecord rec;
    ASSERT_TRUE(ledger.find(photo, rec));
    EXPECT_EQ(rec.status, PhotoStatus::Pending);
    EXPECT_EQ(ledger.size(), 1u);
}

TEST(PhotoWatcher, FullQueueDefersUntilThereIsRoom) {
    TempDir dir;
    PhotoLedger ledger;
    BoundedQueue<IngestEvent> events(32);
    PhotoWatcher watcher(settingsFor(dir, 0, 32), ledger, events);

    const int kPhotos = 40;
    for (int i = 0; i < kPhotos; ++i) writeBytes(dir.file("p" + std::to_string(i) + ".png"), "x");

    auto now = PhotoWatcher::Clock::now();
    EXPECT_EQ(watcher.scanOnce(now), 32u);
    EXPECT_TRUE(events.full());
    EXPECT_EQ(ledger.count(PhotoStatus::Pending), 32u);

    std::set<std::string> delivered;
    IngestEvent ev;
    for (int pass = 0; pass < 10 && delivered.size() < static_cast<size_t>(kPhotos); ++pass) {
        for (int i = 0; i < 5 && events.tryPop(ev); ++i) delivered.insert(ev.path);
        now += 200ms;
        watcher.scanOnce(now);
    }
    while (events.tryPop(ev)) delivered.insert(ev.path);

    EXPECT_EQ(delivered.size(), static_cast<size_t>(kPhotos));
    EXPECT_EQ(ledger.size(), static_cast<size_t>(kPhotos));
    EXPECT_EQ(ledger.count(PhotoStatus::Pending), static_cast<size_t>(kPhotos));
    EXPECT_EQ(watcher.scanOnce(now + 1s), 0u);
}

TEST(PhotoWatcher, ThreadDeliversEvents) {
    TempDir dir;
    PhotoLedger ledger;
    BoundedQueue<IngestEvent> events(8);
    PhotoWatcher watcher(settingsFor(dir, 0), ledger, events);

    std::string error;
    ASSERT_TRUE(watcher.start(error)) << error;
    EXPECT_TRUE(watcher.running());
    writeBytes(dir.file("live.jpeg"), "bytes");

    IngestEvent ev;
    ASSERT_TRUE(events.popFor(ev, 5s));
    EXPECT_EQ(fs::path(ev.path).filename().string(), "live.jpeg");
    watcher.stop();
    EXPECT_FALSE(watcher.running());
    EXPECT_FALSE(events.tryPop(ev));
}

TEST(PhotoLedger, TracksStatusPerTimestamp) {
    PhotoLedger ledger;
    EXPECT_TRUE(ledger.shouldIngest("a.png", 1));
    EXPECT_TRUE(ledger.markPending("a.png", 1));
    EXPECT_FALSE(ledger.markPending("a.png", 1));
    EXPECT_FALSE(ledger.shouldIngest("a.png", 1));

    ledger.setStatus("a.png", 1, PhotoStatus::Accepted);
    EXPECT_EQ(ledger.count(PhotoStatus::Accepted), 1u);

    EXPECT_TRUE(ledger.markPending("a.png", 2));
    ledger.setStatus("a.png", 1, PhotoStatus::Rejected);
    PhotoRecord rec;
    ASSERT_TRUE(ledger.find("a.png", rec));
    EXPECT_EQ(rec.mtime, 2);
    EXPECT_EQ(rec.status, PhotoStatus::Pending);

    EXPECT_FALSE(ledger.find("b.png", rec));

    ledger.forget("a.png", 1);
    EXPECT_TRUE(ledger.find("a.png", rec));
    ledger.forget("a.png", 2);
    EXPECT_FALSE(ledger.find("a.png", rec));
    EXPECT_TRUE(ledger.markPending("a.png", 2));
    ledger.setStatus("a.png", 2, PhotoStatus::Accepted);
    ledger.forget("a.png", 2);
    EXPECT_TRUE(ledger.find("a.png", rec));
    EXPECT_STREQ(toString(PhotoStatus::Rejected), "rejected");
}
