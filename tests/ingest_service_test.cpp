#include "ingest_service.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace testing_support;
using namespace std::chrono_literals;

namespace {

// Hands out the same image for every path.
class FixedDecoder : public ImageDecoder {
public:
    explicit FixedDecoder(cv::Mat image) : image_(std::move(image)) {}
    bool decode(const std::string&, cv::Mat& bgr) const override {
        bgr = image_.clone();
        return true;
    }

private:
    cv::Mat image_;
};

class ThrowingDecoder : public ImageDecoder {
public:
    bool decode(const std::string&, cv::Mat&) const override {
        throw std::runtime_error("decoder out of memory");
    }
};

void touch(const std::string& path) {
    std::ofstream out(path, std::ios::binary);
    out << "photo";
}

class IngestServiceTest : public ::testing::Test {
protected:
    IngestServiceTest() {
        cfg.watcher.photosDir = photos.path().string();
        cfg.watcher.pollIntervalMs = 20;
        cfg.watcher.debounceMs = 0;
    }

    template <typename Pred>
    bool waitFor(Pred pred, std::chrono::milliseconds limit = 10s) {
        const auto end = std::chrono::steady_clock::now() + limit;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > end) return false;
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }

    TempDir photos;
    AquariumConfig cfg;
};

}

TEST_F(IngestServiceTest, SlowConsumerLosesNoSprites) {
    cfg.watcher.spriteQueueCapacity = 2;
    IngestService ingest(cfg, std::make_unique<FixedDecoder>(makeTemplate(cfg)));
    std::string error;
    ASSERT_TRUE(ingest.start(error)) << error;

    const size_t kPhotos = 5;
    for (size_t i = 0; i < kPhotos; ++i) touch(photos.file("fish" + std::to_string(i) + ".jpg"));

    // nothing is drained yet, so the worker has to hold back
    ASSERT_TRUE(waitFor([&] { return ingest.pendingSprites() == 2; }));
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(ingest.pendingSprites(), 2u);

    std::vector<FishSpritePtr> sprites;
    ASSERT_TRUE(waitFor([&] {
        ingest.drainCompleted(1, sprites);
        EXPECT_LE(ingest.pendingSprites(), 2u);
        return sprites.size() == kPhotos;
    }));
    EXPECT_EQ(ingest.ledger().count(PhotoStatus::Accepted), kPhotos);
    for (const FishSpritePtr& s : sprites) ASSERT_NE(s, nullptr);
    ingest.stop();
    EXPECT_FALSE(ingest.running());
}

TEST_F(IngestServiceTest, StopReleasesWorkerBlockedOnFullQueue) {
    cfg.watcher.spriteQueueCapacity = 1;
    IngestService ingest(cfg, std::make_unique<FixedDecoder>(makeTemplate(cfg)));
    std::string error;
    ASSERT_TRUE(ingest.start(error)) << error;
    for (int i = 0; i < 3; ++i) touch(photos.file("fish" + std::to_string(i) + ".png"));
    ASSERT_TRUE(waitFor([&] { return ingest.ledger().count(PhotoStatus::Accepted) >= 2; }));

    const auto t0 = std::chrono::steady_clock::now();
    ingest.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 3s);
    EXPECT_EQ(ingest.pendingSprites(), 0u);
}

TEST_F(IngestServiceTest, DecoderExceptionRejectsPhotoOnly) {
    IngestService ingest(cfg, std::make_unique<ThrowingDecoder>());
    std::string error;
    ASSERT_TRUE(ingest.start(error)) << error;
    const std::string path = photos.file("cursed.png");
    touch(path);

    ASSERT_TRUE(waitFor([&] { return ingest.ledger().count(PhotoStatus::Rejected) == 1; }));
    EXPECT_TRUE(ingest.running());
    PhotoRecord rec;
    ASSERT_TRUE(ingest.ledger().find(path, rec));
    EXPECT_EQ(rec.status, PhotoStatus::Rejected);

    touch(photos.file("second.png"));
    EXPECT_TRUE(waitFor([&] { return ingest.ledger().count(PhotoStatus::Rejected) == 2; }));
    std::vector<FishSpritePtr> sprites;
    EXPECT_EQ(ingest.drainCompleted(10, sprites), 0u);
}

TEST_F(IngestServiceTest, StartFailsWithoutPhotoDirectory) {
    cfg.watcher.photosDir = photos.file("missing");
    IngestService ingest(cfg);
    std::string error;
    EXPECT_FALSE(ingest.start(error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(ingest.running());
}
