// ingest_service.hpp
#pragma once
#include "aquarium_config.hpp"
#include "bounded_queue.hpp"
#include "fish_extractor.hpp"
#include "image_decoder.hpp"
#include "photo_ledger.hpp"
#include "photo_watcher.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Background half of the aquarium: the watcher thread finds photos, the
// extraction thread turns them into sprites. The render thread only ever
// sees finished sprites through drainCompleted().
class IngestService {
public:
    explicit IngestService(const AquariumConfig& config,
                           std::unique_ptr<ImageDecoder> decoder = nullptr);
    ~IngestService();

    IngestService(const IngestService&) = delete;
    IngestService& operator=(const IngestService&) = delete;

    bool start(std::string& error);
    // Joins both threads; extractions still running are discarded.
    void stop();
    bool running() const { return running_.load(); }

    // Non-blocking; moves at most maxItems sprites into out.
    size_t drainCompleted(size_t maxItems, std::vector<FishSpritePtr>& out);

    // Decode and extract one photo on the calling thread.
    ExtractionResult process(const IngestEvent& event) const;

    const PhotoLedger& ledger() const { return ledger_; }
    size_t pendingEvents() const { return events_.size(); }
    size_t pendingSprites() const { return sprites_.size(); }

private:
    void workerLoop();

    AquariumConfig config_;
    std::unique_ptr<ImageDecoder> decoder_;
    FishExtractor extractor_;
    PhotoLedger ledger_;
    BoundedQueue<IngestEvent> events_;
    BoundedQueue<FishSpritePtr> sprites_;
    PhotoWatcher watcher_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};
