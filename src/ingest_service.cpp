// ingest_service.cpp
#include "ingest_service.hpp"
#include "log.hpp"

#include <chrono>
#include <exception>

IngestService::IngestService(const AquariumConfig& config, std::unique_ptr<ImageDecoder> decoder)
: config_(config),
  decoder_(decoder ? std::move(decoder) : std::make_unique<PhotoDecoder>()),
  extractor_(config),
  events_(config.watcher.eventQueueCapacity),
  sprites_(config.watcher.spriteQueueCapacity),
  watcher_(config.watcher, ledger_, events_) {}

IngestService::~IngestService() {
    stop();
}

bool IngestService::start(std::string& error) {
    if (running_.load()) return true;
    running_.store(true);
    worker_ = std::thread(&IngestService::workerLoop, this);
    if (!watcher_.start(error)) {
        running_.store(false);
        events_.close();
        if (worker_.joinable()) worker_.join();
        return false;
    }
    return true;
}

void IngestService::stop() {
    if (!running_.exchange(false)) return;
    watcher_.stop();
    events_.close();
    if (worker_.joinable()) worker_.join();
    sprites_.close();
    sprites_.clear();
    PF_LOG_INFO("ingest", "stopped; " << ledger_.count(PhotoStatus::Accepted) << " accepted, "
                << ledger_.count(PhotoStatus::Rejected) << " rejected");
}

size_t IngestService::drainCompleted(size_t maxItems, std::vector<FishSpritePtr>& out) {
    size_t n = 0;
    FishSpritePtr sprite;
    while (n < maxItems && sprites_.tryPop(sprite)) {
        out.push_back(std::move(sprite));
        ++n;
    }
    return n;
}

ExtractionResult IngestService::process(const IngestEvent& event) const {
    cv::Mat photo;
    bool decoded = false;
    try {
        decoded = decoder_->decode(event.path, photo);
    } catch (const cv::Exception& e) {
        PF_LOG_WARN("ingest", "decoder error on " << event.path << ": " << e.what());
    }
    if (!decoded) {
        ExtractionResult r;
        r.status = ScanStatus::DecodeFailed;
        return r;
    }
    return extractor_.extract(photo, event.path, event.mtime);
}

void IngestService::workerLoop() {
    IngestEvent event;
    while (running_.load()) {
        if (!events_.popFor(event, std::chrono::milliseconds(100))) continue;

        const auto t0 = std::chrono::steady_clock::now();
        ExtractionResult result;
        try {
            result = process(event);
        } catch (const std::exception& e) {
            result = ExtractionResult();
            result.status = ScanStatus::PipelineError;
            result.detail = e.what();
        }
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - t0).count();

        if (!running_.load()) break;

        if (!result.ok()) {
            ledger_.setStatus(event.path, event.mtime, PhotoStatus::Rejected);
            PF_LOG_WARN("ingest", "rejected " << event.path << ": " << toString(result.status)
                        << (result.detail.empty() ? "" : " (" + result.detail + ")"));
            continue;
        }

        ledger_.setStatus(event.path, event.mtime, PhotoStatus::Accepted);
        PF_LOG_INFO("ingest", "accepted " << event.path << " -> " << result.sprite->width() << "x"
                    << result.sprite->height() << " sprite in " << ms << "ms");

        // the render thread drains at its own pace; wait for room rather than lose the sprite
        FishSpritePtr sprite = result.sprite;
        while (running_.load() && !sprites_.pushFor(sprite, std::chrono::milliseconds(100))) {}
    }
}
