// photo_watcher.hpp
#pragma once
#include "aquarium_config.hpp"
#include "bounded_queue.hpp"
#include "photo_ledger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

struct IngestEvent {
    std::string path;
    int64_t mtime = 0;
};

// Polls the photo directory on its own thread. A file is reported once its
// size and timestamp have been stable for the debounce window, so one
// completed write yields one event.
class PhotoWatcher {
public:
    using Clock = std::chrono::steady_clock;

    PhotoWatcher(const WatcherSettings& settings, PhotoLedger& ledger, BoundedQueue<IngestEvent>& events);
    ~PhotoWatcher();

    PhotoWatcher(const PhotoWatcher&) = delete;
    PhotoWatcher& operator=(const PhotoWatcher&) = delete;

    // Fails when the directory is missing or cannot be listed.
    bool open(std::string& error);
    bool start(std::string& error);
    void stop();
    bool running() const { return running_.load(); }

    // One polling pass; returns the number of events emitted.
    size_t scanOnce(Clock::time_point now);

    static bool isSupportedImage(const std::filesystem::path& path);

private:
    struct Candidate {
        int64_t mtime = 0;
        uintmax_t size = 0;
        Clock::time_point lastChange;
    };

    void run();

    WatcherSettings settings_;
    PhotoLedger& ledger_;
    BoundedQueue<IngestEvent>& events_;
    std::map<std::string, Candidate> candidates_;
    bool listErrorReported_ = false;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wakeMtx_;
    std::condition_variable wakeCv_;
};
