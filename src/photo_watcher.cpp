// photo_watcher.cpp
#include "photo_watcher.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace fs = std::filesystem;

PhotoWatcher::PhotoWatcher(const WatcherSettings& settings, PhotoLedger& ledger, BoundedQueue<IngestEvent>& events)
: settings_(settings), ledger_(ledger), events_(events) {}

PhotoWatcher::~PhotoWatcher() {
    stop();
}

bool PhotoWatcher::isSupportedImage(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".heic";
}

bool PhotoWatcher::open(std::string& error) {
    std::error_code ec;
    const fs::path dir(settings_.photosDir);
    if (!fs::is_directory(dir, ec)) {
        error = "photo directory '" + settings_.photosDir + "' does not exist or is not a directory";
        return false;
    }
    fs::directory_iterator it(dir, ec);
    if (ec) {
        error = "cannot list photo directory '" + settings_.photosDir + "': " + ec.message();
        return false;
    }
    return true;
}

bool PhotoWatcher::start(std::string& error) {
    if (running_.load()) return true;
    if (!open(error)) return false;
    running_.store(true);
    thread_ = std::thread(&PhotoWatcher::run, this);
    PF_LOG_INFO("watcher", "watching " << settings_.photosDir << " every " << settings_.pollIntervalMs
                << "ms, debounce " << settings_.debounceMs << "ms");
    return true;
}

void PhotoWatcher::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(wakeMtx_);
    }
    wakeCv_.notify_all();
    if (thread_.joinable()) thread_.join();
    PF_LOG_INFO("watcher", "stopped");
}

void PhotoWatcher::run() {
    const auto interval = std::chrono::milliseconds(settings_.pollIntervalMs);
    while (running_.load()) {
        scanOnce(Clock::now());
        std::unique_lock<std::mutex> lock(wakeMtx_);
        wakeCv_.wait_for(lock, interval, [&] { return !running_.load(); });
    }
}

size_t PhotoWatcher::scanOnce(Clock::time_point now) {
    std::error_code ec;
    fs::directory_iterator it(settings_.photosDir, ec);
    if (ec) {
        if (!listErrorReported_) {
            PF_LOG_ERROR("watcher", "cannot list " << settings_.photosDir << ": " << ec.message());
            listErrorReported_ = true;
        }
        return 0;
    }
    listErrorReported_ = false;

    const auto debounce = std::chrono::milliseconds(settings_.debounceMs);
    std::set<std::string> present;
    size_t emitted = 0;
    size_t deferred = 0;

    for (const fs::directory_entry& entry : it) {
        std::error_code fec;
        if (!entry.is_regular_file(fec) || !isSupportedImage(entry.path())) continue;
        const auto writeTime = entry.last_write_time(fec);
        if (fec) continue;
        const uintmax_t size = entry.file_size(fec);
        if (fec) continue;

        const std::string path = entry.path().string();
        const int64_t mtime = static_cast<int64_t>(writeTime.time_since_epoch().count());
        present.insert(path);

        auto found = candidates_.find(path);
        if (found == candidates_.end()) {
            found = candidates_.emplace(path, Candidate{mtime, size, now}).first;
        } else if (found->second.mtime != mtime || found->second.size != size) {
            found->second = Candidate{mtime, size, now};
        }

        const Candidate& c = found->second;
        if (now - c.lastChange < debounce || c.size == 0) continue;
        if (!ledger_.markPending(path, mtime)) continue;

        // a full queue defers the photo to a later pass instead of losing it
        IngestEvent event{path, mtime};
        if (!events_.tryPush(event)) {
            ledger_.forget(path, mtime);
            ++deferred;
            continue;
        }
        PF_LOG_DEBUG("watcher", "queued " << path);
        ++emitted;
    }
    if (deferred > 0)
        PF_LOG_DEBUG("watcher", "event queue full, " << deferred << " photos deferred to the next scan");

    for (auto c = candidates_.begin(); c != candidates_.end();) {
        if (present.count(c->first) == 0) c = candidates_.erase(c);
        else ++c;
    }
    return emitted;
}
