// photo_ledger.hpp
#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

enum class PhotoStatus { Pending, Accepted, Rejected };

const char* toString(PhotoStatus status);

struct PhotoRecord {
    std::string path;
    int64_t mtime = 0;  // file clock ticks
    PhotoStatus status = PhotoStatus::Pending;
};

// Every photo the watcher has handed out, keyed by path. Records are never
// removed so an unchanged file is not processed twice.
class PhotoLedger {
public:
    bool shouldIngest(const std::string& path, int64_t mtime) const;

    // Creates or resets the record to Pending. False if (path, mtime) is already known.
    bool markPending(const std::string& path, int64_t mtime);

    // Drops a Pending record for exactly (path, mtime) so the next scan offers it again.
    void forget(const std::string& path, int64_t mtime);

    // Ignored when the record has moved on to a newer mtime.
    void setStatus(const std::string& path, int64_t mtime, PhotoStatus status);

    bool find(const std::string& path, PhotoRecord& out) const;
    size_t size() const;
    size_t count(PhotoStatus status) const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, PhotoRecord> records_;
};
