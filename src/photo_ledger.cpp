// photo_ledger.cpp
#include "photo_ledger.hpp"

const char* toString(PhotoStatus status) {
    switch (status) {
        case PhotoStatus::Pending:  return "pending";
        case PhotoStatus::Accepted: return "accepted";
        case PhotoStatus::Rejected: return "rejected";
    }
    return "?";
}

bool PhotoLedger::shouldIngest(const std::string& path, int64_t mtime) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = records_.find(path);
    return it == records_.end() || it->second.mtime != mtime;
}

bool PhotoLedger::markPending(const std::string& path, int64_t mtime) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = records_.find(path);
    if (it != records_.end() && it->second.mtime == mtime) return false;
    PhotoRecord& rec = records_[path];
    rec.path = path;
    rec.mtime = mtime;
    rec.status = PhotoStatus::Pending;
    return true;
}

void PhotoLedger::forget(const std::string& path, int64_t mtime) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = records_.find(path);
    if (it != records_.end() && it->second.mtime == mtime && it->second.status == PhotoStatus::Pending)
        records_.erase(it);
}

void PhotoLedger::setStatus(const std::string& path, int64_t mtime, PhotoStatus status) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = records_.find(path);
    if (it == records_.end() || it->second.mtime != mtime) return;
    it->second.status = status;
}

bool PhotoLedger::find(const std::string& path, PhotoRecord& out) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = records_.find(path);
    if (it == records_.end()) return false;
    out = it->second;
    return true;
}

size_t PhotoLedger::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return records_.size();
}

size_t PhotoLedger::count(PhotoStatus status) const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t n = 0;
    for (const auto& kv : records_)
        if (kv.second.status == status) ++n;
    return n;
}
