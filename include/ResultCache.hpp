#pragma once
#include "ScanTypes.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Stored outcome of one scan; duration is measured per call, not cached.
struct CachedVerdict {
    bool               is_dangerous{false};
    std::vector<Match> matches;
};

// Bounded fingerprint -> verdict map. Eviction drops the oldest inserted entry.
class ResultCache {
public:
    static constexpr size_t kDefaultCapacity = 10000;
    static constexpr size_t kFingerprintHexChars = 16;

    explicit ResultCache(size_t capacity = kDefaultCapacity);

    // sha256(content + ":decode=" + flag + ":tier=" + tier), first 16 hex chars.
    static bool fingerprint(const std::string& content, bool decode, int tier, std::string& out);

    // Returns the cached verdict (hit) or runs compute once and stores it (miss).
    // Callers arriving while the same key is being computed wait for it and count as hits.
    CachedVerdict getOrCompute(const std::string& key, const std::function<CachedVerdict()>& compute);

    void clear();   // entries and counters

    size_t   size()     const;
    size_t   capacity() const { return capacity_; }
    uint64_t hits()     const { return hits_.load(); }
    uint64_t misses()   const { return misses_.load(); }

private:
    void insertLocked_(const std::string& key, const CachedVerdict& v);

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, CachedVerdict> map_;
    std::deque<std::string> order_;   // insertion order, oldest first
    std::unordered_map<std::string, std::shared_future<CachedVerdict>> inflight_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    size_t capacity_;
};
