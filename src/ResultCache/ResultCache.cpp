#include "ResultCache.hpp"
#include "Fingerprint.hpp"
#include <exception>
#include <mutex>

ResultCache::ResultCache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ResultCache::fingerprint(const std::string& content, bool decode, int tier, std::string& out) {
    const std::string material = content + ":decode=" + (decode ? "True" : "False") +
                                 ":tier=" + std::to_string(tier);
    return sha256_hex(material, out, kFingerprintHexChars);
}

void ResultCache::insertLocked_(const std::string& key, const CachedVerdict& v) {
    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second = v;   // keeps its place in order_
        return;
    }
    while (map_.size() >= capacity_ && !order_.empty()) {
        map_.erase(order_.front());
        order_.pop_front();
    }
    map_.emplace(key, v);
    order_.push_back(key);
}

// Desc: cache lookup with compute-once on miss
// In: const std::string& key, const std::function<CachedVerdict()>& compute
// Out: CachedVerdict (rethrows if compute throws; nothing is stored then)
CachedVerdict ResultCache::getOrCompute(const std::string& key, const std::function<CachedVerdict()>& compute) {
    {
        std::shared_lock rlk(mu_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            hits_.fetch_add(1);
            return it->second;
        }
    }

    std::promise<CachedVerdict> promise;
    {
        std::unique_lock wlk(mu_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            hits_.fetch_add(1);
            return it->second;
        }
        auto inf = inflight_.find(key);
        if (inf != inflight_.end()) {
            std::shared_future<CachedVerdict> pending = inf->second;
            hits_.fetch_add(1);
            wlk.unlock();
            return pending.get();
        }
        misses_.fetch_add(1);
        inflight_.emplace(key, promise.get_future().share());
    }

    CachedVerdict v;
    try {
        v = compute();
    } catch (...) {
        {
            std::unique_lock wlk(mu_);
            inflight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::unique_lock wlk(mu_);
        insertLocked_(key, v);
        inflight_.erase(key);
    }
    promise.set_value(v);
    return v;
}

void ResultCache::clear() {
    std::unique_lock wlk(mu_);
    map_.clear();
    order_.clear();
    hits_.store(0);
    misses_.store(0);
}

size_t ResultCache::size() const {
    std::shared_lock rlk(mu_);
    return map_.size();
}
