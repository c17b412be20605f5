#include "ScanEngine.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

using SteadyClock = std::chrono::steady_clock;

ScanEngine::ScanEngine(const EngineOptions& opts)
    : cache_(opts.cache_capacity) {
    std::string err;
    if (!opts.catalog.checkIntegrity(err)) {
        throw std::runtime_error("[ScanEngine] pattern catalog integrity check failed: " + err);
    }

    catalog_ = opts.catalog.filterLanguages(opts.languages);
    ruleset_version_ = catalog_.rulesetVersion();
    matcher_ = std::make_unique<TieredMatcher>(catalog_);

    const PatternCounts loaded = matcher_->loadedCounts();
    if (loaded.critical == 0 || loaded.high == 0 || loaded.medium == 0) {
        throw std::runtime_error("[ScanEngine] a pattern tier has no usable patterns");
    }
    if (matcher_->rejectedCount() > 0) {
        std::cerr << "[ScanEngine] " << matcher_->rejectedCount() << " pattern(s) failed to compile\n";
    }
}

// Desc: scan content, consulting the result cache unless disabled
// In: const std::string& content, const ScanOptions& opts
// Out: Verdict (duration_ms measured for this call, hit or miss)
Verdict ScanEngine::scan(const std::string& content, const ScanOptions& opts) {
    const auto t0 = SteadyClock::now();
    const int tier = TieredMatcher::clampTier(opts.tier);

    auto compute = [&]() {
        CachedVerdict r;
        r.matches = matcher_->match(content, tier, opts.decode_content);
        r.is_dangerous = !r.matches.empty();
        return r;
    };

    CachedVerdict result;
    std::string key;
    if (opts.use_cache && ResultCache::fingerprint(content, opts.decode_content, tier, key)) {
        result = cache_.getOrCompute(key, compute);
    } else {
        if (opts.use_cache) std::cerr << "[ScanEngine] fingerprint failed, scanning uncached\n";
        result = compute();
    }

    Verdict v;
    v.is_dangerous = result.is_dangerous;
    v.matches = std::move(result.matches);
    v.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - t0).count());
    return v;
}

EngineStats ScanEngine::get_stats() const {
    EngineStats s;
    s.cache_size   = cache_.size();
    s.cache_hits   = cache_.hits();
    s.cache_misses = cache_.misses();
    const uint64_t total = s.cache_hits + s.cache_misses;
    if (total > 0) {
        const double pct = 100.0 * static_cast<double>(s.cache_hits) / static_cast<double>(total);
        s.hit_rate_percent = std::round(pct * 100.0) / 100.0;
    }
    s.patterns_loaded = matcher_->loadedCounts();
    s.ruleset_version = ruleset_version_;
    return s;
}

void ScanEngine::clear_cache() {
    cache_.clear();
}
