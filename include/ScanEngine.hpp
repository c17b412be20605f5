#pragma once
#include "PatternCatalog.hpp"
#include "ResultCache.hpp"
#include "ScanTypes.hpp"
#include "TieredMatcher.hpp"
#include <memory>
#include <string>
#include <vector>

struct EngineOptions {
    PatternCatalog           catalog{PatternCatalog::builtin()};
    std::vector<std::string> languages;          // empty or "*" = every language
    size_t                   cache_capacity{ResultCache::kDefaultCapacity};
};

// Cache-fronted scan orchestrator. Safe to share between threads.
class ScanEngine {
public:
    // Throws std::runtime_error if the catalog fails its integrity check or
    // a tier ends up with no compiled pattern.
    explicit ScanEngine(const EngineOptions& opts = EngineOptions());

    Verdict scan(const std::string& content, const ScanOptions& opts = ScanOptions());

    EngineStats get_stats() const;
    void clear_cache();

    const std::string& rulesetVersion() const { return ruleset_version_; }
    const PatternCatalog& catalog() const { return catalog_; }

private:
    PatternCatalog                 catalog_;        // after language filtering
    std::string                    ruleset_version_;
    std::unique_ptr<TieredMatcher> matcher_;
    ResultCache                    cache_;
};
