#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class Severity : uint8_t { Critical = 0, High = 1, Medium = 2 };

const char* severity_name(Severity s);
bool parse_severity(const std::string& name, Severity& out);

// Catalog tiers are indexed by severity.
constexpr int kTierCount = 3;

struct Match {
    std::string pattern;          // expression, truncated to 50 code points
    Severity    severity{Severity::Medium};
    std::string category;
    std::string language{"en"};
    bool        decoded{false};
    bool        markdown_stripped{false};
};

struct Verdict {
    bool               is_dangerous{false};
    std::vector<Match> matches;
    uint64_t           duration_ms{0};
};

struct ScanOptions {
    int  tier{1};                 // 0=critical, 1=+high, 2=+medium
    bool use_cache{true};
    bool decode_content{true};
};

struct PatternCounts {
    size_t critical{0};
    size_t high{0};
    size_t medium{0};
    size_t total() const { return critical + high + medium; }
};

struct EngineStats {
    size_t        cache_size{0};
    uint64_t      cache_hits{0};
    uint64_t      cache_misses{0};
    double        hit_rate_percent{0.0};
    PatternCounts patterns_loaded;
    std::string   ruleset_version;
};
