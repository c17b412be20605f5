#pragma once
#include "PatternCatalog.hpp"
#include "PatternMatcherHS.hpp"
#include "ScanTypes.hpp"
#include <array>
#include <string>
#include <vector>

// Runs the catalog tiers over every content variant and merges the hits.
class TieredMatcher {
public:
    static constexpr size_t kPatternPreview = 50;

    // Throws std::runtime_error if a tier database cannot be built.
    explicit TieredMatcher(const PatternCatalog& catalog);

    // Matches for content at requested_tier (0..2, clamped). With
    // scan_variants the decoded and markdown-stripped views are scanned too.
    std::vector<Match> match(const std::string& content, int requested_tier, bool scan_variants) const;

    // Tiers 0..requested_tier over one view, plus the escalation rule.
    std::vector<Match> scanVariant(const std::string& variant, int requested_tier) const;

    // A critical hit under tier 0 also runs the high tier.
    static bool escalates(int requested_tier, bool critical_hit) {
        return requested_tier == 0 && critical_hit;
    }
    static int clampTier(int tier);

    PatternCounts loadedCounts() const;
    size_t rejectedCount() const;

private:
    std::array<PatternMatcherHS, kTierCount> tiers_;

    void scanTier_(Severity s, const std::string& lowered, std::vector<Match>& out) const;
};
