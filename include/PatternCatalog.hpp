// include/PatternCatalog.hpp
#pragma once
#include "ScanTypes.hpp"
#include <array>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

struct Pattern {
    std::string expression;
    Severity    severity{Severity::Medium};
    std::string category;
    std::string language{"en"};
};

// Tiered, versioned rule table. Tiers are fixed by each rule's severity.
class PatternCatalog {
public:
    static constexpr size_t kMinCritical = 25;
    static constexpr size_t kMinHigh     = 40;
    static constexpr size_t kMinMedium   = 25;
    static constexpr size_t kMinTotal    = 90;

    static PatternCatalog builtin();

    void add(const Pattern& p);

    // Appends rules from a {"critical": [...], "high": [...], "medium": [...]} object.
    // Items are expression strings or {"expression", "category", "language"} objects.
    bool addCustomFromJson(const nlohmann::json& j, std::string& error);

    const std::vector<Pattern>& tier(Severity s) const { return tiers_[static_cast<size_t>(s)]; }
    PatternCounts counts() const;

    // Load-time sanity check against a truncated or mispackaged rule table.
    bool checkIntegrity(std::string& error) const;

    // Keeps rules whose language is listed; empty list or "*" keeps all.
    // The critical tier is always kept whole.
    PatternCatalog filterLanguages(const std::vector<std::string>& languages) const;

    std::string canonicalRulesJson() const;
    std::string rulesetVersion() const;

private:
    std::array<std::vector<Pattern>, kTierCount> tiers_;
};
