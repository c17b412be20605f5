#include "TieredMatcher.hpp"
#include "ContentNormalizer.hpp"
#include <set>
#include <stdexcept>
#include <tuple>
#include <utility>

TieredMatcher::TieredMatcher(const PatternCatalog& catalog) {
    for (int t = 0; t < kTierCount; ++t) {
        const Severity s = static_cast<Severity>(t);
        if (!tiers_[t].build(catalog.tier(s))) {
            throw std::runtime_error(std::string("[TieredMatcher] failed to build ") +
                                     severity_name(s) + " tier");
        }
    }
}

int TieredMatcher::clampTier(int tier) {
    if (tier < 0) return 0;
    if (tier > kTierCount - 1) return kTierCount - 1;
    return tier;
}

void TieredMatcher::scanTier_(Severity s, const std::string& lowered, std::vector<Match>& out) const {
    const PatternMatcherHS& m = tiers_[static_cast<size_t>(s)];
    for (size_t idx : m.scan(lowered)) {
        const Pattern& p = m.compiled()[idx].pattern;
        Match match;
        match.pattern  = ContentNormalizer::truncate_utf8(p.expression, kPatternPreview);
        match.severity = s;
        match.category = p.category;
        match.language = p.language;
        out.push_back(std::move(match));
    }
}

// Desc: scan one content view through the tiers allowed by requested_tier
// In: const std::string& variant, int requested_tier
// Out: std::vector<Match> (critical first, then high, then medium)
std::vector<Match> TieredMatcher::scanVariant(const std::string& variant, int requested_tier) const {
    const int tier = clampTier(requested_tier);
    const std::string lowered = ContentNormalizer::ascii_lower(variant);

    std::vector<Match> out;
    scanTier_(Severity::Critical, lowered, out);
    const bool critical_hit = !out.empty();

    if (tier >= 1 || escalates(tier, critical_hit)) scanTier_(Severity::High, lowered, out);
    if (tier >= 2) scanTier_(Severity::Medium, lowered, out);

    return out;
}

// Desc: match the original, decoded and markdown-stripped views, deduplicated
// In: const std::string& content, int requested_tier, bool scan_variants
// Out: std::vector<Match> (first occurrence of each (pattern, severity, category) kept)
std::vector<Match> TieredMatcher::match(const std::string& content, int requested_tier, bool scan_variants) const {
    const std::string original = ContentNormalizer::sanitize_utf8(content);

    struct View { std::string text; bool decoded; bool stripped; };
    std::vector<View> views;
    views.push_back(View{original, false, false});
    if (scan_variants) {
        std::string decoded = ContentNormalizer::fully_decode(original);
        if (decoded != original) views.push_back(View{std::move(decoded), true, false});
        std::string stripped = ContentNormalizer::strip_markdown(original);
        if (stripped != original) views.push_back(View{std::move(stripped), false, true});
    }

    std::vector<Match> result;
    std::set<std::tuple<std::string, int, std::string>> seen;
    for (const auto& v : views) {
        for (auto& m : scanVariant(v.text, requested_tier)) {
            auto key = std::make_tuple(m.pattern, static_cast<int>(m.severity), m.category);
            if (!seen.insert(key).second) continue;
            m.decoded = v.decoded;
            m.markdown_stripped = v.stripped;
            result.push_back(std::move(m));
        }
    }
    return result;
}

PatternCounts TieredMatcher::loadedCounts() const {
    PatternCounts c;
    c.critical = tiers_[0].patternCount();
    c.high     = tiers_[1].patternCount();
    c.medium   = tiers_[2].patternCount();
    return c;
}

size_t TieredMatcher::rejectedCount() const {
    size_t n = 0;
    for (const auto& t : tiers_) n += t.rejectedCount();
    return n;
}
