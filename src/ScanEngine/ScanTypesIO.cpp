#include "ScanTypesIO.hpp"

using nlohmann::json;

void to_json(json& j, const Match& m) {
    j = json{
        {"pattern",  m.pattern},
        {"severity", severity_name(m.severity)},
        {"category", m.category},
        {"language", m.language}
    };
    if (m.decoded)           j["decoded"] = true;
    if (m.markdown_stripped) j["markdown_stripped"] = true;
}

void to_json(json& j, const Verdict& v) {
    j = json{
        {"is_dangerous", v.is_dangerous},
        {"matches",      v.matches},
        {"duration_ms",  v.duration_ms}
    };
}

void to_json(json& j, const PatternCounts& c) {
    j = json{
        {"critical", c.critical},
        {"high",     c.high},
        {"medium",   c.medium},
        {"total",    c.total()}
    };
}

void to_json(json& j, const EngineStats& s) {
    j = json{
        {"cache_size",       s.cache_size},
        {"cache_hits",       s.cache_hits},
        {"cache_misses",     s.cache_misses},
        {"hit_rate_percent", s.hit_rate_percent},
        {"patterns_loaded",  s.patterns_loaded},
        {"ruleset_version",  s.ruleset_version}
    };
}
