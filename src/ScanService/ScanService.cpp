#include "ScanService.hpp"
#include "EncodingDecoder.hpp"
#include "Fingerprint.hpp"
#include "ScanTypesIO.hpp"
#include <chrono>
#include <climits>
#include <exception>
#include <iostream>

using nlohmann::json;
using SteadyClock = std::chrono::steady_clock;

#define TOOL_NAME "unknown"

namespace {

Severity highest_severity(const std::vector<Match>& matches) {
    Severity best = Severity::Medium;
    for (const auto& m : matches) {
        if (static_cast<int>(m.severity) < static_cast<int>(best)) best = m.severity;
    }
    return best;
}

} // namespace

ScanService::ScanService(ScanEngine& engine, const ConfigManager& config, ThreatLogger* audit)
    : engine_(engine), config_(config), audit_(audit) {}

std::string ScanService::contentText(const json& content) {
    if (content.is_string()) return content.get<std::string>();
    return content.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Desc: dispatch a request on its "op" field (default "scan")
// In: const json& request
// Out: json response
json ScanService::handle(const json& request) {
    if (!request.is_object()) return json{{"error", "request must be a JSON object"}};

    const std::string op = request.contains("op") && request["op"].is_string()
                               ? request["op"].get<std::string>() : "scan";
    if (op == "scan")        return scan(request);
    if (op == "health")      return health();
    if (op == "patterns")    return patterns();
    if (op == "cache_clear") return clear_cache();
    if (op == "stats") {
        int hours = 24;
        if (request.contains("hours")) {
            const json& h = request["hours"];
            long long value = -1;
            if (h.is_number_unsigned()) {
                const unsigned long long u = h.get<unsigned long long>();
                if (u <= static_cast<unsigned long long>(INT_MAX)) value = static_cast<long long>(u);
            } else if (h.is_number_integer()) {
                value = h.get<long long>();
            }
            if (value < 0 || value > INT_MAX) {
                return json{{"error", "'hours' must be an integer in 0.." + std::to_string(INT_MAX)}};
            }
            hours = static_cast<int>(value);
        }
        return stats(hours);
    }
    return json{{"error", "unknown op: " + op}};
}

json ScanService::scanError_(const ConfigManager& cfg, const std::string& what) {
    std::cerr << "[ScanService] scan failed: " << what << "\n";
    const bool allow = cfg.failOpen();
    const std::string action = allow ? "allow" : "block";
    if (audit_) audit_->log_scan(action, TOOL_NAME, "error", {}, 0);
    return json{
        {"action", action},
        {"reason", allow ? "scan error (fail open)" : "scan error (fail closed)"}
    };
}

// Desc: scan request content under the effective (base + request) config
// In: const json& request {content, features?, scan_tier?, source?}
// Out: json {action, reason?, severity?, matches?}
json ScanService::scan(const json& request) {
    const auto t0 = SteadyClock::now();

    if (!request.contains("content")) return json{{"error", "missing 'content'"}};

    ConfigManager cfg;
    if (!config_.applyOverrides(request, cfg)) {
        std::cerr << "[ScanService] invalid request overrides ignored\n";
    }

    if (!cfg.promptGuardEnabled()) {
        return json{{"action", "allow"}, {"reason", "prompt_guard disabled"}};
    }

    std::string source;
    if (request.contains("source") && request["source"].is_string()) {
        source = request["source"].get<std::string>();
    }
    if (cfg.isTrustedSource(source)) {
        return json{{"action", "allow"}, {"reason", "trusted source"}};
    }

    const std::string original = contentText(request["content"]);
    std::string content = original;

    size_t decoded_segments = 0;
    if (cfg.decodeBase64() && EncodingDecoder::has_encoding(content)) {
        for (const auto& f : EncodingDecoder::decode_and_scan(original)) {
            content += "\n" + f.decoded;
            ++decoded_segments;
        }
    }

    ScanOptions opts;
    opts.tier = cfg.scanTier();
    opts.use_cache = cfg.hashCache();
    opts.decode_content = cfg.decodeBase64();

    Verdict v;
    try {
        v = engine_.scan(content, opts);
    } catch (const std::exception& e) {
        return scanError_(cfg, e.what());
    }

    const uint64_t total_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - t0).count());

    std::string content_hash;
    if (!sha256_hex(original, content_hash, 16)) content_hash.clear();

    if (v.is_dangerous) {
        const std::string severity = severity_name(highest_severity(v.matches));
#ifdef DEBUG
        std::cerr << "[ScanService] blocked: " << v.matches.size() << " match(es)";
        if (decoded_segments) std::cerr << ", " << decoded_segments << " decoded segment(s)";
        std::cerr << "\n";
#endif
        if (audit_) {
            audit_->log_threat(severity, TOOL_NAME, v.matches, original, source);
            audit_->log_scan("block", TOOL_NAME, severity, v.matches, total_ms, content_hash, source);
        }
        return json{
            {"action",   "block"},
            {"reason",   "Potential prompt injection detected (" + std::to_string(v.matches.size()) +
                         " pattern(s) matched)"},
            {"severity", severity},
            {"matches",  v.matches}
        };
    }

    if (audit_) audit_->log_scan("allow", TOOL_NAME, "safe", {}, total_ms, content_hash, source);
    return json{{"action", "allow"}};
}

json ScanService::health() const {
    return json{
        {"status",  "ok"},
        {"service", kServiceName},
        {"version", kVersion},
        {"scanner", engine_.get_stats()}
    };
}

json ScanService::stats(int hours) const {
    json out = audit_ ? audit_->get_stats(hours) : json{{"period_hours", hours}};
    out["scanner"] = engine_.get_stats();
    return out;
}

json ScanService::patterns() const {
    const EngineStats s = engine_.get_stats();
    return json{
        {"patterns_loaded", s.patterns_loaded},
        {"ruleset_version", s.ruleset_version},
        {"cache_stats", {
            {"size",     s.cache_size},
            {"hits",     s.cache_hits},
            {"misses",   s.cache_misses},
            {"hit_rate", s.hit_rate_percent}
        }}
    };
}

json ScanService::clear_cache() {
    engine_.clear_cache();
    return json{{"status", "cleared"}, {"message", "Pattern cache cleared"}};
}
