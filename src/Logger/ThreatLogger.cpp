// === src/Logger/ThreatLogger.cpp ===
#include "ThreatLogger.hpp"
#include "Fingerprint.hpp"
#include "ScanTypesIO.hpp"
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>

using nlohmann::json;

#define SCANS_FILE   "promptguard-scans.jsonl"
#define THREATS_FILE "promptguard-threats.jsonl"
#define SUMMARY_FILE "promptguard-summary.json"

namespace {

std::vector<std::string> categories_of(const std::vector<Match>& matches) {
    std::set<std::string> cats;
    for (const auto& m : matches) cats.insert(m.category);
    return std::vector<std::string>(cats.begin(), cats.end());
}

// Desc: call fn(entry) for each parseable line with a timestamp at or after cutoff
// In: const std::string& path, std::time_t cutoff, Fn fn
// Out: void
template <typename Fn>
void for_each_recent(const std::string& path, std::time_t cutoff, Fn fn) {
    std::ifstream in(path);
    if (!in.is_open()) return;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        json entry = json::parse(line, nullptr, false);
        if (entry.is_discarded() || !entry.is_object()) continue;
        if (!entry.contains("timestamp") || !entry["timestamp"].is_string()) continue;
        std::time_t ts = 0;
        if (!ThreatLogger::parseIso(entry["timestamp"].get<std::string>(), ts)) continue;
        if (ts < cutoff) continue;
        fn(entry);
    }
}

} // namespace

ThreatLogger::ThreatLogger(const std::string& log_dir)
    : log_dir_(log_dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "[ThreatLogger] cannot create log dir " << log_dir_ << ": " << ec.message() << "\n";
    }
    const fs::path dir(log_dir_);
    scans_path_   = (dir / SCANS_FILE).string();
    threats_path_ = (dir / THREATS_FILE).string();
    summary_path_ = (dir / SUMMARY_FILE).string();
    ready_ = !ec;
}

// Desc: ISO-8601 local timestamp with microseconds
// In: none
// Out: std::string
std::string ThreatLogger::nowIso() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    localtime_r(&secs, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char frac[16];
    std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(micros));
    return std::string(buf) + frac;
}

bool ThreatLogger::parseIso(const std::string& ts, std::time_t& out) {
    std::tm tm{};
    const char* end = ::strptime(ts.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (!end) return false;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return false;
    out = t;
    return true;
}

bool ThreatLogger::append_(const std::string& path, const json& entry) {
    const std::string line = entry.dump() + "\n";
    std::lock_guard<std::mutex> lk(mu_);
    FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
        std::cerr << "[ThreatLogger] cannot open " << path << ": " << std::strerror(errno) << "\n";
        return false;
    }
    const size_t written = std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
    if (written != line.size()) {
        std::cerr << "[ThreatLogger] short write to " << path << "\n";
        return false;
    }
    return true;
}

bool ThreatLogger::log_scan(const std::string& action, const std::string& tool_name,
                            const std::string& severity, const std::vector<Match>& matches,
                            uint64_t duration_ms, const std::string& content_hash,
                            const std::string& source) {
    json entry = {
        {"timestamp",     nowIso()},
        {"action",        action},
        {"tool_name",     tool_name},
        {"severity",      severity},
        {"pattern_count", matches.size()},
        {"duration_ms",   duration_ms}
    };
    if (!content_hash.empty()) entry["content_hash"] = content_hash;
    if (!source.empty())       entry["source"] = source;
    if (!matches.empty())      entry["categories"] = categories_of(matches);
    return append_(scans_path_, entry);
}

bool ThreatLogger::log_threat(const std::string& severity, const std::string& tool_name,
                              const std::vector<Match>& matches, const std::string& content,
                              const std::string& source) {
    std::string hash;
    if (!sha256_hex(content, hash, 16)) {
        std::cerr << "[ThreatLogger] content hash failed\n";
        hash.clear();
    }
    json entry = {
        {"timestamp",    nowIso()},
        {"severity",     severity},
        {"tool",         tool_name},
        {"patterns",     matches},
        {"categories",   categories_of(matches)},
        {"content_hash", hash}
    };
    if (!source.empty()) entry["source"] = source;
    return append_(threats_path_, entry);
}

// Desc: aggregate scan and threat records newer than now - hours
// In: int hours
// Out: json {period_hours, total_scans, blocked, allowed, total_threats, by_severity, by_category, by_tool}
json ThreatLogger::get_stats(int hours) const {
    const std::time_t cutoff = std::time(nullptr) - static_cast<std::time_t>(hours) * 3600;

    uint64_t total = 0, blocked = 0, allowed = 0, threats = 0;
    std::map<std::string, uint64_t> by_severity, by_category, by_tool;

    std::lock_guard<std::mutex> lk(mu_);
    for_each_recent(scans_path_, cutoff, [&](const json& e) {
        ++total;
        const std::string action = e.value("action", "");
        if (action == "block") ++blocked;
        else if (action == "allow") ++allowed;
    });
    for_each_recent(threats_path_, cutoff, [&](const json& e) {
        ++threats;
        by_severity[e.value("severity", "unknown")]++;
        by_tool[e.value("tool", "unknown")]++;
        if (e.contains("categories") && e["categories"].is_array()) {
            for (const auto& c : e["categories"]) {
                if (c.is_string()) by_category[c.get<std::string>()]++;
            }
        }
    });

    return json{
        {"period_hours", hours},
        {"total_scans",  total},
        {"blocked",      blocked},
        {"allowed",      allowed},
        {"total_threats", threats},
        {"by_severity",  by_severity},
        {"by_category",  by_category},
        {"by_tool",      by_tool}
    };
}

bool ThreatLogger::update_summary() {
    json summary = get_stats(24);
    summary["updated_at"] = nowIso();

    std::lock_guard<std::mutex> lk(mu_);
    std::ofstream out(summary_path_, std::ios::trunc);
    if (!out.is_open()) {
        std::cerr << "[ThreatLogger] cannot write " << summary_path_ << "\n";
        return false;
    }
    out << summary.dump(2) << "\n";
    return static_cast<bool>(out);
}
