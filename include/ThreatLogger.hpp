#pragma once
#include "ScanTypes.hpp"
#include <cstdint>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Append-only JSON-lines audit log of scans and detected threats.
// Raw content is never written, only its hash.
class ThreatLogger {
public:
    explicit ThreatLogger(const std::string& log_dir);

    bool isReady() const { return ready_; }

    bool log_scan(const std::string& action, const std::string& tool_name,
                  const std::string& severity, const std::vector<Match>& matches,
                  uint64_t duration_ms, const std::string& content_hash = "",
                  const std::string& source = "");

    bool log_threat(const std::string& severity, const std::string& tool_name,
                    const std::vector<Match>& matches, const std::string& content,
                    const std::string& source = "");

    // Totals over the last 'hours' hours; malformed lines are skipped.
    nlohmann::json get_stats(int hours = 24) const;

    // Rewrites the summary file with 24h stats and "updated_at".
    bool update_summary();

    const std::string& scansPath()   const { return scans_path_; }
    const std::string& threatsPath() const { return threats_path_; }
    const std::string& summaryPath() const { return summary_path_; }

    static std::string nowIso();
    static bool parseIso(const std::string& ts, std::time_t& out);

private:
    bool append_(const std::string& path, const nlohmann::json& entry);

    std::string log_dir_;
    std::string scans_path_;
    std::string threats_path_;
    std::string summary_path_;
    bool ready_{false};
    mutable std::mutex mu_;
};
