// include/ConfigManager.hpp
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

class ConfigManager {
public:
    explicit ConfigManager() = default;

    // Missing keys keep their defaults; a wrongly typed key fails the load.
    bool loadFromFile(const std::string& config_path);
    bool loadFromJson(const nlohmann::json& j);

    // Copy of this config with the request's "features" and "scan_tier" merged in.
    // Returns false (and leaves 'out' equal to this config) if an override is invalid.
    bool applyOverrides(const nlohmann::json& request, ConfigManager& out) const;

    // features
    bool promptGuardEnabled()       const { return prompt_guard_; }
    bool mlDetectionEnabled()       const { return ml_detection_; }
    bool secretScannerEnabled()     const { return secret_scanner_; }
    bool contentModerationEnabled() const { return content_moderation_; }

    // prompt_guard
    int  scanTier()     const { return scan_tier_; }
    bool hashCache()    const { return hash_cache_; }
    bool decodeBase64() const { return decode_base64_; }
    const std::vector<std::string>& languages() const { return multilang_; }

    bool failOpen() const { return fail_open_; }
    const std::vector<std::string>& trustedSources() const { return trusted_sources_; }
    bool isTrustedSource(const std::string& source) const;

    std::uint64_t cacheMaxEntries() const { return cache_max_entries_; }
    bool auditEnabled() const { return audit_enabled_; }
    const std::string& auditLogDir() const { return audit_log_dir_; }
    std::uint64_t batchWorkers() const { return batch_workers_; }

    // {"critical": [...], "high": [...], "medium": [...]} or null
    const nlohmann::json& customPatterns() const { return custom_patterns_; }

private:
    bool applyFeatures_(const nlohmann::json& f);
    bool applyPromptGuard_(const nlohmann::json& pg);

    bool prompt_guard_       = true;
    bool ml_detection_       = false;
    bool secret_scanner_     = false;
    bool content_moderation_ = false;

    int  scan_tier_     = 1;
    bool hash_cache_    = true;
    bool decode_base64_ = true;
    std::vector<std::string> multilang_;

    bool fail_open_ = true;
    std::vector<std::string> trusted_sources_;

    std::uint64_t cache_max_entries_ = 10000;
    bool          audit_enabled_     = true;
    std::string   audit_log_dir_     = "logs";
    std::uint64_t batch_workers_     = 4;

    nlohmann::json custom_patterns_;
};
