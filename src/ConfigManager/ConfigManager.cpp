// === ConfigManager.cpp ===
#include "ConfigManager.hpp"

#include <fstream>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>
using nlohmann::json;

// Desc: read an optional boolean key
// In: const json& obj, const char* key, bool& out, const char* where
// Out: bool (false if present with the wrong type)
static bool readBool(const json& obj, const char* key, bool& out, const char* where) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_boolean()) {
        std::cerr << "[ConfigManager] '" << where << key << "' must be a boolean\n";
        return false;
    }
    out = obj[key].get<bool>();
    return true;
}

// Desc: read an optional unsigned integer key
// In: const json& obj, const char* key, std::uint64_t& out, const char* where
// Out: bool (false if present with the wrong type)
static bool readUInt(const json& obj, const char* key, std::uint64_t& out, const char* where) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_number_integer() || obj[key].get<long long>() < 0) {
        std::cerr << "[ConfigManager] '" << where << key << "' must be a non-negative integer\n";
        return false;
    }
    out = obj[key].get<std::uint64_t>();
    return true;
}

static bool readStringList(const json& obj, const char* key, std::vector<std::string>& out, const char* where) {
    if (!obj.contains(key)) return true;
    const json& v = obj[key];
    if (!v.is_array()) {
        std::cerr << "[ConfigManager] '" << where << key << "' must be an array of strings\n";
        return false;
    }
    std::vector<std::string> items;
    for (const auto& s : v) {
        if (!s.is_string()) {
            std::cerr << "[ConfigManager] '" << where << key << "' must contain only strings\n";
            return false;
        }
        items.push_back(s.get<std::string>());
    }
    out = std::move(items);
    return true;
}

static bool readTier(const json& obj, int& out) {
    if (!obj.contains("scan_tier")) return true;
    const json& v = obj["scan_tier"];
    if (!v.is_number_integer()) {
        std::cerr << "[ConfigManager] 'scan_tier' must be an integer\n";
        return false;
    }
    const auto t = v.get<long long>();
    if (t < 0 || t > 2) {
        std::cerr << "[ConfigManager] 'scan_tier' must be 0, 1 or 2, got: " << t << "\n";
        return false;
    }
    out = static_cast<int>(t);
    return true;
}

bool ConfigManager::applyFeatures_(const json& f) {
    if (!f.is_object()) { std::cerr << "[ConfigManager] 'features' must be an object\n"; return false; }
    return readBool(f, "prompt_guard", prompt_guard_, "features.") &&
           readBool(f, "ml_detection", ml_detection_, "features.") &&
           readBool(f, "secret_scanner", secret_scanner_, "features.") &&
           readBool(f, "content_moderation", content_moderation_, "features.");
}

bool ConfigManager::applyPromptGuard_(const json& pg) {
    if (!pg.is_object()) { std::cerr << "[ConfigManager] 'prompt_guard' must be an object\n"; return false; }
    return readTier(pg, scan_tier_) &&
           readBool(pg, "hash_cache", hash_cache_, "prompt_guard.") &&
           readBool(pg, "decode_base64", decode_base64_, "prompt_guard.") &&
           readStringList(pg, "multilang", multilang_, "prompt_guard.");
}

bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }

    json j;
    try { file >> j; }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }

    return loadFromJson(j);
}

// Desc: load settings from a parsed config document onto the defaults
// In: const json& j
// Out: bool (false on the first invalid key; *this is left unchanged then)
bool ConfigManager::loadFromJson(const json& j) {
    if (!j.is_object()) { std::cerr << "[ConfigManager] config root must be an object\n"; return false; }

    ConfigManager next;

    if (j.contains("features") && !next.applyFeatures_(j["features"])) return false;
    if (j.contains("prompt_guard") && !next.applyPromptGuard_(j["prompt_guard"])) return false;
    if (!readBool(j, "fail_open", next.fail_open_, "")) return false;
    if (!readStringList(j, "trusted_sources", next.trusted_sources_, "")) return false;

    if (j.contains("cache")) {
        if (!j["cache"].is_object()) { std::cerr << "[ConfigManager] 'cache' must be an object\n"; return false; }
        if (!readUInt(j["cache"], "max_entries", next.cache_max_entries_, "cache.")) return false;
    }

    if (j.contains("audit")) {
        const json& a = j["audit"];
        if (!a.is_object()) { std::cerr << "[ConfigManager] 'audit' must be an object\n"; return false; }
        if (!readBool(a, "enabled", next.audit_enabled_, "audit.")) return false;
        if (a.contains("log_dir")) {
            if (!a["log_dir"].is_string() || a["log_dir"].get<std::string>().empty()) {
                std::cerr << "[ConfigManager] 'audit.log_dir' must be a non-empty string\n";
                return false;
            }
            next.audit_log_dir_ = a["log_dir"].get<std::string>();
        }
    }

    if (j.contains("batch")) {
        if (!j["batch"].is_object()) { std::cerr << "[ConfigManager] 'batch' must be an object\n"; return false; }
        if (!readUInt(j["batch"], "workers", next.batch_workers_, "batch.")) return false;
    }

    if (j.contains("patterns")) {
        if (!j["patterns"].is_object()) {
            std::cerr << "[ConfigManager] 'patterns' must be an object keyed by severity\n";
            return false;
        }
        next.custom_patterns_ = j["patterns"];
    }

    *this = std::move(next);
    return true;
}

bool ConfigManager::applyOverrides(const json& request, ConfigManager& out) const {
    out = *this;
    if (!request.is_object()) return true;

    ConfigManager merged = *this;
    if (request.contains("features") && !request["features"].is_null()) {
        if (!merged.applyFeatures_(request["features"])) return false;
    }
    if (request.contains("scan_tier") && !request["scan_tier"].is_null()) {
        if (!readTier(request, merged.scan_tier_)) return false;
    }
    out = std::move(merged);
    return true;
}

bool ConfigManager::isTrustedSource(const std::string& source) const {
    if (source.empty()) return false;
    return std::find(trusted_sources_.begin(), trusted_sources_.end(), source) != trusted_sources_.end();
}
