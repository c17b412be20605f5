#pragma once
#include "ConfigManager.hpp"
#include "ScanEngine.hpp"
#include "ThreatLogger.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Transport-free request handler in front of a ScanEngine.
// Requests and responses are JSON objects; "op" selects the operation.
class ScanService {
public:
    static constexpr const char* kServiceName = "promptguard";
    static constexpr const char* kVersion     = "0.2.0";

    // 'audit' may be null (auditing off); it must outlive the service.
    ScanService(ScanEngine& engine, const ConfigManager& config, ThreatLogger* audit);

    nlohmann::json handle(const nlohmann::json& request);

    nlohmann::json scan(const nlohmann::json& request);
    nlohmann::json health() const;
    nlohmann::json stats(int hours) const;
    nlohmann::json patterns() const;
    nlohmann::json clear_cache();

    // Strings pass through; anything else is serialized.
    static std::string contentText(const nlohmann::json& content);

private:
    nlohmann::json scanError_(const ConfigManager& cfg, const std::string& what);

    ScanEngine&   engine_;
    ConfigManager config_;
    ThreatLogger* audit_;
};
