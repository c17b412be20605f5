// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include "PatternCatalog.hpp"
#include <string>
#include <vector>

struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
    PatternCatalog catalog;          // built-in rules plus configured custom rules
};

class Requirements {
public:
    static StartupResult run(const std::string& config_path);

private:
    static void ensureDir(const std::string& path, StartupResult& out);
    static void fileLog(const std::string& log_dir, const std::string& msg);
    static bool loadConfig(const std::string& config_path,
                           StartupResult& out);
    static bool validateConfig(const ConfigManager& cfg,
                               StartupResult& out);
    static bool buildCatalog(StartupResult& out);
};
