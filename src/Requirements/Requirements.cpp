// requirements.cpp
#include "requirements.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <ctime>

#define MIN_CACHE_ENTRIES 1ULL
#define MAX_CACHE_ENTRIES 10000000ULL
#define MIN_WORKERS 1ULL
#define MAX_WORKERS 64ULL


// Desc: append a timestamped line to the startup log file
// In: const std::string& log_dir, const std::string& msg
// Out: void
void Requirements::fileLog(const std::string& log_dir, const std::string& msg) {
    const std::string path = log_dir + "/startup.log";
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    std::string line = "[" + std::string(buf) + "] " + msg + "\n";
    ssize_t _wr = ::write(fd, line.c_str(), line.size());
    (void)_wr;
    ::close(fd);
}

// Desc: create directory if missing and record status
// In: const std::string& path, StartupResult& out
// Out: void
void Requirements::ensureDir(const std::string& path, StartupResult& out) {
    if (::mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        out.logs.push_back("[ensureDir] failed: " + path + " (" + std::string(::strerror(errno)) + ")");
        return;
    }
    out.logs.push_back("[ensureDir] ok: " + path);
}

// Desc: load JSON config into StartupResult::config; a missing file keeps defaults
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    struct stat st{};
    if (::stat(config_path.c_str(), &st) == -1 && errno == ENOENT) {
        out.logs.push_back("[config] " + config_path + " not found, using defaults");
        return true;
    }
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[config] loaded: " + config_path);
    return true;
}

// Desc: validate ranges of key config fields
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool (true if valid)
bool Requirements::validateConfig(const ConfigManager& cfg, StartupResult& out) {
    const int tier = cfg.scanTier();
    if (tier < 0 || tier > 2) {
        out.error = "[config] prompt_guard.scan_tier out of range: " + std::to_string(tier);
        out.logs.push_back(out.error);
        return false;
    }

    const uint64_t entries = cfg.cacheMaxEntries();
    if (entries < MIN_CACHE_ENTRIES) {
        out.error = "[config] cache.max_entries too small (<1)";
        out.logs.push_back(out.error);
        return false;
    }
    if (entries > MAX_CACHE_ENTRIES) {
        out.error = "[config] cache.max_entries too large (>10000000)";
        out.logs.push_back(out.error);
        return false;
    }

    const uint64_t workers = cfg.batchWorkers();
    if (workers < MIN_WORKERS || workers > MAX_WORKERS) {
        out.error = "[config] batch.workers must be 1..64, got " + std::to_string(workers);
        out.logs.push_back(out.error);
        return false;
    }

    if (cfg.mlDetectionEnabled())       out.logs.push_back("[config] features.ml_detection is not available, ignored");
    if (cfg.secretScannerEnabled())     out.logs.push_back("[config] features.secret_scanner is not available, ignored");
    if (cfg.contentModerationEnabled()) out.logs.push_back("[config] features.content_moderation is not available, ignored");
    if (!cfg.promptGuardEnabled())      out.logs.push_back("[config] features.prompt_guard is off, every scan will be allowed");

    out.logs.push_back("[config] scan_tier: " + std::to_string(tier));
    out.logs.push_back("[config] cache.max_entries: " + std::to_string(entries));
    out.logs.push_back("[config] batch.workers: " + std::to_string(workers));
    out.logs.push_back(std::string("[config] fail_open: ") + (cfg.failOpen() ? "true" : "false"));
    out.logs.push_back("[config] validation ok");
    return true;
}

// Desc: assemble the rule catalog and run its integrity check
// In: StartupResult& out
// Out: bool (true if the catalog is usable)
bool Requirements::buildCatalog(StartupResult& out) {
    out.catalog = PatternCatalog::builtin();

    std::string err;
    const auto& custom = out.config.customPatterns();
    if (!custom.is_null() && !out.catalog.addCustomFromJson(custom, err)) {
        out.error = "[patterns] invalid custom patterns: " + err;
        out.logs.push_back(out.error);
        return false;
    }
    if (!out.catalog.checkIntegrity(err)) {
        out.error = "[patterns] integrity check failed: " + err;
        out.logs.push_back(out.error);
        return false;
    }

    const PatternCounts c = out.catalog.counts();
    out.logs.push_back("[patterns] critical=" + std::to_string(c.critical) +
                       " high=" + std::to_string(c.high) +
                       " medium=" + std::to_string(c.medium));
    out.logs.push_back("[patterns] ruleset_version: " + out.catalog.rulesetVersion());
    return true;
}


// Desc: orchestrate startup: config, dirs, catalog; log results
// In: const std::string& config_path
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path) {
    StartupResult res;

    // 1) config load + validate
    const bool loaded = loadConfig(config_path, res);
    const std::string log_dir = loaded ? res.config.auditLogDir() : "logs";

    // 2) dirs
    ensureDir(log_dir, res);

    if (!loaded || !validateConfig(res.config, res)) {
        for (auto& l : res.logs) fileLog(log_dir, l);
        return res;
    }

    // 3) rule catalog
    if (!buildCatalog(res)) {
        for (auto& l : res.logs) fileLog(log_dir, l);
        return res;
    }

    // Ok
    res.ok = true;
    for (auto& l : res.logs) fileLog(log_dir, l);
    return res;
}
