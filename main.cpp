// main.cpp
#include "AsyncScanQueue.hpp"
#include "ScanEngine.hpp"
#include "ScanService.hpp"
#include "ScanTypesIO.hpp"
#include "ThreatLogger.hpp"
#include "requirements.hpp"
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#define EXIT_DANGEROUS 2

void print_help() {
    std::cout << "Usage:\n"
              << "  ./promptguard [scan] [--tier N] [--no-cache] [--no-decode]\n"
              << "                             Scan stdin, print the verdict (exit 2 if dangerous)\n"
              << "  ./promptguard batch        Handle JSON-lines requests from stdin with the worker pool\n"
              << "  ./promptguard stats        Print audit and scanner statistics\n"
              << "  ./promptguard patterns     Print loaded pattern counts\n"
              << "  ./promptguard -h, --help   Show this help message\n"
              << "Config: $PROMPTGUARD_CONFIG (default ./config.json)\n";
}

// Desc: parse scan-mode flags into ScanOptions
// In: int argc, char** argv, int first, ScanOptions& opts
// Out: bool (false on an unknown or malformed flag)
static bool parse_scan_flags(int argc, char** argv, int first, ScanOptions& opts) {
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--no-cache") { opts.use_cache = false; continue; }
        if (arg == "--no-decode") { opts.decode_content = false; continue; }
        if (arg == "--tier" && i + 1 < argc) {
            const std::string v = argv[++i];
            if (v != "0" && v != "1" && v != "2") {
                std::cerr << "[Main] --tier must be 0, 1 or 2\n";
                return false;
            }
            opts.tier = std::stoi(v);
            continue;
        }
        std::cerr << "[Main] unknown argument: " << arg << "\n";
        return false;
    }
    return true;
}

static int run_scan(ScanEngine& engine, const ScanOptions& opts) {
    const std::string content((std::istreambuf_iterator<char>(std::cin)),
                              std::istreambuf_iterator<char>());
    const Verdict v = engine.scan(content, opts);
    std::cout << nlohmann::json(v).dump(2) << "\n";
    return v.is_dangerous ? EXIT_DANGEROUS : 0;
}

// Desc: feed stdin JSON lines to the worker pool; one response line per request
// In: ScanService& service, size_t workers
// Out: int exit status
static int run_batch(ScanService& service, size_t workers) {
    std::mutex out_mu;
    start_async_workers(service, [&out_mu](uint64_t seq, const nlohmann::json& response) {
        const nlohmann::json line = {{"seq", seq}, {"response", response}};
        std::lock_guard<std::mutex> lk(out_mu);
        std::cout << line.dump() << "\n";
    }, workers);

    uint64_t seq = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        ++seq;
        nlohmann::json request = nlohmann::json::parse(line, nullptr, false);
        if (request.is_discarded()) {
            std::cerr << "[Main] line " << seq << ": invalid JSON, skipped\n";
            continue;
        }
        enqueue_async_scan(seq, std::move(request));
    }
    stop_async_workers_and_join();
    std::cout.flush();
    return 0;
}

int main(int argc, char** argv) {
    // Handle help flag early
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_help();
        return 0;
    }
    const char* config_env = std::getenv("PROMPTGUARD_CONFIG");
    std::string config_path = config_env ? config_env : "./config.json";

    auto boot = Requirements::run(config_path);
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }

    EngineOptions eo;
    eo.catalog = boot.catalog;
    eo.languages = boot.config.languages();
    eo.cache_capacity = static_cast<size_t>(boot.config.cacheMaxEntries());

    std::unique_ptr<ScanEngine> engine;
    try {
        engine = std::make_unique<ScanEngine>(eo);
    } catch (const std::runtime_error& e) {
        std::cerr << "[Main] aborted: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<ThreatLogger> audit;
    if (boot.config.auditEnabled()) {
        audit = std::make_unique<ThreatLogger>(boot.config.auditLogDir());
        if (!audit->isReady()) audit.reset();
    }
    ScanService service(*engine, boot.config, audit.get());

    const std::string mode = argc > 1 ? argv[1] : "scan";

    // "batch" mode
    if (mode == "batch") {
        const int rc = run_batch(service, static_cast<size_t>(boot.config.batchWorkers()));
        if (audit) audit->update_summary();
        return rc;
    }

    // "stats" mode
    if (mode == "stats") {
        std::cout << service.stats(24).dump(2) << "\n";
        return 0;
    }

    // "patterns" mode
    if (mode == "patterns") {
        std::cout << service.patterns().dump(2) << "\n";
        return 0;
    }

    // default: scan stdin
    ScanOptions opts;
    opts.tier = boot.config.scanTier();
    opts.use_cache = boot.config.hashCache();
    opts.decode_content = boot.config.decodeBase64();
    const int first_flag = (argc > 1 && mode == "scan") ? 2 : 1;
    if (!parse_scan_flags(argc, argv, first_flag, opts)) {
        print_help();
        return 1;
    }
    return run_scan(*engine, opts);
}
