#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

struct AsyncScanTask {
    uint64_t       seq;
    nlohmann::json request;
};
class ScanService;

// Receives each response; called from worker threads.
using AsyncResultSink = std::function<void(uint64_t seq, const nlohmann::json& response)>;

void enqueue_async_scan(uint64_t seq, nlohmann::json request);
bool wait_dequeue_async_scan(AsyncScanTask& out);
void shutdown_async_scan_queue();
void start_async_workers(ScanService& service,
                         AsyncResultSink sink,
                         size_t num_workers);
// Drains queued tasks, then joins the workers.
void stop_async_workers_and_join();
