#include "AsyncScanQueue.hpp"
#include <mutex>
#include <condition_variable>
#include <deque>
#include <utility>
#include "ScanService.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <exception>
#include <iostream>

namespace {
    std::mutex                g_mtx;
    std::condition_variable   g_cv;
    std::deque<AsyncScanTask> g_q;
    bool                      g_shutdown = false;
    std::vector<std::thread>  g_workers;
    std::atomic<bool>         g_started{false};
    AsyncResultSink           g_sink;
}


// Desc: enqueue a scan request into the async queue
// In: uint64_t seq, nlohmann::json request
// Out: void
void enqueue_async_scan(uint64_t seq, nlohmann::json request) {
    AsyncScanTask t{seq, std::move(request)};
    {
        std::lock_guard<std::mutex> lk(g_mtx);
        g_q.emplace_back(std::move(t));
    }
    g_cv.notify_one();
}


// Desc: wait for and pop one scan task from queue
// In: AsyncScanTask& out
// Out: bool (false if shutdown and empty)
bool wait_dequeue_async_scan(AsyncScanTask& out) {
    std::unique_lock<std::mutex> lk(g_mtx);
    g_cv.wait(lk, []{ return g_shutdown || !g_q.empty(); });
    if (g_shutdown && g_q.empty()) return false;
    out = std::move(g_q.front());
    g_q.pop_front();
    return true;
}


// Desc: signal shutdown to all worker threads
// In: (none)
// Out: void
void shutdown_async_scan_queue() {
    {
        std::lock_guard<std::mutex> lk(g_mtx);
        g_shutdown = true;
    }
    g_cv.notify_all();
}


// Desc: worker loop to run each request through the service and report it
// In: ScanService* service, const AsyncResultSink* sink
// Out: void
static void async_worker_loop(ScanService* service, const AsyncResultSink* sink) {
    for (;;) {
        AsyncScanTask t;
        if (!wait_dequeue_async_scan(t)) break;

        nlohmann::json response;
        try {
            response = service->handle(t.request);
        } catch (const std::exception& e) {
            std::cerr << "[AsyncScanQueue] request " << t.seq << " failed: " << e.what() << "\n";
            response = nlohmann::json{{"error", e.what()}};
        }
        (*sink)(t.seq, response);
    }
}

// Desc: start N background scan workers (idempotent)
// In: ScanService& service, AsyncResultSink sink, size_t num_workers
// Out: void
void start_async_workers(ScanService& service,
                         AsyncResultSink sink,
                         size_t num_workers)
{
    if (g_started.exchange(true)) return; // already started
    if (num_workers == 0) num_workers = 1;
    g_sink = std::move(sink);
    {
        std::lock_guard<std::mutex> lk(g_mtx);
        g_shutdown = false;
    }
    g_workers.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        g_workers.emplace_back(async_worker_loop, &service, &g_sink);
    }
}


// Desc: stop workers, join threads, and reset state
// In: (none)
// Out: void
void stop_async_workers_and_join() {
    shutdown_async_scan_queue();
    for (auto& th : g_workers) {
        if (th.joinable()) th.join();
    }
    g_workers.clear();
    g_started = false;
}
