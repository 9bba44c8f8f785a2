#pragma once

#include "config.hpp"
#include "rate_limiter.hpp"
#include "suggestion_client.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <concurrentqueue/moodycamel/lightweightsemaphore.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace sorter {

// One file awaiting a suggestion. Created by the dispatcher, answered
// exactly once by the worker through `reply`.
struct job {
    std::string source_path;
    std::promise<std::string> reply;
    bool stop = false; // shutdown marker, carries no reply
};

// Single long-lived thread draining a bounded FIFO of jobs. Requests to
// the suggestion service are strictly sequential and paced by the
// rate limiter.
class suggestion_worker {
public:
    struct stats {
        uint64_t processed = 0;
        uint64_t suggested = 0;
        uint64_t fallbacks = 0;
        uint64_t service_failures = 0;
        std::size_t queue_depth = 0;
    };

    suggestion_worker(const config& cfg,
                      std::string knowledge_base,
                      rate_limiter& limiter,
                      suggestion_client_sptr client,
                      std::shared_ptr<spdlog::logger> log);
    ~suggestion_worker();

    suggestion_worker(const suggestion_worker&) = delete;
    suggestion_worker& operator=(const suggestion_worker&) = delete;

    // Spawn the worker thread. Must be called once.
    void start();

    // Signal the worker to stop and join it. Jobs still queued resolve
    // to the fallback destination.
    void stop();

    // Enqueue a job for `source_path`, blocking while the queue is full.
    // The returned future always receives exactly one value; an empty
    // path resolves to the fallback without reaching the service.
    std::future<std::string> submit(std::string source_path);

    // Approximate queue depth.
    std::size_t queue_depth() const;

    stats get_stats() const;

private:
    void worker_loop();

    // Resolve one job: rate limit, build prompt, call service, reply.
    void process(job& j);
    std::string suggest(const std::string& source_path);

    void reply_fallback(job& j);
    void drain_pending();

    std::filesystem::path m_root;
    bool m_preserve_structure;
    std::string m_model;
    std::string m_instructions;
    std::string m_knowledge_base;

    rate_limiter& m_limiter;
    suggestion_client_sptr m_client;
    std::shared_ptr<spdlog::logger> m_log;

    std::atomic<bool> m_running{false};

    moodycamel::BlockingConcurrentQueue<job> m_queue;
    // Free queue slots; producers wait on it, the worker signals it.
    moodycamel::LightweightSemaphore m_slots;
    std::thread m_thread;

    std::atomic<uint64_t> m_processed{0};
    std::atomic<uint64_t> m_suggested{0};
    std::atomic<uint64_t> m_fallbacks{0};
    std::atomic<uint64_t> m_service_failures{0};
};

} // namespace sorter
