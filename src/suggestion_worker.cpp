#include "suggestion_worker.hpp"
#include "suggestion_context.hpp"
#include <chrono>

namespace sorter {

suggestion_worker::suggestion_worker(const config& cfg,
                                     std::string knowledge_base,
                                     rate_limiter& limiter,
                                     suggestion_client_sptr client,
                                     std::shared_ptr<spdlog::logger> log)
    : m_root(cfg.watch_root),
      m_preserve_structure(cfg.preserve_structure),
      m_model(cfg.suggestions.model),
      m_instructions(cfg.suggestions.instructions),
      m_knowledge_base(std::move(knowledge_base)),
      m_limiter(limiter), m_client(std::move(client)), m_log(std::move(log)),
      m_slots(static_cast<moodycamel::LightweightSemaphore::ssize_t>(cfg.suggestions.queue_capacity > 0
                                       ? cfg.suggestions.queue_capacity : 1))
{}

suggestion_worker::~suggestion_worker() {
    stop();
}

void suggestion_worker::start() {
    if (m_running.exchange(true)) return; // already started

    m_thread = std::thread(&suggestion_worker::worker_loop, this);
    m_log->info("Suggestion worker started (model={}, interval={}ms)",
               m_model, m_limiter.interval().count());
}

void suggestion_worker::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Poison pill
    job pill;
    pill.stop = true;
    m_queue.enqueue(std::move(pill));

    if (m_thread.joinable()) m_thread.join();

    drain_pending();
    m_log->info("Suggestion worker stopped");
}

std::future<std::string> suggestion_worker::submit(std::string source_path) {
    job j;
    j.source_path = std::move(source_path);
    auto fut = j.reply.get_future();

    if (j.source_path.empty()) {
        m_log->warn("Suggestion requested without a file; answering {}", fallback_destination);
        reply_fallback(j);
        return fut;
    }

    // Wait for a free slot, re-checking for shutdown so a stalled
    // producer cannot outlive the worker.
    while (!m_slots.wait(100 * 1000)) {
        if (!m_running.load(std::memory_order_relaxed)) {
            reply_fallback(j);
            return fut;
        }
    }

    if (!m_running.load(std::memory_order_relaxed)) {
        m_slots.signal();
        reply_fallback(j);
        return fut;
    }

    m_queue.enqueue(std::move(j));

    // Lost a race with stop(): nobody else will drain this job.
    if (!m_running.load(std::memory_order_relaxed)) drain_pending();

    return fut;
}

std::size_t suggestion_worker::queue_depth() const {
    return m_queue.size_approx();
}

suggestion_worker::stats suggestion_worker::get_stats() const {
    return {
        m_processed.load(std::memory_order_relaxed),
        m_suggested.load(std::memory_order_relaxed),
        m_fallbacks.load(std::memory_order_relaxed),
        m_service_failures.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

void suggestion_worker::worker_loop() {
    m_log->debug("Suggestion worker loop started");

    job j;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        bool got = m_queue.wait_dequeue_timed(j, std::chrono::milliseconds(100));
        if (!got) continue;

        if (j.stop) break;

        m_slots.signal();
        process(j);
        j = job{};
    }

    m_log->debug("Suggestion worker loop stopped");
}

void suggestion_worker::process(job& j) {
    m_processed.fetch_add(1, std::memory_order_relaxed);

    std::string destination;
    try {
        destination = suggest(j.source_path);
    } catch (const std::exception& e) {
        m_log->error("Suggestion for '{}' failed: {}", j.source_path, e.what());
        destination.clear();
    }

    if (destination.empty()) {
        reply_fallback(j);
        return;
    }

    m_suggested.fetch_add(1, std::memory_order_relaxed);
    j.reply.set_value(std::move(destination));
}

std::string suggestion_worker::suggest(const std::string& source_path) {
    if (!m_limiter.acquire()) {
        m_log->warn("Rate limiter cancelled; '{}' goes to {}", source_path, fallback_destination);
        return {};
    }

    const std::filesystem::path path(source_path);

    prompt_inputs in;
    in.instructions = m_instructions;
    in.knowledge_base = m_knowledge_base;
    in.filename = path.filename().string();
    in.metadata = file_metadata(path);
    if (m_preserve_structure) in.folder_snapshot = folder_snapshot(m_root);
    in.preserve_structure = m_preserve_structure;

    const std::string prompt = build_prompt(in);
    m_log->debug("Prompt:\n{}", prompt);

    auto result = m_client->generate(m_model, prompt);
    if (result.failed()) {
        m_service_failures.fetch_add(1, std::memory_order_relaxed);
        m_log->warn("Suggestion service error for '{}': {}", in.filename, result.error());
        return {};
    }

    std::string text = trim(result.text());
    if (text.empty()) {
        m_log->warn("Suggestion service returned an empty answer for '{}'", in.filename);
    }
    return text;
}

void suggestion_worker::reply_fallback(job& j) {
    m_fallbacks.fetch_add(1, std::memory_order_relaxed);
    j.reply.set_value(std::string(fallback_destination));
}

void suggestion_worker::drain_pending() {
    job j;
    while (m_queue.try_dequeue(j)) {
        if (j.stop) continue; // stale poison pill
        m_slots.signal();
        m_log->debug("Resolving queued '{}' to {} on shutdown", j.source_path, fallback_destination);
        reply_fallback(j);
        j = job{};
    }
}

} // namespace sorter
