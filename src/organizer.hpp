#pragma once

#include "config.hpp"
#include "directory_watcher.hpp"
#include "dispatcher.hpp"
#include "mover.hpp"
#include "pattern_matcher.hpp"
#include "rate_limiter.hpp"
#include "suggestion_client.hpp"
#include "suggestion_worker.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>
#include <memory>

namespace sorter {

// Owns the whole pipeline for one watched root: matcher, rate limiter,
// suggestion worker, mover, dispatcher and the inotify watcher.
class organizer {
public:
    // Throws std::runtime_error on invalid rules, an unusable watched
    // root, or a suggestion client that cannot be constructed. A null
    // `client` selects the Gemini client when suggestions are enabled.
    organizer(asio::io_context& ioc, const config& cfg,
              std::shared_ptr<spdlog::logger> log,
              suggestion_client_sptr client = nullptr);
    ~organizer();

    // Start the suggestion worker, the watch loop and stats reporting.
    void start();

    // Cancel the rate limiter, stop the worker and close the watcher.
    void stop();

    dispatcher& get_dispatcher() { return *m_dispatcher; }

private:
    asio::awaitable<void> watch_loop();

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    pattern_matcher m_matcher;
    rate_limiter m_limiter;
    suggestion_client_sptr m_client;
    std::unique_ptr<suggestion_worker> m_worker;
    std::unique_ptr<mover> m_mover;
    std::unique_ptr<dispatcher> m_dispatcher;
    std::unique_ptr<directory_watcher> m_watcher;
    bool m_started = false;
};

} // namespace sorter
