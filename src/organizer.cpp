#include "organizer.hpp"
#include "gemini_client.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace sorter {

static void ensure_root(const std::string& root) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) throw std::runtime_error("cannot create watched root '" + root + "': " + ec.message());
}

organizer::organizer(asio::io_context& ioc, const config& cfg,
                     std::shared_ptr<spdlog::logger> log,
                     suggestion_client_sptr client)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_matcher(m_cfg.rules),
      m_limiter(std::chrono::milliseconds(m_cfg.suggestions.rate_interval_ms)),
      m_client(std::move(client))
{
    ensure_root(m_cfg.watch_root);

    if (m_cfg.suggestions.enabled) {
        if (!m_client) m_client = std::make_shared<gemini_client>(m_cfg.suggestions, m_log);
        m_worker = std::make_unique<suggestion_worker>(
            m_cfg, load_knowledge_base(m_cfg.knowledge_base_path, m_log),
            m_limiter, m_client, m_log);
    }

    m_mover = std::make_unique<mover>(m_cfg.watch_root, m_log);
    m_dispatcher = std::make_unique<dispatcher>(
        m_cfg, m_matcher, m_worker.get(), *m_mover, m_log);
    m_watcher = std::make_unique<directory_watcher>(m_ioc, m_cfg.watch_root, m_log);

    m_log->info("Organizer ready ({} rules, suggestions {}, preserve_structure={})",
               m_matcher.size(), m_worker ? "enabled" : "disabled", m_cfg.preserve_structure);
}

organizer::~organizer() {
    stop();
}

void organizer::start() {
    if (m_started) return;
    m_started = true;

    if (m_worker) m_worker->start();

    asio::co_spawn(m_ioc, watch_loop(), asio::detached);
    if (m_cfg.stats_interval_seconds > 0) {
        asio::co_spawn(m_ioc, stats_loop(), asio::detached);
    }
}

void organizer::stop() {
    if (!m_started) return;
    m_started = false;

    // Cancel first so an in-flight job resolves to the fallback instead
    // of waiting out the rate limit.
    m_limiter.cancel();
    if (m_worker) m_worker->stop();
    if (m_watcher) m_watcher->close();
}

asio::awaitable<void> organizer::watch_loop() {
    co_await m_watcher->run(
        [this](const watch_event& ev) {
            try {
                m_dispatcher->handle_event(ev);
            } catch (const std::exception& e) {
                m_log->error("Failed to handle '{}': {}", ev.path, e.what());
            }
        },
        [this](const std::string& err) {
            m_log->error("Watcher error: {}", err);
        });
}

asio::awaitable<void> organizer::stats_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (m_started) {
        timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        co_await timer.async_wait(asio::use_awaitable);

        auto ds = m_dispatcher->get_stats();
        auto ws = m_worker ? m_worker->get_stats() : suggestion_worker::stats{};

        m_log->info("stats: events={} ignored={} rule_matched={} suggested={} fallbacks={} moved={} skipped={} failed={} service_failures={} queue_depth={}",
                   ds.events,
                   ds.ignored,
                   ds.rule_matched,
                   ds.suggested,
                   ds.fallbacks,
                   ds.moved,
                   ds.skipped,
                   ds.failed,
                   ws.service_failures,
                   ws.queue_depth);
    }
}

} // namespace sorter
