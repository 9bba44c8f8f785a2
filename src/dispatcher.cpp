#include "dispatcher.hpp"
#include "ignore_policy.hpp"
#include "suggestion_context.hpp"
#include <system_error>
#include <thread>

namespace sorter {

namespace fs = std::filesystem;

// "root/" and "root" must compare equal to a file's parent_path().
static fs::path normalize_dir(const fs::path& p) {
    fs::path n = p.lexically_normal();
    if (!n.has_filename() && n.has_relative_path()) n = n.parent_path();
    return n;
}

dispatcher::dispatcher(const config& cfg,
                       const pattern_matcher& matcher,
                       suggestion_worker* worker,
                       const mover& mv,
                       std::shared_ptr<spdlog::logger> log)
    : m_root(normalize_dir(cfg.watch_root)),
      m_ignore(cfg.ignore),
      m_preserve_structure(cfg.preserve_structure),
      m_settle_delay(cfg.settle_delay_ms),
      m_matcher(matcher),
      m_worker(cfg.suggestions.enabled ? worker : nullptr),
      m_mover(mv),
      m_log(std::move(log))
{}

dispatch_result dispatcher::handle_event(const watch_event& ev) {
    dispatch_result result;
    if (ev.kind != event_kind::create) return result;

    const fs::path path(ev.path);

    // TODO: treat a new directory as a single unit, driven by a config
    // file dropped inside it.
    std::error_code ec;
    if (fs::is_directory(path, ec) && !ec) {
        result.state = dispatch_state::directory;
        return result;
    }

    // Moves performed below land in subfolders; never react to those.
    if (normalize_dir(path.parent_path()) != m_root) {
        result.state = dispatch_state::nested;
        return result;
    }

    m_events.fetch_add(1, std::memory_order_relaxed);

    // Give the writer a moment to finish before the file is inspected.
    if (m_settle_delay.count() > 0) std::this_thread::sleep_for(m_settle_delay);

    const std::string name = path.filename().string();
    m_log->info("New file detected: {}", path.string());

    if (should_ignore(path, m_ignore)) {
        m_ignored.fetch_add(1, std::memory_order_relaxed);
        m_log->info("Ignored file by config: {}", name);
        result.state = dispatch_state::ignored;
        return result;
    }

    result.destination = resolve_destination(path, result.source);
    result.state = dispatch_state::dispatched;
    result.outcome = m_mover.place(path, result.destination, m_preserve_structure);

    m_log->debug("Dispatched {} -> {} ({})", name, result.destination, to_string(result.outcome));

    switch (result.outcome) {
        case place_outcome::moved:   m_moved.fetch_add(1, std::memory_order_relaxed); break;
        case place_outcome::skipped: m_skipped.fetch_add(1, std::memory_order_relaxed); break;
        case place_outcome::failed:  m_failed.fetch_add(1, std::memory_order_relaxed); break;
    }
    return result;
}

std::string dispatcher::resolve_destination(const fs::path& path, resolution_source& source) {
    const std::string name = path.filename().string();
    std::string destination;
    source = resolution_source::none;

    if (auto target = m_matcher.match(name)) {
        destination = trim(*target);
        source = resolution_source::rule;
        m_rule_matched.fetch_add(1, std::memory_order_relaxed);
        m_log->info("Rule matched {} -> {}", name, destination);
    } else if (m_worker) {
        // One outstanding request; the watch loop waits for its reply.
        auto reply = m_worker->submit(path.string());
        destination = trim(reply.get());
        source = resolution_source::suggestion;
        m_log->info("AI suggested folder: {}", destination);
    }

    if (destination.empty()) {
        destination = fallback_destination;
        source = resolution_source::fallback;
        m_fallbacks.fetch_add(1, std::memory_order_relaxed);
    } else if (source == resolution_source::suggestion) {
        m_suggested.fetch_add(1, std::memory_order_relaxed);
    }

    return destination;
}

dispatcher::stats dispatcher::get_stats() const {
    return {
        m_events.load(std::memory_order_relaxed),
        m_ignored.load(std::memory_order_relaxed),
        m_rule_matched.load(std::memory_order_relaxed),
        m_suggested.load(std::memory_order_relaxed),
        m_fallbacks.load(std::memory_order_relaxed),
        m_moved.load(std::memory_order_relaxed),
        m_skipped.load(std::memory_order_relaxed),
        m_failed.load(std::memory_order_relaxed)
    };
}

} // namespace sorter
