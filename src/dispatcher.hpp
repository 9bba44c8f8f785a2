#pragma once

#include "config.hpp"
#include "mover.hpp"
#include "pattern_matcher.hpp"
#include "suggestion_worker.hpp"
#include "watch_event.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace sorter {

// Where a single event's handling stopped.
enum class dispatch_state {
    not_actionable,   // not a create event
    directory,        // directories are not classified
    nested,           // parent is not the watched root
    ignored,
    dispatched        // handed to the mover; see outcome
};

// How the destination was chosen.
enum class resolution_source {
    none,
    rule,
    suggestion,
    fallback
};

struct dispatch_result {
    dispatch_state state = dispatch_state::not_actionable;
    resolution_source source = resolution_source::none;
    std::string destination;
    place_outcome outcome = place_outcome::failed;
};

// Per-event orchestrator. Events are handled one at a time on the
// caller's thread; a suggestion request blocks until its reply arrives.
class dispatcher {
public:
    struct stats {
        uint64_t events = 0;
        uint64_t ignored = 0;
        uint64_t rule_matched = 0;
        uint64_t suggested = 0;
        uint64_t fallbacks = 0;
        uint64_t moved = 0;
        uint64_t skipped = 0;
        uint64_t failed = 0;
    };

    // `worker` may be null when suggestions are disabled. All references
    // must outlive the dispatcher.
    dispatcher(const config& cfg,
               const pattern_matcher& matcher,
               suggestion_worker* worker,
               const mover& mv,
               std::shared_ptr<spdlog::logger> log);

    dispatch_result handle_event(const watch_event& ev);

    // Rule match, then suggestion, then fallback. Always non-empty and
    // trimmed.
    std::string resolve_destination(const std::filesystem::path& path,
                                    resolution_source& source);

    stats get_stats() const;

private:
    std::filesystem::path m_root;
    ignore_spec m_ignore;
    bool m_preserve_structure;
    std::chrono::milliseconds m_settle_delay;

    const pattern_matcher& m_matcher;
    suggestion_worker* m_worker;
    const mover& m_mover;
    std::shared_ptr<spdlog::logger> m_log;

    std::atomic<uint64_t> m_events{0};
    std::atomic<uint64_t> m_ignored{0};
    std::atomic<uint64_t> m_rule_matched{0};
    std::atomic<uint64_t> m_suggested{0};
    std::atomic<uint64_t> m_fallbacks{0};
    std::atomic<uint64_t> m_moved{0};
    std::atomic<uint64_t> m_skipped{0};
    std::atomic<uint64_t> m_failed{0};
};

} // namespace sorter
