#pragma once

#include <spdlog/spdlog.h>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace sorter {

// Destination used when no rule matches and no usable suggestion exists.
inline constexpr const char* fallback_destination = "Unsorted";

// One (pattern, destination) pair. Patterns are regular expressions,
// compiled once by pattern_matcher.
struct rule_def {
    std::string pattern;
    std::string destination;
};

struct ignore_spec {
    bool use_os_defaults = false;
    std::set<std::string> exact_names;
    std::set<std::string> extensions;       // compared case-insensitively
    std::set<std::string> path_substrings;
};

struct suggestion_config {
    bool enabled = false;
    std::string api_key;
    std::string model;
    std::string instructions;
    std::string endpoint = "https://generativelanguage.googleapis.com/v1beta";
    uint32_t timeout_seconds = 30;

    // One request per interval, burst of one.
    uint32_t rate_interval_ms = 3000;
    std::size_t queue_capacity = 100;
};

struct config {
    // Watched root; every destination is relative to it.
    std::string watch_root = "entropy";
    bool preserve_structure = false;
    std::string knowledge_base_path;
    uint32_t settle_delay_ms = 500;

    ignore_spec ignore;
    std::vector<rule_def> rules;
    suggestion_config suggestions;

    // Operational
    int stats_interval_seconds = 60;
    std::string log_level = "info";
};

// Parse config from YAML file. Throws std::runtime_error on error.
config load_config(const std::string& path);

// Read the knowledge base text. Empty path or unreadable file yields "".
std::string load_knowledge_base(const std::string& path,
                                const std::shared_ptr<spdlog::logger>& log);

} // namespace sorter
