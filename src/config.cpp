#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sorter {

static std::set<std::string> read_string_set(const YAML::Node& node, const std::string& name) {
    std::set<std::string> out;
    if (!node) return out;
    if (!node.IsSequence()) throw std::runtime_error("config: '" + name + "' must be a list");
    for (const auto& item : node) {
        out.insert(item.as<std::string>());
    }
    return out;
}

static config parse_config(const YAML::Node& root) {
    config cfg;

    // Options
    if (auto opts = root["options"]) {
        if (!opts.IsMap()) throw std::runtime_error("config: 'options' must be a map");
        if (auto n = opts["watch_root"])         cfg.watch_root = n.as<std::string>();
        if (auto n = opts["preserve_structure"]) cfg.preserve_structure = n.as<bool>();
        if (auto n = opts["knowledge_base"])     cfg.knowledge_base_path = n.as<std::string>();
        if (auto n = opts["settle_delay_ms"])    cfg.settle_delay_ms = n.as<uint32_t>();
    }

    if (cfg.watch_root.empty()) {
        throw std::runtime_error("config: 'options.watch_root' must not be empty");
    }

    // Ignore list
    if (auto ign = root["ignore"]) {
        if (!ign.IsMap()) throw std::runtime_error("config: 'ignore' must be a map");
        if (auto n = ign["os_defaults"]) cfg.ignore.use_os_defaults = n.as<bool>();
        cfg.ignore.exact_names     = read_string_set(ign["files"], "ignore.files");
        cfg.ignore.extensions      = read_string_set(ign["extensions"], "ignore.extensions");
        cfg.ignore.path_substrings = read_string_set(ign["folders"], "ignore.folders");
    }

    // Rules (ordered, first match wins)
    if (auto rules = root["rules"]) {
        if (!rules.IsSequence()) throw std::runtime_error("config: 'rules' must be a list");
        for (const auto& item : rules) {
            rule_def def;
            if (!item["pattern"] || !item["target"]) {
                throw std::runtime_error("config: each rule needs 'pattern' and 'target'");
            }
            def.pattern = item["pattern"].as<std::string>();
            def.destination = item["target"].as<std::string>();
            if (def.pattern.empty() || def.destination.empty()) {
                throw std::runtime_error("config: rule 'pattern' and 'target' must not be empty");
            }
            cfg.rules.push_back(std::move(def));
        }
    }

    // Suggestion service
    if (auto gpt = root["gpt"]) {
        if (!gpt.IsMap()) throw std::runtime_error("config: 'gpt' must be a map");
        auto& s = cfg.suggestions;
        if (auto n = gpt["enabled"])          s.enabled = n.as<bool>();
        if (auto n = gpt["api_key"])          s.api_key = n.as<std::string>();
        if (auto n = gpt["model"])            s.model = n.as<std::string>();
        if (auto n = gpt["instructions"])     s.instructions = n.as<std::string>();
        if (auto n = gpt["endpoint"])         s.endpoint = n.as<std::string>();
        if (auto n = gpt["timeout_seconds"])  s.timeout_seconds = n.as<uint32_t>();
        if (auto n = gpt["rate_interval_ms"]) s.rate_interval_ms = n.as<uint32_t>();
        if (auto n = gpt["queue_capacity"])   s.queue_capacity = n.as<std::size_t>();
    }

    if (cfg.suggestions.api_key.empty()) {
        if (const char* env = std::getenv("GEMINI_API_KEY")) cfg.suggestions.api_key = env;
    }

    if (cfg.suggestions.enabled) {
        if (cfg.suggestions.model.empty()) {
            throw std::runtime_error("config: 'gpt.model' is required when 'gpt.enabled' is true");
        }
        if (cfg.suggestions.queue_capacity == 0) {
            throw std::runtime_error("config: 'gpt.queue_capacity' must be positive");
        }
    }

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();

    return cfg;
}

config load_config(const std::string& path) {
    try {
        return parse_config(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("config: " + path + ": " + e.what());
    }
}

std::string load_knowledge_base(const std::string& path,
                                const std::shared_ptr<spdlog::logger>& log) {
    if (path.empty()) return {};

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log->warn("Could not read knowledge base '{}'", path);
        return {};
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    log->info("Loaded knowledge base '{}' ({} bytes)", path, ss.str().size());
    return ss.str();
}

} // namespace sorter
