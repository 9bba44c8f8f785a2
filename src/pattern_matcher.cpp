#include "pattern_matcher.hpp"
#include <stdexcept>

namespace sorter {

pattern_matcher::pattern_matcher(const std::vector<rule_def>& rules) {
    m_rules.reserve(rules.size());
    for (const auto& rule : rules) {
        try {
            m_rules.push_back({rule.pattern, std::regex(rule.pattern), rule.destination});
        } catch (const std::regex_error& e) {
            throw std::runtime_error("config: invalid rule pattern '" + rule.pattern + "': " + e.what());
        }
    }
}

std::optional<std::string> pattern_matcher::match(std::string_view filename) const {
    for (const auto& rule : m_rules) {
        if (std::regex_search(filename.begin(), filename.end(), rule.regex)) {
            return rule.destination;
        }
    }
    return std::nullopt;
}

} // namespace sorter
