#pragma once

#include "config.hpp"
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace sorter {

struct compiled_rule {
    std::string pattern;
    std::regex regex;
    std::string destination;
};

// Ordered rule list with patterns compiled once at construction.
class pattern_matcher {
public:
    // Throws std::runtime_error naming the offending pattern if any rule
    // fails to compile.
    explicit pattern_matcher(const std::vector<rule_def>& rules);

    // Destination of the first rule whose pattern matches anywhere in
    // the filename, or nullopt when none does.
    std::optional<std::string> match(std::string_view filename) const;

    std::size_t size() const { return m_rules.size(); }

private:
    std::vector<compiled_rule> m_rules;
};

} // namespace sorter
