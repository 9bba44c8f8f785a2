#include "ignore_policy.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace sorter {

namespace {

constexpr std::array<std::string_view, 3> os_default_names = {
    ".DS_Store", "Thumbs.db", "desktop.ini"
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

bool should_ignore(const std::filesystem::path& path, const ignore_spec& spec) {
    const std::string base = path.filename().string();

    if (base.rfind(hidden_file_marker, 0) == 0) return true;

    if (spec.use_os_defaults &&
        std::find(os_default_names.begin(), os_default_names.end(), base) != os_default_names.end()) {
        return true;
    }

    if (spec.exact_names.count(base)) return true;

    // Extension of the base name only, so "a.tar.gz" yields ".gz" and
    // ".bashrc" has none.
    const std::string ext = to_lower(path.filename().extension().string());
    if (!ext.empty()) {
        for (const auto& ignored : spec.extensions) {
            if (to_lower(ignored) == ext) return true;
        }
    }

    // Coarse on purpose: matches anywhere in the full path.
    const std::string full = path.string();
    for (const auto& fragment : spec.path_substrings) {
        if (!fragment.empty() && full.find(fragment) != std::string::npos) return true;
    }

    return false;
}

} // namespace sorter
