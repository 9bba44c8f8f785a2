#pragma once

#include "config.hpp"
#include <filesystem>

namespace sorter {

// Base names starting with this marker are platform metadata and are
// always ignored.
inline constexpr const char* hidden_file_marker = "._";

// True when the path must be skipped before classification. Any one
// matching criterion is enough. Stateless and safe to call concurrently.
bool should_ignore(const std::filesystem::path& path, const ignore_spec& spec);

} // namespace sorter
