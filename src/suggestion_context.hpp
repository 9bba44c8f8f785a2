#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sorter {

// Everything the prompt is assembled from for one file.
struct prompt_inputs {
    std::string instructions;
    std::string knowledge_base;
    std::string filename;
    std::string metadata;
    std::string folder_snapshot;
    bool preserve_structure = false;
};

// "Extension: .pdf, Size: 1234 bytes", or "" if the file cannot be
// stat'ed (it may already be gone).
std::string file_metadata(const std::filesystem::path& path);

// Newline-joined relative paths of every subdirectory under root,
// computed fresh on each call. Unreadable entries are skipped.
std::string folder_snapshot(const std::filesystem::path& root);

std::string build_prompt(const prompt_inputs& in);

// Copy of s without leading/trailing whitespace.
std::string trim(std::string_view s);

} // namespace sorter
