#include "suggestion_context.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace sorter {

namespace fs = std::filesystem;

std::string file_metadata(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) return {};

    const auto size = fs::file_size(path, ec);
    if (ec) return {};

    return "Extension: " + path.extension().string() + ", Size: " + std::to_string(size) + " bytes";
}

std::string folder_snapshot(const fs::path& root) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) return {};

    std::vector<std::string> dirs;
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (it->is_directory(type_ec) && !type_ec) {
            dirs.push_back(fs::relative(it->path(), root, type_ec).generic_string());
        }
    }

    // Directory iteration order is unspecified; keep the listing stable.
    std::sort(dirs.begin(), dirs.end());

    std::string out;
    for (const auto& d : dirs) {
        out += d;
        out += '\n';
    }
    return out;
}

std::string build_prompt(const prompt_inputs& in) {
    std::string prompt;
    prompt.reserve(in.instructions.size() + in.knowledge_base.size() + in.folder_snapshot.size() + 256);

    prompt += in.instructions;
    prompt += "\n\nKnowledge base:\n";
    prompt += in.knowledge_base;
    prompt += "\n\nFilename: ";
    prompt += in.filename;
    prompt += "\nMetadata: ";
    prompt += in.metadata;
    prompt += "\nExisting folder structure: ";
    prompt += in.folder_snapshot;
    prompt += "\n\nConstraints:\n- Respond only with a folder path.\n- ";
    prompt += in.preserve_structure
        ? "Do not suggest new folders. Only pick from existing ones."
        : "You may suggest new folders if appropriate.";
    return prompt;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string{s.substr(b, e - b)};
}

} // namespace sorter
