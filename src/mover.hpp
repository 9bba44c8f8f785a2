#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string>

namespace sorter {

enum class place_outcome {
    moved,
    skipped,   // preserve-structure refused to create the destination
    failed     // source left in place
};

const char* to_string(place_outcome o);

// Final placement of a file into <root>/<destination>/.
//
// Collisions never overwrite: an existing <name> becomes <stem>_N<ext>
// for the first free N up to max_collision_attempts. Cross-device moves
// fall back to copy + remove.
class mover {
public:
    static constexpr std::size_t max_collision_attempts = 50;

    mover(std::filesystem::path root, std::shared_ptr<spdlog::logger> log);

    place_outcome place(const std::filesystem::path& source,
                        const std::string& destination,
                        bool preserve_structure) const;

    const std::filesystem::path& root() const { return m_root; }

private:
    // Target path inside dest_dir that does not exist yet, or empty.
    std::filesystem::path free_target(const std::filesystem::path& dest_dir,
                                      const std::filesystem::path& filename) const;

    bool move_file(const std::filesystem::path& source,
                   const std::filesystem::path& target) const;

    std::filesystem::path m_root;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace sorter
