#include "mover.hpp"
#include <system_error>

namespace sorter {

namespace fs = std::filesystem;

const char* to_string(place_outcome o) {
    switch (o) {
        case place_outcome::moved:   return "moved";
        case place_outcome::skipped: return "skipped";
        case place_outcome::failed:  return "failed";
    }
    return "unknown";
}

// Destinations are relative to the root, name a subfolder of it and may
// not climb out of it.
static bool is_contained(const fs::path& destination) {
    if (destination.empty() || destination.is_absolute() || destination.has_root_name()) return false;
    if (destination == ".") return false;
    for (const auto& part : destination) {
        if (part == "..") return false;
    }
    return true;
}

static bool same_dir(const fs::path& a, const fs::path& b) {
    std::error_code ec_a, ec_b;
    const auto ca = fs::weakly_canonical(a, ec_a);
    const auto cb = fs::weakly_canonical(b, ec_b);
    if (ec_a || ec_b) return a.lexically_normal() == b.lexically_normal();
    return ca == cb;
}

mover::mover(fs::path root, std::shared_ptr<spdlog::logger> log)
    : m_root(std::move(root)), m_log(std::move(log))
{}

place_outcome mover::place(const fs::path& source,
                           const std::string& destination,
                           bool preserve_structure) const {
    const auto name = source.filename();
    const fs::path rel = fs::path(destination).lexically_normal();

    if (!is_contained(rel)) {
        m_log->error("Refusing to move {}: destination '{}' is outside {}",
                    name.string(), destination, m_root.string());
        return place_outcome::failed;
    }

    const fs::path dest_dir = m_root / rel;
    std::error_code ec;

    // A move within the source's own folder would only rename the file
    // and report it to the watcher again.
    if (same_dir(dest_dir, source.parent_path())) {
        m_log->error("Refusing to move {}: destination '{}' is its own folder",
                    name.string(), destination);
        return place_outcome::failed;
    }

    if (preserve_structure) {
        if (!fs::is_directory(dest_dir, ec)) {
            m_log->info("Skipping {} -> {} (preserve_structure=true, folder doesn't exist)",
                       name.string(), dest_dir.string());
            return place_outcome::skipped;
        }
    } else {
        fs::create_directories(dest_dir, ec);
        if (ec) {
            m_log->error("Failed to create dir {}: {}", dest_dir.string(), ec.message());
            return place_outcome::failed;
        }
    }

    const fs::path target = free_target(dest_dir, name);
    if (target.empty()) {
        m_log->error("Failed to move {}: no free name in {} after {} attempts",
                    name.string(), dest_dir.string(), max_collision_attempts);
        return place_outcome::failed;
    }

    if (!move_file(source, target)) return place_outcome::failed;

    m_log->info("Moved {} -> {}", name.string(), target.string());
    return place_outcome::moved;
}

fs::path mover::free_target(const fs::path& dest_dir, const fs::path& filename) const {
    std::error_code ec;
    fs::path candidate = dest_dir / filename;
    if (!fs::exists(fs::symlink_status(candidate, ec))) {
        return ec && ec != std::errc::no_such_file_or_directory ? fs::path{} : candidate;
    }

    const auto stem = filename.stem().string();
    const auto ext = filename.extension().string();
    for (std::size_t attempt = 1; attempt <= max_collision_attempts; ++attempt) {
        candidate = dest_dir / (stem + "_" + std::to_string(attempt) + ext);
        ec.clear();
        if (!fs::exists(fs::symlink_status(candidate, ec))) {
            if (ec && ec != std::errc::no_such_file_or_directory) {
                m_log->warn("Failed to check {}: {}", candidate.string(), ec.message());
                return {};
            }
            m_log->debug("{} exists, using {}", (dest_dir / filename).string(), candidate.string());
            return candidate;
        }
    }
    return {};
}

bool mover::move_file(const fs::path& source, const fs::path& target) const {
    std::error_code ec;
    fs::rename(source, target, ec);
    if (!ec) return true;

    if (ec != std::errc::cross_device_link) {
        m_log->error("Failed to move {}: {}", source.filename().string(), ec.message());
        return false;
    }

    std::error_code copy_ec;
    fs::copy_file(source, target, fs::copy_options::none, copy_ec);
    if (copy_ec) {
        m_log->error("Failed to copy {} to {}: {}", source.string(), target.string(), copy_ec.message());
        return false;
    }

    std::error_code remove_ec;
    fs::remove(source, remove_ec);
    if (remove_ec) {
        m_log->error("Copied {} but failed to remove the original: {}", source.string(), remove_ec.message());
        return false;
    }
    return true;
}

} // namespace sorter
