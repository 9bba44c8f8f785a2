#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>

namespace test_support {

inline auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Fresh directory under the system temp dir, removed on destruction.
class temp_dir {
public:
    temp_dir() {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() /
                 ("entropy_sorter_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }

    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    std::filesystem::path write(const std::string& rel, const std::string& content = "data") const {
        auto p = m_path / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }

private:
    std::filesystem::path m_path;
};

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace test_support
