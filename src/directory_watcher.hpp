#pragma once

#include "watch_event.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sorter {

// Non-recursive inotify watch on one directory. Entries created in or
// moved into it are reported as create events.
class directory_watcher {
public:
    using event_handler = std::function<void(const watch_event&)>;
    using error_handler = std::function<void(const std::string&)>;

    // Throws std::system_error if the inotify watch cannot be set up.
    directory_watcher(asio::io_context& ioc, std::filesystem::path root,
                      std::shared_ptr<spdlog::logger> log);
    ~directory_watcher();

    // Read events until close() is called. Handlers run on the
    // io_context thread, one event at a time.
    asio::awaitable<void> run(event_handler on_event, error_handler on_error);

    // Cancel the pending read and release the inotify descriptor.
    void close();

    // Decode a buffer of raw inotify records. Sets `overflowed` when the
    // kernel queue overflowed and events were lost.
    static std::vector<watch_event> decode(const std::filesystem::path& root,
                                           const char* data, std::size_t len,
                                           bool& overflowed);

    // Pause before re-reading after `consecutive_errors` failed reads in a
    // row: doubles from 100ms, capped at 5s.
    static std::chrono::milliseconds error_backoff(unsigned consecutive_errors);

private:
    std::filesystem::path m_root;
    std::shared_ptr<spdlog::logger> m_log;
    asio::posix::stream_descriptor m_fd;
    int m_wd = -1;
};

} // namespace sorter
