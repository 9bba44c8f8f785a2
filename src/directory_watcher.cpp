#include "directory_watcher.hpp"
#include <asio/buffer.hpp>
#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <sys/inotify.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace sorter {

namespace {

constexpr uint32_t watch_mask = IN_CREATE | IN_MOVED_TO;

int open_inotify() {
    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "inotify_init1");
    return fd;
}

} // namespace

directory_watcher::directory_watcher(asio::io_context& ioc, std::filesystem::path root,
                                     std::shared_ptr<spdlog::logger> log)
    : m_root(std::move(root)), m_log(std::move(log)), m_fd(ioc, open_inotify())
{
    m_wd = inotify_add_watch(m_fd.native_handle(), m_root.c_str(), watch_mask);
    if (m_wd < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "inotify_add_watch '" + m_root.string() + "'");
    }
    m_log->info("Watching '{}'", m_root.string());
}

directory_watcher::~directory_watcher() {
    close();
}

void directory_watcher::close() {
    if (!m_fd.is_open()) return;

    asio::error_code ec;
    m_fd.cancel(ec);
    m_fd.close(ec);
    if (ec) m_log->warn("Closing inotify descriptor: {}", ec.message());
}

std::vector<watch_event> directory_watcher::decode(const std::filesystem::path& root,
                                                   const char* data, std::size_t len,
                                                   bool& overflowed) {
    std::vector<watch_event> events;
    overflowed = false;

    std::size_t offset = 0;
    while (offset + sizeof(inotify_event) <= len) {
        inotify_event ev;
        std::memcpy(&ev, data + offset, sizeof(inotify_event));
        const std::size_t record = sizeof(inotify_event) + ev.len;
        if (offset + record > len) break;

        if (ev.mask & IN_Q_OVERFLOW) {
            overflowed = true;
        } else if (ev.len > 0) {
            // name is NUL-padded to ev.len
            const char* name = data + offset + sizeof(inotify_event);
            watch_event out;
            out.path = (root / std::string(name, ::strnlen(name, ev.len))).string();
            out.kind = (ev.mask & (IN_CREATE | IN_MOVED_TO)) ? event_kind::create : event_kind::other;
            events.push_back(std::move(out));
        }

        offset += record;
    }
    return events;
}

std::chrono::milliseconds directory_watcher::error_backoff(unsigned consecutive_errors) {
    constexpr std::chrono::milliseconds base{100};
    constexpr std::chrono::milliseconds cap{5000};
    if (consecutive_errors == 0) return std::chrono::milliseconds{0};

    const unsigned shift = consecutive_errors - 1 < 6 ? consecutive_errors - 1 : 6;
    const auto delay = base * (1u << shift);
    return delay < cap ? delay : cap;
}

asio::awaitable<void> directory_watcher::run(event_handler on_event, error_handler on_error) {
    alignas(inotify_event) char buf[64 * 1024];
    asio::steady_timer backoff(m_fd.get_executor());
    unsigned consecutive_errors = 0;

    while (m_fd.is_open()) {
        asio::error_code ec;
        std::size_t n = co_await m_fd.async_read_some(
            asio::buffer(buf, sizeof(buf)), asio::redirect_error(asio::use_awaitable, ec));

        if (ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor) break;
        if (ec) {
            on_error(ec.message());
            backoff.expires_after(error_backoff(++consecutive_errors));
            asio::error_code wait_ec;
            co_await backoff.async_wait(asio::redirect_error(asio::use_awaitable, wait_ec));
            continue;
        }
        consecutive_errors = 0;

        bool overflowed = false;
        auto events = decode(m_root, buf, n, overflowed);
        if (overflowed) on_error("inotify queue overflow, events were dropped");

        for (const auto& ev : events) {
            on_event(ev);
            if (!m_fd.is_open()) break;
        }
    }

    m_log->debug("Watcher on '{}' stopped", m_root.string());
}

} // namespace sorter
