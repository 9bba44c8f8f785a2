#pragma once

#include <string>

namespace sorter {

enum class event_kind {
    create,   // new entry in the watched root (created or moved in)
    other
};

struct watch_event {
    std::string path;
    event_kind kind = event_kind::other;
};

} // namespace sorter
