#pragma once

#include <notmuch.h>

namespace nmsync::engine {

    // Shared between a Database and every Message obtained from it.
    // db is reset to nullptr when the database is closed; the engine frees
    // all of its messages together with the session at that point.
    struct Session {
        notmuch_database_t* db{nullptr};
    };

    [[nodiscard]] inline bool session_open(const Session* s) noexcept {
        return s != nullptr && s->db != nullptr;
    }

} // namespace nmsync::engine
