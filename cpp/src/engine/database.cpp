#include "nmsync/engine/database.hpp"
#include "nmsync/engine/status.hpp"
#include "nmsync/core/log.hpp"

#include "session.hpp"

#include <notmuch.h>

#include <cstdlib>
#include <new>
#include <utility>

namespace nmsync::engine {

using namespace nmsync::core;

namespace {
    // An empty config path keeps the engine from reading any configuration
    // file; the mail root passed in is the only input.
    constexpr const char* kNoConfigFile = "";

    [[nodiscard]] Status out_of_memory() noexcept {
        return make_status(StatusDomain::Bindings, StatusCode::Unknown);
    }

    // Keeps the engine's message if it can be copied; always frees it.
    void take_error_message(char* msg, std::string* out) noexcept {
        out->clear();
        if (msg == nullptr) {
            return;
        }
        try {
            out->assign(msg);
        } catch (const std::bad_alloc&) {
            out->clear();
        }
        std::free(msg);
    }

    // A failed create/open may still hand back a partially built session.
    void discard_failed_session(notmuch_database_t* db) noexcept {
        if (db == nullptr) {
            return;
        }
        const Status s = from_engine(notmuch_database_destroy(db));
        if (!is_ok(s)) {
            log_debug("releasing failed session: %s", status_message(s));
        }
    }

    notmuch_database_mode_t to_engine_mode(Mode mode) noexcept {
        return mode == Mode::ReadWrite ? NOTMUCH_DATABASE_MODE_READ_WRITE
                                       : NOTMUCH_DATABASE_MODE_READ_ONLY;
    }
} // namespace

// ========================================================================
// Lifetime
// ========================================================================

Database::Database() noexcept = default;

Database::~Database() noexcept {
    if (!is_open()) {
        return;
    }
    const Status s = close();
    if (!is_ok(s)) {
        log_warn("closing database on destruction failed: %s", status_message(s));
    }
}

Database::Database(Database&& other) noexcept
    : session_(std::move(other.session_)),
      mode_(other.mode_),
      last_error_(std::move(other.last_error_)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (is_open()) {
            const Status s = close();
            if (!is_ok(s)) {
                log_warn("closing database on move-assignment failed: %s", status_message(s));
            }
        }
        session_ = std::move(other.session_);
        mode_ = other.mode_;
        last_error_ = std::move(other.last_error_);
    }
    return *this;
}

bool Database::is_open() const noexcept {
    return session_open(session_.get());
}

Status Database::check_open() const noexcept {
    if (!is_open()) {
        return make_status(StatusDomain::Bindings, StatusCode::Unavailable);
    }
    return ok_status();
}

// ========================================================================
// Lifecycle
// ========================================================================

Status Database::create(const char* path) noexcept {
    if (path == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    if (is_open()) {
        return make_status(StatusDomain::Bindings, StatusCode::Conflict);
    }

    notmuch_database_t* db = nullptr;
    char* err_msg = nullptr;
    const notmuch_status_t st =
        notmuch_database_create_with_config(path, kNoConfigFile, nullptr, &db, &err_msg);
    take_error_message(err_msg, &last_error_);
    if (st != NOTMUCH_STATUS_SUCCESS) {
        discard_failed_session(db);
        return engine_error(st);
    }

    try {
        session_ = std::make_shared<Session>();
    } catch (const std::bad_alloc&) {
        discard_failed_session(db);
        return out_of_memory();
    }
    session_->db = db;
    mode_ = Mode::ReadWrite;
    log_debug("created database at %s", path);
    return ok_status();
}

Status Database::open(const char* path, Mode mode) noexcept {
    if (path == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    if (is_open()) {
        return make_status(StatusDomain::Bindings, StatusCode::Conflict);
    }

    notmuch_database_t* db = nullptr;
    char* err_msg = nullptr;
    const notmuch_status_t st = notmuch_database_open_with_config(
        path, to_engine_mode(mode), kNoConfigFile, nullptr, &db, &err_msg);
    take_error_message(err_msg, &last_error_);
    if (st != NOTMUCH_STATUS_SUCCESS) {
        discard_failed_session(db);
        return engine_error(st);
    }

    try {
        session_ = std::make_shared<Session>();
    } catch (const std::bad_alloc&) {
        discard_failed_session(db);
        return out_of_memory();
    }
    session_->db = db;
    mode_ = mode;
    log_debug("opened database at %s (%s)", path, mode == Mode::ReadWrite ? "read-write" : "read-only");
    return ok_status();
}

Status Database::close() noexcept {
    if (!is_open()) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }

    // The engine frees the session even when destroy reports a failure, so
    // the session is marked closed either way; outstanding Message handles
    // see it and stop touching their (now freed) engine messages.
    notmuch_database_t* db = std::exchange(session_->db, nullptr);
    session_.reset();
    return from_engine(notmuch_database_destroy(db));
}

// ========================================================================
// Format
// ========================================================================

bool Database::needs_upgrade() const noexcept {
    if (!is_open()) {
        return false;
    }
    return notmuch_database_needs_upgrade(session_->db) != 0;
}

Status Database::upgrade(UpgradeProgressFn progress, void* closure) noexcept {
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }
    return from_engine(notmuch_database_upgrade(session_->db, progress, closure));
}

Status Database::version(u32* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }
    *out = static_cast<u32>(notmuch_database_get_version(session_->db));
    return ok_status();
}

Status Database::path(std::string* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }
    const char* p = notmuch_database_get_path(session_->db);
    try {
        out->assign(p ? p : "");
    } catch (const std::bad_alloc&) {
        return out_of_memory();
    }
    return ok_status();
}

// ========================================================================
// Messages
// ========================================================================

Status Database::index_file(const char* path, Message* out, IndexOutcome* outcome) noexcept {
    if (path == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }

    notmuch_message_t* msg = nullptr;
    const notmuch_status_t st =
        notmuch_database_index_file(session_->db, path, nullptr, out ? &msg : nullptr);

    IndexOutcome result{};
    switch (st) {
        case NOTMUCH_STATUS_SUCCESS:
            result = IndexOutcome::Added;
            break;
        case NOTMUCH_STATUS_DUPLICATE_MESSAGE_ID:
            result = IndexOutcome::Merged;
            break;
        default:
            return engine_error(st);
    }

    if (out != nullptr) {
        *out = Message(session_, msg);
    }
    if (outcome != nullptr) {
        *outcome = result;
    }
    return ok_status();
}

Status Database::remove_message(const char* path, RemoveOutcome* out) noexcept {
    if (path == nullptr || out == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }

    // Here the duplicate-id status means "other filenames remain".
    const notmuch_status_t st = notmuch_database_remove_message(session_->db, path);
    switch (st) {
        case NOTMUCH_STATUS_SUCCESS:
            *out = RemoveOutcome::Removed;
            return ok_status();
        case NOTMUCH_STATUS_DUPLICATE_MESSAGE_ID:
            *out = RemoveOutcome::StillReferenced;
            return ok_status();
        default:
            return engine_error(st);
    }
}

Status Database::find_message(const char* id, Message* out, bool* found) noexcept {
    if (id == nullptr || out == nullptr || found == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    *found = false;
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }

    notmuch_message_t* msg = nullptr;
    s = from_engine(notmuch_database_find_message(session_->db, id, &msg));
    if (!is_ok(s)) {
        return s;
    }
    if (msg == nullptr) {
        return ok_status();
    }

    *out = Message(session_, msg);
    *found = true;
    return ok_status();
}

Status Database::find_message_by_filename(const char* path, Message* out, bool* found) noexcept {
    if (path == nullptr || out == nullptr || found == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    *found = false;
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }

    notmuch_message_t* msg = nullptr;
    s = from_engine(notmuch_database_find_message_by_filename(session_->db, path, &msg));
    if (!is_ok(s)) {
        return s;
    }
    if (msg == nullptr) {
        return ok_status();
    }

    *out = Message(session_, msg);
    *found = true;
    return ok_status();
}

// ========================================================================
// Atomic Sections
// ========================================================================

Status Database::begin_atomic() noexcept {
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }
    return from_engine(notmuch_database_begin_atomic(session_->db));
}

Status Database::end_atomic() noexcept {
    Status s = check_open();
    if (!is_ok(s)) {
        return s;
    }
    return from_engine(notmuch_database_end_atomic(session_->db));
}

AtomicSection::AtomicSection(Database& db) noexcept : db_(&db) {}

AtomicSection::~AtomicSection() noexcept {
    if (!active_) {
        return;
    }
    const Status s = commit();
    if (!is_ok(s)) {
        log_warn("ending atomic section on scope exit failed: %s", status_message(s));
    }
}

Status AtomicSection::begin() noexcept {
    if (active_) {
        return make_status(StatusDomain::Bindings, StatusCode::Conflict);
    }
    const Status s = db_->begin_atomic();
    if (is_ok(s)) {
        active_ = true;
    }
    return s;
}

Status AtomicSection::commit() noexcept {
    if (!active_) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    active_ = false;
    return db_->end_atomic();
}

} // namespace nmsync::engine
