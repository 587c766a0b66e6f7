#include "nmsync/engine/message.hpp"
#include "nmsync/engine/status.hpp"
#include "nmsync/core/log.hpp"

#include "session.hpp"

#include <notmuch.h>

#include <new>
#include <utility>

namespace nmsync::engine {

using namespace nmsync::core;

namespace {
    std::string copy_engine_string(const char* s) {
        return s ? std::string(s) : std::string();
    }

    [[nodiscard]] Status out_of_memory() noexcept {
        return make_status(StatusDomain::Bindings, StatusCode::Unknown);
    }
} // namespace

// ========================================================================
// Lifetime
// ========================================================================

Message::Message() noexcept = default;

Message::Message(std::shared_ptr<Session> session, _notmuch_message* msg) noexcept
    : session_(std::move(session)), msg_(msg) {}

Message::~Message() noexcept {
    reset();
}

Message::Message(Message&& other) noexcept
    : session_(std::move(other.session_)),
      msg_(std::exchange(other.msg_, nullptr)),
      state_(std::exchange(other.state_, FreezeState::Normal)),
      frozen_tags_(std::move(other.frozen_tags_)) {}

Message& Message::operator=(Message&& other) noexcept {
    if (this != &other) {
        reset();
        session_ = std::move(other.session_);
        msg_ = std::exchange(other.msg_, nullptr);
        state_ = std::exchange(other.state_, FreezeState::Normal);
        frozen_tags_ = std::move(other.frozen_tags_);
        other.frozen_tags_.clear();
    }
    return *this;
}

void Message::reset() noexcept {
    if (msg_ != nullptr && session_open(session_.get())) {
        if (state_ == FreezeState::Frozen) {
            log_debug("releasing frozen message; unsynced tag changes are dropped");
        }
        notmuch_message_destroy(msg_);
    }
    // Once the session is closed the engine has already freed msg_.
    msg_ = nullptr;
    state_ = FreezeState::Normal;
    frozen_tags_.clear();
    session_.reset();
}

bool Message::valid() const noexcept {
    return msg_ != nullptr && session_open(session_.get());
}

FreezeState Message::state() const noexcept {
    return state_;
}

Status Message::check_usable() const noexcept {
    if (msg_ == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    if (!session_open(session_.get())) {
        return make_status(StatusDomain::Bindings, StatusCode::Unavailable);
    }
    return ok_status();
}

// ========================================================================
// Accessors
// ========================================================================

std::string Message::id() const {
    if (!valid()) {
        return {};
    }
    return copy_engine_string(notmuch_message_get_message_id(msg_));
}

std::string Message::thread_id() const {
    if (!valid()) {
        return {};
    }
    return copy_engine_string(notmuch_message_get_thread_id(msg_));
}

std::string Message::filename() const {
    if (!valid()) {
        return {};
    }
    return copy_engine_string(notmuch_message_get_filename(msg_));
}

Timestamp Message::date() const noexcept {
    if (!valid()) {
        return 0;
    }
    return static_cast<Timestamp>(notmuch_message_get_date(msg_));
}

Status Message::header(const char* name, std::string* out) const noexcept {
    if (name == nullptr || out == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }

    // NULL means the engine failed; a missing header is "".
    const char* value = notmuch_message_get_header(msg_, name);
    if (value == nullptr) {
        return make_status(StatusDomain::Engine, StatusCode::Unknown);
    }
    try {
        out->assign(value);
    } catch (const std::bad_alloc&) {
        return out_of_memory();
    }
    return ok_status();
}

Status Message::filenames(std::vector<std::string>* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    out->clear();
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }

    notmuch_filenames_t* names = notmuch_message_get_filenames(msg_);
    if (names == nullptr) {
        return ok_status();
    }
    try {
        for (; notmuch_filenames_valid(names); notmuch_filenames_move_to_next(names)) {
            out->emplace_back(notmuch_filenames_get(names));
        }
    } catch (const std::bad_alloc&) {
        notmuch_filenames_destroy(names);
        out->clear();
        return out_of_memory();
    }
    notmuch_filenames_destroy(names);
    return ok_status();
}

// ========================================================================
// Tags
// ========================================================================

Status Message::tags(std::vector<std::string>* out) const noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    out->clear();
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }

    // The engine applies frozen changes to this handle immediately.
    if (state_ == FreezeState::Frozen) {
        try {
            *out = frozen_tags_;
        } catch (const std::bad_alloc&) {
            return out_of_memory();
        }
        return ok_status();
    }

    notmuch_tags_t* cursor = notmuch_message_get_tags(msg_);
    if (cursor == nullptr) {
        return ok_status();
    }
    try {
        for (; notmuch_tags_valid(cursor); notmuch_tags_move_to_next(cursor)) {
            out->emplace_back(notmuch_tags_get(cursor));
        }
    } catch (const std::bad_alloc&) {
        notmuch_tags_destroy(cursor);
        out->clear();
        return out_of_memory();
    }
    notmuch_tags_destroy(cursor);
    return ok_status();
}

Status Message::add_tag(const char* tag) noexcept {
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }
    return from_engine(notmuch_message_add_tag(msg_, tag));
}

Status Message::remove_tag(const char* tag) noexcept {
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }
    return from_engine(notmuch_message_remove_tag(msg_, tag));
}

Status Message::remove_all_tags() noexcept {
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }
    return from_engine(notmuch_message_remove_all_tags(msg_));
}

// ========================================================================
// Freeze / Thaw
// ========================================================================

Status Message::freeze() noexcept {
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }
    if (state_ == FreezeState::Frozen) {
        return make_status(StatusDomain::Bindings, StatusCode::Conflict);
    }

    std::vector<std::string> snapshot;
    s = tags(&snapshot);
    if (!is_ok(s)) {
        return s;
    }

    s = from_engine(notmuch_message_freeze(msg_));
    if (is_ok(s)) {
        frozen_tags_ = std::move(snapshot);
        state_ = FreezeState::Frozen;
    }
    return s;
}

Status Message::thaw() noexcept {
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }
    if (state_ != FreezeState::Frozen) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }

    s = from_engine(notmuch_message_thaw(msg_));
    if (is_ok(s)) {
        state_ = FreezeState::Normal;
        frozen_tags_.clear();
    }
    return s;
}

// ========================================================================
// Maildir Flags
// ========================================================================

Status Message::maildir_flags_to_tags() noexcept {
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }
    return from_engine(notmuch_message_maildir_flags_to_tags(msg_));
}

Status Message::tags_to_maildir_flags() noexcept {
    Status s = check_usable();
    if (!is_ok(s)) {
        return s;
    }
    return from_engine(notmuch_message_tags_to_maildir_flags(msg_));
}

// ========================================================================
// FreezeGuard
// ========================================================================

FreezeGuard::FreezeGuard(Message& msg) noexcept : msg_(&msg) {}

FreezeGuard::~FreezeGuard() noexcept {
    if (!held_) {
        return;
    }
    const Status s = commit();
    if (!is_ok(s)) {
        log_warn("thaw on scope exit failed: %s", status_message(s));
    }
}

Status FreezeGuard::acquire() noexcept {
    if (held_) {
        return make_status(StatusDomain::Bindings, StatusCode::Conflict);
    }
    const Status s = msg_->freeze();
    if (is_ok(s)) {
        held_ = true;
    }
    return s;
}

Status FreezeGuard::commit() noexcept {
    if (!held_) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    held_ = false;
    return msg_->thaw();
}

Status FreezeGuard::abandon() noexcept {
    if (!held_) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    held_ = false;
    msg_->reset();
    return ok_status();
}

} // namespace nmsync::engine
