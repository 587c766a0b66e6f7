#pragma once

#include <memory>
#include <string>
#include <vector>

#include "nmsync/core/errors.hpp"
#include "nmsync/core/types.hpp"

struct _notmuch_message;

namespace nmsync::engine {

using u8 = nmsync::core::u8;

struct Session;
class Database;

enum class FreezeState : u8 {
    Normal = 0,
    Frozen = 1,
};

// ========================================================================
// Message Handle
// ========================================================================

// Owns one engine message. Released when the handle is destroyed, reset or
// overwritten. If the owning Database is closed first the handle becomes
// invalid: every operation returns {Bindings, Unavailable} and accessors
// return empty values.
//
// Calls that build strings or vectors report allocation failure as
// {Bindings, Unknown}.
class Message {
public:
    Message() noexcept;
    ~Message() noexcept;

    Message(const Message&) = delete;
    Message& operator=(const Message&) = delete;
    Message(Message&& other) noexcept;
    Message& operator=(Message&& other) noexcept;

    // Holds a message whose session is still open.
    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] FreezeState state() const noexcept;

    // Release the engine message now. A Frozen message is released without
    // committing; the engine drops its buffered tag changes.
    void reset() noexcept;

    // Accessors. Empty on an invalid handle.
    [[nodiscard]] std::string id() const;
    [[nodiscard]] std::string thread_id() const;
    [[nodiscard]] std::string filename() const;
    [[nodiscard]] nmsync::core::Timestamp date() const noexcept;

    // Value of a header ("" if the message has no such header).
    [[nodiscard]] nmsync::core::Status header(const char* name, std::string* out) const noexcept;

    // Every filename the engine associates with this message.
    [[nodiscard]] nmsync::core::Status filenames(std::vector<std::string>* out) const noexcept;

    // Current tags, in engine order. Empty (not an error) when untagged.
    // While Frozen this is the tag set as of freeze(); changes made since
    // become visible after thaw().
    [[nodiscard]] nmsync::core::Status tags(std::vector<std::string>* out) const noexcept;

    // Tag mutation. Idempotent; tag syntax is validated by the engine.
    [[nodiscard]] nmsync::core::Status add_tag(const char* tag) noexcept;
    [[nodiscard]] nmsync::core::Status remove_tag(const char* tag) noexcept;
    [[nodiscard]] nmsync::core::Status remove_all_tags() noexcept;

    // Normal -> Frozen, snapshotting the current tags.
    // {Bindings, Conflict} if already Frozen.
    [[nodiscard]] nmsync::core::Status freeze() noexcept;

    // Frozen -> Normal, committing buffered tag changes.
    // {Bindings, Invalid} if not Frozen.
    [[nodiscard]] nmsync::core::Status thaw() noexcept;

    // Maildir info flags (":2,FRS") <-> flag tags (flagged, replied, unread...).
    [[nodiscard]] nmsync::core::Status maildir_flags_to_tags() noexcept;
    [[nodiscard]] nmsync::core::Status tags_to_maildir_flags() noexcept;

private:
    friend class Database;

    Message(std::shared_ptr<Session> session, _notmuch_message* msg) noexcept;

    [[nodiscard]] nmsync::core::Status check_usable() const noexcept;

    std::shared_ptr<Session> session_;
    _notmuch_message* msg_{nullptr};
    FreezeState state_{FreezeState::Normal};
    std::vector<std::string> frozen_tags_;
};

// ========================================================================
// Freeze Guard
// ========================================================================

// Brackets a batch of tag mutations on one message. The batch is committed
// by commit(), or on destruction unless commit() or abandon() was reached.
//
// The guard keeps a pointer to the message: the message must outlive the
// guard and must not be moved from while the guard is held.
class FreezeGuard {
public:
    explicit FreezeGuard(Message& msg) noexcept;
    ~FreezeGuard() noexcept;

    FreezeGuard(const FreezeGuard&) = delete;
    FreezeGuard& operator=(const FreezeGuard&) = delete;

    [[nodiscard]] nmsync::core::Status acquire() noexcept;
    [[nodiscard]] nmsync::core::Status commit() noexcept;

    // Drops the batch: the message is released while still Frozen, so none
    // of its buffered changes reach the index. The Message is left empty.
    [[nodiscard]] nmsync::core::Status abandon() noexcept;

    [[nodiscard]] bool held() const noexcept { return held_; }

private:
    Message* msg_;
    bool held_{false};
};

} // namespace nmsync::engine
