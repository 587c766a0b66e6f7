#pragma once

#include <memory>
#include <string>

#include "nmsync/core/errors.hpp"
#include "nmsync/core/types.hpp"
#include "nmsync/engine/message.hpp"

namespace nmsync::engine {

using u8 = nmsync::core::u8;
using u32 = nmsync::core::u32;

enum class Mode : u8 {
    ReadOnly = 0,
    ReadWrite = 1,
};

// What index_file did with a file whose parse succeeded.
enum class IndexOutcome : u8 {
    Added = 0,   // new message
    Merged = 1,  // message-id already known; filename attached to it
};

// What remove_message did with the message behind a filename.
enum class RemoveOutcome : u8 {
    Removed = 0,          // last filename gone, message dropped from the index
    StillReferenced = 1,  // message persists through other filenames
};

using UpgradeProgressFn = void (*)(void* closure, double progress);

// ========================================================================
// Database Handle
// ========================================================================

// One engine session bound to a mail root. Not copyable; close() releases
// the session exactly once and the destructor closes a session still open.
//
// Messages obtained from a Database share its session record and become
// invalid when it is closed. Allocation failure is {Bindings, Unknown}.
class Database {
public:
    Database() noexcept;
    ~Database() noexcept;

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    // ====================================================================
    // Lifecycle
    // ====================================================================

    // Create a new, empty index under 'path' (the engine adds a ".notmuch"
    // directory there). Fails if an index already exists.
    [[nodiscard]] nmsync::core::Status create(const char* path) noexcept;

    // Open an existing index. Mutations on a ReadOnly session are rejected
    // by the engine.
    [[nodiscard]] nmsync::core::Status open(const char* path, Mode mode) noexcept;

    // Release the session. A second call returns {Bindings, Invalid}
    // without reaching the engine.
    [[nodiscard]] nmsync::core::Status close() noexcept;

    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] Mode mode() const noexcept { return mode_; }

    // Engine's explanation for the last failed create/open, if it gave one.
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    // ====================================================================
    // Format
    // ====================================================================

    [[nodiscard]] bool needs_upgrade() const noexcept;
    [[nodiscard]] nmsync::core::Status upgrade(UpgradeProgressFn progress = nullptr,
                                               void* closure = nullptr) noexcept;
    [[nodiscard]] nmsync::core::Status version(u32* out) const noexcept;
    [[nodiscard]] nmsync::core::Status path(std::string* out) const noexcept;

    // ====================================================================
    // Messages
    // ====================================================================

    // Index a mail file. A file whose message-id is already known is merged
    // into the existing message (IndexOutcome::Merged). 'out' and 'outcome'
    // may be null.
    [[nodiscard]] nmsync::core::Status index_file(const char* path,
                                                  Message* out,
                                                  IndexOutcome* outcome = nullptr) noexcept;

    // Detach a filename from its message.
    [[nodiscard]] nmsync::core::Status remove_message(const char* path, RemoveOutcome* out) noexcept;

    // Exact lookup. An unknown id is not an error: *found is set to false.
    [[nodiscard]] nmsync::core::Status find_message(const char* id, Message* out, bool* found) noexcept;
    [[nodiscard]] nmsync::core::Status find_message_by_filename(const char* path,
                                                                Message* out,
                                                                bool* found) noexcept;

    // ====================================================================
    // Atomic Sections
    // ====================================================================

    // Nestable; the outermost end_atomic() commits. See AtomicSection.
    [[nodiscard]] nmsync::core::Status begin_atomic() noexcept;
    [[nodiscard]] nmsync::core::Status end_atomic() noexcept;

private:
    [[nodiscard]] nmsync::core::Status check_open() const noexcept;

    std::shared_ptr<Session> session_;
    Mode mode_{Mode::ReadOnly};
    std::string last_error_;
};

// Ends an atomic section on destruction unless commit() already did.
// The database must outlive the section and must not be moved from or
// closed while it is active.
class AtomicSection {
public:
    explicit AtomicSection(Database& db) noexcept;
    ~AtomicSection() noexcept;

    AtomicSection(const AtomicSection&) = delete;
    AtomicSection& operator=(const AtomicSection&) = delete;

    [[nodiscard]] nmsync::core::Status begin() noexcept;
    [[nodiscard]] nmsync::core::Status commit() noexcept;
    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    Database* db_;
    bool active_{false};
};

} // namespace nmsync::engine
