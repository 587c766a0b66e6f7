#include <gtest/gtest.h>
#include <notmuch.h>

#include <string>
#include <vector>

#include "nmsync/engine/database.hpp"
#include "nmsync/engine/status.hpp"
#include "test_mailroot.hpp"

using namespace nmsync::engine;
using namespace nmsync::core;
using nmsync::test::MailRoot;
using nmsync::test::kSampleMessageId;

namespace {

// Fixture with a freshly created, read-write database.
class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(root_.valid()) << "Failed to create temporary mail root";
        Status s = db_.create(root_.path().c_str());
        ASSERT_TRUE(is_ok(s)) << "create failed: " << status_message(s) << " " << db_.last_error();
    }

    void TearDown() override {
        if (db_.is_open()) {
            EXPECT_TRUE(is_ok(db_.close()));
        }
    }

    MailRoot root_;
    Database db_;
};

} // namespace

//=============================================================================
// Lifecycle
//=============================================================================

TEST(DatabaseLifecycle, CreateCloseReopen) {
    MailRoot root;
    ASSERT_TRUE(root.valid());

    Database db;
    ASSERT_TRUE(is_ok(db.create(root.path().c_str())));
    EXPECT_TRUE(db.is_open());
    EXPECT_EQ(db.mode(), Mode::ReadWrite);
    ASSERT_TRUE(is_ok(db.close()));
    EXPECT_FALSE(db.is_open());

    Status s = db.open(root.path().c_str(), Mode::ReadWrite);
    ASSERT_TRUE(is_ok(s)) << status_message(s) << " " << db.last_error();
    EXPECT_EQ(db.mode(), Mode::ReadWrite);
    EXPECT_TRUE(is_ok(db.close()));
}

TEST(DatabaseLifecycle, CreateOverExistingFails) {
    MailRoot root;
    ASSERT_TRUE(root.valid());

    Database first;
    ASSERT_TRUE(is_ok(first.create(root.path().c_str())));
    ASSERT_TRUE(is_ok(first.close()));

    Database second;
    Status s = second.create(root.path().c_str());
    EXPECT_TRUE(is_engine_error(s));
    EXPECT_FALSE(second.is_open());
}

TEST(DatabaseLifecycle, OpenWithoutIndexFails) {
    MailRoot root;
    ASSERT_TRUE(root.valid());

    Database db;
    Status s = db.open(root.path().c_str(), Mode::ReadOnly);
    EXPECT_TRUE(is_engine_error(s));
    EXPECT_FALSE(db.is_open());
}

TEST(DatabaseLifecycle, CloseTwiceIsRejectedLocally) {
    MailRoot root;
    ASSERT_TRUE(root.valid());

    Database db;
    ASSERT_TRUE(is_ok(db.create(root.path().c_str())));
    ASSERT_TRUE(is_ok(db.close()));

    Status s = db.close();
    EXPECT_EQ(s.domain, StatusDomain::Bindings);
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST(DatabaseLifecycle, CloseNeverOpened) {
    Database db;
    Status s = db.close();
    EXPECT_EQ(s.domain, StatusDomain::Bindings);
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST(DatabaseLifecycle, NullPathIsInvalid) {
    Database db;
    EXPECT_EQ(db.create(nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(db.open(nullptr, Mode::ReadOnly).code, StatusCode::Invalid);
}

TEST(DatabaseLifecycle, MoveTransfersSession) {
    MailRoot root;
    ASSERT_TRUE(root.valid());

    Database a;
    ASSERT_TRUE(is_ok(a.create(root.path().c_str())));

    Database b(std::move(a));
    EXPECT_FALSE(a.is_open());
    EXPECT_TRUE(b.is_open());

    Database c;
    c = std::move(b);
    EXPECT_FALSE(b.is_open());
    EXPECT_TRUE(c.is_open());
    EXPECT_TRUE(is_ok(c.close()));
}

TEST(DatabaseLifecycle, DestructorClosesSession) {
    MailRoot root;
    ASSERT_TRUE(root.valid());
    {
        Database db;
        ASSERT_TRUE(is_ok(db.create(root.path().c_str())));
    }

    // The write lock was released, so a new writer can attach.
    Database again;
    EXPECT_TRUE(is_ok(again.open(root.path().c_str(), Mode::ReadWrite)));
}

TEST_F(DatabaseTest, OpenWhileOpenConflicts) {
    Status s = db_.open(root_.path().c_str(), Mode::ReadOnly);
    EXPECT_EQ(s.domain, StatusDomain::Bindings);
    EXPECT_EQ(s.code, StatusCode::Conflict);
    EXPECT_TRUE(db_.is_open());
}

//=============================================================================
// Format
//=============================================================================

TEST_F(DatabaseTest, FreshDatabaseNeedsNoUpgrade) {
    EXPECT_FALSE(db_.needs_upgrade());

    u32 version = 0;
    ASSERT_TRUE(is_ok(db_.version(&version)));
    EXPECT_GT(version, 0u);
}

TEST_F(DatabaseTest, PathIsReported) {
    std::string path;
    ASSERT_TRUE(is_ok(db_.path(&path)));
    EXPECT_FALSE(path.empty());
}

TEST(DatabaseFormat, ClosedDatabaseQueries) {
    Database db;
    EXPECT_FALSE(db.needs_upgrade());

    u32 version = 0;
    EXPECT_EQ(db.version(&version).code, StatusCode::Unavailable);
    EXPECT_EQ(db.upgrade().code, StatusCode::Unavailable);

    std::string path;
    EXPECT_EQ(db.path(&path).code, StatusCode::Unavailable);
}

//=============================================================================
// Message Lookup and Indexing
//=============================================================================

TEST_F(DatabaseTest, FindUnknownIdIsNotAnError) {
    Message msg;
    bool found = true;
    Status s = db_.find_message("doesnt-exist", &msg, &found);
    EXPECT_TRUE(is_ok(s));
    EXPECT_FALSE(found);
    EXPECT_FALSE(msg.valid());
}

TEST_F(DatabaseTest, IndexFileYieldsMessageId) {
    const std::string file = root_.write_message("sample:2,", kSampleMessageId);

    Message msg;
    IndexOutcome outcome = IndexOutcome::Merged;
    Status s = db_.index_file(file.c_str(), &msg, &outcome);
    ASSERT_TRUE(is_ok(s)) << status_message(s);
    EXPECT_EQ(outcome, IndexOutcome::Added);
    ASSERT_TRUE(msg.valid());
    EXPECT_EQ(msg.id(), kSampleMessageId);

    Message again;
    bool found = false;
    ASSERT_TRUE(is_ok(db_.find_message(msg.id().c_str(), &again, &found)));
    ASSERT_TRUE(found);
    EXPECT_EQ(again.id(), msg.id());
    EXPECT_EQ(again.thread_id(), msg.thread_id());
}

TEST_F(DatabaseTest, ReindexSameFileMerges) {
    const std::string file = root_.write_message("sample:2,", kSampleMessageId);

    Message first;
    ASSERT_TRUE(is_ok(db_.index_file(file.c_str(), &first)));

    Message second;
    IndexOutcome outcome = IndexOutcome::Added;
    Status s = db_.index_file(file.c_str(), &second, &outcome);
    ASSERT_TRUE(is_ok(s)) << status_message(s);
    EXPECT_EQ(outcome, IndexOutcome::Merged);
    EXPECT_EQ(second.id(), first.id());
}

TEST_F(DatabaseTest, IndexWithoutMessageHandle) {
    const std::string file = root_.write_message("sample:2,", kSampleMessageId);

    IndexOutcome outcome = IndexOutcome::Merged;
    ASSERT_TRUE(is_ok(db_.index_file(file.c_str(), nullptr, &outcome)));
    EXPECT_EQ(outcome, IndexOutcome::Added);

    Message msg;
    bool found = false;
    ASSERT_TRUE(is_ok(db_.find_message(kSampleMessageId, &msg, &found)));
    EXPECT_TRUE(found);
}

TEST_F(DatabaseTest, IndexMissingFileIsEngineError) {
    const std::string missing = root_.path() + "/cur/no-such-file:2,";

    Message msg;
    Status s = db_.index_file(missing.c_str(), &msg);
    EXPECT_TRUE(is_engine_error(s));
    EXPECT_NE(s.aux, kEngineSuccess);
    EXPECT_NE(s.aux, kEngineDuplicateMessageId);
    EXPECT_FALSE(msg.valid());
}

TEST_F(DatabaseTest, FindByFilename) {
    const std::string file = root_.write_message("sample:2,", kSampleMessageId);
    ASSERT_TRUE(is_ok(db_.index_file(file.c_str(), nullptr)));

    Message msg;
    bool found = false;
    ASSERT_TRUE(is_ok(db_.find_message_by_filename(file.c_str(), &msg, &found)));
    ASSERT_TRUE(found);
    EXPECT_EQ(msg.id(), kSampleMessageId);

    const std::string other = root_.path() + "/cur/never-indexed:2,";
    Message none;
    found = true;
    ASSERT_TRUE(is_ok(db_.find_message_by_filename(other.c_str(), &none, &found)));
    EXPECT_FALSE(found);
}

TEST_F(DatabaseTest, RemoveReportsRemainingFilenames) {
    const std::string one = root_.write_message("one:2,", kSampleMessageId);
    const std::string two = root_.write_message("two:2,", kSampleMessageId);

    IndexOutcome outcome{};
    ASSERT_TRUE(is_ok(db_.index_file(one.c_str(), nullptr, &outcome)));
    EXPECT_EQ(outcome, IndexOutcome::Added);
    ASSERT_TRUE(is_ok(db_.index_file(two.c_str(), nullptr, &outcome)));
    EXPECT_EQ(outcome, IndexOutcome::Merged);

    RemoveOutcome removed = RemoveOutcome::Removed;
    ASSERT_TRUE(is_ok(db_.remove_message(one.c_str(), &removed)));
    EXPECT_EQ(removed, RemoveOutcome::StillReferenced);

    Message msg;
    bool found = false;
    ASSERT_TRUE(is_ok(db_.find_message(kSampleMessageId, &msg, &found)));
    ASSERT_TRUE(found);
    EXPECT_NE(msg.filename().find("two:2,"), std::string::npos);
    msg.reset();

    ASSERT_TRUE(is_ok(db_.remove_message(two.c_str(), &removed)));
    EXPECT_EQ(removed, RemoveOutcome::Removed);

    ASSERT_TRUE(is_ok(db_.find_message(kSampleMessageId, &msg, &found)));
    EXPECT_FALSE(found);
}

TEST_F(DatabaseTest, NullArgumentsAreInvalid) {
    Message msg;
    bool found = false;
    RemoveOutcome removed{};
    EXPECT_EQ(db_.index_file(nullptr, &msg).code, StatusCode::Invalid);
    EXPECT_EQ(db_.remove_message(nullptr, &removed).code, StatusCode::Invalid);
    EXPECT_EQ(db_.remove_message("x", nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(db_.find_message(nullptr, &msg, &found).code, StatusCode::Invalid);
    EXPECT_EQ(db_.find_message("x", nullptr, &found).code, StatusCode::Invalid);
    EXPECT_EQ(db_.find_message("x", &msg, nullptr).code, StatusCode::Invalid);
}

TEST(DatabaseClosed, OperationsReportUnavailable) {
    Database db;
    Message msg;
    bool found = false;
    RemoveOutcome removed{};
    EXPECT_EQ(db.index_file("/nonexistent", &msg).code, StatusCode::Unavailable);
    EXPECT_EQ(db.remove_message("/nonexistent", &removed).code, StatusCode::Unavailable);
    EXPECT_EQ(db.find_message("id", &msg, &found).code, StatusCode::Unavailable);
    EXPECT_EQ(db.begin_atomic().code, StatusCode::Unavailable);
    EXPECT_EQ(db.end_atomic().code, StatusCode::Unavailable);
}

//=============================================================================
// Read-only Sessions
//=============================================================================

TEST(DatabaseReadOnly, MutationsAreRejectedByEngine) {
    MailRoot root;
    ASSERT_TRUE(root.valid());
    const std::string file = root.write_message("sample:2,", kSampleMessageId);
    const std::string extra = root.write_message("extra:2,", "extra@example.com");

    {
        Database rw;
        ASSERT_TRUE(is_ok(rw.create(root.path().c_str())));
        ASSERT_TRUE(is_ok(rw.index_file(file.c_str(), nullptr)));
        ASSERT_TRUE(is_ok(rw.close()));
    }

    Database ro;
    ASSERT_TRUE(is_ok(ro.open(root.path().c_str(), Mode::ReadOnly)));
    EXPECT_EQ(ro.mode(), Mode::ReadOnly);

    Status s = ro.index_file(extra.c_str(), nullptr);
    EXPECT_TRUE(engine_status_is(s, NOTMUCH_STATUS_READ_ONLY_DATABASE));

    Message msg;
    bool found = false;
    ASSERT_TRUE(is_ok(ro.find_message(kSampleMessageId, &msg, &found)));
    ASSERT_TRUE(found);
    s = msg.add_tag("inbox");
    EXPECT_TRUE(engine_status_is(s, NOTMUCH_STATUS_READ_ONLY_DATABASE));

    std::vector<std::string> tags;
    ASSERT_TRUE(is_ok(msg.tags(&tags)));
    EXPECT_TRUE(tags.empty());
}

//=============================================================================
// Atomic Sections
//=============================================================================

TEST_F(DatabaseTest, AtomicSectionCommits) {
    const std::string one = root_.write_message("one:2,", "one@example.com");
    const std::string two = root_.write_message("two:2,", "two@example.com");

    {
        AtomicSection atomic(db_);
        ASSERT_TRUE(is_ok(atomic.begin()));
        EXPECT_TRUE(atomic.active());
        EXPECT_EQ(atomic.begin().code, StatusCode::Conflict);
        ASSERT_TRUE(is_ok(db_.index_file(one.c_str(), nullptr)));
        ASSERT_TRUE(is_ok(db_.index_file(two.c_str(), nullptr)));
        EXPECT_TRUE(is_ok(atomic.commit()));
        EXPECT_FALSE(atomic.active());
        EXPECT_EQ(atomic.commit().code, StatusCode::Invalid);
    }

    Message msg;
    bool found = false;
    ASSERT_TRUE(is_ok(db_.find_message("two@example.com", &msg, &found)));
    EXPECT_TRUE(found);
}

TEST_F(DatabaseTest, AtomicSectionEndsOnScopeExit) {
    {
        AtomicSection atomic(db_);
        ASSERT_TRUE(is_ok(atomic.begin()));
    }

    // Balanced: another end_atomic has nothing to close.
    Status s = db_.end_atomic();
    EXPECT_TRUE(engine_status_is(s, NOTMUCH_STATUS_UNBALANCED_ATOMIC));
}
