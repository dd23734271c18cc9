#include "state/state_store.hpp"
#include "state/transaction_guard.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace projstate {

namespace {

ProjectState make_state(const std::string& name) {
    ProjectState state;
    state.project_path = "/work/" + name;
    state.project_name = name;
    state.extensions["build_status"] = "UNKNOWN";
    return state;
}

// Exception type that does not derive from std::exception.
struct NonStandardFailure {
    int code;
};

} // anonymous namespace

// ── Fixture ───────────────────────────────────────────────────────────────────

class TransactionTest : public ::testing::Test {
protected:
    void SetUp() override {
        s0_ = make_state("s0");
        s1_ = make_state("s1");
        s1_.extensions["build_status"] = "SUCCESS";
    }

    MockClock    clock_;
    StateStore   store_{StoreOptions{}, nullptr, &clock_};
    ProjectState s0_;
    ProjectState s1_;
};

// ── begin / commit / rollback ─────────────────────────────────────────────────

TEST_F(TransactionTest, RollbackRestoresPreImageExactly) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");
    store_.set_state(s1_);
    store_.set_state(make_state("s2"));

    store_.rollback_transaction(txn);

    EXPECT_EQ(store_.get_state(), s0_);
    EXPECT_FALSE(store_.active_transaction().has_value());
}

TEST_F(TransactionTest, MutationsInsideTransactionAreVisibleImmediately) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");
    store_.set_state(s1_);

    EXPECT_EQ(store_.get_state(), s1_);
    store_.rollback_transaction(txn);
}

TEST_F(TransactionTest, CommitKeepsLatestAndAppendsSnapshot) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");
    store_.set_state(s1_);
    const auto count_before = store_.snapshot_count();

    store_.commit_transaction(txn);

    EXPECT_EQ(store_.get_state(), s1_);
    EXPECT_EQ(store_.snapshot_count(), count_before + 1);
    auto latest = store_.get_latest_snapshot();
    EXPECT_EQ(latest.state, s1_);
    EXPECT_EQ(latest.operation, "op");
}

TEST_F(TransactionTest, CommitRecordsResultingSnapshotSequence) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");
    store_.set_state(s1_);
    store_.commit_transaction(txn);

    auto history = store_.get_transaction_history(1);
    ASSERT_EQ(history.size(), 1u);
    ASSERT_TRUE(history[0].result_sequence.has_value());
    EXPECT_EQ(store_.get_snapshot(*history[0].result_sequence).state, s1_);
}

TEST_F(TransactionTest, PreImageCapturesStateAtBegin) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");
    store_.set_state(s1_);

    auto active = store_.active_transaction();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->id, txn);
    EXPECT_EQ(active->operation, "op");
    EXPECT_EQ(active->status, TransactionStatus::Active);
    ASSERT_TRUE(active->pre_image.has_value());
    EXPECT_EQ(active->pre_image->state, s0_);
    EXPECT_EQ(active->pre_image->sequence, 1u);

    store_.commit_transaction(txn);
}

TEST_F(TransactionTest, PreImageSequenceNamesSnapshotOfLiveStateAfterRollback) {
    store_.set_state(s0_);
    auto first = store_.begin_transaction("op");
    store_.set_state(s1_);
    store_.rollback_transaction(first);

    auto second = store_.begin_transaction("retry");
    auto active = store_.active_transaction();
    ASSERT_TRUE(active.has_value());
    ASSERT_TRUE(active->pre_image.has_value());
    EXPECT_EQ(active->pre_image->state, s0_);
    EXPECT_EQ(active->pre_image->sequence, 1u);
    EXPECT_EQ(store_.get_snapshot(active->pre_image->sequence).state,
              active->pre_image->state);

    store_.rollback_transaction(second);
}

TEST_F(TransactionTest, PreImageSequenceFollowsSetAfterClear) {
    store_.set_state(s0_);
    store_.clear_state();
    store_.set_state(s1_);

    auto txn = store_.begin_transaction("op");
    auto active = store_.active_transaction();
    ASSERT_TRUE(active->pre_image.has_value());
    EXPECT_EQ(store_.get_snapshot(active->pre_image->sequence).state, s1_);
    store_.rollback_transaction(txn);
}

TEST_F(TransactionTest, RolledBackHistoryKeepsPreImage) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");
    store_.set_state(s1_);
    EXPECT_TRUE(store_.abandon_transaction(txn, "gave up"));

    EXPECT_EQ(store_.get_state(), s0_);
    auto history = store_.get_transaction_history(1);
    ASSERT_EQ(history.size(), 1u);
    ASSERT_TRUE(history[0].pre_image.has_value());
    EXPECT_EQ(history[0].pre_image->state, s0_);
}

TEST_F(TransactionTest, SecondBeginConflicts) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("first");

    try {
        (void)store_.begin_transaction("second");
        FAIL() << "expected TransactionConflictError";
    } catch (const TransactionConflictError& e) {
        EXPECT_EQ(e.active_id(), txn);
    }

    // The original transaction is unaffected.
    store_.commit_transaction(txn);
    EXPECT_NO_THROW(store_.rollback_transaction(store_.begin_transaction("third")));
}

TEST_F(TransactionTest, CommitWithWrongIdThrows) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");

    EXPECT_THROW(store_.commit_transaction(txn + 1), TransactionNotFoundError);
    EXPECT_THROW(store_.rollback_transaction(txn + 1), TransactionNotFoundError);
    EXPECT_TRUE(store_.active_transaction().has_value());
}

TEST_F(TransactionTest, ResolvedTransactionCannotBeResolvedAgain) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");
    store_.commit_transaction(txn);

    EXPECT_THROW(store_.commit_transaction(txn), TransactionNotFoundError);
    EXPECT_THROW(store_.rollback_transaction(txn), TransactionNotFoundError);
}

TEST_F(TransactionTest, TransactionBeforeFirstStateRollsBackToUninitialized) {
    auto txn = store_.begin_transaction("initial-analysis");
    EXPECT_FALSE(store_.active_transaction()->pre_image.has_value());

    store_.set_state(s0_);
    store_.rollback_transaction(txn, std::string("analysis failed"));

    EXPECT_FALSE(store_.has_state());
    EXPECT_THROW((void)store_.get_state(), NoStateError);
}

TEST_F(TransactionTest, CommitWithoutAnyStateAddsNoSnapshot) {
    auto txn = store_.begin_transaction("noop");
    store_.commit_transaction(txn);

    EXPECT_EQ(store_.snapshot_count(), 0u);
    auto history = store_.get_transaction_history(1);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, TransactionStatus::Committed);
    EXPECT_FALSE(history[0].result_sequence.has_value());
}

// ── Transaction history ───────────────────────────────────────────────────────

TEST_F(TransactionTest, HistoryIsMostRecentFirstAndLimited) {
    store_.set_state(s0_);
    for (int i = 0; i < 3; ++i) {
        auto txn = store_.begin_transaction("op" + std::to_string(i));
        clock_.advance(std::chrono::milliseconds{1});
        if (i == 1) {
            store_.rollback_transaction(txn, std::string("boom"));
        } else {
            store_.commit_transaction(txn);
        }
    }

    auto all = store_.get_transaction_history(10);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].operation, "op2");
    EXPECT_EQ(all[1].operation, "op1");
    EXPECT_EQ(all[2].operation, "op0");

    EXPECT_EQ(all[1].status, TransactionStatus::RolledBack);
    ASSERT_TRUE(all[1].error.has_value());
    EXPECT_EQ(*all[1].error, "boom");
    ASSERT_TRUE(all[1].finished_at.has_value());
    EXPECT_GT(*all[1].finished_at, all[1].started_at);

    auto limited = store_.get_transaction_history(2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[0].operation, "op2");
    EXPECT_EQ(limited[1].operation, "op1");

    EXPECT_TRUE(store_.get_transaction_history(0).empty());
}

TEST_F(TransactionTest, TransactionHistoryIsBounded) {
    StateStore store{StoreOptions{.max_transactions = 2}, nullptr, &clock_};
    store.set_state(s0_);
    for (int i = 0; i < 5; ++i) {
        store.commit_transaction(store.begin_transaction("op" + std::to_string(i)));
    }

    auto history = store.get_transaction_history(10);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].operation, "op4");
    EXPECT_EQ(history[1].operation, "op3");
}

TEST(TransactionStatusTest, ToString) {
    EXPECT_EQ(to_string(TransactionStatus::Active), "active");
    EXPECT_EQ(to_string(TransactionStatus::Committed), "committed");
    EXPECT_EQ(to_string(TransactionStatus::RolledBack), "rolled_back");
}

// ── execute_with_rollback() ───────────────────────────────────────────────────

TEST_F(TransactionTest, ExecuteCommitsAndReturnsResult) {
    store_.set_state(s0_);

    int result = store_.execute_with_rollback("generate", [&] {
        store_.set_state(s1_);
        return 42;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(store_.get_state(), s1_);
    EXPECT_FALSE(store_.active_transaction().has_value());

    auto history = store_.get_transaction_history(1);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].operation, "generate");
    EXPECT_EQ(history[0].status, TransactionStatus::Committed);
}

TEST_F(TransactionTest, ExecuteSupportsVoidOperations) {
    store_.set_state(s0_);
    store_.execute_with_rollback("validate", [&] { store_.set_state(s1_); });
    EXPECT_EQ(store_.get_state(), s1_);
}

TEST_F(TransactionTest, ExecuteRollsBackAndRethrowsOriginalError) {
    store_.set_state(s0_);

    try {
        store_.execute_with_rollback("fix", [&]() -> int {
            store_.set_state(s1_);
            throw std::logic_error("compilation failed");
        });
        FAIL() << "expected std::logic_error";
    } catch (const std::logic_error& e) {
        EXPECT_STREQ(e.what(), "compilation failed");
    }

    EXPECT_EQ(store_.get_state(), s0_);
    EXPECT_FALSE(store_.active_transaction().has_value());

    auto history = store_.get_transaction_history(1);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, TransactionStatus::RolledBack);
    ASSERT_TRUE(history[0].error.has_value());
    EXPECT_EQ(*history[0].error, "compilation failed");
}

TEST_F(TransactionTest, ExecuteCallsErrorHandlerAfterRollback) {
    store_.set_state(s0_);

    int calls = 0;
    std::string seen;
    auto on_error = [&](const std::exception& e) {
        ++calls;
        seen = e.what();
        // Rollback has already happened.
        EXPECT_EQ(store_.get_state(), s0_);
        EXPECT_FALSE(store_.active_transaction().has_value());
    };

    EXPECT_THROW(store_.execute_with_rollback(
                     "fix",
                     [&] {
                         store_.set_state(s1_);
                         throw std::runtime_error("mvn test failed");
                     },
                     on_error),
                 std::runtime_error);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen, "mvn test failed");
}

TEST_F(TransactionTest, ExecuteSkipsErrorHandlerOnSuccess) {
    store_.set_state(s0_);

    bool called = false;
    auto result = store_.execute_with_rollback(
        "analyze", [] { return 3; },
        [&](const std::exception&) { called = true; });

    EXPECT_EQ(result, 3);
    EXPECT_FALSE(called);
}

TEST_F(TransactionTest, ExecuteRollsBackOnNonStandardException) {
    store_.set_state(s0_);

    EXPECT_THROW(
        store_.execute_with_rollback("odd", [&] {
            store_.set_state(s1_);
            throw NonStandardFailure{7};
        }),
        NonStandardFailure);

    EXPECT_EQ(store_.get_state(), s0_);
    EXPECT_FALSE(store_.active_transaction().has_value());
}

TEST_F(TransactionTest, ExecuteFailsWhileAnotherTransactionIsActive) {
    store_.set_state(s0_);
    auto txn = store_.begin_transaction("outer");

    bool ran = false;
    EXPECT_THROW(store_.execute_with_rollback("inner", [&] { ran = true; }),
                 TransactionConflictError);
    EXPECT_FALSE(ran);

    // The outer transaction is still the active one.
    EXPECT_EQ(store_.active_transaction()->id, txn);
    store_.rollback_transaction(txn);
}

TEST_F(TransactionTest, ExecuteSurvivesClearStateInsideOperation) {
    store_.set_state(s0_);

    EXPECT_THROW(store_.execute_with_rollback("teardown", [&] {
                     store_.clear_state();
                     throw std::runtime_error("aborted");
                 }),
                 std::runtime_error);

    EXPECT_FALSE(store_.has_state());
}

// ── TransactionGuard ──────────────────────────────────────────────────────────

TEST_F(TransactionTest, GuardRollsBackWhenScopeExitsWithoutCommit) {
    store_.set_state(s0_);
    {
        TransactionGuard txn(store_, "scoped");
        EXPECT_TRUE(txn.armed());
        store_.set_state(s1_);
    }

    EXPECT_EQ(store_.get_state(), s0_);
    auto history = store_.get_transaction_history(1);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].status, TransactionStatus::RolledBack);
}

TEST_F(TransactionTest, GuardCommitDisarms) {
    store_.set_state(s0_);
    {
        TransactionGuard txn(store_, "scoped");
        store_.set_state(s1_);
        txn.commit();
        EXPECT_FALSE(txn.armed());
    }

    EXPECT_EQ(store_.get_state(), s1_);
    EXPECT_EQ(store_.get_transaction_history(1)[0].status, TransactionStatus::Committed);
}

TEST_F(TransactionTest, GuardExplicitRollbackRecordsReason) {
    store_.set_state(s0_);
    {
        TransactionGuard txn(store_, "scoped");
        store_.set_state(s1_);
        txn.rollback("tests did not compile");
        EXPECT_FALSE(txn.armed());
    }

    EXPECT_EQ(store_.get_state(), s0_);
    auto history = store_.get_transaction_history(10);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].error.value_or(""), "tests did not compile");
}

TEST_F(TransactionTest, AbandonReportsUnknownId) {
    EXPECT_FALSE(store_.abandon_transaction(99, "nothing"));

    store_.set_state(s0_);
    auto txn = store_.begin_transaction("op");
    store_.set_state(s1_);
    EXPECT_TRUE(store_.abandon_transaction(txn, "gave up"));
    EXPECT_EQ(store_.get_state(), s0_);
}

} // namespace projstate
