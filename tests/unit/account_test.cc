#include <gtest/gtest.h>
#include "state/account.hh"

namespace escrow {
namespace {

class AccountBookTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = Address::from_label("alice");
        bob_ = Address::from_label("bob");
        carol_ = Address::from_label("carol");
        book_.mint(alice_, 1000);
    }

    AccountBook book_;
    Address alice_;
    Address bob_;
    Address carol_;
};

TEST_F(AccountBookTest, MintAndBalance) {
    EXPECT_EQ(book_.balance(alice_), 1000);
    EXPECT_EQ(book_.balance(bob_), 0);
    EXPECT_EQ(book_.total_supply(), 1000);
    EXPECT_EQ(book_.account_count(), 1);
}

TEST_F(AccountBookTest, Transfer) {
    EXPECT_EQ(book_.transfer(alice_, bob_, 300), AccountBook::TransferResult::SUCCESS);
    EXPECT_EQ(book_.balance(alice_), 700);
    EXPECT_EQ(book_.balance(bob_), 300);
    EXPECT_EQ(book_.total_supply(), 1000);
}

TEST_F(AccountBookTest, InsufficientBalance) {
    EXPECT_EQ(book_.transfer(bob_, alice_, 1), AccountBook::TransferResult::INSUFFICIENT_BALANCE);
    EXPECT_EQ(book_.transfer(alice_, bob_, 1001), AccountBook::TransferResult::INSUFFICIENT_BALANCE);
    EXPECT_EQ(book_.balance(alice_), 1000);
}

TEST_F(AccountBookTest, ZeroRecipientRejected) {
    EXPECT_EQ(book_.transfer(alice_, Address{}, 10), AccountBook::TransferResult::INVALID_RECIPIENT);
    EXPECT_EQ(book_.balance(alice_), 1000);
}

// ============================================================================
// Receive Hooks
// ============================================================================

TEST_F(AccountBookTest, HookSeesCreditedBalance) {
    amount_t seen = 0;
    book_.set_receive_hook(bob_, [&](const Address& from, amount_t amount) {
        EXPECT_EQ(from, alice_);
        EXPECT_EQ(amount, 250);
        seen = book_.balance(bob_);
        return true;
    });

    EXPECT_EQ(book_.transfer(alice_, bob_, 250), AccountBook::TransferResult::SUCCESS);
    EXPECT_EQ(seen, 250);
}

TEST_F(AccountBookTest, RejectingHookUndoesTransfer) {
    book_.set_receive_hook(bob_, [](const Address&, amount_t) { return false; });

    EXPECT_EQ(book_.transfer(alice_, bob_, 100), AccountBook::TransferResult::RECIPIENT_REJECTED);
    EXPECT_EQ(book_.balance(alice_), 1000);
    EXPECT_EQ(book_.balance(bob_), 0);
    EXPECT_EQ(book_.open_checkpoints(), 0);
}

TEST_F(AccountBookTest, RejectingHookUndoesNestedTransfers) {
    // Bob forwards to carol, then rejects: both movements disappear
    book_.set_receive_hook(bob_, [&](const Address&, amount_t amount) {
        EXPECT_EQ(book_.transfer(bob_, carol_, amount), AccountBook::TransferResult::SUCCESS);
        return false;
    });

    EXPECT_EQ(book_.transfer(alice_, bob_, 100), AccountBook::TransferResult::RECIPIENT_REJECTED);
    EXPECT_EQ(book_.balance(alice_), 1000);
    EXPECT_EQ(book_.balance(bob_), 0);
    EXPECT_EQ(book_.balance(carol_), 0);
}

TEST_F(AccountBookTest, ClearHook) {
    book_.set_receive_hook(bob_, [](const Address&, amount_t) { return false; });
    book_.clear_receive_hook(bob_);
    EXPECT_EQ(book_.transfer(alice_, bob_, 1), AccountBook::TransferResult::SUCCESS);
}

// ============================================================================
// Checkpoints
// ============================================================================

TEST_F(AccountBookTest, RollbackRestoresBalances) {
    auto cp = book_.checkpoint();
    ASSERT_EQ(book_.transfer(alice_, bob_, 400), AccountBook::TransferResult::SUCCESS);
    ASSERT_EQ(book_.transfer(bob_, carol_, 100), AccountBook::TransferResult::SUCCESS);

    book_.rollback(cp);
    EXPECT_EQ(book_.balance(alice_), 1000);
    EXPECT_EQ(book_.balance(bob_), 0);
    EXPECT_EQ(book_.balance(carol_), 0);
    EXPECT_EQ(book_.open_checkpoints(), 0);
}

TEST_F(AccountBookTest, CommitKeepsBalances) {
    auto cp = book_.checkpoint();
    ASSERT_EQ(book_.transfer(alice_, bob_, 400), AccountBook::TransferResult::SUCCESS);
    book_.commit(cp);

    EXPECT_EQ(book_.balance(bob_), 400);
    EXPECT_EQ(book_.open_checkpoints(), 0);
}

TEST_F(AccountBookTest, InnerCommitOuterRollback) {
    auto outer = book_.checkpoint();
    ASSERT_EQ(book_.transfer(alice_, bob_, 100), AccountBook::TransferResult::SUCCESS);

    auto inner = book_.checkpoint();
    ASSERT_EQ(book_.transfer(alice_, carol_, 100), AccountBook::TransferResult::SUCCESS);
    book_.commit(inner);
    EXPECT_EQ(book_.open_checkpoints(), 1);

    book_.rollback(outer);
    EXPECT_EQ(book_.balance(alice_), 1000);
    EXPECT_EQ(book_.balance(carol_), 0);
}

TEST_F(AccountBookTest, InnerRollbackOuterCommit) {
    auto outer = book_.checkpoint();
    ASSERT_EQ(book_.transfer(alice_, bob_, 100), AccountBook::TransferResult::SUCCESS);

    auto inner = book_.checkpoint();
    ASSERT_EQ(book_.transfer(alice_, carol_, 100), AccountBook::TransferResult::SUCCESS);
    book_.rollback(inner);

    book_.commit(outer);
    EXPECT_EQ(book_.balance(alice_), 900);
    EXPECT_EQ(book_.balance(bob_), 100);
    EXPECT_EQ(book_.balance(carol_), 0);
}

TEST_F(AccountBookTest, ResultStrings) {
    EXPECT_EQ(transfer_result_string(AccountBook::TransferResult::SUCCESS), "success");
    EXPECT_EQ(transfer_result_string(AccountBook::TransferResult::RECIPIENT_REJECTED),
              "recipient_rejected");
}

}  // namespace
}  // namespace escrow
