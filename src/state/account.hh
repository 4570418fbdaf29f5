#pragma once

#include "core/types.hh"
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace escrow {

// ============================================================================
// Account Book - currency balances of every address
// ============================================================================

// Balances are integer smallest-unit amounts. A recipient may install a receive
// hook that runs after the credit lands; returning false rejects the payment and
// undoes everything the transfer (and the hook) changed.
//
// Checkpoints nest: rollback(cp) restores every balance written since cp was
// taken, commit(cp) keeps them. Market operations wrap their whole body in one
// checkpoint so a failing guard or transfer leaves no trace.
//
// The journal is shared by every market on the book. An operation holds
// lock_exclusive() from its checkpoint to its commit or rollback, so checkpoints
// from different threads never interleave. A market operation started while a
// checkpoint is already open (from a receive hook) could be undone by an outer
// rollback it cannot see, so markets refuse to start one.
class AccountBook {
public:
    using ReceiveHook = std::function<bool(const Address& from, amount_t amount)>;
    using checkpoint_t = std::size_t;

    AccountBook() = default;

    AccountBook(const AccountBook&) = delete;
    AccountBook& operator=(const AccountBook&) = delete;

    [[nodiscard]] amount_t balance(const Address& addr) const;

    // Credit from outside the system (genesis allocation, faucets)
    void mint(const Address& addr, amount_t amount);

    enum class TransferResult {
        SUCCESS,
        INSUFFICIENT_BALANCE,
        RECIPIENT_REJECTED,
        INVALID_RECIPIENT,
    };
    [[nodiscard]] TransferResult transfer(
        const Address& from,
        const Address& to,
        amount_t amount);

    void set_receive_hook(const Address& addr, ReceiveHook hook);
    void clear_receive_hook(const Address& addr);

    [[nodiscard]] checkpoint_t checkpoint();
    void commit(checkpoint_t cp);
    void rollback(checkpoint_t cp);
    [[nodiscard]] std::size_t open_checkpoints() const;

    // Blocks other threads from the book; the owning thread may still re-enter
    [[nodiscard]] std::unique_lock<std::recursive_mutex> lock_exclusive() const;

    [[nodiscard]] amount_t total_supply() const;
    [[nodiscard]] std::size_t account_count() const;

private:
    struct JournalEntry {
        Address address;
        amount_t previous;
    };

    std::unordered_map<Address, amount_t> balances_;
    std::unordered_map<Address, ReceiveHook> hooks_;
    std::vector<JournalEntry> journal_;
    std::vector<checkpoint_t> checkpoints_;
    amount_t total_supply_ = 0;

    // Receive hooks may re-enter the book from the same thread
    mutable std::recursive_mutex mutex_;

    void set_balance(const Address& addr, amount_t value);
    void discard_checkpoint(checkpoint_t cp);
};

[[nodiscard]] inline std::string_view transfer_result_string(AccountBook::TransferResult result) {
    switch (result) {
        case AccountBook::TransferResult::SUCCESS: return "success";
        case AccountBook::TransferResult::INSUFFICIENT_BALANCE: return "insufficient_balance";
        case AccountBook::TransferResult::RECIPIENT_REJECTED: return "recipient_rejected";
        case AccountBook::TransferResult::INVALID_RECIPIENT: return "invalid_recipient";
    }
    return "unknown";
}

}  // namespace escrow
