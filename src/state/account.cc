#include "account.hh"
#include "core/logging.hh"
#include <algorithm>

namespace escrow {

// ============================================================================
// Balances
// ============================================================================

amount_t AccountBook::balance(const Address& addr) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = balances_.find(addr);
    return it == balances_.end() ? 0 : it->second;
}

void AccountBook::mint(const Address& addr, amount_t amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    set_balance(addr, balance(addr) + amount);
    total_supply_ += amount;
    ESCROW_LOG_TRACE(log::state) << "Minted " << amount << " to " << addr.short_hex();
}

void AccountBook::set_balance(const Address& addr, amount_t value) {
    if (!checkpoints_.empty()) {
        auto it = balances_.find(addr);
        journal_.push_back({addr, it == balances_.end() ? 0 : it->second});
    }
    balances_[addr] = value;
}

// ============================================================================
// Transfers
// ============================================================================

AccountBook::TransferResult AccountBook::transfer(
    const Address& from,
    const Address& to,
    amount_t amount) {

    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (to.is_zero()) {
        ESCROW_LOG_DEBUG(log::state) << "Transfer failed: zero recipient";
        return TransferResult::INVALID_RECIPIENT;
    }

    amount_t from_balance = balance(from);
    if (from_balance < amount) {
        ESCROW_LOG_DEBUG(log::state) << "Transfer failed: insufficient balance "
                                     << from_balance << " < " << amount;
        return TransferResult::INSUFFICIENT_BALANCE;
    }

    checkpoint_t cp = checkpoint();

    set_balance(from, from_balance - amount);
    set_balance(to, balance(to) + amount);

    auto hook_it = hooks_.find(to);
    if (hook_it != hooks_.end()) {
        // Copy: the hook may replace itself while running
        ReceiveHook hook = hook_it->second;
        if (!hook(from, amount)) {
            rollback(cp);
            ESCROW_LOG_DEBUG(log::state) << "Transfer of " << amount << " rejected by "
                                         << to.short_hex();
            return TransferResult::RECIPIENT_REJECTED;
        }
    }

    commit(cp);
    ESCROW_LOG_TRACE(log::state) << "Transfer: " << amount << " units "
                                 << from.short_hex() << " -> " << to.short_hex();
    return TransferResult::SUCCESS;
}

void AccountBook::set_receive_hook(const Address& addr, ReceiveHook hook) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    hooks_[addr] = std::move(hook);
}

void AccountBook::clear_receive_hook(const Address& addr) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    hooks_.erase(addr);
}

// ============================================================================
// Checkpoints
// ============================================================================

AccountBook::checkpoint_t AccountBook::checkpoint() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    checkpoint_t cp = journal_.size();
    checkpoints_.push_back(cp);
    return cp;
}

void AccountBook::commit(checkpoint_t cp) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    discard_checkpoint(cp);
    if (checkpoints_.empty()) {
        journal_.clear();
    }
}

void AccountBook::rollback(checkpoint_t cp) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    while (journal_.size() > cp) {
        const JournalEntry& entry = journal_.back();
        balances_[entry.address] = entry.previous;
        journal_.pop_back();
    }
    discard_checkpoint(cp);
    if (checkpoints_.empty()) {
        journal_.clear();
    }
}

void AccountBook::discard_checkpoint(checkpoint_t cp) {
    // Inner checkpoints that were never closed go with the outer one
    while (!checkpoints_.empty() && checkpoints_.back() >= cp) {
        bool matched = checkpoints_.back() == cp;
        checkpoints_.pop_back();
        if (matched) {
            break;
        }
    }
}

std::size_t AccountBook::open_checkpoints() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return checkpoints_.size();
}

std::unique_lock<std::recursive_mutex> AccountBook::lock_exclusive() const {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

amount_t AccountBook::total_supply() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return total_supply_;
}

std::size_t AccountBook::account_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return balances_.size();
}

}  // namespace escrow
