#include "payout.hh"
#include "core/logging.hh"

namespace escrow {

// ============================================================================
// FeeRecipients Implementation
// ============================================================================

FeeRecipients::FeeRecipients(const Address& foundation,
                             const Address& operations,
                             const Address& operator_address)
    : foundation_(foundation)
    , operations_(operations)
    , operator_(operator_address) {}

Address FeeRecipients::foundation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return foundation_;
}

Address FeeRecipients::operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_;
}

MarketError FeeRecipients::set_foundation(const Address& caller, const Address& foundation) {
    if (caller != operator_) {
        ESCROW_LOG_WARN(log::payout) << "Foundation change rejected for " << caller.short_hex();
        return MarketError::UNAUTHORIZED;
    }
    if (foundation.is_zero()) {
        return MarketError::INVALID_PARAMETERS;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    foundation_ = foundation;
    ESCROW_LOG_INFO(log::payout) << "Foundation address set to " << foundation.short_hex();
    return MarketError::NONE;
}

// ============================================================================
// Split Arithmetic
// ============================================================================

TicketSplit split_ticket(amount_t ticket_price, const ProtocolConfig& config) {
    TicketSplit split;
    split.foundation = ticket_price * config.foundation_fee_percent / PERCENT_DENOMINATOR;
    split.operations = ticket_price * config.operations_fee_percent / PERCENT_DENOMINATOR;
    split.pool = ticket_price - split.foundation - split.operations;
    return split;
}

PrizeSplit split_lottery_pool(amount_t pool, const ProtocolConfig& config) {
    PrizeSplit split;
    split.winner = pool * config.lottery_winner_percent / PERCENT_DENOMINATOR;
    split.operations = pool - split.winner;
    return split;
}

SlashSplit split_timeout_slash(amount_t seller_deposit, const ProtocolConfig& config) {
    SlashSplit split;
    split.operations = seller_deposit * config.timeout_slash_percent / PERCENT_DENOMINATOR;
    split.seller = seller_deposit - split.operations;
    return split;
}

amount_t seller_deposit_for(amount_t goal_amount, const ProtocolConfig& config) {
    return goal_amount * config.seller_deposit_percent / PERCENT_DENOMINATOR;
}

amount_t failure_refund_share(amount_t remaining_pool, std::size_t remaining_claimants) {
    if (remaining_claimants == 0) {
        return 0;
    }
    return remaining_pool / static_cast<amount_t>(remaining_claimants);
}

WithholdingAnalysis analyze_withholding(
    MarketType type,
    amount_t prize_pool,
    amount_t seller_deposit,
    amount_t goal_amount,
    const ProtocolConfig& config) {

    WithholdingAnalysis analysis;
    amount_t slash = split_timeout_slash(seller_deposit, config).operations;

    if (type == MarketType::LOTTERY) {
        analysis.seller_loss = slash;
        analysis.max_gain = split_lottery_pool(prize_pool, config).winner;
    } else {
        analysis.seller_loss = slash + prize_pool;
        analysis.max_gain = goal_amount;
    }
    return analysis;
}

// ============================================================================
// PayoutEngine Implementation
// ============================================================================

PayoutEngine::PayoutEngine(AccountBook& book, const Address& escrow_account)
    : book_(book)
    , escrow_(escrow_account) {}

MarketError PayoutEngine::pay(const Address& to, amount_t amount, std::string_view reason) {
    if (amount == 0) {
        return MarketError::NONE;
    }

    auto result = book_.transfer(escrow_, to, amount);
    if (result != AccountBook::TransferResult::SUCCESS) {
        ESCROW_LOG_WARN(log::payout) << "Payout of " << amount << " (" << reason << ") to "
                                     << to.short_hex() << " failed: "
                                     << transfer_result_string(result);
        return MarketError::TRANSFER_FAILED;
    }

    ESCROW_LOG_DEBUG(log::payout) << "Paid " << amount << " (" << reason << ") to " << to.short_hex();
    return MarketError::NONE;
}

MarketError PayoutEngine::collect(const Address& from, amount_t amount) {
    if (amount == 0) {
        return MarketError::NONE;
    }

    auto result = book_.transfer(from, escrow_, amount);
    switch (result) {
        case AccountBook::TransferResult::SUCCESS:
            return MarketError::NONE;
        case AccountBook::TransferResult::INSUFFICIENT_BALANCE:
            return MarketError::INSUFFICIENT_FUNDS;
        case AccountBook::TransferResult::RECIPIENT_REJECTED:
        case AccountBook::TransferResult::INVALID_RECIPIENT:
            break;
    }
    return MarketError::TRANSFER_FAILED;
}

}  // namespace escrow
