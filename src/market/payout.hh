#pragma once

#include "core/types.hh"
#include "core/config.hh"
#include "state/account.hh"
#include <limits>
#include <mutex>
#include <string_view>

namespace escrow {

// ============================================================================
// Fee Recipients
// ============================================================================

// Shared by every market of an engine; markets read it at payout time so a
// foundation change applies to later fees only.
class FeeRecipients {
public:
    FeeRecipients(const Address& foundation,
                  const Address& operations,
                  const Address& operator_address);

    [[nodiscard]] Address foundation() const;
    [[nodiscard]] Address operations() const;
    [[nodiscard]] const Address& operator_address() const { return operator_; }

    // Only the operator may rotate the foundation address
    [[nodiscard]] MarketError set_foundation(const Address& caller, const Address& foundation);

private:
    Address foundation_;
    Address operations_;
    Address operator_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Split Arithmetic - integer, round down, remainder to the pool side
// ============================================================================

// Largest amount a percentage split can scale without overflow. Ticket prices,
// goals and prize pools are kept at or below it.
inline constexpr amount_t MAX_SCALED_AMOUNT =
    std::numeric_limits<amount_t>::max() / PERCENT_DENOMINATOR;

struct TicketSplit {
    amount_t foundation = 0;
    amount_t operations = 0;
    amount_t pool = 0;
};

struct PrizeSplit {
    amount_t winner = 0;
    amount_t operations = 0;
};

struct SlashSplit {
    amount_t operations = 0;
    amount_t seller = 0;
};

[[nodiscard]] TicketSplit split_ticket(amount_t ticket_price, const ProtocolConfig& config);
[[nodiscard]] PrizeSplit split_lottery_pool(amount_t pool, const ProtocolConfig& config);
[[nodiscard]] SlashSplit split_timeout_slash(amount_t seller_deposit, const ProtocolConfig& config);
[[nodiscard]] amount_t seller_deposit_for(amount_t goal_amount, const ProtocolConfig& config);

// Equal share of what is left; the last claimant receives all of it
[[nodiscard]] amount_t failure_refund_share(amount_t remaining_pool, std::size_t remaining_claimants);

// ============================================================================
// Withholding Analysis
// ============================================================================

// A seller that sees an unfavourable outcome can refuse to reveal. Withholding
// is deterred only when what the seller forfeits exceeds what a chosen outcome
// could be worth to them.
struct WithholdingAnalysis {
    amount_t seller_loss = 0;
    amount_t max_gain = 0;

    [[nodiscard]] bool deterred() const { return seller_loss > max_gain; }
};

// LOTTERY: loss is the slash, gain is the prize a colluding entrant would take.
// RAFFLE: loss is the slash plus the forfeited pool, gain is the goal amount
// (the declared value of the goods the seller keeps).
[[nodiscard]] WithholdingAnalysis analyze_withholding(
    MarketType type,
    amount_t prize_pool,
    amount_t seller_deposit,
    amount_t goal_amount,
    const ProtocolConfig& config);

// ============================================================================
// Payout Engine - moves value out of one market's escrow account
// ============================================================================

class PayoutEngine {
public:
    PayoutEngine(AccountBook& book, const Address& escrow_account);

    // Zero amounts succeed without touching the book
    [[nodiscard]] MarketError pay(const Address& to, amount_t amount, std::string_view reason);

    // Pulls a payment into escrow
    [[nodiscard]] MarketError collect(const Address& from, amount_t amount);

    [[nodiscard]] amount_t held() const { return book_.balance(escrow_); }
    [[nodiscard]] const Address& escrow_account() const { return escrow_; }

private:
    AccountBook& book_;
    Address escrow_;
};

}  // namespace escrow
