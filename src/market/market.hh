#pragma once

#include "core/types.hh"
#include "core/config.hh"
#include "chain/chain.hh"
#include "identity/verifier.hh"
#include "market/ledger.hh"
#include "market/payout.hh"
#include "market/randomness.hh"
#include "state/account.hh"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace escrow {

// ============================================================================
// Market Parameters
// ============================================================================

struct MarketParams {
    MarketType type = MarketType::LOTTERY;
    amount_t ticket_price = 0;
    amount_t deposit_per_entry = 0;
    amount_t goal_amount = 0;
    std::uint32_t prepared_quantity = 0;    // RAFFLE prizes; ignored for LOTTERY
    timestamp_t end_time{0};
    std::uint32_t max_participants = 0;     // 0 = unlimited
    RandomnessMode randomness_mode = RandomnessMode::PRE_COMMITTED;
    SettlementMode settlement_mode = SettlementMode::SEPARATE_SETTLE;

    [[nodiscard]] amount_t entry_payment() const { return ticket_price + deposit_per_entry; }

    // NONE when usable at `now`
    [[nodiscard]] MarketError validate(timestamp_t now, std::string* detail = nullptr) const;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<MarketParams> deserialize(
        std::span<const std::uint8_t> data);

    static constexpr std::size_t SERIALIZED_SIZE =
        1 +                         // type
        sizeof(amount_t) * 3 +      // ticket_price, deposit_per_entry, goal_amount
        sizeof(std::uint32_t) +     // prepared_quantity
        sizeof(std::uint64_t) +     // end_time
        sizeof(std::uint32_t) +     // max_participants
        1 +                         // randomness_mode
        1;                          // settlement_mode
};

// Direct creation has payer == seller; a factory forwards the seller's
// deposit and creates on their behalf.
struct CreateRequest {
    MarketParams params;
    Address seller;
    Address payer;
    amount_t payment = 0;
    std::optional<hash_t> secret_nullifier;     // required for PRE_COMMITTED
};

// ============================================================================
// Market State
// ============================================================================

struct MarketState {
    market_id_t id = 0;
    Address address;
    Address seller;
    MarketParams params;
    MarketStatus status = MarketStatus::CREATED;

    amount_t seller_deposit = 0;
    amount_t prize_pool = 0;

    EntryLedger ledger;
    std::vector<Address> winners;
    RandomnessState randomness;

    // CONFIRM_RECEIPT raffles complete once every winner has confirmed
    std::uint32_t confirmed_winners = 0;
    timestamp_t revealed_at{0};

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<MarketState> deserialize(
        std::span<const std::uint8_t> data);
};

// Deterministic escrow address of a market
[[nodiscard]] Address market_address(market_id_t id, const Address& seller);

// ============================================================================
// Events
// ============================================================================

enum class MarketEventType : std::uint8_t {
    CREATED = 0,
    OPENED = 1,
    ENTERED = 2,
    CLOSED = 3,
    FAILED = 4,
    COMMITTED = 5,
    WINNERS_SELECTED = 6,
    SETTLED = 7,
    SLASHED = 8,
    REFUNDED = 9,
    RECEIPT_CONFIRMED = 10,
};

[[nodiscard]] std::string_view market_event_string(MarketEventType type);

struct MarketEvent {
    MarketEventType type;
    market_id_t market = 0;
    Address account;            // actor or recipient; zero when not applicable
    amount_t amount = 0;
    MarketStatus status = MarketStatus::CREATED;    // status after the operation
};

// ============================================================================
// Operation Result
// ============================================================================

struct OpResult {
    MarketError error = MarketError::NONE;
    MarketStatus current = MarketStatus::CREATED;
    MarketStatus expected = MarketStatus::CREATED;  // meaningful for INVALID_STATE
    std::string detail;

    [[nodiscard]] bool ok() const { return error == MarketError::NONE; }

    [[nodiscard]] static OpResult success(MarketStatus status) {
        OpResult r;
        r.current = status;
        r.expected = status;
        return r;
    }
    [[nodiscard]] static OpResult failure(MarketError error, MarketStatus current, std::string detail) {
        OpResult r;
        r.error = error;
        r.current = current;
        r.expected = current;
        r.detail = std::move(detail);
        return r;
    }
    [[nodiscard]] static OpResult invalid_state(MarketStatus current, MarketStatus expected) {
        OpResult r;
        r.error = MarketError::INVALID_STATE;
        r.current = current;
        r.expected = expected;
        r.detail = std::string("expected ") + std::string(market_status_string(expected)) +
                   ", market is " + std::string(market_status_string(current));
        return r;
    }
};

// ============================================================================
// Market Engine - lifecycle of one escrow market
// ============================================================================

// Every operation checks the status first and is all-or-nothing: a failure
// restores the market state and rolls back every balance the operation touched.
// Events are published only when the operation succeeds.
//
// Operations hold the book's exclusive lock for their whole body. One started
// while the book has an open checkpoint (from a receive hook, on this market or
// any other sharing the book) is refused with REENTRANT_CALL. Queries are not
// synchronized with operations running on other threads.
//
// The engine is pinned in memory (receive hooks in tests and integrations
// capture it), so it is created through create() and held by unique_ptr.
class MarketEngine {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    struct Context {
        AccountBook& book;
        const IdentityVerifier& verifier;
        const ChainView& chain;
        const FeeRecipients& fees;
        const ProtocolConfig& config;
    };

    struct CreateResult {
        OpResult result;
        std::unique_ptr<MarketEngine> market;
    };

    [[nodiscard]] static CreateResult create(
        market_id_t id,
        const CreateRequest& request,
        const Context& ctx);

    MarketEngine(Passkey, MarketState state, const Context& ctx);

    MarketEngine(const MarketEngine&) = delete;
    MarketEngine& operator=(const MarketEngine&) = delete;

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    [[nodiscard]] OpResult open_market(const Address& caller);
    [[nodiscard]] OpResult enter(const Address& caller, amount_t payment, const IdentityProof& proof);
    [[nodiscard]] OpResult close_entries(const Address& caller);
    [[nodiscard]] OpResult commit(const Address& caller, const hash_t& commitment);
    [[nodiscard]] OpResult reveal(const Address& caller, const hash_t& secret);
    [[nodiscard]] OpResult cancel_by_timeout(const Address& caller);
    [[nodiscard]] OpResult settle(const Address& caller);
    [[nodiscard]] OpResult confirm_receipt(const Address& caller);

    // CONFIRM_RECEIPT only: once the confirmation window has passed, anyone may
    // complete the market. Unconfirmed winner deposits go to operations.
    [[nodiscard]] OpResult finalize_unconfirmed(const Address& caller);
    [[nodiscard]] OpResult claim_refund(const Address& caller);
    [[nodiscard]] OpResult refund_all(const Address& caller);

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    [[nodiscard]] const MarketState& state() const { return state_; }
    [[nodiscard]] MarketStatus status() const { return state_.status; }
    [[nodiscard]] market_id_t id() const { return state_.id; }
    [[nodiscard]] const Address& address() const { return state_.address; }
    [[nodiscard]] const hash_t& external_nullifier() const { return external_nullifier_; }
    [[nodiscard]] const std::vector<MarketEvent>& events() const { return events_; }

    // Balance actually held in escrow
    [[nodiscard]] amount_t held_balance() const;

    // prize_pool + seller_deposit + every unclaimed participant deposit
    [[nodiscard]] amount_t owed_balance() const;

    [[nodiscard]] WithholdingAnalysis withholding_analysis() const;
    [[nodiscard]] bool withholding_deterred() const { return withholding_analysis().deterred(); }

    [[nodiscard]] std::size_t winner_count_target() const;

    [[nodiscard]] timestamp_t confirmation_deadline() const {
        return state_.revealed_at + config_.confirm_window;
    }

private:
    class Operation;
    friend class Operation;

    template<typename Body>
    OpResult run(std::string_view name, Body&& body);

    void emit(MarketEventType type, const Address& account = {}, amount_t amount = 0);

    [[nodiscard]] OpResult done() const { return OpResult::success(state_.status); }
    [[nodiscard]] OpResult fail(MarketError error, std::string detail) const {
        return OpResult::failure(error, state_.status, std::move(detail));
    }

    // Shared by claim_refund and refund_all
    [[nodiscard]] OpResult refund_participant(const Address& participant);

    [[nodiscard]] OpResult fail_market(std::string_view reason);
    [[nodiscard]] OpResult select_winners(const std::vector<Address>& winners);
    [[nodiscard]] OpResult pay_lottery_settlement(amount_t winner_extra);
    [[nodiscard]] OpResult pay_raffle_settlement();

    MarketState state_;
    AccountBook& book_;
    const IdentityVerifier& verifier_;
    const ChainView& chain_;
    const FeeRecipients& fees_;
    const ProtocolConfig& config_;
    RandomnessProtocol randomness_;
    PayoutEngine payout_;
    hash_t external_nullifier_{};

    std::vector<MarketEvent> pending_events_;
    std::vector<MarketEvent> events_;
};

// ============================================================================
// Market Factory - id assignment and ownership of hosted markets
// ============================================================================

class MarketFactory {
public:
    MarketFactory(AccountBook& book,
                  const IdentityVerifier& verifier,
                  const ChainView& chain,
                  const FeeRecipients& fees,
                  ProtocolConfig config = {});

    // On success the market is hosted and returned; the id is consumed only then
    [[nodiscard]] OpResult create_market(const CreateRequest& request, MarketEngine** out = nullptr);

    [[nodiscard]] MarketEngine* find(market_id_t id);
    [[nodiscard]] std::size_t market_count() const;
    [[nodiscard]] const ProtocolConfig& config() const { return config_; }

private:
    AccountBook& book_;
    const IdentityVerifier& verifier_;
    const ChainView& chain_;
    const FeeRecipients& fees_;
    ProtocolConfig config_;

    std::map<market_id_t, std::unique_ptr<MarketEngine>> markets_;
    market_id_t next_id_ = 1;
    mutable std::mutex mutex_;
};

}  // namespace escrow
