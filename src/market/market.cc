#include "market.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"
#include <algorithm>
#include <limits>

namespace escrow {

// ============================================================================
// MarketParams
// ============================================================================

MarketError MarketParams::validate(timestamp_t now, std::string* detail) const {
    auto reject = [detail](MarketError error, std::string_view why) {
        if (detail) {
            *detail = std::string(why);
        }
        return error;
    };

    if (ticket_price == 0) {
        return reject(MarketError::INVALID_PARAMETERS, "ticket price must be positive");
    }
    if (goal_amount == 0) {
        return reject(MarketError::INVALID_PARAMETERS, "goal amount must be positive");
    }
    if (ticket_price > MAX_SCALED_AMOUNT || goal_amount > MAX_SCALED_AMOUNT ||
        deposit_per_entry > std::numeric_limits<amount_t>::max() - ticket_price) {
        return reject(MarketError::INVALID_PARAMETERS, "amounts out of range");
    }
    if (end_time <= now) {
        return reject(MarketError::INVALID_PARAMETERS, "end time must be in the future");
    }
    if (type == MarketType::RAFFLE) {
        if (prepared_quantity == 0) {
            return reject(MarketError::INVALID_TARGET_ENTRIES, "raffle needs at least one prize");
        }
        if (max_participants != 0 && max_participants <= prepared_quantity) {
            return reject(MarketError::INVALID_TARGET_ENTRIES,
                          "capacity must exceed the prepared quantity");
        }
    }
    return MarketError::NONE;
}

std::vector<std::uint8_t> MarketParams::serialize() const {
    std::vector<std::uint8_t> result;
    result.reserve(SERIALIZED_SIZE);

    result.push_back(static_cast<std::uint8_t>(type));
    append_u64(result, ticket_price);
    append_u64(result, deposit_per_entry);
    append_u64(result, goal_amount);
    append_u32(result, prepared_quantity);
    append_u64(result, static_cast<std::uint64_t>(end_time.count()));
    append_u32(result, max_participants);
    result.push_back(static_cast<std::uint8_t>(randomness_mode));
    result.push_back(static_cast<std::uint8_t>(settlement_mode));

    return result;
}

std::optional<MarketParams> MarketParams::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < SERIALIZED_SIZE) {
        return std::nullopt;
    }

    MarketParams params;
    const std::uint8_t* ptr = data.data();

    if (*ptr > static_cast<std::uint8_t>(MarketType::RAFFLE)) {
        return std::nullopt;
    }
    params.type = static_cast<MarketType>(*ptr++);

    params.ticket_price = decode_u64(ptr);
    ptr += sizeof(amount_t);
    params.deposit_per_entry = decode_u64(ptr);
    ptr += sizeof(amount_t);
    params.goal_amount = decode_u64(ptr);
    ptr += sizeof(amount_t);
    params.prepared_quantity = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);
    params.end_time = timestamp_t{static_cast<timestamp_t::rep>(decode_u64(ptr))};
    ptr += sizeof(std::uint64_t);
    params.max_participants = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);

    if (ptr[0] > static_cast<std::uint8_t>(RandomnessMode::POST_CLOSE_COMMIT) ||
        ptr[1] > static_cast<std::uint8_t>(SettlementMode::CONFIRM_RECEIPT)) {
        return std::nullopt;
    }
    params.randomness_mode = static_cast<RandomnessMode>(ptr[0]);
    params.settlement_mode = static_cast<SettlementMode>(ptr[1]);

    return params;
}

// ============================================================================
// MarketState Serialization
// ============================================================================

std::vector<std::uint8_t> MarketState::serialize() const {
    std::vector<std::uint8_t> result;

    append_u64(result, id);
    result.insert(result.end(), address.bytes.begin(), address.bytes.end());
    result.insert(result.end(), seller.bytes.begin(), seller.bytes.end());

    auto params_bytes = params.serialize();
    result.insert(result.end(), params_bytes.begin(), params_bytes.end());

    result.push_back(static_cast<std::uint8_t>(status));
    append_u64(result, seller_deposit);
    append_u64(result, prize_pool);
    append_u32(result, confirmed_winners);
    append_u64(result, static_cast<std::uint64_t>(revealed_at.count()));

    append_u32(result, static_cast<std::uint32_t>(winners.size()));
    for (const auto& winner : winners) {
        result.insert(result.end(), winner.bytes.begin(), winner.bytes.end());
    }

    auto randomness_bytes = randomness.serialize();
    result.insert(result.end(), randomness_bytes.begin(), randomness_bytes.end());

    // Variable-length ledger goes last
    auto ledger_bytes = ledger.serialize();
    result.insert(result.end(), ledger_bytes.begin(), ledger_bytes.end());

    return result;
}

std::optional<MarketState> MarketState::deserialize(std::span<const std::uint8_t> data) {
    constexpr std::size_t HEADER_SIZE =
        sizeof(market_id_t) + ADDRESS_SIZE * 2 + MarketParams::SERIALIZED_SIZE +
        1 + sizeof(amount_t) * 2 + sizeof(std::uint32_t) * 2 + sizeof(std::uint64_t);

    if (data.size() < HEADER_SIZE) {
        return std::nullopt;
    }

    MarketState state;
    const std::uint8_t* ptr = data.data();
    const std::uint8_t* end = data.data() + data.size();

    state.id = decode_u64(ptr);
    ptr += sizeof(market_id_t);
    std::copy(ptr, ptr + ADDRESS_SIZE, state.address.bytes.begin());
    ptr += ADDRESS_SIZE;
    std::copy(ptr, ptr + ADDRESS_SIZE, state.seller.bytes.begin());
    ptr += ADDRESS_SIZE;

    auto params = MarketParams::deserialize(std::span<const std::uint8_t>(ptr, end));
    if (!params) {
        return std::nullopt;
    }
    state.params = *params;
    ptr += MarketParams::SERIALIZED_SIZE;

    if (*ptr > static_cast<std::uint8_t>(MarketStatus::FAILED)) {
        return std::nullopt;
    }
    state.status = static_cast<MarketStatus>(*ptr++);

    state.seller_deposit = decode_u64(ptr);
    ptr += sizeof(amount_t);
    state.prize_pool = decode_u64(ptr);
    ptr += sizeof(amount_t);
    state.confirmed_winners = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);
    state.revealed_at = timestamp_t{static_cast<timestamp_t::rep>(decode_u64(ptr))};
    ptr += sizeof(std::uint64_t);

    std::uint32_t winner_count = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);

    if (static_cast<std::size_t>(end - ptr) <
        static_cast<std::size_t>(winner_count) * ADDRESS_SIZE + RandomnessState::SERIALIZED_SIZE) {
        return std::nullopt;
    }

    state.winners.resize(winner_count);
    for (auto& winner : state.winners) {
        std::copy(ptr, ptr + ADDRESS_SIZE, winner.bytes.begin());
        ptr += ADDRESS_SIZE;
    }

    auto randomness = RandomnessState::deserialize(std::span<const std::uint8_t>(ptr, end));
    if (!randomness) {
        return std::nullopt;
    }
    state.randomness = *randomness;
    ptr += RandomnessState::SERIALIZED_SIZE;

    std::size_t consumed = 0;
    auto ledger = EntryLedger::deserialize(std::span<const std::uint8_t>(ptr, end), &consumed);
    if (!ledger || ptr + consumed != end) {
        return std::nullopt;
    }
    state.ledger = std::move(*ledger);

    return state;
}

Address market_address(market_id_t id, const Address& seller) {
    SHA3Hasher hasher;
    hasher.update(std::string_view("escrow.market"));
    hasher.update_u64(id);
    hasher.update(seller);
    return Address{hasher.finalize()};
}

std::string_view market_event_string(MarketEventType type) {
    switch (type) {
        case MarketEventType::CREATED: return "created";
        case MarketEventType::OPENED: return "opened";
        case MarketEventType::ENTERED: return "entered";
        case MarketEventType::CLOSED: return "closed";
        case MarketEventType::FAILED: return "failed";
        case MarketEventType::COMMITTED: return "committed";
        case MarketEventType::WINNERS_SELECTED: return "winners_selected";
        case MarketEventType::SETTLED: return "settled";
        case MarketEventType::SLASHED: return "slashed";
        case MarketEventType::REFUNDED: return "refunded";
        case MarketEventType::RECEIPT_CONFIRMED: return "receipt_confirmed";
    }
    return "unknown";
}

// ============================================================================
// Operation Scope
// ============================================================================

// Holds a state snapshot and a book checkpoint for one operation. Unless
// commit() is reached, destruction restores both. The caller holds the book's
// exclusive lock for the scope's lifetime.
class MarketEngine::Operation {
public:
    explicit Operation(MarketEngine& engine)
        : engine_(engine)
        , snapshot_(engine.state_)
        , checkpoint_(engine.book_.checkpoint()) {
        engine_.pending_events_.clear();
    }

    ~Operation() {
        if (!finished_) {
            abort();
        }
    }

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    void commit() {
        engine_.book_.commit(checkpoint_);
        for (auto& event : engine_.pending_events_) {
            ESCROW_LOG_INFO(log::market) << "Market " << event.market << " "
                                         << market_event_string(event.type)
                                         << (event.account.is_zero() ? "" : " ")
                                         << (event.account.is_zero() ? "" : event.account.short_hex())
                                         << " amount=" << event.amount
                                         << " status=" << market_status_string(event.status);
            engine_.events_.push_back(event);
        }
        engine_.pending_events_.clear();
        finished_ = true;
    }

    void abort() {
        engine_.book_.rollback(checkpoint_);
        engine_.state_ = std::move(snapshot_);
        engine_.pending_events_.clear();
        finished_ = true;
    }

private:
    MarketEngine& engine_;
    MarketState snapshot_;
    AccountBook::checkpoint_t checkpoint_;
    bool finished_ = false;
};

template<typename Body>
OpResult MarketEngine::run(std::string_view name, Body&& body) {
    auto lock = book_.lock_exclusive();

    if (book_.open_checkpoints() != 0) {
        ESCROW_LOG_WARN(log::market) << "Market " << state_.id << ": " << name
                                     << " refused inside another book operation";
        return fail(MarketError::REENTRANT_CALL, "operation already executing on this book");
    }

    Operation op(*this);
    OpResult result = body();

    if (result.ok()) {
        op.commit();
    } else {
        op.abort();
        ESCROW_LOG_DEBUG(log::market) << "Market " << state_.id << ": " << name << " failed: "
                                      << market_error_string(result.error)
                                      << (result.detail.empty() ? "" : " (")
                                      << result.detail
                                      << (result.detail.empty() ? "" : ")");
    }

    result.current = state_.status;
    if (result.error != MarketError::INVALID_STATE) {
        result.expected = state_.status;
    }
    return result;
}

void MarketEngine::emit(MarketEventType type, const Address& account, amount_t amount) {
    pending_events_.push_back(MarketEvent{type, state_.id, account, amount, state_.status});
}

// ============================================================================
// Creation
// ============================================================================

MarketEngine::MarketEngine(Passkey, MarketState state, const Context& ctx)
    : state_(std::move(state))
    , book_(ctx.book)
    , verifier_(ctx.verifier)
    , chain_(ctx.chain)
    , fees_(ctx.fees)
    , config_(ctx.config)
    , randomness_(ctx.config)
    , payout_(ctx.book, state_.address)
    , external_nullifier_(external_nullifier_hash(ctx.config.app_scope, state_.address)) {}

MarketEngine::CreateResult MarketEngine::create(
    market_id_t id,
    const CreateRequest& request,
    const Context& ctx) {

    CreateResult out;
    auto reject = [&out](MarketError error, std::string detail) {
        out.result = OpResult::failure(error, MarketStatus::CREATED, std::move(detail));
        ESCROW_LOG_DEBUG(log::market) << "Market creation rejected: "
                                      << market_error_string(error) << " (" << out.result.detail << ")";
        return std::move(out);
    };

    std::string problem = ctx.config.validate();
    if (!problem.empty()) {
        return reject(MarketError::INVALID_PARAMETERS, "protocol config: " + problem);
    }
    if (request.seller.is_zero() || request.payer.is_zero()) {
        return reject(MarketError::INVALID_PARAMETERS, "seller and payer must be set");
    }

    MarketError params_error = request.params.validate(ctx.chain.now(), &problem);
    if (params_error != MarketError::NONE) {
        return reject(params_error, problem);
    }

    if (request.params.randomness_mode == RandomnessMode::PRE_COMMITTED &&
        !request.secret_nullifier) {
        return reject(MarketError::INVALID_PARAMETERS, "pre-committed market needs a secret");
    }

    amount_t deposit = seller_deposit_for(request.params.goal_amount, ctx.config);
    if (request.payment != deposit) {
        return reject(MarketError::INSUFFICIENT_FUNDS,
                      "creation payment must equal the seller deposit of " + std::to_string(deposit));
    }

    MarketState state;
    state.id = id;
    state.address = market_address(id, request.seller);
    state.seller = request.seller;
    state.params = request.params;
    state.status = MarketStatus::CREATED;
    state.seller_deposit = deposit;

    RandomnessProtocol randomness(ctx.config);
    state.randomness = request.params.randomness_mode == RandomnessMode::PRE_COMMITTED
        ? randomness.pre_committed(*request.secret_nullifier, state.address)
        : randomness.post_close();

    auto market = std::make_unique<MarketEngine>(Passkey{}, std::move(state), ctx);

    auto lock = ctx.book.lock_exclusive();
    if (ctx.book.open_checkpoints() != 0) {
        return reject(MarketError::REENTRANT_CALL, "creation inside another book operation");
    }

    MarketError paid = market->payout_.collect(request.payer, deposit);
    if (paid != MarketError::NONE) {
        return reject(paid, "seller deposit could not be collected");
    }

    market->events_.push_back(MarketEvent{MarketEventType::CREATED, id, request.seller,
                                          deposit, MarketStatus::CREATED});

    ESCROW_LOG_INFO(log::market) << "Market " << id << " created: "
                                 << market_type_string(request.params.type)
                                 << " seller=" << request.seller.short_hex()
                                 << " deposit=" << deposit
                                 << " goal=" << request.params.goal_amount;

    out.result = OpResult::success(MarketStatus::CREATED);
    out.market = std::move(market);
    return out;
}

// ============================================================================
// Lifecycle Operations
// ============================================================================

OpResult MarketEngine::open_market(const Address& caller) {
    return run("open", [&]() -> OpResult {
        if (state_.status != MarketStatus::CREATED) {
            return OpResult::invalid_state(state_.status, MarketStatus::CREATED);
        }
        if (caller != state_.seller) {
            return fail(MarketError::UNAUTHORIZED, "only the seller may open the market");
        }
        if (chain_.now() >= state_.params.end_time) {
            return fail(MarketError::TIME_EXPIRED, "entry period already over");
        }

        state_.status = MarketStatus::OPEN;
        emit(MarketEventType::OPENED, caller);
        return done();
    });
}

OpResult MarketEngine::enter(const Address& caller, amount_t payment, const IdentityProof& proof) {
    return run("enter", [&]() -> OpResult {
        if (state_.status != MarketStatus::OPEN) {
            return OpResult::invalid_state(state_.status, MarketStatus::OPEN);
        }
        if (chain_.now() >= state_.params.end_time) {
            return fail(MarketError::TIME_EXPIRED, "entry period over");
        }
        if (caller == state_.seller) {
            return fail(MarketError::UNAUTHORIZED, "seller may not enter own market");
        }
        if (state_.params.max_participants != 0 &&
            state_.ledger.size() >= state_.params.max_participants) {
            return fail(MarketError::INVALID_TARGET_ENTRIES, "market is at capacity");
        }
        if (payment != state_.params.entry_payment()) {
            return fail(MarketError::INSUFFICIENT_FUNDS,
                        "payment must equal ticket price plus entry deposit");
        }
        TicketSplit split = split_ticket(state_.params.ticket_price, config_);
        if (state_.prize_pool > MAX_SCALED_AMOUNT - split.pool) {
            return fail(MarketError::INVALID_TARGET_ENTRIES, "prize pool is at its limit");
        }
        if (state_.ledger.is_nullifier_used(proof.nullifier_hash)) {
            return fail(MarketError::ALREADY_PARTICIPATED, "identity already entered");
        }
        if (state_.ledger.has_entered(caller)) {
            return fail(MarketError::ALREADY_PARTICIPATED, "address already entered");
        }
        if (!verifier_.verify(proof.merkle_root, proof.group_id, signal_hash(caller),
                              proof.nullifier_hash, external_nullifier_, proof.proof)) {
            return fail(MarketError::VERIFICATION_FAILED, "identity proof rejected");
        }

        MarketError collected = payout_.collect(caller, payment);
        if (collected != MarketError::NONE) {
            return fail(collected, "entry payment could not be collected");
        }

        if (state_.ledger.record_entry(caller, proof.nullifier_hash, payment) !=
            EntryLedger::RecordResult::RECORDED) {
            return fail(MarketError::ALREADY_PARTICIPATED, "entry not recorded");
        }

        state_.prize_pool += split.pool;

        MarketError paid = payout_.pay(fees_.foundation(), split.foundation, "foundation fee");
        if (paid != MarketError::NONE) {
            return fail(paid, "foundation fee transfer failed");
        }
        paid = payout_.pay(fees_.operations(), split.operations, "operations fee");
        if (paid != MarketError::NONE) {
            return fail(paid, "operations fee transfer failed");
        }

        emit(MarketEventType::ENTERED, caller, payment);
        return done();
    });
}

OpResult MarketEngine::close_entries(const Address& caller) {
    return run("close", [&]() -> OpResult {
        if (state_.status != MarketStatus::OPEN) {
            return OpResult::invalid_state(state_.status, MarketStatus::OPEN);
        }

        bool at_capacity = state_.params.max_participants != 0 &&
                           state_.ledger.size() >= state_.params.max_participants;
        if (chain_.now() < state_.params.end_time && !at_capacity) {
            return fail(MarketError::TIME_NOT_REACHED, "entry period still running");
        }

        ESCROW_LOG_DEBUG(log::market) << "Market " << state_.id << " closing by "
                                      << caller.short_hex() << " with "
                                      << state_.ledger.size() << " entries";

        if (state_.ledger.empty()) {
            return fail_market("no participants");
        }

        if (state_.params.type == MarketType::LOTTERY) {
            if (state_.prize_pool < state_.params.goal_amount) {
                return fail_market("goal not reached");
            }
        } else if (state_.ledger.size() <= state_.params.prepared_quantity) {
            // Every participant wins; no draw needed
            return select_winners(state_.ledger.participants());
        }

        state_.status = MarketStatus::CLOSED;
        randomness_.anchor(state_.randomness, chain_.height());
        emit(MarketEventType::CLOSED, {}, state_.prize_pool);

        WithholdingAnalysis analysis = withholding_analysis();
        if (!analysis.deterred()) {
            ESCROW_LOG_WARN(log::market) << "Market " << state_.id
                                         << ": seller withholding not deterred (loss "
                                         << analysis.seller_loss << " <= gain "
                                         << analysis.max_gain << ")";
        }
        return done();
    });
}

OpResult MarketEngine::commit(const Address& caller, const hash_t& commitment) {
    return run("commit", [&]() -> OpResult {
        if (state_.status != MarketStatus::CLOSED) {
            return OpResult::invalid_state(state_.status, MarketStatus::CLOSED);
        }
        if (state_.randomness.mode != RandomnessMode::POST_CLOSE_COMMIT) {
            return fail(MarketError::INVALID_STATE, "market randomness was committed at creation");
        }
        if (caller != state_.seller) {
            return fail(MarketError::UNAUTHORIZED, "only the seller may commit");
        }
        if (commitment == hash_t{}) {
            return fail(MarketError::INVALID_PARAMETERS, "empty commitment");
        }

        auto result = randomness_.commit(state_.randomness, commitment, chain_.height());
        switch (result) {
            case RandomnessProtocol::Result::OK:
                break;
            case RandomnessProtocol::Result::EXPIRED:
                return fail(MarketError::TIME_EXPIRED, "commit deadline passed");
            default:
                return fail(MarketError::INVALID_STATE,
                            std::string(randomness_result_string(result)));
        }

        state_.status = MarketStatus::COMMITTED;
        emit(MarketEventType::COMMITTED, caller);
        return done();
    });
}

OpResult MarketEngine::reveal(const Address& caller, const hash_t& secret) {
    return run("reveal", [&]() -> OpResult {
        MarketStatus expected = state_.randomness.mode == RandomnessMode::PRE_COMMITTED
            ? MarketStatus::CLOSED
            : MarketStatus::COMMITTED;
        if (state_.status != expected) {
            return OpResult::invalid_state(state_.status, expected);
        }
        if (caller != state_.seller) {
            return fail(MarketError::UNAUTHORIZED, "only the seller may reveal");
        }

        auto result = randomness_.reveal(state_.randomness, secret, state_.address,
                                         state_.ledger.nullifier_hash_sum(), chain_);
        switch (result) {
            case RandomnessProtocol::Result::OK:
                break;
            case RandomnessProtocol::Result::TOO_EARLY:
                return fail(MarketError::TIME_NOT_REACHED, "snapshot block not produced yet");
            case RandomnessProtocol::Result::EXPIRED:
            case RandomnessProtocol::Result::ENTROPY_UNAVAILABLE:
                return fail(MarketError::TIME_EXPIRED, "reveal window closed");
            case RandomnessProtocol::Result::MISMATCH:
                return fail(MarketError::VERIFICATION_FAILED, "secret does not match commitment");
            default:
                return fail(MarketError::INVALID_STATE,
                            std::string(randomness_result_string(result)));
        }

        auto winners = draw_winners(state_.randomness.seed, state_.ledger.participants(),
                                    winner_count_target());
        return select_winners(winners);
    });
}

OpResult MarketEngine::cancel_by_timeout(const Address& caller) {
    return run("cancel_by_timeout", [&]() -> OpResult {
        if (state_.status != MarketStatus::CLOSED && state_.status != MarketStatus::COMMITTED) {
            return OpResult::invalid_state(state_.status, MarketStatus::COMMITTED);
        }
        if (!randomness_.timed_out(state_.randomness, chain_.height())) {
            return fail(MarketError::TIME_NOT_REACHED, "reveal window still open");
        }

        SlashSplit split = split_timeout_slash(state_.seller_deposit, config_);
        state_.seller_deposit = 0;
        state_.status = MarketStatus::FAILED;

        MarketError paid = payout_.pay(fees_.operations(), split.operations, "timeout slash");
        if (paid != MarketError::NONE) {
            return fail(paid, "slash transfer failed");
        }
        paid = payout_.pay(state_.seller, split.seller, "deposit remainder");
        if (paid != MarketError::NONE) {
            return fail(paid, "deposit remainder transfer failed");
        }

        ESCROW_LOG_WARN(log::market) << "Market " << state_.id << " timed out without reveal"
                                     << ", triggered by " << caller.short_hex();
        emit(MarketEventType::SLASHED, fees_.operations(), split.operations);
        emit(MarketEventType::FAILED, state_.seller, split.seller);
        return done();
    });
}

OpResult MarketEngine::settle(const Address& caller) {
    return run("settle", [&]() -> OpResult {
        if (state_.status != MarketStatus::REVEALED) {
            return OpResult::invalid_state(state_.status, MarketStatus::REVEALED);
        }
        if (state_.params.settlement_mode != SettlementMode::SEPARATE_SETTLE) {
            return fail(MarketError::INVALID_STATE, "market settles on receipt confirmation");
        }

        ESCROW_LOG_DEBUG(log::market) << "Market " << state_.id << " settle by " << caller.short_hex();

        if (state_.params.type == MarketType::LOTTERY) {
            return pay_lottery_settlement(0);
        }
        return pay_raffle_settlement();
    });
}

OpResult MarketEngine::confirm_receipt(const Address& caller) {
    return run("confirm_receipt", [&]() -> OpResult {
        if (state_.status != MarketStatus::REVEALED) {
            return OpResult::invalid_state(state_.status, MarketStatus::REVEALED);
        }
        if (state_.params.settlement_mode != SettlementMode::CONFIRM_RECEIPT) {
            return fail(MarketError::INVALID_STATE, "market settles separately");
        }

        const ParticipantInfo* info = state_.ledger.find(caller);
        if (!info || !info->is_winner) {
            return fail(MarketError::UNAUTHORIZED, "only a winner may confirm receipt");
        }
        if (info->deposit_refunded) {
            return fail(MarketError::ALREADY_CLAIMED, "receipt already confirmed");
        }

        state_.ledger.mark_refunded(caller);
        amount_t deposit = state_.params.deposit_per_entry;
        emit(MarketEventType::RECEIPT_CONFIRMED, caller, deposit);

        if (state_.params.type == MarketType::LOTTERY) {
            return pay_lottery_settlement(deposit);
        }

        ++state_.confirmed_winners;
        MarketError paid = payout_.pay(caller, deposit, "winner deposit");
        if (paid != MarketError::NONE) {
            return fail(paid, "winner deposit transfer failed");
        }

        if (state_.confirmed_winners == state_.winners.size()) {
            return pay_raffle_settlement();
        }
        return done();
    });
}

OpResult MarketEngine::finalize_unconfirmed(const Address& caller) {
    return run("finalize_unconfirmed", [&]() -> OpResult {
        if (state_.status != MarketStatus::REVEALED) {
            return OpResult::invalid_state(state_.status, MarketStatus::REVEALED);
        }
        if (state_.params.settlement_mode != SettlementMode::CONFIRM_RECEIPT) {
            return fail(MarketError::INVALID_STATE, "market settles separately");
        }
        if (chain_.now() < confirmation_deadline()) {
            return fail(MarketError::TIME_NOT_REACHED, "confirmation window still open");
        }

        amount_t deposit = state_.params.deposit_per_entry;
        amount_t forfeited = 0;
        for (const auto& winner : state_.winners) {
            const ParticipantInfo* info = state_.ledger.find(winner);
            if (info->deposit_refunded) {
                continue;
            }
            state_.ledger.mark_refunded(winner);
            forfeited += deposit;
            emit(MarketEventType::SLASHED, winner, deposit);
        }

        ESCROW_LOG_WARN(log::market) << "Market " << state_.id << " finalized without full receipt"
                                     << " confirmation by " << caller.short_hex()
                                     << ", forfeited " << forfeited;

        MarketError paid = payout_.pay(fees_.operations(), forfeited, "unconfirmed winner deposits");
        if (paid != MarketError::NONE) {
            return fail(paid, "forfeited deposit transfer failed");
        }

        if (state_.params.type == MarketType::LOTTERY) {
            return pay_lottery_settlement(0);
        }
        return pay_raffle_settlement();
    });
}

OpResult MarketEngine::claim_refund(const Address& caller) {
    return run("claim_refund", [&]() -> OpResult {
        return refund_participant(caller);
    });
}

OpResult MarketEngine::refund_all(const Address& caller) {
    return run("refund_all", [&]() -> OpResult {
        if (!is_terminal(state_.status)) {
            return OpResult::invalid_state(state_.status, MarketStatus::COMPLETED);
        }
        if (state_.ledger.empty()) {
            return fail(MarketError::NO_PARTICIPANTS, "nothing to refund");
        }

        std::size_t refunded = 0;
        std::vector<Address> participants = state_.ledger.participants();
        for (const auto& participant : participants) {
            const ParticipantInfo* info = state_.ledger.find(participant);
            if (info->deposit_refunded) {
                continue;
            }

            OpResult result = refund_participant(participant);
            if (!result.ok()) {
                // One rejecting recipient blocks the whole batch
                result.detail = "refund to " + participant.short_hex() + " failed: " + result.detail;
                return result;
            }
            ++refunded;
        }

        ESCROW_LOG_DEBUG(log::market) << "Market " << state_.id << " batch refund by "
                                      << caller.short_hex() << " paid " << refunded;
        OpResult result = done();
        result.detail = std::to_string(refunded) + " refunded";
        return result;
    });
}

// ============================================================================
// Internal Transitions
// ============================================================================

OpResult MarketEngine::refund_participant(const Address& participant) {
    if (!is_terminal(state_.status)) {
        return OpResult::invalid_state(state_.status, MarketStatus::COMPLETED);
    }

    const ParticipantInfo* info = state_.ledger.find(participant);
    if (!info) {
        return fail(MarketError::NOT_PARTICIPANT, "address never entered");
    }
    if (info->deposit_refunded) {
        return fail(MarketError::ALREADY_CLAIMED, "refund already claimed");
    }

    amount_t amount = state_.params.deposit_per_entry;
    if (state_.status == MarketStatus::FAILED) {
        amount_t share = failure_refund_share(state_.prize_pool, state_.ledger.unrefunded_count());
        state_.prize_pool -= share;
        amount += share;
    }
    state_.ledger.mark_refunded(participant);

    MarketError paid = payout_.pay(participant, amount, "refund");
    if (paid != MarketError::NONE) {
        return fail(paid, "refund transfer failed");
    }

    emit(MarketEventType::REFUNDED, participant, amount);
    return done();
}

OpResult MarketEngine::fail_market(std::string_view reason) {
    amount_t deposit = state_.seller_deposit;
    state_.seller_deposit = 0;
    state_.status = MarketStatus::FAILED;

    MarketError paid = payout_.pay(state_.seller, deposit, "seller deposit return");
    if (paid != MarketError::NONE) {
        return fail(paid, "seller deposit return failed");
    }

    ESCROW_LOG_INFO(log::market) << "Market " << state_.id << " failed: " << reason;
    emit(MarketEventType::FAILED, state_.seller, deposit);
    return done();
}

OpResult MarketEngine::select_winners(const std::vector<Address>& winners) {
    for (const auto& winner : winners) {
        state_.ledger.mark_winner(winner);
    }
    state_.winners = winners;
    state_.status = MarketStatus::REVEALED;
    state_.revealed_at = chain_.now();

    for (const auto& winner : state_.winners) {
        emit(MarketEventType::WINNERS_SELECTED, winner);
    }
    return done();
}

OpResult MarketEngine::pay_lottery_settlement(amount_t winner_extra) {
    PrizeSplit split = split_lottery_pool(state_.prize_pool, config_);
    amount_t deposit = state_.seller_deposit;
    Address winner = state_.winners.front();

    state_.prize_pool = 0;
    state_.seller_deposit = 0;
    state_.status = MarketStatus::COMPLETED;

    MarketError paid = payout_.pay(winner, split.winner + winner_extra, "lottery prize");
    if (paid != MarketError::NONE) {
        return fail(paid, "prize transfer failed");
    }
    paid = payout_.pay(fees_.operations(), split.operations, "lottery operations share");
    if (paid != MarketError::NONE) {
        return fail(paid, "operations share transfer failed");
    }
    paid = payout_.pay(state_.seller, deposit, "seller deposit return");
    if (paid != MarketError::NONE) {
        return fail(paid, "seller deposit return failed");
    }

    emit(MarketEventType::SETTLED, winner, split.winner);
    return done();
}

OpResult MarketEngine::pay_raffle_settlement() {
    amount_t proceeds = state_.prize_pool + state_.seller_deposit;

    state_.prize_pool = 0;
    state_.seller_deposit = 0;
    state_.status = MarketStatus::COMPLETED;

    MarketError paid = payout_.pay(state_.seller, proceeds, "raffle proceeds");
    if (paid != MarketError::NONE) {
        return fail(paid, "seller payout failed");
    }

    emit(MarketEventType::SETTLED, state_.seller, proceeds);
    return done();
}

// ============================================================================
// Queries
// ============================================================================

amount_t MarketEngine::held_balance() const {
    return payout_.held();
}

amount_t MarketEngine::owed_balance() const {
    return state_.prize_pool + state_.seller_deposit +
           static_cast<amount_t>(state_.ledger.unrefunded_count()) * state_.params.deposit_per_entry;
}

WithholdingAnalysis MarketEngine::withholding_analysis() const {
    return analyze_withholding(state_.params.type, state_.prize_pool, state_.seller_deposit,
                               state_.params.goal_amount, config_);
}

std::size_t MarketEngine::winner_count_target() const {
    if (state_.params.type == MarketType::LOTTERY) {
        return 1;
    }
    return std::min<std::size_t>(state_.params.prepared_quantity, state_.ledger.size());
}

// ============================================================================
// MarketFactory Implementation
// ============================================================================

MarketFactory::MarketFactory(AccountBook& book,
                             const IdentityVerifier& verifier,
                             const ChainView& chain,
                             const FeeRecipients& fees,
                             ProtocolConfig config)
    : book_(book)
    , verifier_(verifier)
    , chain_(chain)
    , fees_(fees)
    , config_(std::move(config)) {}

OpResult MarketFactory::create_market(const CreateRequest& request, MarketEngine** out) {
    // Book before factory, the same order a receive hook calling in would take
    auto book_lock = book_.lock_exclusive();
    std::lock_guard<std::mutex> lock(mutex_);

    MarketEngine::Context ctx{book_, verifier_, chain_, fees_, config_};
    auto created = MarketEngine::create(next_id_, request, ctx);
    if (!created.result.ok()) {
        return created.result;
    }

    MarketEngine* market = created.market.get();
    markets_.emplace(next_id_, std::move(created.market));
    ++next_id_;

    if (out) {
        *out = market;
    }
    return created.result;
}

MarketEngine* MarketFactory::find(market_id_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = markets_.find(id);
    return it == markets_.end() ? nullptr : it->second.get();
}

std::size_t MarketFactory::market_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return markets_.size();
}

}  // namespace escrow
