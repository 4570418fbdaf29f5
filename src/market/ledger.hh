#pragma once

#include "core/types.hh"
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace escrow {

// ============================================================================
// Participant Info
// ============================================================================

struct ParticipantInfo {
    bool has_entered = false;
    bool is_winner = false;
    amount_t paid_amount = 0;
    bool deposit_refunded = false;
    hash_t nullifier{};
};

// ============================================================================
// Entry Ledger - one market's participants and spent nullifiers
// ============================================================================

// Owned by exactly one market and only mutated from inside that market's
// serialized operations, so it carries no lock and stays copyable (the engine
// snapshots it to undo a failed operation).
class EntryLedger {
public:
    enum class RecordResult {
        RECORDED,
        NULLIFIER_USED,
        ALREADY_ENTERED,
    };

    // Appends in entry order and folds the nullifier into the running XOR
    [[nodiscard]] RecordResult record_entry(
        const Address& participant,
        const hash_t& nullifier,
        amount_t paid_amount);

    [[nodiscard]] bool is_nullifier_used(const hash_t& nullifier) const;
    [[nodiscard]] bool has_entered(const Address& participant) const;
    [[nodiscard]] const ParticipantInfo* find(const Address& participant) const;

    // Both return false when the participant is unknown or already flagged
    bool mark_winner(const Address& participant);
    bool mark_refunded(const Address& participant);

    [[nodiscard]] const std::vector<Address>& participants() const { return participants_; }
    [[nodiscard]] std::size_t size() const { return participants_.size(); }
    [[nodiscard]] bool empty() const { return participants_.empty(); }
    [[nodiscard]] std::size_t refunded_count() const { return refunded_count_; }
    [[nodiscard]] std::size_t unrefunded_count() const { return participants_.size() - refunded_count_; }
    [[nodiscard]] const hash_t& nullifier_hash_sum() const { return nullifier_hash_sum_; }

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<EntryLedger> deserialize(
        std::span<const std::uint8_t> data,
        std::size_t* consumed = nullptr);

    static constexpr std::size_t ENTRY_SERIALIZED_SIZE =
        ADDRESS_SIZE +              // participant
        HASH_SIZE +                 // nullifier
        sizeof(amount_t) +          // paid_amount
        1;                          // flags (winner, refunded)

private:
    std::vector<Address> participants_;
    std::unordered_map<Address, ParticipantInfo> info_;
    std::unordered_set<hash_t> used_nullifiers_;
    hash_t nullifier_hash_sum_{};
    std::size_t refunded_count_ = 0;
};

}  // namespace escrow
