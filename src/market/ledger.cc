#include "ledger.hh"
#include "core/logging.hh"
#include <algorithm>

namespace escrow {

EntryLedger::RecordResult EntryLedger::record_entry(
    const Address& participant,
    const hash_t& nullifier,
    amount_t paid_amount) {

    if (used_nullifiers_.count(nullifier) > 0) {
        ESCROW_LOG_DEBUG(log::ledger) << "Entry rejected: nullifier already used";
        return RecordResult::NULLIFIER_USED;
    }

    if (info_.count(participant) > 0) {
        ESCROW_LOG_DEBUG(log::ledger) << "Entry rejected: " << participant.short_hex()
                                      << " already entered";
        return RecordResult::ALREADY_ENTERED;
    }

    used_nullifiers_.insert(nullifier);
    participants_.push_back(participant);
    nullifier_hash_sum_ = xor_hashes(nullifier_hash_sum_, nullifier);

    ParticipantInfo& info = info_[participant];
    info.has_entered = true;
    info.paid_amount = paid_amount;
    info.nullifier = nullifier;

    ESCROW_LOG_TRACE(log::ledger) << "Recorded entry #" << participants_.size()
                                  << " for " << participant.short_hex();
    return RecordResult::RECORDED;
}

bool EntryLedger::is_nullifier_used(const hash_t& nullifier) const {
    return used_nullifiers_.count(nullifier) > 0;
}

bool EntryLedger::has_entered(const Address& participant) const {
    return info_.count(participant) > 0;
}

const ParticipantInfo* EntryLedger::find(const Address& participant) const {
    auto it = info_.find(participant);
    return it == info_.end() ? nullptr : &it->second;
}

bool EntryLedger::mark_winner(const Address& participant) {
    auto it = info_.find(participant);
    if (it == info_.end() || it->second.is_winner) {
        return false;
    }
    it->second.is_winner = true;
    return true;
}

bool EntryLedger::mark_refunded(const Address& participant) {
    auto it = info_.find(participant);
    if (it == info_.end() || it->second.deposit_refunded) {
        return false;
    }
    it->second.deposit_refunded = true;
    ++refunded_count_;
    return true;
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<std::uint8_t> EntryLedger::serialize() const {
    std::vector<std::uint8_t> result;
    result.reserve(sizeof(std::uint32_t) + participants_.size() * ENTRY_SERIALIZED_SIZE);

    append_u32(result, static_cast<std::uint32_t>(participants_.size()));

    for (const auto& participant : participants_) {
        const ParticipantInfo& info = info_.at(participant);
        result.insert(result.end(), participant.bytes.begin(), participant.bytes.end());
        result.insert(result.end(), info.nullifier.begin(), info.nullifier.end());
        append_u64(result, info.paid_amount);

        std::uint8_t flags = 0;
        if (info.is_winner) flags |= 0x01;
        if (info.deposit_refunded) flags |= 0x02;
        result.push_back(flags);
    }

    return result;
}

std::optional<EntryLedger> EntryLedger::deserialize(
    std::span<const std::uint8_t> data,
    std::size_t* consumed) {

    if (data.size() < sizeof(std::uint32_t)) {
        return std::nullopt;
    }

    const std::uint8_t* ptr = data.data();
    std::uint32_t count = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);

    std::size_t needed = sizeof(std::uint32_t) +
                         static_cast<std::size_t>(count) * ENTRY_SERIALIZED_SIZE;
    if (data.size() < needed) {
        return std::nullopt;
    }

    EntryLedger ledger;
    for (std::uint32_t i = 0; i < count; ++i) {
        Address participant;
        std::copy(ptr, ptr + ADDRESS_SIZE, participant.bytes.begin());
        ptr += ADDRESS_SIZE;

        hash_t nullifier;
        std::copy(ptr, ptr + HASH_SIZE, nullifier.begin());
        ptr += HASH_SIZE;

        amount_t paid = decode_u64(ptr);
        ptr += sizeof(amount_t);

        std::uint8_t flags = *ptr++;

        if (ledger.record_entry(participant, nullifier, paid) != RecordResult::RECORDED) {
            return std::nullopt;
        }
        if (flags & 0x01) {
            ledger.mark_winner(participant);
        }
        if (flags & 0x02) {
            ledger.mark_refunded(participant);
        }
    }

    if (consumed) {
        *consumed = needed;
    }
    return ledger;
}

}  // namespace escrow
