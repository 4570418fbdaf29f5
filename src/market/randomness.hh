#pragma once

#include "core/types.hh"
#include "core/config.hh"
#include "chain/chain.hh"
#include <vector>

namespace escrow {

// ============================================================================
// Randomness State - one market's commit-reveal progress
// ============================================================================

struct RandomnessState {
    RandomnessMode mode = RandomnessMode::PRE_COMMITTED;
    hash_t commitment{};
    bool committed = false;
    block_t commit_block = 0;

    // Block whose entropy feeds the seed; zero until anchored
    block_t snapshot_block = 0;

    bool revealed = false;
    hash_t revealed_secret{};
    hash_t block_entropy{};
    hash_t seed{};

    [[nodiscard]] bool anchored() const { return snapshot_block != 0; }

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<RandomnessState> deserialize(
        std::span<const std::uint8_t> data);

    static constexpr std::size_t SERIALIZED_SIZE =
        1 +                         // mode
        HASH_SIZE +                 // commitment
        1 +                         // flags (committed, revealed)
        sizeof(block_t) +           // commit_block
        sizeof(block_t) +           // snapshot_block
        HASH_SIZE * 3;              // revealed_secret, block_entropy, seed
};

// ============================================================================
// Commitments and Seed Derivation
// ============================================================================

// Pre-committed markets bind the secret to the market address at creation
[[nodiscard]] hash_t precommitment(const hash_t& secret_nullifier, const Address& market);

// Post-close markets commit to the bare secret
[[nodiscard]] hash_t post_close_commitment(const hash_t& secret);

// seed = SHA3(block_entropy || secret || nullifier_hash_sum)
[[nodiscard]] hash_t derive_seed(
    const hash_t& block_entropy,
    const hash_t& secret,
    const hash_t& nullifier_hash_sum);

// Uniform index of draw `round` in [0, bound); bound must be non-zero. Words
// from the biased tail are redrawn with an attempt counter appended.
[[nodiscard]] std::uint64_t draw_index(const hash_t& seed, std::uint64_t round, std::uint64_t bound);

// Selects min(count, candidates.size()) distinct winners. Each round picks an
// index from the remaining candidates and swap-removes it, so the result is a
// pure function of (seed, candidate order, count).
[[nodiscard]] std::vector<Address> draw_winners(
    const hash_t& seed,
    std::vector<Address> candidates,
    std::size_t count);

// ============================================================================
// Randomness Protocol - reveal window rules
// ============================================================================

class RandomnessProtocol {
public:
    explicit RandomnessProtocol(const ProtocolConfig& config);

    enum class Result {
        OK,
        ALREADY_COMMITTED,
        NOT_COMMITTED,
        ALREADY_REVEALED,
        TOO_EARLY,
        EXPIRED,
        MISMATCH,
        ENTROPY_UNAVAILABLE,
    };

    [[nodiscard]] RandomnessState pre_committed(
        const hash_t& secret_nullifier,
        const Address& market) const;

    [[nodiscard]] RandomnessState post_close() const;

    // Fixes the snapshot at height + reveal_delay. Called at close, and again
    // by commit() for post-close markets.
    void anchor(RandomnessState& state, block_t height) const;

    [[nodiscard]] Result commit(RandomnessState& state, const hash_t& commitment, block_t height) const;

    // Verifies the secret against the commitment and derives the seed
    [[nodiscard]] Result reveal(
        RandomnessState& state,
        const hash_t& secret,
        const Address& market,
        const hash_t& nullifier_hash_sum,
        const ChainView& chain) const;

    // Reveal allowed for snapshot < height <= snapshot + window
    [[nodiscard]] bool reveal_open(const RandomnessState& state, block_t height) const;
    [[nodiscard]] bool timed_out(const RandomnessState& state, block_t height) const;
    [[nodiscard]] block_t reveal_deadline(const RandomnessState& state) const;

private:
    block_t delay_;
    block_t window_;
};

[[nodiscard]] inline std::string_view randomness_result_string(RandomnessProtocol::Result result) {
    switch (result) {
        case RandomnessProtocol::Result::OK: return "ok";
        case RandomnessProtocol::Result::ALREADY_COMMITTED: return "already_committed";
        case RandomnessProtocol::Result::NOT_COMMITTED: return "not_committed";
        case RandomnessProtocol::Result::ALREADY_REVEALED: return "already_revealed";
        case RandomnessProtocol::Result::TOO_EARLY: return "too_early";
        case RandomnessProtocol::Result::EXPIRED: return "expired";
        case RandomnessProtocol::Result::MISMATCH: return "mismatch";
        case RandomnessProtocol::Result::ENTROPY_UNAVAILABLE: return "entropy_unavailable";
    }
    return "unknown";
}

}  // namespace escrow
