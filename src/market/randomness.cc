#include "randomness.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"
#include <algorithm>
#include <limits>

namespace escrow {

// ============================================================================
// RandomnessState Serialization
// ============================================================================

std::vector<std::uint8_t> RandomnessState::serialize() const {
    std::vector<std::uint8_t> result;
    result.reserve(SERIALIZED_SIZE);

    result.push_back(static_cast<std::uint8_t>(mode));
    result.insert(result.end(), commitment.begin(), commitment.end());

    std::uint8_t flags = 0;
    if (committed) flags |= 0x01;
    if (revealed) flags |= 0x02;
    result.push_back(flags);

    append_u64(result, commit_block);
    append_u64(result, snapshot_block);
    result.insert(result.end(), revealed_secret.begin(), revealed_secret.end());
    result.insert(result.end(), block_entropy.begin(), block_entropy.end());
    result.insert(result.end(), seed.begin(), seed.end());

    return result;
}

std::optional<RandomnessState> RandomnessState::deserialize(
    std::span<const std::uint8_t> data) {
    if (data.size() < SERIALIZED_SIZE) {
        return std::nullopt;
    }

    RandomnessState state;
    const std::uint8_t* ptr = data.data();

    if (*ptr > static_cast<std::uint8_t>(RandomnessMode::POST_CLOSE_COMMIT)) {
        return std::nullopt;
    }
    state.mode = static_cast<RandomnessMode>(*ptr++);

    std::copy(ptr, ptr + HASH_SIZE, state.commitment.begin());
    ptr += HASH_SIZE;

    std::uint8_t flags = *ptr++;
    state.committed = (flags & 0x01) != 0;
    state.revealed = (flags & 0x02) != 0;

    state.commit_block = decode_u64(ptr);
    ptr += sizeof(block_t);
    state.snapshot_block = decode_u64(ptr);
    ptr += sizeof(block_t);

    std::copy(ptr, ptr + HASH_SIZE, state.revealed_secret.begin());
    ptr += HASH_SIZE;
    std::copy(ptr, ptr + HASH_SIZE, state.block_entropy.begin());
    ptr += HASH_SIZE;
    std::copy(ptr, ptr + HASH_SIZE, state.seed.begin());

    return state;
}

// ============================================================================
// Commitments and Seed Derivation
// ============================================================================

hash_t precommitment(const hash_t& secret_nullifier, const Address& market) {
    return sha3_256_multi(secret_nullifier, market.bytes);
}

hash_t post_close_commitment(const hash_t& secret) {
    return sha3_256(secret);
}

hash_t derive_seed(const hash_t& block_entropy,
                   const hash_t& secret,
                   const hash_t& nullifier_hash_sum) {
    return sha3_256_multi(block_entropy, secret, nullifier_hash_sum);
}

std::uint64_t draw_index(const hash_t& seed, std::uint64_t round, std::uint64_t bound) {
    constexpr std::uint64_t WORD_MAX = std::numeric_limits<std::uint64_t>::max();

    // 2^64 mod bound; words in the top `excess` values would favour low indices
    const std::uint64_t excess = (WORD_MAX % bound + 1) % bound;

    for (std::uint64_t attempt = 0;; ++attempt) {
        SHA3Hasher hasher;
        hasher.update(seed);
        hasher.update_u64(round);
        if (attempt != 0) {
            hasher.update_u64(attempt);
        }
        hash_t digest = hasher.finalize();

        // First 8 bytes as a big-endian word
        std::uint64_t word = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            word = (word << 8) | digest[i];
        }
        if (word <= WORD_MAX - excess) {
            return word % bound;
        }
    }
}

std::vector<Address> draw_winners(
    const hash_t& seed,
    std::vector<Address> candidates,
    std::size_t count) {

    std::vector<Address> winners;
    std::size_t rounds = std::min(count, candidates.size());
    winners.reserve(rounds);

    for (std::size_t round = 0; round < rounds; ++round) {
        auto idx = static_cast<std::size_t>(
            draw_index(seed, round, static_cast<std::uint64_t>(candidates.size())));
        winners.push_back(candidates[idx]);

        candidates[idx] = candidates.back();
        candidates.pop_back();
    }

    return winners;
}

// ============================================================================
// RandomnessProtocol Implementation
// ============================================================================

RandomnessProtocol::RandomnessProtocol(const ProtocolConfig& config)
    : delay_(config.reveal_delay_blocks)
    , window_(config.reveal_window_blocks) {}

RandomnessState RandomnessProtocol::pre_committed(
    const hash_t& secret_nullifier,
    const Address& market) const {

    RandomnessState state;
    state.mode = RandomnessMode::PRE_COMMITTED;
    state.commitment = precommitment(secret_nullifier, market);
    state.committed = true;
    return state;
}

RandomnessState RandomnessProtocol::post_close() const {
    RandomnessState state;
    state.mode = RandomnessMode::POST_CLOSE_COMMIT;
    return state;
}

void RandomnessProtocol::anchor(RandomnessState& state, block_t height) const {
    state.snapshot_block = height + delay_;
    ESCROW_LOG_DEBUG(log::randomness) << "Snapshot anchored at block " << state.snapshot_block
                                      << ", reveal deadline " << reveal_deadline(state);
}

RandomnessProtocol::Result RandomnessProtocol::commit(
    RandomnessState& state,
    const hash_t& commitment,
    block_t height) const {

    if (state.committed) {
        return Result::ALREADY_COMMITTED;
    }
    if (state.anchored() && timed_out(state, height)) {
        return Result::EXPIRED;
    }

    state.commitment = commitment;
    state.committed = true;
    state.commit_block = height;
    anchor(state, height);
    return Result::OK;
}

RandomnessProtocol::Result RandomnessProtocol::reveal(
    RandomnessState& state,
    const hash_t& secret,
    const Address& market,
    const hash_t& nullifier_hash_sum,
    const ChainView& chain) const {

    if (!state.committed || !state.anchored()) {
        return Result::NOT_COMMITTED;
    }
    if (state.revealed) {
        return Result::ALREADY_REVEALED;
    }

    block_t height = chain.height();
    if (height <= state.snapshot_block) {
        return Result::TOO_EARLY;
    }
    if (timed_out(state, height)) {
        return Result::EXPIRED;
    }

    hash_t expected = state.mode == RandomnessMode::PRE_COMMITTED
        ? precommitment(secret, market)
        : post_close_commitment(secret);
    if (expected != state.commitment) {
        ESCROW_LOG_DEBUG(log::randomness) << "Reveal does not match commitment";
        return Result::MISMATCH;
    }

    auto entropy = chain.block_entropy(state.snapshot_block);
    if (!entropy) {
        log::randomness.warn("Snapshot entropy no longer readable");
        return Result::ENTROPY_UNAVAILABLE;
    }

    state.revealed = true;
    state.revealed_secret = secret;
    state.block_entropy = *entropy;
    state.seed = derive_seed(*entropy, secret, nullifier_hash_sum);
    return Result::OK;
}

bool RandomnessProtocol::reveal_open(const RandomnessState& state, block_t height) const {
    return state.anchored() && height > state.snapshot_block && !timed_out(state, height);
}

bool RandomnessProtocol::timed_out(const RandomnessState& state, block_t height) const {
    return state.anchored() && height > reveal_deadline(state);
}

block_t RandomnessProtocol::reveal_deadline(const RandomnessState& state) const {
    return state.snapshot_block + window_;
}

}  // namespace escrow
