#include <gtest/gtest.h>
#include "market/randomness.hh"
#include "crypto/hash.hh"
#include <set>

namespace escrow {
namespace {

class RandomnessTest : public ::testing::Test {
protected:
    RandomnessTest() : protocol_(config_), chain_(hash_from_u64(9)) {}

    void SetUp() override {
        market_ = Address::from_label("market");
        secret_ = hash_from_u64(0xC0FFEE);
        for (int i = 0; i < 10; ++i) {
            candidates_.push_back(Address::from_label("p" + std::to_string(i)));
        }
    }

    ProtocolConfig config_;
    RandomnessProtocol protocol_;
    SimulatedChain chain_;
    Address market_;
    hash_t secret_{};
    std::vector<Address> candidates_;
};

// ============================================================================
// Commitments
// ============================================================================

TEST_F(RandomnessTest, PrecommitmentBindsMarket) {
    EXPECT_EQ(precommitment(secret_, market_), sha3_256_multi(secret_, market_.bytes));
    EXPECT_NE(precommitment(secret_, market_), precommitment(secret_, Address::from_label("other")));
}

TEST_F(RandomnessTest, PreCommittedStateIsFixed) {
    auto state = protocol_.pre_committed(secret_, market_);
    EXPECT_TRUE(state.committed);
    EXPECT_FALSE(state.anchored());
    EXPECT_EQ(protocol_.commit(state, hash_from_u64(1), chain_.height()),
              RandomnessProtocol::Result::ALREADY_COMMITTED);
}

TEST_F(RandomnessTest, AnchorSetsSnapshotAfterDelay) {
    auto state = protocol_.pre_committed(secret_, market_);
    protocol_.anchor(state, 100);
    EXPECT_EQ(state.snapshot_block, 105);
    EXPECT_EQ(protocol_.reveal_deadline(state), 305);
}

// ============================================================================
// Reveal Window
// ============================================================================

TEST_F(RandomnessTest, RevealTooEarly) {
    auto state = protocol_.pre_committed(secret_, market_);
    protocol_.anchor(state, chain_.height());

    chain_.mine(config_.reveal_delay_blocks);  // height == snapshot
    EXPECT_EQ(protocol_.reveal(state, secret_, market_, {}, chain_),
              RandomnessProtocol::Result::TOO_EARLY);
    EXPECT_FALSE(state.revealed);
}

TEST_F(RandomnessTest, RevealInsideWindow) {
    auto state = protocol_.pre_committed(secret_, market_);
    protocol_.anchor(state, chain_.height());
    chain_.mine(config_.reveal_delay_blocks + 1);

    hash_t sum = hash_from_u64(111 ^ 222);
    ASSERT_EQ(protocol_.reveal(state, secret_, market_, sum, chain_), RandomnessProtocol::Result::OK);

    EXPECT_TRUE(state.revealed);
    EXPECT_EQ(state.revealed_secret, secret_);
    EXPECT_EQ(state.block_entropy, *chain_.block_entropy(state.snapshot_block));
    EXPECT_EQ(state.seed, derive_seed(state.block_entropy, secret_, sum));

    EXPECT_EQ(protocol_.reveal(state, secret_, market_, sum, chain_),
              RandomnessProtocol::Result::ALREADY_REVEALED);
}

TEST_F(RandomnessTest, RevealMismatch) {
    auto state = protocol_.pre_committed(secret_, market_);
    protocol_.anchor(state, chain_.height());
    chain_.mine(config_.reveal_delay_blocks + 1);

    EXPECT_EQ(protocol_.reveal(state, hash_from_u64(1), market_, {}, chain_),
              RandomnessProtocol::Result::MISMATCH);
    EXPECT_FALSE(state.revealed);
}

TEST_F(RandomnessTest, WindowBoundaries) {
    auto state = protocol_.pre_committed(secret_, market_);
    protocol_.anchor(state, 10);
    block_t deadline = protocol_.reveal_deadline(state);

    EXPECT_FALSE(protocol_.reveal_open(state, state.snapshot_block));
    EXPECT_TRUE(protocol_.reveal_open(state, state.snapshot_block + 1));
    EXPECT_TRUE(protocol_.reveal_open(state, deadline));
    EXPECT_FALSE(protocol_.timed_out(state, deadline));
    EXPECT_FALSE(protocol_.reveal_open(state, deadline + 1));
    EXPECT_TRUE(protocol_.timed_out(state, deadline + 1));
}

TEST_F(RandomnessTest, RevealAfterDeadlineExpired) {
    auto state = protocol_.pre_committed(secret_, market_);
    protocol_.anchor(state, chain_.height());
    chain_.mine(config_.reveal_delay_blocks + config_.reveal_window_blocks + 1);

    EXPECT_EQ(protocol_.reveal(state, secret_, market_, {}, chain_),
              RandomnessProtocol::Result::EXPIRED);
}

TEST_F(RandomnessTest, PostCloseCommitReanchors) {
    auto state = protocol_.post_close();
    EXPECT_FALSE(state.committed);

    protocol_.anchor(state, chain_.height());  // close
    chain_.mine(20);

    hash_t commitment = post_close_commitment(secret_);
    ASSERT_EQ(protocol_.commit(state, commitment, chain_.height()), RandomnessProtocol::Result::OK);
    EXPECT_EQ(state.commit_block, chain_.height());
    EXPECT_EQ(state.snapshot_block, chain_.height() + config_.reveal_delay_blocks);

    EXPECT_EQ(protocol_.commit(state, commitment, chain_.height()),
              RandomnessProtocol::Result::ALREADY_COMMITTED);

    chain_.mine(config_.reveal_delay_blocks + 1);
    EXPECT_EQ(protocol_.reveal(state, secret_, market_, {}, chain_), RandomnessProtocol::Result::OK);
}

TEST_F(RandomnessTest, PostCloseCommitTooLate) {
    auto state = protocol_.post_close();
    protocol_.anchor(state, chain_.height());
    chain_.mine(config_.reveal_delay_blocks + config_.reveal_window_blocks + 1);

    EXPECT_EQ(protocol_.commit(state, post_close_commitment(secret_), chain_.height()),
              RandomnessProtocol::Result::EXPIRED);
}

TEST_F(RandomnessTest, UncommittedCannotReveal) {
    auto state = protocol_.post_close();
    EXPECT_EQ(protocol_.reveal(state, secret_, market_, {}, chain_),
              RandomnessProtocol::Result::NOT_COMMITTED);
}

// ============================================================================
// Draw
// ============================================================================

TEST_F(RandomnessTest, DrawIsDeterministic) {
    hash_t seed = hash_from_u64(12345);
    EXPECT_EQ(draw_winners(seed, candidates_, 3), draw_winners(seed, candidates_, 3));
}

TEST_F(RandomnessTest, DrawWithoutReplacement) {
    auto winners = draw_winners(hash_from_u64(1), candidates_, candidates_.size());
    ASSERT_EQ(winners.size(), candidates_.size());

    std::set<Address> unique(winners.begin(), winners.end());
    EXPECT_EQ(unique.size(), candidates_.size());
}

TEST_F(RandomnessTest, DrawCountCappedByCandidates) {
    EXPECT_EQ(draw_winners(hash_from_u64(1), candidates_, 50).size(), candidates_.size());
    EXPECT_TRUE(draw_winners(hash_from_u64(1), {}, 3).empty());
}

TEST_F(RandomnessTest, DrawFollowsIndexSequence) {
    hash_t seed = hash_from_u64(777);
    auto winners = draw_winners(seed, candidates_, 2);

    std::vector<Address> pool = candidates_;
    auto first = draw_index(seed, 0, pool.size());
    EXPECT_EQ(winners[0], pool[first]);
    pool[first] = pool.back();
    pool.pop_back();
    EXPECT_EQ(winners[1], pool[draw_index(seed, 1, pool.size())]);
}

std::uint64_t draw_word(const hash_t& seed, std::uint64_t round, std::uint64_t attempt) {
    SHA3Hasher hasher;
    hasher.update(seed);
    hasher.update_u64(round);
    if (attempt != 0) {
        hasher.update_u64(attempt);
    }
    hash_t digest = hasher.finalize();
    std::uint64_t word = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        word = (word << 8) | digest[i];
    }
    return word;
}

TEST_F(RandomnessTest, SmallBoundUsesFirstWord) {
    hash_t seed = hash_from_u64(42);
    for (std::uint64_t round = 0; round < 16; ++round) {
        EXPECT_EQ(draw_index(seed, round, 10), draw_word(seed, round, 0) % 10);
    }
}

TEST_F(RandomnessTest, BiasedTailIsRedrawn) {
    // Half of all words fall in the tail for this bound
    constexpr std::uint64_t bound = (std::uint64_t{1} << 63) + 1;
    hash_t seed = hash_from_u64(7);

    int redrawn = 0;
    for (std::uint64_t round = 0; round < 32; ++round) {
        std::uint64_t attempt = 0;
        std::uint64_t word = draw_word(seed, round, attempt);
        while (word > (std::uint64_t{1} << 63)) {
            word = draw_word(seed, round, ++attempt);
        }
        redrawn += attempt != 0 ? 1 : 0;
        EXPECT_EQ(draw_index(seed, round, bound), word);
    }
    EXPECT_GT(redrawn, 0);
}

TEST_F(RandomnessTest, DifferentSeedsDiffer) {
    std::set<std::vector<Address>> outcomes;
    for (std::uint64_t s = 0; s < 8; ++s) {
        outcomes.insert(draw_winners(hash_from_u64(s), candidates_, 3));
    }
    EXPECT_GT(outcomes.size(), 1);
}

TEST_F(RandomnessTest, StateCodec) {
    auto state = protocol_.pre_committed(secret_, market_);
    protocol_.anchor(state, chain_.height());
    chain_.mine(config_.reveal_delay_blocks + 1);
    ASSERT_EQ(protocol_.reveal(state, secret_, market_, {}, chain_), RandomnessProtocol::Result::OK);

    auto bytes = state.serialize();
    EXPECT_EQ(bytes.size(), RandomnessState::SERIALIZED_SIZE);

    auto decoded = RandomnessState::deserialize(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->commitment, state.commitment);
    EXPECT_EQ(decoded->snapshot_block, state.snapshot_block);
    EXPECT_TRUE(decoded->revealed);
    EXPECT_EQ(decoded->seed, state.seed);
}

}  // namespace
}  // namespace escrow
