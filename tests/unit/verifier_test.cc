#include <gtest/gtest.h>
#include "identity/verifier.hh"

namespace escrow {
namespace {

class MembershipVerifierTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t GROUP_ID = 7;

    void SetUp() override {
        std::vector<hash_t> leaves;
        for (int i = 0; i < 3; ++i) {
            auto kp = MLDSAKeyPair::generate();
            ASSERT_TRUE(kp.has_value());
            leaves.push_back(membership_leaf(kp->public_key()));
            members_.push_back(std::move(*kp));
        }
        group_ = std::make_unique<MerkleTree>(leaves);
        verifier_.add_group_root(GROUP_ID, group_->root());

        caller_ = Address::from_label("entrant");
        market_ = Address::from_label("market-1");
        scope_ = external_nullifier_hash("escrow-market-v1", market_);
    }

    std::optional<IdentityProof> prove(std::size_t member, const Address& caller) {
        return make_membership_proof(members_[member], *group_, member, GROUP_ID, caller, scope_);
    }

    bool check(const IdentityProof& proof, const Address& caller) {
        return verifier_.verify(proof.merkle_root, proof.group_id, signal_hash(caller),
                                proof.nullifier_hash, scope_, proof.proof);
    }

    std::vector<MLDSAKeyPair> members_;
    std::unique_ptr<MerkleTree> group_;
    MembershipVerifier verifier_;
    Address caller_;
    Address market_;
    hash_t scope_{};
};

TEST_F(MembershipVerifierTest, ValidProofAccepted) {
    for (std::size_t i = 0; i < members_.size(); ++i) {
        auto proof = prove(i, caller_);
        ASSERT_TRUE(proof.has_value());
        EXPECT_TRUE(check(*proof, caller_)) << "member " << i;
    }
}

TEST_F(MembershipVerifierTest, NullifierIsStablePerScope) {
    auto first = prove(0, caller_);
    auto second = prove(0, Address::from_label("other-wallet"));
    ASSERT_TRUE(first && second);

    // Switching wallets does not give the same identity a fresh nullifier
    EXPECT_EQ(first->nullifier_hash, second->nullifier_hash);

    auto other_member = prove(1, caller_);
    ASSERT_TRUE(other_member);
    EXPECT_NE(first->nullifier_hash, other_member->nullifier_hash);
}

TEST_F(MembershipVerifierTest, NullifierDiffersAcrossMarkets) {
    hash_t other_scope = external_nullifier_hash("escrow-market-v1", Address::from_label("market-2"));
    EXPECT_NE(scope_, other_scope);
    EXPECT_NE(membership_nullifier(members_[0].public_key(), scope_),
              membership_nullifier(members_[0].public_key(), other_scope));
}

TEST_F(MembershipVerifierTest, ProofBoundToCaller) {
    auto proof = prove(0, caller_);
    ASSERT_TRUE(proof.has_value());
    EXPECT_FALSE(check(*proof, Address::from_label("front-runner")));
}

TEST_F(MembershipVerifierTest, UnknownRootRejected) {
    auto proof = prove(0, caller_);
    ASSERT_TRUE(proof.has_value());

    verifier_.revoke_group_root(GROUP_ID, group_->root());
    EXPECT_FALSE(verifier_.is_known_root(GROUP_ID, group_->root()));
    EXPECT_FALSE(check(*proof, caller_));
}

TEST_F(MembershipVerifierTest, WrongGroupRejected) {
    auto proof = prove(0, caller_);
    ASSERT_TRUE(proof.has_value());
    proof->group_id = GROUP_ID + 1;
    EXPECT_FALSE(check(*proof, caller_));
}

TEST_F(MembershipVerifierTest, ForgedNullifierRejected) {
    auto proof = prove(0, caller_);
    ASSERT_TRUE(proof.has_value());
    proof->nullifier_hash = hash_from_u64(111);
    EXPECT_FALSE(check(*proof, caller_));
}

TEST_F(MembershipVerifierTest, NonMemberRejected) {
    auto outsider = MLDSAKeyPair::generate();
    ASSERT_TRUE(outsider.has_value());

    // Outsider reuses member 0's path but signs with its own key
    auto proof = make_membership_proof(*outsider, *group_, 0, GROUP_ID, caller_, scope_);
    ASSERT_TRUE(proof.has_value());
    EXPECT_FALSE(check(*proof, caller_));
}

TEST_F(MembershipVerifierTest, MalformedProofRejected) {
    auto proof = prove(0, caller_);
    ASSERT_TRUE(proof.has_value());

    proof->proof.resize(proof->proof.size() - 1);
    EXPECT_FALSE(check(*proof, caller_));

    proof->proof.clear();
    EXPECT_FALSE(check(*proof, caller_));
}

TEST_F(MembershipVerifierTest, LeafOutsideGroup) {
    EXPECT_FALSE(prove(0, caller_) == std::nullopt);
    EXPECT_FALSE(make_membership_proof(members_[0], *group_, 3, GROUP_ID, caller_, scope_).has_value());
}

TEST_F(MembershipVerifierTest, ProofCodec) {
    MembershipProof proof;
    proof.member_key.fill(0x11);
    proof.leaf_index = 2;
    proof.path = {hash_from_u64(1), hash_from_u64(2)};
    proof.signature.fill(0x22);

    auto bytes = proof.serialize();
    EXPECT_EQ(bytes.size(), MembershipProof::FIXED_SIZE + 2 * HASH_SIZE);

    auto decoded = MembershipProof::deserialize(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->member_key, proof.member_key);
    EXPECT_EQ(decoded->leaf_index, 2);
    EXPECT_EQ(decoded->path, proof.path);
    EXPECT_EQ(decoded->signature, proof.signature);
}

TEST_F(MembershipVerifierTest, ProofCodecRejectsLongPath) {
    MembershipProof proof;
    proof.path.resize(MembershipProof::MAX_PATH_LENGTH + 1);
    EXPECT_FALSE(MembershipProof::deserialize(proof.serialize()).has_value());
}

}  // namespace
}  // namespace escrow
