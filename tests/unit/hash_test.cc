#include <gtest/gtest.h>
#include "crypto/hash.hh"

using namespace escrow;

// ============================================================================
// SHA3-256 Tests
// ============================================================================

TEST(SHA3Test, EmptyInput) {
    auto hash = sha3_256(std::span<const std::uint8_t>{});

    // a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a
    EXPECT_EQ(bytes_to_hex(hash),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(SHA3Test, KnownVectorAbc) {
    std::vector<std::uint8_t> input = {'a', 'b', 'c'};
    auto hash = sha3_256(input);
    EXPECT_EQ(bytes_to_hex(hash),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(SHA3Test, DifferentInputsDifferentHashes) {
    std::vector<std::uint8_t> input1 = {1, 2, 3};
    std::vector<std::uint8_t> input2 = {1, 2, 4};
    EXPECT_NE(sha3_256(input1), sha3_256(input2));
}

// ============================================================================
// SHA3Hasher Tests
// ============================================================================

TEST(SHA3HasherTest, IncrementalHashing) {
    std::vector<std::uint8_t> input = {1, 2, 3, 4, 5, 6};
    auto direct_hash = sha3_256(input);

    SHA3Hasher hasher;
    hasher.update(std::span<const std::uint8_t>(input.data(), 3));
    hasher.update(std::span<const std::uint8_t>(input.data() + 3, 3));

    EXPECT_EQ(direct_hash, hasher.finalize());
}

TEST(SHA3HasherTest, Reset) {
    std::vector<std::uint8_t> input = {1, 2, 3};

    SHA3Hasher hasher;
    hasher.update(input);
    auto hash1 = hasher.finalize();

    hasher.reset();
    hasher.update(input);
    EXPECT_EQ(hash1, hasher.finalize());
}

TEST(SHA3HasherTest, U64IsLittleEndian) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), 0xDEADBEEF);

    SHA3Hasher hasher;
    hasher.update_u64(0xDEADBEEF);
    EXPECT_EQ(hasher.finalize(), sha3_256(buf));
}

TEST(SHA3HasherTest, StringAndAddressUpdates) {
    Address addr = Address::from_label("alice");

    SHA3Hasher hasher;
    hasher.update(std::string_view("tag"));
    hasher.update(addr);

    std::vector<std::uint8_t> concat = {'t', 'a', 'g'};
    concat.insert(concat.end(), addr.bytes.begin(), addr.bytes.end());
    EXPECT_EQ(hasher.finalize(), sha3_256(concat));
}

TEST(SHA3HasherTest, MultiHash) {
    std::vector<std::uint8_t> a = {1, 2, 3};
    std::vector<std::uint8_t> b = {4, 5, 6};

    SHA3Hasher hasher;
    hasher.update(a);
    hasher.update(b);

    EXPECT_EQ(sha3_256_multi(a, b), hasher.finalize());
}

// ============================================================================
// Address Derivation Tests
// ============================================================================

TEST(AddressDerivationTest, LabelsAreStableAndDistinct) {
    EXPECT_EQ(Address::from_label("seller"), Address::from_label("seller"));
    EXPECT_NE(Address::from_label("seller"), Address::from_label("buyer"));
    EXPECT_FALSE(Address::from_label("").is_zero());
}

TEST(AddressDerivationTest, PublicKeyAddressIsKeyHash) {
    mldsa_public_key_t pk{};
    pk.fill(0x5A);
    EXPECT_EQ(Address::from_public_key(pk).bytes, sha3_256(pk));
}

// ============================================================================
// Merkle Tree Tests
// ============================================================================

TEST(MerkleTreeTest, SingleLeaf) {
    hash_t leaf{};
    leaf[0] = 0x42;

    MerkleTree tree({leaf});
    EXPECT_EQ(tree.root(), leaf);
    EXPECT_TRUE(tree.proof(0).empty());
    EXPECT_TRUE(MerkleTree::verify(leaf, {}, 0, tree.root()));
}

TEST(MerkleTreeTest, TwoLeaves) {
    hash_t leaf1{}, leaf2{};
    leaf1[0] = 0x01;
    leaf2[0] = 0x02;

    MerkleTree tree({leaf1, leaf2});
    EXPECT_EQ(tree.root(), MerkleTree::hash_pair(leaf1, leaf2));
}

TEST(MerkleTreeTest, ProofVerificationOddLeafCount) {
    std::vector<hash_t> leaves(5);
    for (int i = 0; i < 5; ++i) {
        leaves[i][0] = static_cast<std::uint8_t>(i + 1);
    }

    MerkleTree tree(leaves);
    for (std::size_t i = 0; i < leaves.size(); ++i) {
        EXPECT_TRUE(MerkleTree::verify(leaves[i], tree.proof(i), i, tree.root())) << "leaf " << i;
    }
}

TEST(MerkleTreeTest, WrongLeafFails) {
    std::vector<hash_t> leaves(4);
    for (int i = 0; i < 4; ++i) {
        leaves[i][0] = static_cast<std::uint8_t>(i);
    }

    MerkleTree tree(leaves);
    auto proof = tree.proof(0);
    EXPECT_FALSE(MerkleTree::verify(leaves[1], proof, 0, tree.root()));
}

TEST(MerkleTreeTest, IndexBeyondPathFails) {
    std::vector<hash_t> leaves(4);
    for (int i = 0; i < 4; ++i) {
        leaves[i][0] = static_cast<std::uint8_t>(i);
    }

    MerkleTree tree(leaves);
    auto proof = tree.proof(1);

    // Same low bits, but the path cannot reach index 5
    EXPECT_FALSE(MerkleTree::verify(leaves[1], proof, 5, tree.root()));
}

TEST(MerkleTreeTest, OutOfRangeProofIsEmpty) {
    std::vector<hash_t> leaves(2);
    MerkleTree tree(leaves);
    EXPECT_TRUE(tree.proof(7).empty());
}
