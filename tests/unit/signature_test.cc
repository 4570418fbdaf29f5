#include <gtest/gtest.h>
#include "crypto/signature.hh"
#include "crypto/hash.hh"

using namespace escrow;

// ============================================================================
// ML-DSA-65 Tests
// ============================================================================

TEST(MLDSATest, Generate) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());
    EXPECT_TRUE(keypair->has_secret_key());
}

TEST(MLDSATest, SignAndVerify) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    std::vector<std::uint8_t> message = {1, 2, 3, 4, 5};
    auto sig = keypair->sign(message);
    ASSERT_TRUE(sig.has_value());

    EXPECT_TRUE(keypair->verify(message, *sig));
}

TEST(MLDSATest, VerifyWrongMessage) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    std::vector<std::uint8_t> message1 = {1, 2, 3};
    std::vector<std::uint8_t> message2 = {1, 2, 4};

    auto sig = keypair->sign(message1);
    ASSERT_TRUE(sig.has_value());
    EXPECT_FALSE(keypair->verify(message2, *sig));
}

TEST(MLDSATest, VerifyWrongKey) {
    auto keypair1 = MLDSAKeyPair::generate();
    auto keypair2 = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair1.has_value());
    ASSERT_TRUE(keypair2.has_value());

    std::vector<std::uint8_t> message = {1, 2, 3};
    auto sig = keypair1->sign(message);
    ASSERT_TRUE(sig.has_value());

    EXPECT_FALSE(keypair2->verify(message, *sig));
}

TEST(MLDSATest, TamperedSignatureRejected) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    std::vector<std::uint8_t> message = {9, 9, 9};
    auto sig = keypair->sign(message);
    ASSERT_TRUE(sig.has_value());

    (*sig)[10] ^= 0x01;
    EXPECT_FALSE(mldsa_verify(keypair->public_key(), message, *sig));
}

TEST(MLDSATest, PublicKeyOnly) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    auto pk_only = MLDSAKeyPair::from_public_key(keypair->public_key());
    EXPECT_FALSE(pk_only.has_secret_key());

    std::vector<std::uint8_t> message = {1, 2, 3};
    EXPECT_FALSE(pk_only.sign(message).has_value());

    auto sig = keypair->sign(message);
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(pk_only.verify(message, *sig));
}

TEST(MLDSATest, FromKeysRoundTrip) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    mldsa_secret_key_t sk{};
    sk.fill(0x07);
    auto imported = MLDSAKeyPair::from_keys(keypair->public_key(), sk);
    ASSERT_TRUE(imported.has_value());
    EXPECT_TRUE(imported->has_secret_key());
    EXPECT_EQ(imported->public_key(), keypair->public_key());
}

TEST(MLDSATest, MoveKeepsKeys) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());
    auto pk = keypair->public_key();

    MLDSAKeyPair moved = std::move(*keypair);
    EXPECT_TRUE(moved.has_secret_key());
    EXPECT_EQ(moved.public_key(), pk);
}

TEST(MLDSATest, Address) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    Address addr = keypair->address();
    EXPECT_EQ(addr, Address::from_public_key(keypair->public_key()));
    EXPECT_FALSE(addr.is_zero());
}
