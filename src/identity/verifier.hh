#pragma once

#include "core/types.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"
#include <mutex>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace escrow {

// ============================================================================
// Identity Verifier - proof-of-personhood boundary
// ============================================================================

// Accepts or rejects a proof that the holder of some identity in the group
// rooted at `root` produced `nullifier_hash` for this (signal, scope). A sound
// verifier lets each identity produce at most one valid nullifier per scope.
class IdentityVerifier {
public:
    virtual ~IdentityVerifier() = default;

    [[nodiscard]] virtual bool verify(
        const hash_t& root,
        std::uint64_t group_id,
        const hash_t& signal_hash,
        const hash_t& nullifier_hash,
        const hash_t& external_nullifier_hash,
        std::span<const std::uint8_t> proof) const = 0;
};

// What an entrant submits alongside their payment
struct IdentityProof {
    hash_t merkle_root{};
    std::uint64_t group_id = 0;
    hash_t nullifier_hash{};
    std::vector<std::uint8_t> proof;
};

// Signal binds the proof to the submitting address
[[nodiscard]] hash_t signal_hash(const Address& caller);

// Per-market scope so one identity gets an independent nullifier per market
[[nodiscard]] hash_t external_nullifier_hash(std::string_view app_scope, const Address& market);

// ============================================================================
// Membership Proof - Merkle membership of an ML-DSA identity key
// ============================================================================

struct MembershipProof {
    mldsa_public_key_t member_key{};
    std::uint32_t leaf_index = 0;
    std::vector<hash_t> path;
    mldsa_signature_t signature{};

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<MembershipProof> deserialize(
        std::span<const std::uint8_t> data);

    static constexpr std::size_t MAX_PATH_LENGTH = 32;
    static constexpr std::size_t FIXED_SIZE =
        MLDSA65_PUBLIC_KEY_SIZE +       // member_key
        sizeof(std::uint32_t) +         // leaf_index
        sizeof(std::uint32_t) +         // path length
        MLDSA65_SIGNATURE_SIZE;         // signature
};

[[nodiscard]] hash_t membership_leaf(const mldsa_public_key_t& member_key);

// Deterministic per (identity, scope): the same key can never produce two
[[nodiscard]] hash_t membership_nullifier(
    const mldsa_public_key_t& member_key,
    const hash_t& external_nullifier_hash);

[[nodiscard]] std::vector<std::uint8_t> membership_message(
    const hash_t& root,
    std::uint64_t group_id,
    const hash_t& signal_hash,
    const hash_t& nullifier_hash,
    const hash_t& external_nullifier_hash);

// Builds the IdentityProof a member submits to enter a market
[[nodiscard]] std::optional<IdentityProof> make_membership_proof(
    const MLDSAKeyPair& member,
    const MerkleTree& group,
    std::size_t leaf_index,
    std::uint64_t group_id,
    const Address& caller,
    const hash_t& external_nullifier_hash);

// ============================================================================
// Membership Verifier
// ============================================================================

// Reference verifier: the proof reveals the member key, so it offers
// uniqueness but not anonymity.
class MembershipVerifier : public IdentityVerifier {
public:
    MembershipVerifier() = default;

    void add_group_root(std::uint64_t group_id, const hash_t& root);
    void revoke_group_root(std::uint64_t group_id, const hash_t& root);
    [[nodiscard]] bool is_known_root(std::uint64_t group_id, const hash_t& root) const;

    [[nodiscard]] bool verify(
        const hash_t& root,
        std::uint64_t group_id,
        const hash_t& signal_hash,
        const hash_t& nullifier_hash,
        const hash_t& external_nullifier_hash,
        std::span<const std::uint8_t> proof) const override;

private:
    std::unordered_map<std::uint64_t, std::unordered_set<hash_t>> roots_;
    mutable std::mutex mutex_;
};

}  // namespace escrow
