#include "verifier.hh"
#include "core/logging.hh"
#include <algorithm>

namespace escrow {

// ============================================================================
// Signal / Scope Hashing
// ============================================================================

hash_t signal_hash(const Address& caller) {
    return sha3_256(caller.bytes);
}

hash_t external_nullifier_hash(std::string_view app_scope, const Address& market) {
    SHA3Hasher hasher;
    hasher.update(std::string_view("escrow.scope"));
    hasher.update(app_scope);
    hasher.update(market);
    return hasher.finalize();
}

hash_t membership_leaf(const mldsa_public_key_t& member_key) {
    return sha3_256_multi(std::string_view("escrow.member"), member_key);
}

hash_t membership_nullifier(const mldsa_public_key_t& member_key,
                            const hash_t& external_nullifier_hash) {
    return sha3_256_multi(std::string_view("escrow.nullifier"), member_key, external_nullifier_hash);
}

std::vector<std::uint8_t> membership_message(
    const hash_t& root,
    std::uint64_t group_id,
    const hash_t& signal_hash,
    const hash_t& nullifier_hash,
    const hash_t& external_nullifier_hash) {

    std::vector<std::uint8_t> msg;
    msg.reserve(HASH_SIZE * 4 + sizeof(std::uint64_t));
    msg.insert(msg.end(), root.begin(), root.end());
    append_u64(msg, group_id);
    msg.insert(msg.end(), signal_hash.begin(), signal_hash.end());
    msg.insert(msg.end(), nullifier_hash.begin(), nullifier_hash.end());
    msg.insert(msg.end(), external_nullifier_hash.begin(), external_nullifier_hash.end());
    return msg;
}

// ============================================================================
// MembershipProof Serialization
// ============================================================================

std::vector<std::uint8_t> MembershipProof::serialize() const {
    std::vector<std::uint8_t> result;
    result.reserve(FIXED_SIZE + path.size() * HASH_SIZE);

    result.insert(result.end(), member_key.begin(), member_key.end());
    append_u32(result, leaf_index);
    append_u32(result, static_cast<std::uint32_t>(path.size()));
    for (const auto& node : path) {
        result.insert(result.end(), node.begin(), node.end());
    }
    result.insert(result.end(), signature.begin(), signature.end());

    return result;
}

std::optional<MembershipProof> MembershipProof::deserialize(
    std::span<const std::uint8_t> data) {
    if (data.size() < FIXED_SIZE) {
        return std::nullopt;
    }

    MembershipProof proof;
    const std::uint8_t* ptr = data.data();

    std::copy(ptr, ptr + MLDSA65_PUBLIC_KEY_SIZE, proof.member_key.begin());
    ptr += MLDSA65_PUBLIC_KEY_SIZE;

    proof.leaf_index = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);

    std::uint32_t path_len = decode_u32(ptr);
    ptr += sizeof(std::uint32_t);

    if (path_len > MAX_PATH_LENGTH) {
        return std::nullopt;
    }
    if (data.size() != FIXED_SIZE + static_cast<std::size_t>(path_len) * HASH_SIZE) {
        return std::nullopt;
    }

    proof.path.resize(path_len);
    for (auto& node : proof.path) {
        std::copy(ptr, ptr + HASH_SIZE, node.begin());
        ptr += HASH_SIZE;
    }

    std::copy(ptr, ptr + MLDSA65_SIGNATURE_SIZE, proof.signature.begin());

    return proof;
}

// ============================================================================
// Proof Construction
// ============================================================================

std::optional<IdentityProof> make_membership_proof(
    const MLDSAKeyPair& member,
    const MerkleTree& group,
    std::size_t leaf_index,
    std::uint64_t group_id,
    const Address& caller,
    const hash_t& external_nullifier_hash) {

    if (leaf_index >= group.leaf_count()) {
        log::identity.warn("Membership proof requested for leaf outside the group");
        return std::nullopt;
    }

    MembershipProof membership;
    membership.member_key = member.public_key();
    membership.leaf_index = static_cast<std::uint32_t>(leaf_index);
    membership.path = group.proof(leaf_index);

    IdentityProof out;
    out.merkle_root = group.root();
    out.group_id = group_id;
    out.nullifier_hash = membership_nullifier(member.public_key(), external_nullifier_hash);

    auto msg = membership_message(out.merkle_root, group_id, signal_hash(caller),
                                  out.nullifier_hash, external_nullifier_hash);
    auto sig = member.sign(msg);
    if (!sig) {
        return std::nullopt;
    }
    membership.signature = *sig;
    out.proof = membership.serialize();
    return out;
}

// ============================================================================
// MembershipVerifier Implementation
// ============================================================================

void MembershipVerifier::add_group_root(std::uint64_t group_id, const hash_t& root) {
    std::lock_guard<std::mutex> lock(mutex_);
    roots_[group_id].insert(root);
    ESCROW_LOG_DEBUG(log::identity) << "Group " << group_id << " root added";
}

void MembershipVerifier::revoke_group_root(std::uint64_t group_id, const hash_t& root) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(group_id);
    if (it != roots_.end()) {
        it->second.erase(root);
    }
}

bool MembershipVerifier::is_known_root(std::uint64_t group_id, const hash_t& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(group_id);
    return it != roots_.end() && it->second.count(root) > 0;
}

bool MembershipVerifier::verify(
    const hash_t& root,
    std::uint64_t group_id,
    const hash_t& signal,
    const hash_t& nullifier_hash,
    const hash_t& external_nullifier,
    std::span<const std::uint8_t> proof_bytes) const {

    if (!is_known_root(group_id, root)) {
        ESCROW_LOG_DEBUG(log::identity) << "Proof rejected: unknown root for group " << group_id;
        return false;
    }

    auto proof = MembershipProof::deserialize(proof_bytes);
    if (!proof) {
        ESCROW_LOG_DEBUG(log::identity) << "Proof rejected: malformed encoding";
        return false;
    }

    if (!MerkleTree::verify(membership_leaf(proof->member_key), proof->path,
                            proof->leaf_index, root)) {
        ESCROW_LOG_DEBUG(log::identity) << "Proof rejected: key is not a group member";
        return false;
    }

    if (membership_nullifier(proof->member_key, external_nullifier) != nullifier_hash) {
        ESCROW_LOG_DEBUG(log::identity) << "Proof rejected: nullifier not derived from member key";
        return false;
    }

    auto msg = membership_message(root, group_id, signal, nullifier_hash, external_nullifier);
    if (!mldsa_verify(proof->member_key, msg, proof->signature)) {
        ESCROW_LOG_DEBUG(log::identity) << "Proof rejected: bad member signature";
        return false;
    }

    return true;
}

}  // namespace escrow
