#pragma once

#include "core/types.hh"
#include <span>
#include <string_view>
#include <vector>

namespace escrow {

// ============================================================================
// SHA3-256 Hashing
// ============================================================================

class SHA3Hasher {
public:
    SHA3Hasher();
    ~SHA3Hasher();

    SHA3Hasher(const SHA3Hasher&) = delete;
    SHA3Hasher& operator=(const SHA3Hasher&) = delete;
    SHA3Hasher(SHA3Hasher&&) noexcept;
    SHA3Hasher& operator=(SHA3Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(const void* data, std::size_t len);
    void update(std::string_view text);
    void update(const Address& addr) { update(addr.bytes); }

    // Fixed-width little-endian
    void update_u64(std::uint64_t value);

    [[nodiscard]] hash_t finalize();

    void reset();

private:
    void* ctx_;
};

// Convenience functions
[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha3_256(const void* data, std::size_t len);

// Hash multiple inputs (concatenated)
template<typename... Args>
[[nodiscard]] hash_t sha3_256_multi(Args&&... args) {
    SHA3Hasher hasher;
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

// ============================================================================
// Merkle Tree Utilities
// ============================================================================

class MerkleTree {
public:
    explicit MerkleTree(std::vector<hash_t> leaves);

    [[nodiscard]] const hash_t& root() const { return root_; }
    [[nodiscard]] std::size_t leaf_count() const { return leaves_.size(); }
    [[nodiscard]] std::vector<hash_t> proof(std::size_t index) const;
    [[nodiscard]] static bool verify(const hash_t& leaf, const std::vector<hash_t>& proof,
                                      std::size_t index, const hash_t& root);

    [[nodiscard]] static hash_t hash_pair(const hash_t& left, const hash_t& right);

private:
    std::vector<hash_t> leaves_;
    std::vector<std::vector<hash_t>> layers_;
    hash_t root_;

    void build();
};

}  // namespace escrow
