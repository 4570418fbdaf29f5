#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>

namespace escrow {

// ============================================================================
// SHA3Hasher Implementation
// ============================================================================

SHA3Hasher::SHA3Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        log::crypto.error("Failed to create EVP_MD_CTX");
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("Failed to initialize SHA3-256");
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        throw std::runtime_error("Failed to initialize SHA3-256");
    }
}

SHA3Hasher::~SHA3Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

SHA3Hasher::SHA3Hasher(SHA3Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

SHA3Hasher& SHA3Hasher::operator=(SHA3Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void SHA3Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void SHA3Hasher::update(std::string_view text) {
    update(text.data(), text.size());
}

void SHA3Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1) {
        log::crypto.error("SHA3-256 update failed");
        throw std::runtime_error("SHA3-256 update failed");
    }
}

void SHA3Hasher::update_u64(std::uint64_t value) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), value);
    update(buf);
}

hash_t SHA3Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), result.data(), &len) != 1) {
        log::crypto.error("SHA3-256 finalize failed");
        throw std::runtime_error("SHA3-256 finalize failed");
    }
    return result;
}

void SHA3Hasher::reset() {
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("SHA3-256 reset failed");
        throw std::runtime_error("SHA3-256 reset failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

hash_t sha3_256(std::span<const std::uint8_t> data) {
    return sha3_256(data.data(), data.size());
}

hash_t sha3_256(const void* data, std::size_t len) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data, len, result.data(), &out_len, EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("SHA3-256 failed");
        throw std::runtime_error("SHA3-256 failed");
    }
    return result;
}

// ============================================================================
// Merkle Tree Implementation
// ============================================================================

MerkleTree::MerkleTree(std::vector<hash_t> leaves) : leaves_(std::move(leaves)) {
    if (leaves_.empty()) {
        root_ = {};
    } else {
        build();
    }
}

void MerkleTree::build() {
    layers_.clear();
    layers_.push_back(leaves_);

    while (layers_.back().size() > 1) {
        const auto& prev = layers_.back();
        std::vector<hash_t> next;
        next.reserve((prev.size() + 1) / 2);

        for (std::size_t i = 0; i < prev.size(); i += 2) {
            // Odd layer: the last node is paired with itself
            const hash_t& right = (i + 1 < prev.size()) ? prev[i + 1] : prev[i];
            next.push_back(hash_pair(prev[i], right));
        }
        layers_.push_back(std::move(next));
    }

    root_ = layers_.back()[0];
}

hash_t MerkleTree::hash_pair(const hash_t& left, const hash_t& right) {
    SHA3Hasher hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finalize();
}

std::vector<hash_t> MerkleTree::proof(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }

    std::vector<hash_t> path;
    std::size_t idx = index;

    for (std::size_t layer = 0; layer + 1 < layers_.size(); ++layer) {
        const auto& current = layers_[layer];
        std::size_t sibling_idx = (idx % 2 == 0) ? idx + 1 : idx - 1;
        path.push_back(sibling_idx < current.size() ? current[sibling_idx] : current[idx]);
        idx /= 2;
    }

    return path;
}

bool MerkleTree::verify(const hash_t& leaf, const std::vector<hash_t>& proof,
                        std::size_t index, const hash_t& root) {
    hash_t current = leaf;
    std::size_t idx = index;

    for (const auto& sibling : proof) {
        current = (idx % 2 == 0) ? hash_pair(current, sibling) : hash_pair(sibling, current);
        idx /= 2;
    }

    // Leftover index bits mean the path was too short for the claimed position
    return idx == 0 && current == root;
}

// ============================================================================
// Address derivation (declared in types.hh)
// ============================================================================

Address Address::from_public_key(const mldsa_public_key_t& pk) {
    Address addr;
    addr.bytes = sha3_256(pk);
    return addr;
}

Address Address::from_label(std::string_view label) {
    Address addr;
    addr.bytes = sha3_256_multi(std::string_view("escrow.address"), label);
    return addr;
}

}  // namespace escrow
