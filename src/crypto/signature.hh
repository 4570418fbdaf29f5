#pragma once

#include "core/types.hh"
#include <memory>
#include <span>

namespace escrow {

// ============================================================================
// ML-DSA-65 Key Pair
// ============================================================================

// Identity keys of the membership verifier. Secret keys are zeroed on
// destruction and never copied.
class MLDSAKeyPair {
public:
    ~MLDSAKeyPair();

    MLDSAKeyPair(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair& operator=(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair(MLDSAKeyPair&&) noexcept;
    MLDSAKeyPair& operator=(MLDSAKeyPair&&) noexcept;

    [[nodiscard]] static std::optional<MLDSAKeyPair> generate();

    [[nodiscard]] static std::optional<MLDSAKeyPair> from_keys(
        const mldsa_public_key_t& pk, const mldsa_secret_key_t& sk);

    // Verification-only key
    [[nodiscard]] static MLDSAKeyPair from_public_key(const mldsa_public_key_t& pk);

    [[nodiscard]] const mldsa_public_key_t& public_key() const { return public_key_; }
    [[nodiscard]] bool has_secret_key() const { return secret_key_ != nullptr; }

    [[nodiscard]] std::optional<mldsa_signature_t> sign(std::span<const std::uint8_t> message) const;

    [[nodiscard]] bool verify(std::span<const std::uint8_t> message,
                               const mldsa_signature_t& signature) const;

    [[nodiscard]] Address address() const;

private:
    MLDSAKeyPair() = default;

    mldsa_public_key_t public_key_{};
    std::unique_ptr<mldsa_secret_key_t> secret_key_;
};

[[nodiscard]] bool mldsa_verify(
    const mldsa_public_key_t& public_key,
    std::span<const std::uint8_t> message,
    const mldsa_signature_t& signature);

}  // namespace escrow
