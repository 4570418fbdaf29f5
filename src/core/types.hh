#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <compare>

namespace escrow {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// ML-DSA-65 (FIPS 204 / Dilithium Level 3)
inline constexpr std::size_t MLDSA65_PUBLIC_KEY_SIZE = 1952;
inline constexpr std::size_t MLDSA65_SECRET_KEY_SIZE = 4032;
inline constexpr std::size_t MLDSA65_SIGNATURE_SIZE = 3309;  // From liboqs OQS_SIG_ml_dsa_65_length_signature

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Address size (same as hash for address derivation)
inline constexpr std::size_t ADDRESS_SIZE = HASH_SIZE;

// ============================================================================
// Fee and Collateral Percentages (numerator over PERCENT_DENOMINATOR)
// ============================================================================

inline constexpr std::uint64_t PERCENT_DENOMINATOR = 100;
inline constexpr std::uint64_t FOUNDATION_FEE_PERCENT = 3;
inline constexpr std::uint64_t OPERATIONS_FEE_PERCENT = 2;
inline constexpr std::uint64_t LOTTERY_WINNER_PERCENT = 95;
inline constexpr std::uint64_t SELLER_DEPOSIT_PERCENT = 10;
inline constexpr std::uint64_t TIMEOUT_SLASH_PERCENT = 50;

// ============================================================================
// Block Timing Constants
// ============================================================================

inline constexpr std::uint64_t REVEAL_DELAY_BLOCKS = 5;       // snapshot = anchor + delay
inline constexpr std::uint64_t REVEAL_WINDOW_BLOCKS = 200;    // reveal allowed up to snapshot + window
inline constexpr std::uint64_t ENTROPY_HISTORY_BLOCKS = 256;  // entropy readable for recent blocks only
inline constexpr std::uint64_t CONFIRM_WINDOW_SECONDS = 14 * 24 * 3600;  // receipt confirmation window

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using amount_t = std::uint64_t;
using block_t = std::uint64_t;
using market_id_t = std::uint64_t;
using timestamp_t = std::chrono::seconds;

// ML-DSA-65 keys and signature
using mldsa_public_key_t = std::array<std::uint8_t, MLDSA65_PUBLIC_KEY_SIZE>;
using mldsa_secret_key_t = std::array<std::uint8_t, MLDSA65_SECRET_KEY_SIZE>;
using mldsa_signature_t = std::array<std::uint8_t, MLDSA65_SIGNATURE_SIZE>;

// ============================================================================
// Address (derived from public key hash)
// ============================================================================

struct Address {
    hash_t bytes{};

    [[nodiscard]] static Address from_public_key(const mldsa_public_key_t& pk);
    [[nodiscard]] static Address from_label(std::string_view label);
    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] std::string short_hex() const;
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex);

    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Address&) const = default;
};

// ============================================================================
// Market Type and Status
// ============================================================================

enum class MarketType : std::uint8_t {
    LOTTERY = 0,    // One winner takes the pool once the goal is met
    RAFFLE = 1,     // preparedQuantity physical prizes, seller takes the pool
};

enum class MarketStatus : std::uint8_t {
    CREATED = 0,
    OPEN = 1,
    CLOSED = 2,
    COMMITTED = 3,
    REVEALED = 4,
    COMPLETED = 5,
    FAILED = 6,
};

// Variant A commits at creation, Variant B commits after close
enum class RandomnessMode : std::uint8_t {
    PRE_COMMITTED = 0,
    POST_CLOSE_COMMIT = 1,
};

enum class SettlementMode : std::uint8_t {
    SEPARATE_SETTLE = 0,
    CONFIRM_RECEIPT = 1,
};

[[nodiscard]] inline std::string_view market_type_string(MarketType type) {
    switch (type) {
        case MarketType::LOTTERY: return "lottery";
        case MarketType::RAFFLE: return "raffle";
    }
    return "unknown";
}

[[nodiscard]] inline std::string_view market_status_string(MarketStatus status) {
    switch (status) {
        case MarketStatus::CREATED: return "created";
        case MarketStatus::OPEN: return "open";
        case MarketStatus::CLOSED: return "closed";
        case MarketStatus::COMMITTED: return "committed";
        case MarketStatus::REVEALED: return "revealed";
        case MarketStatus::COMPLETED: return "completed";
        case MarketStatus::FAILED: return "failed";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_terminal(MarketStatus status) {
    return status == MarketStatus::COMPLETED || status == MarketStatus::FAILED;
}

// ============================================================================
// Market Error Codes
// ============================================================================

enum class MarketError : std::uint8_t {
    NONE = 0x00,
    INVALID_STATE = 0x01,
    INSUFFICIENT_FUNDS = 0x02,
    ALREADY_PARTICIPATED = 0x03,
    UNAUTHORIZED = 0x04,
    TIME_NOT_REACHED = 0x05,
    TIME_EXPIRED = 0x06,
    VERIFICATION_FAILED = 0x07,
    TRANSFER_FAILED = 0x08,
    NO_PARTICIPANTS = 0x09,
    INVALID_TARGET_ENTRIES = 0x0A,
    INVALID_PARAMETERS = 0x0B,
    REENTRANT_CALL = 0x0C,
    ALREADY_CLAIMED = 0x0D,
    NOT_PARTICIPANT = 0x0E,
};

[[nodiscard]] inline std::string_view market_error_string(MarketError error) {
    switch (error) {
        case MarketError::NONE: return "none";
        case MarketError::INVALID_STATE: return "invalid_state";
        case MarketError::INSUFFICIENT_FUNDS: return "insufficient_funds";
        case MarketError::ALREADY_PARTICIPATED: return "already_participated";
        case MarketError::UNAUTHORIZED: return "unauthorized";
        case MarketError::TIME_NOT_REACHED: return "time_not_reached";
        case MarketError::TIME_EXPIRED: return "time_expired";
        case MarketError::VERIFICATION_FAILED: return "verification_failed";
        case MarketError::TRANSFER_FAILED: return "transfer_failed";
        case MarketError::NO_PARTICIPANTS: return "no_participants";
        case MarketError::INVALID_TARGET_ENTRIES: return "invalid_target_entries";
        case MarketError::INVALID_PARAMETERS: return "invalid_parameters";
        case MarketError::REENTRANT_CALL: return "reentrant_call";
        case MarketError::ALREADY_CLAIMED: return "already_claimed";
        case MarketError::NOT_PARTICIPANT: return "not_participant";
    }
    return "unknown";
}

// ============================================================================
// Hash Helpers
// ============================================================================

[[nodiscard]] inline hash_t xor_hashes(const hash_t& a, const hash_t& b) {
    hash_t out;
    for (std::size_t i = 0; i < HASH_SIZE; ++i) {
        out[i] = a[i] ^ b[i];
    }
    return out;
}

// Big-endian placement in the low-order bytes, like a uint256 word
[[nodiscard]] inline hash_t hash_from_u64(std::uint64_t value) {
    hash_t out{};
    for (std::size_t i = 0; i < 8; ++i) {
        out[HASH_SIZE - 1 - i] = static_cast<std::uint8_t>(value >> (i * 8));
    }
    return out;
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (std::size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (i * 8));
    }
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (i * 8);
    }
    return val;
}

inline void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

inline void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace escrow

// ============================================================================
// Hash specialization for hash_t (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<escrow::hash_t> {
    std::size_t operator()(const escrow::hash_t& h) const noexcept {
        // Mix the first and last 8 bytes; small nullifiers live in the tail
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
            result ^= static_cast<std::size_t>(h[h.size() - 1 - i]) << (i * 8);
        }
        return result;
    }
};

template<>
struct hash<escrow::Address> {
    std::size_t operator()(const escrow::Address& addr) const noexcept {
        return std::hash<escrow::hash_t>{}(addr.bytes);
    }
};

}  // namespace std
