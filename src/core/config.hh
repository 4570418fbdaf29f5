#pragma once

#include "core/types.hh"
#include <string>

namespace escrow {

// ============================================================================
// Protocol Configuration
// ============================================================================

// Engine-wide economic and timing constants. One instance is shared by every
// market an engine hosts; per-market values live in MarketParams.
struct ProtocolConfig {
    std::uint64_t foundation_fee_percent = FOUNDATION_FEE_PERCENT;
    std::uint64_t operations_fee_percent = OPERATIONS_FEE_PERCENT;
    std::uint64_t lottery_winner_percent = LOTTERY_WINNER_PERCENT;
    std::uint64_t seller_deposit_percent = SELLER_DEPOSIT_PERCENT;
    std::uint64_t timeout_slash_percent = TIMEOUT_SLASH_PERCENT;

    block_t reveal_delay_blocks = REVEAL_DELAY_BLOCKS;
    block_t reveal_window_blocks = REVEAL_WINDOW_BLOCKS;

    // CONFIRM_RECEIPT markets may be finalized by anyone after this
    timestamp_t confirm_window{CONFIRM_WINDOW_SECONDS};

    // Scope constant folded into every market's external nullifier
    std::string app_scope = "escrow-market-v1";

    // Returns an empty string when valid, otherwise the first problem found
    [[nodiscard]] std::string validate() const;
};

}  // namespace escrow
