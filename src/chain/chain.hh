#pragma once

#include "core/types.hh"
#include <optional>

namespace escrow {

// ============================================================================
// Chain View - time, height and per-block entropy seen by a market
// ============================================================================

class ChainView {
public:
    virtual ~ChainView() = default;

    // Wall-clock time of the block currently being built
    [[nodiscard]] virtual timestamp_t now() const = 0;

    // Height of the block currently being built
    [[nodiscard]] virtual block_t height() const = 0;

    // Beacon value of an already produced block; nullopt for the current block,
    // future blocks, and blocks older than ENTROPY_HISTORY_BLOCKS
    [[nodiscard]] virtual std::optional<hash_t> block_entropy(block_t block) const = 0;
};

// ============================================================================
// Simulated Chain
// ============================================================================

// Deterministic chain for tests and local runs. Block entropy is
// SHA3("escrow.beacon" || genesis_seed || height), so a given seed always
// replays the same draws.
class SimulatedChain : public ChainView {
public:
    explicit SimulatedChain(const hash_t& genesis_seed = {},
                            timestamp_t genesis_time = timestamp_t{1'700'000'000},
                            timestamp_t block_interval = timestamp_t{12});

    [[nodiscard]] timestamp_t now() const override { return now_; }
    [[nodiscard]] block_t height() const override { return height_; }
    [[nodiscard]] std::optional<hash_t> block_entropy(block_t block) const override;

    // Produce blocks; time advances by block_interval per block
    void mine(block_t count = 1);

    // Advance wall-clock time, producing the blocks that fit in the span
    void advance_time(timestamp_t delta);

    void set_time(timestamp_t t);

private:
    hash_t genesis_seed_;
    timestamp_t now_;
    timestamp_t block_interval_;
    block_t height_ = 1;
};

}  // namespace escrow
