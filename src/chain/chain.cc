#include "chain.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"

namespace escrow {

SimulatedChain::SimulatedChain(const hash_t& genesis_seed,
                               timestamp_t genesis_time,
                               timestamp_t block_interval)
    : genesis_seed_(genesis_seed)
    , now_(genesis_time)
    , block_interval_(block_interval.count() > 0 ? block_interval : timestamp_t{1}) {}

std::optional<hash_t> SimulatedChain::block_entropy(block_t block) const {
    if (block >= height_) {
        return std::nullopt;
    }
    if (height_ - block > ENTROPY_HISTORY_BLOCKS) {
        return std::nullopt;
    }

    SHA3Hasher hasher;
    hasher.update(std::string_view("escrow.beacon"));
    hasher.update(genesis_seed_);
    hasher.update_u64(block);
    return hasher.finalize();
}

void SimulatedChain::mine(block_t count) {
    height_ += count;
    now_ += block_interval_ * static_cast<std::int64_t>(count);
    ESCROW_LOG_TRACE(log::chain) << "Mined " << count << " blocks, height " << height_;
}

void SimulatedChain::advance_time(timestamp_t delta) {
    if (delta.count() <= 0) {
        return;
    }
    auto blocks = static_cast<block_t>(delta / block_interval_);
    height_ += blocks;
    now_ += delta;
    ESCROW_LOG_TRACE(log::chain) << "Advanced " << delta.count() << "s, height " << height_;
}

void SimulatedChain::set_time(timestamp_t t) {
    if (t > now_) {
        advance_time(t - now_);
    }
}

}  // namespace escrow
