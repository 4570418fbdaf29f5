#include "config.hh"

namespace escrow {

std::string ProtocolConfig::validate() const {
    if (foundation_fee_percent + operations_fee_percent >= PERCENT_DENOMINATOR) {
        return "entry fees must leave part of the ticket for the pool";
    }
    if (lottery_winner_percent == 0 || lottery_winner_percent > PERCENT_DENOMINATOR) {
        return "lottery winner share must be in (0, 100]";
    }
    if (seller_deposit_percent > PERCENT_DENOMINATOR) {
        return "seller deposit percent must be at most 100";
    }
    if (timeout_slash_percent > PERCENT_DENOMINATOR) {
        return "timeout slash percent must be at most 100";
    }
    if (reveal_delay_blocks == 0) {
        return "reveal delay must be at least one block";
    }
    if (reveal_window_blocks == 0) {
        return "reveal window must be at least one block";
    }
    // Snapshot entropy must still be readable at the end of the window
    if (reveal_window_blocks >= ENTROPY_HISTORY_BLOCKS) {
        return "reveal window exceeds the entropy history";
    }
    if (confirm_window.count() <= 0) {
        return "confirm window must be positive";
    }
    if (app_scope.empty()) {
        return "app scope must not be empty";
    }
    return {};
}

}  // namespace escrow
