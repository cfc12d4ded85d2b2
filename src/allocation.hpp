#pragma once

#include "lotclear/types.hpp"

namespace lotclear {

class Auction;

namespace detail {

/// Shared allocation pass of both pricing rules.
///
/// Stable-sorts bids by amount (highest first), then walks them with
/// remaining = auction.lots():
///   - amount < reserve price          -> stop;
///   - quantity <= remaining           -> accept in full;
///   - remaining > 0                   -> accept `remaining` lots of it, stop;
///   - otherwise                       -> stop.
///
/// Returns the accepted bids in scan order. A partially filled bid is a new
/// Bid carrying the original id and the reduced quantity.
Bids allocate_lots(const Auction& auction, Bids bids);

} // namespace detail
} // namespace lotclear
