#pragma once

#include "lotclear/types.hpp"

namespace lotclear {

class Auction;

/// Uniform-price clearing: every winner pays the amount of the lowest
/// accepted bid.
Sales single_price(const Auction& auction, Bids bids);

/// Pay-as-bid clearing: every winner pays its own amount.
Sales multi_price(const Auction& auction, Bids bids);

} // namespace lotclear
