#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>

#include "lotclear/auction.hpp"
#include "lotclear/types.hpp"

namespace lotclear {

/// Totals over one resolution, as printed by `lotclear_resolve --summary`.
/// Sums that do not fit in 64 bits are left empty instead of wrapping.
struct ResolutionSummary {
    std::size_t bid_count     = 0;
    std::size_t winner_count  = 0;
    std::size_t partial_count = 0;   // winners awarded less than requested

    Quantity                lots_offered = 0;
    Quantity                lots_sold    = 0;
    std::optional<Quantity> lots_requested;

    Amount                min_price = 0;   // valid when winner_count > 0
    Amount                max_price = 0;
    std::optional<Amount> revenue;         // sum of amount * quantity
};

/// `bids` is the input that produced `sales`; sales are matched to bids by id.
ResolutionSummary summarize(const Auction& auction, const Bids& bids, const Sales& sales);

void print_summary(const Auction& auction, const ResolutionSummary& summary, std::ostream& os);

} // namespace lotclear
