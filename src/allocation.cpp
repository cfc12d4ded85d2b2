#include "allocation.hpp"

#include "lotclear/auction.hpp"

#include <algorithm> // std::stable_sort

namespace lotclear::detail {

Bids allocate_lots(const Auction& auction, Bids bids)
{
    // Stable: equal amounts are ranking-equivalent but still distinct sales,
    // submission order decides between them.
    std::stable_sort(bids.begin(), bids.end(), BidAmountGreater{});

    Quantity remaining = auction.lots();
    Bids     winners;

    for (const Bid& bid : bids)
    {
        if (bid.amount() < auction.reserve_price())
            break; // everything after is priced lower or equal

        if (bid.quantity() <= remaining)
        {
            remaining -= bid.quantity();
            winners.push_back(bid);
        }
        else if (remaining > 0)
        {
            winners.push_back(bid.with_quantity(remaining));
            remaining = 0;
            break;
        }
        else
        {
            break;
        }
    }

    return winners;
}

} // namespace lotclear::detail
