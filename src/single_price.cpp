#include "lotclear/strategies.hpp"
#include "lotclear/auction.hpp"

#include "allocation.hpp"

#include <utility>

namespace lotclear {

Sales single_price(const Auction& auction, Bids bids)
{
    Bids winners = detail::allocate_lots(auction, std::move(bids));
    if (winners.empty())
        return {};

    // Scan order is descending, so the last winner sets the clearing price.
    const Amount clearing_price = winners.back().amount();

    Sales sales;
    sales.reserve(winners.size());
    for (const Bid& bid : winners)
    {
        sales.push_back(Sale{bid.id(), clearing_price, bid.quantity()});
    }
    return sales;
}

} // namespace lotclear
