#include "lotclear/strategies.hpp"
#include "lotclear/auction.hpp"

#include "allocation.hpp"

#include <utility>

namespace lotclear {

Sales multi_price(const Auction& auction, Bids bids)
{
    Bids winners = detail::allocate_lots(auction, std::move(bids));

    Sales sales;
    sales.reserve(winners.size());
    for (const Bid& bid : winners)
    {
        sales.push_back(Sale{bid.id(), bid.amount(), bid.quantity()});
    }
    return sales;
}

} // namespace lotclear
