#include "lotclear/summary.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <ostream>
#include <unordered_map>

namespace lotclear {

namespace {

using Limits = std::numeric_limits<std::int64_t>;

bool checked_add(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept
{
    if ((b > 0 && a > Limits::max() - b) || (b < 0 && a < Limits::min() - b))
        return false;
    out = a + b;
    return true;
}

bool checked_mul(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept
{
    if (a > 0)
    {
        if (b > 0 ? a > Limits::max() / b : b < Limits::min() / a)
            return false;
    }
    else if (a < 0)
    {
        if (b > 0 ? a < Limits::min() / b : (b != 0 && b < Limits::max() / a))
            return false;
    }
    out = a * b;
    return true;
}

// Accumulates into `acc`, which becomes empty on the first overflow.
void accumulate(std::optional<std::int64_t>& acc, std::int64_t value) noexcept
{
    std::int64_t sum = 0;
    if (acc && checked_add(*acc, value, sum))
        acc = sum;
    else
        acc.reset();
}

} // namespace

ResolutionSummary summarize(const Auction& auction, const Bids& bids, const Sales& sales)
{
    ResolutionSummary st;
    st.bid_count      = bids.size();
    st.winner_count   = sales.size();
    st.lots_offered   = auction.lots();
    st.lots_requested = Quantity{0};
    st.revenue        = Amount{0};

    std::unordered_map<BidId, Quantity> requested;
    requested.reserve(bids.size());
    for (const auto& bid : bids)
    {
        accumulate(st.lots_requested, bid.quantity());
        requested.emplace(bid.id(), bid.quantity());
    }

    if (!sales.empty())
    {
        st.min_price = std::numeric_limits<Amount>::max();
        st.max_price = std::numeric_limits<Amount>::lowest();
    }

    for (const auto& sale : sales)
    {
        // sales never exceed lots, so this sum stays in range
        st.lots_sold += sale.quantity;
        st.min_price  = std::min(st.min_price, sale.amount);
        st.max_price  = std::max(st.max_price, sale.amount);

        Amount line = 0;
        if (checked_mul(sale.amount, sale.quantity, line))
            accumulate(st.revenue, line);
        else
            st.revenue.reset();

        auto it = requested.find(sale.bidder_id);
        if (it != requested.end() && sale.quantity < it->second)
            ++st.partial_count;
    }
    return st;
}

void print_summary(const Auction& auction, const ResolutionSummary& st, std::ostream& os)
{
    os << "=== Resolution summary ===\n\n";
    os << "Auction: " << auction << "\n\n";

    os << "Bids:\n";
    os << "  submitted     : " << st.bid_count << "\n";
    os << "  lots requested: ";
    if (st.lots_requested)
        os << *st.lots_requested << "\n\n";
    else
        os << "overflow\n\n";

    os << "Outcome:\n";
    os << "  winners       : " << st.winner_count << "\n";
    os << "  partial fills : " << st.partial_count << "\n";
    os << "  lots sold     : " << st.lots_sold << " of " << st.lots_offered << "\n";
    os << "  lots unsold   : " << std::max<Quantity>(st.lots_offered - st.lots_sold, 0) << "\n\n";

    if (st.winner_count == 0)
    {
        os << "No bid cleared the reserve price.\n";
        return;
    }

    if (auction.strategy() == AuctionStrategy::SinglePrice)
        os << "Clearing price  : " << st.min_price << "\n";
    else
        os << "Price range     : [" << st.min_price << ", " << st.max_price << "]\n";

    if (!st.revenue)
    {
        os << "Revenue         : overflow\n";
        os << "Average price   : n/a\n";
        return;
    }

    os << "Revenue         : " << *st.revenue << "\n";
    if (st.lots_sold > 0)
    {
        os << "Average price   : " << std::fixed << std::setprecision(2)
           << static_cast<double>(*st.revenue) / static_cast<double>(st.lots_sold) << "\n";
    }
    else
    {
        os << "Average price   : n/a\n";
    }
}

} // namespace lotclear
