#include "lotclear/types.hpp"

#include <atomic>
#include <cctype>
#include <ostream>

namespace lotclear {

namespace {

std::atomic<BidId> g_next_bid_id{1};

std::string to_lower(std::string_view s)
{
    std::string out(s);
    for (auto& c : out)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

BidId next_bid_id() noexcept
{
    return g_next_bid_id.fetch_add(1, std::memory_order_relaxed);
}

Bid::Bid(Amount amount, Quantity quantity)
    : Bid(next_bid_id(), amount, quantity)
{
}

Bid::Bid(BidId id, Amount amount, Quantity quantity) noexcept
    : id_(id),
      amount_(amount),
      quantity_(quantity)
{
}

Bid Bid::with_quantity(Quantity quantity) const noexcept
{
    return Bid(id_, amount_, quantity);
}

std::string to_string(AuctionStrategy strategy)
{
    switch (strategy)
    {
    case AuctionStrategy::SinglePrice:
        return "single_price";
    case AuctionStrategy::MultiPrice:
        return "multi_price";
    }
    return "unknown";
}

std::optional<AuctionStrategy> parse_strategy(std::string_view name)
{
    auto lower = to_lower(name);
    if (lower == "single_price" || lower == "single" || lower == "uniform")
        return AuctionStrategy::SinglePrice;
    if (lower == "multi_price" || lower == "multi" || lower == "pay_as_bid")
        return AuctionStrategy::MultiPrice;
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Bid& bid)
{
    return os << "Bid{id=" << bid.id()
              << ", amount=" << bid.amount()
              << ", quantity=" << bid.quantity() << "}";
}

std::ostream& operator<<(std::ostream& os, const Sale& sale)
{
    return os << "Sale{bidder_id=" << sale.bidder_id
              << ", amount=" << sale.amount
              << ", quantity=" << sale.quantity << "}";
}

std::ostream& operator<<(std::ostream& os, AuctionStrategy strategy)
{
    return os << to_string(strategy);
}

} // namespace lotclear
