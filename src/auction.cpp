#include "lotclear/auction.hpp"
#include "lotclear/strategies.hpp"

#include <ostream>
#include <utility>

namespace lotclear {

Auction::Auction(Quantity lots, Amount reserve_price, AuctionStrategy strategy) noexcept
    : lots_(lots),
      reserve_price_(reserve_price),
      strategy_(strategy)
{
}

Sales Auction::resolve_bids(Bids bids) const
{
    switch (strategy_)
    {
    case AuctionStrategy::SinglePrice:
        return single_price(*this, std::move(bids));
    case AuctionStrategy::MultiPrice:
        return multi_price(*this, std::move(bids));
    }
    return {};
}

AuctionBuilder& AuctionBuilder::lots(Quantity lots) noexcept
{
    lots_ = lots;
    return *this;
}

AuctionBuilder& AuctionBuilder::reserve_price(Amount reserve_price) noexcept
{
    reserve_price_ = reserve_price;
    return *this;
}

AuctionBuilder& AuctionBuilder::strategy(AuctionStrategy strategy) noexcept
{
    strategy_ = strategy;
    return *this;
}

Auction AuctionBuilder::build() const noexcept
{
    return Auction(lots_.value_or(Auction::kDefaultLots),
                   reserve_price_.value_or(Auction::kDefaultReservePrice),
                   strategy_.value_or(Auction::kDefaultStrategy));
}

std::ostream& operator<<(std::ostream& os, const Auction& auction)
{
    return os << "Auction{lots=" << auction.lots()
              << ", reserve_price=" << auction.reserve_price()
              << ", strategy=" << auction.strategy() << "}";
}

} // namespace lotclear
