#pragma once

#include <iosfwd>
#include <optional>

#include "lotclear/types.hpp"

namespace lotclear {

/**
 * Configuration of a single-good, sealed-bid auction.
 *
 * Design
 *  - Immutable once built; construct through AuctionBuilder.
 *  - resolve_bids() is stateless: the same Auction can clear any number
 *    of independent bid sets, from several threads at once, as long as
 *    each call owns its bid vector.
 *  - No validation: negative lots or reserve price are taken as given.
 */
class Auction
{
public:
    static constexpr Quantity        kDefaultLots         = 1;
    static constexpr Amount          kDefaultReservePrice = 0;
    static constexpr AuctionStrategy kDefaultStrategy     = AuctionStrategy::SinglePrice;

    Quantity        lots() const noexcept { return lots_; }
    Amount          reserve_price() const noexcept { return reserve_price_; }
    AuctionStrategy strategy() const noexcept { return strategy_; }

    /// Allocate lots to the bids and price the winners according to strategy().
    /// Sales come back in acceptance order (highest amount first).
    /// Never fails: no eligible bid gives an empty result.
    Sales resolve_bids(Bids bids) const;

private:
    friend class AuctionBuilder;

    Auction(Quantity lots, Amount reserve_price, AuctionStrategy strategy) noexcept;

    Quantity        lots_;
    Amount          reserve_price_;
    AuctionStrategy strategy_;
};

/// Fluent builder, unset fields take the Auction::kDefault* values.
class AuctionBuilder
{
public:
    AuctionBuilder() = default;

    AuctionBuilder& lots(Quantity lots) noexcept;
    AuctionBuilder& reserve_price(Amount reserve_price) noexcept;
    AuctionBuilder& strategy(AuctionStrategy strategy) noexcept;

    Auction build() const noexcept;

private:
    std::optional<Quantity>        lots_;
    std::optional<Amount>          reserve_price_;
    std::optional<AuctionStrategy> strategy_;
};

std::ostream& operator<<(std::ostream& os, const Auction& auction);

} // namespace lotclear
