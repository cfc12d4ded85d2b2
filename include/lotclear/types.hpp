#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lotclear {

using Amount   = std::int64_t;   // price per unit in minor currency units (1 = 0.01)
using Quantity = std::int64_t;   // number of lots
using BidId    = std::uint64_t;

/// Mint a fresh bid id. Thread-safe, ids start at 1 and are never reused
/// within the process.
BidId next_bid_id() noexcept;

/**
 * A request to buy `quantity` lots at `amount` per lot.
 *
 * Comparison operators look at the amount only: two bids with the same
 * amount rank as equal even if their ids and quantities differ. Use
 * same_bid() when identity matters.
 */
class Bid
{
public:
    /// New bid with a freshly minted id.
    Bid(Amount amount, Quantity quantity);

    /// Bid with a pre-defined id (ids from an external source, partial fills).
    Bid(BidId id, Amount amount, Quantity quantity) noexcept;

    BidId    id() const noexcept { return id_; }
    Amount   amount() const noexcept { return amount_; }
    Quantity quantity() const noexcept { return quantity_; }

    /// Same amount and id, reduced quantity.
    Bid with_quantity(Quantity quantity) const noexcept;

private:
    BidId    id_;
    Amount   amount_;
    Quantity quantity_;
};

inline bool operator==(const Bid& a, const Bid& b) noexcept { return a.amount() == b.amount(); }
inline bool operator!=(const Bid& a, const Bid& b) noexcept { return !(a == b); }
inline bool operator<(const Bid& a, const Bid& b) noexcept { return a.amount() < b.amount(); }
inline bool operator>(const Bid& a, const Bid& b) noexcept { return b < a; }
inline bool operator<=(const Bid& a, const Bid& b) noexcept { return !(b < a); }
inline bool operator>=(const Bid& a, const Bid& b) noexcept { return !(a < b); }

/// Ranking comparator: highest amount first. Used with a stable sort so
/// that equal amounts keep their submission order.
struct BidAmountGreater
{
    bool operator()(const Bid& a, const Bid& b) const noexcept
    {
        return a.amount() > b.amount();
    }
};

/// Identity comparison (id, amount and quantity all equal).
inline bool same_bid(const Bid& a, const Bid& b) noexcept
{
    return a.id() == b.id() && a.amount() == b.amount() && a.quantity() == b.quantity();
}

using Bids = std::vector<Bid>;

struct Sale {
    BidId    bidder_id{0};  // id of the winning bid
    Amount   amount{0};     // price charged per lot
    Quantity quantity{0};   // lots awarded
};

using Sales = std::vector<Sale>;

enum class AuctionStrategy {
    SinglePrice,   // uniform clearing price
    MultiPrice     // pay-as-bid
};

std::string to_string(AuctionStrategy strategy);

/// Accepts "single_price"/"multi_price" (also "single", "multi", "uniform",
/// "pay_as_bid"), case-insensitive. Empty optional for anything else.
std::optional<AuctionStrategy> parse_strategy(std::string_view name);

std::ostream& operator<<(std::ostream& os, const Bid& bid);
std::ostream& operator<<(std::ostream& os, const Sale& sale);
std::ostream& operator<<(std::ostream& os, AuctionStrategy strategy);

} // namespace lotclear
