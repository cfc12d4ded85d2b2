#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <random>

#include "lotclear/auction.hpp"
#include "lotclear/strategies.hpp"

using namespace lotclear;

namespace {

Quantity total_quantity(const Sales& sales) {
    return std::accumulate(sales.begin(), sales.end(), Quantity{0},
                           [](Quantity acc, const Sale& s) { return acc + s.quantity; });
}

} // namespace

TEST(SinglePrice, EmptyBidsGiveNoSales) {
    auto auction = AuctionBuilder{}.lots(10).build();
    auto sales   = auction.resolve_bids({});
    EXPECT_TRUE(sales.empty());
}

TEST(SinglePrice, LargeLotSellsToEveryBidAtLowestAmount) {
    auto auction = AuctionBuilder{}.lots(10).build();
    auto sales   = auction.resolve_bids({Bid(10, 1), Bid(20, 1)});

    ASSERT_EQ(sales.size(), 2u);
    EXPECT_EQ(sales[0].amount, 10);
    EXPECT_EQ(sales[1].amount, 10);
}

TEST(SinglePrice, SmallLotSellsToHighestBid) {
    Bid low(10, 1);
    Bid high(20, 1);

    auto auction = AuctionBuilder{}.lots(1).build();
    auto sales   = auction.resolve_bids({low, high});

    ASSERT_EQ(sales.size(), 1u);
    EXPECT_EQ(sales[0].amount, 20);
    EXPECT_EQ(sales[0].quantity, 1);
    EXPECT_EQ(sales[0].bidder_id, high.id());
}

TEST(SinglePrice, PartialFillSetsClearingPrice) {
    Bid low(10, 2);
    Bid high(20, 1);

    auto auction = AuctionBuilder{}.lots(2).build();
    auto sales   = auction.resolve_bids({low, high});

    ASSERT_EQ(sales.size(), 2u);
    EXPECT_EQ(sales[0].bidder_id, high.id());
    EXPECT_EQ(sales[0].amount, 10);
    EXPECT_EQ(sales[0].quantity, 1);
    EXPECT_EQ(sales[1].bidder_id, low.id()); // partial fill keeps the bid's id
    EXPECT_EQ(sales[1].amount, 10);
    EXPECT_EQ(sales[1].quantity, 1);
}

TEST(SinglePrice, ReservePriceExcludesLowBids) {
    auto auction = AuctionBuilder{}.lots(2).reserve_price(50).build();
    auto sales   = auction.resolve_bids({Bid(55, 1), Bid(20, 1)});

    ASSERT_EQ(sales.size(), 1u);
    EXPECT_EQ(sales[0].amount, 55);
    EXPECT_EQ(sales[0].quantity, 1);
}

TEST(SinglePrice, BidAtReserveIsEligible) {
    auto auction = AuctionBuilder{}.lots(2).reserve_price(50).build();
    auto sales   = auction.resolve_bids({Bid(50, 1), Bid(49, 1)});

    ASSERT_EQ(sales.size(), 1u);
    EXPECT_EQ(sales[0].amount, 50);
}

TEST(SinglePrice, NoBidClearsReserve) {
    auto auction = AuctionBuilder{}.lots(5).reserve_price(100).build();
    auto sales   = auction.resolve_bids({Bid(99, 1), Bid(10, 3)});
    EXPECT_TRUE(sales.empty());
}

TEST(SinglePrice, ZeroLotsGiveNoSales) {
    auto auction = AuctionBuilder{}.lots(0).build();
    auto sales   = auction.resolve_bids({Bid(10, 1), Bid(20, 1)});
    EXPECT_TRUE(sales.empty());
}

TEST(SinglePrice, NegativeLotsGiveNoSales) {
    auto auction = AuctionBuilder{}.lots(-1).build();
    auto sales   = auction.resolve_bids({Bid(10, 1), Bid(20, 0)});
    EXPECT_TRUE(sales.empty());
}

TEST(SinglePrice, ZeroQuantityBidBecomesZeroQuantitySale) {
    auto auction = AuctionBuilder{}.lots(1).build();
    auto sales   = auction.resolve_bids({Bid(30, 1), Bid(5, 0)});

    // the zero-quantity bid fits trivially and pulls the clearing price down
    ASSERT_EQ(sales.size(), 2u);
    EXPECT_EQ(sales[0].quantity, 1);
    EXPECT_EQ(sales[1].quantity, 0);
    EXPECT_EQ(sales[0].amount, 5);
    EXPECT_EQ(sales[1].amount, 5);
}

TEST(SinglePrice, ScanStopsAfterPartialFill) {
    Bid top(100, 3);
    Bid second(90, 5);
    Bid small(80, 1);

    auto auction = AuctionBuilder{}.lots(4).build();
    auto sales   = auction.resolve_bids({small, second, top});

    // `small` would fit in what's left of lots before `second`, but the
    // partial fill on `second` ends the scan.
    ASSERT_EQ(sales.size(), 2u);
    EXPECT_EQ(sales[0].bidder_id, top.id());
    EXPECT_EQ(sales[0].quantity, 3);
    EXPECT_EQ(sales[1].bidder_id, second.id());
    EXPECT_EQ(sales[1].quantity, 1);
    EXPECT_EQ(sales[0].amount, 90);
    EXPECT_EQ(sales[1].amount, 90);
}

TEST(SinglePrice, ScanStopsWhenLotsAreExhaustedExactly) {
    Bid a(50, 2);
    Bid b(40, 3);
    Bid c(30, 1);

    auto auction = AuctionBuilder{}.lots(5).build();
    auto sales   = auction.resolve_bids({a, b, c});

    ASSERT_EQ(sales.size(), 2u);
    EXPECT_EQ(total_quantity(sales), 5);
    EXPECT_EQ(sales[1].amount, 40);
}

TEST(SinglePrice, EqualAmountsKeepSubmissionOrder) {
    Bid first(10, 1);
    Bid second(10, 1);
    Bid third(10, 1);

    auto auction = AuctionBuilder{}.lots(2).build();
    auto sales   = auction.resolve_bids({first, second, third});

    ASSERT_EQ(sales.size(), 2u);
    EXPECT_EQ(sales[0].bidder_id, first.id());
    EXPECT_EQ(sales[1].bidder_id, second.id());
}

TEST(SinglePrice, AllBidsWinInFullWhenSupplyIsSufficient) {
    Bids bids{Bid(30, 2), Bid(10, 3), Bid(20, 4)};

    auto auction = AuctionBuilder{}.lots(9).build();
    auto sales   = single_price(auction, bids);

    ASSERT_EQ(sales.size(), 3u);
    EXPECT_EQ(sales[0].quantity, 2);
    EXPECT_EQ(sales[1].quantity, 4);
    EXPECT_EQ(sales[2].quantity, 3);
    for (const auto& sale : sales) {
        EXPECT_EQ(sale.amount, 10);
    }
}

TEST(SinglePrice, RandomBidSetsHoldInvariants) {
    std::mt19937_64 rng(7);
    std::uniform_int_distribution<Amount>   amount_dist(-20, 100);
    std::uniform_int_distribution<Quantity> qty_dist(0, 10);
    std::uniform_int_distribution<Quantity> lots_dist(0, 40);
    std::uniform_int_distribution<Amount>   reserve_dist(-10, 60);
    std::uniform_int_distribution<int>      count_dist(0, 30);

    for (int round = 0; round < 500; ++round) {
        auto auction = AuctionBuilder{}
                           .lots(lots_dist(rng))
                           .reserve_price(reserve_dist(rng))
                           .build();

        Bids bids;
        int count = count_dist(rng);
        for (int i = 0; i < count; ++i) {
            bids.emplace_back(amount_dist(rng), qty_dist(rng));
        }

        Amount lowest_winner = 0;
        auto   sales         = auction.resolve_bids(bids);

        EXPECT_LE(total_quantity(sales), auction.lots());
        for (const auto& sale : sales) {
            EXPECT_GE(sale.amount, auction.reserve_price());
            EXPECT_EQ(sale.amount, sales.front().amount);

            auto it = std::find_if(bids.begin(), bids.end(),
                                   [&](const Bid& b) { return b.id() == sale.bidder_id; });
            ASSERT_NE(it, bids.end());
            EXPECT_LE(sale.quantity, it->quantity());
            lowest_winner = it->amount();
        }
        if (!sales.empty()) {
            EXPECT_EQ(sales.front().amount, lowest_winner);
        }
    }
}
