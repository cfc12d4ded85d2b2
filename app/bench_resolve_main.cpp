#include "lotclear/auction.hpp"
#include "lotclear/types.hpp"
#include "utils/benchmark.hpp"

#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace lotclear;

int main(int argc, char** argv) {
    // ---- parameters: [num_bids] [runs] [iterations] ----
    std::size_t num_bids   = (argc > 1) ? std::stoull(argv[1]) : 1'000;
    std::size_t runs       = (argc > 2) ? std::stoull(argv[2]) : 5;
    std::size_t iterations = (argc > 3) ? std::stoull(argv[3]) : 2'000;

    if (num_bids == 0 || runs == 0 || iterations == 0) {
        std::cerr << "num_bids, runs and iterations must be > 0\n";
        return 1;
    }

    const std::size_t warmup     = iterations / 10;
    const std::size_t batch_size = 16;

    // Roughly half of the demanded volume is on offer.
    const Quantity lots = static_cast<Quantity>(num_bids * 5 / 2);

    std::cout << "Config:\n"
              << "  num_bids   = " << num_bids << "\n"
              << "  lots       = " << lots << "\n"
              << "  runs       = " << runs << "\n"
              << "  iterations = " << iterations << "\n"
              << "  warmup     = " << warmup << "\n\n";

    std::mt19937_64 rng(42);
    std::uniform_int_distribution<Amount>   amount_dist(1, 100);
    std::uniform_int_distribution<Quantity> qty_dist(1, 10);

    // Bid sets are generated up front so random generation is not measured.
    std::vector<Bids> bid_sets(8);
    for (auto& set : bid_sets) {
        set.reserve(num_bids);
        for (std::size_t i = 0; i < num_bids; ++i) {
            set.emplace_back(amount_dist(rng), qty_dist(rng));
        }
    }

    std::size_t sink = 0;

    for (auto strategy : {AuctionStrategy::SinglePrice, AuctionStrategy::MultiPrice}) {
        const Auction auction = AuctionBuilder{}
                                    .lots(lots)
                                    .reserve_price(10)
                                    .strategy(strategy)
                                    .build();

        const std::string name = "Auction::resolve_bids/" + to_string(strategy);

        auto summary = bench::run_averaged(name, runs, [&](std::size_t) {
            return bench::run_batched(
                name,
                iterations,
                batch_size,
                [&](std::size_t i) {
                    // copy: resolve_bids consumes its input
                    Sales sales = auction.resolve_bids(bid_sets[i % bid_sets.size()]);
                    sink += sales.size();
                },
                warmup);
        });

        bench::print(summary);
        std::cout << "\n";
    }

    // keeps the optimizer from dropping the resolutions
    std::cout << "total sales produced: " << sink << "\n";
    return 0;
}
