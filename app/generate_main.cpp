#include "lotclear/auction.hpp"
#include "lotclear/json_codec.hpp"
#include "lotclear/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace lotclear;

// Writes a random auction document for lotclear_resolve:
//   amounts uniform in [1, 100], quantities uniform in [1, 10],
//   ids numbered 1..num_bids.
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: lotclear_generate <num_bids> <seed> [lots] [reserve] [strategy]\n";
        return 1;
    }

    try {
        const std::size_t   num_bids = static_cast<std::size_t>(std::stoull(argv[1]));
        const std::uint32_t seed     = static_cast<std::uint32_t>(std::stoul(argv[2]));

        AuctionBuilder builder;
        if (argc > 3) {
            auto lots = static_cast<Quantity>(std::stoll(argv[3]));
            if (lots < 0) {
                throw std::invalid_argument("lots must not be negative");
            }
            builder.lots(lots);
        }
        if (argc > 4) {
            builder.reserve_price(static_cast<Amount>(std::stoll(argv[4])));
        }
        if (argc > 5) {
            auto strategy = parse_strategy(argv[5]);
            if (!strategy) {
                throw std::invalid_argument(std::string("unknown strategy: ") + argv[5]);
            }
            builder.strategy(*strategy);
        }

        auto doc = json::random_document(builder.build(), num_bids, seed);
        std::cout << doc.dump(2) << "\n";
    } catch (const std::exception& ex) {
        std::cerr << "lotclear_generate error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
