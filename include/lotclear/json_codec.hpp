#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

#include "lotclear/auction.hpp"
#include "lotclear/types.hpp"

namespace lotclear::json {

/// An auction configuration together with the bids to clear against it.
struct AuctionDocument {
    Auction auction = AuctionBuilder{}.build();
    Bids    bids;
};

/// {"lots": 2, "reserve_price": 50, "strategy": "single_price"}
/// Every field is optional, missing ones take the builder defaults.
/// Negative lots are rejected.
Auction read_auction(const nlohmann::json& j);

/// [{"id": 7, "amount": 55, "quantity": 1}, ...]
/// "amount" is required, "quantity" defaults to 1 and must not be negative.
/// Explicit ids must be unique within the array. Bids without "id" get a
/// minted id, or the ids following the largest explicit id when the array
/// names any.
Bids read_bids(const nlohmann::json& j);

/// {"auction": {...}, "bids": [...]}; both keys optional.
AuctionDocument read_document(const nlohmann::json& j);

/// Parse text and read it as a document.
AuctionDocument parse_document(const std::string& text);

/// Random document for `auction`: ids 1..num_bids, amounts in [1, 100],
/// quantities in [1, 10]. Same seed, same document.
nlohmann::json random_document(const Auction& auction, std::size_t num_bids, std::uint32_t seed);

nlohmann::json to_json(const Auction& auction);
nlohmann::json to_json(const Sale& sale);
nlohmann::json to_json(const Sales& sales);

} // namespace lotclear::json
