#include "lotclear/json_codec.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using nlohmann::json;

namespace {

// Reads an integer field, wrapping nlohmann type errors so the caller sees
// which field was wrong. Values that do not fit in T are rejected instead
// of wrapping.
template <typename T>
T read_integer(const json& obj, const char* key, const std::string& where)
{
    const auto& v = obj.at(key);
    if (!v.is_number_integer())
    {
        throw std::invalid_argument(where + "." + key + " must be an integer, got " + v.dump());
    }
    if (v.is_number_unsigned()
        && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
    {
        throw std::invalid_argument(where + "." + key + " out of range, got " + v.dump());
    }
    return v.get<T>();
}

// Lot counts: integer and not negative.
lotclear::Quantity read_count(const json& obj, const char* key, const std::string& where)
{
    auto value = read_integer<lotclear::Quantity>(obj, key, where);
    if (value < 0)
    {
        throw std::invalid_argument(where + "." + key + " must not be negative, got "
                                    + std::to_string(value));
    }
    return value;
}

struct BidFields {
    std::optional<lotclear::BidId> id;
    lotclear::Amount               amount   = 0;
    lotclear::Quantity             quantity = 1;
};

BidFields read_bid_fields(const json& j, std::size_t index)
{
    const std::string where = "bids[" + std::to_string(index) + "]";

    if (!j.is_object())
    {
        throw std::invalid_argument(where + " must be an object, got " + j.dump());
    }
    if (!j.contains("amount"))
    {
        throw std::invalid_argument(where + ".amount is required");
    }

    BidFields fields;
    fields.amount = read_integer<lotclear::Amount>(j, "amount", where);
    if (j.contains("quantity"))
        fields.quantity = read_count(j, "quantity", where);

    if (j.contains("id"))
    {
        const auto& id = j.at("id");
        // Literals built in code are signed even when non-negative.
        bool valid = id.is_number_unsigned()
                  || (id.is_number_integer() && id.get<std::int64_t>() >= 0);
        if (!valid)
        {
            throw std::invalid_argument(where + ".id must be a non-negative integer, got "
                                        + id.dump());
        }
        fields.id = id.get<lotclear::BidId>();
    }
    return fields;
}

} // namespace

namespace lotclear::json {

Auction read_auction(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw std::invalid_argument("auction must be an object, got " + j.dump());
    }

    AuctionBuilder builder;

    if (j.contains("lots"))
        builder.lots(read_count(j, "lots", "auction"));

    if (j.contains("reserve_price"))
        builder.reserve_price(read_integer<Amount>(j, "reserve_price", "auction"));

    if (j.contains("strategy"))
    {
        const auto& s = j.at("strategy");
        if (!s.is_string())
        {
            throw std::invalid_argument("auction.strategy must be a string, got " + s.dump());
        }
        auto strategy = parse_strategy(s.get<std::string>());
        if (!strategy)
        {
            throw std::invalid_argument("auction.strategy: unknown strategy " + s.dump());
        }
        builder.strategy(*strategy);
    }

    return builder.build();
}

Bids read_bids(const nlohmann::json& j)
{
    if (!j.is_array())
    {
        throw std::invalid_argument("bids must be an array, got " + j.dump());
    }

    std::vector<BidFields>    fields;
    std::unordered_set<BidId> explicit_ids;
    std::optional<BidId>      max_id;

    fields.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i)
    {
        fields.push_back(read_bid_fields(j.at(i), i));

        const auto& id = fields.back().id;
        if (!id)
            continue;
        if (!explicit_ids.insert(*id).second)
        {
            throw std::invalid_argument("bids[" + std::to_string(i) + "].id "
                                        + std::to_string(*id) + " is used by an earlier bid");
        }
        if (!max_id || *id > *max_id)
            max_id = *id;
    }

    // Without explicit ids the process-wide counter is used. Once the
    // document names ids, the missing ones are numbered after its largest
    // id so they cannot collide with it.
    BidId next_local = max_id ? *max_id : 0;

    Bids bids;
    bids.reserve(fields.size());
    for (std::size_t i = 0; i < fields.size(); ++i)
    {
        const auto& f = fields[i];
        if (f.id)
        {
            bids.emplace_back(*f.id, f.amount, f.quantity);
        }
        else if (!max_id)
        {
            bids.emplace_back(f.amount, f.quantity);
        }
        else
        {
            if (next_local == std::numeric_limits<BidId>::max())
            {
                throw std::invalid_argument("bids[" + std::to_string(i)
                                            + "].id: no id left after the document's largest id");
            }
            bids.emplace_back(++next_local, f.amount, f.quantity);
        }
    }
    return bids;
}

AuctionDocument read_document(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw std::invalid_argument("document must be an object, got " + j.dump());
    }

    AuctionDocument doc;
    if (j.contains("auction"))
        doc.auction = read_auction(j.at("auction"));
    if (j.contains("bids"))
        doc.bids = read_bids(j.at("bids"));
    return doc;
}

AuctionDocument parse_document(const std::string& text)
{
    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& ex)
    {
        throw std::invalid_argument(std::string("invalid JSON: ") + ex.what());
    }
    return read_document(j);
}

nlohmann::json random_document(const Auction& auction, std::size_t num_bids, std::uint32_t seed)
{
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<Amount>   amount_dist(1, 100);
    std::uniform_int_distribution<Quantity> qty_dist(1, 10);

    auto bids = nlohmann::json::array();
    for (std::size_t i = 0; i < num_bids; ++i)
    {
        bids.push_back({
            {"id", static_cast<BidId>(i + 1)},
            {"amount", amount_dist(rng)},
            {"quantity", qty_dist(rng)},
        });
    }

    return nlohmann::json{
        {"auction", to_json(auction)},
        {"bids", std::move(bids)},
    };
}

nlohmann::json to_json(const Auction& auction)
{
    return nlohmann::json{
        {"lots", auction.lots()},
        {"reserve_price", auction.reserve_price()},
        {"strategy", to_string(auction.strategy())},
    };
}

nlohmann::json to_json(const Sale& sale)
{
    return nlohmann::json{
        {"bidder_id", sale.bidder_id},
        {"amount", sale.amount},
        {"quantity", sale.quantity},
    };
}

nlohmann::json to_json(const Sales& sales)
{
    auto arr = nlohmann::json::array();
    for (const auto& sale : sales)
    {
        arr.push_back(to_json(sale));
    }
    return arr;
}

} // namespace lotclear::json
