#include "lotclear/auction.hpp"
#include "lotclear/json_codec.hpp"
#include "lotclear/summary.hpp"
#include "lotclear/types.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace lotclear;

namespace {

std::string read_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: lotclear_resolve <document.json> [--summary]\n";
        return 1;
    }

    const std::string path = argv[1];
    const bool summary     = (argc > 2 && std::string(argv[2]) == "--summary");

    try {
        auto doc = json::parse_document(read_file(path));

        // resolve_bids consumes the vector, keep the input for the summary
        Sales sales = doc.auction.resolve_bids(doc.bids);

        nlohmann::json out{
            {"auction", json::to_json(doc.auction)},
            {"sales", json::to_json(sales)},
        };
        std::cout << out.dump(2) << "\n";

        if (summary) {
            std::cout << "\n";
            print_summary(doc.auction, summarize(doc.auction, doc.bids, sales), std::cout);
        }
    } catch (const std::exception& ex) {
        std::cerr << "lotclear_resolve error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
