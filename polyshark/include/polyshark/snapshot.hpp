#pragma once
#include "polyshark/common.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace polyshark {

class SnapshotError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// One scan cycle worth of market data
struct Snapshot {
  std::vector<Market> markets;
  std::unordered_map<std::string, OrderBook> books; // token_id -> book

  const OrderBook *findBook(const std::string &token_id) const {
    auto it = books.find(token_id);
    return it != books.end() ? &it->second : nullptr;
  }
};

// Gamma /markets object. nullopt if the market is not a usable binary
// market (fewer than two outcomes, length mismatch).
std::optional<Market> parseMarket(const nlohmann::json &j);

// CLOB /book object. Levels are sorted: bids descending, asks ascending.
OrderBook parseOrderBook(const nlohmann::json &j);

// {"markets": [...], "books": [...]}
Snapshot parseSnapshot(const nlohmann::json &j);

// A file holding one cycle object or an array of cycle objects.
// Throws SnapshotError on I/O or JSON errors.
std::vector<Snapshot> loadSnapshots(const std::string &path);

} // namespace polyshark
