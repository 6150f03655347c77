#include "polyshark/snapshot.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace polyshark {

// ── Field helpers ────────────────────────────────────────────────────
// Gamma serves numbers as strings and arrays as JSON-encoded strings.
static double toDouble(const json &v) {
  if (v.is_number())
    return v.get<double>();
  if (v.is_string())
    return std::stod(v.get<std::string>());
  throw SnapshotError("expected number, got " + std::string(v.type_name()));
}

static double numberOr(const json &obj, const char *key, double fallback) {
  if (!obj.contains(key) || obj[key].is_null())
    return fallback;
  return toDouble(obj[key]);
}

static std::optional<double> optionalNumber(const json &obj, const char *key) {
  if (!obj.contains(key) || obj[key].is_null())
    return std::nullopt;
  return toDouble(obj[key]);
}

static json unwrapArray(const json &v) {
  if (v.is_string())
    return json::parse(v.get<std::string>());
  return v;
}

static std::vector<std::string> stringArray(const json &obj, const char *key) {
  std::vector<std::string> out;
  if (!obj.contains(key) || obj[key].is_null())
    return out;
  for (const auto &item : unwrapArray(obj[key]))
    out.push_back(item.is_string() ? item.get<std::string>() : item.dump());
  return out;
}

static std::vector<PriceLevel> parseLevels(const json &levels) {
  std::vector<PriceLevel> out;
  for (const auto &l : levels)
    out.push_back({toDouble(l.at("price")), toDouble(l.at("size"))});
  return out;
}

// ── Market ───────────────────────────────────────────────────────────
std::optional<Market> parseMarket(const json &j) {
  Market m;
  m.id = j.value("id", "");
  m.question = j.value("question", "");
  m.slug = j.value("slug", "");
  m.outcomes = stringArray(j, "outcomes");
  m.clob_token_ids = stringArray(j, "clobTokenIds");

  if (j.contains("outcomePrices") && !j["outcomePrices"].is_null()) {
    for (const auto &p : unwrapArray(j["outcomePrices"]))
      m.outcome_prices.push_back(toDouble(p));
  }

  if (m.outcomes.size() < 2 || m.outcomes.size() != m.outcome_prices.size()) {
    spdlog::warn("[Snapshot] Skipping market '{}': {} outcomes, {} prices",
                 m.id, m.outcomes.size(), m.outcome_prices.size());
    return std::nullopt;
  }

  m.best_bid = optionalNumber(j, "bestBid");
  m.best_ask = optionalNumber(j, "bestAsk");
  m.maker_base_fee = static_cast<uint32_t>(numberOr(j, "makerBaseFee", 0));
  m.taker_base_fee = static_cast<uint32_t>(numberOr(j, "takerBaseFee", 0));
  m.liquidity = j.contains("liquidityNum") ? numberOr(j, "liquidityNum", 0.0)
                                           : numberOr(j, "liquidity", 0.0);
  m.volume_24hr = numberOr(j, "volume24hr", 0.0);
  m.active = j.value("active", true);
  m.accepting_orders = j.value("acceptingOrders", true);
  return m;
}

// ── Order book ───────────────────────────────────────────────────────
OrderBook parseOrderBook(const json &j) {
  OrderBook book;
  book.token_id = j.contains("asset_id") ? j["asset_id"].get<std::string>()
                                         : j.value("token_id", "");
  if (j.contains("bids"))
    book.bids = parseLevels(j["bids"]);
  if (j.contains("asks"))
    book.asks = parseLevels(j["asks"]);
  book.timestamp = static_cast<uint64_t>(numberOr(j, "timestamp", 0.0));

  // Sort: bids descending, asks ascending
  std::sort(book.bids.begin(), book.bids.end(),
            [](auto &a, auto &b) { return a.price > b.price; });
  std::sort(book.asks.begin(), book.asks.end(),
            [](auto &a, auto &b) { return a.price < b.price; });
  return book;
}

// ── Snapshot ─────────────────────────────────────────────────────────
Snapshot parseSnapshot(const json &j) {
  Snapshot snap;
  try {
    if (j.contains("markets")) {
      for (const auto &m : j["markets"]) {
        if (auto market = parseMarket(m))
          snap.markets.push_back(std::move(*market));
      }
    }
    if (j.contains("books")) {
      for (const auto &b : j["books"]) {
        auto book = parseOrderBook(b);
        snap.books[book.token_id] = std::move(book);
      }
    }
  } catch (const json::exception &e) {
    throw SnapshotError(std::string("malformed snapshot: ") + e.what());
  } catch (const std::logic_error &e) {
    throw SnapshotError(std::string("bad numeric field: ") + e.what());
  }
  return snap;
}

std::vector<Snapshot> loadSnapshots(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw SnapshotError("cannot open snapshot file: " + path);

  json data;
  try {
    data = json::parse(in);
  } catch (const json::parse_error &e) {
    throw SnapshotError("invalid JSON in " + path + ": " + e.what());
  }

  std::vector<Snapshot> cycles;
  if (data.is_array()) {
    for (const auto &cycle : data)
      cycles.push_back(parseSnapshot(cycle));
  } else {
    cycles.push_back(parseSnapshot(data));
  }

  spdlog::info("[Snapshot] Loaded {} cycle(s) from {}", cycles.size(), path);
  return cycles;
}

} // namespace polyshark
