#include "bags/coingecko_client.hpp"
#include "bags/https_client.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace bags {

namespace {

std::optional<double> optionalNumber(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return std::nullopt;
  return it->get<double>();
}

double numberOr(const json& j, const char* key, double fallback) {
  return optionalNumber(j, key).value_or(fallback);
}

std::optional<uint32_t> optionalRank(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return std::nullopt;
  double value = it->get<double>();
  if (value < 0) return std::nullopt;
  return static_cast<uint32_t>(value);
}

std::string stringOr(const json& j, const char* key, const std::string& fallback = "") {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

json parseBody(const std::string& body, const char* what) {
  try {
    return json::parse(body);
  } catch (const json::parse_error& e) {
    throw MarketDataError(std::string("Malformed ") + what + " response: " + e.what() +
                          " (body: " + excerpt(body) + ")");
  }
}

// Issues the request and insists on a 2xx status
std::string fetchBody(const std::string& host, const std::string& target) {
  http::Response response;
  try {
    response = http::get(host, target);
  } catch (const http::HttpError& e) {
    throw MarketDataError(e.what());
  } catch (const std::exception& e) {
    throw MarketDataError(std::string("Request to ") + host + " failed: " + e.what());
  }
  if (!response.ok()) {
    std::ostringstream oss;
    oss << "HTTP " << response.status << " from " << host << target << ": " << excerpt(response.body);
    throw MarketDataError(oss.str());
  }
  return std::move(response.body);
}

} // namespace

CoinGeckoClient::CoinGeckoClient(std::string api_key)
  : host_(api_key.empty() ? kPublicHost : kProHost)
  , api_key_(std::move(api_key)) {
}

std::string CoinGeckoClient::withKey(std::string target) const {
  if (!api_key_.empty()) {
    target += (target.find('?') == std::string::npos ? "?" : "&");
    target += "x_cg_pro_api_key=" + http::urlEncode(api_key_);
  }
  return target;
}

std::string CoinGeckoClient::marketsTarget(const std::string& currency, size_t limit,
                                           const std::string& ids) const {
  std::ostringstream oss;
  oss << kApiPrefix << "/coins/markets?vs_currency=" << http::urlEncode(currency)
      << "&order=market_cap_desc&per_page=" << limit
      << "&page=1&sparkline=false&price_change_percentage=1h%2C24h%2C7d";
  if (!ids.empty()) {
    oss << "&ids=" << http::urlEncode(ids);
  }
  return withKey(oss.str());
}

std::string CoinGeckoClient::chartTarget(const std::string& coin_id, const std::string& currency,
                                         int days) const {
  std::ostringstream oss;
  oss << kApiPrefix << "/coins/" << http::urlEncode(coin_id)
      << "/market_chart?vs_currency=" << http::urlEncode(currency) << "&days=" << days;
  return withKey(oss.str());
}

std::string CoinGeckoClient::searchTarget(const std::string& query) const {
  return withKey(std::string(kApiPrefix) + "/search?query=" + http::urlEncode(query));
}

std::string CoinGeckoClient::globalTarget() const {
  return withKey(std::string(kApiPrefix) + "/global");
}

std::future<std::vector<Coin>> CoinGeckoClient::fetchSnapshot(const std::string& currency, size_t limit) {
  std::string host = host_;
  std::string target = marketsTarget(currency, limit);
  return runDetached([host, target]() {
    return parseMarkets(fetchBody(host, target));
  });
}

std::future<std::vector<double>> CoinGeckoClient::fetchSeries(const std::string& coin_id,
                                                              const std::string& currency, int days) {
  std::string host = host_;
  std::string target = chartTarget(coin_id, currency, days);
  return runDetached([host, target]() {
    return parseChart(fetchBody(host, target));
  });
}

std::future<std::vector<SearchResult>> CoinGeckoClient::search(const std::string& query) {
  std::string host = host_;
  std::string target = searchTarget(query);
  return runDetached([host, target]() {
    return parseSearch(fetchBody(host, target));
  });
}

std::future<std::optional<Coin>> CoinGeckoClient::fetchSingle(const std::string& coin_id,
                                                              const std::string& currency) {
  std::string host = host_;
  std::string target = marketsTarget(currency, 1, coin_id);
  return runDetached([host, target]() -> std::optional<Coin> {
    auto coins = parseMarkets(fetchBody(host, target));
    if (coins.empty()) return std::nullopt;
    return coins.front();
  });
}

std::future<GlobalStats> CoinGeckoClient::fetchGlobalStats(const std::string& currency) {
  std::string host = host_;
  std::string target = globalTarget();
  return runDetached([host, target, currency]() {
    return parseGlobal(fetchBody(host, target), currency);
  });
}

std::future<Sentiment> CoinGeckoClient::fetchSentiment() {
  return runDetached([]() {
    return parseFearGreed(fetchBody(kSentimentHost, "/fng/"));
  });
}

std::vector<Coin> CoinGeckoClient::parseMarkets(const std::string& body) {
  json parsed = parseBody(body, "markets");
  if (!parsed.is_array()) {
    throw MarketDataError("Unexpected markets response (body: " + excerpt(body) + ")");
  }

  std::vector<Coin> coins;
  coins.reserve(parsed.size());
  for (const auto& item : parsed) {
    if (!item.is_object()) continue;
    Coin coin;
    coin.id = stringOr(item, "id");
    if (coin.id.empty()) continue;
    coin.name = stringOr(item, "name", coin.id);
    coin.symbol = stringOr(item, "symbol");
    coin.current_price = numberOr(item, "current_price", 0.0);
    coin.market_cap = numberOr(item, "market_cap", 0.0);
    coin.total_volume = numberOr(item, "total_volume", 0.0);
    coin.price_change_1h = optionalNumber(item, "price_change_percentage_1h_in_currency");
    coin.price_change_24h = optionalNumber(item, "price_change_percentage_24h_in_currency");
    coin.price_change_7d = optionalNumber(item, "price_change_percentage_7d_in_currency");
    coin.market_cap_rank = optionalRank(item, "market_cap_rank");
    coin.high_24h = optionalNumber(item, "high_24h");
    coin.low_24h = optionalNumber(item, "low_24h");
    coin.circulating_supply = optionalNumber(item, "circulating_supply");
    coin.max_supply = optionalNumber(item, "max_supply");
    coins.push_back(std::move(coin));
  }
  return coins;
}

std::vector<double> CoinGeckoClient::parseChart(const std::string& body) {
  json parsed = parseBody(body, "chart");
  auto it = parsed.is_object() ? parsed.find("prices") : parsed.end();
  if (it == parsed.end() || !it->is_array()) {
    throw MarketDataError("Chart response has no prices (body: " + excerpt(body) + ")");
  }

  std::vector<double> prices;
  prices.reserve(it->size());
  for (const auto& point : *it) {
    // [timestamp_ms, price]
    if (point.is_array() && point.size() > 1 && point[1].is_number()) {
      prices.push_back(point[1].get<double>());
    }
  }
  return prices;
}

std::vector<SearchResult> CoinGeckoClient::parseSearch(const std::string& body, size_t max_results) {
  json parsed = parseBody(body, "search");
  auto it = parsed.is_object() ? parsed.find("coins") : parsed.end();
  if (it == parsed.end() || !it->is_array()) {
    throw MarketDataError("Search response has no coins (body: " + excerpt(body) + ")");
  }

  std::vector<SearchResult> results;
  for (const auto& item : *it) {
    if (results.size() >= max_results) break;
    SearchResult result;
    result.id = stringOr(item, "id");
    if (result.id.empty()) continue;
    result.name = stringOr(item, "name", result.id);
    result.symbol = stringOr(item, "symbol");
    result.market_cap_rank = optionalRank(item, "market_cap_rank");
    results.push_back(std::move(result));
  }
  return results;
}

GlobalStats CoinGeckoClient::parseGlobal(const std::string& body, const std::string& currency) {
  json parsed = parseBody(body, "global");
  auto data = parsed.is_object() ? parsed.find("data") : parsed.end();
  if (data == parsed.end() || !data->is_object()) {
    throw MarketDataError("Global response has no data (body: " + excerpt(body) + ")");
  }

  GlobalStats stats;
  auto caps = data->find("total_market_cap");
  if (caps != data->end() && caps->is_object()) {
    auto cap = optionalNumber(*caps, currency.c_str());
    stats.total_market_cap = cap ? *cap : numberOr(*caps, "usd", 0.0);
  }
  auto shares = data->find("market_cap_percentage");
  if (shares != data->end() && shares->is_object()) {
    stats.btc_dominance = numberOr(*shares, "btc", 0.0);
  }
  return stats;
}

Sentiment CoinGeckoClient::parseFearGreed(const std::string& body) {
  json parsed = parseBody(body, "fear & greed");
  auto data = parsed.is_object() ? parsed.find("data") : parsed.end();
  if (data == parsed.end() || !data->is_array() || data->empty()) {
    throw MarketDataError("Fear & greed response has no data (body: " + excerpt(body) + ")");
  }

  const json& entry = data->front();
  Sentiment sentiment;
  // The index value arrives as a string
  const std::string raw = stringOr(entry, "value");
  try {
    sentiment.value = static_cast<uint32_t>(std::stoul(raw));
  } catch (const std::logic_error&) {
    throw MarketDataError("Fear & greed value is not a number: '" + raw + "'");
  }
  sentiment.label = stringOr(entry, "value_classification");
  return sentiment;
}

} // namespace bags
