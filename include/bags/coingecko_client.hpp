#pragma once
#include <string>
#include <vector>
#include "market_data.hpp"

namespace bags {

/**
 * MarketDataSource backed by the CoinGecko v3 API, plus the alternative.me
 * Fear & Greed index for sentiment. A non-empty API key switches to the pro host.
 *
 * Response parsing is exposed as static functions so it can be exercised
 * without network access.
 */
class CoinGeckoClient : public MarketDataSource {
public:
  static constexpr const char* kPublicHost = "api.coingecko.com";
  static constexpr const char* kProHost = "pro-api.coingecko.com";
  static constexpr const char* kApiPrefix = "/api/v3";
  static constexpr const char* kSentimentHost = "api.alternative.me";

  explicit CoinGeckoClient(std::string api_key = "");

  std::future<std::vector<Coin>> fetchSnapshot(const std::string& currency, size_t limit) override;
  std::future<std::vector<double>> fetchSeries(const std::string& coin_id,
                                               const std::string& currency, int days) override;
  std::future<std::vector<SearchResult>> search(const std::string& query) override;
  std::future<std::optional<Coin>> fetchSingle(const std::string& coin_id,
                                               const std::string& currency) override;
  std::future<GlobalStats> fetchGlobalStats(const std::string& currency) override;
  std::future<Sentiment> fetchSentiment() override;

  const std::string& host() const noexcept { return host_; }

  // Request targets, relative to the API host
  std::string marketsTarget(const std::string& currency, size_t limit,
                            const std::string& ids = "") const;
  std::string chartTarget(const std::string& coin_id, const std::string& currency, int days) const;
  std::string searchTarget(const std::string& query) const;
  std::string globalTarget() const;

  static std::vector<Coin> parseMarkets(const std::string& body);
  static std::vector<double> parseChart(const std::string& body);
  static std::vector<SearchResult> parseSearch(const std::string& body, size_t max_results = kMaxSearchResults);
  static GlobalStats parseGlobal(const std::string& body, const std::string& currency);
  static Sentiment parseFearGreed(const std::string& body);

private:
  std::string host_;
  std::string api_key_;

  std::string withKey(std::string target) const;
};

} // namespace bags
