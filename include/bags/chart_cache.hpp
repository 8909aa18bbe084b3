#pragma once
#include <future>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "market_data.hpp"

namespace bags {

enum class ChartStatus { Ready, Loading, Failed };

struct ChartLookup {
  ChartStatus status = ChartStatus::Loading;
  const std::vector<double>* series = nullptr;
};

using ChartKey = std::pair<std::string, int>;

// A fetch that failed, with the (coin id, days) it was requested for
struct ChartFailure {
  ChartKey key;
  std::string message;
};

/**
 * Price series keyed by (coin id, range in days).
 * A key is fetched at most once while it is cached or in flight; results land
 * under the key they were requested for, whatever the popup shows by then.
 * Entries live until clear(), which the currency switch triggers.
 */
class ChartCache {
public:
  using Key = ChartKey;

  ChartLookup getOrFetch(MarketDataSource& source, const std::string& coin_id,
                         const std::string& currency, int days);

  const std::vector<double>* find(const std::string& coin_id, int days) const;
  bool isLoading(const std::string& coin_id, int days) const;

  // Moves finished fetches into the cache. Returns the failed ones.
  std::vector<ChartFailure> poll();

  // Drops every entry and abandons in-flight fetches
  void clear();

  size_t size() const noexcept { return series_.size(); }
  size_t pendingCount() const noexcept { return pending_.size(); }

private:
  std::map<Key, std::vector<double>> series_;
  std::map<Key, std::future<std::vector<double>>> pending_;
  std::vector<ChartFailure> errors_;

  // Harvests one pending key if its future is ready; returns whether it did
  bool harvest(std::map<Key, std::future<std::vector<double>>>::iterator it);
};

} // namespace bags
