#include "bags/chart_cache.hpp"
#include "bags/logger.hpp"
#include <chrono>
#include <iterator>

namespace bags {

ChartLookup ChartCache::getOrFetch(MarketDataSource& source, const std::string& coin_id,
                                   const std::string& currency, int days) {
  Key key{coin_id, days};

  if (auto hit = series_.find(key); hit != series_.end()) {
    return {ChartStatus::Ready, &hit->second};
  }
  if (pending_.count(key) > 0) {
    return {ChartStatus::Loading, nullptr};
  }

  LOG_DEBUG("Fetching chart " + coin_id + " " + std::to_string(days) + "d");
  auto it = pending_.emplace(key, source.fetchSeries(coin_id, currency, days)).first;
  harvest(it);

  if (auto hit = series_.find(key); hit != series_.end()) {
    return {ChartStatus::Ready, &hit->second};
  }
  return {pending_.count(key) > 0 ? ChartStatus::Loading : ChartStatus::Failed, nullptr};
}

const std::vector<double>* ChartCache::find(const std::string& coin_id, int days) const {
  auto it = series_.find(Key{coin_id, days});
  return it != series_.end() ? &it->second : nullptr;
}

bool ChartCache::isLoading(const std::string& coin_id, int days) const {
  return pending_.count(Key{coin_id, days}) > 0;
}

bool ChartCache::harvest(std::map<Key, std::future<std::vector<double>>>::iterator it) {
  auto& future = it->second;
  if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    return false;
  }

  const Key key = it->first;
  try {
    series_[key] = future.get();
  } catch (const std::exception& e) {
    LOG_ERROR("Chart fetch for " + key.first + " (" + std::to_string(key.second) + "d) failed: " + e.what());
    errors_.push_back({key, e.what()});
  }
  pending_.erase(it);
  return true;
}

std::vector<ChartFailure> ChartCache::poll() {
  for (auto it = pending_.begin(); it != pending_.end();) {
    auto next = std::next(it);
    harvest(it);
    it = next;
  }
  std::vector<ChartFailure> errors;
  errors.swap(errors_);
  return errors;
}

void ChartCache::clear() {
  series_.clear();
  pending_.clear();
  errors_.clear();
}

} // namespace bags
