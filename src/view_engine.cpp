#include "bags/view_engine.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

namespace bags {

namespace {

std::string toLower(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::optional<double> present(double value) {
  if (std::isnan(value)) return std::nullopt;
  return value;
}

std::optional<double> present(const std::optional<double>& value) {
  if (!value || std::isnan(*value)) return std::nullopt;
  return value;
}

template <typename T>
int compareOptional(const std::optional<T>& a, const std::optional<T>& b) {
  if (!a && !b) return 0;
  if (!a) return -1;
  if (!b) return 1;
  if (*a < *b) return -1;
  if (*b < *a) return 1;
  return 0;
}

} // namespace

bool ViewEngine::matchesFilter(const Coin& coin, const std::string& filter) {
  if (filter.empty()) return true;
  const std::string needle = toLower(filter);
  return toLower(coin.name).find(needle) != std::string::npos ||
         toLower(coin.symbol).find(needle) != std::string::npos;
}

int ViewEngine::compare(const Coin& a, const Coin& b, SortColumn column) {
  switch (column) {
    case SortColumn::Rank:
      return compareOptional(a.market_cap_rank, b.market_cap_rank);
    case SortColumn::Name: {
      const std::string la = toLower(a.name);
      const std::string lb = toLower(b.name);
      return la < lb ? -1 : (lb < la ? 1 : 0);
    }
    case SortColumn::Price:
      return compareOptional(present(a.current_price), present(b.current_price));
    case SortColumn::Change1h:
      return compareOptional(present(a.price_change_1h), present(b.price_change_1h));
    case SortColumn::Change24h:
      return compareOptional(present(a.price_change_24h), present(b.price_change_24h));
    case SortColumn::Change7d:
      return compareOptional(present(a.price_change_7d), present(b.price_change_7d));
    case SortColumn::Volume:
      return compareOptional(present(a.total_volume), present(b.total_volume));
    case SortColumn::MarketCap:
      return compareOptional(present(a.market_cap), present(b.market_cap));
  }
  return 0;
}

std::vector<VisibleCoin> ViewEngine::compute(const std::vector<Coin>& coins, const ViewQuery& query) {
  std::unordered_set<std::string> held;
  if (query.holdings) {
    for (const auto& h : *query.holdings) {
      if (h.isPositive()) held.insert(h.coin_id);
    }
  }

  auto inTab = [&](const Coin& coin) {
    switch (query.tab) {
      case Tab::Markets:
        return true;
      case Tab::Favourites:
        return (query.favourites && query.favourites->count(coin.id) > 0) || held.count(coin.id) > 0;
      case Tab::Portfolio:
        return held.count(coin.id) > 0;
    }
    return true;
  };

  std::vector<VisibleCoin> visible;
  visible.reserve(coins.size());
  for (size_t i = 0; i < coins.size(); ++i) {
    const Coin& coin = coins[i];
    if (inTab(coin) && matchesFilter(coin, query.filter)) {
      visible.push_back({i, &coin});
    }
  }

  if (query.sort) {
    const SortColumn column = query.sort->column;
    const bool descending = query.sort->direction == SortDirection::Descending;
    std::stable_sort(visible.begin(), visible.end(),
                     [column, descending](const VisibleCoin& a, const VisibleCoin& b) {
                       int c = compare(*a.coin, *b.coin, column);
                       return descending ? c > 0 : c < 0;
                     });
  }
  return visible;
}

} // namespace bags
