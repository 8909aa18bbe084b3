#pragma once
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain.hpp"

namespace bags {

// A row of the visible list: the coin and its position in the provider snapshot.
struct VisibleCoin {
  size_t index;
  const Coin* coin;
};

struct ViewQuery {
  Tab tab = Tab::Markets;
  const std::set<std::string>* favourites = nullptr;
  const std::vector<Holding>* holdings = nullptr;
  std::string filter;
  std::optional<SortSpec> sort;
};

/**
 * Derives the list shown in the table: tab scope, then filter, then a stable sort.
 * Pure; recomputed on every frame from the current snapshot.
 */
class ViewEngine {
public:
  static std::vector<VisibleCoin> compute(const std::vector<Coin>& coins, const ViewQuery& query);

  // Three-way comparison in the column's natural (ascending) order.
  // Missing and NaN values sort before present ones.
  static int compare(const Coin& a, const Coin& b, SortColumn column);

  static bool matchesFilter(const Coin& coin, const std::string& filter);
};

} // namespace bags
