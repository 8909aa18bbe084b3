#include "bags/view_engine.hpp"
#include "test_support.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using bags::SortColumn;
using bags::SortDirection;
using bags::SortSpec;
using bags::Tab;
using bags::ViewEngine;
using bags::ViewQuery;

namespace {

std::vector<bags::Coin> btcEth() {
  auto btc = test::makeCoin("btc", "Bitcoin", "btc", 50000, 1);
  btc.market_cap = 900e9;
  auto eth = test::makeCoin("eth", "Ethereum", "eth", 3000, 2);
  eth.market_cap = 400e9;
  return {btc, eth};
}

std::vector<std::string> ids(const std::vector<bags::VisibleCoin>& visible) {
  std::vector<std::string> out;
  for (const auto& v : visible) out.push_back(v.coin->id);
  return out;
}

} // namespace

void test_provider_order_without_sort() {
  auto coins = btcEth();
  ViewQuery query;
  auto visible = ViewEngine::compute(coins, query);
  assert((ids(visible) == std::vector<std::string>{"btc", "eth"}));
  assert(visible[0].index == 0 && visible[1].index == 1);

  std::cout << "✅ Provider order test passed" << std::endl;
}

void test_price_sort_both_directions() {
  auto coins = btcEth();
  ViewQuery query;
  query.sort = SortSpec{SortColumn::Price, SortDirection::Descending};
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"btc", "eth"}));

  query.sort = SortSpec{SortColumn::Price, SortDirection::Ascending};
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"eth", "btc"}));

  std::cout << "✅ Price sort test passed" << std::endl;
}

void test_filter_matches_name_and_symbol() {
  std::vector<bags::Coin> coins = {
    test::makeCoin("bitcoin", "Bitcoin", "btc", 50000),
    test::makeCoin("ethereum", "Ethereum", "eth", 3000),
    test::makeCoin("wrapped-bitcoin", "Wrapped Bitcoin", "wbtc", 49900),
  };
  ViewQuery query;
  query.filter = "BTC";
  auto visible = ViewEngine::compute(coins, query);
  assert((ids(visible) == std::vector<std::string>{"bitcoin", "wrapped-bitcoin"}));
  for (const auto& v : visible) {
    assert(ViewEngine::matchesFilter(*v.coin, query.filter));
  }

  query.filter = "ether";
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"ethereum"}));

  query.filter = "doge";
  assert(ViewEngine::compute(coins, query).empty());

  std::cout << "✅ Filter test passed" << std::endl;
}

void test_tab_scope() {
  auto coins = btcEth();
  coins.push_back(test::makeCoin("sol", "Solana", "sol", 150, 5));
  std::set<std::string> favourites = {"eth"};
  std::vector<bags::Holding> holdings = {{"sol", 2.0, std::nullopt}, {"btc", 0.0, std::nullopt}};

  ViewQuery query;
  query.favourites = &favourites;
  query.holdings = &holdings;

  query.tab = Tab::Favourites;
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"eth", "sol"}));

  query.tab = Tab::Portfolio;
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"sol"}));

  query.tab = Tab::Markets;
  assert(ViewEngine::compute(coins, query).size() == 3);

  std::cout << "✅ Tab scope test passed" << std::endl;
}

void test_sort_is_stable() {
  std::vector<bags::Coin> coins = {
    test::makeCoin("a", "A", "a", 10, std::nullopt, 1.0),
    test::makeCoin("b", "B", "b", 20, std::nullopt, 1.0),
    test::makeCoin("c", "C", "c", 30, std::nullopt, -1.0),
    test::makeCoin("d", "D", "d", 40, std::nullopt, 1.0),
  };
  ViewQuery query;
  query.sort = SortSpec{SortColumn::Change24h, SortDirection::Descending};
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"a", "b", "d", "c"}));

  query.sort = SortSpec{SortColumn::Change24h, SortDirection::Ascending};
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"c", "a", "b", "d"}));

  std::cout << "✅ Stable sort test passed" << std::endl;
}

void test_missing_and_nan_values() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  std::vector<bags::Coin> coins = {
    test::makeCoin("x", "X", "x", 1, std::nullopt, 5.0),
    test::makeCoin("y", "Y", "y", 1, std::nullopt, std::nullopt),
    test::makeCoin("z", "Z", "z", 1, std::nullopt, nan),
    test::makeCoin("w", "W", "w", 1, std::nullopt, -2.0),
  };
  ViewQuery query;
  query.sort = SortSpec{SortColumn::Change24h, SortDirection::Ascending};
  // Missing and NaN compare equal and sort first, keeping provider order between them
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"y", "z", "w", "x"}));

  query.sort = SortSpec{SortColumn::Change24h, SortDirection::Descending};
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"x", "w", "y", "z"}));

  std::cout << "✅ Missing and NaN ordering test passed" << std::endl;
}

void test_name_sort_ignores_case() {
  std::vector<bags::Coin> coins = {
    test::makeCoin("b", "bravo", "b", 1),
    test::makeCoin("a", "Alpha", "a", 1),
    test::makeCoin("c", "Charlie", "c", 1),
  };
  ViewQuery query;
  query.sort = SortSpec{SortColumn::Name, SortDirection::Ascending};
  assert((ids(ViewEngine::compute(coins, query)) == std::vector<std::string>{"a", "b", "c"}));

  std::cout << "✅ Name sort test passed" << std::endl;
}

void test_toggle_cycle() {
  std::optional<SortSpec> sort;
  sort = bags::toggleSort(sort, SortColumn::Price);
  assert(sort && sort->column == SortColumn::Price && sort->direction == SortDirection::Ascending);
  sort = bags::toggleSort(sort, SortColumn::Price);
  assert(sort && sort->direction == SortDirection::Descending);
  sort = bags::toggleSort(sort, SortColumn::Price);
  assert(!sort);
  sort = bags::toggleSort(sort, SortColumn::Price);
  assert(sort && sort->direction == SortDirection::Ascending);

  // Another column restarts ascending
  sort = bags::toggleSort(SortSpec{SortColumn::Price, SortDirection::Descending}, SortColumn::Volume);
  assert(sort && sort->column == SortColumn::Volume && sort->direction == SortDirection::Ascending);

  assert(bags::sortColumnForKey('p') == SortColumn::Price);
  assert(bags::sortColumnForKey('7') == SortColumn::Change7d);
  assert(!bags::sortColumnForKey('z'));

  std::cout << "✅ Sort toggle cycle test passed" << std::endl;
}

int main() {
  std::cout << "Running ViewEngine tests..." << std::endl;

  test_provider_order_without_sort();
  test_price_sort_both_directions();
  test_filter_matches_name_and_symbol();
  test_tab_scope();
  test_sort_is_stable();
  test_missing_and_nan_values();
  test_name_sort_ignores_case();
  test_toggle_cycle();

  std::cout << "🎉 All ViewEngine tests passed" << std::endl;
  return 0;
}
