#include "bags/state.hpp"
#include "bags/logger.hpp"
#include <algorithm>

namespace bags {

bool AppState::isUnlocked() const noexcept {
  return !inMode<mode::Locked>() && !inMode<mode::ConfirmingPassword>();
}

std::vector<VisibleCoin> AppState::visibleCoins() const {
  ViewQuery query;
  query.tab = ui.tab;
  query.favourites = &portfolio.favourites;
  query.holdings = &portfolio.holdings;
  query.filter = ui.filter;
  query.sort = ui.sort;
  return ViewEngine::compute(market.coins, query);
}

const Coin* AppState::selectedCoin() const {
  auto visible = visibleCoins();
  if (visible.empty()) {
    return nullptr;
  }
  return visible[std::min(ui.selected, visible.size() - 1)].coin;
}

const Coin* AppState::findCoin(const std::string& coin_id) const {
  auto it = std::find_if(market.coins.begin(), market.coins.end(),
                         [&](const Coin& c) { return c.id == coin_id; });
  return it != market.coins.end() ? &*it : nullptr;
}

const Holding* AppState::holdingFor(const std::string& coin_id) const {
  auto it = std::find_if(portfolio.holdings.begin(), portfolio.holdings.end(),
                         [&](const Holding& h) { return h.coin_id == coin_id; });
  return it != portfolio.holdings.end() ? &*it : nullptr;
}

bool AppState::isFavourite(const std::string& coin_id) const {
  return portfolio.favourites.count(coin_id) > 0;
}

std::vector<PriceAlert> AppState::alertsFor(const std::string& coin_id) const {
  std::vector<PriceAlert> out;
  for (const auto& alert : portfolio.alerts) {
    if (alert.coin_id == coin_id) out.push_back(alert);
  }
  return out;
}

double AppState::portfolioValue() const {
  double total = 0.0;
  for (const auto& h : portfolio.holdings) {
    if (const Coin* coin = findCoin(h.coin_id)) {
      total += h.amount * coin->current_price;
    }
  }
  return total;
}

double AppState::portfolioCost() const {
  double total = 0.0;
  for (const auto& h : portfolio.holdings) {
    if (h.buy_price) total += h.amount * *h.buy_price;
  }
  return total;
}

void AppState::moveSelection(int delta) {
  const size_t count = visibleCoins().size();
  if (count == 0) {
    ui.selected = 0;
    ui.scroll_offset = 0;
    return;
  }
  if (delta < 0) {
    const size_t step = static_cast<size_t>(-delta);
    ui.selected = ui.selected > step ? ui.selected - step : 0;
  } else {
    ui.selected = std::min(ui.selected + static_cast<size_t>(delta), count - 1);
  }
  adjustScroll();
}

void AppState::selectFirst() {
  ui.selected = 0;
  adjustScroll();
}

void AppState::selectLast() {
  const size_t count = visibleCoins().size();
  ui.selected = count > 0 ? count - 1 : 0;
  adjustScroll();
}

void AppState::clampSelection() {
  const size_t count = visibleCoins().size();
  if (count == 0) {
    ui.selected = 0;
  } else if (ui.selected >= count) {
    ui.selected = count - 1;
  }
  adjustScroll();
}

void AppState::adjustScroll() {
  const size_t page = std::max<size_t>(ui.page_height, 1);
  if (ui.selected < ui.scroll_offset) {
    ui.scroll_offset = ui.selected;
  } else if (ui.selected >= ui.scroll_offset + page) {
    ui.scroll_offset = ui.selected + 1 - page;
  }
  const size_t count = visibleCoins().size();
  if (count <= page) {
    ui.scroll_offset = 0;
  } else if (ui.scroll_offset > count - page) {
    ui.scroll_offset = count - page;
  }
}

void AppState::setTab(Tab tab) {
  ui.tab = tab;
  ui.selected = 0;
  ui.scroll_offset = 0;
}

std::string AppState::truncateForDisplay(const std::string& message, size_t max_length) {
  if (message.size() <= max_length || max_length < 3) {
    return message;
  }
  return message.substr(0, max_length - 3) + "...";
}

void AppState::setError(const std::string& message, Clock::time_point now) {
  LOG_ERROR(message);
  ui.error = truncateForDisplay(message);
  ui.error_time = now;
}

void AppState::clearError() noexcept {
  ui.error.reset();
}

void AppState::flashAlert(const std::string& coin_id, Clock::time_point now) {
  ui.alert_flash = coin_id;
  ui.alert_flash_time = now;
}

void AppState::expireTransient(Clock::time_point now) {
  if (ui.error && now - ui.error_time >= kErrorLifetime) {
    ui.error.reset();
  }
  if (ui.alert_flash && now - ui.alert_flash_time >= kAlertFlashLifetime) {
    ui.alert_flash.reset();
  }
}

} // namespace bags
