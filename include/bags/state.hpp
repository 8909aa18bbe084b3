#pragma once
#include <chrono>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "chart_cache.hpp"
#include "domain.hpp"
#include "view_engine.hpp"

namespace bags {

using Clock = std::chrono::steady_clock;

class StateException : public std::runtime_error {
public:
    explicit StateException(const std::string& message) : std::runtime_error(message) {}
};

// --- Input modes ---

namespace mode {

struct Locked {
  bool is_new = false;
  std::string buffer;
  std::string error;
};

struct ConfirmingPassword {
  std::string first;
  std::string buffer;
};

struct Browsing {};

struct Filtering {};

struct SortPicking {};

struct EditingAmount {
  std::string coin_id;
  std::string buffer;
};

struct EditingAlert {
  std::string coin_id;
  std::string buffer;
  AlertDirection direction = AlertDirection::Above;
};

struct EditingBuyPrice {
  std::string coin_id;
  std::string buffer;
};

struct Settings {
  SettingsField field = SettingsField::Currency;
  bool editing = false;
  std::string edit_buffer;
  bags::Settings draft;
  std::string error;
};

struct SearchQuery {
  std::string query;
  std::string error;
};

struct SearchResults {
  std::string query;
  std::vector<SearchResult> results;
  size_t selected = 0;
};

struct ChartPopup {
  std::string coin_id;
  ChartRange range = ChartRange::Day1;
  std::string error;
};

} // namespace mode

// Exactly one modal surface is active at a time
using InputMode = std::variant<
    mode::Locked,
    mode::ConfirmingPassword,
    mode::Browsing,
    mode::Filtering,
    mode::SortPicking,
    mode::EditingAmount,
    mode::EditingAlert,
    mode::EditingBuyPrice,
    mode::Settings,
    mode::SearchQuery,
    mode::SearchResults,
    mode::ChartPopup>;

// --- State ---

struct MarketState {
  std::vector<Coin> coins;
  std::optional<GlobalStats> global;
  std::optional<Clock::time_point> last_refresh;
};

struct PortfolioState {
  std::vector<Holding> holdings;
  std::set<std::string> favourites;
  std::vector<PriceAlert> alerts;
};

struct UIState {
  Tab tab = Tab::Markets;
  size_t selected = 0;
  size_t scroll_offset = 0;
  size_t page_height = 20;
  std::string filter;
  std::optional<SortSpec> sort;
  std::optional<std::string> error;
  Clock::time_point error_time{};
  std::optional<std::string> alert_flash;  // coin id
  Clock::time_point alert_flash_time{};
  bool quit = false;
};

/**
 * Root aggregate of the application. Owned by the event loop and passed by
 * reference; background work never touches it directly.
 */
class AppState {
public:
  static constexpr std::chrono::seconds kErrorLifetime{10};
  static constexpr std::chrono::seconds kAlertFlashLifetime{2};
  static constexpr size_t kMaxErrorLength = 80;

  AppState() = default;
  AppState(const AppState&) = delete;
  AppState& operator=(const AppState&) = delete;

  MarketState market;
  PortfolioState portfolio;
  UIState ui;
  Settings settings;
  ChartCache charts;
  InputMode mode = mode::Locked{};

  bool isUnlocked() const noexcept;
  template <typename Mode>
  bool inMode() const noexcept { return std::holds_alternative<Mode>(mode); }

  // --- Derived views ---
  std::vector<VisibleCoin> visibleCoins() const;
  const Coin* selectedCoin() const;
  const Coin* findCoin(const std::string& coin_id) const;
  const Holding* holdingFor(const std::string& coin_id) const;
  bool isFavourite(const std::string& coin_id) const;
  std::vector<PriceAlert> alertsFor(const std::string& coin_id) const;
  double portfolioValue() const;
  double portfolioCost() const;

  // --- Cursor ---
  void moveSelection(int delta);
  void selectFirst();
  void selectLast();
  void clampSelection();
  void adjustScroll();
  void setTab(Tab tab);

  // --- Transient signals ---
  // Logs the full message and shows a truncated copy for kErrorLifetime
  void setError(const std::string& message, Clock::time_point now = Clock::now());
  void clearError() noexcept;
  void flashAlert(const std::string& coin_id, Clock::time_point now = Clock::now());
  void expireTransient(Clock::time_point now = Clock::now());

  static std::string truncateForDisplay(const std::string& message, size_t max_length = kMaxErrorLength);
};

} // namespace bags
