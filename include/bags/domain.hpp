#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bags {

// --- Market data ---

// One asset row of a market snapshot. Replaced wholesale on every refresh.
struct Coin {
  std::string id;
  std::string name;
  std::string symbol;
  double current_price = 0.0;
  double market_cap = 0.0;
  double total_volume = 0.0;
  std::optional<double> price_change_1h;
  std::optional<double> price_change_24h;
  std::optional<double> price_change_7d;
  std::optional<uint32_t> market_cap_rank;
  std::optional<double> high_24h;
  std::optional<double> low_24h;
  std::optional<double> circulating_supply;
  std::optional<double> max_supply;
};

struct SearchResult {
  std::string id;
  std::string name;
  std::string symbol;
  std::optional<uint32_t> market_cap_rank;
};

struct Sentiment {
  uint32_t value = 0;
  std::string label;
};

struct GlobalStats {
  double total_market_cap = 0.0;
  double btc_dominance = 0.0;
  std::optional<Sentiment> sentiment;
};

// --- Portfolio ---

struct Holding {
  std::string coin_id;
  double amount = 0.0;
  std::optional<double> buy_price;

  bool isPositive() const noexcept { return amount > 0.0; }
};

enum class AlertDirection { Above, Below };

const char* toString(AlertDirection direction) noexcept;
AlertDirection toggled(AlertDirection direction) noexcept;

struct PriceAlert {
  int64_t id = 0;
  std::string coin_id;
  double target_price = 0.0;
  AlertDirection direction = AlertDirection::Above;
  bool triggered = false;
  std::optional<double> triggered_price;

  // Above fires at or over the target, Below at or under it.
  bool isTriggeredBy(double price) const noexcept;
};

// --- View ---

enum class Tab { Markets, Favourites, Portfolio };

const char* tabTitle(Tab tab) noexcept;
Tab nextTab(Tab tab) noexcept;

enum class SortColumn { Rank, Name, Price, Change1h, Change24h, Change7d, Volume, MarketCap };
enum class SortDirection { Ascending, Descending };

struct SortSpec {
  SortColumn column = SortColumn::Rank;
  SortDirection direction = SortDirection::Ascending;

  bool operator==(const SortSpec& other) const noexcept {
    return column == other.column && direction == other.direction;
  }
};

// Same column cycles ascending -> descending -> unset; another column starts ascending.
std::optional<SortSpec> toggleSort(const std::optional<SortSpec>& current, SortColumn column) noexcept;
std::optional<SortColumn> sortColumnForKey(char key) noexcept;
const char* sortColumnLabel(SortColumn column) noexcept;

enum class ChartRange { Day1, Week1, Month1 };

int rangeDays(ChartRange range) noexcept;
const char* rangeLabel(ChartRange range) noexcept;
ChartRange nextRange(ChartRange range) noexcept;
ChartRange prevRange(ChartRange range) noexcept;

// --- Settings ---

enum class NotificationMethod { None, Desktop, Ntfy, Both };

const char* toString(NotificationMethod method) noexcept;
NotificationMethod notificationMethodFromString(const std::string& value) noexcept;
bool wantsDesktop(NotificationMethod method) noexcept;
bool wantsNtfy(NotificationMethod method) noexcept;

enum class SettingsField {
  Currency, Theme, RefreshInterval, CoingeckoApiKey, CoinmarketcapApiKey, Notifications, NtfyTopic
};

const std::vector<SettingsField>& settingsFields();
const char* settingsFieldLabel(SettingsField field) noexcept;
bool isTextField(SettingsField field) noexcept;

struct Settings {
  std::string currency = "usd";
  std::string theme = "dark";
  int refresh_interval_secs = 60;
  std::string coingecko_api_key;
  std::string cmc_api_key;
  NotificationMethod notification_method = NotificationMethod::None;
  std::string ntfy_topic;
};

// Keys under which secret settings live in the encrypted store.
namespace setting_keys {
  constexpr const char* kCoingeckoApiKey = "coingecko_api_key";
  constexpr const char* kCmcApiKey = "cmc_api_key";
  constexpr const char* kCurrency = "currency";
  constexpr const char* kNotificationMethod = "notification_method";
  constexpr const char* kNtfyTopic = "ntfy_topic";
}

const std::vector<std::string>& supportedCurrencies();
const std::vector<int>& refreshIntervalChoices();
std::string currencySymbol(const std::string& currency);
bool isSupportedCurrency(const std::string& currency) noexcept;

// Steps through a list by one position, wrapping at both ends.
template <typename T>
T cycleValue(const std::vector<T>& values, const T& current, bool forward) {
  if (values.empty()) return current;
  size_t index = values.size();
  for (size_t i = 0; i < values.size(); ++i) {
    if (values[i] == current) {
      index = i;
      break;
    }
  }
  if (index == values.size()) return values.front();
  index = forward ? (index + 1) % values.size() : (index + values.size() - 1) % values.size();
  return values[index];
}

} // namespace bags
