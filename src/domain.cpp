#include "bags/domain.hpp"
#include <algorithm>
#include <map>

namespace bags {

const char* toString(AlertDirection direction) noexcept {
  return direction == AlertDirection::Above ? "above" : "below";
}

AlertDirection toggled(AlertDirection direction) noexcept {
  return direction == AlertDirection::Above ? AlertDirection::Below : AlertDirection::Above;
}

bool PriceAlert::isTriggeredBy(double price) const noexcept {
  switch (direction) {
    case AlertDirection::Above: return price >= target_price;
    case AlertDirection::Below: return price <= target_price;
  }
  return false;
}

const char* tabTitle(Tab tab) noexcept {
  switch (tab) {
    case Tab::Markets: return "Markets";
    case Tab::Favourites: return "Favourites";
    case Tab::Portfolio: return "Portfolio";
  }
  return "Markets";
}

Tab nextTab(Tab tab) noexcept {
  switch (tab) {
    case Tab::Markets: return Tab::Favourites;
    case Tab::Favourites: return Tab::Portfolio;
    case Tab::Portfolio: return Tab::Markets;
  }
  return Tab::Markets;
}

std::optional<SortSpec> toggleSort(const std::optional<SortSpec>& current, SortColumn column) noexcept {
  if (!current || current->column != column) {
    return SortSpec{column, SortDirection::Ascending};
  }
  if (current->direction == SortDirection::Ascending) {
    return SortSpec{column, SortDirection::Descending};
  }
  return std::nullopt;
}

std::optional<SortColumn> sortColumnForKey(char key) noexcept {
  switch (key) {
    case 'r':
    case '#': return SortColumn::Rank;
    case 'n': return SortColumn::Name;
    case 'p': return SortColumn::Price;
    case '1': return SortColumn::Change1h;
    case '2': return SortColumn::Change24h;
    case '7': return SortColumn::Change7d;
    case 'v': return SortColumn::Volume;
    case 'm': return SortColumn::MarketCap;
    default: return std::nullopt;
  }
}

const char* sortColumnLabel(SortColumn column) noexcept {
  switch (column) {
    case SortColumn::Rank: return "#";
    case SortColumn::Name: return "Name";
    case SortColumn::Price: return "Price";
    case SortColumn::Change1h: return "1h";
    case SortColumn::Change24h: return "24h";
    case SortColumn::Change7d: return "7d";
    case SortColumn::Volume: return "Volume";
    case SortColumn::MarketCap: return "Market Cap";
  }
  return "";
}

int rangeDays(ChartRange range) noexcept {
  switch (range) {
    case ChartRange::Day1: return 1;
    case ChartRange::Week1: return 7;
    case ChartRange::Month1: return 30;
  }
  return 1;
}

const char* rangeLabel(ChartRange range) noexcept {
  switch (range) {
    case ChartRange::Day1: return "1D";
    case ChartRange::Week1: return "7D";
    case ChartRange::Month1: return "30D";
  }
  return "1D";
}

ChartRange nextRange(ChartRange range) noexcept {
  switch (range) {
    case ChartRange::Day1: return ChartRange::Week1;
    case ChartRange::Week1: return ChartRange::Month1;
    case ChartRange::Month1: return ChartRange::Day1;
  }
  return ChartRange::Day1;
}

ChartRange prevRange(ChartRange range) noexcept {
  switch (range) {
    case ChartRange::Day1: return ChartRange::Month1;
    case ChartRange::Week1: return ChartRange::Day1;
    case ChartRange::Month1: return ChartRange::Week1;
  }
  return ChartRange::Day1;
}

const char* toString(NotificationMethod method) noexcept {
  switch (method) {
    case NotificationMethod::None: return "none";
    case NotificationMethod::Desktop: return "desktop";
    case NotificationMethod::Ntfy: return "ntfy";
    case NotificationMethod::Both: return "both";
  }
  return "none";
}

NotificationMethod notificationMethodFromString(const std::string& value) noexcept {
  if (value == "desktop") return NotificationMethod::Desktop;
  if (value == "ntfy") return NotificationMethod::Ntfy;
  if (value == "both") return NotificationMethod::Both;
  return NotificationMethod::None;
}

bool wantsDesktop(NotificationMethod method) noexcept {
  return method == NotificationMethod::Desktop || method == NotificationMethod::Both;
}

bool wantsNtfy(NotificationMethod method) noexcept {
  return method == NotificationMethod::Ntfy || method == NotificationMethod::Both;
}

const std::vector<SettingsField>& settingsFields() {
  static const std::vector<SettingsField> fields = {
    SettingsField::Currency,
    SettingsField::Theme,
    SettingsField::RefreshInterval,
    SettingsField::CoingeckoApiKey,
    SettingsField::CoinmarketcapApiKey,
    SettingsField::Notifications,
    SettingsField::NtfyTopic,
  };
  return fields;
}

const char* settingsFieldLabel(SettingsField field) noexcept {
  switch (field) {
    case SettingsField::Currency: return "Currency";
    case SettingsField::Theme: return "Theme";
    case SettingsField::RefreshInterval: return "Refresh interval";
    case SettingsField::CoingeckoApiKey: return "CoinGecko API key";
    case SettingsField::CoinmarketcapApiKey: return "CoinMarketCap API key";
    case SettingsField::Notifications: return "Notifications";
    case SettingsField::NtfyTopic: return "Ntfy topic";
  }
  return "";
}

bool isTextField(SettingsField field) noexcept {
  return field == SettingsField::CoingeckoApiKey ||
         field == SettingsField::CoinmarketcapApiKey ||
         field == SettingsField::NtfyTopic;
}

const std::vector<std::string>& supportedCurrencies() {
  static const std::vector<std::string> currencies = {
    "usd", "eur", "gbp", "jpy", "aud", "cad", "chf", "cny", "krw", "inr", "brl", "btc", "eth",
  };
  return currencies;
}

const std::vector<int>& refreshIntervalChoices() {
  static const std::vector<int> choices = {30, 60, 120, 300, 600};
  return choices;
}

std::string currencySymbol(const std::string& currency) {
  static const std::map<std::string, std::string> symbols = {
    {"usd", "$"}, {"eur", "€"}, {"gbp", "£"}, {"jpy", "¥"}, {"aud", "A$"},
    {"cad", "C$"}, {"chf", "CHF "}, {"cny", "¥"}, {"krw", "₩"}, {"inr", "₹"},
    {"brl", "R$"}, {"btc", "₿"}, {"eth", "Ξ"},
  };
  auto it = symbols.find(currency);
  return it != symbols.end() ? it->second : "";
}

bool isSupportedCurrency(const std::string& currency) noexcept {
  const auto& currencies = supportedCurrencies();
  return std::find(currencies.begin(), currencies.end(), currency) != currencies.end();
}

} // namespace bags
