#include "bags/views.hpp"
#include "bags/downsampler.hpp"
#include "bags/format.hpp"
#include <ftxui/dom/elements.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <type_traits>
#include <variant>

namespace bags {

using namespace ftxui;

namespace {

const char* const kEighths[] = {" ", "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};

Element cell(const std::string& content, int width, bool right_aligned = true) {
  Element body = right_aligned ? hbox({filler(), text(content)}) : text(content);
  return body | size(WIDTH, EQUAL, width);
}

Element changeCell(const std::optional<double>& change, int width, const Theme& theme) {
  Element e = cell(format::percent(change), width);
  if (change && std::isfinite(*change)) {
    e = e | color(*change >= 0 ? theme.positive : theme.negative);
  }
  return e;
}

std::string clip(const std::string& s, size_t max_length) {
  if (s.size() <= max_length) return s;
  return s.substr(0, max_length - 1) + "~";
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
  return s;
}

Element popup(const std::string& title, Elements body, const Theme& theme) {
  return window(text(" " + title + " ") | bold | color(theme.title), vbox(std::move(body)))
       | color(theme.fg) | clear_under | center;
}

Element hint(const std::string& s, const Theme& theme) {
  return text(s) | color(theme.dim);
}

Element inputLine(const std::string& label, const std::string& buffer, const Theme& theme) {
  return hbox({
    text(label),
    text(buffer) | color(theme.input_accent),
    text("_") | blink,
  });
}

// --- Table columns ---

struct Column {
  std::string label;
  int width;
  std::optional<SortColumn> sort;
  bool right_aligned = true;
};

std::vector<Column> columnsFor(Tab tab) {
  std::vector<Column> cols = {
    {"", 2, std::nullopt, false},
    {"#", 4, SortColumn::Rank},
    {"Name", 18, SortColumn::Name, false},
    {"Symbol", 7, std::nullopt, false},
    {"Price", 15, SortColumn::Price},
    {"1h", 8, SortColumn::Change1h},
    {"24h", 8, SortColumn::Change24h},
    {"7d", 8, SortColumn::Change7d},
  };
  if (tab == Tab::Portfolio) {
    cols.push_back({"Amount", 12, std::nullopt});
    cols.push_back({"Value", 15, std::nullopt});
    cols.push_back({"P/L", 15, std::nullopt});
  } else {
    cols.push_back({"Volume", 10, SortColumn::Volume});
    cols.push_back({"Mkt Cap", 10, SortColumn::MarketCap});
  }
  return cols;
}

Element headerRow(const AppState& state, const Theme& theme) {
  Elements cells;
  for (const auto& col : columnsFor(state.ui.tab)) {
    std::string label = col.label;
    if (col.sort && state.ui.sort && state.ui.sort->column == *col.sort) {
      label += state.ui.sort->direction == SortDirection::Ascending ? " ▲" : " ▼";
    }
    cells.push_back(cell(label, col.width, col.right_aligned) | bold);
    cells.push_back(text(" "));
  }
  return hbox(std::move(cells)) | color(theme.title);
}

Element coinRow(const AppState& state, const Coin& coin, bool selected, const Theme& theme) {
  const std::string sym = currencySymbol(state.settings.currency);
  const bool flashing = state.ui.alert_flash && *state.ui.alert_flash == coin.id;

  std::string marker;
  if (flashing) marker = "!";
  else if (state.isFavourite(coin.id)) marker = "*";

  Elements cells = {
    cell(marker, 2, false) | color(theme.accent), text(" "),
    cell(coin.market_cap_rank ? std::to_string(*coin.market_cap_rank) : "--", 4), text(" "),
    cell(clip(coin.name, 18), 18, false), text(" "),
    cell(upper(coin.symbol), 7, false) | color(theme.dim), text(" "),
    cell(format::price(coin.current_price, sym), 15), text(" "),
    changeCell(coin.price_change_1h, 8, theme), text(" "),
    changeCell(coin.price_change_24h, 8, theme), text(" "),
    changeCell(coin.price_change_7d, 8, theme), text(" "),
  };

  if (state.ui.tab == Tab::Portfolio) {
    const Holding* held = state.holdingFor(coin.id);
    const double amount = held ? held->amount : 0.0;
    const double value = amount * coin.current_price;
    cells.push_back(cell(format::amount(amount), 12));
    cells.push_back(text(" "));
    cells.push_back(cell(format::price(value, sym), 15));
    cells.push_back(text(" "));
    if (held && held->buy_price) {
      const double pnl = value - amount * *held->buy_price;
      cells.push_back(cell(format::price(pnl, sym), 15) | color(pnl >= 0 ? theme.positive : theme.negative));
    } else {
      cells.push_back(cell("--", 15) | color(theme.dim));
    }
  } else {
    cells.push_back(cell(format::large(coin.total_volume, sym), 10));
    cells.push_back(text(" "));
    cells.push_back(cell(format::large(coin.market_cap, sym), 10));
  }

  Element row = hbox(std::move(cells));
  if (flashing) {
    row = row | inverted;
  }
  if (selected) {
    row = row | bgcolor(theme.highlight_bg) | color(theme.highlight_fg) | bold;
  }
  return row;
}

Element portfolioTotals(const AppState& state, const Theme& theme) {
  const std::string sym = currencySymbol(state.settings.currency);
  const double value = state.portfolioValue();
  const double cost = state.portfolioCost();
  Elements parts = {
    text("Total ") | color(theme.dim),
    text(format::price(value, sym)) | bold,
    text("   Cost ") | color(theme.dim),
    text(cost > 0 ? format::price(cost, sym) : "--"),
  };
  if (cost > 0) {
    double pnl = 0.0;
    for (const auto& h : state.portfolio.holdings) {
      const Coin* coin = state.findCoin(h.coin_id);
      if (coin && h.buy_price) pnl += h.amount * (coin->current_price - *h.buy_price);
    }
    parts.push_back(text("   P/L ") | color(theme.dim));
    parts.push_back(text(format::price(pnl, sym) + " (" + format::percent(pnl / cost * 100.0) + ")")
                    | color(pnl >= 0 ? theme.positive : theme.negative));
  }
  return hbox(std::move(parts));
}

// --- Edit popups ---

Element amountPopup(const AppState& state, const mode::EditingAmount& m, const Theme& theme) {
  const Coin* coin = state.findCoin(m.coin_id);
  return popup("Amount: " + (coin ? coin->name : m.coin_id), {
    inputLine("Quantity: ", m.buffer, theme),
    text(""),
    hint("Enter save  Esc cancel  0 removes the holding", theme),
  }, theme);
}

Element alertPopup(const AppState& state, const mode::EditingAlert& m, const Theme& theme) {
  const Coin* coin = state.findCoin(m.coin_id);
  Elements body = {
    hbox({text("Direction: "), text(toString(m.direction)) | bold | color(theme.accent)}),
    inputLine("Target:    ", m.buffer, theme),
  };
  if (coin) {
    body.push_back(hint("Now " + format::price(coin->current_price, currencySymbol(state.settings.currency)), theme));
  }
  body.push_back(text(""));
  body.push_back(hint("Tab direction  Enter save  Esc cancel", theme));
  return popup("Alert: " + (coin ? coin->name : m.coin_id), std::move(body), theme);
}

Element buyPricePopup(const AppState& state, const mode::EditingBuyPrice& m, const Theme& theme) {
  const Coin* coin = state.findCoin(m.coin_id);
  return popup("Buy price: " + (coin ? coin->name : m.coin_id), {
    inputLine("Price: ", m.buffer, theme),
    text(""),
    hint("Enter save  Esc cancel  empty clears", theme),
  }, theme);
}

std::string settingValue(const mode::Settings& m, SettingsField field) {
  const Settings& d = m.draft;
  switch (field) {
    case SettingsField::Currency: return upper(d.currency);
    case SettingsField::Theme: return d.theme;
    case SettingsField::RefreshInterval: return std::to_string(d.refresh_interval_secs) + "s";
    case SettingsField::CoingeckoApiKey: return format::masked(d.coingecko_api_key);
    case SettingsField::CoinmarketcapApiKey: return format::masked(d.cmc_api_key);
    case SettingsField::Notifications: return toString(d.notification_method);
    case SettingsField::NtfyTopic: return d.ntfy_topic.empty() ? "(not set)" : d.ntfy_topic;
  }
  return "";
}

Element overlayFor(const AppState& state, const Theme& theme) {
  return std::visit([&](const auto& m) -> Element {
    using M = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<M, mode::EditingAmount>) return amountPopup(state, m, theme);
    else if constexpr (std::is_same_v<M, mode::EditingAlert>) return alertPopup(state, m, theme);
    else if constexpr (std::is_same_v<M, mode::EditingBuyPrice>) return buyPricePopup(state, m, theme);
    else if constexpr (std::is_same_v<M, mode::Settings>) return SettingsView(m, theme);
    else if constexpr (std::is_same_v<M, mode::SearchQuery>) return SearchView(m, theme);
    else if constexpr (std::is_same_v<M, mode::SearchResults>) return SearchResultsView(m, theme);
    else if constexpr (std::is_same_v<M, mode::ChartPopup>) return ChartPopupView(state, m, theme);
    else if constexpr (std::is_same_v<M, mode::SortPicking>) return SortPickerView(state, theme);
    else return emptyElement();
  }, state.mode);
}

} // namespace

const Theme& ActiveTheme(const AppState& state) {
  if (const auto* settings = std::get_if<mode::Settings>(&state.mode)) {
    return themeByName(settings->draft.theme);
  }
  return themeByName(state.settings.theme);
}

std::vector<std::string> SparklineRows(const std::vector<double>& series, size_t width, size_t height) {
  std::vector<std::string> rows(height);
  if (series.empty() || width == 0 || height == 0) {
    return rows;
  }
  const auto sampled = downsample(series, width);
  const auto levels = scaleToLevels(sampled, static_cast<int>(height * 8));
  for (size_t r = 0; r < height; ++r) {
    const int base = static_cast<int>((height - 1 - r) * 8);
    for (int level : levels) {
      const int fill = std::clamp(level + 1 - base, 0, 8);
      rows[r] += kEighths[fill];
    }
  }
  return rows;
}

Element LockView(const AppState& state, const Theme& theme) {
  std::string title = "Unlock";
  std::string prompt = "Password: ";
  std::string buffer;
  std::string error;
  std::string help = "Enter unlock  Esc quit";

  if (const auto* locked = std::get_if<mode::Locked>(&state.mode)) {
    if (locked->is_new) {
      title = "Create password";
      help = "Choose a password for the encrypted store. Enter continue  Esc quit";
    }
    buffer = locked->buffer;
    error = locked->error;
  } else if (const auto* confirming = std::get_if<mode::ConfirmingPassword>(&state.mode)) {
    title = "Confirm password";
    prompt = "Again: ";
    buffer = confirming->buffer;
    help = "Enter create  Esc start over";
  }

  Elements body = {
    text("bags") | bold | color(theme.accent) | hcenter,
    text(""),
    inputLine(prompt, std::string(buffer.size(), '*'), theme),
  };
  if (!error.empty()) {
    body.push_back(text(error) | color(theme.error));
  }
  body.push_back(text(""));
  body.push_back(hint(help, theme));

  return window(text(" " + title + " ") | bold | color(theme.title), vbox(std::move(body)))
       | size(WIDTH, GREATER_THAN, 40) | center;
}

Element TopBar(const AppState& state, const Theme& theme) {
  Elements tabs;
  for (Tab tab : {Tab::Markets, Tab::Favourites, Tab::Portfolio}) {
    Element label = text(std::string(" ") + tabTitle(tab) + " ");
    if (tab == state.ui.tab) {
      label = label | bold | bgcolor(theme.highlight_bg) | color(theme.highlight_fg);
    } else {
      label = label | color(theme.dim);
    }
    tabs.push_back(label);
  }

  Elements stats;
  if (state.market.global) {
    const auto& global = *state.market.global;
    const std::string sym = currencySymbol(state.settings.currency);
    stats.push_back(text("MCap ") | color(theme.dim));
    stats.push_back(text(format::large(global.total_market_cap, sym)));
    char dominance[32];
    std::snprintf(dominance, sizeof(dominance), "%.1f%%", global.btc_dominance);
    stats.push_back(text("  BTC ") | color(theme.dim));
    stats.push_back(text(dominance));
    if (global.sentiment) {
      stats.push_back(text("  F&G ") | color(theme.dim));
      stats.push_back(text(std::to_string(global.sentiment->value) + " " + global.sentiment->label)
                      | color(global.sentiment->value >= 50 ? theme.positive : theme.negative));
    }
  }
  if (state.market.last_refresh) {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - *state.market.last_refresh);
    stats.push_back(text("  " + format::age(elapsed)) | color(theme.dim));
  }

  return hbox({
    text(" bags ") | bold | color(theme.accent),
    hbox(std::move(tabs)),
    filler(),
    hbox(std::move(stats)),
    text(" "),
  });
}

Element CoinTable(const AppState& state, const Theme& theme) {
  const auto visible = state.visibleCoins();
  Elements rows;
  rows.push_back(headerRow(state, theme));
  rows.push_back(separator() | color(theme.border));

  if (visible.empty()) {
    std::string message = "No coins";
    if (!state.ui.filter.empty()) message = "Nothing matches '" + state.ui.filter + "'";
    else if (state.ui.tab == Tab::Favourites) message = "No favourites yet. f adds the selected coin, c searches";
    else if (state.ui.tab == Tab::Portfolio) message = "No holdings yet. a sets an amount";
    else if (!state.market.last_refresh) message = "Loading...";
    rows.push_back(text(message) | color(theme.dim) | center);
    return vbox(std::move(rows)) | flex;
  }

  const size_t begin = std::min(state.ui.scroll_offset, visible.size());
  const size_t end = std::min(visible.size(), begin + std::max<size_t>(state.ui.page_height, 1));
  for (size_t i = begin; i < end; ++i) {
    rows.push_back(coinRow(state, *visible[i].coin, i == state.ui.selected, theme));
  }
  rows.push_back(filler());
  if (state.ui.tab == Tab::Portfolio) {
    rows.push_back(separator() | color(theme.border));
    rows.push_back(portfolioTotals(state, theme));
  }
  return vbox(std::move(rows)) | flex;
}

Element BottomBar(const AppState& state, const Theme& theme) {
  if (state.ui.error) {
    return text(" " + *state.ui.error) | color(theme.error);
  }
  if (state.inMode<mode::Filtering>()) {
    return inputLine(" /", state.ui.filter, theme);
  }
  Elements parts;
  if (!state.ui.filter.empty()) {
    parts.push_back(text(" filter: " + state.ui.filter + " ") | color(theme.input_accent));
  }
  parts.push_back(hint(" q quit  / filter  s sort  Enter chart  f fav  a amount  b buy  A alert  X clear alerts"
                       "  c search  S settings  r refresh", theme));
  return hbox(std::move(parts));
}

Element ChartPopupView(const AppState& state, const mode::ChartPopup& popup_mode, const Theme& theme) {
  const Coin* coin = state.findCoin(popup_mode.coin_id);
  const std::string sym = currencySymbol(state.settings.currency);
  const int days = rangeDays(popup_mode.range);

  Elements ranges;
  for (ChartRange range : {ChartRange::Day1, ChartRange::Week1, ChartRange::Month1}) {
    Element label = text(std::string(" ") + rangeLabel(range) + " ");
    ranges.push_back(range == popup_mode.range ? label | inverted | bold : label | color(theme.dim));
  }

  Elements body;
  if (coin) {
    body.push_back(hbox({
      text(format::price(coin->current_price, sym)) | bold,
      filler(),
      hbox(std::move(ranges)),
    }));
  } else {
    body.push_back(hbox({filler(), hbox(std::move(ranges))}));
  }

  const std::vector<double>* series = state.charts.find(popup_mode.coin_id, days);
  if (!popup_mode.error.empty()) {
    body.push_back(text(popup_mode.error) | color(theme.error));
  } else if (!series) {
    body.push_back(text(state.charts.isLoading(popup_mode.coin_id, days) ? "Loading chart..." : "No data")
                   | color(theme.dim) | size(HEIGHT, EQUAL, kChartHeight) | center);
  } else if (series->empty()) {
    body.push_back(text("No data for this range") | color(theme.dim) | size(HEIGHT, EQUAL, kChartHeight) | center);
  } else {
    const double first = series->front();
    const double last = series->back();
    const auto [lo, hi] = std::minmax_element(series->begin(), series->end());
    const Color trend = last >= first ? theme.positive : theme.negative;

    Elements lines;
    for (const auto& row : SparklineRows(*series, kChartWidth, kChartHeight)) {
      lines.push_back(text(row) | color(trend));
    }
    body.push_back(vbox(std::move(lines)));

    std::optional<double> change;
    if (first != 0.0) change = (last - first) / first * 100.0;
    body.push_back(hbox({
      text("Low ") | color(theme.dim), text(format::price(*lo, sym)),
      text("  High ") | color(theme.dim), text(format::price(*hi, sym)),
      filler(),
      text(std::string(rangeLabel(popup_mode.range)) + " ") | color(theme.dim),
      text(format::percent(change)) | color(trend),
    }));
  }

  if (coin && coin->circulating_supply) {
    std::string supply = format::large(*coin->circulating_supply);
    if (coin->max_supply) supply += " / " + format::large(*coin->max_supply);
    body.push_back(hbox({text("Supply ") | color(theme.dim), text(supply + " " + upper(coin->symbol))}));
  }

  const auto alerts = state.alertsFor(popup_mode.coin_id);
  if (!alerts.empty()) {
    body.push_back(separator() | color(theme.border));
    for (const auto& alert : alerts) {
      std::string line = std::string(toString(alert.direction)) + " " + format::price(alert.target_price, sym);
      if (alert.triggered) {
        line += "  triggered";
        if (alert.triggered_price) line += " at " + format::price(*alert.triggered_price, sym);
      }
      body.push_back(text(line) | color(alert.triggered ? theme.dim : theme.accent));
    }
  }

  body.push_back(hint("h/l range  Esc close", theme));
  return popup(coin ? coin->name + " (" + upper(coin->symbol) + ")" : popup_mode.coin_id, std::move(body), theme);
}

Element SettingsView(const mode::Settings& m, const Theme& theme) {
  Elements body;
  for (SettingsField field : settingsFields()) {
    const bool active = field == m.field;
    std::string value = (active && m.editing) ? m.edit_buffer + "_" : settingValue(m, field);
    Element line = hbox({
      text(active ? "> " : "  "),
      text(settingsFieldLabel(field)) | size(WIDTH, EQUAL, 20),
      text(value) | color(active && m.editing ? theme.input_accent : theme.fg),
    });
    if (active) line = line | bold | color(theme.accent);
    body.push_back(line);
  }
  if (!m.error.empty()) {
    body.push_back(text(""));
    body.push_back(text(m.error) | color(theme.error));
  }
  body.push_back(text(""));
  body.push_back(hint(m.editing ? "Enter keep  Esc discard"
                                : "j/k field  h/l change  Enter edit  s save  Esc cancel", theme));
  return popup("Settings", std::move(body), theme);
}

Element SearchView(const mode::SearchQuery& search, const Theme& theme) {
  Elements body = {inputLine("Search: ", search.query, theme) | size(WIDTH, GREATER_THAN, 40)};
  if (!search.error.empty()) {
    body.push_back(text(search.error) | color(theme.error));
  }
  body.push_back(text(""));
  body.push_back(hint("Enter search  Esc cancel", theme));
  return popup("Add coin", std::move(body), theme);
}

Element SearchResultsView(const mode::SearchResults& results, const Theme& theme) {
  Elements body;
  if (results.results.empty()) {
    body.push_back(text("No coins found for '" + results.query + "'") | color(theme.dim));
  }
  for (size_t i = 0; i < results.results.size(); ++i) {
    const auto& r = results.results[i];
    Element line = hbox({
      text(r.market_cap_rank ? "#" + std::to_string(*r.market_cap_rank) : "") | size(WIDTH, EQUAL, 7),
      text(clip(r.name, 24)) | size(WIDTH, EQUAL, 25),
      text(upper(r.symbol)) | color(theme.dim),
    });
    if (i == results.selected) line = line | bgcolor(theme.highlight_bg) | color(theme.highlight_fg);
    body.push_back(line);
  }
  body.push_back(text(""));
  body.push_back(hint("Enter add to favourites  Esc back", theme));
  return popup("Results: " + results.query, std::move(body), theme);
}

Element SortPickerView(const AppState& state, const Theme& theme) {
  static const std::pair<char, SortColumn> keys[] = {
    {'r', SortColumn::Rank}, {'n', SortColumn::Name}, {'p', SortColumn::Price},
    {'1', SortColumn::Change1h}, {'2', SortColumn::Change24h}, {'7', SortColumn::Change7d},
    {'v', SortColumn::Volume}, {'m', SortColumn::MarketCap},
  };
  Elements body;
  for (const auto& [key, column] : keys) {
    std::string current;
    if (state.ui.sort && state.ui.sort->column == column) {
      current = state.ui.sort->direction == SortDirection::Ascending ? " ▲" : " ▼";
    }
    body.push_back(hbox({
      text(std::string(1, key)) | bold | color(theme.accent) | size(WIDTH, EQUAL, 3),
      text(sortColumnLabel(column)),
      text(current),
    }));
  }
  body.push_back(text(""));
  body.push_back(hint("Esc clear sort", theme));
  return popup("Sort by", std::move(body), theme);
}

Element RenderApp(const AppState& state) {
  const Theme& theme = ActiveTheme(state);

  if (!state.isUnlocked()) {
    return LockView(state, theme) | color(theme.fg) | bgcolor(theme.bg) | flex;
  }

  Element main = vbox({
    TopBar(state, theme),
    separator() | color(theme.border),
    CoinTable(state, theme),
    separator() | color(theme.border),
    BottomBar(state, theme),
  }) | border | color(theme.fg) | bgcolor(theme.bg);

  return dbox({main, overlayFor(state, theme)});
}

} // namespace bags
