#include "bags/input_machine.hpp"
#include "bags/format.hpp"
#include "bags/logger.hpp"
#include "bags/theme.hpp"
#include "bags/validation.hpp"
#include <ftxui/component/mouse.hpp>
#include <algorithm>
#include <type_traits>

namespace bags {

using ftxui::Event;

namespace {

const Event kCtrlD = Event::Special("\x04");
const Event kCtrlU = Event::Special("\x15");

std::optional<char> singleChar(const Event& event) {
  if (!event.is_character()) return std::nullopt;
  const std::string& s = event.character();
  if (s.size() != 1) return std::nullopt;
  return s[0];
}

bool isKey(const Event& event, char key) {
  auto c = singleChar(event);
  return c && *c == key;
}

// Appends printable ASCII to a text buffer; returns whether the event was text
bool appendText(std::string& buffer, const Event& event, size_t max_length) {
  auto c = singleChar(event);
  if (!c || !Validator::isPrintableAscii(*c)) return false;
  if (buffer.size() < max_length) buffer += *c;
  return true;
}

// Numeric edit buffers drop everything but digits and '.'
void editNumeric(std::string& buffer, const Event& event) {
  if (event == Event::Backspace) {
    if (!buffer.empty()) buffer.pop_back();
    return;
  }
  auto c = singleChar(event);
  if (c && Validator::isNumericInputChar(*c) &&
      buffer.size() < ValidationLimits::MAX_NUMERIC_INPUT_LENGTH) {
    buffer += *c;
  }
}

void editText(std::string& buffer, const Event& event, size_t max_length) {
  if (event == Event::Backspace) {
    if (!buffer.empty()) buffer.pop_back();
    return;
  }
  appendText(buffer, event, max_length);
}

} // namespace

InputStateMachine::InputStateMachine(AppState& state, AppController& controller)
  : state_(state)
  , controller_(controller) {
}

bool InputStateMachine::handle(Event event) {
  if (event == Event::Custom) {
    return false;
  }
  if (event.is_mouse()) {
    const auto button = event.mouse().button;
    if (button != ftxui::Mouse::WheelUp && button != ftxui::Mouse::WheelDown) {
      return false;
    }
    if (state_.inMode<mode::Browsing>()) {
      state_.moveSelection(button == ftxui::Mouse::WheelUp ? -1 : 1);
    }
    return true;
  }

  InputMode next = std::visit([&](auto& m) -> InputMode {
    using M = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<M, mode::Locked>) return onLocked(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::ConfirmingPassword>) return onConfirming(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::Browsing>) return onBrowsing(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::Filtering>) return onFiltering(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::SortPicking>) return onSortPicking(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::EditingAmount>) return onEditingAmount(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::EditingAlert>) return onEditingAlert(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::EditingBuyPrice>) return onEditingBuyPrice(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::Settings>) return onSettings(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::SearchQuery>) return onSearchQuery(std::move(m), event);
    else if constexpr (std::is_same_v<M, mode::SearchResults>) return onSearchResults(std::move(m), event);
    else return onChartPopup(std::move(m), event);
  }, state_.mode);

  state_.mode = std::move(next);
  return true;
}

// --- Lock screen ---

InputMode InputStateMachine::tryUnlock(const std::string& password, bool is_new) {
  try {
    controller_.unlock(password);
    return mode::Browsing{};
  } catch (const WrongPasswordError& e) {
    LOG_WARN("Unlock failed: wrong password");
    return mode::Locked{is_new, "", e.what()};
  } catch (const StoreError& e) {
    LOG_ERROR(std::string("Unlock failed: ") + e.what());
    return mode::Locked{is_new, "", AppState::truncateForDisplay(e.what())};
  }
}

InputMode InputStateMachine::onLocked(mode::Locked m, const Event& event) {
  if (event == Event::Escape) {
    state_.ui.quit = true;
    return m;
  }
  if (event == Event::Return) {
    if (m.buffer.empty()) {
      m.error = "Password cannot be empty";
      return m;
    }
    if (m.is_new) {
      return mode::ConfirmingPassword{m.buffer, ""};
    }
    return tryUnlock(m.buffer, false);
  }
  if (event == Event::Backspace) {
    if (!m.buffer.empty()) m.buffer.pop_back();
    return m;
  }
  if (appendText(m.buffer, event, ValidationLimits::MAX_TEXT_INPUT_LENGTH)) {
    m.error.clear();
  }
  return m;
}

InputMode InputStateMachine::onConfirming(mode::ConfirmingPassword m, const Event& event) {
  if (event == Event::Escape) {
    return mode::Locked{true, "", ""};
  }
  if (event == Event::Return) {
    if (m.buffer != m.first) {
      return mode::Locked{true, "", "Passwords do not match"};
    }
    return tryUnlock(m.first, true);
  }
  editText(m.buffer, event, ValidationLimits::MAX_TEXT_INPUT_LENGTH);
  return m;
}

// --- Table ---

InputMode InputStateMachine::onBrowsing(mode::Browsing m, const Event& event) {
  const int page = static_cast<int>(std::max<size_t>(state_.ui.page_height, 1));

  if (event == Event::ArrowDown) { state_.moveSelection(1); return m; }
  if (event == Event::ArrowUp) { state_.moveSelection(-1); return m; }
  if (event == Event::PageDown || event == kCtrlD) { state_.moveSelection(page); return m; }
  if (event == Event::PageUp || event == kCtrlU) { state_.moveSelection(-page); return m; }
  if (event == Event::Home) { state_.selectFirst(); return m; }
  if (event == Event::End) { state_.selectLast(); return m; }
  if (event == Event::Tab) {
    state_.setTab(nextTab(state_.ui.tab));
    return m;
  }
  if (event == Event::Escape) {
    if (!state_.ui.filter.empty()) {
      state_.ui.filter.clear();
      state_.clampSelection();
    } else {
      state_.ui.quit = true;
    }
    return m;
  }

  const Coin* selected = state_.selectedCoin();
  const std::string selected_id = selected ? selected->id : "";

  if (event == Event::Return) {
    if (selected) return openChart(selected_id, ChartRange::Day1);
    return m;
  }

  auto key = singleChar(event);
  if (!key) {
    return m;
  }

  switch (*key) {
    case 'q':
      state_.ui.quit = true;
      break;
    case '/':
      return mode::Filtering{};
    case 's':
      return mode::SortPicking{};
    case 'S': {
      mode::Settings settings;
      settings.draft = state_.settings;
      return settings;
    }
    case 'c':
      return mode::SearchQuery{};
    case '1': state_.setTab(Tab::Markets); break;
    case '2': state_.setTab(Tab::Favourites); break;
    case '3': state_.setTab(Tab::Portfolio); break;
    case 'j': state_.moveSelection(1); break;
    case 'k': state_.moveSelection(-1); break;
    case 'g': state_.selectFirst(); break;
    case 'G': state_.selectLast(); break;
    case 'r':
      controller_.refreshAll();
      break;
    case 'f':
      if (selected) controller_.toggleFavourite(selected_id);
      break;
    case 'a':
      if (selected) {
        const Holding* held = state_.holdingFor(selected_id);
        return mode::EditingAmount{selected_id, held ? format::amount(held->amount) : ""};
      }
      break;
    case 'A':
      if (selected) return mode::EditingAlert{selected_id, "", AlertDirection::Above};
      break;
    case 'X':
      if (selected) controller_.removeAlerts(selected_id);
      break;
    case 'b':
      if (selected) {
        if (const Holding* held = state_.holdingFor(selected_id)) {
          return mode::EditingBuyPrice{selected_id, held->buy_price ? format::amount(*held->buy_price) : ""};
        }
      }
      break;
    case 'd':
      if (selected && state_.holdingFor(selected_id)) controller_.deleteHolding(selected_id);
      break;
    default:
      break;
  }
  return m;
}

InputMode InputStateMachine::onFiltering(mode::Filtering m, const Event& event) {
  if (event == Event::Return) {
    return mode::Browsing{};
  }
  if (event == Event::Escape) {
    state_.ui.filter.clear();
    state_.selectFirst();
    return mode::Browsing{};
  }
  const std::string before = state_.ui.filter;
  editText(state_.ui.filter, event, ValidationLimits::MAX_TEXT_INPUT_LENGTH);
  if (state_.ui.filter != before) {
    state_.ui.selected = 0;
    state_.ui.scroll_offset = 0;
  }
  return m;
}

InputMode InputStateMachine::onSortPicking(mode::SortPicking, const Event& event) {
  if (event == Event::Escape) {
    state_.ui.sort.reset();
  } else if (auto key = singleChar(event)) {
    if (auto column = sortColumnForKey(*key)) {
      state_.ui.sort = toggleSort(state_.ui.sort, *column);
    }
  }
  state_.clampSelection();
  return mode::Browsing{};
}

// --- Edit popups ---

InputMode InputStateMachine::onEditingAmount(mode::EditingAmount m, const Event& event) {
  if (event == Event::Escape) {
    return mode::Browsing{};
  }
  if (event == Event::Return) {
    if (auto amount = Validator::parseAmount(m.buffer)) {
      controller_.setHolding(m.coin_id, *amount);
    } else {
      LOG_DEBUG("Discarding unparseable amount '" + m.buffer + "'");
    }
    return mode::Browsing{};
  }
  editNumeric(m.buffer, event);
  return m;
}

InputMode InputStateMachine::onEditingAlert(mode::EditingAlert m, const Event& event) {
  if (event == Event::Escape) {
    return mode::Browsing{};
  }
  if (event == Event::Tab) {
    m.direction = toggled(m.direction);
    return m;
  }
  if (event == Event::Return) {
    if (auto target = Validator::parsePrice(m.buffer)) {
      controller_.addAlert(m.coin_id, *target, m.direction);
    }
    return mode::Browsing{};
  }
  editNumeric(m.buffer, event);
  return m;
}

InputMode InputStateMachine::onEditingBuyPrice(mode::EditingBuyPrice m, const Event& event) {
  if (event == Event::Escape) {
    return mode::Browsing{};
  }
  if (event == Event::Return) {
    if (m.buffer.empty()) {
      controller_.setBuyPrice(m.coin_id, std::nullopt);
    } else if (auto price = Validator::parsePrice(m.buffer)) {
      controller_.setBuyPrice(m.coin_id, *price);
    }
    return mode::Browsing{};
  }
  editNumeric(m.buffer, event);
  return m;
}

// --- Settings ---

void InputStateMachine::cycleSetting(mode::Settings& m, bool forward) {
  Settings& d = m.draft;
  switch (m.field) {
    case SettingsField::Currency:
      d.currency = cycleValue(supportedCurrencies(), d.currency, forward);
      break;
    case SettingsField::Theme:
      d.theme = cycleValue(themeNames(), d.theme, forward);
      break;
    case SettingsField::RefreshInterval:
      d.refresh_interval_secs = cycleValue(refreshIntervalChoices(), d.refresh_interval_secs, forward);
      break;
    case SettingsField::Notifications: {
      static const std::vector<NotificationMethod> methods = {
        NotificationMethod::None, NotificationMethod::Desktop,
        NotificationMethod::Ntfy, NotificationMethod::Both,
      };
      d.notification_method = cycleValue(methods, d.notification_method, forward);
      break;
    }
    default:
      break;
  }
}

InputMode InputStateMachine::onSettings(mode::Settings m, const Event& event) {
  if (m.editing) {
    if (event == Event::Escape) {
      m.editing = false;
      m.edit_buffer.clear();
    } else if (event == Event::Return) {
      switch (m.field) {
        case SettingsField::CoingeckoApiKey: m.draft.coingecko_api_key = m.edit_buffer; break;
        case SettingsField::CoinmarketcapApiKey: m.draft.cmc_api_key = m.edit_buffer; break;
        case SettingsField::NtfyTopic: m.draft.ntfy_topic = m.edit_buffer; break;
        default: break;
      }
      m.editing = false;
      m.edit_buffer.clear();
    } else {
      editText(m.edit_buffer, event, ValidationLimits::MAX_TEXT_INPUT_LENGTH);
    }
    return m;
  }

  const auto& fields = settingsFields();
  if (event == Event::Escape || isKey(event, 'q')) {
    return mode::Browsing{};
  }
  if (event == Event::ArrowDown || event == Event::Tab || isKey(event, 'j')) {
    m.field = cycleValue(fields, m.field, true);
    return m;
  }
  if (event == Event::ArrowUp || event == Event::TabReverse || isKey(event, 'k')) {
    m.field = cycleValue(fields, m.field, false);
    return m;
  }
  if (event == Event::ArrowLeft || isKey(event, 'h')) {
    cycleSetting(m, false);
    return m;
  }
  if (event == Event::ArrowRight || isKey(event, 'l')) {
    cycleSetting(m, true);
    return m;
  }
  if (event == Event::Return || isKey(event, 'e')) {
    if (isTextField(m.field)) {
      m.editing = true;
      switch (m.field) {
        case SettingsField::CoingeckoApiKey: m.edit_buffer = m.draft.coingecko_api_key; break;
        case SettingsField::CoinmarketcapApiKey: m.edit_buffer = m.draft.cmc_api_key; break;
        case SettingsField::NtfyTopic: m.edit_buffer = m.draft.ntfy_topic; break;
        default: break;
      }
    } else {
      cycleSetting(m, true);
    }
    return m;
  }
  if (isKey(event, 's')) {
    ValidationResult result = controller_.saveSettings(m.draft);
    if (!result) {
      m.error = result.error_message;
      return m;
    }
    return mode::Browsing{};
  }
  return m;
}

// --- Coin search ---

InputMode InputStateMachine::onSearchQuery(mode::SearchQuery m, const Event& event) {
  if (event == Event::Escape) {
    return mode::Browsing{};
  }
  if (event == Event::Return) {
    if (m.query.empty()) {
      return m;
    }
    try {
      auto results = controller_.search(m.query);
      return mode::SearchResults{m.query, std::move(results), 0};
    } catch (const MarketDataError& e) {
      LOG_ERROR(std::string("Search failed: ") + e.what());
      m.error = AppState::truncateForDisplay(std::string("Search failed: ") + e.what());
      return m;
    }
  }
  editText(m.query, event, ValidationLimits::MAX_TEXT_INPUT_LENGTH);
  m.error.clear();
  return m;
}

InputMode InputStateMachine::onSearchResults(mode::SearchResults m, const Event& event) {
  if (event == Event::Escape) {
    return mode::SearchQuery{m.query, ""};
  }
  if (event == Event::ArrowDown || isKey(event, 'j')) {
    if (m.selected + 1 < m.results.size()) ++m.selected;
    return m;
  }
  if (event == Event::ArrowUp || isKey(event, 'k')) {
    if (m.selected > 0) --m.selected;
    return m;
  }
  if (event == Event::Return) {
    if (m.selected < m.results.size()) {
      controller_.addFromSearch(m.results[m.selected]);
      return mode::Browsing{};
    }
  }
  return m;
}

// --- Chart ---

InputMode InputStateMachine::openChart(const std::string& coin_id, ChartRange range) {
  mode::ChartPopup popup{coin_id, range, ""};
  ChartLookup lookup = controller_.requestChart(coin_id, range);
  if (lookup.status == ChartStatus::Failed) {
    popup.error = "Chart unavailable";
    for (const auto& failure : state_.charts.poll()) {
      if (failure.key == ChartKey{coin_id, rangeDays(range)}) {
        popup.error = AppState::truncateForDisplay(failure.message);
      }
    }
  }
  return popup;
}

InputMode InputStateMachine::onChartPopup(mode::ChartPopup m, const Event& event) {
  if (event == Event::Escape || event == Event::Return || isKey(event, 'q')) {
    return mode::Browsing{};
  }
  if (event == Event::ArrowRight || event == Event::Tab || isKey(event, 'l')) {
    return openChart(m.coin_id, nextRange(m.range));
  }
  if (event == Event::ArrowLeft || isKey(event, 'h')) {
    return openChart(m.coin_id, prevRange(m.range));
  }
  return m;
}

} // namespace bags
