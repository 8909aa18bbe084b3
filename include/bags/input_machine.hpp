#pragma once
#include <ftxui/component/event.hpp>
#include "controller.hpp"
#include "state.hpp"

namespace bags {

/**
 * Translates terminal events into transitions of AppState::mode.
 * One handler per mode; each receives the current mode by value and returns
 * the next one, so a handler can never observe a half-updated mode.
 */
class InputStateMachine {
public:
  InputStateMachine(AppState& state, AppController& controller);

  // Returns whether the event was consumed. The mouse wheel scrolls the table.
  bool handle(ftxui::Event event);

private:
  AppState& state_;
  AppController& controller_;

  InputMode onLocked(mode::Locked m, const ftxui::Event& event);
  InputMode onConfirming(mode::ConfirmingPassword m, const ftxui::Event& event);
  InputMode onBrowsing(mode::Browsing m, const ftxui::Event& event);
  InputMode onFiltering(mode::Filtering m, const ftxui::Event& event);
  InputMode onSortPicking(mode::SortPicking m, const ftxui::Event& event);
  InputMode onEditingAmount(mode::EditingAmount m, const ftxui::Event& event);
  InputMode onEditingAlert(mode::EditingAlert m, const ftxui::Event& event);
  InputMode onEditingBuyPrice(mode::EditingBuyPrice m, const ftxui::Event& event);
  InputMode onSettings(mode::Settings m, const ftxui::Event& event);
  InputMode onSearchQuery(mode::SearchQuery m, const ftxui::Event& event);
  InputMode onSearchResults(mode::SearchResults m, const ftxui::Event& event);
  InputMode onChartPopup(mode::ChartPopup m, const ftxui::Event& event);

  InputMode tryUnlock(const std::string& password, bool is_new);
  InputMode openChart(const std::string& coin_id, ChartRange range);
  void cycleSetting(mode::Settings& m, bool forward);
};

} // namespace bags
