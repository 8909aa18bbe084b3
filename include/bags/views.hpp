#pragma once
#include <ftxui/dom/elements.hpp>
#include "state.hpp"
#include "theme.hpp"

namespace bags {

// Rows taken by the frame around the table: border, top bar, header,
// separators and the bottom bar
constexpr int kChromeRows = 8;

constexpr int kChartWidth = 60;
constexpr int kChartHeight = 8;

// Whole screen for the current mode. Reads AppState only.
ftxui::Element RenderApp(const AppState& state);

ftxui::Element LockView(const AppState& state, const Theme& theme);
ftxui::Element TopBar(const AppState& state, const Theme& theme);
ftxui::Element CoinTable(const AppState& state, const Theme& theme);
ftxui::Element BottomBar(const AppState& state, const Theme& theme);

// Popups, drawn over the table
ftxui::Element ChartPopupView(const AppState& state, const mode::ChartPopup& popup, const Theme& theme);
ftxui::Element SettingsView(const mode::Settings& settings, const Theme& theme);
ftxui::Element SearchView(const mode::SearchQuery& search, const Theme& theme);
ftxui::Element SearchResultsView(const mode::SearchResults& results, const Theme& theme);
ftxui::Element SortPickerView(const AppState& state, const Theme& theme);

// Multi-row sparkline built from block eighths, one column per sample
std::vector<std::string> SparklineRows(const std::vector<double>& series, size_t width, size_t height);

// The draft theme while settings are open, so changes preview live
const Theme& ActiveTheme(const AppState& state);

} // namespace bags
