#pragma once
#include <string>
#include <vector>
#include <ftxui/screen/color.hpp>

namespace bags {

struct Theme {
  std::string name;
  ftxui::Color fg;
  ftxui::Color bg;
  ftxui::Color dim;
  ftxui::Color border;
  ftxui::Color highlight_bg;
  ftxui::Color highlight_fg;
  ftxui::Color positive;
  ftxui::Color negative;
  ftxui::Color accent;
  ftxui::Color input_accent;
  ftxui::Color title;
  ftxui::Color error;
};

const std::vector<Theme>& themes();
std::vector<std::string> themeNames();
bool isKnownTheme(const std::string& name);
// Falls back to the first (dark) theme for unknown names
const Theme& themeByName(const std::string& name);

} // namespace bags
