#include "bags/theme.hpp"
#include <cstdint>

namespace bags {

using ftxui::Color;

namespace {

Color rgb(uint8_t r, uint8_t g, uint8_t b) {
  return Color::RGB(r, g, b);
}

} // namespace

const std::vector<Theme>& themes() {
  static const std::vector<Theme> all = {
    {"dark", Color::White, Color::Default, Color::GrayDark, Color::GrayDark,
     Color::GrayDark, Color::White, Color::Green, Color::Red, Color::Cyan, Color::Yellow,
     Color::Cyan, Color::Red},
    {"dark-blue", rgb(200, 210, 230), rgb(16, 24, 40), rgb(100, 116, 139), rgb(51, 65, 85),
     rgb(30, 58, 138), Color::White, rgb(74, 222, 128), rgb(248, 113, 113), rgb(96, 165, 250),
     rgb(250, 204, 21), rgb(147, 197, 253), rgb(239, 68, 68)},
    {"dark-green", rgb(210, 230, 210), rgb(12, 28, 18), rgb(107, 133, 112), rgb(40, 70, 50),
     rgb(22, 101, 52), Color::White, rgb(134, 239, 172), rgb(252, 165, 165), rgb(74, 222, 128),
     rgb(253, 224, 71), rgb(187, 247, 208), rgb(248, 113, 113)},
    {"dark-red", rgb(235, 215, 215), rgb(32, 12, 14), rgb(140, 105, 108), rgb(80, 40, 44),
     rgb(127, 29, 29), Color::White, rgb(134, 239, 172), rgb(252, 165, 165), rgb(248, 113, 113),
     rgb(253, 224, 71), rgb(254, 202, 202), rgb(239, 68, 68)},
    {"dark-violet", rgb(226, 216, 240), rgb(24, 16, 40), rgb(125, 112, 150), rgb(60, 45, 90),
     rgb(91, 33, 182), Color::White, rgb(134, 239, 172), rgb(252, 165, 165), rgb(192, 132, 252),
     rgb(253, 224, 71), rgb(221, 214, 254), rgb(248, 113, 113)},
    {"dark-gray", rgb(220, 220, 220), rgb(28, 28, 28), rgb(120, 120, 120), rgb(70, 70, 70),
     rgb(64, 64, 64), Color::White, rgb(134, 239, 172), rgb(252, 165, 165), rgb(212, 212, 212),
     rgb(253, 224, 71), Color::White, rgb(248, 113, 113)},
    {"solarized-dark", rgb(131, 148, 150), rgb(0, 43, 54), rgb(88, 110, 117), rgb(7, 54, 66),
     rgb(7, 54, 66), rgb(238, 232, 213), rgb(133, 153, 0), rgb(220, 50, 47), rgb(38, 139, 210),
     rgb(181, 137, 0), rgb(42, 161, 152), rgb(220, 50, 47)},
    {"solarized-light", rgb(101, 123, 131), rgb(253, 246, 227), rgb(147, 161, 161), rgb(238, 232, 213),
     rgb(238, 232, 213), rgb(7, 54, 66), rgb(133, 153, 0), rgb(220, 50, 47), rgb(38, 139, 210),
     rgb(203, 75, 22), rgb(42, 161, 152), rgb(220, 50, 47)},
    {"light", Color::Black, Color::White, Color::GrayDark, Color::GrayLight,
     Color::GrayLight, Color::Black, rgb(22, 128, 61), rgb(185, 28, 28), Color::Blue, rgb(180, 83, 9),
     Color::Blue, Color::Red},
    {"bubblegum", rgb(255, 228, 240), rgb(45, 20, 44), rgb(190, 140, 170), rgb(236, 72, 153),
     rgb(190, 24, 93), Color::White, rgb(110, 231, 183), rgb(251, 113, 133), rgb(244, 114, 182),
     rgb(253, 230, 138), rgb(249, 168, 212), rgb(251, 113, 133)},
    {"no-color", Color::Default, Color::Default, Color::Default, Color::Default,
     Color::Default, Color::Default, Color::Default, Color::Default, Color::Default,
     Color::Default, Color::Default, Color::Default},
  };
  return all;
}

std::vector<std::string> themeNames() {
  std::vector<std::string> names;
  for (const auto& theme : themes()) {
    names.push_back(theme.name);
  }
  return names;
}

bool isKnownTheme(const std::string& name) {
  for (const auto& theme : themes()) {
    if (theme.name == name) return true;
  }
  return false;
}

const Theme& themeByName(const std::string& name) {
  for (const auto& theme : themes()) {
    if (theme.name == name) return theme;
  }
  return themes().front();
}

} // namespace bags
