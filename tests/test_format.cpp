#include "bags/format.hpp"
#include "bags/state.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

namespace format = bags::format;

void test_prices() {
  assert(format::price(50000, "$") == "$50,000.00");
  assert(format::price(1234567.891, "€") == "€1,234,567.89");
  assert(format::price(1.5, "$") == "$1.50");
  assert(format::price(0.5, "$") == "$0.5000");
  assert(format::price(0.001234, "$") == "$0.001234");
  assert(format::price(0.0, "$") == "$0.00");
  assert(format::price(-1500, "$") == "-$1,500.00");
  assert(format::price(NAN, "$") == "--");

  std::cout << "✅ Price formatting test passed" << std::endl;
}

void test_large_numbers_and_percent() {
  assert(format::large(2.5e12, "$") == "$2.5T");
  assert(format::large(9.8e11, "$") == "$980.0B");
  assert(format::large(3.1e7) == "31.0M");
  assert(format::large(4200) == "4.2K");
  assert(format::large(999) == "999");

  assert(format::percent(1.234) == "+1.2%");
  assert(format::percent(-0.44) == "-0.4%");
  assert(format::percent(std::nullopt) == "--");

  std::cout << "✅ Large number and percent test passed" << std::endl;
}

void test_amounts_and_misc() {
  assert(format::amount(2.0) == "2");
  assert(format::amount(1.25) == "1.25");
  assert(format::amount(0.000123) == "0.000123");
  assert(format::amount(12.123456) == "12.1235");

  assert(format::age(std::chrono::seconds(12)) == "12s ago");
  assert(format::age(std::chrono::seconds(185)) == "3m ago");
  assert(format::age(std::chrono::seconds(7300)) == "2h ago");

  assert(format::masked("") == "(not set)");
  assert(format::masked("abc") == "***");
  assert(format::masked("CG-abcdef1234") == "*********1234");

  assert(format::withThousands("1234567") == "1,234,567");
  assert(format::withThousands("123") == "123");

  std::cout << "✅ Amount and misc formatting test passed" << std::endl;
}

void test_error_truncation() {
  const std::string longMessage(200, 'e');
  const std::string shown = bags::AppState::truncateForDisplay(longMessage);
  assert(shown.size() == bags::AppState::kMaxErrorLength);
  assert(shown.substr(shown.size() - 3) == "...");
  assert(bags::AppState::truncateForDisplay("short") == "short");

  std::cout << "✅ Error truncation test passed" << std::endl;
}

int main() {
  std::cout << "Running formatting tests..." << std::endl;

  test_prices();
  test_large_numbers_and_percent();
  test_amounts_and_misc();
  test_error_truncation();

  std::cout << "🎉 All formatting tests passed" << std::endl;
  return 0;
}
