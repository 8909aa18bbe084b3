#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace bags::format {

// >= 1: two decimals with thousands separators; >= 0.01: four; > 0: six
std::string price(double value, const std::string& currency_symbol = "");
// 1.2T / 3.4B / 5.6M / 7.8K
std::string large(double value, const std::string& currency_symbol = "");
// "+1.2%", "-0.4%", "--" when missing
std::string percent(const std::optional<double>& value);
// Up to four decimals (six below 1), trailing zeros trimmed
std::string amount(double value);
// "12s ago", "3m ago", "2h ago"
std::string age(std::chrono::seconds elapsed);
// Keeps the last four characters of a secret visible
std::string masked(const std::string& secret);

std::string withThousands(const std::string& integer_digits);

} // namespace bags::format
