#include "bags/format.hpp"
#include <cmath>
#include <cstdio>

namespace bags::format {

namespace {

std::string fixed(double value, int decimals) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
  return buffer;
}

} // namespace

std::string withThousands(const std::string& integer_digits) {
  std::string out;
  const size_t n = integer_digits.size();
  for (size_t i = 0; i < n; ++i) {
    out += integer_digits[i];
    const size_t remaining = n - i - 1;
    if (remaining > 0 && remaining % 3 == 0) {
      out += ',';
    }
  }
  return out;
}

std::string price(double value, const std::string& currency_symbol) {
  if (!std::isfinite(value)) {
    return "--";
  }
  const bool negative = value < 0;
  const double v = std::fabs(value);
  std::string body;
  if (v >= 1.0) {
    std::string text = fixed(v, 2);
    const auto dot = text.find('.');
    body = withThousands(text.substr(0, dot)) + text.substr(dot);
  } else if (v >= 0.01) {
    body = fixed(v, 4);
  } else if (v > 0.0) {
    body = fixed(v, 6);
  } else {
    body = "0.00";
  }
  return (negative ? "-" : "") + currency_symbol + body;
}

std::string large(double value, const std::string& currency_symbol) {
  if (!std::isfinite(value)) {
    return "--";
  }
  const double v = std::fabs(value);
  const char* sign = value < 0 ? "-" : "";
  if (v >= 1e12) return sign + currency_symbol + fixed(v / 1e12, 1) + "T";
  if (v >= 1e9) return sign + currency_symbol + fixed(v / 1e9, 1) + "B";
  if (v >= 1e6) return sign + currency_symbol + fixed(v / 1e6, 1) + "M";
  if (v >= 1e3) return sign + currency_symbol + fixed(v / 1e3, 1) + "K";
  return sign + currency_symbol + fixed(v, 0);
}

std::string percent(const std::optional<double>& value) {
  if (!value || !std::isfinite(*value)) {
    return "--";
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%+.1f%%", *value);
  return buffer;
}

std::string amount(double value) {
  std::string text = fixed(value, std::fabs(value) < 1.0 ? 6 : 4);
  if (text.find('.') != std::string::npos) {
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();
  }
  return text;
}

std::string age(std::chrono::seconds elapsed) {
  const auto secs = elapsed.count();
  if (secs < 60) return std::to_string(secs) + "s ago";
  if (secs < 3600) return std::to_string(secs / 60) + "m ago";
  return std::to_string(secs / 3600) + "h ago";
}

std::string masked(const std::string& secret) {
  if (secret.empty()) {
    return "(not set)";
  }
  if (secret.size() <= 4) {
    return std::string(secret.size(), '*');
  }
  return std::string(secret.size() - 4, '*') + secret.substr(secret.size() - 4);
}

} // namespace bags::format
