#include "bags/validation.hpp"
#include "bags/config.hpp"
#include "bags/domain.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace bags {

bool Validator::isNumericInputChar(char c) noexcept {
    return (c >= '0' && c <= '9') || c == '.';
}

bool Validator::isNumericInput(const std::string& s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), isNumericInputChar);
}

std::optional<double> Validator::parseAmount(const std::string& s) noexcept {
    if (!isNumericInput(s) || s.length() > ValidationLimits::MAX_NUMERIC_INPUT_LENGTH) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.length() || errno == ERANGE || !std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> Validator::parsePrice(const std::string& s) noexcept {
    auto value = parseAmount(s);
    if (!value || *value <= 0.0) {
        return std::nullopt;
    }
    return value;
}

bool Validator::isPrintableAscii(char c) noexcept {
    return c >= 0x20 && c < 0x7f;
}

bool Validator::isValidLogLevel(const std::string& level) noexcept {
    return level == "TRACE" || level == "DEBUG" || level == "INFO" ||
           level == "WARN" || level == "ERROR" || level == "FATAL";
}

bool Validator::isValidTopic(const std::string& topic) noexcept {
    if (topic.empty() || topic.length() > ValidationLimits::MAX_TOPIC_LENGTH) {
        return false;
    }
    return std::all_of(topic.begin(), topic.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

ValidationResult Validator::validateSettings(const Settings& settings) {
    if (!isSupportedCurrency(settings.currency)) {
        return {false, "Unsupported currency: " + settings.currency};
    }
    if (settings.refresh_interval_secs < Config::kMinRefreshIntervalSecs) {
        return {false, "Refresh interval must be at least " +
                       std::to_string(Config::kMinRefreshIntervalSecs) + "s"};
    }
    for (const std::string* key : {&settings.coingecko_api_key, &settings.cmc_api_key}) {
        if (key->size() > ValidationLimits::MAX_TEXT_INPUT_LENGTH) {
            return {false, "API key is too long"};
        }
        if (!std::all_of(key->begin(), key->end(), isPrintableAscii)) {
            return {false, "API key may only contain printable characters"};
        }
    }
    if (wantsNtfy(settings.notification_method)) {
        if (settings.ntfy_topic.empty()) {
            return {false, "Ntfy notifications need a topic"};
        }
        if (!isValidTopic(settings.ntfy_topic)) {
            return {false, "Ntfy topic may only contain letters, digits, '-' and '_'"};
        }
    }
    return {};
}

} // namespace bags
