#pragma once
#include <optional>
#include <string>

namespace bags {

struct Settings;

// Input field validation results
struct ValidationResult {
    bool is_valid;
    std::string error_message;

    ValidationResult(bool valid = true, const std::string& error = "")
        : is_valid(valid), error_message(error) {}

    operator bool() const noexcept { return is_valid; }
};

/**
 * Input checks for edit buffers and settings.
 */
class Validator {
public:
    // Edit buffers only admit ASCII digits and '.'
    static bool isNumericInputChar(char c) noexcept;
    static bool isNumericInput(const std::string& s) noexcept;

    // Whole-buffer parse; rejects empty, partial, negative and non-finite input
    static std::optional<double> parseAmount(const std::string& s) noexcept;
    // As parseAmount, but zero is rejected too
    static std::optional<double> parsePrice(const std::string& s) noexcept;

    static bool isPrintableAscii(char c) noexcept;
    static bool isValidLogLevel(const std::string& level) noexcept;
    // ntfy topics: 1..64 of [A-Za-z0-9_-]
    static bool isValidTopic(const std::string& topic) noexcept;

    static ValidationResult validateSettings(const Settings& settings);
};

namespace ValidationLimits {
    constexpr size_t MAX_NUMERIC_INPUT_LENGTH = 32;
    constexpr size_t MAX_TEXT_INPUT_LENGTH = 256;
    constexpr size_t MAX_TOPIC_LENGTH = 64;
}

} // namespace bags
