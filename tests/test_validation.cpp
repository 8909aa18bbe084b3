#include "bags/domain.hpp"
#include "bags/validation.hpp"
#include <cassert>
#include <iostream>

using bags::Validator;

void test_numeric_input() {
  assert(Validator::isNumericInputChar('7'));
  assert(Validator::isNumericInputChar('.'));
  assert(!Validator::isNumericInputChar('a'));
  assert(!Validator::isNumericInputChar('-'));
  assert(!Validator::isNumericInputChar('e'));

  assert(Validator::parseAmount("1.5") == 1.5);
  assert(Validator::parseAmount("0") == 0.0);
  assert(Validator::parseAmount("2.") == 2.0);
  assert(!Validator::parseAmount("abc"));
  assert(!Validator::parseAmount(""));
  assert(!Validator::parseAmount("."));
  assert(!Validator::parseAmount("1.2.3"));
  assert(!Validator::parseAmount("-1"));
  assert(!Validator::parseAmount("1e5"));
  assert(!Validator::parseAmount(std::string(40, '9')));

  assert(Validator::parsePrice("48000") == 48000.0);
  assert(!Validator::parsePrice("0"));
  assert(!Validator::parsePrice("0.0"));

  std::cout << "✅ Numeric input test passed" << std::endl;
}

void test_settings_validation() {
  bags::Settings settings;
  assert(Validator::validateSettings(settings));

  settings.currency = "doge";
  auto result = Validator::validateSettings(settings);
  assert(!result && result.error_message.find("doge") != std::string::npos);

  settings.currency = "eur";
  settings.notification_method = bags::NotificationMethod::Both;
  assert(!Validator::validateSettings(settings));
  settings.ntfy_topic = "bad topic!";
  assert(!Validator::validateSettings(settings));
  settings.ntfy_topic = "my_alerts-1";
  assert(Validator::validateSettings(settings));

  settings.refresh_interval_secs = 10;
  result = Validator::validateSettings(settings);
  assert(!result && result.error_message.find("at least 30s") != std::string::npos);
  settings.refresh_interval_secs = 30;
  assert(Validator::validateSettings(settings));

  settings.coingecko_api_key = std::string(300, 'k');
  assert(!Validator::validateSettings(settings));
  settings.coingecko_api_key = "CG-abc\x01";
  assert(!Validator::validateSettings(settings));
  settings.coingecko_api_key = "CG-abc123";
  settings.cmc_api_key = std::string(256, 'c');
  assert(Validator::validateSettings(settings));

  // Desktop only does not need a topic
  settings.notification_method = bags::NotificationMethod::Desktop;
  settings.ntfy_topic.clear();
  assert(Validator::validateSettings(settings));

  std::cout << "✅ Settings validation test passed" << std::endl;
}

void test_domain_helpers() {
  assert(bags::cycleValue(bags::supportedCurrencies(), std::string("usd"), false) == "eth");
  assert(bags::cycleValue(bags::supportedCurrencies(), std::string("eth"), true) == "usd");
  assert(bags::cycleValue(bags::refreshIntervalChoices(), 45, true) == 30);

  assert(bags::notificationMethodFromString("both") == bags::NotificationMethod::Both);
  assert(bags::notificationMethodFromString("garbage") == bags::NotificationMethod::None);
  assert(bags::wantsDesktop(bags::NotificationMethod::Both) && bags::wantsNtfy(bags::NotificationMethod::Both));

  assert(bags::nextRange(bags::ChartRange::Month1) == bags::ChartRange::Day1);
  assert(bags::prevRange(bags::ChartRange::Day1) == bags::ChartRange::Month1);
  assert(bags::rangeDays(bags::ChartRange::Week1) == 7);
  assert(bags::nextTab(bags::Tab::Portfolio) == bags::Tab::Markets);

  bags::PriceAlert alert;
  alert.target_price = 100;
  alert.direction = bags::AlertDirection::Above;
  assert(alert.isTriggeredBy(100) && !alert.isTriggeredBy(99.99));
  alert.direction = bags::AlertDirection::Below;
  assert(alert.isTriggeredBy(100) && !alert.isTriggeredBy(100.01));

  std::cout << "✅ Domain helper test passed" << std::endl;
}

int main() {
  std::cout << "Running validation tests..." << std::endl;

  test_numeric_input();
  test_settings_validation();
  test_domain_helpers();

  std::cout << "🎉 All validation tests passed" << std::endl;
  return 0;
}
