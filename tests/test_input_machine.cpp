#include "bags/input_machine.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>

using bags::SortColumn;
using bags::SortDirection;
using ftxui::Event;

namespace {

struct MachineFixture : test::Harness {
  bags::InputStateMachine machine{state, *controller};

  MachineFixture() {
    market->coins = {
      test::makeCoin("btc", "Bitcoin", "btc", 50000, 1),
      test::makeCoin("eth", "Ethereum", "eth", 3000, 2),
    };
  }

  void key(char c) { machine.handle(Event::Character(c)); }
  void type(const std::string& s) {
    for (char c : s) key(c);
  }
  void press(const Event& event) { machine.handle(event); }
};

} // namespace

void test_first_run_password_flow() {
  MachineFixture f;
  f.state.mode = bags::mode::Locked{true, "", ""};

  f.press(Event::Return);
  auto* locked = std::get_if<bags::mode::Locked>(&f.state.mode);
  assert(locked && locked->error == "Password cannot be empty");

  f.type("hunter2");
  f.press(Event::Return);
  assert(f.state.inMode<bags::mode::ConfirmingPassword>());

  f.type("hunter3");
  f.press(Event::Return);
  locked = std::get_if<bags::mode::Locked>(&f.state.mode);
  assert(locked && locked->is_new);
  assert(locked->error == "Passwords do not match");
  assert(locked->buffer.empty());

  f.type("hunter2");
  f.press(Event::Return);
  f.type("hunter2");
  f.press(Event::Return);
  assert(f.state.inMode<bags::mode::Browsing>());
  assert(f.controller->isUnlocked());
  assert(f.state.market.coins.size() == 2);
  assert(f.market->snapshot_calls == 1);

  std::cout << "✅ First run password flow test passed" << std::endl;
}

void test_wrong_password() {
  MachineFixture f;
  f.state.mode = bags::mode::Locked{false, "", ""};

  f.type("nope");
  f.press(Event::Return);
  auto* locked = std::get_if<bags::mode::Locked>(&f.state.mode);
  assert(locked && !locked->is_new);
  assert(locked->error == "Wrong password");
  assert(!f.controller->isUnlocked());
  assert(f.market->snapshot_calls == 0);

  // Typing clears the error
  f.key('x');
  locked = std::get_if<bags::mode::Locked>(&f.state.mode);
  assert(locked && locked->error.empty() && locked->buffer == "x");

  std::cout << "✅ Wrong password test passed" << std::endl;
}

void test_amount_rejects_non_numeric() {
  MachineFixture f;
  f.unlock();

  f.key('a');
  assert(f.state.inMode<bags::mode::EditingAmount>());
  f.type("abc");
  auto* editing = std::get_if<bags::mode::EditingAmount>(&f.state.mode);
  assert(editing && editing->buffer.empty());
  f.type("1.5x");
  editing = std::get_if<bags::mode::EditingAmount>(&f.state.mode);
  assert(editing->buffer == "1.5");
  f.press(Event::Return);
  assert(f.state.holdingFor("btc") && f.state.holdingFor("btc")->amount == 1.5);

  // Submitting "abc" leaves the holding unchanged
  f.state.mode = bags::mode::EditingAmount{"btc", "abc"};
  f.press(Event::Return);
  assert(f.state.inMode<bags::mode::Browsing>());
  assert(f.state.holdingFor("btc")->amount == 1.5);
  assert(f.store->holdings().size() == 1);

  std::cout << "✅ Amount input rejection test passed" << std::endl;
}

void test_buy_price_auto_capture() {
  MachineFixture f;
  f.unlock();

  f.key('a');
  f.type("2");
  f.press(Event::Return);
  const bags::Holding* held = f.state.holdingFor("btc");
  assert(held && held->amount == 2.0);
  assert(held->buy_price == 50000.0);

  // Later edits keep the recorded price
  f.state.market.coins[0].current_price = 60000;
  f.key('a');
  auto* editing = std::get_if<bags::mode::EditingAmount>(&f.state.mode);
  assert(editing && editing->buffer == "2");
  f.type("5");
  f.press(Event::Return);
  held = f.state.holdingFor("btc");
  assert(held->amount == 25.0);
  assert(held->buy_price == 50000.0);

  // Explicit buy price edit
  f.key('b');
  assert(f.state.inMode<bags::mode::EditingBuyPrice>());
  f.state.mode = bags::mode::EditingBuyPrice{"btc", "45000"};
  f.press(Event::Return);
  assert(f.state.holdingFor("btc")->buy_price == 45000.0);

  // Deleting and re-adding captures the current price again
  f.key('d');
  assert(!f.state.holdingFor("btc"));
  f.key('a');
  f.type("1");
  f.press(Event::Return);
  assert(f.state.holdingFor("btc")->buy_price == 60000.0);

  std::cout << "✅ Buy price auto-capture test passed" << std::endl;
}

void test_buy_price_needs_holding() {
  MachineFixture f;
  f.unlock();

  f.key('b');
  assert(f.state.inMode<bags::mode::Browsing>());

  std::cout << "✅ Buy price without holding test passed" << std::endl;
}

void test_sort_picker_cycle() {
  MachineFixture f;
  f.unlock();

  f.key('s');
  assert(f.state.inMode<bags::mode::SortPicking>());
  f.key('p');
  assert(f.state.inMode<bags::mode::Browsing>());
  assert(f.state.ui.sort == bags::SortSpec({SortColumn::Price, SortDirection::Ascending}));
  assert(f.state.selectedCoin()->id == "eth");

  f.key('s');
  f.key('p');
  assert(f.state.ui.sort == bags::SortSpec({SortColumn::Price, SortDirection::Descending}));

  f.key('s');
  f.key('p');
  assert(!f.state.ui.sort);

  f.key('s');
  f.key('m');
  assert(f.state.ui.sort && f.state.ui.sort->column == SortColumn::MarketCap);
  f.key('s');
  f.press(Event::Escape);
  assert(!f.state.ui.sort);
  assert(f.state.inMode<bags::mode::Browsing>());

  // Unknown keys cancel without changing the sort
  f.key('s');
  f.key('z');
  assert(!f.state.ui.sort);
  assert(f.state.inMode<bags::mode::Browsing>());

  std::cout << "✅ Sort picker test passed" << std::endl;
}

void test_filter_and_escape() {
  MachineFixture f;
  f.unlock();

  f.key('j');
  assert(f.state.ui.selected == 1);

  f.key('/');
  f.type("eth");
  assert(f.state.ui.filter == "eth");
  assert(f.state.ui.selected == 0);
  f.press(Event::Return);
  assert(f.state.inMode<bags::mode::Browsing>());
  assert(f.state.visibleCoins().size() == 1);

  // Esc clears the filter first, then quits
  f.press(Event::Escape);
  assert(f.state.ui.filter.empty());
  assert(!f.state.ui.quit);
  f.press(Event::Escape);
  assert(f.state.ui.quit);

  std::cout << "✅ Filter test passed" << std::endl;
}

void test_navigation_keys() {
  MachineFixture f;
  f.unlock();

  f.key('G');
  assert(f.state.ui.selected == 1);
  f.key('g');
  assert(f.state.ui.selected == 0);
  f.press(Event::ArrowDown);
  f.press(Event::ArrowDown);
  assert(f.state.ui.selected == 1);
  f.press(Event::Special("\x15"));
  assert(f.state.ui.selected == 0);

  f.key('f');
  assert(f.state.isFavourite("btc"));
  f.key('2');
  assert(f.state.ui.tab == bags::Tab::Favourites);
  assert(f.state.visibleCoins().size() == 1);
  f.press(Event::Tab);
  assert(f.state.ui.tab == bags::Tab::Portfolio);
  f.key('1');
  assert(f.state.ui.tab == bags::Tab::Markets);

  f.key('r');
  assert(f.market->snapshot_calls == 2);

  f.key('q');
  assert(f.state.ui.quit);

  std::cout << "✅ Navigation keys test passed" << std::endl;
}

void test_chart_popup_ranges() {
  MachineFixture f;
  f.market->series[{"btc", 1}] = {1, 2, 3};
  f.market->series[{"btc", 7}] = {3, 2, 1};
  f.unlock();

  f.press(Event::Return);
  auto* popup = std::get_if<bags::mode::ChartPopup>(&f.state.mode);
  assert(popup && popup->coin_id == "btc" && popup->range == bags::ChartRange::Day1);
  assert(f.market->series_calls == 1);

  f.key('l');
  popup = std::get_if<bags::mode::ChartPopup>(&f.state.mode);
  assert(popup->range == bags::ChartRange::Week1);
  assert(f.market->series_calls == 2);

  f.key('h');
  popup = std::get_if<bags::mode::ChartPopup>(&f.state.mode);
  assert(popup->range == bags::ChartRange::Day1);
  assert(f.market->series_calls == 2);

  f.press(Event::Escape);
  assert(f.state.inMode<bags::mode::Browsing>());

  // Provider failures stay inside the popup
  f.market->fail_series = true;
  f.key('j');
  f.press(Event::Return);
  popup = std::get_if<bags::mode::ChartPopup>(&f.state.mode);
  assert(popup && popup->coin_id == "eth");
  assert(popup->error.find("429") != std::string::npos);
  assert(!f.state.ui.error);

  std::cout << "✅ Chart popup test passed" << std::endl;
}

void test_superseded_chart_failure_is_ignored() {
  MachineFixture f;
  f.market->defer_series = true;
  f.unlock();

  f.press(Event::Return);
  f.key('l');
  auto* popup = std::get_if<bags::mode::ChartPopup>(&f.state.mode);
  assert(popup && popup->range == bags::ChartRange::Week1);
  assert(f.state.charts.pendingCount() == 2);

  // The 1D request fails after the user moved on to 7D
  f.market->complete("btc", 7, {3, 4, 5});
  f.market->fail("btc", 1, "HTTP 429: rate limited");
  f.controller->onTick();
  popup = std::get_if<bags::mode::ChartPopup>(&f.state.mode);
  assert(popup && popup->error.empty());
  assert(f.state.charts.find("btc", 7));
  assert(!f.state.ui.error);

  // A failure of the range on screen still shows up
  f.key('h');
  f.market->fail("btc", 1, "HTTP 500: upstream");
  f.controller->onTick();
  popup = std::get_if<bags::mode::ChartPopup>(&f.state.mode);
  assert(popup && popup->range == bags::ChartRange::Day1);
  assert(popup->error.find("500") != std::string::npos);

  std::cout << "✅ Superseded chart failure test passed" << std::endl;
}

void test_alert_entry() {
  MachineFixture f;
  f.unlock();

  f.key('A');
  f.type("60000");
  f.press(Event::Tab);
  auto* editing = std::get_if<bags::mode::EditingAlert>(&f.state.mode);
  assert(editing && editing->direction == bags::AlertDirection::Below);
  f.press(Event::Return);
  assert(f.state.portfolio.alerts.size() == 1);
  assert(f.state.portfolio.alerts[0].target_price == 60000.0);
  assert(!f.state.portfolio.alerts[0].triggered);

  // Fires on the next refresh
  f.key('r');
  assert(f.state.portfolio.alerts[0].triggered);
  assert(f.store->alerts()[0].triggered);

  // Zero is not a valid target
  f.state.mode = bags::mode::EditingAlert{"btc", "0", bags::AlertDirection::Above};
  f.press(Event::Return);
  assert(f.state.portfolio.alerts.size() == 1);

  f.key('X');
  assert(f.state.portfolio.alerts.empty());
  assert(f.store->alerts().empty());

  std::cout << "✅ Alert entry test passed" << std::endl;
}

void test_settings_save_and_cancel() {
  MachineFixture f;
  f.unlock();

  f.key('S');
  auto* settings = std::get_if<bags::mode::Settings>(&f.state.mode);
  assert(settings && settings->field == bags::SettingsField::Currency);
  f.key('l');
  settings = std::get_if<bags::mode::Settings>(&f.state.mode);
  assert(settings->draft.currency == "eur");

  // Cancel discards the draft
  f.press(Event::Escape);
  assert(f.state.settings.currency == "usd");

  f.key('S');
  f.key('l');
  f.key('j');
  f.key('l');
  settings = std::get_if<bags::mode::Settings>(&f.state.mode);
  assert(settings->field == bags::SettingsField::Theme);
  assert(settings->draft.theme != "dark");
  f.key('s');
  assert(f.state.inMode<bags::mode::Browsing>());
  assert(f.state.settings.currency == "eur");
  assert(f.market->last_currency == "eur");
  assert(f.store->getSetting(bags::setting_keys::kCurrency) == std::optional<std::string>("eur"));
  assert(f.config.getAppConfig().currency == "eur");

  std::cout << "✅ Settings save and cancel test passed" << std::endl;
}

void test_settings_validation() {
  MachineFixture f;
  f.unlock();

  f.key('S');
  auto* settings = std::get_if<bags::mode::Settings>(&f.state.mode);
  settings->field = bags::SettingsField::Notifications;
  settings->draft.notification_method = bags::NotificationMethod::Ntfy;
  f.key('s');
  settings = std::get_if<bags::mode::Settings>(&f.state.mode);
  assert(settings && settings->error == "Ntfy notifications need a topic");

  // Enter the topic as text
  settings->field = bags::SettingsField::NtfyTopic;
  f.press(Event::Return);
  f.type("my-alerts");
  f.press(Event::Return);
  settings = std::get_if<bags::mode::Settings>(&f.state.mode);
  assert(!settings->editing && settings->draft.ntfy_topic == "my-alerts");
  f.key('s');
  assert(f.state.inMode<bags::mode::Browsing>());
  assert(f.state.settings.notification_method == bags::NotificationMethod::Ntfy);
  assert(f.state.settings.ntfy_topic == "my-alerts");

  std::cout << "✅ Settings validation test passed" << std::endl;
}

void test_search_adds_favourite() {
  MachineFixture f;
  f.market->search_results = {{"dogecoin", "Dogecoin", "doge", 9}};
  f.market->singles["dogecoin"] = test::makeCoin("dogecoin", "Dogecoin", "doge", 0.08, 9);
  f.unlock();

  f.key('c');
  f.type("doge");
  f.press(Event::Return);
  auto* results = std::get_if<bags::mode::SearchResults>(&f.state.mode);
  assert(results && results->results.size() == 1);

  // Esc goes back to the query
  f.press(Event::Escape);
  auto* query = std::get_if<bags::mode::SearchQuery>(&f.state.mode);
  assert(query && query->query == "doge");
  f.press(Event::Return);
  f.press(Event::Return);

  assert(f.state.inMode<bags::mode::Browsing>());
  assert(f.state.isFavourite("dogecoin"));
  assert(f.state.findCoin("dogecoin"));
  assert(f.state.ui.tab == bags::Tab::Favourites);
  assert(f.state.selectedCoin()->id == "dogecoin");

  // Search failures stay in the popup
  f.market->fail_search = true;
  f.key('c');
  f.type("x");
  f.press(Event::Return);
  query = std::get_if<bags::mode::SearchQuery>(&f.state.mode);
  assert(query && query->error.find("Search failed") == 0);

  std::cout << "✅ Search test passed" << std::endl;
}

int main() {
  std::cout << "Running InputStateMachine tests..." << std::endl;

  test_first_run_password_flow();
  test_wrong_password();
  test_amount_rejects_non_numeric();
  test_buy_price_auto_capture();
  test_buy_price_needs_holding();
  test_sort_picker_cycle();
  test_filter_and_escape();
  test_navigation_keys();
  test_chart_popup_ranges();
  test_superseded_chart_failure_is_ignored();
  test_alert_entry();
  test_settings_save_and_cancel();
  test_settings_validation();
  test_search_adds_favourite();

  std::cout << "🎉 All InputStateMachine tests passed" << std::endl;
  return 0;
}
