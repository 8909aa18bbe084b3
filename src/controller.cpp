#include "bags/controller.hpp"
#include "bags/logger.hpp"
#include <future>
#include <map>
#include <set>

namespace bags {

AppController::AppController(AppState& state, Config& config, MarketSourceFactory source_factory,
                             StoreOpener store_opener, Notifier& notifier)
  : state_(state)
  , config_(config)
  , source_factory_(std::move(source_factory))
  , store_opener_(std::move(store_opener))
  , notifier_(notifier)
  , scheduler_(std::chrono::seconds(config.effectiveRefreshInterval())) {
  const auto& app = config_.getAppConfig();
  state_.settings.currency = app.currency;
  state_.settings.theme = app.theme;
  state_.settings.refresh_interval_secs = config_.effectiveRefreshInterval();
}

void AppController::requireUnlocked() const {
  if (!store_ || !source_) {
    throw StateException("Store is locked");
  }
}

template <typename Fn>
bool AppController::storeWrite(const std::string& what, Fn&& fn) {
  try {
    store_->withLock(std::forward<Fn>(fn));
    return true;
  } catch (const StoreError& e) {
    state_.setError(what + " failed: " + e.what());
    return false;
  }
}

void AppController::unlock(const std::string& password) {
  std::unique_ptr<SecureStore> opened = store_opener_(password);
  store_ = std::make_unique<SessionStore>(std::move(opened));
  alerts_ = std::make_unique<AlertEngine>(*store_, notifier_);
  LOG_INFO("Store unlocked");

  loadSettings();
  source_ = source_factory_(state_.settings);
  reloadPortfolio();
  refreshAll();
}

void AppController::loadSettings() {
  std::map<std::string, std::string> stored;
  try {
    store_->withLock([&](SecureStore& store) {
      for (const char* key : {setting_keys::kCoingeckoApiKey, setting_keys::kCmcApiKey,
                              setting_keys::kCurrency, setting_keys::kNotificationMethod,
                              setting_keys::kNtfyTopic}) {
        if (auto value = store.getSetting(key)) {
          stored[key] = *value;
        }
      }
    });
  } catch (const StoreError& e) {
    LOG_WARN(std::string("Reading stored settings failed, using defaults: ") + e.what());
  }

  Settings& s = state_.settings;
  s.coingecko_api_key = stored[setting_keys::kCoingeckoApiKey];
  s.cmc_api_key = stored[setting_keys::kCmcApiKey];
  s.ntfy_topic = stored[setting_keys::kNtfyTopic];
  s.notification_method = notificationMethodFromString(stored[setting_keys::kNotificationMethod]);
  const std::string& currency = stored[setting_keys::kCurrency];
  if (isSupportedCurrency(currency)) {
    s.currency = currency;
  }
}

void AppController::reloadPortfolio() {
  std::vector<std::string> favourites;
  std::vector<Holding> holdings;
  std::vector<PriceAlert> alerts;
  try {
    store_->withLock([&](SecureStore& store) {
      favourites = store.favourites();
      holdings = store.holdings();
      alerts = store.alerts();
    });
  } catch (const StoreError& e) {
    state_.setError(std::string("Reading portfolio failed: ") + e.what());
    return;
  }

  state_.portfolio.favourites = std::set<std::string>(favourites.begin(), favourites.end());
  state_.portfolio.holdings = std::move(holdings);
  state_.portfolio.alerts = AlertEngine::merge(state_.portfolio.alerts, std::move(alerts));
}

void AppController::fetchSnapshot(Clock::time_point now) {
  PERF_TIMER("snapshot refresh");
  try {
    auto coins = awaitResult(source_->fetchSnapshot(state_.settings.currency, kSnapshotLimit));
    state_.market.coins = std::move(coins);
    state_.market.last_refresh = now;
  } catch (const MarketDataError& e) {
    state_.setError(std::string("Refresh failed: ") + e.what(), now);
    return;
  }
  fetchMissingTracked();
}

// Favourites and holdings outside the top of the market still need prices
void AppController::fetchMissingTracked() {
  std::set<std::string> tracked = state_.portfolio.favourites;
  for (const auto& h : state_.portfolio.holdings) {
    tracked.insert(h.coin_id);
  }

  std::vector<std::future<std::optional<Coin>>> pending;
  for (const auto& id : tracked) {
    if (!state_.findCoin(id)) {
      pending.push_back(source_->fetchSingle(id, state_.settings.currency));
    }
  }
  for (auto& future : pending) {
    try {
      if (auto coin = awaitResult(std::move(future))) {
        state_.market.coins.push_back(std::move(*coin));
      }
    } catch (const MarketDataError& e) {
      LOG_WARN(std::string("Fetching tracked coin failed: ") + e.what());
    }
  }
}

void AppController::refreshGlobalStats() {
  auto global = source_->fetchGlobalStats(state_.settings.currency);
  auto sentiment = source_->fetchSentiment();

  GlobalStats stats = state_.market.global.value_or(GlobalStats{});
  bool updated = false;
  try {
    GlobalStats fresh = awaitResult(std::move(global));
    stats.total_market_cap = fresh.total_market_cap;
    stats.btc_dominance = fresh.btc_dominance;
    updated = true;
  } catch (const MarketDataError& e) {
    LOG_WARN(std::string("Global stats unavailable: ") + e.what());
  }
  try {
    stats.sentiment = awaitResult(std::move(sentiment));
    updated = true;
  } catch (const MarketDataError& e) {
    LOG_WARN(std::string("Fear & greed index unavailable: ") + e.what());
  }
  if (updated) {
    state_.market.global = stats;
  }
}

void AppController::refreshAll(Clock::time_point now) {
  requireUnlocked();
  scheduler_.markAttempt(now);

  fetchSnapshot(now);
  reloadPortfolio();
  state_.clampSelection();
  alerts_->evaluate(state_, now);
  refreshGlobalStats();
}

void AppController::onTick(Clock::time_point now) {
  state_.expireTransient(now);
  if (!isUnlocked()) {
    return;
  }

  if (scheduler_.isDue(now)) {
    LOG_DEBUG("Scheduled refresh");
    refreshAll(now);
  }

  // Failures of superseded requests were logged by the cache and go no further
  for (const auto& failure : state_.charts.poll()) {
    auto* popup = std::get_if<mode::ChartPopup>(&state_.mode);
    if (popup && failure.key == ChartKey{popup->coin_id, rangeDays(popup->range)}) {
      popup->error = AppState::truncateForDisplay(failure.message);
    }
  }
}

void AppController::toggleFavourite(const std::string& coin_id) {
  requireUnlocked();
  const bool was_favourite = state_.isFavourite(coin_id);
  std::vector<std::string> favourites;
  bool ok = storeWrite(was_favourite ? "Removing favourite" : "Adding favourite", [&](SecureStore& store) {
    if (was_favourite) {
      store.removeFavourite(coin_id);
    } else {
      store.addFavourite(coin_id);
    }
    favourites = store.favourites();
  });
  if (ok) {
    state_.portfolio.favourites = std::set<std::string>(favourites.begin(), favourites.end());
    state_.clampSelection();
  }
}

void AppController::setHolding(const std::string& coin_id, double amount) {
  requireUnlocked();
  const Holding* existing = state_.holdingFor(coin_id);
  const double existing_amount = existing ? existing->amount : 0.0;

  std::optional<double> buy_price;
  if (existing_amount <= 0.0 && amount > 0.0) {
    if (const Coin* coin = state_.findCoin(coin_id)) {
      buy_price = coin->current_price;
    }
  }

  std::vector<Holding> holdings;
  bool ok = storeWrite("Saving holding", [&](SecureStore& store) {
    store.upsertHolding(coin_id, amount, buy_price);
    holdings = store.holdings();
  });
  if (ok) {
    state_.portfolio.holdings = std::move(holdings);
    state_.clampSelection();
  }
}

void AppController::setBuyPrice(const std::string& coin_id, std::optional<double> price) {
  requireUnlocked();
  std::vector<Holding> holdings;
  bool ok = storeWrite("Saving buy price", [&](SecureStore& store) {
    store.setBuyPrice(coin_id, price);
    holdings = store.holdings();
  });
  if (ok) {
    state_.portfolio.holdings = std::move(holdings);
  }
}

void AppController::deleteHolding(const std::string& coin_id) {
  setHolding(coin_id, 0.0);
}

void AppController::addAlert(const std::string& coin_id, double target_price, AlertDirection direction) {
  requireUnlocked();
  std::vector<PriceAlert> alerts;
  bool ok = storeWrite("Saving alert", [&](SecureStore& store) {
    store.insertAlert(coin_id, target_price, direction);
    alerts = store.alerts();
  });
  if (ok) {
    state_.portfolio.alerts = AlertEngine::merge(state_.portfolio.alerts, std::move(alerts));
  }
}

size_t AppController::removeAlerts(const std::string& coin_id) {
  requireUnlocked();
  std::vector<int64_t> ids;
  for (const auto& alert : state_.portfolio.alerts) {
    if (alert.coin_id == coin_id) ids.push_back(alert.id);
  }
  if (ids.empty()) {
    return 0;
  }

  std::vector<PriceAlert> alerts;
  bool ok = storeWrite("Removing alerts", [&](SecureStore& store) {
    for (int64_t id : ids) {
      store.deleteAlert(id);
    }
    alerts = store.alerts();
  });
  if (!ok) {
    return 0;
  }
  state_.portfolio.alerts = AlertEngine::merge(state_.portfolio.alerts, std::move(alerts));
  return ids.size();
}

std::vector<SearchResult> AppController::search(const std::string& query) {
  requireUnlocked();
  return awaitResult(source_->search(query));
}

void AppController::addFromSearch(const SearchResult& result) {
  requireUnlocked();
  if (!state_.isFavourite(result.id)) {
    toggleFavourite(result.id);
  }
  if (!state_.findCoin(result.id)) {
    try {
      if (auto coin = awaitResult(source_->fetchSingle(result.id, state_.settings.currency))) {
        state_.market.coins.push_back(std::move(*coin));
      } else {
        state_.setError("No market data for " + result.name);
      }
    } catch (const MarketDataError& e) {
      state_.setError("Fetching " + result.name + " failed: " + e.what());
    }
  }
  state_.setTab(Tab::Favourites);
  state_.clampSelection();
}

ChartLookup AppController::requestChart(const std::string& coin_id, ChartRange range) {
  requireUnlocked();
  return state_.charts.getOrFetch(*source_, coin_id, state_.settings.currency, rangeDays(range));
}

ValidationResult AppController::saveSettings(const Settings& draft) {
  requireUnlocked();
  ValidationResult valid = Validator::validateSettings(draft);
  if (!valid) {
    return valid;
  }

  const bool currency_changed = draft.currency != state_.settings.currency;

  storeWrite("Saving settings", [&](SecureStore& store) {
    store.setSetting(setting_keys::kCoingeckoApiKey, draft.coingecko_api_key);
    store.setSetting(setting_keys::kCmcApiKey, draft.cmc_api_key);
    store.setSetting(setting_keys::kCurrency, draft.currency);
    store.setSetting(setting_keys::kNotificationMethod, toString(draft.notification_method));
    store.setSetting(setting_keys::kNtfyTopic, draft.ntfy_topic);
  });

  Config::AppConfig app = config_.getAppConfig();
  app.currency = draft.currency;
  app.theme = draft.theme;
  app.refresh_interval_secs = draft.refresh_interval_secs;
  config_.setAppConfig(app);
  if (!config_.save()) {
    state_.setError("Saving configuration to " + config_.getConfigFilePath() + " failed");
  }

  state_.settings = draft;
  state_.settings.refresh_interval_secs = config_.effectiveRefreshInterval();
  scheduler_.setInterval(std::chrono::seconds(state_.settings.refresh_interval_secs));
  source_ = source_factory_(state_.settings);
  state_.charts.clear();
  LOG_INFO("Settings saved (currency=" + draft.currency + ", theme=" + draft.theme + ")");

  if (currency_changed) {
    refreshAll();
  }
  return valid;
}

} // namespace bags
