#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "alert_engine.hpp"
#include "chart_cache.hpp"
#include "config.hpp"
#include "market_data.hpp"
#include "notifier.hpp"
#include "refresh_scheduler.hpp"
#include "session_store.hpp"
#include "state.hpp"
#include "validation.hpp"

namespace bags {

// Opens (or creates) the secure store with a password. Throws WrongPasswordError / StoreError.
using StoreOpener = std::function<std::unique_ptr<SecureStore>(const std::string& password)>;

/**
 * Owns the collaborators behind AppState: market source, unlocked store,
 * alert engine and refresh scheduler. Every operation that touches the
 * network or the store goes through here; failures end up as AppState errors.
 */
class AppController {
public:
  AppController(AppState& state, Config& config, MarketSourceFactory source_factory,
                StoreOpener store_opener, Notifier& notifier);

  AppController(const AppController&) = delete;
  AppController& operator=(const AppController&) = delete;

  // Opens the store, loads settings and portfolio, then fetches the first snapshot.
  // Throws WrongPasswordError or StoreError; state is untouched on failure.
  void unlock(const std::string& password);
  bool isUnlocked() const noexcept { return store_ != nullptr; }

  // Snapshot, store re-read, selection clamp, alert pass, global stats
  void refreshAll(Clock::time_point now = Clock::now());
  // Idle tick: scheduled refresh, chart harvest, transient expiry
  void onTick(Clock::time_point now = Clock::now());

  void toggleFavourite(const std::string& coin_id);
  // Quantity <= 0 deletes. A first positive quantity captures the current price as buy price.
  void setHolding(const std::string& coin_id, double amount);
  void setBuyPrice(const std::string& coin_id, std::optional<double> price);
  void deleteHolding(const std::string& coin_id);

  void addAlert(const std::string& coin_id, double target_price, AlertDirection direction);
  size_t removeAlerts(const std::string& coin_id);

  // Throws MarketDataError
  std::vector<SearchResult> search(const std::string& query);
  void addFromSearch(const SearchResult& result);

  ChartLookup requestChart(const std::string& coin_id, ChartRange range);

  // Validates and applies settings; returns the validation failure, if any
  ValidationResult saveSettings(const Settings& draft);

  SessionStore* store() noexcept { return store_.get(); }
  AlertEngine* alertEngine() noexcept { return alerts_.get(); }
  RefreshScheduler& scheduler() noexcept { return scheduler_; }

private:
  AppState& state_;
  Config& config_;
  MarketSourceFactory source_factory_;
  StoreOpener store_opener_;
  Notifier& notifier_;

  std::unique_ptr<MarketDataSource> source_;
  std::unique_ptr<SessionStore> store_;
  std::unique_ptr<AlertEngine> alerts_;
  RefreshScheduler scheduler_;

  void requireUnlocked() const;
  void loadSettings();
  void reloadPortfolio();
  void fetchSnapshot(Clock::time_point now);
  void fetchMissingTracked();
  void refreshGlobalStats();

  // Runs a store mutation; a StoreError becomes a transient error
  template <typename Fn>
  bool storeWrite(const std::string& what, Fn&& fn);
};

} // namespace bags
