#pragma once
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include "domain.hpp"

namespace bags {

// Transport, status and payload failures of a market data provider
class MarketDataError : public std::runtime_error {
public:
  explicit MarketDataError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Asynchronous market data provider.
 * Every call returns immediately; failures surface as MarketDataError from future::get().
 */
class MarketDataSource {
public:
  virtual ~MarketDataSource() = default;

  virtual std::future<std::vector<Coin>> fetchSnapshot(const std::string& currency, size_t limit) = 0;
  virtual std::future<std::vector<double>> fetchSeries(const std::string& coin_id,
                                                       const std::string& currency, int days) = 0;
  virtual std::future<std::vector<SearchResult>> search(const std::string& query) = 0;
  virtual std::future<std::optional<Coin>> fetchSingle(const std::string& coin_id,
                                                       const std::string& currency) = 0;
  virtual std::future<GlobalStats> fetchGlobalStats(const std::string& currency) = 0;
  virtual std::future<Sentiment> fetchSentiment() = 0;
};

// Builds a source for the current provider settings (API key, currency)
using MarketSourceFactory = std::function<std::unique_ptr<MarketDataSource>(const Settings&)>;

constexpr size_t kSnapshotLimit = 50;
constexpr size_t kMaxSearchResults = 10;
constexpr size_t kErrorExcerptLength = 300;

// Runs `work` on a detached thread. Destroying the returned future never blocks.
template <typename Work>
auto runDetached(Work work) -> std::future<decltype(work())> {
  using Result = decltype(work());
  auto promise = std::make_shared<std::promise<Result>>();
  auto future = promise->get_future();
  std::thread([promise, work = std::move(work)]() mutable {
    try {
      if constexpr (std::is_void_v<Result>) {
        work();
        promise->set_value();
      } else {
        promise->set_value(work());
      }
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();
  return future;
}

// Waits for a provider result, reporting failures of any kind as MarketDataError
template <typename T>
T awaitResult(std::future<T> future) {
  try {
    return future.get();
  } catch (const MarketDataError&) {
    throw;
  } catch (const std::exception& e) {
    throw MarketDataError(e.what());
  }
}

// Cuts provider payloads down for error messages
std::string excerpt(const std::string& body, size_t max_length = kErrorExcerptLength);

} // namespace bags
