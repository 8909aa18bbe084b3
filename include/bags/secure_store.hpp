#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain.hpp"

namespace bags {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// The store exists but cannot be decrypted with the supplied password
class WrongPasswordError : public StoreError {
public:
  WrongPasswordError() : StoreError("Wrong password") {}
};

/**
 * Synchronous persistence for favourites, holdings, alerts and settings.
 * Mutations throw StoreError when they cannot be made durable.
 */
class SecureStore {
public:
  virtual ~SecureStore() = default;

  virtual void addFavourite(const std::string& coin_id) = 0;
  virtual void removeFavourite(const std::string& coin_id) = 0;
  virtual std::vector<std::string> favourites() const = 0;

  // Quantity <= 0 deletes the holding. An empty buy price keeps the recorded one.
  virtual void upsertHolding(const std::string& coin_id, double amount,
                             std::optional<double> buy_price) = 0;
  virtual void setBuyPrice(const std::string& coin_id, std::optional<double> buy_price) = 0;
  // Positive holdings only
  virtual std::vector<Holding> holdings() const = 0;

  virtual int64_t insertAlert(const std::string& coin_id, double target_price,
                              AlertDirection direction) = 0;
  virtual std::vector<PriceAlert> alerts() const = 0;
  virtual void markAlertTriggered(int64_t alert_id, double price) = 0;
  virtual void deleteAlert(int64_t alert_id) = 0;

  virtual std::optional<std::string> getSetting(const std::string& key) const = 0;
  // An empty value removes the key
  virtual void setSetting(const std::string& key, const std::string& value) = 0;
};

/**
 * SecureStore over an in-memory JSON document. Every mutation calls persist().
 * Used directly as a volatile store; subclasses make the document durable.
 */
class DocumentStore : public SecureStore {
public:
  DocumentStore();
  explicit DocumentStore(nlohmann::json document);

  void addFavourite(const std::string& coin_id) override;
  void removeFavourite(const std::string& coin_id) override;
  std::vector<std::string> favourites() const override;

  void upsertHolding(const std::string& coin_id, double amount,
                     std::optional<double> buy_price) override;
  void setBuyPrice(const std::string& coin_id, std::optional<double> buy_price) override;
  std::vector<Holding> holdings() const override;

  int64_t insertAlert(const std::string& coin_id, double target_price,
                      AlertDirection direction) override;
  std::vector<PriceAlert> alerts() const override;
  void markAlertTriggered(int64_t alert_id, double price) override;
  void deleteAlert(int64_t alert_id) override;

  std::optional<std::string> getSetting(const std::string& key) const override;
  void setSetting(const std::string& key, const std::string& value) override;

  const nlohmann::json& document() const noexcept { return doc_; }

protected:
  virtual void persist() {}

private:
  nlohmann::json doc_;

  // Applies a mutation and persists it, restoring the previous document on failure
  template <typename Mutation>
  void mutate(Mutation&& mutation);
  static nlohmann::json emptyDocument();
  static void validate(const nlohmann::json& doc);
};

/**
 * DocumentStore encrypted at rest with AES-256-GCM.
 * Key: PBKDF2-HMAC-SHA256 over the password with a per-file random salt.
 * File layout: magic "BAGS" | version | salt(16) | iv(12) | tag(16) | ciphertext.
 * Writes go to a temporary file that is renamed over the original.
 */
class EncryptedFileStore : public DocumentStore {
public:
  static constexpr int kKdfIterations = 200000;

  static bool exists(const std::filesystem::path& path);

  // Opens an existing store or creates an empty one when the file is absent.
  // Throws WrongPasswordError on authentication failure and StoreError otherwise.
  static std::unique_ptr<EncryptedFileStore> open(const std::filesystem::path& path,
                                                  const std::string& password);

  const std::filesystem::path& path() const noexcept { return path_; }

protected:
  void persist() override;

private:
  EncryptedFileStore(std::filesystem::path path, std::vector<unsigned char> salt,
                     std::vector<unsigned char> key, nlohmann::json document);

  std::filesystem::path path_;
  std::vector<unsigned char> salt_;
  std::vector<unsigned char> key_;
};

} // namespace bags
