#include "bags/secure_store.hpp"
#include "bags/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

using json = nlohmann::json;

namespace bags {

namespace {

constexpr int kDocumentVersion = 1;

const char* directionKey(AlertDirection direction) {
  return direction == AlertDirection::Above ? "above" : "below";
}

AlertDirection directionFromKey(const std::string& key) {
  return key == "below" ? AlertDirection::Below : AlertDirection::Above;
}

} // namespace

// --- DocumentStore ---

DocumentStore::DocumentStore() : doc_(emptyDocument()) {}

DocumentStore::DocumentStore(json document) : doc_(std::move(document)) {
  validate(doc_);
}

json DocumentStore::emptyDocument() {
  return json{
    {"version", kDocumentVersion},
    {"favourites", json::array()},
    {"holdings", json::object()},
    {"alerts", json::array()},
    {"next_alert_id", 1},
    {"settings", json::object()},
  };
}

void DocumentStore::validate(const json& doc) {
  if (!doc.is_object() ||
      !doc.contains("favourites") || !doc["favourites"].is_array() ||
      !doc.contains("holdings") || !doc["holdings"].is_object() ||
      !doc.contains("alerts") || !doc["alerts"].is_array() ||
      !doc.contains("next_alert_id") || !doc["next_alert_id"].is_number_integer() ||
      !doc.contains("settings") || !doc["settings"].is_object()) {
    throw StoreError("Store document is malformed");
  }
}

template <typename Mutation>
void DocumentStore::mutate(Mutation&& mutation) {
  json previous = doc_;
  try {
    mutation(doc_);
    persist();
  } catch (const StoreError&) {
    doc_ = std::move(previous);
    throw;
  } catch (const json::exception& e) {
    doc_ = std::move(previous);
    throw StoreError(std::string("Store update failed: ") + e.what());
  }
}

void DocumentStore::addFavourite(const std::string& coin_id) {
  mutate([&](json& doc) {
    auto& favs = doc["favourites"];
    if (std::find(favs.begin(), favs.end(), coin_id) == favs.end()) {
      favs.push_back(coin_id);
    }
  });
}

void DocumentStore::removeFavourite(const std::string& coin_id) {
  mutate([&](json& doc) {
    auto& favs = doc["favourites"];
    favs.erase(std::remove(favs.begin(), favs.end(), coin_id), favs.end());
  });
}

std::vector<std::string> DocumentStore::favourites() const {
  std::vector<std::string> ids;
  for (const auto& id : doc_["favourites"]) {
    if (id.is_string()) ids.push_back(id.get<std::string>());
  }
  return ids;
}

void DocumentStore::upsertHolding(const std::string& coin_id, double amount,
                                  std::optional<double> buy_price) {
  mutate([&](json& doc) {
    auto& holdings = doc["holdings"];
    if (amount <= 0.0) {
      holdings.erase(coin_id);
      return;
    }
    json& entry = holdings[coin_id];
    if (!entry.is_object()) {
      entry = json{{"amount", amount}, {"buy_price", nullptr}};
    }
    entry["amount"] = amount;
    if (buy_price) {
      entry["buy_price"] = *buy_price;
    }
  });
}

void DocumentStore::setBuyPrice(const std::string& coin_id, std::optional<double> buy_price) {
  mutate([&](json& doc) {
    auto& holdings = doc["holdings"];
    auto it = holdings.find(coin_id);
    if (it == holdings.end()) {
      return;
    }
    if (buy_price) {
      (*it)["buy_price"] = *buy_price;
    } else {
      (*it)["buy_price"] = nullptr;
    }
  });
}

std::vector<Holding> DocumentStore::holdings() const {
  std::vector<Holding> result;
  const json& stored = doc_["holdings"];
  for (auto it = stored.begin(); it != stored.end(); ++it) {
    const json& entry = it.value();
    Holding h;
    h.coin_id = it.key();
    h.amount = entry.value("amount", 0.0);
    auto bp = entry.find("buy_price");
    if (bp != entry.end() && bp->is_number()) {
      h.buy_price = bp->get<double>();
    }
    if (h.isPositive()) {
      result.push_back(std::move(h));
    }
  }
  return result;
}

int64_t DocumentStore::insertAlert(const std::string& coin_id, double target_price,
                                   AlertDirection direction) {
  int64_t id = 0;
  mutate([&](json& doc) {
    id = doc["next_alert_id"].get<int64_t>();
    doc["next_alert_id"] = id + 1;
    doc["alerts"].push_back(json{
      {"id", id},
      {"coin_id", coin_id},
      {"target_price", target_price},
      {"direction", directionKey(direction)},
      {"triggered", false},
      {"triggered_price", nullptr},
    });
  });
  return id;
}

std::vector<PriceAlert> DocumentStore::alerts() const {
  std::vector<PriceAlert> result;
  for (const auto& entry : doc_["alerts"]) {
    PriceAlert alert;
    alert.id = entry.value("id", int64_t{0});
    alert.coin_id = entry.value("coin_id", std::string{});
    alert.target_price = entry.value("target_price", 0.0);
    alert.direction = directionFromKey(entry.value("direction", std::string{"above"}));
    alert.triggered = entry.value("triggered", false);
    auto tp = entry.find("triggered_price");
    if (tp != entry.end() && tp->is_number()) {
      alert.triggered_price = tp->get<double>();
    }
    result.push_back(std::move(alert));
  }
  return result;
}

void DocumentStore::markAlertTriggered(int64_t alert_id, double price) {
  mutate([&](json& doc) {
    for (auto& entry : doc["alerts"]) {
      if (entry.value("id", int64_t{0}) == alert_id) {
        entry["triggered"] = true;
        entry["triggered_price"] = price;
      }
    }
  });
}

void DocumentStore::deleteAlert(int64_t alert_id) {
  mutate([&](json& doc) {
    auto& alerts = doc["alerts"];
    for (auto it = alerts.begin(); it != alerts.end();) {
      if (it->value("id", int64_t{0}) == alert_id) {
        it = alerts.erase(it);
      } else {
        ++it;
      }
    }
  });
}

std::optional<std::string> DocumentStore::getSetting(const std::string& key) const {
  const auto& settings = doc_["settings"];
  auto it = settings.find(key);
  if (it == settings.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

void DocumentStore::setSetting(const std::string& key, const std::string& value) {
  mutate([&](json& doc) {
    if (value.empty()) {
      doc["settings"].erase(key);
    } else {
      doc["settings"][key] = value;
    }
  });
}

// --- EncryptedFileStore ---

namespace {

constexpr char kMagic[4] = {'B', 'A', 'G', 'S'};
constexpr unsigned char kFileVersion = 1;
constexpr size_t kSaltLength = 16;
constexpr size_t kIvLength = 12;
constexpr size_t kTagLength = 16;
constexpr size_t kKeyLength = 32;
constexpr size_t kHeaderLength = sizeof(kMagic) + 1 + kSaltLength + kIvLength + kTagLength;

using Bytes = std::vector<unsigned char>;
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::string opensslError(const std::string& what) {
  const unsigned long err = ::ERR_get_error();
  const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
  return reason ? what + ": " + reason : what;
}

Bytes randomBytes(size_t length) {
  Bytes out(length);
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw StoreError(opensslError("Failed to generate random bytes"));
  }
  return out;
}

Bytes deriveKey(const std::string& password, const Bytes& salt) {
  Bytes key(kKeyLength);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        EncryptedFileStore::kKdfIterations, EVP_sha256(),
                        static_cast<int>(key.size()), key.data()) != 1) {
    throw StoreError(opensslError("Key derivation failed"));
  }
  return key;
}

CipherCtx newContext() {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    throw StoreError(opensslError("Failed to allocate cipher context"));
  }
  return ctx;
}

Bytes encrypt(const Bytes& key, const Bytes& iv, const std::string& plaintext, Bytes& tag) {
  CipherCtx ctx = newContext();
  Bytes ciphertext(plaintext.size() + 16);
  int len = 0;
  int total = 0;

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
    throw StoreError(opensslError("Cipher initialisation failed"));
  }
  if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                        reinterpret_cast<const unsigned char*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    throw StoreError(opensslError("Encryption failed"));
  }
  total = len;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
    throw StoreError(opensslError("Encryption failed"));
  }
  total += len;
  ciphertext.resize(static_cast<size_t>(total));

  tag.assign(kTagLength, 0);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
    throw StoreError(opensslError("Failed to read authentication tag"));
  }
  return ciphertext;
}

// Returns nullopt when the tag does not authenticate
std::optional<std::string> decrypt(const Bytes& key, const Bytes& iv, const Bytes& tag,
                                   const Bytes& ciphertext) {
  CipherCtx ctx = newContext();
  std::string plaintext(ciphertext.size() + 16, '\0');
  int len = 0;
  int total = 0;

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
    throw StoreError(opensslError("Cipher initialisation failed"));
  }
  if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plaintext[0]), &len,
                        ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
    throw StoreError(opensslError("Decryption failed"));
  }
  total = len;

  Bytes expected = tag;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(expected.size()),
                          expected.data()) != 1) {
    throw StoreError(opensslError("Failed to set authentication tag"));
  }
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&plaintext[0]) + total, &len) != 1) {
    ERR_clear_error();
    return std::nullopt;
  }
  total += len;
  plaintext.resize(static_cast<size_t>(total));
  return plaintext;
}

Bytes readFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw StoreError("Cannot open store " + path.string());
  }
  return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

EncryptedFileStore::EncryptedFileStore(std::filesystem::path path, std::vector<unsigned char> salt,
                                       std::vector<unsigned char> key, json document)
  : DocumentStore(std::move(document))
  , path_(std::move(path))
  , salt_(std::move(salt))
  , key_(std::move(key)) {
}

bool EncryptedFileStore::exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

std::unique_ptr<EncryptedFileStore> EncryptedFileStore::open(const std::filesystem::path& path,
                                                             const std::string& password) {
  if (password.empty()) {
    throw StoreError("Password cannot be empty");
  }

  if (!exists(path)) {
    Bytes salt = randomBytes(kSaltLength);
    Bytes key = deriveKey(password, salt);
    std::unique_ptr<EncryptedFileStore> store(
        new EncryptedFileStore(path, std::move(salt), std::move(key), DocumentStore().document()));
    store->persist();
    LOG_INFO("Created new store at " + path.string());
    return store;
  }

  Bytes raw = readFile(path);
  if (raw.size() < kHeaderLength || !std::equal(std::begin(kMagic), std::end(kMagic), raw.begin())) {
    throw StoreError("Store " + path.string() + " is not a bags store");
  }
  if (raw[sizeof(kMagic)] != kFileVersion) {
    throw StoreError("Unsupported store version " + std::to_string(raw[sizeof(kMagic)]));
  }

  auto cursor = raw.begin() + static_cast<std::ptrdiff_t>(sizeof(kMagic) + 1);
  Bytes salt(cursor, cursor + kSaltLength);
  cursor += kSaltLength;
  Bytes iv(cursor, cursor + kIvLength);
  cursor += kIvLength;
  Bytes tag(cursor, cursor + kTagLength);
  cursor += kTagLength;
  Bytes ciphertext(cursor, raw.end());

  Bytes key = deriveKey(password, salt);
  auto plaintext = decrypt(key, iv, tag, ciphertext);
  if (!plaintext) {
    throw WrongPasswordError();
  }

  json document;
  try {
    document = json::parse(*plaintext);
  } catch (const json::parse_error& e) {
    throw StoreError(std::string("Store contents are corrupt: ") + e.what());
  }

  std::unique_ptr<EncryptedFileStore> store(
      new EncryptedFileStore(path, std::move(salt), std::move(key), std::move(document)));
  LOG_INFO("Opened store at " + path.string());
  return store;
}

void EncryptedFileStore::persist() {
  const std::string plaintext = document().dump();
  Bytes iv = randomBytes(kIvLength);
  Bytes tag;
  Bytes ciphertext = encrypt(key_, iv, plaintext, tag);

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw StoreError("Cannot create " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  std::filesystem::path tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw StoreError("Cannot write " + tmp.string());
    }
    out.write(kMagic, sizeof(kMagic));
    out.put(static_cast<char>(kFileVersion));
    out.write(reinterpret_cast<const char*>(salt_.data()), static_cast<std::streamsize>(salt_.size()));
    out.write(reinterpret_cast<const char*>(iv.data()), static_cast<std::streamsize>(iv.size()));
    out.write(reinterpret_cast<const char*>(tag.data()), static_cast<std::streamsize>(tag.size()));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), static_cast<std::streamsize>(ciphertext.size()));
    out.flush();
    if (!out) {
      throw StoreError("Failed writing " + tmp.string());
    }
  }

  std::filesystem::permissions(tmp, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    LOG_WARN("Could not restrict permissions on " + tmp.string() + ": " + ec.message());
    ec.clear();
  }
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    throw StoreError("Cannot replace " + path_.string() + ": " + ec.message());
  }
}

} // namespace bags
