#include "core/full_sync_settings.h"
#include "core/logger.h"
#include "core/sync_errors.h"
#include <pqxx/pqxx>
#include <stdexcept>

using json = nlohmann::json;

namespace {
size_t readPositive(const json &entry, const std::string &moduleName,
                    const char *key) {
  if (!entry.contains(key)) {
    throw std::invalid_argument("full sync limits for '" + moduleName +
                                "' lack '" + key + "'");
  }
  const json &value = entry[key];
  if (!value.is_number_integer() || value.get<long long>() <= 0) {
    throw std::invalid_argument("full sync limit '" + std::string(key) +
                                "' for '" + moduleName +
                                "' must be a positive integer");
  }
  return value.get<size_t>();
}
} // namespace

void FullSyncSettings::validate(const std::string &moduleName,
                                const FullSyncLimits &limits) {
  if (moduleName.empty()) {
    throw std::invalid_argument("full sync limits need a module name");
  }
  if (limits.chunkSize < MIN_CHUNK_SIZE || limits.chunkSize > MAX_CHUNK_SIZE) {
    throw std::invalid_argument(
        "chunk_size for '" + moduleName + "' must be between " +
        std::to_string(MIN_CHUNK_SIZE) + " and " +
        std::to_string(MAX_CHUNK_SIZE));
  }
  if (limits.maxChunks < MIN_MAX_CHUNKS || limits.maxChunks > MAX_MAX_CHUNKS) {
    throw std::invalid_argument(
        "max_chunks for '" + moduleName + "' must be between " +
        std::to_string(MIN_MAX_CHUNKS) + " and " +
        std::to_string(MAX_MAX_CHUNKS));
  }
}

void FullSyncSettings::setLimits(const std::string &moduleName,
                                 const FullSyncLimits &limits) {
  validate(moduleName, limits);
  std::lock_guard<std::mutex> lock(mutex_);
  limits_[moduleName] = limits;
}

FullSyncLimits FullSyncSettings::limitsFor(const std::string &moduleName) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = limits_.find(moduleName);
  if (it == limits_.end()) {
    throw ConfigurationMissingError(moduleName);
  }
  return it->second;
}

bool FullSyncSettings::hasLimits(const std::string &moduleName) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return limits_.count(moduleName) > 0;
}

void FullSyncSettings::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  limits_.clear();
}

void FullSyncSettings::loadFromJson(const json &limits) {
  if (!limits.is_object()) {
    throw std::invalid_argument("full_sync_limits must be a JSON object");
  }

  std::map<std::string, FullSyncLimits> parsed;
  for (auto it = limits.begin(); it != limits.end(); ++it) {
    if (!it.value().is_object()) {
      throw std::invalid_argument("full sync limits for '" + it.key() +
                                  "' must be an object");
    }
    FullSyncLimits entry;
    entry.chunkSize = readPositive(it.value(), it.key(), "chunk_size");
    entry.maxChunks = readPositive(it.value(), it.key(), "max_chunks");
    validate(it.key(), entry);
    parsed[it.key()] = entry;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  limits_ = std::move(parsed);
  Logger::info(LogCategory::CONFIG, "FullSyncSettings",
               "Loaded full sync limits for " +
                   std::to_string(limits_.size()) + " module(s)");
}

bool FullSyncSettings::loadFromDatabase(const std::string &connectionString) {
  std::string value;
  try {
    pqxx::connection conn(connectionString);
    pqxx::nontransaction txn(conn);
    auto result = txn.exec_params(
        "SELECT value FROM metadata.config WHERE key = $1", CONFIG_KEY);
    if (result.empty() || result[0][0].is_null()) {
      Logger::warning(LogCategory::CONFIG, "FullSyncSettings",
                      "metadata.config has no '" + std::string(CONFIG_KEY) +
                          "' entry");
      return false;
    }
    value = result[0][0].as<std::string>();
  } catch (const pqxx::failure &e) {
    throw StoreUnavailableError(e.what());
  }

  json parsed;
  try {
    parsed = json::parse(value);
  } catch (const json::parse_error &e) {
    throw std::invalid_argument("metadata.config '" +
                                std::string(CONFIG_KEY) +
                                "' is not valid JSON: " + e.what());
  }
  loadFromJson(parsed);
  return true;
}
