#ifndef FULL_SYNC_SETTINGS_H
#define FULL_SYNC_SETTINGS_H

#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

struct FullSyncLimits {
  size_t chunkSize = 0;
  size_t maxChunks = 0;
};

// Per-module transmission limits. There are no defaults: a
// module without an entry cannot be synced and limitsFor() throws
// ConfigurationMissingError.
class FullSyncSettings {
public:
  static constexpr size_t MIN_CHUNK_SIZE = 1;
  static constexpr size_t MAX_CHUNK_SIZE = 100000;
  static constexpr size_t MIN_MAX_CHUNKS = 1;
  static constexpr size_t MAX_MAX_CHUNKS = 10000;

  static constexpr const char *CONFIG_KEY = "full_sync_limits";

  // Throws std::invalid_argument when either value is out of range.
  static void validate(const std::string &moduleName,
                       const FullSyncLimits &limits);

  void setLimits(const std::string &moduleName, const FullSyncLimits &limits);
  FullSyncLimits limitsFor(const std::string &moduleName) const;
  bool hasLimits(const std::string &moduleName) const;
  void clear();

  // {"posts": {"chunk_size": 100, "max_chunks": 10}, ...}. Entries are
  // validated before any of them replaces the current table.
  void loadFromJson(const nlohmann::json &limits);

  // Reads the JSON stored under metadata.config key 'full_sync_limits'.
  // Returns false, leaving the current limits as they are, when the row is
  // missing; database errors propagate as StoreUnavailableError.
  bool loadFromDatabase(const std::string &connectionString);

private:
  mutable std::mutex mutex_;
  std::map<std::string, FullSyncLimits> limits_;
};

#endif
