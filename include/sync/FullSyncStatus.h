#ifndef FULL_SYNC_STATUS_H
#define FULL_SYNC_STATUS_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

// Persisted progress of one module's full sync. lastSent is the cursor:
// every id at or above it has been transmitted. It stays empty until the
// driver starts the module, and the whole record is frozen once finished.
struct FullSyncStatus {
  std::optional<int64_t> lastSent;
  int64_t sent = 0;
  bool finished = false;

  nlohmann::json toJson() const;
  // Throws std::invalid_argument on a document that is not a status.
  static FullSyncStatus fromJson(const nlohmann::json &doc);

  bool operator==(const FullSyncStatus &other) const {
    return lastSent == other.lastSent && sent == other.sent &&
           finished == other.finished;
  }
  bool operator!=(const FullSyncStatus &other) const {
    return !(*this == other);
  }
};

#endif
