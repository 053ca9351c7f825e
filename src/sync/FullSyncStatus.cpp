#include "sync/FullSyncStatus.h"
#include <stdexcept>

using json = nlohmann::json;

json FullSyncStatus::toJson() const {
  json doc;
  if (lastSent) {
    doc["last_sent"] = *lastSent;
  } else {
    doc["last_sent"] = nullptr;
  }
  doc["sent"] = sent;
  doc["finished"] = finished;
  return doc;
}

FullSyncStatus FullSyncStatus::fromJson(const json &doc) {
  if (!doc.is_object()) {
    throw std::invalid_argument("full sync status must be a JSON object");
  }

  FullSyncStatus status;
  if (doc.contains("last_sent") && !doc["last_sent"].is_null()) {
    if (!doc["last_sent"].is_number_integer()) {
      throw std::invalid_argument("full sync status 'last_sent' must be an "
                                  "integer or null");
    }
    status.lastSent = doc["last_sent"].get<int64_t>();
  }

  if (doc.contains("sent")) {
    if (!doc["sent"].is_number_integer() || doc["sent"].get<int64_t>() < 0) {
      throw std::invalid_argument("full sync status 'sent' must be a "
                                  "non-negative integer");
    }
    status.sent = doc["sent"].get<int64_t>();
  }

  status.finished = doc.value("finished", false);
  return status;
}
