#include "sync/SyncModule.h"
#include <algorithm>
#include <limits>

int64_t SyncModule::initialLastSent() const {
  return std::numeric_limits<int64_t>::max();
}

std::map<int64_t, json>
SyncModule::getObjectsById(const std::string &type,
                           const std::vector<int64_t> &ids) const {
  std::map<int64_t, json> objects;
  if (type.empty() || ids.empty()) {
    return objects;
  }

  for (int64_t id : ids) {
    auto object = getObjectById(type, id);
    if (object) {
      objects[id] = std::move(*object);
    }
  }
  return objects;
}

RecordScope SyncModule::scope(const json &config) const {
  RecordScope result;
  result.table = tableName();
  result.idField = idField();
  result.where = whereClause(config);
  return result;
}

// Number of entries in actionNames that also appear in actionsToCount.
size_t
SyncModule::countActions(const std::vector<std::string> &actionNames,
                         const std::vector<std::string> &actionsToCount) {
  return static_cast<size_t>(
      std::count_if(actionNames.begin(), actionNames.end(),
                    [&actionsToCount](const std::string &action) {
                      return std::find(actionsToCount.begin(),
                                       actionsToCount.end(),
                                       action) != actionsToCount.end();
                    }));
}
