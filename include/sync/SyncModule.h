#ifndef SYNC_MODULE_H
#define SYNC_MODULE_H

#include "sync/RecordStore.h"
#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// Callback through which the surrounding orchestrator is told about
// actions a module wants to emit outside of a full sync.
using ActionHandler =
    std::function<void(const std::string &actionName, const json &data)>;

// Everything the full sync engine needs to know about one kind of entity.
// The extractor, partitioner and driver only ever talk to this interface.
class SyncModule {
public:
  virtual ~SyncModule() = default;

  virtual std::string name() const = 0;

  virtual std::string idField() const { return "id"; }

  // Empty when the entity kind has no addressable collection, in which case
  // it cannot be partitioned.
  virtual std::string tableName() const { return ""; }

  // SQL filter selecting the records in scope for the given full sync
  // configuration.
  virtual std::string whereClause(const json & /*config*/) const {
    return "1=1";
  }

  // Cursor value above every possible id.
  virtual int64_t initialLastSent() const;

  virtual std::string actionName() const { return "full_sync_" + name(); }
  virtual std::vector<std::string> fullSyncActions() const {
    return {actionName()};
  }

  virtual void initListeners(const ActionHandler & /*handler*/) {}

  virtual std::optional<json> getObjectById(const std::string & /*type*/,
                                            int64_t /*id*/) const {
    return std::nullopt;
  }

  // Objects that exist, keyed by id; ids without an object are skipped.
  std::map<int64_t, json> getObjectsById(const std::string &type,
                                         const std::vector<int64_t> &ids) const;

  RecordScope scope(const json &config) const;
  bool isAddressable() const { return !tableName().empty(); }

  // How many of actionNames occur in actionsToCount.
  static size_t countActions(const std::vector<std::string> &actionNames,
                             const std::vector<std::string> &actionsToCount);
};

#endif
