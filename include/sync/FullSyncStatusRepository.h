#ifndef FULL_SYNC_STATUS_REPOSITORY_H
#define FULL_SYNC_STATUS_REPOSITORY_H

#include "sync/FullSyncStatus.h"
#include <optional>
#include <string>

class IFullSyncStatusRepository {
public:
  virtual ~IFullSyncStatusRepository() = default;

  virtual std::optional<FullSyncStatus>
  load(const std::string &moduleName) = 0;
  // A finished status stays finished: saving over it is a no-op.
  virtual void save(const std::string &moduleName,
                    const FullSyncStatus &status) = 0;
  virtual void reset(const std::string &moduleName) = 0;
};

// Status rows in metadata.full_sync_status, one JSONB document per module.
// Errors propagate as StoreUnavailableError.
class FullSyncStatusRepository : public IFullSyncStatusRepository {
  std::string connectionString_;

public:
  explicit FullSyncStatusRepository(std::string connectionString);

  void ensureSchema();

  std::optional<FullSyncStatus> load(const std::string &moduleName) override;
  void save(const std::string &moduleName,
            const FullSyncStatus &status) override;
  void reset(const std::string &moduleName) override;
};

#endif
