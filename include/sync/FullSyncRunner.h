#ifndef FULL_SYNC_RUNNER_H
#define FULL_SYNC_RUNNER_H

#include "sync/FullSyncDriver.h"
#include "sync/FullSyncStatusRepository.h"
#include "sync/SyncModuleLock.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

struct ModuleRunReport {
  std::string moduleName;
  bool ran = false;
  FullSyncOutcome outcome = FullSyncOutcome::PAUSED_DEADLINE;
  FullSyncStatus status;
  std::string error;
};

// One time-boxed pass over every registered module: load its status, skip
// it when finished, take its lock, drive it, persist the new status. A
// failing module is reported and the pass moves on to the next one.
class FullSyncRunner {
  struct RegisteredModule {
    std::shared_ptr<SyncModule> module;
    json config;
  };

  FullSyncDriver &driver_;
  IFullSyncStatusRepository &statusRepository_;
  ModuleLockFactory lockFactory_;
  ActionHandler listener_;
  FullSyncDriver::Clock clock_;
  std::vector<RegisteredModule> modules_;

public:
  FullSyncRunner(FullSyncDriver &driver,
                 IFullSyncStatusRepository &statusRepository,
                 ModuleLockFactory lockFactory, ActionHandler listener = {},
                 FullSyncDriver::Clock clock = std::chrono::steady_clock::now);

  void registerModule(std::shared_ptr<SyncModule> module,
                      json config = json::object());
  std::shared_ptr<SyncModule> findModule(const std::string &name) const;

  std::vector<ModuleRunReport>
  runOnce(std::chrono::steady_clock::time_point sendUntil);

  // True once every registered module has a finished status.
  bool allFinished();

private:
  ModuleRunReport runModule(const RegisteredModule &entry,
                            std::chrono::steady_clock::time_point sendUntil);
};

#endif
