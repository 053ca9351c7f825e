#include "sync/FullSyncRunner.h"
#include "core/logger.h"
#include "core/sync_errors.h"
#include <stdexcept>

namespace {
constexpr int LOCK_WAIT_SECONDS = 5;
}

FullSyncRunner::FullSyncRunner(FullSyncDriver &driver,
                               IFullSyncStatusRepository &statusRepository,
                               ModuleLockFactory lockFactory,
                               ActionHandler listener,
                               FullSyncDriver::Clock clock)
    : driver_(driver), statusRepository_(statusRepository),
      lockFactory_(std::move(lockFactory)), listener_(std::move(listener)),
      clock_(std::move(clock)) {}

void FullSyncRunner::registerModule(std::shared_ptr<SyncModule> module,
                                    json config) {
  if (!module) {
    throw std::invalid_argument("cannot register a null sync module");
  }
  if (findModule(module->name())) {
    throw std::invalid_argument("sync module '" + module->name() +
                                "' is already registered");
  }
  if (listener_) {
    module->initListeners(listener_);
  }
  modules_.push_back({std::move(module), std::move(config)});
}

std::shared_ptr<SyncModule>
FullSyncRunner::findModule(const std::string &name) const {
  for (const auto &entry : modules_) {
    if (entry.module->name() == name) {
      return entry.module;
    }
  }
  return nullptr;
}

std::vector<ModuleRunReport>
FullSyncRunner::runOnce(std::chrono::steady_clock::time_point sendUntil) {
  std::vector<ModuleRunReport> reports;

  for (const auto &entry : modules_) {
    if (clock_() >= sendUntil) {
      Logger::info(LogCategory::SYNC, "FullSyncRunner",
                   "Time budget spent, leaving remaining modules for the "
                   "next run");
      break;
    }
    reports.push_back(runModule(entry, sendUntil));
  }
  return reports;
}

ModuleRunReport
FullSyncRunner::runModule(const RegisteredModule &entry,
                          std::chrono::steady_clock::time_point sendUntil) {
  ModuleRunReport report;
  report.moduleName = entry.module->name();

  try {
    FullSyncStatus before;
    if (auto stored = statusRepository_.load(report.moduleName)) {
      before = *stored;
    }
    report.status = before;

    if (before.finished) {
      report.outcome = FullSyncOutcome::ALREADY_FINISHED;
      return report;
    }

    std::unique_ptr<IModuleLock> lock = lockFactory_(report.moduleName);
    if (!lock || !lock->tryAcquire(LOCK_WAIT_SECONDS)) {
      report.error = "module is locked by another run";
      Logger::warning(LogCategory::SYNC, "FullSyncRunner",
                      "Skipping '" + report.moduleName + "': " + report.error);
      return report;
    }

    FullSyncResult result = driver_.sendFullSyncActions(
        *entry.module, entry.config, before, sendUntil);
    report.ran = true;
    report.outcome = result.outcome;
    report.status = result.status;

    if (result.outcome == FullSyncOutcome::STORE_FAILED) {
      report.error = result.error;
    }

    if (result.status != before) {
      statusRepository_.save(report.moduleName, result.status);
    }
    lock->release();

    Logger::info(LogCategory::SYNC, "FullSyncRunner",
                 "Module '" + report.moduleName + "': " +
                     fullSyncOutcomeToString(result.outcome) + ", " +
                     std::to_string(result.idsSent) + " record(s) in " +
                     std::to_string(result.chunksSent) + " chunk(s), " +
                     std::to_string(result.status.sent) + " in total");
  } catch (const ConfigurationMissingError &e) {
    report.error = e.what();
    Logger::error(LogCategory::CONFIG, "FullSyncRunner", report.error);
  } catch (const StoreUnavailableError &e) {
    report.error = e.what();
    Logger::error(LogCategory::DATABASE, "FullSyncRunner",
                  "Module '" + report.moduleName + "': " + report.error);
  } catch (const std::exception &e) {
    report.error = e.what();
    Logger::error(LogCategory::SYNC, "FullSyncRunner",
                  "Module '" + report.moduleName + "' failed: " +
                      report.error);
  }
  return report;
}

bool FullSyncRunner::allFinished() {
  for (const auto &entry : modules_) {
    auto status = statusRepository_.load(entry.module->name());
    if (!status || !status->finished) {
      return false;
    }
  }
  return true;
}
