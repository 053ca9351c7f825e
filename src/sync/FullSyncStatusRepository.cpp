#include "sync/FullSyncStatusRepository.h"
#include "core/logger.h"
#include "core/sync_errors.h"
#include "utils/json_utils.h"
#include <pqxx/pqxx>

FullSyncStatusRepository::FullSyncStatusRepository(std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

void FullSyncStatusRepository::ensureSchema() {
  try {
    pqxx::connection conn(connectionString_);
    pqxx::work txn(conn);
    txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
    txn.exec("CREATE TABLE IF NOT EXISTS metadata.full_sync_status ("
             "module_name TEXT PRIMARY KEY, "
             "status JSONB NOT NULL, "
             "updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW())");
    txn.commit();
  } catch (const pqxx::failure &e) {
    throw StoreUnavailableError(e.what());
  }
}

std::optional<FullSyncStatus>
FullSyncStatusRepository::load(const std::string &moduleName) {
  nlohmann::json doc;
  try {
    pqxx::connection conn(connectionString_);
    pqxx::nontransaction txn(conn);
    auto results = txn.exec_params(
        "SELECT status::text FROM metadata.full_sync_status "
        "WHERE module_name = $1",
        moduleName);
    if (results.empty()) {
      return std::nullopt;
    }
    doc = JsonUtils::parseJSONField(results[0], 0);
  } catch (const pqxx::failure &e) {
    Logger::error(LogCategory::DATABASE, "FullSyncStatusRepository",
                  "Error loading status of '" + moduleName +
                      "': " + std::string(e.what()));
    throw StoreUnavailableError(e.what());
  }

  if (doc.is_null()) {
    Logger::warning(LogCategory::DATABASE, "FullSyncStatusRepository",
                    "Unreadable status for '" + moduleName +
                        "', starting over");
    return std::nullopt;
  }
  return FullSyncStatus::fromJson(doc);
}

// The upsert refuses to touch a row whose stored status is already
// finished, so a stale writer cannot reopen a completed module.
void FullSyncStatusRepository::save(const std::string &moduleName,
                                    const FullSyncStatus &status) {
  try {
    pqxx::connection conn(connectionString_);
    pqxx::work txn(conn);
    txn.exec_params(
        "INSERT INTO metadata.full_sync_status (module_name, status) "
        "VALUES ($1, $2::jsonb) "
        "ON CONFLICT (module_name) DO UPDATE "
        "SET status = EXCLUDED.status, updated_at = NOW() "
        "WHERE NOT COALESCE((metadata.full_sync_status.status->>'finished')"
        "::boolean, false)",
        moduleName, status.toJson().dump());
    txn.commit();
  } catch (const pqxx::failure &e) {
    Logger::error(LogCategory::DATABASE, "FullSyncStatusRepository",
                  "Error saving status of '" + moduleName +
                      "': " + std::string(e.what()));
    throw StoreUnavailableError(e.what());
  }
}

void FullSyncStatusRepository::reset(const std::string &moduleName) {
  try {
    pqxx::connection conn(connectionString_);
    pqxx::work txn(conn);
    txn.exec_params(
        "DELETE FROM metadata.full_sync_status WHERE module_name = $1",
        moduleName);
    txn.commit();
    Logger::info(LogCategory::DATABASE, "FullSyncStatusRepository",
                 "Reset full sync status of '" + moduleName + "'");
  } catch (const pqxx::failure &e) {
    throw StoreUnavailableError(e.what());
  }
}
