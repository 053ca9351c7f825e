#include "sync/SyncModuleLock.h"
#include "core/logger.h"
#include "core/sync_errors.h"
#include <chrono>
#include <pqxx/pqxx>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace {
constexpr int LOCK_RETRY_SLEEP_MS = 500;
constexpr int MIN_LOCK_TIMEOUT_SECONDS = 1;
constexpr int MAX_LOCK_TIMEOUT_SECONDS = 3600;
} // namespace

SyncModuleLock::SyncModuleLock(std::string connectionString,
                               const std::string &moduleName,
                               int lockTimeoutSeconds)
    : connectionString_(std::move(connectionString)),
      lockName_("full_sync:" + moduleName), sessionId_(generateSessionId()),
      acquired_(false), lockTimeoutSeconds_(lockTimeoutSeconds) {
  if (lockTimeoutSeconds_ < MIN_LOCK_TIMEOUT_SECONDS ||
      lockTimeoutSeconds_ > MAX_LOCK_TIMEOUT_SECONDS) {
    throw std::invalid_argument(
        "lock timeout must be between " +
        std::to_string(MIN_LOCK_TIMEOUT_SECONDS) + " and " +
        std::to_string(MAX_LOCK_TIMEOUT_SECONDS) + " seconds");
  }
}

SyncModuleLock::~SyncModuleLock() {
  if (acquired_) {
    try {
      release();
    } catch (const std::exception &e) {
      Logger::error(LogCategory::DATABASE, "SyncModuleLock",
                    "Error releasing " + lockName_ +
                        " in destructor: " + std::string(e.what()));
    }
  }
}

void SyncModuleLock::ensureSchema(const std::string &connectionString) {
  try {
    pqxx::connection conn(connectionString);
    pqxx::work txn(conn);
    txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
    txn.exec("CREATE TABLE IF NOT EXISTS metadata.full_sync_locks ("
             "lock_name TEXT PRIMARY KEY, "
             "session_id TEXT NOT NULL, "
             "acquired_by TEXT NOT NULL, "
             "acquired_at TIMESTAMPTZ NOT NULL DEFAULT NOW(), "
             "expires_at TIMESTAMPTZ NOT NULL)");
    txn.commit();
  } catch (const pqxx::failure &e) {
    throw StoreUnavailableError(e.what());
  }
}

// Expired rows are cleared first; the insert then only succeeds when no live
// row exists for this module. Retries every LOCK_RETRY_SLEEP_MS until
// maxWaitSeconds have passed.
bool SyncModuleLock::tryAcquire(int maxWaitSeconds) {
  if (acquired_) {
    return true;
  }

  auto startTime = std::chrono::steady_clock::now();
  const std::string hostname = getHostname();

  while (true) {
    try {
      pqxx::connection conn(connectionString_);
      pqxx::work txn(conn);

      txn.exec_params("DELETE FROM metadata.full_sync_locks "
                      "WHERE lock_name = $1 AND expires_at < NOW()",
                      lockName_);

      auto result = txn.exec_params(
          "INSERT INTO metadata.full_sync_locks "
          "(lock_name, session_id, acquired_by, expires_at) "
          "VALUES ($1, $2, $3, NOW() + make_interval(secs => $4)) "
          "ON CONFLICT (lock_name) DO NOTHING RETURNING lock_name",
          lockName_, sessionId_, hostname, lockTimeoutSeconds_);
      txn.commit();

      if (!result.empty()) {
        acquired_ = true;
        Logger::info(LogCategory::DATABASE, "SyncModuleLock",
                     "Acquired " + lockName_ + " (session " + sessionId_ +
                         ", host " + hostname + ")");
        return true;
      }
    } catch (const pqxx::failure &e) {
      Logger::error(LogCategory::DATABASE, "SyncModuleLock",
                    "Error acquiring " + lockName_ + ": " + e.what());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::steady_clock::now() - startTime)
                       .count();
    if (elapsed >= maxWaitSeconds) {
      Logger::warning(LogCategory::DATABASE, "SyncModuleLock",
                      "Gave up on " + lockName_ + " after " +
                          std::to_string(elapsed) + " seconds");
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(LOCK_RETRY_SLEEP_MS));
  }
}

void SyncModuleLock::release() {
  if (!acquired_) {
    return;
  }

  pqxx::result result;
  try {
    pqxx::connection conn(connectionString_);
    pqxx::work txn(conn);
    result = txn.exec_params("DELETE FROM metadata.full_sync_locks "
                             "WHERE lock_name = $1 AND session_id = $2",
                             lockName_, sessionId_);
    txn.commit();
  } catch (const pqxx::failure &e) {
    throw StoreUnavailableError("releasing " + lockName_ + ": " + e.what());
  }
  acquired_ = false;

  if (result.affected_rows() == 0) {
    Logger::warning(LogCategory::DATABASE, "SyncModuleLock",
                    lockName_ + " had already expired when released");
    return;
  }
  Logger::debug(LogCategory::DATABASE, "SyncModuleLock",
                "Released " + lockName_);
}

std::string SyncModuleLock::generateSessionId() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<uint64_t> dis;

  std::ostringstream oss;
  oss << std::hex << dis(gen);
  return oss.str();
}

std::string SyncModuleLock::getHostname() {
  char hostname[256];
  hostname[255] = '\0';
  if (gethostname(hostname, sizeof(hostname) - 1) == 0 && hostname[0] != '\0') {
    return std::string(hostname);
  }
  return "unknown";
}
