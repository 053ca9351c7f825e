#include "sync/PostgresRecordStore.h"
#include "core/logger.h"
#include "core/sync_errors.h"
#include "utils/string_utils.h"
#include <stdexcept>

namespace {
void checkScope(const RecordScope &scope) {
  if (!StringUtils::isSafeIdentifier(scope.table)) {
    throw std::invalid_argument("invalid table name: '" + scope.table + "'");
  }
  if (!StringUtils::isSafeIdentifier(scope.idField)) {
    throw std::invalid_argument("invalid id field: '" + scope.idField + "'");
  }
}

std::string whereOf(const RecordScope &scope) {
  return scope.where.empty() ? "1=1" : scope.where;
}
} // namespace

PostgresRecordStore::PostgresRecordStore(std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

pqxx::connection &PostgresRecordStore::getConnection() {
  if (!conn_ || !conn_->is_open()) {
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
  }
  return *conn_;
}

void PostgresRecordStore::fail(const std::string &operation,
                               const RecordScope &scope,
                               const std::exception &e) {
  conn_.reset();
  Logger::error(LogCategory::DATABASE, "PostgresRecordStore",
                operation + " on " + scope.table + " failed: " + e.what());
  throw StoreUnavailableError(e.what());
}

// SELECT id FROM t WHERE (filter) AND id < cursor ORDER BY id DESC LIMIT n
std::vector<int64_t>
PostgresRecordStore::queryIdsDescending(const RecordScope &scope,
                                        int64_t upperBoundExclusive,
                                        size_t limit) {
  checkScope(scope);
  std::vector<int64_t> ids;

  const std::string sql = "SELECT " + scope.idField + " FROM " + scope.table +
                          " WHERE (" + whereOf(scope) + ") AND " +
                          scope.idField + " < $1 ORDER BY " + scope.idField +
                          " DESC LIMIT $2";
  try {
    pqxx::nontransaction txn(getConnection());
    auto results = txn.exec_params(sql, upperBoundExclusive,
                                   static_cast<int64_t>(limit));
    ids.reserve(results.size());
    for (const auto &row : results) {
      ids.push_back(row[0].as<int64_t>());
    }
  } catch (const pqxx::failure &e) {
    fail("queryIdsDescending", scope, e);
  }
  return ids;
}

// MIN/MAX are taken over an ordered, limited subquery so that a window
// covers exactly the next limit matching ids.
std::optional<IdRange>
PostgresRecordStore::queryMinMax(const RecordScope &scope,
                                 std::optional<int64_t> lowerBoundExclusive,
                                 size_t limit) {
  checkScope(scope);

  std::string inner = "SELECT " + scope.idField + " AS id FROM " +
                      scope.table + " WHERE (" + whereOf(scope) + ")";
  if (lowerBoundExclusive) {
    inner += " AND " + scope.idField + " > " +
             std::to_string(*lowerBoundExclusive);
  }
  if (limit > 0) {
    inner += " ORDER BY " + scope.idField + " ASC LIMIT " +
             std::to_string(limit);
  }
  const std::string sql =
      "SELECT MIN(id), MAX(id) FROM (" + inner + ") AS ids";

  try {
    pqxx::nontransaction txn(getConnection());
    auto results = txn.exec(sql);
    if (results.empty() || results[0][0].is_null() ||
        results[0][1].is_null()) {
      return std::nullopt;
    }
    IdRange range;
    range.min = results[0][0].as<int64_t>();
    range.max = results[0][1].as<int64_t>();
    return range;
  } catch (const pqxx::failure &e) {
    fail("queryMinMax", scope, e);
  }
}

int64_t PostgresRecordStore::queryCount(const RecordScope &scope) {
  checkScope(scope);
  const std::string sql =
      "SELECT COUNT(*) FROM " + scope.table + " WHERE " + whereOf(scope);

  try {
    pqxx::nontransaction txn(getConnection());
    auto results = txn.exec(sql);
    return results[0][0].as<int64_t>();
  } catch (const pqxx::failure &e) {
    fail("queryCount", scope, e);
  }
}
