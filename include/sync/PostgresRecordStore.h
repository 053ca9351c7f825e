#ifndef POSTGRES_RECORD_STORE_H
#define POSTGRES_RECORD_STORE_H

#include "sync/RecordStore.h"
#include <memory>
#include <pqxx/pqxx>
#include <string>

// IRecordStore over a PostgreSQL database. Keeps one connection open across
// calls and reopens it after a failure. Not thread-safe; give each worker
// its own instance.
class PostgresRecordStore : public IRecordStore {
  std::string connectionString_;
  std::unique_ptr<pqxx::connection> conn_;

public:
  explicit PostgresRecordStore(std::string connectionString);

  std::vector<int64_t> queryIdsDescending(const RecordScope &scope,
                                          int64_t upperBoundExclusive,
                                          size_t limit) override;
  std::optional<IdRange>
  queryMinMax(const RecordScope &scope,
              std::optional<int64_t> lowerBoundExclusive,
              size_t limit) override;
  int64_t queryCount(const RecordScope &scope) override;

private:
  pqxx::connection &getConnection();
  [[noreturn]] void fail(const std::string &operation,
                         const RecordScope &scope, const std::exception &e);
};

#endif
