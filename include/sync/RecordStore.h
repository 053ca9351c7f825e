#ifndef RECORD_STORE_H
#define RECORD_STORE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// The predicate a module hands to the store: which collection, which id
// column, and the filter selecting the records in scope.
struct RecordScope {
  std::string table;
  std::string idField;
  std::string where;
};

struct IdRange {
  int64_t min = 0;
  int64_t max = 0;

  bool operator==(const IdRange &other) const {
    return min == other.min && max == other.max;
  }
};

// Read-only id queries against the backing store. Implementations throw
// StoreUnavailableError when the store cannot answer.
class IRecordStore {
public:
  virtual ~IRecordStore() = default;

  // Up to limit ids matching scope that are strictly below
  // upperBoundExclusive, highest first.
  virtual std::vector<int64_t>
  queryIdsDescending(const RecordScope &scope, int64_t upperBoundExclusive,
                     size_t limit) = 0;

  // MIN and MAX over the first limit matching ids (ascending) above
  // lowerBoundExclusive. No bound and limit 0 mean the whole scope.
  // Empty when nothing matches.
  virtual std::optional<IdRange>
  queryMinMax(const RecordScope &scope,
              std::optional<int64_t> lowerBoundExclusive, size_t limit) = 0;

  virtual int64_t queryCount(const RecordScope &scope) = 0;
};

#endif
