#ifndef BATCH_PARTITIONER_H
#define BATCH_PARTITIONER_H

#include "sync/RecordStore.h"
#include "sync/SyncModule.h"
#include <optional>
#include <string>
#include <vector>

// Splits a module's matching id space into ascending {min, max} windows of
// at most batchSize matching ids each, for workers that extract in
// parallel. It shares no state with the driver and may run beside it;
// workers using the windows must not write the module's full sync status.
//
// The windows are an approximation, not an id enumeration. When a window
// query comes back empty before the running maximum reaches the global
// maximum (ids deleted mid-scan, or a filter that disagrees between the two
// queries), one last window is made up from the previous window's minimum to
// the global maximum. That window overlaps its predecessor and may span ids
// that no longer exist.
class BatchPartitioner {
  IRecordStore &store_;

public:
  explicit BatchPartitioner(IRecordStore &store) : store_(store) {}

  // whereSql is a SQL filter without the WHERE keyword; empty matches every
  // record. Returns std::nullopt when the module has no addressable
  // collection, and an empty list when nothing matches.
  std::optional<std::vector<IdRange>>
  partition(const SyncModule &module, size_t batchSize,
            const std::string &whereSql = "") const;

  // [{"min": .., "max": ..}, ...], or false for an unaddressable module.
  static json rangesToJson(const std::optional<std::vector<IdRange>> &ranges);
};

#endif
