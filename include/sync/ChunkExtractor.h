#ifndef CHUNK_EXTRACTOR_H
#define CHUNK_EXTRACTOR_H

#include "sync/FullSyncStatus.h"
#include "sync/RecordStore.h"
#include "sync/SyncModule.h"
#include <cstdint>
#include <vector>

struct ChunkWithPrecedingEnd {
  std::vector<int64_t> ids;
  int64_t previousEnd = 0;
};

// Reads the next descending slice of a module's ids below the status cursor.
// Never writes anything; store failures surface as StoreUnavailableError.
class ChunkExtractor {
  IRecordStore &store_;

public:
  explicit ChunkExtractor(IRecordStore &store) : store_(store) {}

  // An empty result means the traversal is complete. A status without a
  // cursor starts from the module's initial cursor.
  std::vector<int64_t> nextChunk(const SyncModule &module, const json &config,
                                 const FullSyncStatus &status,
                                 size_t chunkSize) const;

  int64_t total(const SyncModule &module, const json &config) const;

  static std::vector<ChunkWithPrecedingEnd>
  chunksWithPrecedingEnd(const std::vector<std::vector<int64_t>> &chunks,
                         int64_t previousEnd);
};

#endif
