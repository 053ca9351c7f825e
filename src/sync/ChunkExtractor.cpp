#include "sync/ChunkExtractor.h"
#include "core/logger.h"
#include "core/sync_errors.h"
#include <stdexcept>

std::vector<int64_t> ChunkExtractor::nextChunk(const SyncModule &module,
                                               const json &config,
                                               const FullSyncStatus &status,
                                               size_t chunkSize) const {
  if (chunkSize == 0) {
    throw std::invalid_argument("chunk size for module '" + module.name() +
                                "' must be greater than zero");
  }

  int64_t cursor = status.lastSent ? *status.lastSent : module.initialLastSent();

  try {
    return store_.queryIdsDescending(module.scope(config), cursor, chunkSize);
  } catch (const StoreUnavailableError &e) {
    Logger::error(LogCategory::DATABASE, "ChunkExtractor",
                  "Fetching chunk below " + std::to_string(cursor) +
                      " for module '" + module.name() +
                      "' failed: " + e.what());
    throw;
  }
}

int64_t ChunkExtractor::total(const SyncModule &module,
                              const json &config) const {
  return store_.queryCount(module.scope(config));
}

// Chunks are descending, so each one's preceding end is the smallest id of
// the chunk before it.
std::vector<ChunkWithPrecedingEnd> ChunkExtractor::chunksWithPrecedingEnd(
    const std::vector<std::vector<int64_t>> &chunks, int64_t previousEnd) {
  std::vector<ChunkWithPrecedingEnd> result;
  result.reserve(chunks.size());

  for (const auto &chunk : chunks) {
    result.push_back({chunk, previousEnd});
    if (!chunk.empty()) {
      previousEnd = chunk.back();
    }
  }
  return result;
}
