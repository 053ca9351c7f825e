#include "sync/ChunkExtractor.h"
#include "sync/TableSyncModule.h"
#include "../support/test_doubles.h"
#include <cassert>
#include <iostream>
#include <limits>

namespace {

void testNextChunkIsDescendingBelowCursor() {
  std::cout << "Testing ChunkExtractor - next chunk below cursor...\n";

  InMemoryRecordStore store;
  store.addRange("posts", 1, 30);
  TableSyncModule module("posts", "posts");
  ChunkExtractor extractor(store);

  FullSyncStatus status;
  status.lastSent = 25;
  auto ids = extractor.nextChunk(module, json::object(), status, 4);
  assert(ids == std::vector<int64_t>({24, 23, 22, 21}));

  status.lastSent = 3;
  ids = extractor.nextChunk(module, json::object(), status, 4);
  assert(ids == std::vector<int64_t>({2, 1}));

  status.lastSent = 1;
  ids = extractor.nextChunk(module, json::object(), status, 4);
  assert(ids.empty());

  std::cout << "✓ ChunkExtractor descending test passed\n";
}

void testUnsetCursorUsesInitialLastSent() {
  std::cout << "Testing ChunkExtractor - unset cursor...\n";

  InMemoryRecordStore store;
  store.addRange("posts", 1, 5);
  store.tables["posts"].insert(std::numeric_limits<int64_t>::max() - 1);
  TableSyncModule module("posts", "posts");
  ChunkExtractor extractor(store);

  auto ids = extractor.nextChunk(module, json::object(), FullSyncStatus{}, 2);
  assert(ids.size() == 2);
  assert(ids[0] == std::numeric_limits<int64_t>::max() - 1);
  assert(ids[1] == 5);

  std::cout << "✓ ChunkExtractor unset cursor test passed\n";
}

void testZeroChunkSizeRejected() {
  std::cout << "Testing ChunkExtractor - zero chunk size...\n";

  InMemoryRecordStore store;
  TableSyncModule module("posts", "posts");
  ChunkExtractor extractor(store);

  bool threw = false;
  try {
    extractor.nextChunk(module, json::object(), FullSyncStatus{}, 0);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
  assert(store.idQueries == 0);

  std::cout << "✓ ChunkExtractor zero chunk size test passed\n";
}

void testStoreFailureSurfaces() {
  std::cout << "Testing ChunkExtractor - store failure...\n";

  InMemoryRecordStore store;
  store.addRange("posts", 1, 5);
  store.failuresRemaining = 1;
  TableSyncModule module("posts", "posts");
  ChunkExtractor extractor(store);

  bool threw = false;
  try {
    extractor.nextChunk(module, json::object(), FullSyncStatus{}, 2);
  } catch (const StoreUnavailableError &) {
    threw = true;
  }
  assert(threw);

  auto ids = extractor.nextChunk(module, json::object(), FullSyncStatus{}, 2);
  assert(ids == std::vector<int64_t>({5, 4}));

  std::cout << "✓ ChunkExtractor store failure test passed\n";
}

void testTotalCountsScope() {
  std::cout << "Testing ChunkExtractor - total...\n";

  InMemoryRecordStore store;
  store.addRange("posts", 1, 40);
  store.addFilter("(1=1) AND id IN (1,2,99)",
                  [](int64_t id) { return id == 1 || id == 2 || id == 99; });
  TableSyncModule module("posts", "posts");
  ChunkExtractor extractor(store);

  assert(extractor.total(module, json::object()) == 40);
  assert(extractor.total(module, json::array({1, 2, 99})) == 2);

  std::cout << "✓ ChunkExtractor total test passed\n";
}

void testChunksWithPrecedingEnd() {
  std::cout << "Testing ChunkExtractor - chunks with preceding end...\n";

  std::vector<std::vector<int64_t>> chunks = {{10, 9, 8}, {7, 6}, {3}};
  auto paired = ChunkExtractor::chunksWithPrecedingEnd(chunks, 11);

  assert(paired.size() == 3);
  assert(paired[0].previousEnd == 11);
  assert(paired[1].previousEnd == 8);
  assert(paired[2].previousEnd == 6);
  assert(paired[2].ids == std::vector<int64_t>({3}));
  assert(ChunkExtractor::chunksWithPrecedingEnd({}, 5).empty());

  std::cout << "✓ ChunkExtractor preceding end test passed\n";
}

} // namespace

int main() {
  testNextChunkIsDescendingBelowCursor();
  testUnsetCursorUsesInitialLastSent();
  testZeroChunkSizeRejected();
  testStoreFailureSurfaces();
  testTotalCountsScope();
  testChunksWithPrecedingEnd();

  std::cout << "\nAll ChunkExtractor tests passed\n";
  return 0;
}
