#include "core/full_sync_settings.h"
#include "core/sync_errors.h"
#include "sync/FullSyncDriver.h"
#include "sync/TableSyncModule.h"
#include "../support/test_doubles.h"
#include <cassert>
#include <iostream>
#include <limits>

namespace {

struct Fixture {
  InMemoryRecordStore store;
  RecordingTransportSender transport;
  FullSyncSettings settings;
  ManualClock clock;
  TableSyncModule module{"posts", "posts", "id"};
  FullSyncDriver driver{store, transport, settings, clock.fn()};

  Fixture(size_t chunkSize, size_t maxChunks) {
    settings.setLimits("posts", FullSyncLimits{chunkSize, maxChunks});
  }

  std::chrono::steady_clock::time_point ample() {
    return clock.now + std::chrono::hours(1);
  }
};

FullSyncStatus statusAt(int64_t lastSent, int64_t sent = 0) {
  FullSyncStatus status;
  status.lastSent = lastSent;
  status.sent = sent;
  return status;
}

std::vector<int64_t> descending(int64_t from, int64_t to) {
  std::vector<int64_t> ids;
  for (int64_t id = from; id >= to; --id)
    ids.push_back(id);
  return ids;
}

void testScenarioThreeChunksThenResume() {
  std::cout << "Testing FullSyncDriver - 100 ids, chunk 10, max 3...\n";

  Fixture f(10, 3);
  f.store.addRange("posts", 1, 100);

  FullSyncResult first = f.driver.sendFullSyncActions(
      f.module, json::object(), statusAt(101), f.ample());

  assert(f.transport.sent.size() == 3);
  assert(f.transport.sent[0].ids == descending(100, 91));
  assert(f.transport.sent[1].ids == descending(90, 81));
  assert(f.transport.sent[2].ids == descending(80, 71));
  assert(f.transport.sent[0].previousEnd == 101);
  assert(f.transport.sent[1].previousEnd == 91);
  assert(f.transport.sent[2].previousEnd == 81);
  assert(f.transport.sent[0].actionName == "full_sync_posts");

  assert(first.outcome == FullSyncOutcome::PAUSED_CHUNK_LIMIT);
  assert(first.status.lastSent == 71);
  assert(first.status.sent == 30);
  assert(!first.status.finished);
  assert(first.chunksSent == 3);

  FullSyncResult second = f.driver.sendFullSyncActions(
      f.module, json::object(), first.status, f.ample());
  assert(f.transport.sent.size() == 6);
  assert(f.transport.sent[3].previousEnd == 71);
  assert(f.transport.sent[3].ids == descending(70, 61));
  assert(second.status.lastSent == 41);
  assert(second.status.sent == 60);

  std::cout << "✓ FullSyncDriver scenario test passed\n";
}

void testRepeatedInvocationsCoverEveryIdOnce() {
  std::cout << "Testing FullSyncDriver - coverage across invocations...\n";

  Fixture f(7, 2);
  f.store.addRange("posts", 1, 100);

  FullSyncStatus status;
  int invocations = 0;
  while (!status.finished) {
    status = f.driver
                 .sendFullSyncActions(f.module, json::object(), status,
                                      f.ample())
                 .status;
    assert(++invocations < 100);
  }

  assert(f.transport.allIds() == descending(100, 1));
  assert(status.sent == 100);
  assert(status.lastSent == 1);

  std::cout << "✓ FullSyncDriver coverage test passed\n";
}

void testCursorStrictlyDecreases() {
  std::cout << "Testing FullSyncDriver - cursor monotonicity...\n";

  Fixture f(4, 50);
  f.store.addRange("posts", 1, 30);
  f.store.tables["posts"].erase(17);
  f.store.tables["posts"].erase(18);

  FullSyncResult result = f.driver.sendFullSyncActions(
      f.module, json::object(), FullSyncStatus{}, f.ample());
  assert(result.outcome == FullSyncOutcome::FINISHED);

  int64_t previous = std::numeric_limits<int64_t>::max();
  for (const auto &action : f.transport.sent) {
    assert(action.previousEnd == previous);
    for (int64_t id : action.ids)
      assert(id < action.previousEnd);
    assert(action.ids.back() < previous);
    previous = action.ids.back();
  }
  assert(result.status.sent == 28);

  std::cout << "✓ FullSyncDriver monotonicity test passed\n";
}

void testFailingTransportLeavesStatusUnchanged() {
  std::cout << "Testing FullSyncDriver - idempotent retry on failure...\n";

  Fixture f(10, 5);
  f.store.addRange("posts", 1, 100);
  f.transport.successesBeforeFailure = 0;

  FullSyncStatus initial = statusAt(55, 45);
  for (int i = 0; i < 3; ++i) {
    FullSyncResult result = f.driver.sendFullSyncActions(
        f.module, json::object(), initial, f.ample());
    assert(result.outcome == FullSyncOutcome::TRANSPORT_FAILED);
    assert(result.status == initial);
    assert(result.status.toJson().dump() == initial.toJson().dump());
  }
  assert(f.transport.attempts == 3);

  std::cout << "✓ FullSyncDriver failing transport test passed\n";
}

void testFailureMidRunKeepsAcknowledgedProgress() {
  std::cout << "Testing FullSyncDriver - failure after two chunks...\n";

  Fixture f(10, 5);
  f.store.addRange("posts", 1, 100);
  f.transport.successesBeforeFailure = 2;
  f.transport.throwOnFailure = true;

  FullSyncResult result = f.driver.sendFullSyncActions(
      f.module, json::object(), statusAt(101), f.ample());
  assert(result.outcome == FullSyncOutcome::TRANSPORT_FAILED);
  assert(result.status.lastSent == 81);
  assert(result.status.sent == 20);

  f.transport.successesBeforeFailure = -1;
  result = f.driver.sendFullSyncActions(f.module, json::object(),
                                        result.status, f.ample());
  assert(f.transport.sent[2].ids == descending(80, 71));

  std::cout << "✓ FullSyncDriver mid-run failure test passed\n";
}

void testDeadlineStopsBeforeNextTransmission() {
  std::cout << "Testing FullSyncDriver - wall clock budget...\n";

  Fixture f(10, 100);
  f.store.addRange("posts", 1, 100);
  f.transport.onSend = [&f]() {
    f.clock.advance(std::chrono::milliseconds(10));
  };
  auto deadline = f.clock.now + std::chrono::milliseconds(25);

  FullSyncResult result = f.driver.sendFullSyncActions(
      f.module, json::object(), statusAt(101), deadline);
  assert(result.outcome == FullSyncOutcome::PAUSED_DEADLINE);
  assert(f.transport.sent.size() == 3);
  assert(result.status.lastSent == 71);

  FullSyncStatus before = result.status;
  result = f.driver.sendFullSyncActions(f.module, json::object(), before,
                                        deadline);
  assert(result.outcome == FullSyncOutcome::PAUSED_DEADLINE);
  assert(f.transport.attempts == 3);
  assert(result.status == before);

  std::cout << "✓ FullSyncDriver deadline test passed\n";
}

void testFinishedStatusIsFrozen() {
  std::cout << "Testing FullSyncDriver - finished status untouched...\n";

  Fixture f(10, 3);
  f.store.addRange("posts", 1, 20);

  FullSyncResult result = f.driver.sendFullSyncActions(
      f.module, json::object(), statusAt(101), f.ample());
  assert(result.outcome == FullSyncOutcome::FINISHED);
  assert(result.status.finished);
  assert(result.status.sent == 20);
  assert(result.status.lastSent == 1);

  size_t queries = f.store.idQueries;
  FullSyncResult again = f.driver.sendFullSyncActions(
      f.module, json::object(), result.status, f.ample());
  assert(again.outcome == FullSyncOutcome::ALREADY_FINISHED);
  assert(again.status == result.status);
  assert(f.store.idQueries == queries);

  std::cout << "✓ FullSyncDriver finished status test passed\n";
}

void testUnsetCursorStartsAboveAllIds() {
  std::cout << "Testing FullSyncDriver - unset cursor...\n";

  Fixture f(5, 1);
  f.store.addRange("posts", 1, 12);

  FullSyncResult result = f.driver.sendFullSyncActions(
      f.module, json::object(), FullSyncStatus{}, f.ample());
  assert(f.transport.sent.size() == 1);
  assert(f.transport.sent[0].previousEnd ==
         std::numeric_limits<int64_t>::max());
  assert(f.transport.sent[0].ids == descending(12, 8));
  assert(result.status.lastSent == 8);

  std::cout << "✓ FullSyncDriver unset cursor test passed\n";
}

void testEmptyScopeFinishesImmediately() {
  std::cout << "Testing FullSyncDriver - nothing in scope...\n";

  Fixture f(10, 3);
  FullSyncResult result = f.driver.sendFullSyncActions(
      f.module, json::object(), FullSyncStatus{}, f.ample());
  assert(result.outcome == FullSyncOutcome::FINISHED);
  assert(result.status.finished);
  assert(result.status.sent == 0);
  assert(f.transport.attempts == 0);

  std::cout << "✓ FullSyncDriver empty scope test passed\n";
}

void testConfigSelectsIds() {
  std::cout << "Testing FullSyncDriver - config narrows the scope...\n";

  Fixture f(2, 10);
  f.store.addRange("posts", 1, 50);
  f.store.addFilter("(1=1) AND id IN (3,10,42)", [](int64_t id) {
    return id == 3 || id == 10 || id == 42;
  });

  FullSyncResult result = f.driver.sendFullSyncActions(
      f.module, json::array({3, 10, 42}), FullSyncStatus{}, f.ample());
  assert(result.status.finished);
  assert(f.transport.allIds() == std::vector<int64_t>({42, 10, 3}));
  assert(result.status.sent == 3);

  std::cout << "✓ FullSyncDriver config scope test passed\n";
}

void testMissingLimitsIsFatal() {
  std::cout << "Testing FullSyncDriver - missing limits...\n";

  Fixture f(10, 3);
  f.store.addRange("comments", 1, 10);
  TableSyncModule comments("comments", "comments");

  bool threw = false;
  try {
    f.driver.sendFullSyncActions(comments, json::object(), statusAt(101),
                                 f.ample());
  } catch (const ConfigurationMissingError &e) {
    threw = true;
    assert(e.moduleName() == "comments");
  }
  assert(threw);
  assert(f.transport.attempts == 0);
  assert(f.store.idQueries == 0);

  std::cout << "✓ FullSyncDriver missing limits test passed\n";
}

void testStoreFailureBeforeFirstSendPropagates() {
  std::cout << "Testing FullSyncDriver - store failure on first fetch...\n";

  Fixture f(10, 5);
  f.store.addRange("posts", 1, 100);
  f.store.failuresRemaining = 1;

  FullSyncStatus initial = statusAt(101);
  bool threw = false;
  try {
    f.driver.sendFullSyncActions(f.module, json::object(), initial,
                                 f.ample());
  } catch (const StoreUnavailableError &) {
    threw = true;
  }
  assert(threw);
  assert(f.transport.attempts == 0);
  assert(initial.lastSent == 101);
  assert(initial.sent == 0);

  std::cout << "✓ FullSyncDriver first fetch failure test passed\n";
}

void testStoreFailureMidRunKeepsAcknowledgedProgress() {
  std::cout << "Testing FullSyncDriver - store failure after two chunks...\n";

  Fixture f(10, 5);
  f.store.addRange("posts", 1, 100);
  f.transport.onSend = [&f]() {
    if (f.transport.attempts == 2)
      f.store.failuresRemaining = 1;
  };

  FullSyncResult result = f.driver.sendFullSyncActions(
      f.module, json::object(), statusAt(101), f.ample());
  assert(result.outcome == FullSyncOutcome::STORE_FAILED);
  assert(!result.error.empty());
  assert(f.transport.sent.size() == 2);
  assert(result.chunksSent == 2);
  assert(result.status.lastSent == 81);
  assert(result.status.sent == 20);
  assert(!result.status.finished);

  f.transport.onSend = nullptr;
  result = f.driver.sendFullSyncActions(f.module, json::object(),
                                        result.status, f.ample());
  assert(f.transport.sent[2].previousEnd == 81);
  assert(f.transport.sent[2].ids == descending(80, 71));
  assert(result.status.lastSent == 31);
  assert(result.status.sent == 70);

  std::vector<int64_t> all = f.transport.allIds();
  assert(all == descending(100, 31));

  std::cout << "✓ FullSyncDriver mid-run store failure test passed\n";
}

} // namespace

int main() {
  testScenarioThreeChunksThenResume();
  testRepeatedInvocationsCoverEveryIdOnce();
  testCursorStrictlyDecreases();
  testFailingTransportLeavesStatusUnchanged();
  testFailureMidRunKeepsAcknowledgedProgress();
  testDeadlineStopsBeforeNextTransmission();
  testFinishedStatusIsFrozen();
  testUnsetCursorStartsAboveAllIds();
  testEmptyScopeFinishesImmediately();
  testConfigSelectsIds();
  testMissingLimitsIsFatal();
  testStoreFailureBeforeFirstSendPropagates();
  testStoreFailureMidRunKeepsAcknowledgedProgress();

  std::cout << "\nAll FullSyncDriver tests passed\n";
  return 0;
}
