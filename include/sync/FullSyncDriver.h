#ifndef FULL_SYNC_DRIVER_H
#define FULL_SYNC_DRIVER_H

#include "core/full_sync_settings.h"
#include "sync/ChunkExtractor.h"
#include "sync/FullSyncStatus.h"
#include "sync/SyncModule.h"
#include "sync/TransportSender.h"
#include <chrono>
#include <functional>
#include <string>

enum class FullSyncOutcome {
  FINISHED,
  ALREADY_FINISHED,
  PAUSED_CHUNK_LIMIT,
  PAUSED_DEADLINE,
  TRANSPORT_FAILED,
  STORE_FAILED
};

std::string fullSyncOutcomeToString(FullSyncOutcome outcome);

struct FullSyncResult {
  FullSyncStatus status;
  FullSyncOutcome outcome = FullSyncOutcome::PAUSED_DEADLINE;
  size_t chunksSent = 0;
  int64_t idsSent = 0;
  // Set for TRANSPORT_FAILED and STORE_FAILED.
  std::string error;
};

// Sends a module's records to the remote side chunk by chunk, highest ids
// first, until the extractor runs dry, max_chunks chunks went out, the
// deadline passes, or the transport fails. Meant to be called repeatedly
// with the status it returned until that status is finished.
//
// The status only moves after a successful send, so a pause or a failure
// hands back exactly the progress that was acknowledged. The deadline is
// checked between chunks; a send that is already in flight is never cut
// short. Only one driver may run per module at a time.
class FullSyncDriver {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  FullSyncDriver(IRecordStore &store, ITransportSender &transport,
                 const FullSyncSettings &settings,
                 Clock clock = std::chrono::steady_clock::now);

  // Throws ConfigurationMissingError when the module has no limits and
  // StoreUnavailableError when the store fails before any chunk went out;
  // in both cases the caller's status is untouched. A store failure after
  // acknowledged sends returns STORE_FAILED with that progress kept.
  FullSyncResult
  sendFullSyncActions(const SyncModule &module, const json &config,
                      const FullSyncStatus &status,
                      std::chrono::steady_clock::time_point sendUntil);

private:
  ChunkExtractor extractor_;
  ITransportSender &transport_;
  const FullSyncSettings &settings_;
  Clock clock_;

  SendResult transmit(const SyncModule &module,
                      const std::vector<int64_t> &ids, int64_t previousEnd);
};

#endif
