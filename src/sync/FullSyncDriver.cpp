#include "sync/FullSyncDriver.h"
#include "core/logger.h"
#include "core/sync_errors.h"

std::string fullSyncOutcomeToString(FullSyncOutcome outcome) {
  switch (outcome) {
  case FullSyncOutcome::FINISHED:
    return "FINISHED";
  case FullSyncOutcome::ALREADY_FINISHED:
    return "ALREADY_FINISHED";
  case FullSyncOutcome::PAUSED_CHUNK_LIMIT:
    return "PAUSED_CHUNK_LIMIT";
  case FullSyncOutcome::PAUSED_DEADLINE:
    return "PAUSED_DEADLINE";
  case FullSyncOutcome::TRANSPORT_FAILED:
    return "TRANSPORT_FAILED";
  case FullSyncOutcome::STORE_FAILED:
    return "STORE_FAILED";
  }
  return "UNKNOWN";
}

FullSyncDriver::FullSyncDriver(IRecordStore &store, ITransportSender &transport,
                               const FullSyncSettings &settings, Clock clock)
    : extractor_(store), transport_(transport), settings_(settings),
      clock_(std::move(clock)) {}

FullSyncResult FullSyncDriver::sendFullSyncActions(
    const SyncModule &module, const json &config, const FullSyncStatus &status,
    std::chrono::steady_clock::time_point sendUntil) {
  const std::string moduleName = module.name();

  FullSyncResult result;
  result.status = status;

  if (status.finished) {
    result.outcome = FullSyncOutcome::ALREADY_FINISHED;
    return result;
  }

  FullSyncLimits limits = settings_.limitsFor(moduleName);
  FullSyncSettings::validate(moduleName, limits);

  if (!result.status.lastSent) {
    result.status.lastSent = module.initialLastSent();
    Logger::info(LogCategory::SYNC, "FullSyncDriver",
                 "Starting full sync of module '" + moduleName + "'");
  }

  while (true) {
    std::vector<int64_t> ids;
    try {
      ids = extractor_.nextChunk(module, config, result.status,
                                 limits.chunkSize);
    } catch (const StoreUnavailableError &e) {
      if (result.chunksSent == 0) {
        throw;
      }
      result.outcome = FullSyncOutcome::STORE_FAILED;
      result.error = e.what();
      Logger::warning(LogCategory::DATABASE, "FullSyncDriver",
                      "Module '" + moduleName + "' stopped at cursor " +
                          std::to_string(*result.status.lastSent) +
                          " after " + std::to_string(result.chunksSent) +
                          " chunk(s): " + result.error);
      return result;
    }

    if (ids.empty()) {
      result.status.finished = true;
      result.outcome = FullSyncOutcome::FINISHED;
      Logger::info(LogCategory::SYNC, "FullSyncDriver",
                   "Module '" + moduleName + "' finished, " +
                       std::to_string(result.status.sent) + " record(s) sent");
      return result;
    }

    // The fetched chunk is dropped here and fetched again next time.
    if (result.chunksSent >= limits.maxChunks) {
      result.outcome = FullSyncOutcome::PAUSED_CHUNK_LIMIT;
      break;
    }
    if (clock_() >= sendUntil) {
      result.outcome = FullSyncOutcome::PAUSED_DEADLINE;
      break;
    }

    SendResult sent = transmit(module, ids, *result.status.lastSent);
    if (!sent.success) {
      Logger::warning(LogCategory::TRANSFER, "FullSyncDriver",
                      "Module '" + moduleName + "' stopped at cursor " +
                          std::to_string(*result.status.lastSent) +
                          ": " + sent.errorMessage);
      result.outcome = FullSyncOutcome::TRANSPORT_FAILED;
      result.error = sent.errorMessage;
      return result;
    }

    result.status.lastSent = ids.back();
    result.status.sent += static_cast<int64_t>(ids.size());
    result.chunksSent++;
    result.idsSent += static_cast<int64_t>(ids.size());
  }

  Logger::debug(LogCategory::SYNC, "FullSyncDriver",
                "Module '" + moduleName + "' paused (" +
                    fullSyncOutcomeToString(result.outcome) + ") after " +
                    std::to_string(result.chunksSent) + " chunk(s), cursor " +
                    std::to_string(*result.status.lastSent));
  return result;
}

SendResult FullSyncDriver::transmit(const SyncModule &module,
                                    const std::vector<int64_t> &ids,
                                    int64_t previousEnd) {
  json payload;
  payload["ids"] = ids;
  payload["previous_end"] = previousEnd;

  try {
    return transport_.sendAction(module.actionName(), payload);
  } catch (const TransportFailureError &e) {
    return SendResult::failure(e.what());
  }
}
