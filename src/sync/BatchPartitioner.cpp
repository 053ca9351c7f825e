#include "sync/BatchPartitioner.h"
#include "core/logger.h"
#include <stdexcept>

std::optional<std::vector<IdRange>>
BatchPartitioner::partition(const SyncModule &module, size_t batchSize,
                            const std::string &whereSql) const {
  if (batchSize == 0) {
    throw std::invalid_argument("batch size must be greater than zero");
  }
  if (!module.isAddressable()) {
    Logger::warning(LogCategory::PARTITION, "BatchPartitioner",
                    "Module '" + module.name() +
                        "' has no table, cannot compute batches");
    return std::nullopt;
  }

  RecordScope scope;
  scope.table = module.tableName();
  scope.idField = module.idField();
  scope.where = whereSql.empty() ? "1=1" : whereSql;

  std::vector<IdRange> results;
  std::optional<IdRange> total = store_.queryMinMax(scope, std::nullopt, 0);
  if (!total) {
    return results;
  }

  int64_t currentMin = 1;
  int64_t currentMax = 0;

  while (total->max > currentMax) {
    std::optional<IdRange> window =
        store_.queryMinMax(scope, currentMax, batchSize);

    if (!window || window->max <= currentMax) {
      Logger::warning(LogCategory::PARTITION, "BatchPartitioner",
                      "No ids above " + std::to_string(currentMax) +
                          " for module '" + module.name() +
                          "' although the maximum is " +
                          std::to_string(total->max) +
                          ", closing with an approximate window");
      currentMax = total->max;
      results.push_back(IdRange{currentMin, currentMax});
      break;
    }

    currentMin = window->min;
    currentMax = window->max;
    results.push_back(*window);
  }

  Logger::debug(LogCategory::PARTITION, "BatchPartitioner",
                "Module '" + module.name() + "' split into " +
                    std::to_string(results.size()) + " batch(es) of up to " +
                    std::to_string(batchSize) + " id(s)");
  return results;
}

json BatchPartitioner::rangesToJson(
    const std::optional<std::vector<IdRange>> &ranges) {
  if (!ranges) {
    return false;
  }
  json out = json::array();
  for (const auto &range : *ranges) {
    out.push_back({{"min", range.min}, {"max", range.max}});
  }
  return out;
}
