#include "sync/TableSyncModule.h"
#include "utils/string_utils.h"
#include <stdexcept>

namespace {
const json *idListOf(const json &config) {
  if (config.is_array())
    return &config;
  if (config.is_object() && config.contains("ids") &&
      config["ids"].is_array())
    return &config["ids"];
  return nullptr;
}
} // namespace

TableSyncModule::TableSyncModule(std::string name, std::string table,
                                 std::string idField, std::string baseWhere)
    : name_(std::move(name)), table_(std::move(table)),
      idField_(std::move(idField)), baseWhere_(std::move(baseWhere)) {
  if (name_.empty()) {
    throw std::invalid_argument("sync module needs a name");
  }
  if (!StringUtils::isSafeIdentifier(table_)) {
    throw std::invalid_argument("invalid table name for module '" + name_ +
                                "': '" + table_ + "'");
  }
  if (!StringUtils::isSafeIdentifier(idField_)) {
    throw std::invalid_argument("invalid id field for module '" + name_ +
                                "': '" + idField_ + "'");
  }
  if (StringUtils::trim(baseWhere_).empty()) {
    baseWhere_ = "1=1";
  }
}

TableSyncModule TableSyncModule::fromJson(const json &entry) {
  if (!entry.is_object() || !entry.contains("name") ||
      !entry.contains("table")) {
    throw std::invalid_argument(
        "module entries need at least 'name' and 'table'");
  }
  return TableSyncModule(entry["name"].get<std::string>(),
                         entry["table"].get<std::string>(),
                         entry.value("id_field", "id"),
                         entry.value("where", "1=1"));
}

std::string TableSyncModule::whereClause(const json &config) const {
  const json *ids = idListOf(config);
  if (!ids) {
    return baseWhere_;
  }
  if (ids->empty()) {
    return "1=0";
  }

  std::string list;
  for (const auto &id : *ids) {
    if (!id.is_number_integer()) {
      throw std::invalid_argument("full sync config for '" + name_ +
                                  "' lists a non-integer id: " + id.dump());
    }
    if (!list.empty())
      list += ",";
    list += std::to_string(id.get<int64_t>());
  }
  return "(" + baseWhere_ + ") AND " + idField_ + " IN (" + list + ")";
}
