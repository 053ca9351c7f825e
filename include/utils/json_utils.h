#ifndef JSON_UTILS_H
#define JSON_UTILS_H

#include <fstream>
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>

namespace JsonUtils {

// Parses a JSON column. NULL or unparsable values yield a null json.
inline nlohmann::json parseJSONField(const pqxx::row &row, int index) {
  if (row[index].is_null()) {
    return nlohmann::json{};
  }
  try {
    return nlohmann::json::parse(row[index].as<std::string>());
  } catch (const nlohmann::json::parse_error &) {
    return nlohmann::json{};
  }
}

// Throws std::runtime_error when the file cannot be opened or parsed.
inline nlohmann::json loadFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("could not open '" + path + "'");
  }
  try {
    return nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("could not parse '" + path + "': " + e.what());
  }
}

} // namespace JsonUtils

#endif
