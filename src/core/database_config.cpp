#include "core/database_config.h"
#include "core/logger.h"
#include <cctype>
#include <cstdlib>
#include <cstring>

using json = nlohmann::json;

PostgresSettings DatabaseConfig::settings_;
bool DatabaseConfig::initialized_ = false;
std::mutex DatabaseConfig::configMutex_;

namespace {
bool validateAndSetPort(const std::string &portStr, std::string &targetPort) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  int portNum = std::stoi(portStr);
  if (portNum > 0 && portNum <= 65535) {
    targetPort = portStr;
    return true;
  }
  return false;
}

// The port may be written as a string or a number in config.json.
std::string portToString(const json &value) {
  if (value.is_number_integer())
    return std::to_string(value.get<long long>());
  if (value.is_string())
    return value.get<std::string>();
  return "";
}
} // namespace

// libpq keyword/value strings need values with spaces, quotes or
// backslashes single-quoted and escaped.
std::string DatabaseConfig::escapeConnectionParam(const std::string &param) {
  bool needsQuoting = param.empty();
  for (char c : param) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' ||
        c == '\\') {
      needsQuoting = true;
      break;
    }
  }
  if (!needsQuoting)
    return param;

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

std::string DatabaseConfig::buildConnectionString(bool maskPassword) {
  std::lock_guard<std::mutex> lock(configMutex_);
  std::string conn = "host=" + escapeConnectionParam(settings_.host) +
                     " dbname=" + escapeConnectionParam(settings_.database) +
                     " user=" + escapeConnectionParam(settings_.user);
  if (maskPassword)
    conn += " password=***";
  else
    conn += " password=" + escapeConnectionParam(settings_.password);
  conn += " port=" + escapeConnectionParam(settings_.port);
  return conn;
}

std::string DatabaseConfig::getPostgresConnectionString() {
  return buildConnectionString(false);
}

std::string DatabaseConfig::getPostgresConnectionStringForLogging() {
  return buildConnectionString(true);
}

PostgresSettings DatabaseConfig::current() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return settings_;
}

bool DatabaseConfig::isInitialized() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return initialized_;
}

void DatabaseConfig::reset() {
  std::lock_guard<std::mutex> lock(configMutex_);
  settings_ = PostgresSettings{};
  initialized_ = false;
}

// Expects {"database": {"postgres": {"host", "port", "database", "user",
// "password"}}}. Empty values keep the defaults; a malformed port is logged
// and ignored. Environment variables are only consulted when the section is
// missing entirely.
void DatabaseConfig::loadFromJson(const json &config) {
  std::lock_guard<std::mutex> lock(configMutex_);

  if (!config.contains("database") ||
      !config["database"].contains("postgres")) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "No database.postgres section, using environment "
                    "variables");
    loadFromEnvUnlocked();
    return;
  }

  const json &pgConfig = config["database"]["postgres"];

  std::string host = pgConfig.value("host", "");
  if (!host.empty())
    settings_.host = host;

  if (pgConfig.contains("port")) {
    std::string port = portToString(pgConfig["port"]);
    if (!validateAndSetPort(port, settings_.port)) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid port number: '" + port +
                          "', keeping: " + settings_.port);
    }
  }

  std::string db = pgConfig.value("database", "");
  if (!db.empty())
    settings_.database = db;

  std::string user = pgConfig.value("user", "");
  if (!user.empty())
    settings_.user = user;

  if (pgConfig.contains("password"))
    settings_.password = pgConfig["password"].get<std::string>();

  initialized_ = true;
}

void DatabaseConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
}

// POSTGRES_HOST, POSTGRES_PORT, POSTGRES_DB, POSTGRES_USER and
// POSTGRES_PASSWORD override the defaults when set.
void DatabaseConfig::loadFromEnvUnlocked() {
  const char *host = std::getenv("POSTGRES_HOST");
  const char *port = std::getenv("POSTGRES_PORT");
  const char *db = std::getenv("POSTGRES_DB");
  const char *user = std::getenv("POSTGRES_USER");
  const char *password = std::getenv("POSTGRES_PASSWORD");

  if (host && strlen(host) > 0)
    settings_.host = host;
  if (port && strlen(port) > 0) {
    std::string portStr(port);
    if (!validateAndSetPort(portStr, settings_.port)) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid POSTGRES_PORT: " + portStr +
                          ", keeping: " + settings_.port);
    }
  }
  if (db && strlen(db) > 0)
    settings_.database = db;
  if (user && strlen(user) > 0)
    settings_.user = user;
  if (password)
    settings_.password = password;

  if (settings_.password.empty()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "POSTGRES_PASSWORD not set in config.json or environment");
  }

  initialized_ = true;
}
