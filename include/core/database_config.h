#ifndef DATABASE_CONFIG_H
#define DATABASE_CONFIG_H

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

struct PostgresSettings {
  std::string host = "localhost";
  std::string port = "5432";
  std::string database = "postgres";
  std::string user = "postgres";
  std::string password;
};

// Process-wide connection settings for the PostgreSQL database holding both
// the synced tables and the metadata schema.
class DatabaseConfig {
private:
  static PostgresSettings settings_;
  static bool initialized_;
  static std::mutex configMutex_;

  static void loadFromEnvUnlocked();
  static std::string buildConnectionString(bool maskPassword);

public:
  // Reads the "database.postgres" object of an already parsed config.json.
  // Falls back to the environment when the object is absent.
  static void loadFromJson(const nlohmann::json &config);
  static void loadFromEnv();
  static void reset();

  static PostgresSettings current();
  static bool isInitialized();

  static std::string escapeConnectionParam(const std::string &param);
  static std::string getPostgresConnectionString();
  static std::string getPostgresConnectionStringForLogging();
};

#endif
