#include "core/database_config.h"
#include "core/full_sync_settings.h"
#include "core/logger.h"
#include "sync/BatchPartitioner.h"
#include "sync/ChunkExtractor.h"
#include "sync/FullSyncRunner.h"
#include "sync/HttpTransportSender.h"
#include "sync/PostgresRecordStore.h"
#include "sync/TableSyncModule.h"
#include "utils/json_utils.h"
#include "utils/time_utils.h"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <curl/curl.h>
#include <iostream>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CONFIG_ERROR = 6;

constexpr double DEFAULT_TIME_BUDGET_SECONDS = 30.0;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

// Once a signal arrives the clock jumps past every deadline, so the driver
// stops at the next chunk boundary instead of mid-send.
std::chrono::steady_clock::time_point interruptibleNow() {
  if (g_shutdownRequested.load()) {
    return std::chrono::steady_clock::time_point::max();
  }
  return std::chrono::steady_clock::now();
}

void printUsage(const char *program) {
  std::cerr << "usage: " << program << " [config.json]\n"
            << "       " << program
            << " --partition <module> <batch_size> [config.json]\n"
            << "       " << program << " --total <module> [config.json]\n"
            << "       " << program << " --reset <module> [config.json]"
            << std::endl;
}

struct CommandLine {
  std::string mode = "run";
  std::string moduleName;
  size_t batchSize = 0;
  std::string configPath = "config.json";
};

bool parseCommandLine(int argc, char *argv[], CommandLine &cmd) {
  int i = 1;
  if (i < argc && std::string(argv[i]) == "--partition") {
    if (argc - i < 3)
      return false;
    cmd.mode = "partition";
    cmd.moduleName = argv[i + 1];
    long long batchSize = std::atoll(argv[i + 2]);
    if (batchSize <= 0)
      return false;
    cmd.batchSize = static_cast<size_t>(batchSize);
    i += 3;
  } else if (i < argc && (std::string(argv[i]) == "--total" ||
                          std::string(argv[i]) == "--reset")) {
    if (argc - i < 2)
      return false;
    cmd.mode = std::string(argv[i]).substr(2);
    cmd.moduleName = argv[i + 1];
    i += 2;
  }
  if (i < argc) {
    cmd.configPath = argv[i++];
  }
  return i == argc;
}

std::vector<std::pair<std::shared_ptr<TableSyncModule>, json>>
loadModules(const json &config) {
  std::vector<std::pair<std::shared_ptr<TableSyncModule>, json>> modules;
  if (!config.contains("modules") || !config["modules"].is_array()) {
    throw std::invalid_argument("config.json has no 'modules' array");
  }
  for (const auto &entry : config["modules"]) {
    auto module =
        std::make_shared<TableSyncModule>(TableSyncModule::fromJson(entry));
    modules.emplace_back(module, entry.value("config", json::object()));
  }
  return modules;
}
} // namespace

int main(int argc, char *argv[]) {
  CommandLine cmd;
  if (!parseCommandLine(argc, argv, cmd)) {
    printUsage(argv[0]);
    return EXIT_CONFIG_ERROR;
  }

  json config;
  FullSyncSettings settings;
  std::vector<std::pair<std::shared_ptr<TableSyncModule>, json>> modules;
  double timeBudgetSeconds = DEFAULT_TIME_BUDGET_SECONDS;
  HttpTransportConfig transportConfig;

  try {
    config = JsonUtils::loadFile(cmd.configPath);

    json logging = config.value("logging", json::object());
    Logger::setLogLevel(logging.value("level", "INFO"));
    Logger::initialize(logging.value("file", ""));

    DatabaseConfig::loadFromJson(config);
    modules = loadModules(config);
    if (cmd.mode == "run") {
      transportConfig = HttpTransportConfig::fromJson(config);
    }

    if (config.contains(FullSyncSettings::CONFIG_KEY)) {
      settings.loadFromJson(config[FullSyncSettings::CONFIG_KEY]);
    } else {
      settings.loadFromDatabase(DatabaseConfig::getPostgresConnectionString());
    }

    timeBudgetSeconds = config.value("full_sync", json::object())
                            .value("time_budget_seconds",
                                   DEFAULT_TIME_BUDGET_SECONDS);
    if (timeBudgetSeconds <= 0) {
      throw std::invalid_argument(
          "full_sync.time_budget_seconds must be positive");
    }
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    Logger::shutdown();
    return EXIT_CONFIG_ERROR;
  }

  const std::string connStr = DatabaseConfig::getPostgresConnectionString();
  Logger::info(LogCategory::DATABASE, "main",
               "Using " + DatabaseConfig::getPostgresConnectionStringForLogging());
  PostgresRecordStore store(connStr);

  try {
    if (cmd.mode != "run") {
      std::shared_ptr<TableSyncModule> module;
      json moduleConfig;
      for (const auto &entry : modules) {
        if (entry.first->name() == cmd.moduleName) {
          module = entry.first;
          moduleConfig = entry.second;
        }
      }
      if (!module) {
        std::cerr << "Unknown module: " << cmd.moduleName << std::endl;
        Logger::shutdown();
        return EXIT_CONFIG_ERROR;
      }

      if (cmd.mode == "total") {
        ChunkExtractor extractor(store);
        std::cout << extractor.total(*module, moduleConfig) << std::endl;
      } else if (cmd.mode == "reset") {
        FullSyncStatusRepository statusRepository(connStr);
        statusRepository.ensureSchema();
        statusRepository.reset(module->name());
      } else {
        BatchPartitioner partitioner(store);
        auto ranges = partitioner.partition(
            *module, cmd.batchSize, module->whereClause(moduleConfig));
        std::cout << BatchPartitioner::rangesToJson(ranges).dump()
                  << std::endl;
      }
      Logger::shutdown();
      return EXIT_SUCCESS_CODE;
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::SYSTEM, "main", e.what());
    Logger::shutdown();
    return EXIT_EXECUTION_ERROR;
  }

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "Error: curl_global_init failed" << std::endl;
    Logger::shutdown();
    return EXIT_INIT_ERROR;
  }
  if (std::signal(SIGINT, signalHandler) == SIG_ERR ||
      std::signal(SIGTERM, signalHandler) == SIG_ERR) {
    std::cerr << "Error: failed to register signal handlers" << std::endl;
    curl_global_cleanup();
    Logger::shutdown();
    return EXIT_INIT_ERROR;
  }

  int exitCode = EXIT_SUCCESS_CODE;
  try {
    HttpTransportSender transport(transportConfig);
    FullSyncStatusRepository statusRepository(connStr);
    statusRepository.ensureSchema();
    SyncModuleLock::ensureSchema(connStr);

    FullSyncDriver driver(store, transport, settings, interruptibleNow);
    FullSyncRunner runner(
        driver, statusRepository,
        [&connStr](const std::string &moduleName) {
          return std::make_unique<SyncModuleLock>(connStr, moduleName);
        },
        {}, interruptibleNow);

    for (auto &entry : modules) {
      runner.registerModule(entry.first, entry.second);
    }

    auto reports = runner.runOnce(TimeUtils::deadlineAfter(timeBudgetSeconds));

    json summary = json::array();
    for (const auto &report : reports) {
      json line = {{"module", report.moduleName},
                   {"outcome", fullSyncOutcomeToString(report.outcome)},
                   {"status", report.status.toJson()}};
      if (!report.error.empty()) {
        line["error"] = report.error;
        exitCode = EXIT_EXECUTION_ERROR;
      }
      summary.push_back(line);
    }
    std::cout << summary.dump(2) << std::endl;
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "main",
                     "Full sync run failed: " + std::string(e.what()));
    exitCode = EXIT_INIT_ERROR;
  }

  curl_global_cleanup();
  Logger::shutdown();
  return exitCode;
}
