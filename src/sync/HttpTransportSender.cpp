#include "sync/HttpTransportSender.h"
#include "core/logger.h"
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            size * nmemb);
  return size * nmemb;
}

constexpr size_t MAX_LOGGED_RESPONSE = 512;
} // namespace

HttpTransportConfig HttpTransportConfig::fromJson(const json &config) {
  if (!config.contains("transport") || !config["transport"].is_object()) {
    throw std::invalid_argument("config.json has no 'transport' section");
  }
  const json &transport = config["transport"];

  HttpTransportConfig result;
  result.url = transport.value("url", "");
  result.authToken = transport.value("auth_token", "");
  result.timeoutSeconds = transport.value("timeout_seconds", 30L);

  if (result.url.empty()) {
    throw std::invalid_argument("transport.url must be set");
  }
  if (result.timeoutSeconds <= 0) {
    throw std::invalid_argument("transport.timeout_seconds must be positive");
  }
  return result;
}

HttpTransportSender::HttpTransportSender(HttpTransportConfig config)
    : config_(std::move(config)) {}

SendResult HttpTransportSender::sendAction(const std::string &actionName,
                                           const json &payload) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    Logger::error(LogCategory::TRANSPORT, "HttpTransportSender",
                  "Failed to initialize CURL");
    return SendResult::failure("curl_easy_init failed");
  }

  json body;
  body["action"] = actionName;
  body["payload"] = payload;
  std::string bodyStr = body.dump();

  std::string responseBody;
  struct curl_slist *headerList = nullptr;
  headerList = curl_slist_append(headerList, "Content-Type: application/json");
  if (!config_.authToken.empty()) {
    std::string authHeader = "Authorization: Bearer " + config_.authToken;
    headerList = curl_slist_append(headerList, authHeader.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, config_.url.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, bodyStr.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(bodyStr.length()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeoutSeconds);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  CURLcode res = curl_easy_perform(curl);
  long httpCode = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

  curl_slist_free_all(headerList);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    std::string message = curl_easy_strerror(res);
    Logger::error(LogCategory::TRANSPORT, "HttpTransportSender",
                  "Sending " + actionName + " failed: " + message);
    return SendResult::failure(message);
  }

  if (httpCode < 200 || httpCode >= 300) {
    std::string message = "HTTP " + std::to_string(httpCode) + ": " +
                          responseBody.substr(0, MAX_LOGGED_RESPONSE);
    Logger::warning(LogCategory::TRANSPORT, "HttpTransportSender",
                    "Remote rejected " + actionName + " (" + message + ")");
    return SendResult::failure(message);
  }

  Logger::debug(LogCategory::TRANSPORT, "HttpTransportSender",
                "Sent " + actionName + " (" +
                    std::to_string(bodyStr.size()) + " bytes)");
  return SendResult::ok();
}
