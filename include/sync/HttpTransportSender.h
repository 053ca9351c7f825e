#ifndef HTTP_TRANSPORT_SENDER_H
#define HTTP_TRANSPORT_SENDER_H

#include "sync/TransportSender.h"
#include <string>

struct HttpTransportConfig {
  std::string url;
  std::string authToken;
  long timeoutSeconds = 30;

  // Reads the "transport" object of config.json. Throws
  // std::invalid_argument when the url is missing.
  static HttpTransportConfig fromJson(const nlohmann::json &config);
};

// Posts {"action": ..., "payload": ...} as JSON to a fixed endpoint. Any
// curl error or a non-2xx response counts as a failed send.
class HttpTransportSender : public ITransportSender {
  HttpTransportConfig config_;

public:
  explicit HttpTransportSender(HttpTransportConfig config);

  SendResult sendAction(const std::string &actionName,
                        const nlohmann::json &payload) override;
};

#endif
