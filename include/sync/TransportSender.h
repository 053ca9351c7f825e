#ifndef TRANSPORT_SENDER_H
#define TRANSPORT_SENDER_H

#include <nlohmann/json.hpp>
#include <string>

struct SendResult {
  bool success = false;
  std::string errorMessage;

  static SendResult ok() { return SendResult{true, ""}; }
  static SendResult failure(std::string message) {
    return SendResult{false, std::move(message)};
  }
};

// Outbound channel to the remote consumer. May block on I/O. Implementations
// report failure through SendResult or by throwing TransportFailureError.
class ITransportSender {
public:
  virtual ~ITransportSender() = default;

  virtual SendResult sendAction(const std::string &actionName,
                                const nlohmann::json &payload) = 0;
};

#endif
