#ifndef SYNC_ERRORS_H
#define SYNC_ERRORS_H

#include <stdexcept>
#include <string>

// A backing-store query failed. Nothing was written, so the invocation can
// be retried with the same status.
class StoreUnavailableError : public std::runtime_error {
public:
  explicit StoreUnavailableError(const std::string &message)
      : std::runtime_error("store unavailable: " + message) {}
};

class TransportFailureError : public std::runtime_error {
public:
  explicit TransportFailureError(const std::string &message)
      : std::runtime_error("transport failure: " + message) {}
};

class ConfigurationMissingError : public std::runtime_error {
  std::string moduleName_;

public:
  explicit ConfigurationMissingError(const std::string &moduleName)
      : std::runtime_error("no full sync limits configured for module '" +
                           moduleName + "'"),
        moduleName_(moduleName) {}

  const std::string &moduleName() const { return moduleName_; }
};

#endif
