#ifndef SYNC_MODULE_LOCK_H
#define SYNC_MODULE_LOCK_H

#include <functional>
#include <memory>
#include <string>

class IModuleLock {
public:
  virtual ~IModuleLock() = default;

  virtual bool tryAcquire(int maxWaitSeconds) = 0;
  virtual void release() = 0;
  virtual bool isAcquired() const = 0;
};

using ModuleLockFactory =
    std::function<std::unique_ptr<IModuleLock>(const std::string &moduleName)>;

// Row lock in metadata.full_sync_locks keeping a second driver off a module
// while one is running. Rows expire after lockTimeoutSeconds so a crashed
// process cannot hold a module forever. Released on destruction.
class SyncModuleLock : public IModuleLock {
  std::string connectionString_;
  std::string lockName_;
  std::string sessionId_;
  bool acquired_;
  int lockTimeoutSeconds_;

public:
  SyncModuleLock(std::string connectionString, const std::string &moduleName,
                 int lockTimeoutSeconds = 300);
  ~SyncModuleLock() override;

  SyncModuleLock(const SyncModuleLock &) = delete;
  SyncModuleLock &operator=(const SyncModuleLock &) = delete;

  bool tryAcquire(int maxWaitSeconds = 30) override;
  void release() override;
  bool isAcquired() const override { return acquired_; }

  static void ensureSchema(const std::string &connectionString);

private:
  static std::string generateSessionId();
  static std::string getHostname();
};

#endif
