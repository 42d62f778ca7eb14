#pragma once

#include "core/error.h"
#include "core/result.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace wake::core {

class ILogger;

/// Key-value persistence supplied by a collaborator. No transactions, no
/// multi-key atomicity; only eventual visibility of the latest write.
class IDurableStore {
public:
  virtual ~IDurableStore() = default;

  /// nullopt when the key has never been written or was removed.
  virtual Result<std::optional<std::string>, WakeError>
  get(const std::string &key) = 0;

  virtual Result<void, WakeError> set(const std::string &key,
                                      const std::string &value) = 0;

  virtual Result<void, WakeError> remove(const std::string &key) = 0;
};

/// Store access scoped to one logical entity (one key).
///
/// An optional legacy key is migrated lazily: the first read that misses the
/// current key but finds the legacy one copies the value over and deletes
/// the legacy entry.
class StoreHandle {
public:
  StoreHandle(std::shared_ptr<IDurableStore> store, std::string key,
              std::string legacy_key = {},
              std::shared_ptr<ILogger> logger = nullptr);

  [[nodiscard]] const std::string &key() const { return key_; }

  Result<std::optional<std::string>, WakeError> read();
  Result<void, WakeError> write(const std::string &value);
  Result<void, WakeError> erase();

private:
  std::shared_ptr<IDurableStore> store_;
  std::string key_;
  std::string legacy_key_;
  std::shared_ptr<ILogger> logger_;
};

/// Write-behind decorator: set()/remove() return immediately and are applied
/// to the inner store by one background thread. Pending writes to the same
/// key coalesce (last write wins) and get() sees them before they land.
/// Inner failures are logged and dropped.
class WriteBehindStore final : public IDurableStore {
public:
  WriteBehindStore(std::shared_ptr<IDurableStore> inner,
                   std::shared_ptr<ILogger> logger);
  ~WriteBehindStore() override;

  WriteBehindStore(const WriteBehindStore &) = delete;
  WriteBehindStore &operator=(const WriteBehindStore &) = delete;

  Result<std::optional<std::string>, WakeError>
  get(const std::string &key) override;
  Result<void, WakeError> set(const std::string &key,
                              const std::string &value) override;
  Result<void, WakeError> remove(const std::string &key) override;

  /// Block until every write enqueued so far has been applied.
  void flush();

  /// Number of inner write failures observed so far.
  [[nodiscard]] std::size_t failure_count() const;

private:
  struct PendingWrite {
    std::string key;
    std::optional<std::string> value; // nullopt = remove
  };

  void enqueue(std::string key, std::optional<std::string> value);
  void worker_loop();

  std::shared_ptr<IDurableStore> inner_;
  std::shared_ptr<ILogger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<PendingWrite> queue_;
  std::optional<PendingWrite> in_flight_; // Popped, not yet applied
  bool writing_ = false;
  bool stopping_ = false;
  std::size_t failures_ = 0;
  std::thread worker_;
};

} // namespace wake::core
