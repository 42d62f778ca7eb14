#include "core/durable_store.h"

#include "core/logger.h"

#include <algorithm>

namespace wake::core {

// ---- StoreHandle ----

StoreHandle::StoreHandle(std::shared_ptr<IDurableStore> store, std::string key,
                         std::string legacy_key,
                         std::shared_ptr<ILogger> logger)
    : store_(std::move(store)), key_(std::move(key)),
      legacy_key_(std::move(legacy_key)), logger_(std::move(logger)) {}

Result<std::optional<std::string>, WakeError> StoreHandle::read() {
  using R = Result<std::optional<std::string>, WakeError>;
  if (!store_) {
    return R::Err(WakeError::Persistence("No durable store configured"));
  }

  auto current = store_->get(key_);
  if (current.is_err() || current.value().has_value() || legacy_key_.empty() ||
      legacy_key_ == key_) {
    return current;
  }

  auto legacy = store_->get(legacy_key_);
  if (legacy.is_err() || !legacy.value().has_value()) {
    return legacy;
  }

  auto copied = store_->set(key_, *legacy.value());
  if (copied.is_err()) {
    // Serve the legacy value; migration retries on the next read.
    if (logger_) {
      logger_->warn("store", "store", "legacy_migration_failed",
                    "key=" + key_ + " error=" + copied.error().internal_message);
    }
    return legacy;
  }
  auto removed = store_->remove(legacy_key_);
  if (removed.is_err() && logger_) {
    logger_->warn("store", "store", "legacy_cleanup_failed",
                  "legacy_key=" + legacy_key_ +
                      " error=" + removed.error().internal_message);
  }
  if (logger_) {
    logger_->info("store", "store", "legacy_migrated",
                  "legacy_key=" + legacy_key_ + " key=" + key_);
  }
  return legacy;
}

Result<void, WakeError> StoreHandle::write(const std::string &value) {
  if (!store_) {
    return Result<void, WakeError>::Err(
        WakeError::Persistence("No durable store configured"));
  }
  auto written = store_->set(key_, value);
  if (written.is_err() || legacy_key_.empty() || legacy_key_ == key_) {
    return written;
  }
  return store_->remove(legacy_key_);
}

Result<void, WakeError> StoreHandle::erase() {
  if (!store_) {
    return Result<void, WakeError>::Err(
        WakeError::Persistence("No durable store configured"));
  }
  return store_->remove(key_);
}

// ---- WriteBehindStore ----

WriteBehindStore::WriteBehindStore(std::shared_ptr<IDurableStore> inner,
                                   std::shared_ptr<ILogger> logger)
    : inner_(std::move(inner)), logger_(std::move(logger)) {
  worker_ = std::thread([this]() { worker_loop(); });
}

WriteBehindStore::~WriteBehindStore() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

Result<std::optional<std::string>, WakeError>
WriteBehindStore::get(const std::string &key) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(queue_.rbegin(), queue_.rend(),
                           [&key](const PendingWrite &w) { return w.key == key; });
    if (it != queue_.rend()) {
      return Result<std::optional<std::string>, WakeError>::Ok(it->value);
    }
    if (in_flight_ && in_flight_->key == key) {
      return Result<std::optional<std::string>, WakeError>::Ok(
          in_flight_->value);
    }
  }
  if (!inner_) {
    return Result<std::optional<std::string>, WakeError>::Err(
        WakeError::Persistence("Write-behind store has no inner store"));
  }
  return inner_->get(key);
}

Result<void, WakeError> WriteBehindStore::set(const std::string &key,
                                              const std::string &value) {
  enqueue(key, value);
  return Result<void, WakeError>::Ok();
}

Result<void, WakeError> WriteBehindStore::remove(const std::string &key) {
  enqueue(key, std::nullopt);
  return Result<void, WakeError>::Ok();
}

void WriteBehindStore::enqueue(std::string key,
                               std::optional<std::string> value) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&key](const PendingWrite &w) { return w.key == key; });
    if (it != queue_.end()) {
      it->value = std::move(value);
    } else {
      queue_.push_back(PendingWrite{std::move(key), std::move(value)});
    }
  }
  cv_.notify_one();
}

void WriteBehindStore::flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() { return queue_.empty() && !writing_; });
}

std::size_t WriteBehindStore::failure_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

void WriteBehindStore::worker_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) {
      // stopping_ with nothing left to write
      return;
    }

    in_flight_ = std::move(queue_.front());
    queue_.pop_front();
    writing_ = true;
    const PendingWrite write = *in_flight_;
    lock.unlock();

    Result<void, WakeError> applied =
        inner_ ? (write.value ? inner_->set(write.key, *write.value)
                              : inner_->remove(write.key))
               : Result<void, WakeError>::Err(WakeError::Persistence(
                     "Write-behind store has no inner store"));
    if (applied.is_err() && logger_) {
      logger_->warn("store", "write_behind", "persist_failed",
                    "key=" + write.key +
                        " error=" + applied.error().internal_message);
    }

    lock.lock();
    writing_ = false;
    in_flight_.reset();
    if (applied.is_err()) {
      ++failures_;
    }
    if (queue_.empty()) {
      idle_cv_.notify_all();
    }
  }
}

} // namespace wake::core
