#pragma once

#include "core/durable_store.h"

#include <mutex>
#include <string>

namespace wake::infra {

/// IDurableStore that keeps one file per key: <directory>/<key>.json.
/// Writes go through a temp file and a rename so a crash never leaves a
/// half-written value behind.
class FileDurableStore final : public core::IDurableStore {
public:
  explicit FileDurableStore(std::string directory);

  core::Result<std::optional<std::string>, core::WakeError>
  get(const std::string &key) override;
  core::Result<void, core::WakeError> set(const std::string &key,
                                          const std::string &value) override;
  core::Result<void, core::WakeError> remove(const std::string &key) override;

  [[nodiscard]] const std::string &directory() const { return directory_; }

  /// Path of the file backing `key`.
  [[nodiscard]] std::string file_path(const std::string &key) const;

private:
  std::string directory_;
  std::mutex mutex_;
};

} // namespace wake::infra
