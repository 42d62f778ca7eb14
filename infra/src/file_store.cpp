#include "infra/file_store.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace wake::infra {

using core::Result;
using core::WakeError;

namespace {

bool valid_key(const std::string &key) {
  return !key.empty() && key.find('/') == std::string::npos &&
         key.find('\\') == std::string::npos && key != "." && key != "..";
}

WakeError invalid_key(const std::string &key) {
  return WakeError::Validation("Invalid store key '" + key + "'");
}

WakeError io_error(std::string user_msg, std::string internal_msg) {
  return WakeError(core::ErrorCategory::Persistence, 3, false,
                   std::move(user_msg), std::move(internal_msg));
}

} // namespace

FileDurableStore::FileDurableStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string FileDurableStore::file_path(const std::string &key) const {
  return (std::filesystem::path(directory_) / (key + ".json")).string();
}

Result<std::optional<std::string>, WakeError>
FileDurableStore::get(const std::string &key) {
  using R = Result<std::optional<std::string>, WakeError>;
  if (!valid_key(key)) {
    return R::Err(invalid_key(key));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::filesystem::path path(file_path(key));
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return R::Ok(std::nullopt);
  }

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return R::Err(
        io_error("Failed to read saved data", "cannot open " + path.string()));
  }
  std::ostringstream buffer;
  buffer << ifs.rdbuf();
  return R::Ok(buffer.str());
}

Result<void, WakeError> FileDurableStore::set(const std::string &key,
                                              const std::string &value) {
  if (!valid_key(key)) {
    return Result<void, WakeError>::Err(invalid_key(key));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::filesystem::path path(file_path(key));
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    return Result<void, WakeError>::Err(io_error(
        "Failed to save data",
        "create_directories " + path.parent_path().string() + ": " +
            ec.message()));
  }

  const std::filesystem::path tmp(path.string() + ".tmp");
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    ofs << value;
    ofs.flush();
    if (!ofs) {
      std::filesystem::remove(tmp, ec);
      return Result<void, WakeError>::Err(io_error(
          "Failed to save data", "write " + tmp.string()));
    }
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return Result<void, WakeError>::Err(io_error(
        "Failed to save data",
        "rename " + tmp.string() + ": " + ec.message()));
  }
  return Result<void, WakeError>::Ok();
}

Result<void, WakeError> FileDurableStore::remove(const std::string &key) {
  if (!valid_key(key)) {
    return Result<void, WakeError>::Err(invalid_key(key));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::remove(file_path(key), ec);
  if (ec) {
    return Result<void, WakeError>::Err(io_error(
        "Failed to delete data", file_path(key) + ": " + ec.message()));
  }
  return Result<void, WakeError>::Ok();
}

} // namespace wake::infra
