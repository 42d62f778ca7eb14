#pragma once

#include <cassert>
#include <type_traits>
#include <utility>
#include <variant>

namespace wake::core {

/// Result<T, E> for explicit error handling across module boundaries.
/// Every fallible core operation returns one; nothing throws past a module.
template <typename T, typename E> class Result {
public:
  static_assert(!std::is_same_v<T, E>,
                "Result<T, E> needs distinct value and error types");

  /// Construct a success result.
  static Result Ok(T value) {
    Result r;
    r.storage_.template emplace<0>(std::move(value));
    return r;
  }

  /// Construct an error result.
  static Result Err(E error) {
    Result r;
    r.storage_.template emplace<1>(std::move(error));
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }

  /// Access the success value. UB if is_err().
  [[nodiscard]] const T &value() const & {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T &value() & {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T &&value() && {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(std::move(storage_));
  }

  /// Success value, or `fallback` when this is an error.
  [[nodiscard]] T value_or(T fallback) const & {
    return is_ok() ? std::get<0>(storage_) : std::move(fallback);
  }

  /// Access the error value. UB if is_ok().
  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result::error() called on Ok");
    return std::get<1>(storage_);
  }

  [[nodiscard]] E &&error() && {
    assert(is_err() && "Result::error() called on Ok");
    return std::get<1>(std::move(storage_));
  }

private:
  Result() = default;
  std::variant<T, E> storage_;
};

/// Result<void, E>: success carries no value.
template <typename E> class Result<void, E> {
public:
  static Result Ok() { return Result(); }

  static Result Err(E error) {
    Result r;
    r.has_error_ = true;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !has_error_; }
  [[nodiscard]] bool is_err() const noexcept { return has_error_; }

  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result<void,E>::error() called on Ok");
    return error_;
  }

private:
  Result() = default;
  bool has_error_ = false;
  E error_{};
};

} // namespace wake::core
