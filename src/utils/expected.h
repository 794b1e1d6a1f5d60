/**
 * @file expected.h
 * @brief Minimal std::expected-like result type (C++17)
 *
 * Expected<T, E> holds either a value of type T or an error of type E.
 * Used throughout the codebase instead of exceptions for recoverable errors
 * (upstream failures, configuration problems, invalid requests).
 */

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "utils/error.h"

namespace monitorgate::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(const E& error) : error_(error) {}
  explicit Unexpected(E&& error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown when value() is called on an Expected holding an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  const char* what() const noexcept override { return "Bad expected access"; }

  const E& error() const { return error_; }

 private:
  E error_;
};

/**
 * @brief Value-or-error result
 */
template <typename T, typename E = Error>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T, typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                                        !std::is_same_v<std::decay_t<U>, Expected> &&
                                                        !std::is_same_v<std::decay_t<U>, Unexpected<E>>>>
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}  // NOLINT

  Expected(const Unexpected<E>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}  // NOLINT
  Expected(Unexpected<E>&& unexpected)  // NOLINT
      : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::move(std::get<0>(storage_));
  }

  T& operator*() & { return value(); }
  const T& operator*() const& { return value(); }
  T&& operator*() && { return std::move(*this).value(); }

  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

  const E& error() const& { return std::get<1>(storage_); }
  E& error() & { return std::get<1>(storage_); }
  E&& error() && { return std::move(std::get<1>(storage_)); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value, keep the error
   */
  template <typename F>
  auto transform(F&& func) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
    if (has_value()) {
      return std::forward<F>(func)(std::get<0>(storage_));
    }
    return Unexpected<E>(std::get<1>(storage_));
  }

  /**
   * @brief Chain an operation that itself returns an Expected
   */
  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
    if (has_value()) {
      return std::forward<F>(func)(std::get<0>(storage_));
    }
    return Unexpected<E>(std::get<1>(storage_));
  }

  /**
   * @brief Recover from an error
   */
  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(std::get<1>(storage_));
  }

  template <typename F>
  auto transform_error(F&& func) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
    using NewE = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return std::get<0>(storage_);
    }
    return Unexpected<NewE>(std::forward<F>(func)(std::get<1>(storage_)));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations that only report success or failure
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  Expected(const Unexpected<E>& unexpected) : error_(unexpected.error()) {}  // NOLINT
  Expected(Unexpected<E>&& unexpected) : error_(std::move(unexpected).error()) {}  // NOLINT

  bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (error_.has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  const E& error() const& { return *error_; }
  E& error() & { return *error_; }
  E&& error() && { return std::move(*error_); }

 private:
  std::optional<E> error_;
};

}  // namespace monitorgate::utils
