/**
 * @file expected.h
 * @brief Value-or-error result type modelled on C++23 std::expected
 *
 * Expected<T, E> holds either a value of type T or an error of type E.
 * Expected<void, E> holds either nothing (success) or an error.
 *
 * Example:
 * @code
 * Expected<std::string, Error> ReadSnapshot(const std::string& path) {
 *   if (path.empty()) {
 *     return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Empty path"));
 *   }
 *   return std::string("...");
 * }
 *
 * auto bytes = ReadSnapshot(path);
 * if (!bytes) {
 *   spdlog::error("{}", bytes.error().message());
 * }
 * @endcode
 */

#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace snapkeep::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

 private:
  E error_;
};

/**
 * @brief Create an Unexpected from an error value
 */
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

  const char* what() const noexcept override { return "Bad Expected access: contains error"; }

  const E& error() const { return error_; }

 private:
  E error_;
};

template <typename T, typename E>
class Expected;

namespace detail {

template <typename U>
struct IsUnexpected : std::false_type {};

template <typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

template <typename U>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<Expected<T, E>> : std::true_type {};

}  // namespace detail

template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected()
    requires std::is_default_constructible_v<T>
      : storage_(std::in_place_index<0>) {}

  template <typename U = T>
    requires(std::is_constructible_v<T, U &&> && !std::is_same_v<std::remove_cvref_t<U>, Expected> &&
             !detail::IsUnexpected<std::remove_cvref_t<U>>::value)
  Expected(U&& value)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G>
  Expected(const Unexpected<G>& unexpected)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<1>, unexpected.error()) {}

  template <typename G>
  Expected(Unexpected<G>&& unexpected)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(error());
    }
    return std::move(std::get<0>(storage_));
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  E& error() & { return std::get<1>(storage_); }
  const E& error() const& { return std::get<1>(storage_); }
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
   * @brief Chain an operation returning another Expected
   */
  template <typename F>
  auto and_then(F&& func) const& {
    using Result = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
    static_assert(detail::IsExpected<Result>::value, "and_then callback must return Expected");
    if (has_value()) {
      return std::invoke(std::forward<F>(func), std::get<0>(storage_));
    }
    return Result(MakeUnexpected(error()));
  }

  template <typename F>
  auto and_then(F&& func) && {
    using Result = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
    static_assert(detail::IsExpected<Result>::value, "and_then callback must return Expected");
    if (has_value()) {
      return std::invoke(std::forward<F>(func), std::move(std::get<0>(storage_)));
    }
    return Result(MakeUnexpected(std::move(std::get<1>(storage_))));
  }

  /**
   * @brief Map the value, keeping the error untouched
   */
  template <typename F>
  auto transform(F&& func) const& {
    using U = std::remove_cv_t<std::invoke_result_t<F, const T&>>;
    if constexpr (std::is_void_v<U>) {
      if (has_value()) {
        std::invoke(std::forward<F>(func), std::get<0>(storage_));
        return Expected<void, E>();
      }
      return Expected<void, E>(MakeUnexpected(error()));
    } else {
      if (has_value()) {
        return Expected<U, E>(std::invoke(std::forward<F>(func), std::get<0>(storage_)));
      }
      return Expected<U, E>(MakeUnexpected(error()));
    }
  }

  /**
   * @brief Recover from an error with an operation returning Expected
   */
  template <typename F>
  auto or_else(F&& func) const& {
    using Result = std::remove_cvref_t<std::invoke_result_t<F, const E&>>;
    static_assert(detail::IsExpected<Result>::value, "or_else callback must return Expected");
    if (has_value()) {
      return Result(std::get<0>(storage_));
    }
    return std::invoke(std::forward<F>(func), error());
  }

  /**
   * @brief Map the error, keeping the value untouched
   */
  template <typename F>
  auto transform_error(F&& func) const& {
    using G = std::remove_cv_t<std::invoke_result_t<F, const E&>>;
    if (has_value()) {
      return Expected<T, G>(std::get<0>(storage_));
    }
    return Expected<T, G>(MakeUnexpected(std::invoke(std::forward<F>(func), error())));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Expected specialization for operations without a result value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G>
  Expected(const Unexpected<G>& unexpected)  // NOLINT(google-explicit-constructor)
      : error_(unexpected.error()) {}

  template <typename G>
  Expected(Unexpected<G>&& unexpected)  // NOLINT(google-explicit-constructor)
      : error_(std::move(unexpected).error()) {}

  bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & { return *error_; }
  const E& error() const& { return *error_; }
  E&& error() && { return std::move(*error_); }

  template <typename F>
  auto and_then(F&& func) const {
    using Result = std::remove_cvref_t<std::invoke_result_t<F>>;
    static_assert(detail::IsExpected<Result>::value, "and_then callback must return Expected");
    if (has_value()) {
      return std::invoke(std::forward<F>(func));
    }
    return Result(MakeUnexpected(*error_));
  }

  template <typename F>
  auto transform(F&& func) const {
    using U = std::remove_cv_t<std::invoke_result_t<F>>;
    if constexpr (std::is_void_v<U>) {
      if (has_value()) {
        std::invoke(std::forward<F>(func));
        return Expected<void, E>();
      }
      return Expected<void, E>(MakeUnexpected(*error_));
    } else {
      if (has_value()) {
        return Expected<U, E>(std::invoke(std::forward<F>(func)));
      }
      return Expected<U, E>(MakeUnexpected(*error_));
    }
  }

  template <typename F>
  auto or_else(F&& func) const {
    using Result = std::remove_cvref_t<std::invoke_result_t<F, const E&>>;
    static_assert(detail::IsExpected<Result>::value, "or_else callback must return Expected");
    if (has_value()) {
      return Result();
    }
    return std::invoke(std::forward<F>(func), *error_);
  }

  template <typename F>
  auto transform_error(F&& func) const {
    using G = std::remove_cv_t<std::invoke_result_t<F, const E&>>;
    if (has_value()) {
      return Expected<void, G>();
    }
    return Expected<void, G>(MakeUnexpected(std::invoke(std::forward<F>(func), *error_)));
  }

 private:
  std::optional<E> error_;
};

}  // namespace snapkeep::utils
