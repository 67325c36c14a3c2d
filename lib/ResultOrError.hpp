#ifndef HX_LEDGER_RESULT_OR_ERROR_HPP
#define HX_LEDGER_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace hx {

/**
 * Common base for module error types.
 * Modules derive their own Error struct from it so that error codes stay
 * scoped to the module that defines them.
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

template <typename T, typename E = RoeErrorBase> class ResultOrError {
public:
  // Success
  ResultOrError(const T &value) : data_(std::in_place_index<0>, value) {}
  ResultOrError(T &&value) : data_(std::in_place_index<0>, std::move(value)) {}

  // Error
  ResultOrError(const E &err) : data_(std::in_place_index<1>, err) {}
  ResultOrError(E &&err) : data_(std::in_place_index<1>, std::move(err)) {}

  static ResultOrError error(const E &err) { return ResultOrError(err); }
  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  bool isOk() const { return data_.index() == 0; }
  bool isError() const { return data_.index() == 1; }
  explicit operator bool() const { return isOk(); }

  const T &value() const {
    if (!isOk()) {
      throw std::runtime_error("Attempting to access value of error result: " +
                               std::get<1>(data_).message);
    }
    return std::get<0>(data_);
  }

  T &value() {
    if (!isOk()) {
      throw std::runtime_error("Attempting to access value of error result: " +
                               std::get<1>(data_).message);
    }
    return std::get<0>(data_);
  }

  T valueOr(const T &defaultValue) const {
    return isOk() ? std::get<0>(data_) : defaultValue;
  }

  const E &error() const {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return std::get<1>(data_);
  }

  E &error() {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return std::get<1>(data_);
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }
  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  std::variant<T, E> data_;
};

template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() = default;
  ResultOrError(const E &err) : error_(err) {}
  ResultOrError(E &&err) : error_(std::move(err)) {}

  static ResultOrError error(const E &err) { return ResultOrError(err); }
  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  bool isOk() const { return !error_.has_value(); }
  bool isError() const { return error_.has_value(); }
  explicit operator bool() const { return isOk(); }

  const E &error() const {
    if (!error_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *error_;
  }

  E &error() {
    if (!error_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return *error_;
  }

private:
  std::optional<E> error_;
};

} // namespace hx

#endif // HX_LEDGER_RESULT_OR_ERROR_HPP
