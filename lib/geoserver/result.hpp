/**
 * @file result.hpp
 * @brief Value-or-error return types for remote and filesystem calls
 *
 * Remote failures are expected outcomes in this application: they are shown
 * to the operator verbatim and never abort anything. Calls therefore return
 * a Result<T> (value or message) or a Status (ok or message) instead of
 * throwing.
 */

#ifndef RESULT_HPP
#define RESULT_HPP

#include <optional>
#include <string>
#include <utility>

/**
 * @class Status
 * @brief Outcome of an operation without a payload
 */
class Status {
private:
  bool m_ok = true;
  std::string m_error;

public:
  Status() = default;

  static Status success() { return Status(); }

  static Status failure(std::string error) {
    Status status;
    status.m_ok = false;
    status.m_error = error.empty() ? "unknown error" : std::move(error);
    return status;
  }

  bool ok() const { return m_ok; }
  explicit operator bool() const { return m_ok; }
  const std::string &error() const { return m_error; }
};

/**
 * @class Result
 * @brief Either a value of type T or a user-visible error message
 *
 * @tparam T Payload type
 */
template <typename T> class Result {
private:
  std::optional<T> m_value;
  std::string m_error;

public:
  static Result success(T value) {
    Result result;
    result.m_value = std::move(value);
    return result;
  }

  static Result failure(std::string error) {
    Result result;
    result.m_error = error.empty() ? "unknown error" : std::move(error);
    return result;
  }

  /** @brief Carries over the error of a failed Status */
  static Result failure(const Status &status) {
    return failure(status.error());
  }

  bool ok() const { return m_value.has_value(); }
  explicit operator bool() const { return ok(); }

  const T &value() const { return *m_value; }
  T &value() { return *m_value; }
  const std::string &error() const { return m_error; }

  Status status() const {
    return ok() ? Status::success() : Status::failure(m_error);
  }
};

#endif // RESULT_HPP
