#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace idelens {

enum class ErrorKind : std::uint8_t {
  NotFound,
  AccessDenied,
  Timeout,
  ResourceExhausted,
  Malformed
};

std::string_view error_code(ErrorKind k);

struct Error {
  ErrorKind kind = ErrorKind::Malformed;
  std::string operation;
  std::string message;
  hwnd_u64 hwnd{};
  std::uint32_t os_error{};

  std::string to_string() const;
};

inline Error make_error(ErrorKind kind, std::string operation,
                        std::string message, hwnd_u64 hwnd = 0,
                        std::uint32_t os_error = 0) {
  return Error{kind, std::move(operation), std::move(message), hwnd, os_error};
}

class BadResultAccess : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Value-or-Error returned by the internal layers. The public Inspector
// collapses errors into empty values.
template <typename T> class Result {
public:
  Result(T value) : v_(std::move(value)) {}
  Result(Error error) : v_(std::move(error)) {}

  bool ok() const { return v_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T &value() const & {
    if (!ok())
      throw BadResultAccess("value() on failed result: " + error().to_string());
    return std::get<0>(v_);
  }
  T &&value() && {
    if (!ok())
      throw BadResultAccess("value() on failed result: " + error().to_string());
    return std::get<0>(std::move(v_));
  }

  const Error &error() const {
    if (ok())
      throw BadResultAccess("error() on successful result");
    return std::get<1>(v_);
  }

  T value_or(T fallback) const & {
    if (ok())
      return std::get<0>(v_);
    return fallback;
  }

private:
  std::variant<T, Error> v_;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status(std::monostate{}); }

} // namespace idelens
