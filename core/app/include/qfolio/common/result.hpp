#pragma once

#include <map>
#include <string>
#include <utility>
#include <variant>

namespace qfolio {

// -----------------------------------------------------------------------------
// ErrorKind — the engine's failure taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every failure a component can report through Result<T>.
//
// @details
// The first seven kinds are domain outcomes that the caller is expected to
// handle (fall back, skip an asset, drop a trade). The last three are ambient
// failures: transport hiccups that the retry wrapper may retry, malformed
// arguments, and configuration that failed validation.
//
// Business-rule blocks (ComplianceBlocked) and the circuit breaker
// (CircuitBreakerTripped) are reported through the same type so they can be
// logged uniformly, but they are never retried.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  InsufficientHistory,
  EmptyUniverse,
  DegenerateSelection,
  PriceUnavailable,
  ComplianceBlocked,
  OrderRejected,
  CircuitBreakerTripped,
  TransientFailure,
  InvalidInput,
  InvalidConfiguration,
};

// -----------------------------------------------------------------------------
// Error
// -----------------------------------------------------------------------------
//
// @brief  A failure plus the context needed to reconstruct the decision from
//         logs alone.
//
// @details
//   kind     — taxonomy entry (see ErrorKind).
//   message  — human-readable description.
//   stage    — pipeline stage that produced the error (e.g. "regime",
//              "price_discovery"). Empty when not tied to a stage.
//   asset    — instrument the error concerns. Empty for universe-wide errors.
//   inputs   — the numeric inputs that led to the failure (thresholds,
//              observation counts, prices...).
// -----------------------------------------------------------------------------
struct Error {
  ErrorKind kind{ErrorKind::InvalidInput};
  std::string message;
  std::string stage;
  std::string asset;
  std::map<std::string, double> inputs;
};

inline Error makeError(ErrorKind kind, std::string message,
                       std::string stage = {}, std::string asset = {},
                       std::map<std::string, double> inputs = {}) {
  Error e;
  e.kind = kind;
  e.message = std::move(message);
  e.stage = std::move(stage);
  e.asset = std::move(asset);
  e.inputs = std::move(inputs);
  return e;
}

const char* errorKindToString(ErrorKind kind);

// Single-line rendering for log output: "Kind[stage/asset]: message {k=v}".
std::string describe(const Error& error);

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
//
// @brief  Either a value of type T or an Error.
//
// @details
// A thin wrapper over std::variant<T, Error>. Implicit construction from
// both alternatives keeps call sites short:
//
//   Result<double> price(...) {
//     if (missing) return makeError(ErrorKind::PriceUnavailable, "...");
//     return 101.5;
//   }
//
// Accessing value() on an error (or error() on a value) throws
// std::bad_variant_access; callers check ok() first.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : storage_(std::move(value)) {}
  Result(Error error) : storage_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(storage_); }
  explicit operator bool() const { return ok(); }

  const T& value() const& { return std::get<T>(storage_); }
  T& value() & { return std::get<T>(storage_); }
  T&& value() && { return std::get<T>(std::move(storage_)); }

  const Error& error() const { return std::get<Error>(storage_); }

  T value_or(T fallback) const {
    return ok() ? std::get<T>(storage_) : std::move(fallback);
  }

 private:
  std::variant<T, Error> storage_;
};

// Result of an operation with no payload.
using Status = Result<std::monostate>;

inline Status okStatus() { return std::monostate{}; }

}  // namespace qfolio
