#include "qfolio/common/result.hpp"

#include <sstream>

namespace qfolio {

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InsufficientHistory:   return "InsufficientHistory";
    case ErrorKind::EmptyUniverse:         return "EmptyUniverse";
    case ErrorKind::DegenerateSelection:   return "DegenerateSelection";
    case ErrorKind::PriceUnavailable:      return "PriceUnavailable";
    case ErrorKind::ComplianceBlocked:     return "ComplianceBlocked";
    case ErrorKind::OrderRejected:         return "OrderRejected";
    case ErrorKind::CircuitBreakerTripped: return "CircuitBreakerTripped";
    case ErrorKind::TransientFailure:      return "TransientFailure";
    case ErrorKind::InvalidInput:          return "InvalidInput";
    case ErrorKind::InvalidConfiguration:  return "InvalidConfiguration";
  }
  return "Unknown";
}

std::string describe(const Error& error) {
  std::ostringstream out;
  out << errorKindToString(error.kind);
  if (!error.stage.empty() || !error.asset.empty()) {
    out << "[" << error.stage;
    if (!error.asset.empty()) {
      out << "/" << error.asset;
    }
    out << "]";
  }
  out << ": " << error.message;
  if (!error.inputs.empty()) {
    out << " {";
    bool first = true;
    for (const auto& [key, value] : error.inputs) {
      if (!first) {
        out << ", ";
      }
      out << key << "=" << value;
      first = false;
    }
    out << "}";
  }
  return out.str();
}

}  // namespace qfolio
