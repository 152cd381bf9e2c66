#include "qfolio/audit/audit_sink.hpp"

namespace qfolio {

// -----------------------------------------------------------------------------
// InMemoryAuditSink
// -----------------------------------------------------------------------------
Status InMemoryAuditSink::append(const nlohmann::json& record) {
  std::lock_guard lock(mutex_);
  records_.push_back(record);
  return okStatus();
}

std::vector<nlohmann::json> InMemoryAuditSink::records() const {
  std::lock_guard lock(mutex_);
  return records_;
}

std::vector<nlohmann::json> InMemoryAuditSink::recordsOfType(
    const std::string& type) const {
  std::lock_guard lock(mutex_);
  std::vector<nlohmann::json> out;
  for (const auto& r : records_) {
    if (r.value("type", std::string()) == type) {
      out.push_back(r);
    }
  }
  return out;
}

std::size_t InMemoryAuditSink::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

void InMemoryAuditSink::clear() {
  std::lock_guard lock(mutex_);
  records_.clear();
}

// -----------------------------------------------------------------------------
// JsonLinesAuditSink
// -----------------------------------------------------------------------------
JsonLinesAuditSink::JsonLinesAuditSink(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {}

Status JsonLinesAuditSink::append(const nlohmann::json& record) {
  std::lock_guard lock(mutex_);
  if (!out_.is_open()) {
    return makeError(ErrorKind::TransientFailure,
                     "audit log '" + path_ + "' is not open", "audit");
  }
  out_ << record.dump() << '\n';
  out_.flush();
  if (!out_) {
    out_.clear();
    return makeError(ErrorKind::TransientFailure,
                     "write to audit log '" + path_ + "' failed", "audit");
  }
  return okStatus();
}

}  // namespace qfolio
