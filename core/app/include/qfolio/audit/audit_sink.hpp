#pragma once

#include "qfolio/common/result.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// IAuditSink — append-only destination for structured audit records
// -----------------------------------------------------------------------------
// append() receives one fully encoded record. Sinks never modify or reorder
// records. A failing sink reports it through the Status; the recorder logs
// it and keeps feeding the other sinks.
// -----------------------------------------------------------------------------
class IAuditSink {
 public:
  virtual ~IAuditSink() = default;

  virtual Status append(const nlohmann::json& record) = 0;
};

// -----------------------------------------------------------------------------
// InMemoryAuditSink — keeps every record; used by tests and STATUS
// -----------------------------------------------------------------------------
class InMemoryAuditSink final : public IAuditSink {
 public:
  Status append(const nlohmann::json& record) override;

  std::vector<nlohmann::json> records() const;

  // Records whose "type" equals type, in order.
  std::vector<nlohmann::json> recordsOfType(const std::string& type) const;

  std::size_t size() const;
  void clear();

 private:
  mutable std::mutex mutex_;
  std::vector<nlohmann::json> records_;
};

// -----------------------------------------------------------------------------
// JsonLinesAuditSink — one compact JSON document per line, flushed per record
// -----------------------------------------------------------------------------
class JsonLinesAuditSink final : public IAuditSink {
 public:
  // Opens path for appending. isOpen() reports failure.
  explicit JsonLinesAuditSink(const std::string& path);

  Status append(const nlohmann::json& record) override;

  bool isOpen() const { return out_.is_open(); }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::mutex mutex_;
  std::ofstream out_;
};

}  // namespace qfolio
