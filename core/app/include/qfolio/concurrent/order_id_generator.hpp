#pragma once

#include <atomic>
#include <cstdint>

namespace qfolio {

// -----------------------------------------------------------------------------
// OrderIdGenerator — monotonically increasing order ids
// -----------------------------------------------------------------------------
//
// @brief  Hands out 1, 2, 3, ... from an atomic counter. 0 stays reserved as
//         "unset" (see domain::OrderId).
//
// @details
// Owned by value by the component that assigns ids (the paper exchange).
// Relaxed ordering is enough: uniqueness is the only guarantee required.
//
// Thread model: next_id() may be called concurrently.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace qfolio
