#pragma once

#include <atomic>
#include <cstdint>

namespace faucet::dispatch {

/*
  Counts admitted jobs that have not reached a terminal outcome.
  TryAcquire never lets the count exceed the ceiling, even under contention.
*/
class InFlightGauge {
 public:
  explicit InFlightGauge(std::uint32_t ceiling) : ceiling_(ceiling) {
  }

  bool TryAcquire() {
    auto current = in_flight_.load();
    while (current < ceiling_) {
      if (in_flight_.compare_exchange_weak(current, current + 1)) {
        return true;
      }
    }
    return false;
  }

  void Release() {
    in_flight_.fetch_sub(1);
  }

  std::uint32_t in_flight() const {
    return in_flight_.load();
  }

  std::uint32_t ceiling() const {
    return ceiling_;
  }

 private:
  const std::uint32_t        ceiling_;
  std::atomic<std::uint32_t> in_flight_{0};
};

} // namespace faucet::dispatch
