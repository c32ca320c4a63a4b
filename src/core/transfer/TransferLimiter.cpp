#include "TransferLimiter.hpp"
#include "core/Errors.hpp"

namespace alib {

TransferLimiter::TransferLimiter(int slots) : slots_(slots) {
  if (slots < 1) throw ValidationError("transfer limiter needs at least one slot");
}

void TransferLimiter::acquire() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [&] { return used_ < slots_; });
  ++used_;
}

void TransferLimiter::release() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    --used_;
  }
  cv_.notify_one();
}

int TransferLimiter::inFlight() const {
  std::lock_guard<std::mutex> lk(mu_);
  return used_;
}

} // namespace alib
