#pragma once
#include <condition_variable>
#include <mutex>

namespace alib {

// Counting gate on concurrent part transfers, shared by every job.
class TransferLimiter {
public:
  explicit TransferLimiter(int slots);

  void acquire();
  void release();
  int inFlight() const;

  class Slot {
  public:
    explicit Slot(TransferLimiter& l) : l_(l) { l_.acquire(); }
    ~Slot() { l_.release(); }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
  private:
    TransferLimiter& l_;
  };

private:
  const int slots_;
  int used_ = 0;
  mutable std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace alib
