#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stop_token>

namespace epicflow::exec {

/*
  Counting gate bounding how many callers hold a slot at once.
*/
class AdmissionGate {
 public:
  explicit AdmissionGate(std::size_t capacity);

  // Blocks for a free slot. False, without a slot, once token is stopped.
  bool Acquire(std::stop_token token);

  void Release();

  std::size_t InFlight() const;
  std::size_t PeakInFlight() const;

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  const std::size_t capacity_;

  mutable std::mutex          mutex_;
  std::condition_variable_any cv_;
  std::size_t                 in_flight_ = 0;
  std::size_t                 peak_      = 0;
};

/*
  Releases an acquired slot on scope exit.
*/
class AdmissionSlot {
 public:
  explicit AdmissionSlot(AdmissionGate& gate) : gate_(gate) {
  }

  ~AdmissionSlot() {
    gate_.Release();
  }

  AdmissionSlot(const AdmissionSlot&)            = delete;
  AdmissionSlot& operator=(const AdmissionSlot&) = delete;

 private:
  AdmissionGate& gate_;
};

} // namespace epicflow::exec
