#include "admission_gate.hpp"

#include <algorithm>

namespace epicflow::exec {

AdmissionGate::AdmissionGate(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

bool AdmissionGate::Acquire(std::stop_token token) {
  if (token.stop_requested()) return false;

  std::unique_lock lock(mutex_);

  // A slot freed in the same instant as the stop still counts as stopped.
  if (!cv_.wait(lock, token, [&] { return in_flight_ < capacity_; }) || token.stop_requested()) {
    return false;
  }

  ++in_flight_;
  peak_ = std::max(peak_, in_flight_);
  return true;
}

void AdmissionGate::Release() {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
  }
  cv_.notify_one();
}

std::size_t AdmissionGate::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_;
}

std::size_t AdmissionGate::PeakInFlight() const {
  std::lock_guard lock(mutex_);
  return peak_;
}

} // namespace epicflow::exec
