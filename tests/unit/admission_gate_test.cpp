#include "internal/exec/admission_gate.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using epicflow::exec::AdmissionGate;
using epicflow::exec::AdmissionSlot;

void TestCapacityBoundsConcurrentHolders() {
  constexpr std::size_t kCapacity = 3;
  AdmissionGate         gate(kCapacity);
  std::atomic<int>      current{0};
  std::atomic<int>      highest{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 12; ++i) {
    threads.emplace_back([&] {
      assert(gate.Acquire(std::stop_token{}));
      AdmissionSlot slot(gate);

      const int now = ++current;
      int       seen = highest.load();
      while (now > seen && !highest.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      --current;
    });
  }
  for (auto& thread : threads) thread.join();

  assert(highest.load() <= static_cast<int>(kCapacity));
  assert(gate.PeakInFlight() <= kCapacity);
  assert(gate.InFlight() == 0);
}

void TestStopUnblocksWaiter() {
  AdmissionGate gate(1);
  assert(gate.Acquire(std::stop_token{}));

  std::stop_source  stop;
  std::atomic<bool> admitted{true};
  std::thread       waiter([&] { admitted = gate.Acquire(stop.get_token()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  stop.request_stop();
  waiter.join();

  assert(!admitted.load());
  assert(gate.InFlight() == 1);
  gate.Release();
  assert(gate.InFlight() == 0);
}

void TestStoppedTokenNeverAdmits() {
  AdmissionGate    gate(4);
  std::stop_source stop;
  stop.request_stop();

  assert(!gate.Acquire(stop.get_token()));
  assert(gate.InFlight() == 0);
  assert(gate.PeakInFlight() == 0);
}

void TestZeroCapacityClampsToOne() {
  AdmissionGate gate(0);
  assert(gate.Capacity() == 1);
  assert(gate.Acquire(std::stop_token{}));
  gate.Release();
}

} // namespace

int main() {
  TestCapacityBoundsConcurrentHolders();
  TestStopUnblocksWaiter();
  TestStoppedTokenNeverAdmits();
  TestZeroCapacityClampsToOne();

  std::cout << "epicflow_unit_admission_gate: pass\n";
  return 0;
}
