#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <thread>
#include <vector>

#include "bread/scheduler/gate.hpp"

namespace {

bool test_capacity_and_peak() {
  bread::Gate zero(0);
  if (zero.capacity() != 1) {
    std::cerr << std::format("capacity 0 should clamp to 1, got {}\n", zero.capacity());
    return false;
  }

  bread::Gate gate(2);
  gate.acquire();
  gate.acquire();
  if (gate.in_flight() != 2 || gate.peak() != 2) {
    std::cerr << std::format("in_flight={} peak={} after two acquires\n", gate.in_flight(),
                             gate.peak());
    return false;
  }
  gate.release();
  gate.acquire();
  gate.release();
  gate.release();
  if (gate.in_flight() != 0 || gate.peak() != 2) {
    std::cerr << std::format("in_flight={} peak={} after releases\n", gate.in_flight(),
                             gate.peak());
    return false;
  }
  return true;
}

bool test_acquire_blocks_until_release() {
  bread::Gate gate(1);
  gate.acquire();

  std::atomic<bool> admitted{false};
  std::thread waiter([&]() {
    gate.acquire();
    admitted.store(true);
    gate.release();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  if (admitted.load()) {
    std::cerr << std::format("acquire should block while the gate is full\n");
    gate.release();
    waiter.join();
    return false;
  }

  gate.release();
  waiter.join();
  if (!admitted.load()) {
    std::cerr << std::format("waiter should be admitted after release\n");
    return false;
  }
  if (gate.in_flight() != 0 || gate.peak() != 1) {
    std::cerr << std::format("in_flight={} peak={}\n", gate.in_flight(), gate.peak());
    return false;
  }
  return true;
}

bool test_bound_under_contention() {
  constexpr uint32_t kCapacity = 3;
  bread::Gate gate(kCapacity);
  std::atomic<uint32_t> live{0};
  std::atomic<uint32_t> high{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 200; ++i) {
        gate.acquire();
        const uint32_t now = live.fetch_add(1) + 1;
        uint32_t prev = high.load();
        while (now > prev && !high.compare_exchange_weak(prev, now)) {
        }
        live.fetch_sub(1);
        gate.release();
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  if (high.load() > kCapacity || gate.peak() > kCapacity) {
    std::cerr << std::format("gate admitted {} (peak {}) with capacity {}\n", high.load(),
                             gate.peak(), kCapacity);
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_capacity_and_peak()) {
    return 1;
  }
  if (!test_acquire_blocks_until_release()) {
    return 1;
  }
  if (!test_bound_under_contention()) {
    return 1;
  }
  return 0;
}
