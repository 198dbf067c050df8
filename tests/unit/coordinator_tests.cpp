#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <thread>
#include <utility>

#include "bread/core/context.hpp"
#include "bread/core/error.hpp"
#include "bread/engine/coordinator.hpp"

namespace {

using namespace std::chrono_literals;

bool test_await_waits_for_finished() {
  bread::Coordinator coord;
  auto ctx = bread::Context::background();

  constexpr int kUnits = 4;
  std::atomic<int> finished{0};
  for (int i = 0; i < kUnits; ++i) {
    coord.launched();
  }

  std::thread workers([&]() {
    for (int i = 0; i < kUnits; ++i) {
      std::this_thread::sleep_for(5ms);
      finished.fetch_add(1);
      coord.finished();
    }
  });

  auto result = coord.await(*ctx, {});
  const int seen = finished.load();
  workers.join();

  if (!result) {
    std::cerr << std::format("await failed: {}\n", result.error().what());
    return false;
  }
  if (seen != kUnits || coord.outstanding() != 0) {
    std::cerr << std::format("await returned with {} of {} finished\n", seen, kUnits);
    return false;
  }
  if (coord.state() != bread::IngestState::Completed) {
    std::cerr << std::format("state should be completed, got {}\n",
                             bread::to_string(coord.state()));
    return false;
  }
  return true;
}

bool test_result_reported_once() {
  bread::Coordinator coord;
  auto ctx = bread::Context::background();
  if (!coord.await(*ctx, {})) {
    std::cerr << std::format("first await should succeed\n");
    return false;
  }
  auto again = coord.await(*ctx, {});
  if (again || again.error().code() != bread::ErrorCode::Internal) {
    std::cerr << std::format("second await should be rejected\n");
    return false;
  }
  return true;
}

bool test_loop_failure_wins_over_cancel() {
  bread::Coordinator coord;
  auto ctx = bread::Context::with_cancel(bread::Context::background());
  ctx->cancel();

  bread::Expected<void> failed = bread::unexpected(bread::Error{bread::ErrorCode::IoError, "disk"});
  auto result = coord.await(*ctx, std::move(failed));
  if (result || result.error().code() != bread::ErrorCode::IoError ||
      result.error().message() != "disk") {
    std::cerr << std::format("loop error should be returned verbatim\n");
    return false;
  }
  if (coord.state() != bread::IngestState::Failed) {
    std::cerr << std::format("state should be failed, got {}\n", bread::to_string(coord.state()));
    return false;
  }
  return true;
}

bool test_cancelled_context() {
  bread::Coordinator coord;
  auto ctx = bread::Context::with_cancel(bread::Context::background());
  coord.launched();
  ctx->cancel();
  coord.finished();

  auto result = coord.await(*ctx, {});
  if (result || result.error().code() != bread::ErrorCode::Cancelled) {
    std::cerr << std::format("await should report cancellation\n");
    return false;
  }
  if (coord.state() != bread::IngestState::Cancelled) {
    std::cerr << std::format("state should be cancelled, got {}\n",
                             bread::to_string(coord.state()));
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_await_waits_for_finished()) {
    return 1;
  }
  if (!test_result_reported_once()) {
    return 1;
  }
  if (!test_loop_failure_wins_over_cancel()) {
    return 1;
  }
  if (!test_cancelled_context()) {
    return 1;
  }
  return 0;
}
