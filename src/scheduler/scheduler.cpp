#include "bread/scheduler/scheduler.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "bread/core/error.hpp"

namespace bread {
namespace {

class BasicScheduler final : public IScheduler {
 public:
  explicit BasicScheduler(SchedulerConfig cfg)
      : queue_depth_(cfg.queue_depth == 0 ? 1u : cfg.queue_depth),
        worker_threads_(cfg.worker_threads == 0 ? 1u : cfg.worker_threads) {}

  ~BasicScheduler() override { static_cast<void>(join()); }

  Expected<void> start() noexcept override {
    {
      std::scoped_lock lock(mu_);
      if (started_) {
        return {};
      }
      accepting_ = true;
      stopping_ = false;
      started_ = true;
    }

    struct ThreadJoinGuard {
      explicit ThreadJoinGuard(std::vector<std::thread>& workers) : workers_(workers) {}

      ~ThreadJoinGuard() {
        if (!active_) {
          return;
        }
        for (auto& thread : workers_) {
          if (thread.joinable()) {
            thread.join();
          }
        }
      }

      void release() noexcept { active_ = false; }

     private:
      std::vector<std::thread>& workers_;
      bool active_{true};
    };

    try {
      std::vector<std::thread> local_workers;
      ThreadJoinGuard join_guard{local_workers};
      try {
        local_workers.reserve(worker_threads_);
        for (uint32_t i = 0; i < worker_threads_; ++i) {
          local_workers.emplace_back([this]() { this->worker_loop(); });
        }
      } catch (const std::exception& ex) {
        {
          std::scoped_lock lock(mu_);
          accepting_ = false;
          stopping_ = true;
          started_ = false;
        }
        cv_not_empty_.notify_all();
        return unexpected(Error{ErrorCode::Internal, ex.what()});
      }

      {
        std::scoped_lock lock(mu_);
        workers_ = std::move(local_workers);
      }
      join_guard.release();
    } catch (const std::exception& ex) {
      return unexpected(Error{ErrorCode::Internal, ex.what()});
    }
    return {};
  }

  Expected<void> submit(Task task) noexcept override {
    std::unique_lock lock(mu_);
    if (!started_) {
      return unexpected(Error{ErrorCode::InvalidArgument, "scheduler has not started"});
    }
    if (!accepting_) {
      return unexpected(Error{ErrorCode::Unsupported, "scheduler is not accepting new tasks"});
    }

    cv_not_full_.wait(lock, [this]() { return queue_.size() < queue_depth_ || stopping_; });
    if (stopping_) {
      return unexpected(Error{ErrorCode::Unsupported, "scheduler is stopping"});
    }

    try {
      queue_.push_back(std::move(task));
    } catch (const std::exception& ex) {
      return unexpected(Error{ErrorCode::Internal, ex.what()});
    }
    cv_not_empty_.notify_one();
    return {};
  }

  Expected<void> stop_issue_new_work() noexcept override {
    std::scoped_lock lock(mu_);
    accepting_ = false;
    cv_not_full_.notify_all();
    return {};
  }

  Expected<void> join() noexcept override {
    std::vector<std::thread> local_workers;
    {
      std::scoped_lock lock(mu_);
      if (!started_) {
        return {};
      }
      accepting_ = false;
      stopping_ = true;
      local_workers.swap(workers_);
      started_ = false;
    }

    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();

    for (auto& t : local_workers) {
      if (t.joinable()) {
        t.join();
      }
    }
    return {};
  }

  uint64_t processed() const noexcept override {
    std::scoped_lock lock(mu_);
    return processed_count_;
  }

  uint64_t failed() const noexcept override {
    std::scoped_lock lock(mu_);
    return failed_count_;
  }

 private:
  // Queued tasks still run after join() is requested; workers exit once the
  // queue is empty.
  void worker_loop() {
    for (;;) {
      Task task;
      {
        std::unique_lock lock(mu_);
        cv_not_empty_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (stopping_ && queue_.empty()) {
          return;
        }
        task = std::move(queue_.front());
        queue_.pop_front();
        cv_not_full_.notify_one();
      }

      bool ok = true;
      try {
        task();
      } catch (...) {
        ok = false;
      }
      task = nullptr;

      {
        std::scoped_lock lock(mu_);
        ++processed_count_;
        if (!ok) {
          ++failed_count_;
        }
      }
    }
  }

  size_t queue_depth_{1};
  uint32_t worker_threads_{1};

  mutable std::mutex mu_;
  std::condition_variable cv_not_empty_;
  std::condition_variable cv_not_full_;

  std::deque<Task> queue_;
  std::vector<std::thread> workers_;
  uint64_t processed_count_{0};
  uint64_t failed_count_{0};

  bool started_{false};
  bool accepting_{false};
  bool stopping_{false};
};

}  // namespace

Expected<std::unique_ptr<IScheduler>> make_scheduler(const SchedulerConfig& cfg) noexcept {
  if (cfg.worker_threads == 0) {
    return unexpected(Error{ErrorCode::InvalidArgument, "worker_threads must be > 0"});
  }
  if (cfg.queue_depth == 0) {
    return unexpected(Error{ErrorCode::InvalidArgument, "queue_depth must be > 0"});
  }

  try {
    return std::unique_ptr<IScheduler>(new BasicScheduler(cfg));
  } catch (const std::exception& ex) {
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

}  // namespace bread
