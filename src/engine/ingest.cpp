#include "bread/engine/ingest.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <span>
#include <utility>

#include "bread/core/error.hpp"
#include "bread/engine/coordinator.hpp"
#include "bread/pool/buffer_pool.hpp"
#include "bread/scheduler/gate.hpp"
#include "bread/scheduler/scheduler.hpp"
#include "engine/chunk_reader.hpp"

namespace bread {
namespace {

// State shared between the read loop and the tasks it launches. Lives until
// the coordinator has seen every task finish.
struct Session {
  explicit Session(const Config& cfg)
      : pool(cfg.buffer_size, cfg.buffer_seed), gate(cfg.workers) {}

  BufferPool pool;
  Gate gate;
  Coordinator coordinator;
  std::atomic<uint64_t> callback_failures{0};
};

}  // namespace

Expected<Config> validate(const Config& cfg,
                          const std::shared_ptr<Context>& ctx,
                          const IByteSource* source) noexcept {
  if (!ctx) {
    return unexpected(Error{ErrorCode::MissingContext, "missing context"});
  }
  if (source == nullptr) {
    return unexpected(Error{ErrorCode::NilSource, "nil byte source"});
  }
  if (!cfg.process) {
    return unexpected(Error{ErrorCode::MissingCallback, "missing process callback"});
  }
  if (cfg.buffer_size == 0) {
    return unexpected(Error{ErrorCode::MissingBufferSize, "missing buffer size"});
  }

  try {
    Config out = cfg;
    if (out.workers == 0) {
      out.workers = kDefaultWorkers;
    }
    if (!out.delimiter) {
      out.delimiter = kDefaultDelimiter;
    }
    return out;
  } catch (const std::exception& ex) {
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

Expected<void> ingest(const Config& cfg,
                      const std::shared_ptr<Context>& ctx,
                      IByteSource* source,
                      IngestStats* stats) noexcept {
  auto valid = validate(cfg, ctx, source);
  if (!valid) {
    return unexpected(valid.error());
  }
  const Config& c = *valid;
  Context& context = *ctx;

  std::unique_ptr<Session> session;
  try {
    session = std::make_unique<Session>(c);
  } catch (const std::exception& ex) {
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }
  Session& s = *session;

  std::unique_ptr<engine::ChunkReader> reader;
  try {
    reader = std::make_unique<engine::ChunkReader>(
        *source, engine::ChunkPolicy{c.buffer_size, *c.delimiter, c.no_delimiter});
  } catch (const std::exception& ex) {
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }

  auto scheduler = make_scheduler(SchedulerConfig{.worker_threads = c.workers,
                                                  .queue_depth = c.workers});
  if (!scheduler) {
    return unexpected(scheduler.error());
  }
  if (auto started = (*scheduler)->start(); !started) {
    return unexpected(started.error());
  }

  Expected<void> loop_result{};
  uint64_t sequence = 0;
  uint64_t delivered = 0;

  // Cancellation is checked once per chunk, never inside a fill.
  while (!context.done()) {
    try {
      PooledBuffer buffer = s.pool.acquire();
      auto more = reader->next(buffer.bytes());
      if (!more) {
        loop_result = unexpected(more.error());
        break;
      }
      if (!*more) {
        break;
      }

      const size_t size = buffer.bytes().size();
      Task task = [&s, &process = c.process, &context, buffer = std::move(buffer),
                   sequence]() mutable {
        Chunk chunk{std::span<std::byte>(buffer.bytes()), sequence};
        try {
          process(context, chunk);
        } catch (...) {
          s.callback_failures.fetch_add(1, std::memory_order_relaxed);
        }
        buffer.reset();
        s.gate.release();
        s.coordinator.finished();
      };

      s.gate.acquire();
      if (context.done()) {
        s.gate.release();
        break;
      }

      s.coordinator.launched();
      if (auto submitted = (*scheduler)->submit(std::move(task)); !submitted) {
        s.gate.release();
        s.coordinator.finished();
        loop_result = unexpected(submitted.error());
        break;
      }

      ++sequence;
      delivered += size;
    } catch (const std::exception& ex) {
      loop_result = unexpected(Error{ErrorCode::Internal, ex.what()});
      break;
    }
  }

  if (auto stopped = (*scheduler)->stop_issue_new_work(); !stopped && loop_result) {
    loop_result = unexpected(stopped.error());
  }

  auto result = s.coordinator.await(context, std::move(loop_result));

  if (auto joined = (*scheduler)->join(); !joined && result) {
    result = unexpected(joined.error());
  }

  if (stats != nullptr) {
    stats->chunks = sequence;
    stats->bytes = delivered;
    stats->peak_in_flight = s.gate.peak();
    stats->buffers_allocated = s.pool.allocations();
    stats->callback_failures = s.callback_failures.load(std::memory_order_relaxed);
    stats->state = s.coordinator.state();
  }
  return result;
}

}  // namespace bread
