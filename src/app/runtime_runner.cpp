#include "app/runtime_runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <signal.h>
#include <unistd.h>

#include <argparse/argparse.hpp>

#include "app/math_utils.hpp"
#include "bread/codec/codec.hpp"
#include "bread/core/error.hpp"
#include "bread/engine/ingest.hpp"
#include "sink/hash_sink.hpp"

namespace {

using Clock = std::chrono::steady_clock;

using bread::Error;
using bread::ErrorCode;
using bread::app::Config;
using bread::app::RunSummary;

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) { g_interrupted.store(true, std::memory_order_relaxed); }

// First failure reported by any chunk task.
class FailureSlot {
 public:
  void record(Error e) {
    std::scoped_lock lock(mu_);
    if (!error_) {
      error_ = std::move(e);
    }
  }

  std::optional<Error> take() {
    std::scoped_lock lock(mu_);
    return std::exchange(error_, std::nullopt);
  }

 private:
  std::mutex mu_;
  std::optional<Error> error_;
};

void print_summary(const Config& cfg, const RunSummary& s) {
  std::cout << std::format("chunks            {}\n", s.chunks)
            << std::format("bytes             {}\n", s.bytes)
            << std::format("largest chunk     {}\n", s.largest_chunk);
  if (!cfg.no_delimiter) {
    std::cout << std::format("records           {}\n", s.records);
  }
  std::cout << std::format("digest            {:016x}\n", s.digest)
            << std::format("peak in flight    {} / {}\n", s.peak_in_flight, cfg.workers)
            << std::format("buffers allocated {}\n", s.buffers_allocated)
            << std::format("wall              {:.3f} s\n", s.wall_sec)
            << std::format("throughput        {:.3f} GB/s\n",
                           bread::app::to_gbps(s.bytes, s.wall_sec));
  if (cfg.codec != bread::CodecId::None) {
    const double ratio = s.compressed_bytes == 0
                             ? 0.0
                             : static_cast<double>(s.bytes) /
                                   static_cast<double>(s.compressed_bytes);
    std::cout << std::format("{:<17} {} bytes (ratio {:.2f})\n", bread::to_string(cfg.codec),
                             s.compressed_bytes, ratio);
    if (cfg.verify) {
      std::cout << std::format("verified          {} chunks\n", s.verified_chunks);
    }
  }
  if (s.callback_failures > 0) {
    std::cout << std::format("callback failures {}\n", s.callback_failures);
  }
}

}  // namespace

namespace bread::app {

// The first SIGINT/SIGTERM requests cancellation; SA_RESETHAND restores the
// default action, so a second signal ends the process even while a read is
// blocked.
void install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_interrupt;
  sa.sa_flags = SA_RESETHAND;
  sigemptyset(&sa.sa_mask);
  for (const int sig : {SIGINT, SIGTERM}) {
    if (::sigaction(sig, &sa, nullptr) != 0) {
      std::cerr << std::format("[warn] cannot install handler for signal {}\n", sig);
    }
  }
}

bool interrupt_requested() noexcept { return g_interrupted.load(std::memory_order_relaxed); }

int exit_code_for(const Error& error) noexcept {
  switch (error.code()) {
    case ErrorCode::Cancelled:
    case ErrorCode::DeadlineExceeded:
      return 130;
    default:
      return 1;
  }
}

std::chrono::nanoseconds timeout_from_ms(uint64_t ms) noexcept {
  constexpr auto kMaxMs = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max())
          .count());
  if (ms >= kMaxMs) {
    return std::chrono::nanoseconds::max();
  }
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
}

bread::Expected<std::byte> parse_delimiter(std::string_view text) noexcept {
  if (text.size() == 1) {
    return static_cast<std::byte>(text.front());
  }
  if (text == "\\n") {
    return std::byte{'\n'};
  }
  if (text == "\\t") {
    return std::byte{'\t'};
  }
  if (text == "\\r") {
    return std::byte{'\r'};
  }
  if (text == "\\0") {
    return std::byte{0};
  }
  return unexpected(Error{ErrorCode::InvalidArgument,
                          "delimiter must be a single byte or one of \\n \\t \\r \\0"});
}

bread::Expected<Config> parse_args(int argc, char** argv) {
  Config cfg{};

  argparse::ArgumentParser program("bread");
  program.add_description("Reads a stream in delimiter-aligned chunks processed by a bounded worker pool.");
  program.add_argument("-i", "--input").default_value(std::string("-")).help("file to read, - for stdin");
  program.add_argument("-w", "--workers").scan<'u', uint32_t>().default_value(cfg.workers);
  program.add_argument("--buffer-size").default_value(std::string("1MiB"));
  program.add_argument("--buffer-seed").scan<'u', uint32_t>().default_value(cfg.buffer_seed);
  program.add_argument("--delimiter").default_value(std::string("\\n"));
  program.add_argument("--no-delimiter").default_value(false).implicit_value(true);
  program.add_argument("--codec").default_value(std::string("none")).help("none|lz4|zstd");
  program.add_argument("--level").scan<'i', int>().default_value(cfg.codec_level);
  program.add_argument("--verify")
      .default_value(false)
      .implicit_value(true)
      .help("decompress each chunk and compare it with the input");
  program.add_argument("--seed").scan<'u', uint64_t>().default_value(cfg.seed);
  program.add_argument("--timeout-ms").scan<'u', uint64_t>().default_value(cfg.timeout_ms);
  program.add_argument("-q", "--quiet").default_value(false).implicit_value(true);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return unexpected(Error{ErrorCode::InvalidArgument, "argument parsing failed"});
  }

  cfg.input = program.get<std::string>("--input");
  cfg.workers = program.get<uint32_t>("--workers");
  if (cfg.workers == 0) {
    return unexpected(Error{ErrorCode::InvalidArgument, "--workers must be > 0"});
  }
  cfg.buffer_seed = program.get<uint32_t>("--buffer-seed");

  auto size = parse_size(program.get<std::string>("--buffer-size"));
  if (!size) {
    return unexpected(size.error());
  }
  if (*size == 0 || *size > UINT32_MAX) {
    return unexpected(Error{ErrorCode::InvalidArgument, "--buffer-size must be in (0, 4GiB)"});
  }
  cfg.buffer_size = static_cast<uint32_t>(*size);

  auto delim = parse_delimiter(program.get<std::string>("--delimiter"));
  if (!delim) {
    return unexpected(delim.error());
  }
  cfg.delimiter = *delim;
  cfg.no_delimiter = program.get<bool>("--no-delimiter");

  auto codec = parse_codec_id(program.get<std::string>("--codec"));
  if (!codec) {
    return unexpected(codec.error());
  }
  cfg.codec = *codec;
  cfg.codec_level = program.get<int>("--level");
  cfg.verify = program.get<bool>("--verify");
  cfg.seed = program.get<uint64_t>("--seed");
  cfg.timeout_ms = program.get<uint64_t>("--timeout-ms");
  cfg.quiet = program.get<bool>("--quiet");
  return cfg;
}

bread::Expected<RunSummary> run_ingest(const Config& cfg,
                                       const std::shared_ptr<Context>& ctx,
                                       IByteSource& source) {
  std::unique_ptr<ICodec> codec;
  if (cfg.codec != CodecId::None) {
    auto made = make_codec(CodecParams{.id = cfg.codec, .level = cfg.codec_level});
    if (!made) {
      return unexpected(made.error());
    }
    codec = std::move(*made);
  }

  auto run_ctx = Context::with_cancel(ctx);
  HashSink sink(cfg.seed,
                cfg.no_delimiter ? std::nullopt : std::optional<std::byte>(cfg.delimiter));
  FailureSlot failure;
  std::atomic<uint64_t> compressed{0};
  std::atomic<uint64_t> verified{0};

  bread::Config ingest_cfg{};
  ingest_cfg.workers = cfg.workers;
  ingest_cfg.buffer_seed = cfg.buffer_seed;
  ingest_cfg.buffer_size = cfg.buffer_size;
  ingest_cfg.delimiter = cfg.delimiter;
  ingest_cfg.no_delimiter = cfg.no_delimiter;
  ingest_cfg.process = [&](const Context& chunk_ctx, Chunk& chunk) {
    if (chunk_ctx.done()) {
      return;
    }
    sink.consume(chunk);
    if (!codec) {
      return;
    }

    thread_local std::vector<std::byte> scratch;
    auto bound = codec->max_compressed_size(chunk.bytes.size());
    if (!bound) {
      failure.record(bound.error());
      run_ctx->cancel();
      return;
    }
    scratch.resize(*bound);
    auto n = codec->compress(chunk.bytes, scratch);
    if (!n) {
      failure.record(n.error());
      run_ctx->cancel();
      return;
    }
    compressed.fetch_add(*n, std::memory_order_relaxed);
    if (!cfg.verify) {
      return;
    }

    thread_local std::vector<std::byte> restored;
    restored.resize(chunk.bytes.size());
    auto back = codec->decompress(std::span<const std::byte>(scratch.data(), *n), restored,
                                  chunk.bytes.size());
    if (!back) {
      failure.record(back.error());
      run_ctx->cancel();
      return;
    }
    if (*back != chunk.bytes.size() ||
        !std::equal(chunk.bytes.begin(), chunk.bytes.end(), restored.begin())) {
      failure.record(Error{ErrorCode::CodecError,
                           std::format("{} roundtrip mismatch in chunk {}",
                                       codec->name(), chunk.sequence)});
      run_ctx->cancel();
      return;
    }
    verified.fetch_add(1, std::memory_order_relaxed);
  };

  IngestStats stats{};
  const auto t0 = Clock::now();
  auto result = ingest(ingest_cfg, run_ctx, &source, &stats);
  const auto t1 = Clock::now();

  if (auto stage_error = failure.take()) {
    return unexpected(std::move(*stage_error));
  }
  if (!result) {
    return unexpected(result.error());
  }

  RunSummary out{};
  out.chunks = stats.chunks;
  out.bytes = stats.bytes;
  const SinkTotals totals = sink.totals();
  out.records = totals.records;
  out.largest_chunk = totals.largest_chunk;
  out.compressed_bytes = compressed.load(std::memory_order_relaxed);
  out.verified_chunks = verified.load(std::memory_order_relaxed);
  out.digest = totals.digest;
  out.peak_in_flight = stats.peak_in_flight;
  out.buffers_allocated = stats.buffers_allocated;
  out.callback_failures = stats.callback_failures;
  out.wall_sec = std::chrono::duration<double>(t1 - t0).count();
  return out;
}

}  // namespace bread::app

int run_cli_impl(int argc, char** argv) {
  auto cfg = bread::app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().message() << "\n";
    return 2;
  }

  std::unique_ptr<bread::IByteSource> source;
  auto opened = cfg->input == "-" ? bread::make_fd_source(STDIN_FILENO)
                                  : bread::open_file_source(cfg->input);
  if (!opened) {
    std::cerr << "error: " << opened.error().message() << "\n";
    return 1;
  }
  source = std::move(*opened);

  auto ctx = bread::Context::background();
  if (cfg->timeout_ms > 0) {
    ctx = bread::Context::with_timeout(ctx, bread::app::timeout_from_ms(cfg->timeout_ms));
  }
  auto cli_ctx = bread::Context::with_cancel(ctx);

  bread::app::install_signal_handlers();
  std::jthread watcher([cli_ctx](std::stop_token stop) {
    while (!stop.stop_requested()) {
      if (bread::app::interrupt_requested()) {
        cli_ctx->cancel();
        return;
      }
      if (cli_ctx->wait_for(std::chrono::milliseconds(50))) {
        return;
      }
    }
  });

  auto run = bread::app::run_ingest(*cfg, cli_ctx, *source);
  watcher.request_stop();
  watcher.join();

  if (!run) {
    std::cerr << std::format("error: {} ({})\n", run.error().message(),
                             bread::to_string(run.error().code()));
    return bread::app::exit_code_for(run.error());
  }

  if (!cfg->quiet) {
    print_summary(*cfg, *run);
  }
  return 0;
}
