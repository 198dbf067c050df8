#include "bench/bench.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include <vector>

#include "app/math_utils.hpp"
#include "bread/core/context.hpp"
#include "bread/core/error.hpp"
#include "bread/engine/ingest.hpp"
#include "generator/pattern_source.hpp"

namespace bread {

Expected<BenchResult> run_ingest_bench(const BenchConfig& cfg) noexcept {
  if (cfg.source_bytes == 0) {
    return unexpected(Error{ErrorCode::InvalidArgument, "source_bytes must be > 0"});
  }

  try {
    app::PatternSource source(app::PatternProfile{.total_bytes = cfg.source_bytes,
                                                  .period = cfg.record_period,
                                                  .fill = std::byte{'O'},
                                                  .delimiter = cfg.delimiter});

    Config ingest_cfg{};
    ingest_cfg.process = [](const Context&, Chunk&) {};
    ingest_cfg.workers = cfg.workers;
    ingest_cfg.buffer_seed = cfg.buffer_seed;
    ingest_cfg.buffer_size = cfg.buffer_size;
    ingest_cfg.delimiter = cfg.delimiter;

    BenchResult out{};
    const auto t0 = std::chrono::steady_clock::now();
    auto run = ingest(ingest_cfg, Context::background(), &source, &out.stats);
    const auto t1 = std::chrono::steady_clock::now();
    if (!run) {
      return unexpected(run.error());
    }

    out.wall_sec = std::chrono::duration<double>(t1 - t0).count();
    out.eff_gbps = app::to_gbps(out.stats.bytes, out.wall_sec);
    return out;
  } catch (const std::exception& ex) {
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

AggregateMetrics summarize_repeats(std::span<const BenchResult> repeats) noexcept {
  try {
    std::vector<double> eff_values;
    eff_values.reserve(repeats.size());
    for (const auto& r : repeats) {
      eff_values.push_back(r.eff_gbps);
    }
    return app::calc_stats(std::move(eff_values));
  } catch (const std::exception&) {
    return AggregateMetrics{};
  }
}

}  // namespace bread
