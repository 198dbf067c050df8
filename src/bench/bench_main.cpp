#include <algorithm>
#include <cstdint>
#include <exception>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include "bench/bench.hpp"
#include "bread/core/error.hpp"
#include "bread/core/units.hpp"

namespace {

struct Scenario {
  const char* name;
  bread::BenchConfig cfg;
};

std::vector<Scenario> default_scenarios(uint64_t scale_mib) {
  std::vector<Scenario> out;
  bread::BenchConfig wide{};
  wide.workers = 16;
  wide.buffer_seed = 0;
  wide.buffer_size = static_cast<uint32_t>(bread::MB);
  wide.source_bytes = scale_mib == 0 ? 5 * bread::GB : 5 * scale_mib * bread::MB;
  out.push_back({"16 workers, 1 MiB buffers", wide});

  bread::BenchConfig narrow{};
  narrow.workers = 3;
  narrow.buffer_seed = 3;
  narrow.buffer_size = static_cast<uint32_t>(bread::MB);
  narrow.source_bytes = scale_mib == 0 ? bread::GB : scale_mib * bread::MB;
  out.push_back({"3 workers, 3 seeded 1 MiB buffers", narrow});
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  argparse::ArgumentParser program("bread_bench");
  program.add_argument("--repeats").scan<'u', uint32_t>().default_value(static_cast<uint32_t>(3));
  program.add_argument("--scale-mib")
      .scan<'u', uint64_t>()
      .default_value(static_cast<uint64_t>(0))
      .help("shrink sources to N MiB (first scenario 5N MiB); 0 keeps 5 GiB / 1 GiB");

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return 2;
  }

  const auto repeats = std::max(1u, program.get<uint32_t>("--repeats"));
  const auto scale_mib = program.get<uint64_t>("--scale-mib");

  for (const auto& scenario : default_scenarios(scale_mib)) {
    std::cout << std::format("== {} ({} MiB)\n", scenario.name,
                             scenario.cfg.source_bytes / bread::MB);
    std::vector<bread::BenchResult> results;
    results.reserve(repeats);
    for (uint32_t i = 0; i < repeats; ++i) {
      auto r = bread::run_ingest_bench(scenario.cfg);
      if (!r) {
        std::cerr << std::format("error: {}\n", r.error().message());
        return 1;
      }
      std::cout << std::format("  repeat {}: {:.3f} GB/s, {} chunks, {} buffers, peak {}\n", i,
                               r->eff_gbps, r->stats.chunks, r->stats.buffers_allocated,
                               r->stats.peak_in_flight);
      results.push_back(*r);
    }

    const auto m = bread::summarize_repeats(results);
    std::cout << std::format("  mean {:.3f}  median {:.3f}  p95 {:.3f}  min {:.3f}  max {:.3f} GB/s\n",
                             m.mean, m.median, m.p95, m.min, m.max);
  }
  return 0;
}
