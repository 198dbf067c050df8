#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "app/config_types.hpp"
#include "bread/core/context.hpp"
#include "bread/core/error.hpp"
#include "bread/core/expected.hpp"
#include "bread/io/source.hpp"

int run_cli_impl(int argc, char** argv);

namespace bread::app {

bread::Expected<Config> parse_args(int argc, char** argv);

void install_signal_handlers();
bool interrupt_requested() noexcept;

// 130 for cancellation and deadline expiry, 1 for every other failure.
int exit_code_for(const Error& error) noexcept;

// Saturates instead of overflowing for timeouts beyond the nanosecond range.
std::chrono::nanoseconds timeout_from_ms(uint64_t ms) noexcept;
bread::Expected<std::byte> parse_delimiter(std::string_view text) noexcept;

// Ingests source with the CLI's per-chunk stage: hash, count records and,
// when a codec is configured, compress. A stage failure cancels the run and
// is returned in place of the cancellation it caused.
bread::Expected<RunSummary> run_ingest(const Config& cfg,
                                       const std::shared_ptr<Context>& ctx,
                                       IByteSource& source);

}  // namespace bread::app
