#include <format>
#include <iostream>
#include <memory>

#include "bread/core/context.hpp"
#include "bread/core/error.hpp"
#include "bread/core/units.hpp"
#include "bread/engine/ingest.hpp"
#include "test_sources.hpp"

namespace {

bread::Config valid_config() {
  bread::Config cfg{};
  cfg.process = [](const bread::Context&, bread::Chunk&) {};
  cfg.buffer_size = static_cast<uint32_t>(bread::KB);
  return cfg;
}

bool expect_rejected(const char* label,
                     const bread::Config& cfg,
                     const std::shared_ptr<bread::Context>& ctx,
                     bread::test::ScriptedSource* source,
                     bread::ErrorCode expected) {
  int calls = 0;
  bread::Config counted = cfg;
  if (counted.process) {
    counted.process = [&calls](const bread::Context&, bread::Chunk&) { ++calls; };
  }

  auto r = bread::ingest(counted, ctx, source);
  if (r) {
    std::cerr << std::format("{}: expected {} but ingest succeeded\n", label,
                             bread::to_string(expected));
    return false;
  }
  if (r.error().code() != expected) {
    std::cerr << std::format("{}: expected {}, got {}\n", label, bread::to_string(expected),
                             bread::to_string(r.error().code()));
    return false;
  }
  if (source != nullptr && source->reads() != 0) {
    std::cerr << std::format("{}: source was read {} times\n", label, source->reads());
    return false;
  }
  if (calls != 0) {
    std::cerr << std::format("{}: callback ran {} times\n", label, calls);
    return false;
  }
  return true;
}

bool test_missing_fields_rejected() {
  auto ctx = bread::Context::background();

  bread::test::ScriptedSource s1({"a\nb\n"});
  if (!expect_rejected("nil context", valid_config(), nullptr, &s1,
                       bread::ErrorCode::MissingContext)) {
    return false;
  }

  if (!expect_rejected("nil source", valid_config(), ctx, nullptr,
                       bread::ErrorCode::NilSource)) {
    return false;
  }

  bread::Config no_callback = valid_config();
  no_callback.process = nullptr;
  bread::test::ScriptedSource s2({"a\nb\n"});
  if (!expect_rejected("missing callback", no_callback, ctx, &s2,
                       bread::ErrorCode::MissingCallback)) {
    return false;
  }

  bread::Config no_size = valid_config();
  no_size.buffer_size = 0;
  bread::test::ScriptedSource s3({"a\nb\n"});
  if (!expect_rejected("missing buffer size", no_size, ctx, &s3,
                       bread::ErrorCode::MissingBufferSize)) {
    return false;
  }
  return true;
}

bool test_check_order() {
  // Nothing set at all: the context is checked first, then the source.
  bread::Config empty{};
  auto r = bread::validate(empty, nullptr, nullptr);
  if (r || r.error().code() != bread::ErrorCode::MissingContext) {
    std::cerr << std::format("empty config with nil context should report missing_context\n");
    return false;
  }
  r = bread::validate(empty, bread::Context::background(), nullptr);
  if (r || r.error().code() != bread::ErrorCode::NilSource) {
    std::cerr << std::format("empty config with nil source should report nil_source\n");
    return false;
  }
  return true;
}

bool test_defaults_applied() {
  bread::test::ScriptedSource source({});
  auto ctx = bread::Context::background();

  bread::Config cfg = valid_config();
  cfg.buffer_seed = 7;
  auto r = bread::validate(cfg, ctx, &source);
  if (!r) {
    std::cerr << std::format("validate failed: {}\n", r.error().message());
    return false;
  }
  if (r->workers != bread::kDefaultWorkers) {
    std::cerr << std::format("workers default: expected 1, got {}\n", r->workers);
    return false;
  }
  if (!r->delimiter || *r->delimiter != std::byte{'\n'}) {
    std::cerr << std::format("delimiter should default to newline\n");
    return false;
  }
  if (r->buffer_seed != 7 || r->buffer_size != bread::KB || r->no_delimiter) {
    std::cerr << std::format("validate must not touch fields other than workers/delimiter\n");
    return false;
  }

  cfg.workers = 12;
  cfg.delimiter = std::byte{0};
  r = bread::validate(cfg, ctx, &source);
  if (!r || r->workers != 12 || !r->delimiter || *r->delimiter != std::byte{0}) {
    std::cerr << std::format("explicit workers and NUL delimiter must be kept\n");
    return false;
  }
  if (source.reads() != 0) {
    std::cerr << std::format("validate must not read the source\n");
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_missing_fields_rejected()) {
    return 1;
  }
  if (!test_check_order()) {
    return 1;
  }
  if (!test_defaults_applied()) {
    return 1;
  }
  return 0;
}
