#include <cstddef>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include "bread/core/error.hpp"
#include "engine/chunk_reader.hpp"
#include "test_sources.hpp"

namespace {

using bread::engine::ChunkPolicy;
using bread::engine::ChunkReader;
using bread::test::as_string;
using bread::test::ScriptedSource;

bread::Expected<std::vector<std::string>> read_all(bread::IByteSource& source,
                                                   ChunkPolicy policy) {
  ChunkReader reader(source, policy);
  std::vector<std::string> chunks;
  std::vector<std::byte> buf;
  for (;;) {
    auto more = reader.next(buf);
    if (!more) {
      return bread::unexpected(more.error());
    }
    if (!*more) {
      return chunks;
    }
    chunks.push_back(as_string(buf));
  }
}

bool expect_chunks(const char* name, const bread::Expected<std::vector<std::string>>& got,
                   const std::vector<std::string>& want) {
  if (!got) {
    std::cerr << std::format("{}: unexpected error: {}\n", name, got.error().what());
    return false;
  }
  if (*got != want) {
    std::cerr << std::format("{}: got {} chunks, want {}\n", name, got->size(), want.size());
    for (const auto& c : *got) {
      std::cerr << std::format("  [{}]\n", c);
    }
    return false;
  }
  return true;
}

bool test_tiny_buffer_without_delimiter() {
  ScriptedSource source({"hello"});
  return expect_chunks("tiny buffer",
                       read_all(source, ChunkPolicy{.buffer_size = 1, .delimiter = std::byte{'\n'}}),
                       {"hello"});
}

bool test_extends_to_delimiter() {
  ScriptedSource source({"aa\nbbbb\nc\ndd"});
  return expect_chunks("extension",
                       read_all(source, ChunkPolicy{.buffer_size = 2, .delimiter = std::byte{'\n'}}),
                       {"aa\n", "bbbb\n", "c\n", "dd"});
}

bool test_fill_ending_on_delimiter_is_not_extended() {
  ScriptedSource source({"ab\ncd\nef\n"});
  return expect_chunks("aligned fill",
                       read_all(source, ChunkPolicy{.buffer_size = 3, .delimiter = std::byte{'\n'}}),
                       {"ab\n", "cd\n", "ef\n"});
}

bool test_fixed_size_without_delimiter_mode() {
  ScriptedSource source({"abc\nde", "fgh\nij"});
  return expect_chunks(
      "no_delimiter",
      read_all(source, ChunkPolicy{.buffer_size = 4, .delimiter = std::byte{'\n'},
                                   .no_delimiter = true}),
      {"abc\n", "defg", "h\nij"});
}

bool test_short_reads_still_fill() {
  ScriptedSource source({"a", "b", "c", "d", "e", "\n", "f"});
  return expect_chunks("short reads",
                       read_all(source, ChunkPolicy{.buffer_size = 3, .delimiter = std::byte{'\n'}}),
                       {"abcde\n", "f"});
}

bool test_nul_delimiter() {
  ScriptedSource source({std::string("ab\0cd\0", 6)});
  return expect_chunks("nul delimiter",
                       read_all(source, ChunkPolicy{.buffer_size = 1, .delimiter = std::byte{0}}),
                       {std::string("ab\0", 3), std::string("cd\0", 3)});
}

bool test_error_propagates() {
  ScriptedSource source({"abc\n", "de"}, bread::Error{bread::ErrorCode::IoError, "read failed"});
  auto got = read_all(source, ChunkPolicy{.buffer_size = 4, .delimiter = std::byte{'\n'}});
  if (got || got.error().code() != bread::ErrorCode::IoError ||
      got.error().message() != "read failed") {
    std::cerr << std::format("source error should surface from next()\n");
    return false;
  }
  return true;
}

bool test_bytes_read() {
  ScriptedSource source({"12\n34\n"});
  ChunkReader reader(source, ChunkPolicy{.buffer_size = 2, .delimiter = std::byte{'\n'}});
  std::vector<std::byte> buf;
  auto more = reader.next(buf);
  if (!more || !*more || reader.bytes_read() != 3) {
    std::cerr << std::format("bytes_read after first chunk should be 3\n");
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_tiny_buffer_without_delimiter()) {
    return 1;
  }
  if (!test_extends_to_delimiter()) {
    return 1;
  }
  if (!test_fill_ending_on_delimiter_is_not_extended()) {
    return 1;
  }
  if (!test_fixed_size_without_delimiter_mode()) {
    return 1;
  }
  if (!test_short_reads_still_fill()) {
    return 1;
  }
  if (!test_nul_delimiter()) {
    return 1;
  }
  if (!test_error_propagates()) {
    return 1;
  }
  if (!test_bytes_read()) {
    return 1;
  }
  return 0;
}
