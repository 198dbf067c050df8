#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bread/core/error.hpp"
#include "bread/io/source.hpp"

namespace bread::test {

inline std::vector<std::byte> to_bytes(std::string_view s) {
  std::vector<std::byte> out(s.size());
  std::transform(s.begin(), s.end(), out.begin(),
                 [](char c) { return static_cast<std::byte>(c); });
  return out;
}

inline std::string as_string(std::span<const std::byte> bytes) {
  std::string out(bytes.size(), '\0');
  std::transform(bytes.begin(), bytes.end(), out.begin(),
                 [](std::byte b) { return static_cast<char>(b); });
  return out;
}

// Chunk lengths a sequential splitter produces for data: fill buffer_size
// bytes, then extend through the next delimiter unless the fill already ends
// on one.
inline std::vector<size_t> reference_chunk_sizes(std::span<const std::byte> data,
                                                 size_t buffer_size, std::byte delim,
                                                 bool no_delimiter) {
  std::vector<size_t> sizes;
  size_t pos = 0;
  while (pos < data.size()) {
    size_t end = std::min(pos + buffer_size, data.size());
    if (!no_delimiter && data[end - 1] != delim) {
      auto hit = std::find(data.begin() + static_cast<std::ptrdiff_t>(end), data.end(), delim);
      end = hit == data.end() ? data.size() : static_cast<size_t>(hit - data.begin()) + 1;
    }
    sizes.push_back(end - pos);
    pos = end;
  }
  return sizes;
}

// Serves each fragment through one or more reads (never crossing into the
// next fragment), then reports failure if one is set, else end of source.
class ScriptedSource final : public IByteSource {
 public:
  explicit ScriptedSource(std::vector<std::string> fragments,
                          std::optional<Error> failure = std::nullopt)
      : fragments_(std::move(fragments)), failure_(std::move(failure)) {}

  Expected<size_t> read(std::span<std::byte> out) noexcept override {
    ++reads_;
    while (index_ < fragments_.size() && offset_ == fragments_[index_].size()) {
      ++index_;
      offset_ = 0;
    }
    if (index_ == fragments_.size()) {
      if (failure_) {
        return unexpected(*failure_);
      }
      return size_t{0};
    }

    const auto& frag = fragments_[index_];
    const size_t n = std::min(out.size(), frag.size() - offset_);
    for (size_t i = 0; i < n; ++i) {
      out[i] = static_cast<std::byte>(frag[offset_ + i]);
    }
    offset_ += n;
    return n;
  }

  uint64_t reads() const noexcept { return reads_; }

 private:
  std::vector<std::string> fragments_;
  std::optional<Error> failure_;
  size_t index_{0};
  size_t offset_{0};
  uint64_t reads_{0};
};

}  // namespace bread::test
