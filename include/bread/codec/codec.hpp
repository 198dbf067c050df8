#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "bread/core/expected.hpp"

namespace bread {

enum class CodecId : uint8_t { None = 0, Lz4 = 1, Zstd = 2 };

struct CodecParams {
  CodecId id{CodecId::None};
  int level{0};
};

// Stateless block codec. Instances are safe to share between threads.
class ICodec {
 public:
  virtual ~ICodec() = default;

  virtual CodecId id() const noexcept = 0;
  virtual const char* name() const noexcept = 0;

  virtual Expected<size_t> max_compressed_size(size_t raw_size) const noexcept = 0;

  virtual Expected<size_t> compress(std::span<const std::byte> raw,
                                    std::span<std::byte> out) const noexcept = 0;

  virtual Expected<size_t> decompress(std::span<const std::byte> comp,
                                      std::span<std::byte> out,
                                      size_t expected_raw_size) const noexcept = 0;
};

const char* to_string(CodecId id) noexcept;

Expected<std::unique_ptr<ICodec>> make_codec(const CodecParams& params) noexcept;

Expected<CodecId> parse_codec_id(std::string_view name) noexcept;

}  // namespace bread
