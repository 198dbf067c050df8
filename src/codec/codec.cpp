#include "bread/codec/codec.hpp"

#include <cstring>
#include <exception>
#include <limits>
#include <string>

#include <lz4.h>
#include <zstd.h>

#include "bread/core/error.hpp"

namespace bread {
namespace {

constexpr size_t kLz4MaxInputSize = static_cast<size_t>(std::numeric_limits<int>::max());

bool exceeds_lz4_bound(size_t size) { return size > kLz4MaxInputSize; }

class NoneCodec final : public ICodec {
 public:
  CodecId id() const noexcept override { return CodecId::None; }
  const char* name() const noexcept override { return to_string(CodecId::None); }

  Expected<size_t> max_compressed_size(size_t raw_size) const noexcept override {
    return raw_size;
  }

  Expected<size_t> compress(std::span<const std::byte> raw,
                            std::span<std::byte> out) const noexcept override {
    if (out.size() < raw.size()) {
      return unexpected(Error{ErrorCode::InvalidArgument, "output buffer too small"});
    }
    if (!raw.empty()) {
      std::memcpy(out.data(), raw.data(), raw.size());
    }
    return raw.size();
  }

  Expected<size_t> decompress(std::span<const std::byte> comp,
                              std::span<std::byte> out,
                              size_t expected_raw_size) const noexcept override {
    if (comp.size() != expected_raw_size || out.size() < expected_raw_size) {
      return unexpected(Error{ErrorCode::InvalidArgument, "none codec size mismatch"});
    }
    if (expected_raw_size > 0) {
      std::memcpy(out.data(), comp.data(), expected_raw_size);
    }
    return expected_raw_size;
  }
};

class Lz4Codec final : public ICodec {
 public:
  CodecId id() const noexcept override { return CodecId::Lz4; }
  const char* name() const noexcept override { return to_string(CodecId::Lz4); }

  Expected<size_t> max_compressed_size(size_t raw_size) const noexcept override {
    if (exceeds_lz4_bound(raw_size)) {
      return unexpected(Error{ErrorCode::InvalidArgument, "lz4 raw size exceeds int range"});
    }
    return static_cast<size_t>(LZ4_compressBound(static_cast<int>(raw_size)));
  }

  Expected<size_t> compress(std::span<const std::byte> raw,
                            std::span<std::byte> out) const noexcept override {
    if (exceeds_lz4_bound(raw.size()) || exceeds_lz4_bound(out.size())) {
      return unexpected(Error{ErrorCode::InvalidArgument, "lz4 input/output buffer too large"});
    }
    const int n = LZ4_compress_default(reinterpret_cast<const char*>(raw.data()),
                                       reinterpret_cast<char*>(out.data()),
                                       static_cast<int>(raw.size()),
                                       static_cast<int>(out.size()));
    if (n <= 0) {
      return unexpected(Error{ErrorCode::CodecError, "lz4 compress failed"});
    }
    return static_cast<size_t>(n);
  }

  Expected<size_t> decompress(std::span<const std::byte> comp,
                              std::span<std::byte> out,
                              size_t expected_raw_size) const noexcept override {
    if (exceeds_lz4_bound(comp.size()) || exceeds_lz4_bound(out.size())) {
      return unexpected(Error{ErrorCode::InvalidArgument, "lz4 input/output buffer too large"});
    }
    const int n = LZ4_decompress_safe(reinterpret_cast<const char*>(comp.data()),
                                      reinterpret_cast<char*>(out.data()),
                                      static_cast<int>(comp.size()),
                                      static_cast<int>(out.size()));
    if (n < 0 || static_cast<size_t>(n) != expected_raw_size) {
      return unexpected(Error{ErrorCode::CodecError, "lz4 decompress failed"});
    }
    return static_cast<size_t>(n);
  }
};

class ZstdCodec final : public ICodec {
 public:
  explicit ZstdCodec(int level) : level_(level) {}

  CodecId id() const noexcept override { return CodecId::Zstd; }
  const char* name() const noexcept override { return to_string(CodecId::Zstd); }

  Expected<size_t> max_compressed_size(size_t raw_size) const noexcept override {
    return ZSTD_compressBound(raw_size);
  }

  Expected<size_t> compress(std::span<const std::byte> raw,
                            std::span<std::byte> out) const noexcept override {
    const size_t n = ZSTD_compress(out.data(), out.size(), raw.data(), raw.size(), level_);
    if (ZSTD_isError(n)) {
      try {
        return unexpected(Error{ErrorCode::CodecError,
                                std::string("zstd compress failed: ") + ZSTD_getErrorName(n)});
      } catch (const std::exception&) {
        return unexpected(Error{ErrorCode::CodecError, "zstd compress failed"});
      }
    }
    return n;
  }

  Expected<size_t> decompress(std::span<const std::byte> comp,
                              std::span<std::byte> out,
                              size_t expected_raw_size) const noexcept override {
    const size_t n = ZSTD_decompress(out.data(), out.size(), comp.data(), comp.size());
    if (ZSTD_isError(n) || n != expected_raw_size) {
      return unexpected(Error{ErrorCode::CodecError, "zstd decompress failed"});
    }
    return n;
  }

 private:
  int level_{1};
};

}  // namespace

const char* to_string(CodecId id) noexcept {
  switch (id) {
    case CodecId::None:
      return "none";
    case CodecId::Lz4:
      return "lz4";
    case CodecId::Zstd:
      return "zstd";
  }
  return "unknown";
}

Expected<std::unique_ptr<ICodec>> make_codec(const CodecParams& params) noexcept {
  try {
    switch (params.id) {
      case CodecId::None:
        return std::unique_ptr<ICodec>(new NoneCodec());
      case CodecId::Lz4:
        return std::unique_ptr<ICodec>(new Lz4Codec());
      case CodecId::Zstd:
        if (params.level < ZSTD_minCLevel() || params.level > ZSTD_maxCLevel()) {
          return unexpected(Error{ErrorCode::InvalidArgument, "zstd level out of range"});
        }
        return std::unique_ptr<ICodec>(new ZstdCodec(params.level));
    }
  } catch (const std::exception& ex) {
    return unexpected(Error{ErrorCode::Internal, ex.what()});
  }
  return unexpected(Error{ErrorCode::InvalidArgument, "invalid codec id"});
}

Expected<CodecId> parse_codec_id(std::string_view name) noexcept {
  if (name == "none") {
    return CodecId::None;
  }
  if (name == "lz4") {
    return CodecId::Lz4;
  }
  if (name == "zstd") {
    return CodecId::Zstd;
  }
  return unexpected(Error{ErrorCode::InvalidArgument, "unknown codec (expected none|lz4|zstd)"});
}

}  // namespace bread
