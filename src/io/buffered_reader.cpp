#include "io/buffered_reader.hpp"

#include <algorithm>

namespace bread::io {

BufferedReader::BufferedReader(IByteSource& source, size_t read_ahead)
    : source_(source), buf_(read_ahead == 0 ? kDefaultReadAhead : read_ahead) {}

Expected<void> BufferedReader::fill() {
  if (error_) {
    return unexpected(*error_);
  }
  if (eof_) {
    return {};
  }

  begin_ = 0;
  end_ = 0;
  auto n = source_.read(buf_);
  if (!n) {
    error_ = n.error();
    return unexpected(n.error());
  }
  if (*n == 0) {
    eof_ = true;
  } else {
    end_ = *n;
  }
  return {};
}

Expected<size_t> BufferedReader::read_full(std::span<std::byte> out) {
  size_t done = 0;
  while (done < out.size()) {
    if (buffered() > 0) {
      const size_t n = std::min(buffered(), out.size() - done);
      std::copy_n(buf_.begin() + static_cast<std::ptrdiff_t>(begin_), n,
                  out.begin() + static_cast<std::ptrdiff_t>(done));
      begin_ += n;
      done += n;
      continue;
    }

    // Bytes already copied out are delivered first; a pending error
    // surfaces on the next call.
    if (error_) {
      if (done > 0) {
        break;
      }
      return unexpected(*error_);
    }
    if (eof_) {
      break;
    }

    auto rest = out.subspan(done);
    if (rest.size() >= buf_.size()) {
      auto n = source_.read(rest);
      if (!n) {
        error_ = n.error();
        continue;
      }
      if (*n == 0) {
        eof_ = true;
      }
      done += *n;
      continue;
    }

    if (auto filled = fill(); !filled) {
      continue;
    }
  }

  consumed_ += done;
  return done;
}

Expected<bool> BufferedReader::read_until(std::byte delim, std::vector<std::byte>& out) {
  for (;;) {
    if (buffered() == 0) {
      if (error_) {
        return unexpected(*error_);
      }
      if (eof_) {
        return false;
      }
      if (auto filled = fill(); !filled) {
        return unexpected(filled.error());
      }
      continue;
    }

    const auto first = buf_.begin() + static_cast<std::ptrdiff_t>(begin_);
    const auto last = buf_.begin() + static_cast<std::ptrdiff_t>(end_);
    auto hit = std::find(first, last, delim);
    const bool found = hit != last;
    if (found) {
      ++hit;
    }

    out.insert(out.end(), first, hit);
    const auto n = static_cast<size_t>(hit - first);
    begin_ += n;
    consumed_ += n;
    if (found) {
      return true;
    }
  }
}

}  // namespace bread::io
