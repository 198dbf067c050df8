#include "bread/core/error.hpp"

namespace bread {

const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::MissingContext:
      return "missing_context";
    case ErrorCode::NilSource:
      return "nil_source";
    case ErrorCode::MissingCallback:
      return "missing_callback";
    case ErrorCode::MissingBufferSize:
      return "missing_buffer_size";
    case ErrorCode::IoError:
      return "io_error";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::DeadlineExceeded:
      return "deadline_exceeded";
    case ErrorCode::CodecError:
      return "codec_error";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::Internal:
      return "internal";
  }
  return "unknown";
}

}  // namespace bread
