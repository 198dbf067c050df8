#pragma once

#include "bread/core/error.hpp"

#if BREAD_HAVE_STD_EXPECTED
#include <expected>
#else
#include <tl/expected.hpp>
#endif

namespace bread {

#if BREAD_HAVE_STD_EXPECTED

template <class T>
using Expected = std::expected<T, Error>;

using std::unexpected;

#else

template <class T>
using Expected = tl::expected<T, Error>;

using tl::unexpected;

#endif

}  // namespace bread
