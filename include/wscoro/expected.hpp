#pragma once

#include <wscoro/error_info.hpp>

#include <iocoro/expected.hpp>

namespace wscoro {

using iocoro::expected;
using iocoro::unexpect;
using iocoro::unexpect_t;
using iocoro::unexpected;

using iocoro::operator==;
using iocoro::operator!=;

/// Result of a frame write: empty on success, the rejection or transport error otherwise.
using write_result = expected<void, error_info>;

}  // namespace wscoro
