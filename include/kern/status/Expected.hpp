// Expected.hpp
// -----------------------------------------------------------------------------
// The AStatusOrElse<T> return contract: a function either succeeds with a T or
// fails with a non-OK Status. It is a tl::expected so callers must look at the
// arm they got; there is no hidden exception path.
//
//   AStatusOrElse<float> divide(int a, int b) {
//       if (b == 0) return kern::failure(kern::zeroDivisionError("b == 0"));
//       return static_cast<float>(a) / static_cast<float>(b);
//   }

#pragma once

#include "kern/log/Check.hpp"
#include "kern/status/Status.hpp"

#include <utility>

#include <tl/expected.hpp>

namespace kern {

template <typename T>
using AStatusOrElse = tl::expected<T, Status>;

using Failure = tl::unexpected<Status>;

/**
 * @brief Wrap a failing Status as the failure arm of an AStatusOrElse.
 *
 * Returning an OK status in place of a value breaks the contract, so an OK
 * @p status is a fatal check failure.
 */
[[nodiscard]] inline Failure failure(Status status) {
    KERN_CHECK(!status.ok(), "an OK status cannot signal failure");
    return Failure(std::move(status));
}

} // namespace kern
