#pragma once

/** \file domain_ops.hpp
 *  \brief Numeric operations with explicit, named preconditions.
 *
 * Every input maps to either a value or exactly one domain_error. These are the only
 * producers of domain_error in the library.
 */

#include "faultline/error.hpp"
#include "faultline/expected.hpp"

namespace faultline::math {

/** \brief a / b; fails with division_by_zero when b == 0. NaN and infinite results pass through. */
auto divide(double a, double b) noexcept -> std::expected<double, domain_error>;

/** \brief Principal square root; fails with negative_square_root when x < 0. */
auto sqrt(double x) noexcept -> std::expected<double, domain_error>;

/** \brief a * b; fails with overflow when finite inputs produce a non-finite product. */
auto multiply(double a, double b) noexcept -> std::expected<double, domain_error>;

} // namespace faultline::math
