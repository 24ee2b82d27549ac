#include "faultline/math/domain_ops.hpp"

#include <cmath>

namespace faultline::math {

auto divide(double a, double b) noexcept -> std::expected<double, domain_error> {
  if (b == 0.0) return std::unexpected(domain_error::division_by_zero);
  return a / b;
}

auto sqrt(double x) noexcept -> std::expected<double, domain_error> {
  if (x < 0.0) return std::unexpected(domain_error::negative_square_root);
  return std::sqrt(x);
}

auto multiply(double a, double b) noexcept -> std::expected<double, domain_error> {
  const double p = a * b;
  if (std::isfinite(a) && std::isfinite(b) && !std::isfinite(p)) {
    return std::unexpected(domain_error::overflow);
  }
  return p;
}

} // namespace faultline::math
