#include "faultline/error_mapping.hpp"

#include <utility>

namespace faultline::core {

auto to_error(const std::error_code& ec, std::string_view path, std::string component) -> error {
  return error{io_failure{ec, std::string(path)}, std::move(component)};
}

auto to_error(const int_parse_failure& f, std::string component) -> error {
  return error{parse_failure{std::string(to_string(f.kind)), f.input}, std::move(component)};
}

auto to_error(const float_parse_failure& f, std::string component) -> error {
  return error{parse_float_failure{std::string(to_string(f.kind)), f.input}, std::move(component)};
}

auto to_error(math::domain_error e, std::string component) -> error {
  return error{domain_failure{e}, std::move(component)};
}

} // namespace faultline::core
