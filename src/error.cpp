#include "faultline/error.hpp"

namespace faultline::math {

auto to_string(domain_error e) -> std::string_view {
  switch (e) {
    case domain_error::division_by_zero: return "division by zero";
    case domain_error::negative_square_root: return "square root of negative number";
    case domain_error::overflow: return "overflow";
  }
  return "unknown domain error";
}

} // namespace faultline::math

namespace faultline::core {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

auto code_of(const error& e) noexcept -> error_code {
  return std::visit(overloaded{
      [](const io_failure& f) {
        return f.cause == std::errc::no_such_file_or_directory ? error_code::io_not_found
                                                               : error_code::io_failed;
      },
      [](const parse_failure&) { return error_code::parse_int; },
      [](const parse_float_failure&) { return error_code::parse_float; },
      [](const domain_failure&) { return error_code::domain; },
  }, e.kind);
}

auto is_not_found(const error& e) noexcept -> bool {
  return code_of(e) == error_code::io_not_found;
}

auto category_name(const error& e) noexcept -> std::string_view {
  return std::visit(overloaded{
      [](const io_failure&) -> std::string_view { return "I/O error"; },
      [](const parse_failure&) -> std::string_view { return "parse error"; },
      [](const parse_float_failure&) -> std::string_view { return "float parse error"; },
      [](const domain_failure&) -> std::string_view { return "domain error"; },
  }, e.kind);
}

auto describe(const error& e) -> std::string {
  std::string out(category_name(e));
  out.append(": ");
  std::visit(overloaded{
      [&](const io_failure& f) {
        out.append(f.cause.message());
        if (!f.path.empty()) out.append(" (").append(f.path).append(")");
      },
      [&](const parse_failure& f) {
        out.append(f.reason).append(" (input \"").append(f.input).append("\")");
      },
      [&](const parse_float_failure& f) {
        out.append(f.reason).append(" (input \"").append(f.input).append("\")");
      },
      [&](const domain_failure& f) { out.append(math::to_string(f.cause)); },
  }, e.kind);
  return out;
}

} // namespace faultline::core
