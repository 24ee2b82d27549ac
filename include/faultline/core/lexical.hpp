#pragma once

/** \file lexical.hpp
 *  \brief Text-to-number parsing with failure payloads that describe why the text was rejected.
 *
 * These failure shapes are foreign to the taxonomy; callers cross into core::error through
 * core::to_error (error_mapping.hpp).
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "faultline/expected.hpp"

namespace faultline::core {

enum class int_parse_kind : std::uint8_t { empty, invalid_digit, pos_overflow };

/** \brief Why an integer literal was rejected. */
struct int_parse_failure {
  int_parse_kind kind{int_parse_kind::invalid_digit};
  std::string input;
};

enum class float_parse_kind : std::uint8_t { empty, invalid };

/** \brief Why a floating-point literal was rejected. */
struct float_parse_failure {
  float_parse_kind kind{float_parse_kind::invalid};
  std::string input;
};

auto to_string(int_parse_kind k) -> std::string_view;
auto to_string(float_parse_kind k) -> std::string_view;

/** \brief Parse an unsigned 16-bit integer: optional '+', then decimal digits only. */
auto parse_u16(std::string_view text) -> std::expected<std::uint16_t, int_parse_failure>;

/** \brief Parse a double: optional sign, decimal/scientific form, inf/infinity/nan. The C form nan(...) is rejected. */
auto parse_f64(std::string_view text) -> std::expected<double, float_parse_failure>;

/** \brief Accepts exactly "true" or "false". */
auto parse_bool(std::string_view text) noexcept -> std::optional<bool>;

/** \brief Strip whitespace from both ends: ASCII plus UTF-8 encoded Unicode White_Space (U+00A0, U+2000..U+200A, U+3000, ...). */
auto trim(std::string_view s) noexcept -> std::string_view;

} // namespace faultline::core
