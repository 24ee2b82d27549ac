#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - One active failure category per error (I/O, integer parse, float parse, domain).
 * - Each category embeds the descriptive content of the failure it was converted from,
 *   so describe() never needs the original foreign value.
 * - Stable error codes derived from the active category for programmatic handling.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include "faultline/expected.hpp"

namespace faultline::math {

/** \brief Precondition violations raised by domain operations. */
enum class domain_error : std::uint8_t {
  division_by_zero,
  negative_square_root,
  overflow,
};

/** \brief Human-readable name of a domain error. */
auto to_string(domain_error e) -> std::string_view;

} // namespace faultline::math

namespace faultline::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_not_found = 1002,
  parse_int = 2001,
  parse_float = 2002,
  domain = 3001,
};

/** \brief Storage-layer failure (missing file, permission denied, short read). */
struct io_failure {
  std::error_code cause;   /**< OS/library error, category preserved */
  std::string path;        /**< path the operation targeted */
};

/** \brief Text did not match the integer grammar of the target type. */
struct parse_failure {
  std::string reason;      /**< cause description, e.g. "invalid digit found in string" */
  std::string input;       /**< offending text */
};

/** \brief Text did not match the floating-point grammar. */
struct parse_float_failure {
  std::string reason;
  std::string input;
};

/** \brief A domain operation's mathematical precondition was violated. */
struct domain_failure {
  math::domain_error cause{math::domain_error::division_by_zero};
};

using error_kind = std::variant<io_failure, parse_failure, parse_float_failure, domain_failure>;

/** \brief Structured error payload: exactly one active category plus the originating stage. */
struct error {
  error_kind kind;          /**< active failure category */
  std::string component;    /**< subsystem, e.g., "config.port" */
};

/** \brief Stable code of the active category. */
auto code_of(const error& e) noexcept -> error_code;

/** \brief "<category>: <cause>" rendering; the cause description is embedded verbatim. */
auto describe(const error& e) -> std::string;

/** \brief True when the error is an I/O failure caused by an absent file. */
auto is_not_found(const error& e) noexcept -> bool;

/** \brief Category label used as the prefix of describe(). */
auto category_name(const error& e) noexcept -> std::string_view;

} // namespace faultline::core
