#pragma once

/** \file error_mapping.hpp
 *  \brief Conversion of foreign failure shapes into core::error.
 *
 * One pure, total function per foreign shape. This is the only sanctioned crossing into
 * the taxonomy; code past this boundary sees core::error and nothing else.
 */

#include <string>
#include <string_view>
#include <system_error>

#include "faultline/core/lexical.hpp"
#include "faultline/error.hpp"

namespace faultline::core {

/** \brief Storage failure on `path`. */
auto to_error(const std::error_code& ec, std::string_view path, std::string component = {}) -> error;

/** \brief Integer literal rejected by parse_u16. */
auto to_error(const int_parse_failure& f, std::string component = {}) -> error;

/** \brief Float literal rejected by parse_f64. */
auto to_error(const float_parse_failure& f, std::string component = {}) -> error;

/** \brief Domain operation precondition violation. */
auto to_error(math::domain_error e, std::string component = {}) -> error;

/** \brief Identity; lets generic code call to_error on values already in the taxonomy. */
inline auto to_error(error e) -> error { return e; }

} // namespace faultline::core
