#pragma once

/**
 * \file config.hpp
 * \brief Line-oriented `key=value` configuration with per-field failure policy.
 *
 * Format: one `key=value` pair per line, keys in {debug, port, host}. Key and value are
 * trimmed of ASCII and Unicode whitespace (UTF-8). No quoting or escaping.
 *
 * Failure policy:
 * - unreadable file: the load fails with the I/O error
 * - line without exactly one '=': skipped
 * - `debug` not "true"/"false": defaults to false
 * - `port` not a u16: the load fails with the parse error
 * - `host`: taken verbatim
 * - unknown key: ignored
 *
 * Set FAULTLINE_CONFIG_DEBUG=1 to trace skipped and defaulted lines on stderr.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "faultline/error.hpp"
#include "faultline/expected.hpp"
#include "faultline/io/storage.hpp"

namespace faultline {

/** \brief Fully populated runtime configuration. */
struct config {
  bool debug{false};                 /**< verbose mode */
  std::uint16_t port{8080};          /**< listen port */
  std::string host{"localhost"};     /**< bind address or hostname */

  friend auto operator==(const config&, const config&) -> bool = default;
};

/** \brief debug=false, port=8080, host="localhost". */
auto default_config() -> config;

/** \brief Apply the line rules to already-read text, starting from the defaults. */
auto parse_config(std::string_view text) -> std::expected<config, core::error>;

/** \brief Read `path` from storage and parse it. */
auto load_config(const io::storage& store, const std::filesystem::path& path)
    -> std::expected<config, core::error>;

/** \brief load_config, or default_config() when loading fails for any reason. */
auto load_config_or_default(const io::storage& store, const std::filesystem::path& path) -> config;

/** \brief Persisted layout: "debug=<bool>\nport=<n>\nhost=<text>\n". */
auto render_config(const config& c) -> std::string;

/** \brief Write render_config(c) to `path`. */
auto save_config(io::storage& store, const std::filesystem::path& path, const config& c)
    -> std::expected<void, core::error>;

} // namespace faultline
