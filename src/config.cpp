#include "faultline/config.hpp"

#include <iostream>
#include <utility>

#include "faultline/core/lexical.hpp"
#include "faultline/core/platform_utils.hpp"
#include "faultline/error_mapping.hpp"

namespace faultline {

auto default_config() -> config {
  return config{};
}

auto parse_config(std::string_view text) -> std::expected<config, core::error> {
  const bool dbg = core::env_flag("FAULTLINE_CONFIG_DEBUG");
  config c = default_config();

  std::size_t line_no = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto nl = text.find('\n', pos);
    std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() : nl + 1;
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    // Exactly one separator, otherwise the line is structurally malformed.
    const auto eq = line.find('=');
    if (eq == std::string_view::npos || line.find('=', eq + 1) != std::string_view::npos) {
      if (dbg) std::cerr << "[faultline.config] skipped malformed line " << line_no << "\n";
      continue;
    }
    const auto key = core::trim(line.substr(0, eq));
    const auto value = core::trim(line.substr(eq + 1));

    if (key == "debug") {
      if (auto b = core::parse_bool(value)) {
        c.debug = *b;
      } else {
        c.debug = false;
        if (dbg) std::cerr << "[faultline.config] line " << line_no << ": debug=\"" << value << "\" is not a bool, using false\n";
      }
    } else if (key == "port") {
      auto p = core::parse_u16(value);
      if (!p) {
        if (dbg) std::cerr << "[faultline.config] line " << line_no << ": invalid port=\"" << value << "\"\n";
        return std::unexpected(core::to_error(p.error(), "config.port"));
      }
      c.port = *p;
    } else if (key == "host") {
      c.host = std::string(value);
    } else if (dbg) {
      std::cerr << "[faultline.config] line " << line_no << ": ignored unknown key \"" << key << "\"\n";
    }
  }
  return c;
}

auto load_config(const io::storage& store, const std::filesystem::path& path)
    -> std::expected<config, core::error> {
  auto text = store.read_text(path);
  if (!text) return std::unexpected(core::to_error(text.error(), path.string(), "config.read"));
  return parse_config(*text);
}

auto load_config_or_default(const io::storage& store, const std::filesystem::path& path) -> config {
  auto c = load_config(store, path);
  if (c) return std::move(*c);
  if (core::env_flag("FAULTLINE_CONFIG_DEBUG")) {
    std::cerr << "[faultline.config] " << core::describe(c.error()) << "; using defaults\n";
  }
  return default_config();
}

auto render_config(const config& c) -> std::string {
  std::string out;
  out.append("debug=").append(c.debug ? "true" : "false").append("\n");
  out.append("port=").append(std::to_string(c.port)).append("\n");
  out.append("host=").append(c.host).append("\n");
  return out;
}

auto save_config(io::storage& store, const std::filesystem::path& path, const config& c)
    -> std::expected<void, core::error> {
  auto w = store.write_text(path, render_config(c));
  if (!w) return std::unexpected(core::to_error(w.error(), path.string(), "config.write"));
  return {};
}

} // namespace faultline
