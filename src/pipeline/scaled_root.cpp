#include "faultline/pipeline/scaled_root.hpp"

#include <iostream>
#include <string>

#include "faultline/core/lexical.hpp"
#include "faultline/core/platform_utils.hpp"
#include "faultline/error_mapping.hpp"
#include "faultline/math/domain_ops.hpp"
#include "faultline/pipeline/chain.hpp"

namespace faultline::pipeline {

auto compute_scaled_root(const io::storage& store, const std::filesystem::path& path,
                         double divisor)
    -> std::expected<double, core::error> {
  const bool dbg = core::env_flag("FAULTLINE_PIPELINE_DEBUG");

  auto read = [&](const std::filesystem::path& p) -> std::expected<std::string, core::error> {
    auto text = store.read_text(p);
    if (!text) return std::unexpected(core::to_error(text.error(), p.string(), "pipeline.read"));
    return std::move(*text);
  };
  auto parse = [](const std::string& text) -> std::expected<double, core::error> {
    auto v = core::parse_f64(core::trim(text));
    if (!v) return std::unexpected(core::to_error(v.error(), "pipeline.parse"));
    return *v;
  };
  auto root = [](double x) -> std::expected<double, core::error> {
    auto v = math::sqrt(x);
    if (!v) return std::unexpected(core::to_error(v.error(), "pipeline.sqrt"));
    return *v;
  };
  auto scale = [divisor](double x) -> std::expected<double, core::error> {
    auto v = math::divide(x, divisor);
    if (!v) return std::unexpected(core::to_error(v.error(), "pipeline.divide"));
    return *v;
  };

  auto result = chain(path, read, parse, root, scale);
  if (dbg && !result) {
    std::cerr << "[faultline.pipeline] " << result.error().component << " failed: "
              << core::describe(result.error()) << "\n";
  }
  return result;
}

} // namespace faultline::pipeline
