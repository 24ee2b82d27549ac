#pragma once

/** \file scaled_root.hpp
 *  \brief read file -> parse float -> square root -> divide by a constant.
 */

#include <filesystem>

#include "faultline/error.hpp"
#include "faultline/expected.hpp"
#include "faultline/io/storage.hpp"

namespace faultline::pipeline {

/** \brief Default divisor applied to the square root. */
inline constexpr double kDefaultDivisor = 10.0;

/**
 * \brief sqrt(number stored at `path`) / divisor.
 *
 * Surrounding whitespace in the file is ignored. Errors carry the failing stage in
 * `component`: "pipeline.read", "pipeline.parse", "pipeline.sqrt", "pipeline.divide".
 */
auto compute_scaled_root(const io::storage& store, const std::filesystem::path& path,
                         double divisor = kDefaultDivisor)
    -> std::expected<double, core::error>;

} // namespace faultline::pipeline
