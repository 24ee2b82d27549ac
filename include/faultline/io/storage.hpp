#pragma once

/** \file storage.hpp
 *  \brief Text storage collaborator consumed by the pipeline and the config loader.
 *
 * Failures are reported as std::error_code; callers convert them with core::to_error
 * at the point they are first observed.
 *
 * Thread-safety: file_storage holds no state; memory_storage allows concurrent readers
 * and serializes writers.
 */

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

#include "faultline/expected.hpp"

namespace faultline::io {

/** \brief Read/write whole text files by path. */
class storage {
public:
  virtual ~storage() = default;

  /** \brief Full contents of `path`; no_such_file_or_directory when absent. */
  virtual auto read_text(const std::filesystem::path& path) const
      -> std::expected<std::string, std::error_code> = 0;

  /** \brief Create or replace `path` with `content`. */
  virtual auto write_text(const std::filesystem::path& path, std::string_view content)
      -> std::expected<void, std::error_code> = 0;

  /** \brief Delete `path`; no_such_file_or_directory when absent. */
  virtual auto remove(const std::filesystem::path& path)
      -> std::expected<void, std::error_code> = 0;
};

/** \brief Storage backed by the local filesystem. */
class file_storage final : public storage {
public:
  auto read_text(const std::filesystem::path& path) const
      -> std::expected<std::string, std::error_code> override;
  auto write_text(const std::filesystem::path& path, std::string_view content)
      -> std::expected<void, std::error_code> override;
  auto remove(const std::filesystem::path& path)
      -> std::expected<void, std::error_code> override;
};

/** \brief In-process storage keyed by the generic path string. */
class memory_storage final : public storage {
public:
  auto read_text(const std::filesystem::path& path) const
      -> std::expected<std::string, std::error_code> override;
  auto write_text(const std::filesystem::path& path, std::string_view content)
      -> std::expected<void, std::error_code> override;
  auto remove(const std::filesystem::path& path)
      -> std::expected<void, std::error_code> override;

  /** \brief Number of stored files. */
  auto size() const -> std::size_t;

private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::string> files_;
};

} // namespace faultline::io
