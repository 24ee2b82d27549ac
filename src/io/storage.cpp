#include "faultline/io/storage.hpp"

#include <mutex>

#include "faultline/platform/filesystem.hpp"

namespace faultline::io {

auto file_storage::read_text(const std::filesystem::path& path) const
    -> std::expected<std::string, std::error_code> {
  return platform::read_all(path);
}

auto file_storage::write_text(const std::filesystem::path& path, std::string_view content)
    -> std::expected<void, std::error_code> {
  return platform::write_all(path, content);
}

auto file_storage::remove(const std::filesystem::path& path)
    -> std::expected<void, std::error_code> {
  std::error_code ec;
  const bool removed = std::filesystem::remove(path, ec);
  if (ec) return std::unexpected(ec);
  if (!removed) return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  return {};
}

auto memory_storage::read_text(const std::filesystem::path& path) const
    -> std::expected<std::string, std::error_code> {
  std::shared_lock lk(mu_);
  auto it = files_.find(path.generic_string());
  if (it == files_.end()) {
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }
  return it->second;
}

auto memory_storage::write_text(const std::filesystem::path& path, std::string_view content)
    -> std::expected<void, std::error_code> {
  std::unique_lock lk(mu_);
  files_[path.generic_string()] = std::string(content);
  return {};
}

auto memory_storage::remove(const std::filesystem::path& path)
    -> std::expected<void, std::error_code> {
  std::unique_lock lk(mu_);
  if (files_.erase(path.generic_string()) == 0) {
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }
  return {};
}

auto memory_storage::size() const -> std::size_t {
  std::shared_lock lk(mu_);
  return files_.size();
}

} // namespace faultline::io
