#include "faultline/platform/filesystem.hpp"

#include <array>
#include <cerrno>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace faultline::platform {

namespace {

auto last_error() -> std::error_code {
#ifdef _WIN32
  return std::error_code(static_cast<int>(::GetLastError()), std::system_category());
#else
  return std::error_code(errno, std::generic_category());
#endif
}

} // namespace

auto FileHandle::close() noexcept -> void {
  if (is_valid()) {
#ifdef _WIN32
    ::CloseHandle(handle_);
#else
    ::close(handle_);
#endif
    handle_ = invalid_handle();
  }
}

auto open_for_read(const std::filesystem::path& path)
    -> std::expected<FileHandle, std::error_code> {
#ifdef _WIN32
  HANDLE h = ::CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) return std::unexpected(last_error());
  return FileHandle(h);
#else
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) return std::unexpected(last_error());
  FileHandle fh(fd);
  // Directories open fine with O_RDONLY; reject them here so the caller gets EISDIR.
  struct stat st{};
  if (::fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
    return std::unexpected(std::make_error_code(std::errc::is_a_directory));
  }
  return fh;
#endif
}

auto open_for_write(const std::filesystem::path& path)
    -> std::expected<FileHandle, std::error_code> {
#ifdef _WIN32
  HANDLE h = ::CreateFileW(path.c_str(), GENERIC_WRITE, FILE_SHARE_READ, nullptr,
                           CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) return std::unexpected(last_error());
  return FileHandle(h);
#else
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd == -1) return std::unexpected(last_error());
  return FileHandle(fd);
#endif
}

auto read_all(const std::filesystem::path& path)
    -> std::expected<std::string, std::error_code> {
  auto fh = open_for_read(path);
  if (!fh) return std::unexpected(fh.error());

  std::string out;
  std::array<char, 4096> buf{};
  for (;;) {
#ifdef _WIN32
    DWORD n = 0;
    if (!::ReadFile(fh->get(), buf.data(), static_cast<DWORD>(buf.size()), &n, nullptr)) {
      return std::unexpected(last_error());
    }
#else
    ssize_t n = ::read(fh->get(), buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return std::unexpected(last_error());
    }
#endif
    if (n == 0) break;
    out.append(buf.data(), static_cast<std::size_t>(n));
  }
  return out;
}

auto write_all(const std::filesystem::path& path, std::string_view content)
    -> std::expected<void, std::error_code> {
  auto fh = open_for_write(path);
  if (!fh) return std::unexpected(fh.error());

  const char* data = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
#ifdef _WIN32
    DWORD n = 0;
    if (!::WriteFile(fh->get(), data, static_cast<DWORD>(remaining), &n, nullptr)) {
      return std::unexpected(last_error());
    }
#else
    ssize_t n = ::write(fh->get(), data, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      return std::unexpected(last_error());
    }
#endif
    data += n;
    remaining -= static_cast<std::size_t>(n);
  }
  return {};
}

} // namespace faultline::platform
