#pragma once

/** \file filesystem.hpp
 *  \brief Portable whole-file read/write on top of an RAII file handle.
 *
 * Every function reports failures as std::error_code (system category) and closes any
 * handle it opened on all exit paths.
 */

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "faultline/expected.hpp"

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#endif

namespace faultline::platform {

/** \brief File handle wrapper for RAII.
 *
 * Automatically closes file on destruction.
 */
class FileHandle {
public:
#ifdef _WIN32
    using native_handle_type = HANDLE;
#else
    using native_handle_type = int;
#endif

    FileHandle() noexcept = default;

    explicit FileHandle(native_handle_type handle) noexcept
        : handle_(handle) {}

    ~FileHandle() {
        close();
    }

    FileHandle(FileHandle&& other) noexcept
        : handle_(other.handle_) {
        other.handle_ = invalid_handle();
    }

    auto operator=(FileHandle&& other) noexcept -> FileHandle& {
        if (this != &other) {
            close();
            handle_ = other.handle_;
            other.handle_ = invalid_handle();
        }
        return *this;
    }

    FileHandle(const FileHandle&) = delete;
    auto operator=(const FileHandle&) -> FileHandle& = delete;

    [[nodiscard]] auto get() const noexcept -> native_handle_type {
        return handle_;
    }

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return handle_ != invalid_handle();
    }

    auto close() noexcept -> void;

private:
    [[nodiscard]] static auto invalid_handle() noexcept -> native_handle_type {
#ifdef _WIN32
        return INVALID_HANDLE_VALUE;
#else
        return -1;
#endif
    }

    native_handle_type handle_ = invalid_handle();
};

/** \brief Open an existing file read-only. */
[[nodiscard]] auto open_for_read(const std::filesystem::path& path)
    -> std::expected<FileHandle, std::error_code>;

/** \brief Create or truncate a file for writing. */
[[nodiscard]] auto open_for_write(const std::filesystem::path& path)
    -> std::expected<FileHandle, std::error_code>;

/** \brief Read the whole file into a string. */
[[nodiscard]] auto read_all(const std::filesystem::path& path)
    -> std::expected<std::string, std::error_code>;

/** \brief Replace the file contents with `content`. */
[[nodiscard]] auto write_all(const std::filesystem::path& path, std::string_view content)
    -> std::expected<void, std::error_code>;

} // namespace faultline::platform
