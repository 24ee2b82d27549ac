#include "tests/support/temp_dir.hpp"

#include <atomic>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace faultline_test_helpers {

scoped_temp_dir::scoped_temp_dir(std::string_view tag) {
  // ctest may run several test processes at once; the random part keeps them apart.
  static std::atomic<unsigned> counter{0};
  std::random_device rd;
  dir_ = std::filesystem::temp_directory_path() /
         ("faultline_" + std::string(tag) + "_" + std::to_string(rd()) + "_" + std::to_string(++counter));
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  std::filesystem::create_directories(dir_, ec);
  if (ec) throw std::runtime_error("failed to create temp dir: " + dir_.string());
}

scoped_temp_dir::~scoped_temp_dir() {
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
}

void write_file(const std::filesystem::path& p, std::string_view content) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out.good()) throw std::runtime_error("failed to open for write: " + p.string());
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

std::string read_file(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) throw std::runtime_error("failed to open for read: " + p.string());
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

} // namespace faultline_test_helpers
