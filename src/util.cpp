#include "util.h"

#include "platform.h"

#include <cstdio>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace strata {

std::string util_load_file(std::filesystem::path const &path) {
  std::ifstream in{ path, std::ios::binary };
  if (!in) { throw std::runtime_error("Failed to open file: " + path.string()); }

  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) { throw std::runtime_error("Failed to read file: " + path.string()); }
  return oss.str();
}

void util_write_file_atomic(std::filesystem::path const &path, std::string_view content) {
  auto tmp{ path };
  tmp += ".tmp-" + util_hex64(util_random64()).substr(0, 8);

  {
    std::ofstream out{ tmp, std::ios::binary | std::ios::trunc };
    if (!out) { throw std::runtime_error("Failed to open file for writing: " + tmp.string()); }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("Failed to write file: " + tmp.string());
    }
  }

  try {
    platform::atomic_rename(tmp, path);
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    throw;
  }
}

std::string util_join(std::vector<std::string> const &parts, std::string_view sep) {
  std::string result;
  for (size_t i{ 0 }; i < parts.size(); ++i) {
    if (i) { result.append(sep); }
    result.append(parts[i]);
  }
  return result;
}

std::string util_hex64(std::uint64_t value) {
  char buf[17]{};
  std::snprintf(buf, sizeof buf, "%016llx", static_cast<unsigned long long>(value));
  return buf;
}

std::uint64_t util_random64() {
  static std::mutex mutex;
  static std::mt19937_64 gen{ std::random_device{}() };
  std::lock_guard const lock(mutex);
  return gen();
}

}  // namespace strata
