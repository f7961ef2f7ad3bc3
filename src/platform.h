#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <string>

namespace strata::platform {

// Non-blocking exclusive advisory lock on a file. Mutual exclusion holds across
// processes (fcntl) and across threads of this process (per-path in-process set).
class file_lock : uncopyable {
 public:
  // Returns an empty lock (operator bool is false) if another holder has it.
  static file_lock try_acquire(std::filesystem::path const &path);

  file_lock();
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);

long process_id();
std::string host_name();

}  // namespace strata::platform
