#include "platform.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>

namespace strata::platform {

struct file_lock::impl {
  int fd;
  std::string key;  // entry in s_held

  // fcntl locks are per-process, so a second store in this process would succeed;
  // held paths are also tracked in-process.
  static std::mutex s_held_mutex;
  static std::unordered_set<std::string> s_held;

  ~impl() {
    ::close(fd);
    release_key(key);
  }

  // Canonicalize path so different spellings of the same path share one key
  static std::string key_for(std::filesystem::path const &path) {
    return std::filesystem::absolute(path).lexically_normal().string();
  }

  static void release_key(std::string const &key) {
    std::lock_guard<std::mutex> lock(s_held_mutex);
    s_held.erase(key);
  }
};

std::mutex file_lock::impl::s_held_mutex;
std::unordered_set<std::string> file_lock::impl::s_held;

namespace {

int open_lock_file(std::filesystem::path const &path) {
  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }
  return fd;
}

}  // namespace

file_lock::file_lock() = default;

file_lock file_lock::try_acquire(std::filesystem::path const &path) {
  std::string key{ impl::key_for(path) };

  {
    std::lock_guard<std::mutex> lock(impl::s_held_mutex);
    if (!impl::s_held.insert(key).second) { return file_lock{}; }
  }

  int fd{ -1 };
  try {
    fd = open_lock_file(path);
  } catch (...) {
    impl::release_key(key);
    throw;
  }

  struct flock fl{ .l_type = F_WRLCK,
                   .l_whence = SEEK_SET,
                   .l_start = 0,
                   .l_len = 0,
                   .l_pid = 0 };

  if (::fcntl(fd, F_SETLK, &fl) == -1) {
    int const err{ errno };
    ::close(fd);
    impl::release_key(key);
    if (err == EACCES || err == EAGAIN) { return file_lock{}; }
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  file_lock result;
  result.impl_ = std::make_unique<impl>();
  result.impl_->fd = fd;
  result.impl_->key = std::move(key);
  return result;
}

file_lock::~file_lock() = default;

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

long process_id() { return static_cast<long>(::getpid()); }

std::string host_name() {
  char buf[256]{};
  if (::gethostname(buf, sizeof buf - 1) != 0) { return "unknown"; }
  return buf;
}

}  // namespace strata::platform
