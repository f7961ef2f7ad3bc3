#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Load entire file into a string.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_file(std::filesystem::path const &path);

// Write content to path via a sibling temp file and an atomic rename, so readers
// observe either the previous content or the new content, never a torn write.
void util_write_file_atomic(std::filesystem::path const &path, std::string_view content);

// Join strings with a separator: {"a","b"}, " -> " -> "a -> b"
std::string util_join(std::vector<std::string> const &parts, std::string_view sep);

// Lowercase hex of a 64-bit value, zero padded to 16 characters.
std::string util_hex64(std::uint64_t value);

// Random 64-bit value from a process-wide generator (thread-safe).
std::uint64_t util_random64();

}  // namespace strata
