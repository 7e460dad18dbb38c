#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace kiln::platform {

// Exclusive advisory lock held for the object's lifetime. Construction fails
// immediately (std::runtime_error) when another process or thread holds the lock.
class file_lock : uncopyable {
 public:
  explicit file_lock(std::filesystem::path const &path);
  ~file_lock();
  file_lock(file_lock &&) noexcept;
  file_lock &operator=(file_lock &&) noexcept;

  explicit operator bool() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to);
void flush_directory(std::filesystem::path const &dir);

// Search PATH (or `search_path` when given) for an executable regular file.
std::optional<std::filesystem::path> find_executable(
    std::string_view name,
    std::optional<std::string_view> search_path = std::nullopt);

// True if the process may create files in `dir`.
bool is_directory_writable(std::filesystem::path const &dir);

// Shell-style expansion of ~ and $VARS (no command substitution). Throws on undefined
// variables.
std::filesystem::path expand_path(std::string_view p);

}  // namespace kiln::platform
