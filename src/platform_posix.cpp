#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <wordexp.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>

namespace kiln::platform {

struct file_lock::impl {
  int fd;
  std::filesystem::path lock_path;
  std::string key;

  // fcntl locks are per-process, so a second lock on the same path from this process
  // would silently succeed. Track held paths to refuse that case as well.
  static std::mutex s_held_mutex;
  static std::unordered_set<std::string> s_held;
};

std::mutex file_lock::impl::s_held_mutex;
std::unordered_set<std::string> file_lock::impl::s_held;

file_lock::~file_lock() {
  if (impl_) {
    ::close(impl_->fd);
    std::lock_guard<std::mutex> lock{ impl::s_held_mutex };
    impl::s_held.erase(impl_->key);
  }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

file_lock::file_lock(std::filesystem::path const &path) {
  std::string const key{ std::filesystem::absolute(path).lexically_normal().string() };

  {
    std::lock_guard<std::mutex> lock{ impl::s_held_mutex };
    if (!impl::s_held.insert(key).second) {
      throw std::runtime_error("Lock already held: " + path.string());
    }
  }

  auto const release_key{ [&] {
    std::lock_guard<std::mutex> lock{ impl::s_held_mutex };
    impl::s_held.erase(key);
  } };

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666) };
  if (fd == -1) {
    int const err{ errno };
    release_key();
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{ .l_type = F_WRLCK,
                   .l_whence = SEEK_SET,
                   .l_start = 0,
                   .l_len = 0,
                   .l_pid = 0 };

  if (::fcntl(fd, F_SETLK, &fl) == -1) {
    int const err{ errno };
    ::close(fd);
    release_key();
    if (err == EACCES || err == EAGAIN) {
      throw std::runtime_error("Another kiln process holds the lock: " + path.string());
    }
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  impl_ = std::make_unique<impl>();
  impl_->fd = fd;
  impl_->lock_path = path;
  impl_->key = key;
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void flush_directory(std::filesystem::path const &dir) {
  int const fd{ ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open directory: " + dir.string());
  }
  int const rc{ ::fsync(fd) };
  int const err{ errno };
  ::close(fd);
  if (rc != 0) {
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to fsync directory: " + dir.string());
  }
}

std::optional<std::filesystem::path> find_executable(
    std::string_view name,
    std::optional<std::string_view> search_path) {
  if (name.empty()) { return std::nullopt; }

  auto const is_executable{ [](std::filesystem::path const &p) {
    struct stat st{};
    return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(p.c_str(), X_OK) == 0;
  } };

  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path const candidate{ name };
    if (is_executable(candidate)) { return candidate; }
    return std::nullopt;
  }

  std::string_view path_value;
  if (search_path) {
    path_value = *search_path;
  } else if (char const *env_path{ std::getenv("PATH") }) {
    path_value = env_path;
  } else {
    return std::nullopt;
  }

  for (auto const dir : util_split(path_value, ':')) {
    std::filesystem::path const candidate{ std::filesystem::path{ dir.empty() ? "."
                                                                              : dir } /
                                           name };
    if (is_executable(candidate)) { return candidate; }
  }

  return std::nullopt;
}

bool is_directory_writable(std::filesystem::path const &dir) {
  return ::access(dir.c_str(), W_OK | X_OK) == 0;
}

namespace {

// Leaves a leading ~ or ~user unquoted and double-quotes the rest, so $VAR still
// expands but spaces and glob characters stay literal.
std::string quote_for_wordexp(std::string_view p) {
  std::string out;
  size_t start{ 0 };
  if (p.front() == '~') {
    start = std::min(p.find('/'), p.size());
    out.append(p.substr(0, start));
  }
  if (start == p.size()) { return out; }

  out.push_back('"');
  for (char const c : p.substr(start)) {
    if (c == '"' || c == '\\' || c == '`') { out.push_back('\\'); }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

}  // namespace

std::filesystem::path expand_path(std::string_view p) {
  if (p.empty()) { return {}; }

  wordexp_t we{};
  std::string const path_str{ p };
  std::string const quoted{ quote_for_wordexp(p) };
  int const flags{ WRDE_NOCMD | WRDE_UNDEF };  // no $(cmd), fail on undefined $VAR

  int const rc{ wordexp(quoted.c_str(), &we, flags) };

  if (rc == 0) {
    if (we.we_wordc != 1) {
      wordfree(&we);
      throw std::runtime_error("path expansion did not produce a single path: " + path_str);
    }
    std::filesystem::path result{ we.we_wordv[0] };
    wordfree(&we);
    return result;
  }

  // POSIX: wordfree() must only be called after successful wordexp()
  if (rc == WRDE_BADVAL) {
    throw std::runtime_error("undefined variable in path: " + path_str);
  }
  throw std::runtime_error("path expansion failed: " + path_str);
}

}  // namespace kiln::platform
