#include "util.h"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace kiln {

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_load_text_file(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ bytes.begin(), bytes.end() };
}

void util_write_durable(std::FILE *file,
                        std::string_view data,
                        std::filesystem::path const &path_for_errors) {
  if (!data.empty() && std::fwrite(data.data(), 1, data.size(), file) != data.size()) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to write " + path_for_errors.string());
  }

  if (std::fflush(file) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to flush " + path_for_errors.string());
  }

  if (::fsync(::fileno(file)) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to fsync " + path_for_errors.string());
  }
}

std::vector<std::string_view> util_split(std::string_view text, char delim) {
  std::vector<std::string_view> parts;
  std::size_t start{ 0 };
  for (;;) {
    auto const pos{ text.find(delim, start) };
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string_view util_trim(std::string_view text) {
  auto const first{ text.find_first_not_of(" \t\r\n") };
  if (first == std::string_view::npos) { return {}; }
  auto const last{ text.find_last_not_of(" \t\r\n") };
  return text.substr(first, last - first + 1);
}

std::string util_format_duration(std::chrono::milliseconds duration) {
  auto const ms{ duration.count() };
  char buf[64]{};

  if (ms < 1000) {
    std::snprintf(buf, sizeof buf, "%lldms", static_cast<long long>(ms));
  } else if (ms < 60'000) {
    std::snprintf(buf, sizeof buf, "%.1fs", static_cast<double>(ms) / 1000.0);
  } else {
    long long const total_s{ static_cast<long long>(ms / 1000) };
    std::snprintf(buf, sizeof buf, "%lldm%02llds", total_s / 60, total_s % 60);
  }

  return buf;
}

std::int64_t util_epoch_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

}  // namespace kiln
