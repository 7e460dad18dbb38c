#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kiln {

struct checkpoint {
  std::string phase_id;
  std::string unit_id;  // empty: resume at phase granularity
  std::int64_t timestamp;
};

// Single advisory resume pointer, persisted as CHECKPOINT_* key/value lines.
class checkpoint_manager {
 public:
  using clock_fn_t = std::function<std::int64_t()>;

  explicit checkpoint_manager(std::filesystem::path path, clock_fn_t clock = {});

  void save(std::string_view phase_id, std::string_view unit_id);
  std::optional<checkpoint> load() const;
  void clear();

  std::filesystem::path const &path() const { return path_; }

 private:
  std::filesystem::path path_;
  clock_fn_t clock_;
};

std::optional<checkpoint> checkpoint_parse(std::string_view text);
std::string checkpoint_format(checkpoint const &cp);

}  // namespace kiln
