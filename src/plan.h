#pragma once

#include "unit.h"
#include "util.h"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

enum class prereq_mode { strict, warn };

struct phase_def {
  std::string id;
  std::string name;
  std::string description;
  bool enabled{ true };
  std::chrono::milliseconds timeout{ std::chrono::seconds{ 600 } };
  int concurrency{ 1 };
  std::vector<std::string> required_commands;
  prereq_mode prereq{ prereq_mode::strict };
  std::vector<unit::ptr_t> units;
};

// Immutable ordered list of phases. Built only through plan_builder.
class plan : uncopyable {
 public:
  plan() = default;

  std::vector<phase_def> const &phases() const { return phases_; }

  phase_def const *find_phase(std::string_view id) const;
  unit const *find_unit(std::string_view id) const;
  bool contains_id(std::string_view id) const;

  // Unit ids of enabled phases, in execution order.
  std::vector<std::string> active_unit_ids() const;

 private:
  friend class plan_builder;

  std::vector<phase_def> phases_;
};

std::vector<std::string> phase_unit_ids(phase_def const &phase);

// Throws std::invalid_argument for empty ids, ids containing ':' or line breaks,
// ids reused anywhere in the plan, and units whose phase_id does not match.
class plan_builder {
 public:
  plan_builder &phase(phase_def def);  // def.units is ignored; add units with unit()
  plan_builder &unit(kiln::unit::ptr_t u);  // appended to the most recent phase

  plan build();

 private:
  void claim_id(std::string const &id, char const *what);

  plan plan_;
  std::vector<std::string> ids_;
};

// Same rule the store applies to keys.
bool plan_id_valid(std::string_view id);

}  // namespace kiln
