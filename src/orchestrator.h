#pragma once

#include "checkpoint.h"
#include "plan.h"
#include "state_store.h"
#include "unit.h"
#include "util.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

struct run_options {
  bool dry_run{ false };
  bool force_all{ false };
  std::vector<std::string> force_ids;     // phase or unit ids
  std::optional<std::string> only_phase;  // run one phase, checkpoint untouched
};

enum class run_outcome { completed, failed };

struct run_report {
  run_outcome outcome{ run_outcome::completed };
  std::size_t executed{ 0 };  // units whose execute() ran
  std::size_t skipped{ 0 };   // already completed, or in a completed/disabled phase
  std::vector<std::string> would_execute;  // dry run only
  std::optional<std::string> failed_phase;
  std::optional<std::string> failed_unit;
  std::string diagnostic;
  std::optional<std::string> resumed_from;
  std::chrono::milliseconds elapsed{ 0 };

  bool ok() const { return outcome == run_outcome::completed; }
};

// Walks the plan's phases in order. Unit failures halt the run and are reported in the
// run_report; state store and checkpoint errors propagate as exceptions.
class orchestrator : unmovable {
 public:
  using command_probe_fn_t =
      std::function<std::vector<std::string>(std::vector<std::string> const &)>;

  // `base` supplies directories, env, installer and retry policy for every unit.
  orchestrator(plan const &p,
               state_store &store,
               checkpoint_manager &checkpoints,
               unit_context base);

  // Returns the names of missing commands; defaults to a PATH lookup using base.env.
  void set_command_probe(command_probe_fn_t probe) { probe_ = std::move(probe); }

  // Throws std::invalid_argument for force ids or a phase id the plan does not contain.
  run_report run(run_options const &opts);

 private:
  struct run_state;

  std::size_t resume_index(run_options const &opts, run_report &report) const;
  bool run_phase(phase_def const &phase, run_state &rs);
  bool run_phase_parallel(phase_def const &phase, run_state &rs);
  bool run_unit(phase_def const &phase, unit &u, run_state &rs);

  plan const &plan_;
  state_store &store_;
  checkpoint_manager &checkpoints_;
  unit_context base_;
  command_probe_fn_t probe_;
};

char const *run_outcome_name(run_outcome outcome);

}  // namespace kiln
