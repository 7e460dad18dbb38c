#include "orchestrator.h"

#include "preflight.h"
#include "trace.h"
#include "tui.h"

#include "tbb/task_arena.h"
#include "tbb/task_group.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace kiln {

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

std::string join(std::vector<std::string> const &items) {
  std::string out;
  for (auto const &item : items) {
    if (!out.empty()) { out += ", "; }
    out += item;
  }
  return out;
}

}  // namespace

char const *run_outcome_name(run_outcome outcome) {
  switch (outcome) {
    case run_outcome::completed: return "completed";
    case run_outcome::failed: return "failed";
  }
  return "unknown";
}

struct orchestrator::run_state {
  run_options const &opts;
  run_report &report;
  bool touch_checkpoint;
  std::mutex mutex;  // store, checkpoint and report writes from parallel phases
  std::atomic<bool> halted{ false };

  bool forced(std::string const &id) const {
    return opts.force_all ||
           std::find(opts.force_ids.begin(), opts.force_ids.end(), id) != opts.force_ids.end();
  }

  void fail(std::string const &phase_id, std::string const &unit_id, std::string why) {
    halted = true;
    if (report.outcome == run_outcome::failed) { return; }
    report.outcome = run_outcome::failed;
    report.failed_phase = phase_id;
    if (!unit_id.empty()) { report.failed_unit = unit_id; }
    report.diagnostic = std::move(why);
  }
};

orchestrator::orchestrator(plan const &p,
                           state_store &store,
                           checkpoint_manager &checkpoints,
                           unit_context base)
    : plan_{ p }, store_{ store }, checkpoints_{ checkpoints }, base_{ std::move(base) } {
  probe_ = [this](std::vector<std::string> const &commands) {
    return preflight_missing_commands(commands, base_.env);
  };
}

run_report orchestrator::run(run_options const &opts) {
  for (auto const &id : opts.force_ids) {
    if (!plan_.contains_id(id)) {
      throw std::invalid_argument("--force: no phase or unit named '" + id + "'");
    }
  }
  if (opts.only_phase && !plan_.find_phase(*opts.only_phase)) {
    throw std::invalid_argument("--phase: no phase named '" + *opts.only_phase + "'");
  }

  auto const start{ std::chrono::steady_clock::now() };
  auto const &phases{ plan_.phases() };

  run_report report;
  run_state rs{ .opts = opts,
                .report = report,
                .touch_checkpoint = !opts.dry_run && !opts.only_phase };

  std::size_t first{ 0 };
  std::size_t last{ phases.size() };

  if (opts.only_phase) {
    first = static_cast<std::size_t>(plan_.find_phase(*opts.only_phase) - phases.data());
    last = first + 1;
  } else {
    first = resume_index(opts, report);
    for (std::size_t i{ 0 }; i < first; ++i) {
      KILN_TRACE_PHASE_SKIPPED(phases[i].id, "before checkpoint");
      report.skipped += phases[i].units.size();
    }
  }

  if (opts.dry_run) { tui::info("Dry run: nothing will be executed or recorded"); }

  for (std::size_t i{ first }; i < last; ++i) {
    if (!run_phase(phases[i], rs)) { break; }

    if (rs.touch_checkpoint && i + 1 < phases.size()) {
      checkpoints_.save(phases[i + 1].id, "");
      KILN_TRACE_CHECKPOINT_SAVED(phases[i + 1].id, "");
    }
  }

  if (report.ok() && rs.touch_checkpoint) {
    checkpoints_.clear();
    KILN_TRACE_CHECKPOINT_CLEARED();
  }

  report.elapsed = std::chrono::milliseconds{ elapsed_ms(start) };
  return report;
}

std::size_t orchestrator::resume_index(run_options const &opts, run_report &report) const {
  if (opts.force_all) { return 0; }

  auto const cp{ checkpoints_.load() };
  if (!cp) { return 0; }

  auto const &phases{ plan_.phases() };
  auto const it{ std::find_if(phases.begin(), phases.end(), [&](auto const &p) {
    return p.id == cp->phase_id;
  }) };
  if (it == phases.end()) {
    tui::warn("Checkpoint names unknown phase '%s', starting from the beginning",
              cp->phase_id.c_str());
    return 0;
  }

  auto const index{ static_cast<std::size_t>(it - phases.begin()) };
  for (std::size_t i{ 0 }; i < index; ++i) {
    auto const &phase{ phases[i] };
    bool const targeted{ std::any_of(opts.force_ids.begin(),
                                     opts.force_ids.end(),
                                     [&](std::string const &id) {
                                       if (id == phase.id) { return true; }
                                       auto const *u{ plan_.find_unit(id) };
                                       return u && u->phase_id() == phase.id;
                                     }) };
    if (targeted || (phase.enabled && !store_.phase_completed(phase.id))) {
      tui::debug("Checkpoint at '%s' not trusted: phase '%s' needs a scan",
                 cp->phase_id.c_str(),
                 phase.id.c_str());
      return 0;
    }
  }

  if (index > 0) {
    tui::info("Resuming at phase '%s'", cp->phase_id.c_str());
    report.resumed_from = cp->phase_id;
  }
  return index;
}

bool orchestrator::run_phase(phase_def const &phase, run_state &rs) {
  auto &report{ rs.report };

  if (!phase.enabled) {
    tui::info("Phase %s is disabled, skipping", phase.name.c_str());
    KILN_TRACE_PHASE_SKIPPED(phase.id, "disabled");
    report.skipped += phase.units.size();
    return true;
  }

  bool const any_forced{ rs.forced(phase.id) ||
                         std::any_of(phase.units.begin(), phase.units.end(), [&](auto const &u) {
                           return rs.forced(u->id());
                         }) };

  if (!any_forced && store_.phase_completed(phase.id)) {
    tui::info("Phase %s already completed, skipping %zu units",
              phase.name.c_str(),
              phase.units.size());
    KILN_TRACE_PHASE_SKIPPED(phase.id, "completed");
    for (auto const &u : phase.units) {
      KILN_TRACE_UNIT_SKIPPED(phase.id, u->id(), "phase completed");
    }
    report.skipped += phase.units.size();
    return true;
  }

  if (auto const missing{ probe_(phase.required_commands) }; !missing.empty()) {
    std::string const why{ "missing required commands: " + join(missing) };
    if (rs.opts.dry_run || phase.prereq == prereq_mode::warn) {
      tui::warn("Phase %s: %s", phase.name.c_str(), why.c_str());
    } else {
      tui::error("Phase %s: %s", phase.name.c_str(), why.c_str());
      store_.mark_phase(phase.id, status::failed);
      rs.fail(phase.id, "", why);
      return false;
    }
  }

  tui::info("Phase %s (%zu units)", phase.name.c_str(), phase.units.size());
  KILN_TRACE_PHASE_START(phase.id, phase.units.size());
  auto const start{ std::chrono::steady_clock::now() };

  if (!rs.opts.dry_run) { store_.mark_phase(phase.id, status::in_progress); }

  bool ok{ true };
  if (phase.concurrency > 1 && !rs.opts.dry_run) {
    ok = run_phase_parallel(phase, rs);
  } else {
    for (auto const &u : phase.units) {
      if (!run_unit(phase, *u, rs)) {
        ok = false;
        break;
      }
    }
  }

  if (!ok) {
    if (!rs.opts.dry_run) { store_.mark_phase(phase.id, status::failed); }
    KILN_TRACE_PHASE_COMPLETE(phase.id, "failed", elapsed_ms(start));
    return false;
  }

  if (!rs.opts.dry_run) { store_.mark_phase(phase.id, status::completed); }
  KILN_TRACE_PHASE_COMPLETE(phase.id, "completed", elapsed_ms(start));
  return true;
}

bool orchestrator::run_phase_parallel(phase_def const &phase, run_state &rs) {
  if (rs.touch_checkpoint) {
    checkpoints_.save(phase.id, "");
    KILN_TRACE_CHECKPOINT_SAVED(phase.id, "");
  }

  tbb::task_arena arena{ phase.concurrency };
  arena.execute([&] {
    tbb::task_group group;
    for (auto const &u : phase.units) {
      group.run([&, target = u.get()] {
        if (!rs.halted) { run_unit(phase, *target, rs); }
      });
    }
    group.wait();
  });

  return !rs.halted;
}

bool orchestrator::run_unit(phase_def const &phase, unit &u, run_state &rs) {
  bool const forced{ rs.forced(phase.id) || rs.forced(u.id()) };
  bool const sequential{ phase.concurrency <= 1 };

  {
    std::lock_guard const lock{ rs.mutex };

    if (!forced && store_.has_completed(u.id())) {
      tui::debug("%s: already completed", u.id().c_str());
      KILN_TRACE_UNIT_SKIPPED(phase.id, u.id(), "completed");
      ++rs.report.skipped;
      return true;
    }

    if (rs.opts.dry_run) {
      tui::info("Would execute: %s%s", u.id().c_str(), forced ? " (forced)" : "");
      rs.report.would_execute.push_back(u.id());
      return true;
    }

    if (rs.touch_checkpoint && sequential) {
      checkpoints_.save(phase.id, u.id());
      KILN_TRACE_CHECKPOINT_SAVED(phase.id, u.id());
    }
    store_.mark_in_progress(u.id());
  }

  KILN_TRACE_UNIT_START(phase.id, u.id(), forced);
  tui::info("Running %s%s", u.id().c_str(), forced ? " (forced)" : "");
  auto const start{ std::chrono::steady_clock::now() };

  unit_context ctx{ base_ };
  ctx.phase_id = phase.id;
  ctx.forced = forced;
  ctx.dry_run = false;
  ctx.timeout = phase.timeout;

  auto result{ [&] {
    try {
      return u.execute(ctx);
    } catch (std::exception const &e) { return unit_result::failed(e.what()); }
  }() };
  if (!status_is_terminal(result.value)) {
    result = unit_result::failed(std::string{ "unit reported non-terminal status " } +
                                 status_name(result.value));
  }

  auto const duration{ elapsed_ms(start) };
  std::lock_guard const lock{ rs.mutex };
  store_.mark_result(u.id(), result.value);
  ++rs.report.executed;
  KILN_TRACE_UNIT_COMPLETE(phase.id, u.id(), status_name(result.value), duration);

  if (result.value == status::failed) {
    tui::error("%s failed: %s", u.id().c_str(), result.diagnostic.c_str());
    rs.fail(phase.id, u.id(), result.diagnostic);
    return false;
  }

  if (result.value == status::skipped) {
    tui::info("%s skipped (%s)", u.id().c_str(), result.diagnostic.c_str());
  } else {
    tui::info("%s completed in %s",
              u.id().c_str(),
              util_format_duration(std::chrono::milliseconds{ duration }).c_str());
  }
  return true;
}

}  // namespace kiln
