#include "plan.h"

#include <algorithm>
#include <stdexcept>

namespace kiln {

bool plan_id_valid(std::string_view id) {
  return !id.empty() && id.find_first_of(":\r\n") == std::string_view::npos;
}

phase_def const *plan::find_phase(std::string_view id) const {
  auto const it{ std::find_if(phases_.begin(), phases_.end(), [&](auto const &p) {
    return p.id == id;
  }) };
  return it == phases_.end() ? nullptr : &*it;
}

unit const *plan::find_unit(std::string_view id) const {
  for (auto const &phase : phases_) {
    for (auto const &u : phase.units) {
      if (u->id() == id) { return u.get(); }
    }
  }
  return nullptr;
}

bool plan::contains_id(std::string_view id) const {
  return find_phase(id) != nullptr || find_unit(id) != nullptr;
}

std::vector<std::string> plan::active_unit_ids() const {
  std::vector<std::string> ids;
  for (auto const &phase : phases_) {
    if (!phase.enabled) { continue; }
    for (auto const &u : phase.units) { ids.push_back(u->id()); }
  }
  return ids;
}

std::vector<std::string> phase_unit_ids(phase_def const &phase) {
  std::vector<std::string> ids;
  ids.reserve(phase.units.size());
  for (auto const &u : phase.units) { ids.push_back(u->id()); }
  return ids;
}

void plan_builder::claim_id(std::string const &id, char const *what) {
  if (!plan_id_valid(id)) {
    throw std::invalid_argument(std::string{ what } + " id '" + id +
                                "' must be non-empty and free of ':' and line breaks");
  }
  if (std::find(ids_.begin(), ids_.end(), id) != ids_.end()) {
    throw std::invalid_argument(std::string{ what } + " id '" + id + "' is already used");
  }
  ids_.push_back(id);
}

plan_builder &plan_builder::phase(phase_def def) {
  claim_id(def.id, "phase");
  if (def.concurrency < 1) {
    throw std::invalid_argument("phase '" + def.id + "': concurrency must be at least 1");
  }
  if (def.timeout.count() <= 0) {
    throw std::invalid_argument("phase '" + def.id + "': timeout must be positive");
  }
  if (def.name.empty()) { def.name = def.id; }
  def.units.clear();
  plan_.phases_.push_back(std::move(def));
  return *this;
}

plan_builder &plan_builder::unit(kiln::unit::ptr_t u) {
  if (!u) { throw std::invalid_argument("null unit"); }
  if (plan_.phases_.empty()) {
    throw std::logic_error("unit '" + u->id() + "' added before any phase");
  }

  auto &current{ plan_.phases_.back() };
  if (u->phase_id() != current.id) {
    throw std::invalid_argument("unit '" + u->id() + "' belongs to phase '" + u->phase_id() +
                                "' but was added to '" + current.id + "'");
  }
  if (current.concurrency > 1 && !u->required_packages().empty()) {
    throw std::invalid_argument("unit '" + u->id() + "' installs packages; phase '" +
                                current.id + "' must run sequentially");
  }

  claim_id(u->id(), "unit");
  current.units.push_back(std::move(u));
  return *this;
}

plan plan_builder::build() {
  ids_.clear();
  return std::move(plan_);
}

}  // namespace kiln
