#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace kiln {

namespace trace_events {

struct phase_start {
  std::string phase;
  std::int64_t unit_count;
};

struct phase_complete {
  std::string phase;
  std::string status;
  std::int64_t duration_ms;
};

struct phase_skipped {
  std::string phase;
  std::string reason;
};

struct unit_start {
  std::string phase;
  std::string unit;
  bool forced;
};

struct unit_complete {
  std::string phase;
  std::string unit;
  std::string status;
  std::int64_t duration_ms;
};

struct unit_skipped {
  std::string phase;
  std::string unit;
  std::string reason;
};

struct install_attempt {
  std::int64_t attempt;
  std::int64_t max_attempts;
  std::int64_t package_count;
};

struct install_complete {
  std::int64_t attempt;
  bool success;
  std::int64_t failed_count;
  std::int64_t duration_ms;
};

struct cache_hit {
  std::string package;
  std::string artifact;
};

struct cache_miss {
  std::string package;
};

struct checkpoint_saved {
  std::string phase;
  std::string unit;
};

struct checkpoint_cleared {};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::phase_start,
                                   trace_events::phase_complete,
                                   trace_events::phase_skipped,
                                   trace_events::unit_start,
                                   trace_events::unit_complete,
                                   trace_events::unit_skipped,
                                   trace_events::install_attempt,
                                   trace_events::install_complete,
                                   trace_events::cache_hit,
                                   trace_events::cache_miss,
                                   trace_events::checkpoint_saved,
                                   trace_events::checkpoint_cleared>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace kiln

#define KILN_TRACE_UNLIKELY [[unlikely]]

#define KILN_TRACE_EMIT(event_expr) \
  do { \
    if (::kiln::tui::g_trace_enabled) KILN_TRACE_UNLIKELY { \
        ::kiln::tui::trace event_expr; \
      } \
  } while (0)

#define KILN_TRACE_PHASE_START(phase_value, unit_count_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::phase_start{ \
      .phase = (phase_value), \
      .unit_count = static_cast<std::int64_t>(unit_count_value), \
  }))

#define KILN_TRACE_PHASE_COMPLETE(phase_value, status_value, duration_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::phase_complete{ \
      .phase = (phase_value), \
      .status = (status_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define KILN_TRACE_PHASE_SKIPPED(phase_value, reason_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::phase_skipped{ \
      .phase = (phase_value), \
      .reason = (reason_value), \
  }))

#define KILN_TRACE_UNIT_START(phase_value, unit_value, forced_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::unit_start{ \
      .phase = (phase_value), \
      .unit = (unit_value), \
      .forced = (forced_value), \
  }))

#define KILN_TRACE_UNIT_COMPLETE(phase_value, unit_value, status_value, duration_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::unit_complete{ \
      .phase = (phase_value), \
      .unit = (unit_value), \
      .status = (status_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define KILN_TRACE_UNIT_SKIPPED(phase_value, unit_value, reason_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::unit_skipped{ \
      .phase = (phase_value), \
      .unit = (unit_value), \
      .reason = (reason_value), \
  }))

#define KILN_TRACE_INSTALL_ATTEMPT(attempt_value, max_value, count_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::install_attempt{ \
      .attempt = static_cast<std::int64_t>(attempt_value), \
      .max_attempts = static_cast<std::int64_t>(max_value), \
      .package_count = static_cast<std::int64_t>(count_value), \
  }))

#define KILN_TRACE_INSTALL_COMPLETE(attempt_value, success_value, failed_value, duration_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::install_complete{ \
      .attempt = static_cast<std::int64_t>(attempt_value), \
      .success = (success_value), \
      .failed_count = static_cast<std::int64_t>(failed_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define KILN_TRACE_CACHE_HIT(package_value, artifact_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::cache_hit{ \
      .package = (package_value), \
      .artifact = (artifact_value), \
  }))

#define KILN_TRACE_CACHE_MISS(package_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::cache_miss{ \
      .package = (package_value), \
  }))

#define KILN_TRACE_CHECKPOINT_SAVED(phase_value, unit_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::checkpoint_saved{ \
      .phase = (phase_value), \
      .unit = (unit_value), \
  }))

#define KILN_TRACE_CHECKPOINT_CLEARED() \
  KILN_TRACE_EMIT((::kiln::trace_events::checkpoint_cleared{}))
