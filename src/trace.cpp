#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace kiln {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(phase_start),
                        TRACE_NAME(phase_complete),
                        TRACE_NAME(phase_skipped),
                        TRACE_NAME(unit_start),
                        TRACE_NAME(unit_complete),
                        TRACE_NAME(unit_skipped),
                        TRACE_NAME(install_attempt),
                        TRACE_NAME(install_complete),
                        TRACE_NAME(cache_hit),
                        TRACE_NAME(cache_miss),
                        TRACE_NAME(checkpoint_saved),
                        TRACE_NAME(checkpoint_cleared),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::phase_start const &value) {
            std::ostringstream oss;
            oss << "phase_start phase=" << value.phase << " units=" << value.unit_count;
            return oss.str();
          },
          [](trace_events::phase_complete const &value) {
            std::ostringstream oss;
            oss << "phase_complete phase=" << value.phase << " status=" << value.status
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::phase_skipped const &value) {
            std::ostringstream oss;
            oss << "phase_skipped phase=" << value.phase << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::unit_start const &value) {
            std::ostringstream oss;
            oss << "unit_start phase=" << value.phase << " unit=" << value.unit
                << " forced=" << bool_string(value.forced);
            return oss.str();
          },
          [](trace_events::unit_complete const &value) {
            std::ostringstream oss;
            oss << "unit_complete phase=" << value.phase << " unit=" << value.unit
                << " status=" << value.status << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::unit_skipped const &value) {
            std::ostringstream oss;
            oss << "unit_skipped phase=" << value.phase << " unit=" << value.unit
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::install_attempt const &value) {
            std::ostringstream oss;
            oss << "install_attempt attempt=" << value.attempt << "/" << value.max_attempts
                << " packages=" << value.package_count;
            return oss.str();
          },
          [](trace_events::install_complete const &value) {
            std::ostringstream oss;
            oss << "install_complete attempt=" << value.attempt
                << " success=" << bool_string(value.success)
                << " failed=" << value.failed_count << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::cache_hit const &value) {
            std::ostringstream oss;
            oss << "cache_hit package=" << value.package << " artifact=" << value.artifact;
            return oss.str();
          },
          [](trace_events::cache_miss const &value) {
            std::ostringstream oss;
            oss << "cache_miss package=" << value.package;
            return oss.str();
          },
          [](trace_events::checkpoint_saved const &value) {
            std::ostringstream oss;
            oss << "checkpoint_saved phase=" << value.phase << " unit=" << value.unit;
            return oss.str();
          },
          [](trace_events::checkpoint_cleared const &) {
            return std::string{ "checkpoint_cleared" };
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::phase_start const &value) {
            append_kv(output, "phase", value.phase);
            append_kv(output, "unit_count", value.unit_count);
          },
          [&](trace_events::phase_complete const &value) {
            append_kv(output, "phase", value.phase);
            append_kv(output, "status", value.status);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::phase_skipped const &value) {
            append_kv(output, "phase", value.phase);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::unit_start const &value) {
            append_kv(output, "phase", value.phase);
            append_kv(output, "unit", value.unit);
            append_kv(output, "forced", value.forced);
          },
          [&](trace_events::unit_complete const &value) {
            append_kv(output, "phase", value.phase);
            append_kv(output, "unit", value.unit);
            append_kv(output, "status", value.status);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::unit_skipped const &value) {
            append_kv(output, "phase", value.phase);
            append_kv(output, "unit", value.unit);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::install_attempt const &value) {
            append_kv(output, "attempt", value.attempt);
            append_kv(output, "max_attempts", value.max_attempts);
            append_kv(output, "package_count", value.package_count);
          },
          [&](trace_events::install_complete const &value) {
            append_kv(output, "attempt", value.attempt);
            append_kv(output, "success", value.success);
            append_kv(output, "failed_count", value.failed_count);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::cache_hit const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "artifact", value.artifact);
          },
          [&](trace_events::cache_miss const &value) {
            append_kv(output, "package", value.package);
          },
          [&](trace_events::checkpoint_saved const &value) {
            append_kv(output, "phase", value.phase);
            append_kv(output, "unit", value.unit);
          },
          [&](trace_events::checkpoint_cleared const &) {},
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace kiln
