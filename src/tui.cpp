#include "tui.h"

#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace kiln::tui {

bool g_trace_enabled{ false };

namespace {

constexpr std::chrono::milliseconds kFlushInterval{ 50 };

struct log_line {
  std::chrono::system_clock::time_point when;
  level severity;
  std::string text;
};

using queued = std::variant<log_line, trace_event_t>;

struct file_closer {
  void operator()(std::FILE *f) const { std::fclose(f); }
};

using trace_file_ptr = std::unique_ptr<std::FILE, file_closer>;

char const *level_label(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2024-01-15 10:30:00.123] [INF] "
std::string decorated_prefix(level severity, std::chrono::system_clock::time_point when) {
  auto const secs{ std::chrono::time_point_cast<std::chrono::seconds>(when) };
  auto const millis{ std::chrono::duration_cast<std::chrono::milliseconds>(when - secs) };
  std::time_t const t{ std::chrono::system_clock::to_time_t(when) };
  std::tm local{};
  localtime_r(&t, &local);

  char date[24]{};
  if (std::strftime(date, sizeof date, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char prefix[48]{};
  std::snprintf(prefix,
                sizeof prefix,
                "[%s.%03d] [%s] ",
                date,
                static_cast<int>(millis.count()),
                level_label(severity));
  return prefix;
}

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const needed{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (needed <= 0) { return {}; }

  std::string out(static_cast<std::size_t>(needed) + 1, '\0');
  std::vsnprintf(out.data(), out.size(), fmt, args);
  out.resize(static_cast<std::size_t>(needed));
  return out;
}

// Owns everything the log front end and the writer thread share. Entries are queued while
// the writer runs and rendered inline otherwise.
class log_writer {
 public:
  bool initialized{ false };
  std::optional<level> threshold;
  bool decorated{ false };

  void set_handler(std::function<void(std::string_view)> handler) {
    std::lock_guard const lock{ mutex_ };
    handler_ = std::move(handler);
  }

  bool running() const { return worker_.joinable(); }

  void open_trace_outputs(std::vector<trace_output_spec> const &outputs) {
    trace_file_.reset();
    trace_stderr_ = false;

    for (auto const &out : outputs) {
      if (out.type == trace_output_type::std_err) {
        trace_stderr_ = true;
        continue;
      }
      if (!out.file_path) { continue; }
      if (trace_file_) {
        trace_file_.reset();
        trace_stderr_ = false;
        throw std::logic_error{ "Only one trace file output supported" };
      }
      trace_file_.reset(std::fopen(out.file_path->c_str(), "w"));
      if (!trace_file_) {
        trace_stderr_ = false;
        throw std::runtime_error("Failed to open trace file: " + out.file_path->string());
      }
    }
  }

  bool tracing() const { return trace_stderr_ || trace_file_ != nullptr; }

  void submit(queued entry) {
    std::unique_lock lock{ mutex_ };
    if (!running()) {
      write(entry);
      return;
    }
    pending_.push_back(std::move(entry));
    lock.unlock();
    cv_.notify_one();
  }

  void start() {
    stop_ = false;
    worker_ = std::thread{ [this] { drain_until_stopped(); } };
  }

  void stop() {
    {
      std::lock_guard const lock{ mutex_ };
      stop_ = true;
    }
    cv_.notify_all();
    worker_.join();
    worker_ = std::thread{};
  }

 private:
  void drain_until_stopped() {
    std::unique_lock lock{ mutex_ };
    while (true) {
      cv_.wait_for(lock, kFlushInterval, [this] { return stop_ || !pending_.empty(); });
      std::deque<queued> batch;
      batch.swap(pending_);
      bool const stopping{ stop_ };

      lock.unlock();
      for (auto const &entry : batch) { write(entry); }
      if (!handler_) { std::fflush(stderr); }
      lock.lock();

      if (stopping && pending_.empty()) { return; }
    }
  }

  void emit(std::string const &line) {
    if (handler_) {
      handler_(line);
    } else {
      std::fwrite(line.data(), 1, line.size(), stderr);
    }
  }

  void write(queued const &entry) {
    if (auto const *line{ std::get_if<log_line>(&entry) }) {
      std::string out{ decorated ? decorated_prefix(line->severity, line->when) : "" };
      out += line->text;
      out += '\n';
      emit(out);
      return;
    }

    auto const &event{ std::get<trace_event_t>(entry) };
    if (trace_stderr_) {
      std::string out{ decorated ? decorated_prefix(level::TUI_TRACE,
                                                    std::chrono::system_clock::now())
                                 : "" };
      out += trace_event_to_string(event);
      out += '\n';
      emit(out);
    }
    if (trace_file_) {
      std::string const json{ trace_event_to_json(event) + "\n" };
      if (std::fwrite(json.data(), 1, json.size(), trace_file_.get()) != json.size() ||
          std::fflush(trace_file_.get()) != 0) {
        trace_file_.reset();
        emit("Trace file write failed; file tracing disabled\n");
      }
    }
  }

  std::function<void(std::string_view)> handler_;
  std::deque<queued> pending_;
  std::mutex mutex_;  // guards pending_, stop_ and handler_ replacement
  std::condition_variable cv_;
  std::thread worker_;
  bool stop_{ false };
  bool trace_stderr_{ false };
  trace_file_ptr trace_file_;
};

log_writer s_writer;
std::mutex s_stdout_mutex;

void log_at(level severity, char const *fmt, va_list args) {
  if (!s_writer.initialized || fmt == nullptr) { return; }
  if (s_writer.threshold && severity < *s_writer.threshold) { return; }

  std::string text{ vformat(fmt, args) };
  if (text.empty()) { return; }
  s_writer.submit(log_line{ .when = std::chrono::system_clock::now(),
                            .severity = severity,
                            .text = std::move(text) });
}

}  // namespace

void init() {
  if (s_writer.initialized) { throw std::logic_error{ "kiln::tui::init called more than once" }; }
  s_writer.initialized = true;
  s_writer.threshold = std::nullopt;
  s_writer.decorated = false;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  if (!s_writer.initialized) {
    throw std::logic_error{ "kiln::tui::configure_trace_outputs called before init" };
  }
  if (s_writer.running()) {
    throw std::logic_error{ "kiln::tui::configure_trace_outputs called while running" };
  }

  g_trace_enabled = false;
  s_writer.open_trace_outputs(outputs);
  g_trace_enabled = s_writer.tracing();
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  if (!s_writer.initialized) {
    throw std::logic_error{ "kiln::tui::set_output_handler called before init" };
  }
  if (s_writer.running()) {
    throw std::logic_error{ "kiln::tui::set_output_handler called while running" };
  }
  s_writer.set_handler(std::move(handler));
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_writer.initialized) { throw std::logic_error{ "kiln::tui::run called before init" }; }
  if (s_writer.running()) {
    throw std::logic_error{ "kiln::tui::run called while already running" };
  }

  s_writer.threshold = threshold;
  s_writer.decorated = decorated_logging;
  s_writer.start();
}

void shutdown() {
  if (!s_writer.running()) {
    throw std::logic_error{ "kiln::tui::shutdown called while not running" };
  }
  s_writer.stop();
  s_writer.threshold = std::nullopt;
  s_writer.decorated = false;
}

void trace(trace_event_t event) {
  if (!g_trace_enabled) { return; }
  s_writer.submit(std::move(event));
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_at(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_at(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_at(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_at(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard const lock{ s_stdout_mutex };
  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);
  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_writer.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace kiln::tui
