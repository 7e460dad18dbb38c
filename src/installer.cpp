#include "installer.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <thread>
#include <unordered_set>

namespace kiln {

namespace {

std::string join_names(std::vector<std::string> const &names) {
  std::string out;
  for (auto const &name : names) {
    if (!out.empty()) { out += ", "; }
    out += name;
  }
  return out;
}

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

install_error::install_error(std::string const &what, std::vector<std::string> failed)
    : std::runtime_error{ what }, failed_{ std::move(failed) } {}

installer::installer(installer_cfg cfg, pkg_manager &manager, sleep_fn_t sleep)
    : cfg_{ std::move(cfg) }, manager_{ manager }, sleep_{ std::move(sleep) } {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

install_plan installer::plan(std::vector<pkg_request> const &requests) const {
  return installer_plan(cfg_, requests);
}

install_plan installer_plan(installer_cfg const &cfg,
                            std::vector<pkg_request> const &requests) {
  install_plan result;
  std::unordered_set<std::string> seen;

  for (auto const &request : requests) {
    if (!seen.insert(request.name).second) { continue; }

    if (auto entry{ pkg_cache_find(cfg.cache_dir, request, cfg.strict_versions) }) {
      result.cached.emplace_back(request, std::move(*entry));
    } else {
      result.remote.push_back(request);
    }
  }
  return result;
}

void installer::install(std::vector<pkg_request> const &requests) {
  if (requests.empty()) { return; }

  auto const p{ plan(requests) };
  std::vector<std::string> failed;

  auto const mark_failed{ [&failed](std::string const &name) {
    if (std::find(failed.begin(), failed.end(), name) == failed.end()) {
      failed.push_back(name);
    }
  } };

  for (auto const &[request, entry] : p.cached) {
    KILN_TRACE_CACHE_HIT(request.name, entry.artifact.filename().string());
    tui::info("Installing %s from cache (%s)",
              request.name.c_str(),
              entry.artifact.filename().string().c_str());

    bool ok{ false };
    try {
      ok = manager_.install_artifact(entry.artifact, request.dev_only);
    } catch (std::exception const &e) {
      tui::warn("%s: %s", request.name.c_str(), e.what());
    }
    if (!ok) {
      tui::warn("Cached install failed: %s", request.name.c_str());
      mark_failed(request.name);
    }
  }

  for (bool const dev : { false, true }) {
    std::vector<pkg_request> batch;
    for (auto const &request : p.remote) {
      if (request.dev_only == dev) { batch.push_back(request); }
    }
    if (batch.empty()) { continue; }

    std::string specs;
    for (auto const &request : batch) {
      KILN_TRACE_CACHE_MISS(request.name);
      if (!specs.empty()) { specs += ' '; }
      specs += pkg_request_spec(request);
    }
    tui::info("Installing from registry%s: %s", dev ? " (dev)" : "", specs.c_str());

    bool ok{ false };
    try {
      ok = manager_.install_batch(batch, dev);
    } catch (std::exception const &e) {
      tui::warn("%s: %s", std::string{ manager_.name() }.c_str(), e.what());
    }
    if (!ok) {
      for (auto const &request : batch) { mark_failed(request.name); }
    }
  }

  auto const verify_one{ [&](pkg_request const &request) {
    if (std::find(failed.begin(), failed.end(), request.name) != failed.end()) { return; }
    if (!verify(request.name)) {
      tui::warn("Not present after install: %s", request.name.c_str());
      mark_failed(request.name);
    }
  } };
  for (auto const &[request, entry] : p.cached) { verify_one(request); }
  for (auto const &request : p.remote) { verify_one(request); }

  if (!failed.empty()) {
    throw install_error("Failed to install: " + join_names(failed), std::move(failed));
  }
}

void installer::install_with_retry(std::vector<pkg_request> const &requests,
                                   retry_policy const &policy) {
  if (policy.attempts < 1) {
    throw std::invalid_argument("install attempts must be at least 1");
  }
  if (requests.empty()) { return; }

  for (int attempt{ 1 };; ++attempt) {
    KILN_TRACE_INSTALL_ATTEMPT(attempt, policy.attempts, static_cast<int>(requests.size()));
    auto const start{ std::chrono::steady_clock::now() };

    try {
      install(requests);
      KILN_TRACE_INSTALL_COMPLETE(attempt, true, 0, elapsed_ms(start));
      if (policy.settle.count() > 0) { sleep_(policy.settle); }
      return;
    } catch (install_error const &e) {
      KILN_TRACE_INSTALL_COMPLETE(attempt,
                                  false,
                                  static_cast<int>(e.failed_packages().size()),
                                  elapsed_ms(start));
      if (attempt >= policy.attempts) {
        throw install_error("Install failed after " + std::to_string(policy.attempts) +
                                (policy.attempts == 1 ? " attempt: " : " attempts: ") +
                                join_names(e.failed_packages()),
                            e.failed_packages());
      }
      tui::warn("Install attempt %d/%d failed (%s), retrying in %s",
                attempt,
                policy.attempts,
                join_names(e.failed_packages()).c_str(),
                util_format_duration(policy.delay).c_str());
    }

    if (policy.delay.count() > 0) { sleep_(policy.delay); }
  }
}

bool installer::verify(std::string_view package_name) const {
  std::error_code ec;
  return std::filesystem::is_directory(cfg_.modules_dir / std::filesystem::path{ package_name },
                                       ec);
}

std::vector<std::string> installer_describe_plan(install_plan const &plan) {
  std::vector<std::string> lines;
  for (auto const &[request, entry] : plan.cached) {
    lines.push_back("[CACHED] " + pkg_request_spec(request) + " -> " +
                    entry.artifact.filename().string());
  }
  for (auto const &request : plan.remote) {
    lines.push_back("[NETWORK] " + pkg_request_spec(request));
  }
  lines.push_back("Summary: " + std::to_string(plan.cached.size()) + " cached, " +
                  std::to_string(plan.remote.size()) + " require network");
  return lines;
}

}  // namespace kiln
