#include "test_support.h"

#include "util.h"

#include <cctype>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace kiln::test {

temp_dir_fixture::temp_dir_fixture() {
  static std::mt19937_64 rng{ std::random_device{}() };
  root = std::filesystem::temp_directory_path() /
         std::filesystem::path("kiln-test-unit-" + std::to_string(rng()));
  std::filesystem::create_directories(root);
}

temp_dir_fixture::~temp_dir_fixture() {
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}

void write_file(std::filesystem::path const &path, std::string_view content) {
  if (path.has_parent_path()) { std::filesystem::create_directories(path.parent_path()); }
  std::ofstream out{ path, std::ios::binary | std::ios::trunc };
  if (!out) { throw std::runtime_error("write_file: cannot open " + path.string()); }
  out << content;
}

std::vector<std::string> read_lines(std::filesystem::path const &path) {
  std::vector<std::string> lines;
  for (auto const line : util_split(util_load_text_file(path), '\n')) {
    if (!line.empty()) { lines.emplace_back(line); }
  }
  return lines;
}

fake_pkg_manager::fake_pkg_manager(std::filesystem::path modules_dir)
    : modules_dir{ std::move(modules_dir) } {}

bool fake_pkg_manager::consume_transient() {
  if (transient_failures <= 0) { return false; }
  --transient_failures;
  return true;
}

void fake_pkg_manager::materialize(std::string const &name) {
  if (ghost_names.contains(name)) { return; }
  std::filesystem::create_directories(modules_dir / name);
}

bool fake_pkg_manager::install_artifact(std::filesystem::path const &artifact, bool) {
  std::string const filename{ artifact.filename().string() };
  artifact_calls.push_back(filename);
  if (consume_transient()) { return false; }

  // "zod-3.22.4.tgz" -> "zod"
  std::string name{ filename };
  for (std::size_t i{ 0 }; i + 1 < filename.size(); ++i) {
    if (filename[i] == '-' && std::isdigit(static_cast<unsigned char>(filename[i + 1]))) {
      name = filename.substr(0, i);
      break;
    }
  }

  if (fail_names.contains(name)) { return false; }
  materialize(name);
  return true;
}

bool fake_pkg_manager::install_batch(std::vector<pkg_request> const &requests, bool dev) {
  std::vector<std::string> specs;
  for (auto const &request : requests) { specs.push_back(pkg_request_spec(request)); }
  batch_calls.push_back(specs);
  batch_dev.push_back(dev);
  if (consume_transient()) { return false; }

  for (auto const &request : requests) {
    if (fail_names.contains(request.name)) { return false; }
  }
  for (auto const &request : requests) { materialize(request.name); }
  return true;
}

void execution_log::record(std::string id) {
  std::lock_guard const lock{ mutex_ };
  entries_.push_back(std::move(id));
}

std::vector<std::string> execution_log::entries() const {
  std::lock_guard const lock{ mutex_ };
  return entries_;
}

fake_unit::fake_unit(std::string id,
                     std::string phase_id,
                     execution_log *log,
                     std::vector<pkg_request> packages)
    : unit{ std::move(id), std::move(phase_id), std::move(packages) }, log_{ log } {}

unit_result fake_unit::execute(unit_context const &ctx) {
  ++calls;
  last_forced = ctx.forced;
  if (log_) { log_->record(id()); }

  if (behavior) { return behavior(ctx); }

  if (!required_packages().empty()) {
    if (!ctx.pkg_installer) { return unit_result::failed("no installer"); }
    try {
      ctx.pkg_installer->install_with_retry(required_packages(), ctx.retry);
    } catch (install_error const &e) {
      return unit_result::failed(e.what());
    }
  }
  return unit_result::completed();
}

}  // namespace kiln::test
