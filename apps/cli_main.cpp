#include "photo_restore/config/configuration.hpp"
#include "photo_restore/core/errors.hpp"
#include "photo_restore/core/types.hpp"
#include "photo_restore/core/utils.hpp"
#include "photo_restore/io/staging.hpp"
#include "photo_restore/runner/events.hpp"
#include "photo_restore/runner/launcher.hpp"
#include "photo_restore/runner/orchestrator.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using json = nlohmann::json;

namespace {

constexpr int kExitRunFailed = 1;
constexpr int kExitConfigError = 2;

photo_restore::config::Config load_config(const std::string &config_path,
                                          const std::string &project_root) {
  using photo_restore::config::Config;
  Config cfg = config_path.empty() ? Config{} : Config::load(config_path);
  if (!project_root.empty()) {
    cfg.paths.project_root = project_root;
  }
  cfg.validate();
  return cfg;
}

struct RunArgs {
  std::string config_path;
  std::string project_root;
  std::string run_id;
  std::string input;
  std::string output_folder;
  std::string gpu;
  std::string python;
  std::string event_log;
  bool with_scratch = true;
  bool with_scratch_set = false;
  bool hr = false;
  bool hr_set = false;
};

int run_command(const RunArgs &args) {
  using namespace photo_restore;

  config::Config cfg;
  try {
    cfg = load_config(args.config_path, args.project_root);
  } catch (const PhotoRestoreError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitConfigError;
  }

  RunRequest request;
  request.run_id = args.run_id.empty() ? core::get_run_id() : args.run_id;
  request.input_path = args.input;
  if (!args.output_folder.empty()) {
    request.output_folder = args.output_folder;
  }
  request.options = cfg.defaults.apply(
      args.gpu.empty() ? std::nullopt : std::optional<std::string>(args.gpu),
      args.with_scratch_set ? std::optional<bool>(args.with_scratch) : std::nullopt,
      args.hr_set ? std::optional<bool>(args.hr) : std::nullopt);
  request.python = args.python.empty() ? cfg.worker.interpreter : args.python;

  const std::string event_log =
      args.event_log.empty() ? cfg.logging.event_log : args.event_log;
  std::ofstream log_file;
  if (!event_log.empty()) {
    log_file.open(event_log, std::ios::app);
    if (!log_file) {
      std::cerr << "Error: Cannot open event log: " << event_log << std::endl;
      return kExitConfigError;
    }
  }

  auto emitter = std::make_shared<runner::JsonLinesEmitter>(
      std::cout, log_file.is_open() ? &log_file : nullptr);
  auto orchestrator = std::make_shared<const runner::RunOrchestrator>(
      runner::OrchestratorSettings::from_config(cfg));

  auto pending = runner::launch_run(orchestrator, request, emitter);
  try {
    const RunResult result = pending.get();
    emitter->run_succeeded(request.run_id, result);
    return 0;
  } catch (const RunError &e) {
    emitter->run_failed(request.run_id, e.kind(), e.what());
    return kExitRunFailed;
  }
}

int pick_latest_command(const std::string &dir) {
  try {
    const auto latest = photo_restore::io::pick_latest_file(dir);
    json out;
    out["dir"] = dir;
    out["latest"] = latest ? json(latest->string()) : json(nullptr);
    std::cout << out.dump(2) << std::endl;
    return 0;
  } catch (const photo_restore::RunError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitRunFailed;
  }
}

int print_config_command(const std::string &config_path) {
  try {
    const auto cfg = load_config(config_path, std::string());
    std::cout << cfg.to_yaml() << std::endl;
    return 0;
  } catch (const photo_restore::PhotoRestoreError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitConfigError;
  }
}

int validate_config_command(const std::string &config_path) {
  json out;
  out["path"] = config_path;
  try {
    load_config(config_path, std::string());
    out["valid"] = true;
  } catch (const photo_restore::PhotoRestoreError &e) {
    out["valid"] = false;
    out["error"] = e.what();
  }
  std::cout << out.dump(2) << std::endl;
  return out["valid"].get<bool>() ? 0 : kExitConfigError;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Photo restoration runner"};
  app.require_subcommand(1);

  RunArgs run_args;
  auto run_cmd = app.add_subcommand("run", "Restore one photo or folder");
  run_cmd->add_option("--input", run_args.input, "Input image file or folder")
      ->required();
  run_cmd->add_option("--output-folder", run_args.output_folder,
                      "Output folder (relative to project root)");
  run_cmd->add_option("--gpu", run_args.gpu, "GPU ids, -1 for CPU");
  auto scratch_flag = run_cmd->add_flag("--with-scratch,!--no-scratch",
                                        run_args.with_scratch,
                                        "Enable scratch detection");
  auto hr_flag = run_cmd->add_flag("--hr,!--no-hr", run_args.hr, "High resolution mode");
  run_cmd->add_option("--python", run_args.python, "Worker interpreter");
  run_cmd->add_option("--run-id", run_args.run_id, "Run identifier");
  run_cmd->add_option("--config", run_args.config_path, "Path to photo_restore.yaml");
  run_cmd->add_option("--project-root", run_args.project_root,
                      "Directory holding the worker entry script");
  run_cmd->add_option("--event-log", run_args.event_log,
                      "Append progress events to this file");

  std::string latest_dir;
  auto latest_cmd = app.add_subcommand("pick-latest",
                                       "Print the newest file of a directory");
  latest_cmd->add_option("dir", latest_dir, "Directory")->required();

  std::string print_cfg_path;
  auto print_cfg_cmd = app.add_subcommand("print-config", "Print effective config");
  print_cfg_cmd->add_option("--config", print_cfg_path, "Path to photo_restore.yaml");

  std::string validate_cfg_path;
  auto validate_cfg_cmd = app.add_subcommand("validate-config", "Validate config");
  validate_cfg_cmd->add_option("--config", validate_cfg_path, "Path to photo_restore.yaml")
      ->required();

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    run_args.with_scratch_set = scratch_flag->count() > 0;
    run_args.hr_set = hr_flag->count() > 0;
    return run_command(run_args);
  }
  if (latest_cmd->parsed()) {
    return pick_latest_command(latest_dir);
  }
  if (print_cfg_cmd->parsed()) {
    return print_config_command(print_cfg_path);
  }
  if (validate_cfg_cmd->parsed()) {
    return validate_config_command(validate_cfg_path);
  }
  return 1;
}
