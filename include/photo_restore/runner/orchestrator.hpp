#pragma once

#include "photo_restore/config/configuration.hpp"
#include "photo_restore/core/types.hpp"
#include "photo_restore/runner/events.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace photo_restore::runner {

namespace fs = std::filesystem;

struct OrchestratorSettings {
    fs::path project_root;
    std::string default_output_folder = "output_gui";
    std::string entry_script = "run.py";
    std::string unbuffered_env = "PYTHONUNBUFFERED";
    std::chrono::milliseconds poll_interval{200};

    static OrchestratorSettings from_config(const config::Config& cfg);
};

/**
 * Drives one run end to end: output folder, staging, worker spawn, output
 * draining with stage tracking, exit check and result lookup.
 *
 * run() is const and keeps all per-run state on its own stack, so a single
 * orchestrator may serve concurrent runs with distinct output folders.
 * Every failure is reported to the sink as a final error event before it is
 * rethrown as a RunError; exceptions outside the taxonomy become TaskFailed.
 * Directories created before a failure are kept.
 */
class RunOrchestrator {
public:
    explicit RunOrchestrator(OrchestratorSettings settings);

    RunResult run(const RunRequest& request, ProgressSink& sink) const;

    // Blank override: <project_root>/<default_output_folder>; relative
    // overrides are resolved against the project root.
    fs::path resolve_output_folder(const std::optional<std::string>& override_folder) const;

    const OrchestratorSettings& settings() const { return settings_; }

private:
    struct RunContext;

    RunResult execute(const RunRequest& request, RunContext& ctx) const;

    OrchestratorSettings settings_;
};

} // namespace photo_restore::runner
