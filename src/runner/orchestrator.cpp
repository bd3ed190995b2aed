#include "photo_restore/runner/orchestrator.hpp"
#include "photo_restore/core/errors.hpp"
#include "photo_restore/core/stage_classifier.hpp"
#include "photo_restore/core/utils.hpp"
#include "photo_restore/io/staging.hpp"
#include "photo_restore/process/process_runner.hpp"
#include "photo_restore/process/stream_multiplexer.hpp"

#include <iostream>
#include <system_error>

namespace photo_restore::runner {

using process::OutputLine;
using process::RecvStatus;
using process::StreamOrigin;

OrchestratorSettings OrchestratorSettings::from_config(const config::Config& cfg) {
    OrchestratorSettings s;
    s.project_root = cfg.resolved_project_root();
    s.default_output_folder = cfg.paths.default_output_folder;
    s.entry_script = cfg.worker.entry_script;
    s.unbuffered_env = cfg.worker.unbuffered_env;
    s.poll_interval = std::chrono::milliseconds(cfg.runtime.poll_interval_ms);
    return s;
}

struct RunOrchestrator::RunContext {
    const std::string& run_id;
    ProgressSink& sink;
    std::optional<Stage> stage = kStageStarting;
    RunState state = RunState::Starting;

    void emit(std::optional<Stage> s, const std::string& message, bool is_error) {
        sink.on_progress(ProgressEvent{run_id, s, message, is_error});
    }
};

RunOrchestrator::RunOrchestrator(OrchestratorSettings settings)
    : settings_(std::move(settings)) {
    if (settings_.project_root.empty()) {
        settings_.project_root = fs::current_path();
    }
    settings_.project_root = fs::absolute(settings_.project_root);
}

fs::path RunOrchestrator::resolve_output_folder(
    const std::optional<std::string>& override_folder) const {
    if (override_folder && !core::is_blank(*override_folder)) {
        fs::path p(*override_folder);
        return p.is_absolute() ? p : settings_.project_root / p;
    }
    return settings_.project_root / settings_.default_output_folder;
}

RunResult RunOrchestrator::run(const RunRequest& request, ProgressSink& sink) const {
    RunContext ctx{request.run_id, sink};
    ctx.emit(kStageStarting, "Starting...", false);

    try {
        RunResult result = execute(request, ctx);
        ctx.state = RunState::Succeeded;
        std::cerr << "[RUN] " << request.run_id << " " << run_state_to_string(ctx.state)
                  << ": " << result.output_path << std::endl;
        return result;
    } catch (const RunError& e) {
        ctx.state = RunState::Failed;
        std::cerr << "[RUN] " << request.run_id << " " << run_state_to_string(ctx.state)
                  << " (" << error_kind_name(e.kind()) << "): " << e.what() << std::endl;
        ctx.emit(ctx.stage, e.what(), true);
        throw;
    } catch (const std::exception& e) {
        ctx.state = RunState::Failed;
        TaskFailed failure(e.what());
        std::cerr << "[RUN] " << request.run_id << " " << run_state_to_string(ctx.state)
                  << ": " << failure.what() << std::endl;
        try {
            ctx.emit(ctx.stage, failure.what(), true);
        } catch (const std::exception& sink_error) {
            std::cerr << "[RUN] " << request.run_id
                      << ": could not report failure: " << sink_error.what() << std::endl;
        }
        throw failure;
    }
}

RunResult RunOrchestrator::execute(const RunRequest& request, RunContext& ctx) const {
    const fs::path output_folder = resolve_output_folder(request.output_folder);
    std::error_code ec;
    fs::create_directories(output_folder, ec);
    if (ec) {
        throw IOError("Failed to create output folder " + output_folder.string() + ": " +
                      ec.message());
    }

    if (core::is_blank(request.input_path)) {
        throw InputNotFound("Input not found: \"" + request.input_path + "\"");
    }
    const fs::path input_path = fs::absolute(request.input_path, ec);
    if (ec || !fs::exists(input_path, ec)) {
        throw InputNotFound("Input not found: " + request.input_path);
    }

    const fs::path input_folder = io::prepare_input_folder(input_path, output_folder);
    const StageDirs stage_dirs = io::reset_stage_dirs(output_folder);

    const fs::path entry_script = settings_.project_root / settings_.entry_script;
    if (!fs::exists(entry_script, ec)) {
        throw LaunchScriptMissing(settings_.entry_script + " not found: " + entry_script.string());
    }

    process::ProcessSpec spec;
    spec.program = request.python;
    spec.args = process::build_worker_args(entry_script, input_folder, output_folder,
                                           request.options);
    spec.cwd = settings_.project_root;
    if (!settings_.unbuffered_env.empty()) {
        spec.env[settings_.unbuffered_env] = "1";
    }

    process::ChildProcess child = process::ChildProcess::spawn(spec);
    ctx.state = RunState::Running;
    process::StreamMultiplexer mux(child.take_stdout(), child.take_stderr());

    auto forward = [&ctx](const OutputLine& line) {
        ctx.stage = core::advance_stage(ctx.stage, line.text);
        ctx.emit(ctx.stage, line.text, line.origin == StreamOrigin::Stderr);
    };

    process::ExitStatus status;
    while (true) {
        OutputLine line;
        const RecvStatus rs = mux.recv_for(settings_.poll_interval, line);
        if (rs == RecvStatus::Line) {
            forward(line);
            continue;
        }
        if (rs == RecvStatus::Timeout) {
            if (auto exited = child.try_wait()) {
                status = *exited;
                break;
            }
            continue;
        }
        // Both streams closed before the poll saw the exit.
        status = child.wait();
        break;
    }

    // Lines read between the last receive and end of stream are still queued.
    mux.join();
    while (auto line = mux.try_recv()) {
        forward(*line);
    }

    if (!status.success()) {
        throw WorkerExitedNonZero("Worker exited with status: " + status.describe());
    }

    const fs::path& final_dir = stage_dirs.final_dir();
    const auto latest = io::pick_latest_file(final_dir);
    if (!latest) {
        throw NoOutputProduced("No output image found under " + final_dir.string());
    }

    ctx.stage = kStageFinal;
    ctx.emit(kStageFinal, "Done", false);
    return RunResult{latest->string()};
}

} // namespace photo_restore::runner
