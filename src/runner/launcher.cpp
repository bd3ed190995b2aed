#include "photo_restore/runner/launcher.hpp"
#include "photo_restore/core/errors.hpp"

#include <iostream>

namespace photo_restore::runner {

RunResult run_guarded(const RunOrchestrator& orchestrator, const RunRequest& request,
                      ProgressSink& sink) {
    try {
        return orchestrator.run(request, sink);
    } catch (const RunError&) {
        throw;
    } catch (const std::exception& e) {
        TaskFailed failure(e.what());
        std::cerr << "[RUN] " << request.run_id << ": " << failure.what() << std::endl;
        try {
            sink.on_progress(ProgressEvent{request.run_id, std::nullopt, failure.what(), true});
        } catch (const std::exception& sink_error) {
            std::cerr << "[RUN] " << request.run_id
                      << ": could not report failure: " << sink_error.what() << std::endl;
        }
        throw failure;
    }
}

std::future<RunResult> launch_run(std::shared_ptr<const RunOrchestrator> orchestrator,
                                  RunRequest request,
                                  std::shared_ptr<ProgressSink> sink) {
    return std::async(std::launch::async,
                      [orchestrator = std::move(orchestrator), request = std::move(request),
                       sink = std::move(sink)]() {
                          return run_guarded(*orchestrator, request, *sink);
                      });
}

} // namespace photo_restore::runner
