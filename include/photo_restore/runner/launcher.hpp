#pragma once

#include "photo_restore/runner/orchestrator.hpp"

#include <future>
#include <memory>

namespace photo_restore::runner {

/**
 * Runs request on the calling thread. RunErrors pass through; any other
 * exception escaping the run becomes TaskFailed.
 */
RunResult run_guarded(const RunOrchestrator& orchestrator, const RunRequest& request,
                      ProgressSink& sink);

/**
 * Starts request on a dedicated thread. The orchestrator and sink are shared
 * with the run until it finishes. There is no way to cancel a started run;
 * destroying the returned future waits for it.
 */
std::future<RunResult> launch_run(std::shared_ptr<const RunOrchestrator> orchestrator,
                                  RunRequest request,
                                  std::shared_ptr<ProgressSink> sink);

} // namespace photo_restore::runner
