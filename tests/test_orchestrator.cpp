#include "photo_restore/core/errors.hpp"
#include "photo_restore/runner/launcher.hpp"
#include "photo_restore/runner/orchestrator.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;
namespace fs = std::filesystem;
namespace runner = photo_restore::runner;
using photo_restore::ErrorKind;
using photo_restore::ProgressEvent;
using photo_restore::RunError;
using photo_restore::RunRequest;
using photo_restore::Stage;
using photo_restore::testing::RecordingSink;
using photo_restore::testing::TempDir;
using photo_restore::testing::write_file;
using photo_restore::testing::write_worker;

namespace {

const std::string kRestoringWorker =
    "echo \"Running Stage 1: Overall restoration\"\n"
    "echo \"Mapping: You are using the mask free mode\"\n"
    "echo \"UserWarning: deprecated argument\" 1>&2\n"
    "echo \"Running Stage 2: Face Detection\"\n"
    "echo \"Running Stage 3: Face Enhancement\"\n"
    "echo \"Running Stage 4: Blending\"\n"
    "cp \"$in\"/* \"$out/final_output/\"\n"
    "echo \"All the processing is done.\"\n";

struct Fixture {
  TempDir tmp;
  fs::path root = tmp.path() / "project";
  fs::path input = tmp.path() / "photos" / "old.png";

  Fixture() {
    fs::create_directories(root);
    write_file(input, "pixels");
  }

  runner::RunOrchestrator orchestrator() const {
    runner::OrchestratorSettings s;
    s.project_root = root;
    s.poll_interval = 20ms;
    return runner::RunOrchestrator(s);
  }

  RunRequest request(const std::string &run_id) const {
    RunRequest r;
    r.run_id = run_id;
    r.input_path = input.string();
    r.python = "/bin/sh";
    return r;
  }
};

// Records events but rejects the Stage 2 marker line.
class RejectingSink : public RecordingSink {
  public:
    void on_progress(const ProgressEvent &event) override {
        if (event.message == "Running Stage 2: Face Detection") {
            throw std::runtime_error("event rejected");
        }
        RecordingSink::on_progress(event);
    }
};

ErrorKind run_and_capture_kind(const runner::RunOrchestrator &orch, const RunRequest &req,
                               RecordingSink &sink) {
  try {
    orch.run(req, sink);
  } catch (const RunError &e) {
    return e.kind();
  }
  FAIL("run did not fail");
  return ErrorKind::TaskFailed;
}

} // namespace

TEST_CASE("successful_run_returns_final_output_and_ends_with_done") {
  Fixture f;
  write_worker(f.root / "run.py", kRestoringWorker);
  RecordingSink sink;

  const auto result = f.orchestrator().run(f.request("run-ok"), sink);

  const fs::path expected = f.root / "output_gui" / "final_output" / "old.png";
  REQUIRE(fs::path(result.output_path) == expected);

  const auto events = sink.events();
  REQUIRE(events.size() >= 3);
  REQUIRE(events.front().stage == Stage{0});
  REQUIRE(events.front().message == "Starting...");
  REQUIRE(events.back().stage == Stage{4});
  REQUIRE(events.back().message == "Done");
  REQUIRE_FALSE(events.back().is_error);
  for (const auto &e : events) {
    REQUIRE(e.run_id == "run-ok");
  }
}

TEST_CASE("stderr_lines_are_flagged_and_stages_only_change_on_markers") {
  Fixture f;
  write_worker(f.root / "run.py", kRestoringWorker);
  RecordingSink sink;

  f.orchestrator().run(f.request("run-stages"), sink);

  bool saw_warning = false;
  for (const auto &e : sink.events()) {
    if (e.message == "Mapping: You are using the mask free mode") {
      REQUIRE(e.stage == Stage{1});
      REQUIRE_FALSE(e.is_error);
    }
    if (e.message == "UserWarning: deprecated argument") {
      saw_warning = true;
      REQUIRE(e.is_error);
    }
    if (e.message == "All the processing is done.") {
      REQUIRE(e.stage == Stage{4});
    }
  }
  REQUIRE(saw_warning);
}

TEST_CASE("worker_receives_staged_input_flags_and_unbuffered_env") {
  Fixture f;
  write_worker(f.root / "run.py",
               "echo \"IN:$in\"\n"
               "echo \"ENV:${PYTHONUNBUFFERED:-unset}\"\n"
               "echo \"CWD:$(pwd -P)\"\n"
               "touch \"$out/final_output/x.png\"\n");
  RecordingSink sink;
  auto req = f.request("run-args");
  req.output_folder = "custom_out";

  f.orchestrator().run(req, sink);

  const fs::path out = f.root / "custom_out";
  bool saw_in = false;
  bool saw_env = false;
  bool saw_cwd = false;
  for (const auto &e : sink.events()) {
    if (e.message == "IN:" + (out / "_gui_input").string()) saw_in = true;
    if (e.message == "ENV:1") saw_env = true;
    if (e.message == "CWD:" + fs::canonical(f.root).string()) saw_cwd = true;
  }
  REQUIRE(saw_in);
  REQUIRE(saw_env);
  REQUIRE(saw_cwd);
  REQUIRE(fs::is_directory(out / "stage_1_restore_output"));
}

TEST_CASE("directory_input_is_passed_through_without_staging") {
  Fixture f;
  const fs::path album = f.tmp.path() / "album";
  write_file(album / "a.png", "a");
  write_worker(f.root / "run.py",
               "echo \"IN:$in\"\n"
               "touch \"$out/final_output/a.png\"\n");
  RecordingSink sink;
  auto req = f.request("run-dir");
  req.input_path = album.string();

  f.orchestrator().run(req, sink);

  bool saw_in = false;
  for (const auto &e : sink.events()) {
    if (e.message == "IN:" + album.string()) saw_in = true;
  }
  REQUIRE(saw_in);
  REQUIRE_FALSE(fs::exists(f.root / "output_gui" / "_gui_input"));
}

TEST_CASE("nonzero_exit_fails_with_final_error_event") {
  Fixture f;
  write_worker(f.root / "run.py",
               "echo \"Running Stage 2: Face Detection\"\n"
               "echo \"Traceback (most recent call last):\" 1>&2\n"
               "exit 3\n");
  RecordingSink sink;

  const auto kind = run_and_capture_kind(f.orchestrator(), f.request("run-fail"), sink);

  REQUIRE(kind == ErrorKind::WorkerExitedNonZero);
  const auto events = sink.events();
  REQUIRE(events.back().is_error);
  REQUIRE(events.back().stage == Stage{2});
  REQUIRE(events.back().message.find("exit status: 3") != std::string::npos);
  for (const auto &e : events) {
    REQUIRE(e.message != "Done");
  }
}

TEST_CASE("clean_exit_without_output_fails_with_no_output_produced") {
  Fixture f;
  write_worker(f.root / "run.py", "echo \"Running Stage 1\"\n");
  RecordingSink sink;

  const auto kind = run_and_capture_kind(f.orchestrator(), f.request("run-empty"), sink);

  REQUIRE(kind == ErrorKind::NoOutputProduced);
  REQUIRE(sink.events().back().is_error);
}

TEST_CASE("stale_results_from_a_previous_run_are_not_returned") {
  Fixture f;
  write_file(f.root / "output_gui" / "final_output" / "previous.png", "old");
  write_worker(f.root / "run.py", "exit 0\n");
  RecordingSink sink;

  const auto kind = run_and_capture_kind(f.orchestrator(), f.request("run-stale"), sink);

  REQUIRE(kind == ErrorKind::NoOutputProduced);
  REQUIRE_FALSE(fs::exists(f.root / "output_gui" / "final_output" / "previous.png"));
}

TEST_CASE("missing_input_fails_before_spawning") {
  Fixture f;
  write_worker(f.root / "run.py", "touch \"$out/spawned\"\n");
  RecordingSink sink;
  auto req = f.request("run-noinput");
  req.input_path = (f.tmp.path() / "missing.png").string();

  REQUIRE(run_and_capture_kind(f.orchestrator(), req, sink) == ErrorKind::InputNotFound);
  REQUIRE_FALSE(fs::exists(f.root / "output_gui" / "spawned"));
  REQUIRE(sink.events().back().is_error);
}

TEST_CASE("empty_input_path_fails_with_input_not_found") {
  Fixture f;
  write_worker(f.root / "run.py", "touch \"$out/spawned\"\n");
  RecordingSink sink;
  auto req = f.request("run-emptyinput");

  req.input_path = "";
  REQUIRE(run_and_capture_kind(f.orchestrator(), req, sink) == ErrorKind::InputNotFound);
  req.input_path = "   ";
  REQUIRE(run_and_capture_kind(f.orchestrator(), req, sink) == ErrorKind::InputNotFound);

  REQUIRE_FALSE(fs::exists(f.root / "output_gui" / "spawned"));
  const auto events = sink.events();
  REQUIRE(events.back().is_error);
  REQUIRE(events.back().stage == Stage{0});
  REQUIRE(events.back().message.rfind("Input not found", 0) == 0);
}

TEST_CASE("missing_entry_script_fails_and_keeps_created_directories") {
  Fixture f;
  RecordingSink sink;

  REQUIRE(run_and_capture_kind(f.orchestrator(), f.request("run-noscript"), sink) ==
          ErrorKind::LaunchScriptMissing);
  REQUIRE(fs::is_directory(f.root / "output_gui" / "final_output"));
  REQUIRE(fs::is_directory(f.root / "output_gui" / "_gui_input"));
}

TEST_CASE("missing_interpreter_fails_with_spawn_error") {
  Fixture f;
  write_worker(f.root / "run.py", "exit 0\n");
  RecordingSink sink;
  auto req = f.request("run-nopython");
  req.python = "/definitely/not/here/python3";

  REQUIRE(run_and_capture_kind(f.orchestrator(), req, sink) == ErrorKind::SpawnError);
}

TEST_CASE("lines_written_right_before_exit_are_not_lost") {
  Fixture f;
  write_worker(f.root / "run.py",
               "i=0\n"
               "while [ $i -lt 300 ]; do echo \"line $i\"; echo \"err $i\" 1>&2; i=$((i+1)); done\n"
               "touch \"$out/final_output/r.png\"\n");
  RecordingSink sink;

  f.orchestrator().run(f.request("run-flood"), sink);

  int out_lines = 0;
  int err_lines = 0;
  for (const auto &e : sink.events()) {
    if (e.message.rfind("line ", 0) == 0) ++out_lines;
    if (e.message.rfind("err ", 0) == 0) ++err_lines;
  }
  REQUIRE(out_lines == 300);
  REQUIRE(err_lines == 300);
}

TEST_CASE("exit_status_is_checked_when_streams_close_before_exit") {
  Fixture f;
  write_worker(f.root / "run.py",
               "echo \"Running Stage 3: Face Enhancement\"\n"
               "exec >&- 2>&-\n"
               "sleep 0.5\n"
               "exit 5\n");
  RecordingSink sink;

  const auto kind = run_and_capture_kind(f.orchestrator(), f.request("run-closed"), sink);

  REQUIRE(kind == ErrorKind::WorkerExitedNonZero);
  const auto events = sink.events();
  REQUIRE(events.back().is_error);
  REQUIRE(events.back().stage == Stage{3});
  REQUIRE(events.back().message.find("exit status: 5") != std::string::npos);
}

TEST_CASE("undecodable_bytes_are_dropped_and_the_run_continues") {
  Fixture f;
  write_worker(f.root / "run.py",
               "printf 'bad \\377 line\\n'\n"
               "printf 'err \\376\\n' 1>&2\n"
               "touch \"$out/final_output/r.png\"\n");
  RecordingSink sink;

  const auto result = f.orchestrator().run(f.request("run-bytes"), sink);

  REQUIRE(fs::path(result.output_path).filename() == "r.png");
  bool saw_out = false;
  bool saw_err = false;
  for (const auto &e : sink.events()) {
    if (e.message == "bad  line") {
      saw_out = true;
      REQUIRE_FALSE(e.is_error);
    }
    if (e.message == "err ") {
      saw_err = true;
      REQUIRE(e.is_error);
    }
  }
  REQUIRE(saw_out);
  REQUIRE(saw_err);
  REQUIRE(sink.events().back().message == "Done");
}

TEST_CASE("unexpected_failure_mid_run_reports_task_failed_with_last_stage") {
  Fixture f;
  write_worker(f.root / "run.py",
               "echo \"Running Stage 1: Overall restoration\"\n"
               "echo \"Running Stage 2: Face Detection\"\n"
               "touch \"$out/final_output/r.png\"\n");
  RejectingSink sink;

  REQUIRE(run_and_capture_kind(f.orchestrator(), f.request("run-rejected"), sink) ==
          ErrorKind::TaskFailed);
  const auto events = sink.events();
  REQUIRE(events.back().is_error);
  REQUIRE(events.back().stage == Stage{2});
  REQUIRE(events.back().message == "Task failed: event rejected");
}

TEST_CASE("resolve_output_folder_uses_project_root") {
  Fixture f;
  const auto orch = f.orchestrator();
  const fs::path root = fs::absolute(f.root);

  REQUIRE(orch.settings().project_root == root);
  REQUIRE(orch.resolve_output_folder(std::nullopt) == root / "output_gui");
  REQUIRE(orch.resolve_output_folder(std::string("  ")) == root / "output_gui");
  REQUIRE(orch.resolve_output_folder(std::string("mine")) == root / "mine");
  REQUIRE(orch.resolve_output_folder(std::string("/abs/out")) == fs::path("/abs/out"));
}

TEST_CASE("concurrent_runs_do_not_see_each_other") {
  Fixture f;
  write_worker(f.root / "run.py",
               "echo \"Running Stage 1\"\n"
               "sleep 0.2\n"
               "echo \"OUT:$out\"\n"
               "cp \"$in\"/* \"$out/final_output/\"\n");
  auto orch = std::make_shared<const runner::RunOrchestrator>(f.orchestrator());
  auto sink_a = std::make_shared<RecordingSink>();
  auto sink_b = std::make_shared<RecordingSink>();

  auto req_a = f.request("run-a");
  req_a.output_folder = "out_a";
  auto req_b = f.request("run-b");
  req_b.output_folder = "out_b";

  auto fut_a = runner::launch_run(orch, req_a, sink_a);
  auto fut_b = runner::launch_run(orch, req_b, sink_b);
  const auto res_a = fut_a.get();
  const auto res_b = fut_b.get();

  REQUIRE(fs::path(res_a.output_path).parent_path() == f.root / "out_a" / "final_output");
  REQUIRE(fs::path(res_b.output_path).parent_path() == f.root / "out_b" / "final_output");
  for (const auto &e : sink_a->events()) {
    REQUIRE(e.run_id == "run-a");
    REQUIRE(e.message.find("out_b") == std::string::npos);
  }
  for (const auto &e : sink_b->events()) {
    REQUIRE(e.run_id == "run-b");
    REQUIRE(e.message.find("out_a") == std::string::npos);
  }
  REQUIRE(sink_a->events().back().message == "Done");
  REQUIRE(sink_b->events().back().message == "Done");
}

TEST_CASE("unexpected_exceptions_become_task_failed") {
  Fixture f;
  write_worker(f.root / "run.py", "touch \"$out/final_output/r.png\"\n");
  auto orch = std::make_shared<const runner::RunOrchestrator>(f.orchestrator());
  auto sink = std::make_shared<runner::CallbackSink>(
      [](const ProgressEvent &) { throw std::runtime_error("ui went away"); });

  auto fut = runner::launch_run(orch, f.request("run-broken-sink"), sink);
  try {
    fut.get();
    FAIL("run did not fail");
  } catch (const RunError &e) {
    REQUIRE(e.kind() == ErrorKind::TaskFailed);
    REQUIRE(std::string(e.what()).find("ui went away") != std::string::npos);
  }
}
