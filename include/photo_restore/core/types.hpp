#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace photo_restore {

namespace fs = std::filesystem;

// Stage 0 is "starting", 1..4 are the worker's sequential phases.
using Stage = std::uint8_t;

constexpr Stage kStageStarting = 0;
constexpr Stage kStageFinal = 4;

struct RunOptions {
    std::string gpu = "-1";
    bool with_scratch = true;
    bool hr = false;
};

struct RunRequest {
    std::string run_id;
    std::string input_path;
    std::optional<std::string> output_folder;
    RunOptions options;
    std::string python = "python3";
};

struct ProgressEvent {
    std::string run_id;
    std::optional<Stage> stage;
    std::string message;
    bool is_error = false;
};

struct RunResult {
    std::string output_path;
};

enum class RunState {
    Starting,
    Running,
    Succeeded,
    Failed
};

inline std::string run_state_to_string(RunState state) {
    switch (state) {
        case RunState::Starting: return "starting";
        case RunState::Running: return "running";
        case RunState::Succeeded: return "succeeded";
        case RunState::Failed: return "failed";
    }
    return "unknown";
}

// Fixed directory names under a run's output folder.
constexpr const char* kStagingDirName = "_gui_input";
constexpr const char* kFinalOutputDirName = "final_output";
constexpr std::array<const char*, 4> kStageDirNames = {
    "stage_1_restore_output",
    "stage_2_detection_output",
    "stage_3_face_output",
    kFinalOutputDirName,
};

struct StageDirs {
    std::array<fs::path, 4> dirs;

    static StageDirs under(const fs::path& output_folder) {
        StageDirs sd;
        for (size_t i = 0; i < kStageDirNames.size(); ++i) {
            sd.dirs[i] = output_folder / kStageDirNames[i];
        }
        return sd;
    }

    const fs::path& final_dir() const { return dirs.back(); }
};

} // namespace photo_restore
