#include "photo_restore/core/stage_classifier.hpp"

#include <array>

namespace photo_restore::core {

namespace {

constexpr std::array<const char *, 4> kStageMarkers = {
    "Running Stage 1",
    "Running Stage 2",
    "Running Stage 3",
    "Running Stage 4",
};

} // namespace

std::optional<Stage> stage_from_line(const std::string &line) {
  for (size_t i = 0; i < kStageMarkers.size(); ++i) {
    if (line.find(kStageMarkers[i]) != std::string::npos) {
      return static_cast<Stage>(i + 1);
    }
  }
  return std::nullopt;
}

std::optional<Stage> advance_stage(std::optional<Stage> current,
                                   const std::string &line) {
  if (auto s = stage_from_line(line)) {
    return s;
  }
  return current;
}

} // namespace photo_restore::core
