#pragma once

#include "photo_restore/core/types.hpp"

#include <optional>
#include <string>

namespace photo_restore::core {

// Stage 1..4 announced by a worker line ("Running Stage N"), or nullopt for
// ordinary log chatter.
std::optional<Stage> stage_from_line(const std::string &line);

// One step of the current-stage fold over the worker's output: a classified
// line replaces the current stage, any other line keeps it.
std::optional<Stage> advance_stage(std::optional<Stage> current,
                                   const std::string &line);

} // namespace photo_restore::core
