#pragma once

#include "photo_restore/core/types.hpp"

#include <filesystem>
#include <optional>

namespace photo_restore::io {

namespace fs = std::filesystem;

/**
 * Directory handed to the worker as --input_folder.
 * A directory input is returned unchanged; a single file is copied into a
 * freshly recreated staging directory under output_folder.
 * Throws IOError on any filesystem failure.
 */
fs::path prepare_input_folder(const fs::path& input_path, const fs::path& output_folder);

/**
 * Recreates <output_folder>/_gui_input holding only a copy of input_file.
 */
fs::path stage_single_file(const fs::path& input_file, const fs::path& output_folder);

/**
 * Deletes and recreates the four stage output directories.
 */
StageDirs reset_stage_dirs(const fs::path& output_folder);

/**
 * Most recently modified non-hidden regular file in dir, or nullopt when dir
 * is missing or holds no candidate. Equal timestamps keep the entry listed
 * first. Throws IOError when dir cannot be listed or an entry cannot be stat'ed.
 */
std::optional<fs::path> pick_latest_file(const fs::path& dir);

} // namespace photo_restore::io
