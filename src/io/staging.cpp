#include "photo_restore/io/staging.hpp"
#include "photo_restore/core/errors.hpp"

#include <iostream>
#include <system_error>

namespace photo_restore::io {

namespace {

void remove_tree(const fs::path& dir, const std::string& what) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        if (ec) {
            throw IOError("Failed to stat " + what + ": " + ec.message());
        }
        return;
    }
    fs::remove_all(dir, ec);
    if (ec) {
        throw IOError("Failed to clear " + what + ": " + ec.message());
    }
}

void create_tree(const fs::path& dir, const std::string& what) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("Failed to create " + what + ": " + ec.message());
    }
}

} // namespace

fs::path stage_single_file(const fs::path& input_file, const fs::path& output_folder) {
    const fs::path input_dir = output_folder / kStagingDirName;
    remove_tree(input_dir, kStagingDirName);
    create_tree(input_dir, kStagingDirName);

    const fs::path file_name = input_file.filename();
    if (file_name.empty()) {
        throw IOError("Invalid input file path: " + input_file.string());
    }

    std::error_code ec;
    fs::copy_file(input_file, input_dir / file_name, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw IOError("Failed to copy input file: " + ec.message());
    }

    std::cerr << "[STAGING] " << input_file << " -> " << input_dir << std::endl;
    return input_dir;
}

fs::path prepare_input_folder(const fs::path& input_path, const fs::path& output_folder) {
    std::error_code ec;
    if (fs::is_directory(input_path, ec)) {
        return input_path;
    }
    return stage_single_file(input_path, output_folder);
}

StageDirs reset_stage_dirs(const fs::path& output_folder) {
    StageDirs sd = StageDirs::under(output_folder);
    for (const auto& dir : sd.dirs) {
        remove_tree(dir, dir.string());
        create_tree(dir, dir.string());
    }
    return sd;
}

std::optional<fs::path> pick_latest_file(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw IOError("Failed to read dir " + dir.string() + ": " + ec.message());
    }

    std::optional<fs::path> latest;
    fs::file_time_type latest_time{};

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw IOError("Failed to read dir entry in " + dir.string() + ": " + ec.message());
        }
        const fs::directory_entry& entry = *it;

        const bool regular = entry.is_regular_file(ec);
        if (ec) {
            throw IOError("Failed to stat " + entry.path().string() + ": " + ec.message());
        }
        if (!regular) {
            continue;
        }

        const std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }

        const auto modified = entry.last_write_time(ec);
        if (ec) {
            throw IOError("Failed to stat file " + name + ": " + ec.message());
        }

        if (!latest || modified > latest_time) {
            latest = entry.path();
            latest_time = modified;
        }
    }
    if (ec) {
        throw IOError("Failed to read dir " + dir.string() + ": " + ec.message());
    }

    return latest;
}

} // namespace photo_restore::io
