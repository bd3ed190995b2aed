#include "photo_restore/config/configuration.hpp"
#include "photo_restore/core/errors.hpp"
#include "photo_restore/core/utils.hpp"

#include <fstream>

namespace photo_restore::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["paths"]) {
        auto p = node["paths"];
        if (p["project_root"]) cfg.paths.project_root = p["project_root"].as<std::string>();
        if (p["default_output_folder"]) {
            cfg.paths.default_output_folder = p["default_output_folder"].as<std::string>();
        }
    }

    if (node["worker"]) {
        auto w = node["worker"];
        if (w["interpreter"]) cfg.worker.interpreter = w["interpreter"].as<std::string>();
        if (w["entry_script"]) cfg.worker.entry_script = w["entry_script"].as<std::string>();
        if (w["unbuffered_env"]) cfg.worker.unbuffered_env = w["unbuffered_env"].as<std::string>();
    }

    if (node["defaults"]) {
        auto d = node["defaults"];
        if (d["gpu"]) cfg.defaults.gpu = d["gpu"].as<std::string>();
        if (d["with_scratch"]) cfg.defaults.with_scratch = d["with_scratch"].as<bool>();
        if (d["hr"]) cfg.defaults.hr = d["hr"].as<bool>();
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["poll_interval_ms"]) cfg.runtime.poll_interval_ms = r["poll_interval_ms"].as<int>();
    }

    if (node["logging"]) {
        auto l = node["logging"];
        if (l["event_log"]) cfg.logging.event_log = l["event_log"].as<std::string>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["paths"]["project_root"] = paths.project_root;
    node["paths"]["default_output_folder"] = paths.default_output_folder;

    node["worker"]["interpreter"] = worker.interpreter;
    node["worker"]["entry_script"] = worker.entry_script;
    node["worker"]["unbuffered_env"] = worker.unbuffered_env;

    node["defaults"]["gpu"] = defaults.gpu;
    node["defaults"]["with_scratch"] = defaults.with_scratch;
    node["defaults"]["hr"] = defaults.hr;

    node["runtime"]["poll_interval_ms"] = runtime.poll_interval_ms;

    node["logging"]["event_log"] = logging.event_log;

    return node;
}

void Config::validate() const {
    if (core::is_blank(paths.default_output_folder)) {
        throw ValidationError("paths.default_output_folder must not be empty");
    }
    if (core::is_blank(worker.interpreter)) {
        throw ValidationError("worker.interpreter must not be empty");
    }
    if (core::is_blank(worker.entry_script)) {
        throw ValidationError("worker.entry_script must not be empty");
    }
    if (defaults.gpu.empty()) {
        throw ValidationError("defaults.gpu must not be empty");
    }
    if (runtime.poll_interval_ms <= 0) {
        throw ValidationError("runtime.poll_interval_ms must be > 0");
    }
}

RunOptions DefaultsConfig::apply(const std::optional<std::string>& gpu_override,
                                 std::optional<bool> with_scratch_override,
                                 std::optional<bool> hr_override) const {
    RunOptions options;
    options.gpu = gpu_override && !core::is_blank(*gpu_override) ? *gpu_override : gpu;
    options.with_scratch = with_scratch_override.value_or(with_scratch);
    options.hr = hr_override.value_or(hr);
    return options;
}

fs::path Config::resolved_project_root() const {
    if (core::is_blank(paths.project_root)) {
        return fs::current_path();
    }
    return fs::absolute(paths.project_root);
}

} // namespace photo_restore::config
