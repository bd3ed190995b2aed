#include "photo_restore/runner/events.hpp"
#include "photo_restore/core/utils.hpp"

namespace photo_restore::runner {

nlohmann::json to_json(const ProgressEvent& event) {
    nlohmann::json j;
    j["runId"] = event.run_id;
    if (event.stage) {
        j["stage"] = static_cast<int>(*event.stage);
    } else {
        j["stage"] = nullptr;
    }
    j["message"] = event.message;
    j["isError"] = event.is_error;
    return j;
}

nlohmann::json to_json(const RunResult& result) {
    return {{"outputPath", result.output_path}};
}

JsonLinesEmitter::JsonLinesEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(out), log_file_(log_file) {}

void JsonLinesEmitter::emit(const nlohmann::json& event) {
    // Paths in messages are not guaranteed to be UTF-8.
    const std::string line = event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << std::endl;
    }
}

void JsonLinesEmitter::on_progress(const ProgressEvent& event) {
    nlohmann::json j = to_json(event);
    j["type"] = "progress";
    j["ts"] = core::get_iso_timestamp();
    emit(j);
}

void JsonLinesEmitter::run_succeeded(const std::string& run_id, const RunResult& result) {
    nlohmann::json j;
    j["type"] = "run_end";
    j["runId"] = run_id;
    j["success"] = true;
    j["result"] = to_json(result);
    j["ts"] = core::get_iso_timestamp();
    emit(j);
}

void JsonLinesEmitter::run_failed(const std::string& run_id, ErrorKind kind,
                                  const std::string& message) {
    nlohmann::json j;
    j["type"] = "run_end";
    j["runId"] = run_id;
    j["success"] = false;
    j["error"] = {{"kind", error_kind_name(kind)}, {"message", message}};
    j["ts"] = core::get_iso_timestamp();
    emit(j);
}

} // namespace photo_restore::runner
