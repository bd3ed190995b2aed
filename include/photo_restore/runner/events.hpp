#pragma once

#include "photo_restore/core/errors.hpp"
#include "photo_restore/core/types.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>

namespace photo_restore::runner {

/**
 * Receiver of a run's progress events. Called from the run's own thread,
 * so implementations shared between runs must be thread-safe.
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_progress(const ProgressEvent& event) = 0;
};

class CallbackSink : public ProgressSink {
public:
    using Callback = std::function<void(const ProgressEvent&)>;

    explicit CallbackSink(Callback cb) : cb_(std::move(cb)) {}

    void on_progress(const ProgressEvent& event) override {
        if (cb_) cb_(event);
    }

private:
    Callback cb_;
};

nlohmann::json to_json(const ProgressEvent& event);
nlohmann::json to_json(const RunResult& result);

/**
 * Writes progress and run_end records as JSON lines to an output stream and,
 * if given, to an event log file.
 */
class JsonLinesEmitter : public ProgressSink {
public:
    explicit JsonLinesEmitter(std::ostream& out, std::ofstream* log_file = nullptr);

    void on_progress(const ProgressEvent& event) override;

    void run_succeeded(const std::string& run_id, const RunResult& result);
    void run_failed(const std::string& run_id, ErrorKind kind, const std::string& message);

    void emit(const nlohmann::json& event);

private:
    std::ostream& out_;
    std::ofstream* log_file_;
    std::mutex mutex_;
};

} // namespace photo_restore::runner
