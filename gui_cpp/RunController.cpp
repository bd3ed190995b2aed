#include "RunController.hpp"

#include "photo_restore/core/errors.hpp"
#include "photo_restore/runner/events.hpp"
#include "photo_restore/runner/launcher.hpp"

#include <QMetaObject>

#include <stdexcept>

namespace photo_restore::gui {

RunController::RunController(runner::OrchestratorSettings settings, QObject *parent)
    : QObject(parent),
      orchestrator_(std::make_shared<const runner::RunOrchestrator>(std::move(settings))) {}

RunController::~RunController() {
    for (auto &[id, thread] : runs_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool RunController::is_running() const {
    return !runs_.empty();
}

bool RunController::is_running(const QString &run_id) const {
    return runs_.count(run_id.toStdString()) > 0;
}

void RunController::start(const RunRequest &request) {
    if (request.run_id.empty()) {
        throw std::runtime_error("empty run id");
    }
    if (runs_.count(request.run_id) > 0) {
        throw std::runtime_error("run already running: " + request.run_id);
    }

    auto orchestrator = orchestrator_;
    std::thread worker([this, orchestrator, request]() {
        const QString qid = QString::fromStdString(request.run_id);

        runner::CallbackSink sink([this, qid](const ProgressEvent &event) {
            const int stage = event.stage ? static_cast<int>(*event.stage) : -1;
            const QString message = QString::fromStdString(event.message);
            const bool is_error = event.is_error;
            QMetaObject::invokeMethod(
                this, [this, qid, stage, message, is_error]() {
                    emit progress(qid, stage, message, is_error);
                },
                Qt::QueuedConnection);
        });

        QString output_path;
        QString error_kind;
        QString error_message;
        try {
            const RunResult result = runner::run_guarded(*orchestrator, request, sink);
            output_path = QString::fromStdString(result.output_path);
        } catch (const RunError &e) {
            error_kind = QString::fromLatin1(error_kind_name(e.kind()));
            error_message = QString::fromStdString(e.what());
        }

        const std::string id = request.run_id;
        QMetaObject::invokeMethod(
            this, [this, id, qid, output_path, error_kind, error_message]() {
                on_run_ended(id);
                if (error_kind.isEmpty()) {
                    emit finished(qid, output_path);
                } else {
                    emit failed(qid, error_kind, error_message);
                }
            },
            Qt::QueuedConnection);
    });

    runs_.emplace(request.run_id, std::move(worker));
}

void RunController::on_run_ended(const std::string &run_id) {
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return;
    }
    if (it->second.joinable()) {
        it->second.join();
    }
    runs_.erase(it);
}

}
