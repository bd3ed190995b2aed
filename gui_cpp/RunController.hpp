#pragma once

#include "photo_restore/core/types.hpp"
#include "photo_restore/runner/orchestrator.hpp"

#include <QObject>
#include <QString>

#include <map>
#include <memory>
#include <string>
#include <thread>

namespace photo_restore::gui {

// Qt face of the run launcher for a desktop shell. Each run executes on its
// own thread; progress and completion arrive as signals on this object's thread.
class RunController : public QObject {
    Q_OBJECT

  public:
    explicit RunController(runner::OrchestratorSettings settings, QObject *parent = nullptr);
    ~RunController() override;

    bool is_running() const;
    bool is_running(const QString &run_id) const;
    void start(const RunRequest &request);

  signals:
    // stage is -1 when the line carries no stage.
    void progress(const QString &run_id, int stage, const QString &message, bool is_error);
    void finished(const QString &run_id, const QString &output_path);
    void failed(const QString &run_id, const QString &error_kind, const QString &message);

  private:
    void on_run_ended(const std::string &run_id);

    std::shared_ptr<const runner::RunOrchestrator> orchestrator_;
    std::map<std::string, std::thread> runs_;
};

}
