/**
 * @file projecttaskcommand.h
 * @brief Node command that starts a long-running task in the opened project.
 */

#ifndef PROJECTTASKCOMMAND_H
#define PROJECTTASKCOMMAND_H

#include <optional>

#include "models/taskstep.h"
#include "projectcommand.h"

/**
 * @brief Describes a remote task and what to do after it finishes.
 */
struct ProjectTask
{
    QString path;
    HttpRequest::Method method = HttpRequest::Method::Get;
    std::optional<QByteArray> body;
    QString errorTitle;
    QString taskName;          ///< Used to detect conflicting pending tasks
    QString taskDescription;
    std::optional<TaskStep> followUp;
};

/**
 * @brief Starts a remote task and registers it in the task table.
 *
 * The node answers 202 with {"taskID": "..."}. The id is recorded with the
 * task's follow-up step; GetProjectTasks later polls it and queues the
 * follow-up once the task has finished.
 */
class ProjectTaskCommand : public ProjectCommand
{
public:
    ProjectTaskCommand(NodeController *controller, ProjectTask task);
    ~ProjectTaskCommand() override = default;

    [[nodiscard]] QString name() const override { return QStringLiteral("ProjectTaskCommand"); }

    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;

    [[nodiscard]] const ProjectTask &task() const { return task_; }

private:
    ProjectTask task_;
};

#endif // PROJECTTASKCOMMAND_H
