#include "projecttaskcommand.h"

#include <QJsonObject>

#include "httpresponseparser.h"
#include "nodecontroller.h"
#include "utils/logging.h"

namespace {

NodeRequest requestForTask(const ProjectTask &task)
{
    NodeRequest request;
    request.path = task.path;
    request.method = task.method;
    request.body = task.body;
    request.shape = NodeRequest::ResponseShape::Object;
    request.acceptStatusCode = 202;
    request.errorTitle = task.errorTitle;
    return request;
}

} // namespace

ProjectTaskCommand::ProjectTaskCommand(NodeController *controller, ProjectTask task)
    : ProjectCommand(controller, requestForTask(task), RequiredProjectState::Opened)
    , task_(std::move(task))
{
}

void ProjectTaskCommand::handleResponse(const HttpResponseParser &response,
                                        CommandCompletion completion)
{
    const QJsonValue taskId = response.bodyToObject().value_or(QJsonObject()).value("taskID");
    if (!taskId.isString() || !controller_) {
        completion(false, false, error(invalidStructureMessage()));
        return;
    }

    WaitingTask waiting;
    waiting.followUp = task_.followUp;
    waiting.status.taskName = task_.taskName;
    waiting.status.taskDescription = task_.taskDescription;

    LOG_VERBOSE() << "Node: task" << task_.taskName << "started as" << taskId.toString()
                  << (task_.followUp ? "then " + task_.followUp->describe() : QString());
    controller_->scene().openedProject.waitingOnTask.insert(taskId.toString(), waiting);
    completion(true, false, std::nullopt);
}
