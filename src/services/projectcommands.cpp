#include "projectcommands.h"

#include <QDateTime>
#include <QDebug>
#include <QSet>

#include "httpresponseparser.h"
#include "jsonfields.h"
#include "nodecommands.h"
#include "nodecontroller.h"
#include "templatecommands.h"
#include "utils/logging.h"

namespace {

NodeRequest projectRequest(const QString &path, NodeRequest::ResponseShape shape,
                           int acceptStatusCode, const QString &errorTitle)
{
    NodeRequest request;
    request.path = path;
    request.shape = shape;
    request.acceptStatusCode = acceptStatusCode;
    request.errorTitle = errorTitle;
    return request;
}

QString taskIdQuery(const QString &key, const QStringList &taskIds)
{
    QStringList encoded;
    for (const QString &id : taskIds) {
        encoded.append(NodeCommand::encodeQueryValue(id).value_or(QString()));
    }
    return encoded.isEmpty() ? QString() : QString("?%1=%2").arg(key, encoded.join(','));
}

} // namespace

// --- GetProjectStatus ---

GetProjectStatus::GetProjectStatus(NodeController *controller)
    : ProjectCommand(controller,
                     projectRequest("/project/status", NodeRequest::ResponseShape::Object, 200,
                                    QObject::tr("Error Getting RCNode Project Status")),
                     RequiredProjectState::Opened, false, MismatchPolicy::Skip)
{
}

void GetProjectStatus::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    const QJsonObject object = response.bodyToObject().value_or(QJsonObject());
    const std::optional<bool> restarted = jsonBool(object, "restarted");
    const std::optional<double> progress = jsonDouble(object, "progress");
    const std::optional<double> timeTotal = jsonDouble(object, "timeTotal");
    const std::optional<double> timeEstimation = jsonDouble(object, "timeEstimation");
    const std::optional<qint64> errorCode = jsonInt(object, "errorCode");
    const std::optional<qint64> changeCounter = jsonInt(object, "changeCounter");
    const std::optional<qint64> processID = jsonInt(object, "processID");

    if (!controller_) {
        completion(false, false, error(invalidStructureMessage()));
        return;
    }

    if (!restarted || !progress || !timeTotal || !timeEstimation || !errorCode
            || !changeCounter || !processID) {
        qWarning() << "Node: project status has an unexpected structure, unloading project";
        controller_->projectUnload();
        completion(false, false, error(invalidStructureMessage()));
        return;
    }

    SceneState &scene = controller_->scene();
    ProjectInfo &project = scene.openedProject;
    project.restarted = *restarted;
    project.progress = *progress;
    project.timeTotal = *timeTotal;
    project.timeEstimation = *timeEstimation;
    project.errorCode = static_cast<int>(*errorCode);
    project.processID = static_cast<int>(*processID);

    const int counter = static_cast<int>(*changeCounter);
    if (project.changeCounter != counter && !scene.mediaUpload && project.waitingOnTask.isEmpty()) {
        LOG_VERBOSE() << "Node: change counter" << project.changeCounter.value_or(-1) << "->" << counter;
        controller_->pushCommand(std::make_shared<GetProjectList>(controller_.data(),
                                                                  GetProjectList::Folder::Data));
        controller_->pushCommand(std::make_shared<EvaluateProjectInfo>(controller_.data()));
        project.changeCounter = counter;
    }

    completion(true, false, std::nullopt);
}

// --- GetProjectTasks ---

GetProjectTasks::GetProjectTasks(NodeController *controller, const QStringList &taskIds)
    : ProjectCommand(controller,
                     projectRequest("/project/tasks" + taskIdQuery("taskIDs", taskIds),
                                    NodeRequest::ResponseShape::ObjectList, 200,
                                    QObject::tr("Error Getting RCNode Project Tasks Statuses")),
                     RequiredProjectState::Opened, false, MismatchPolicy::Skip)
{
}

void GetProjectTasks::executeWithProject(CommandCompletion completion)
{
    if (controller_ && controller_->scene().openedProject.waitingOnTask.isEmpty()) {
        completion(true, false, std::nullopt);
        return;
    }
    ProjectCommand::executeWithProject(std::move(completion));
}

void GetProjectTasks::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    struct TaskReport {
        QString taskId;
        qint64 timeStart;
        qint64 timeEnd;
        QString state;
        qint64 errorCode;
        QString errorMessage;
    };

    // Validate every entry before touching the task table
    QList<TaskReport> reports;
    const QList<QJsonObject> tasks = response.bodyToObjectList().value_or(QList<QJsonObject>());
    for (const QJsonObject &task : tasks) {
        const std::optional<QString> taskId = jsonString(task, "taskID");
        const std::optional<qint64> timeStart = jsonInt(task, "timeStart");
        const std::optional<qint64> timeEnd = jsonInt(task, "timeEnd");
        const std::optional<QString> state = jsonString(task, "state");
        const std::optional<qint64> errorCode = jsonInt(task, "errorCode");
        const std::optional<QString> errorMessage = jsonString(task, "errorMessage");
        if (!taskId || !timeStart || !timeEnd || !state || !errorCode || !errorMessage) {
            completion(false, false, error(invalidStructureMessage()));
            return;
        }
        reports.append({*taskId, *timeStart, *timeEnd, *state, *errorCode, *errorMessage});
    }

    if (!controller_) {
        completion(true, false, std::nullopt);
        return;
    }

    QMap<QString, WaitingTask> &waiting = controller_->scene().openedProject.waitingOnTask;
    for (const TaskReport &report : reports) {
        WaitingTask entry;
        auto it = waiting.find(report.taskId);
        if (it != waiting.end()) {
            entry = it.value();
        } else {
            entry.status.taskName = QStringLiteral("RealityCaptureTask");
            entry.status.taskDescription = QStringLiteral("Task started in RealityCapture");
        }
        entry.status.timeStart = report.timeStart;
        entry.status.timeEnd = report.timeEnd;
        entry.status.state = report.state;

        if (report.state == QLatin1String("finished")) {
            LOG_VERBOSE() << "Node: task" << entry.status.taskName << "finished";
            waiting.remove(report.taskId);
            if (entry.followUp) {
                controller_->pushCommand(controller_->commandForStep(*entry.followUp));
            }
        } else if (report.state == QLatin1String("failed")) {
            qWarning() << "Node: task" << entry.status.taskName << "failed with" << report.errorCode;
            waiting.remove(report.taskId);
            controller_->pushCommand(std::make_shared<GetProjectClearTasks>(controller_.data(),
                                                                            QStringList{report.taskId}));
            controller_->showAlert(QObject::tr("Error Executing RCNode Task"),
                                   QObject::tr("Task: %1, failed with error: %2. %3")
                                       .arg(entry.status.taskName)
                                       .arg(report.errorCode)
                                       .arg(report.errorMessage));
        } else {
            waiting.insert(report.taskId, entry);
        }
    }

    completion(true, false, std::nullopt);
}

// --- GetProjectClearTasks ---

GetProjectClearTasks::GetProjectClearTasks(NodeController *controller, const QStringList &taskIds)
    : ProjectCommand(controller,
                     projectRequest("/project/cleartasks" + taskIdQuery("taskIds", taskIds),
                                    NodeRequest::ResponseShape::None, 200,
                                    QObject::tr("Error Clearing RCNode Project Tasks Statuses")),
                     RequiredProjectState::Opened, false, MismatchPolicy::Skip)
{
}

// --- GetProjectList ---

GetProjectList::GetProjectList(NodeController *controller, Folder folder)
    : ProjectCommand(controller,
                     projectRequest(QString("/project/list?folder=%1")
                                        .arg(folder == Folder::Data ? "data" : "output"),
                                    NodeRequest::ResponseShape::StringList, 200,
                                    QObject::tr("Error Getting RCNode Project File List")),
                     RequiredProjectState::Opened)
    , folder_(folder)
{
}

void GetProjectList::executeWithProject(CommandCompletion completion)
{
    if (controller_) {
        ProjectUpdate update;
        update.kind = folder_ == Folder::Data ? ProjectUpdate::Kind::FetchInputList
                                              : ProjectUpdate::Kind::FetchOutputList;
        controller_->scene().openedProject.update = update;
    }

    QPointer<NodeController> controller = controller_;
    ProjectCommand::executeWithProject([controller, completion](bool success, bool retryable,
                                                                const std::optional<CommandError> &err) {
        if (controller) {
            controller->scene().openedProject.update.reset();
        }
        completion(success, retryable, err);
    });
}

void GetProjectList::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    const QStringList files = response.bodyToStringList().value_or(QStringList());
    if (controller_) {
        if (folder_ == Folder::Data) {
            controller_->scene().openedProject.fileList = QSet<QString>(files.cbegin(), files.cend());
        } else {
            controller_->observeOutputFolder(files);
        }
    }
    completion(true, false, std::nullopt);
}

// --- GetProjectClose ---

GetProjectClose::GetProjectClose(NodeController *controller)
    : ProjectCommand(controller,
                     projectRequest("/project/close", NodeRequest::ResponseShape::None, 200,
                                    QObject::tr("Error Closing RCNode Project")),
                     RequiredProjectState::Opened, true, MismatchPolicy::Skip)
{
}

void GetProjectClose::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    Q_UNUSED(response)
    if (controller_) {
        controller_->projectUnload();
    }
    completion(true, false, std::nullopt);
}

// --- GetProjectCreate ---

GetProjectCreate::GetProjectCreate(NodeController *controller, const QString &projectName)
    : ProjectCommand(controller,
                     projectRequest("/project/create", NodeRequest::ResponseShape::None, 201,
                                    QObject::tr("Error Creating RCNode Project")),
                     RequiredProjectState::Closed, true)
    , projectName_(projectName)
{
}

void GetProjectCreate::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    QString name = projectName_;
    if (!encodeQueryValue(name)) {
        name = QString("cr_fly_%1").arg(QDateTime::currentSecsSinceEpoch());
        qDebug() << "Node: project name cannot be encoded, using" << name;
    }

    if (controller_) {
        controller_->loadProject(name, response.header("Session"));
        controller_->pushCommand(std::make_shared<GetProjectSave>(controller_.data(), name));
        controller_->pushCommand(std::make_shared<CreateTemplateFiles>(controller_.data()));
    }
    completion(true, false, std::nullopt);
}

// --- GetProjectOpen ---

GetProjectOpen::GetProjectOpen(NodeController *controller, const QString &projectGuid)
    : ProjectCommand(controller,
                     projectRequest("/project/open?guid="
                                        + encodeQueryValue(projectGuid).value_or(QString()),
                                    NodeRequest::ResponseShape::None, 200,
                                    QObject::tr("Error Opening RCNode Project")),
                     RequiredProjectState::None, true)
    , projectGuid_(projectGuid)
{
}

void GetProjectOpen::executeWithProject(CommandCompletion completion)
{
    if (!controller_ || !controller_->scene().openedProject.loaded) {
        ProjectCommand::executeWithProject(std::move(completion));
        return;
    }

    const SceneState &scene = controller_->scene();
    const std::optional<QString> projectName = scene.projectNameForGuid(projectGuid_);
    if (!projectName) {
        completion(false, false, error(QObject::tr("Project name could not be found in project list.")));
        return;
    }

    if (scene.openedProject.name != *projectName) {
        controller_->pushCommand(std::make_shared<GetProjectClose>(controller_.data()));
        controller_->pushCommand(std::make_shared<GetProjectOpen>(controller_.data(), projectGuid_));
    }
    completion(true, false, std::nullopt);
}

void GetProjectOpen::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    const std::optional<QString> projectName = controller_
        ? controller_->scene().projectNameForGuid(projectGuid_)
        : std::nullopt;
    if (!projectName) {
        completion(false, false, error(QObject::tr("Project name could not be found in project list.")));
        return;
    }

    controller_->loadProject(*projectName, response.header("Session"));
    controller_->pushCommand(std::make_shared<CreateTemplateFiles>(controller_.data()));
    controller_->loadSavedModels();
    completion(true, false, std::nullopt);
}

// --- GetProjectSave ---

GetProjectSave::GetProjectSave(NodeController *controller, const QString &projectName)
    : ProjectCommand(controller,
                     projectRequest("/project/save?name="
                                        + encodeQueryValue(projectName).value_or(QString()),
                                    NodeRequest::ResponseShape::None, 202,
                                    QObject::tr("Error Saving RCNode Project")),
                     RequiredProjectState::Opened, true, MismatchPolicy::Skip)
    , encodedName_(encodeQueryValue(projectName).value_or(QString()))
{
}

void GetProjectSave::executeWithProject(CommandCompletion completion)
{
    if (encodedName_.isEmpty()) {
        completion(false, false, error(QObject::tr("Project name could not be encoded.")));
        return;
    }
    ProjectCommand::executeWithProject(std::move(completion));
}

void GetProjectSave::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    Q_UNUSED(response)
    if (controller_) {
        ProjectInfo &project = controller_->scene().openedProject;
        project.savedChangeCounter = project.changeCounter;
        controller_->pushCommandDelayed(std::make_shared<GetNodeProjects>(controller_.data()),
                                        NodeController::ProjectListRefreshDelayMs);
    }
    completion(true, false, std::nullopt);
}

// --- GetProjectDelete ---

GetProjectDelete::GetProjectDelete(NodeController *controller, const QString &projectGuid)
    : ProjectCommand(controller,
                     projectRequest("/project/delete?guid="
                                        + encodeQueryValue(projectGuid).value_or(QString()),
                                    NodeRequest::ResponseShape::None, 200,
                                    QObject::tr("Error Deleting RCNode Project")),
                     RequiredProjectState::None, true)
    , projectGuid_(projectGuid)
{
}

void GetProjectDelete::executeWithProject(CommandCompletion completion)
{
    if (controller_ && controller_->scene().openedProject.loaded) {
        controller_->pushCommand(std::make_shared<GetProjectClose>(controller_.data()));
        controller_->pushCommand(std::make_shared<GetProjectDelete>(controller_.data(), projectGuid_));
        completion(true, false, std::nullopt);
        return;
    }
    ProjectCommand::executeWithProject(std::move(completion));
}

void GetProjectDelete::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    Q_UNUSED(response)
    if (controller_) {
        SceneState &scene = controller_->scene();
        const std::optional<QString> projectName = scene.projectNameForGuid(projectGuid_);
        if (projectName) {
            scene.projectList.remove(*projectName);
            scene.projectGuids.remove(*projectName);
        }
    }
    completion(true, false, std::nullopt);
}
