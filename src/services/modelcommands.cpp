#include "modelcommands.h"

#include <QDebug>
#include <QDir>
#include <QFile>

#include "httpconnection.h"
#include "httpresponseparser.h"
#include "nodecontroller.h"
#include "utils/logging.h"
#include "utils/zipextractor.h"

namespace {

ProjectTask commandTask(const QString &command, const QString &errorTitle,
                        const QString &taskName, const QString &taskDescription,
                        const std::optional<TaskStep> &followUp)
{
    ProjectTask task;
    task.path = "/project/command?name=" + command;
    task.errorTitle = errorTitle;
    task.taskName = taskName;
    task.taskDescription = taskDescription;
    task.followUp = followUp;
    return task;
}

ProjectTask calculateTask(ModelType model)
{
    if (model == ModelType::Alignment) {
        return commandTask("align", QObject::tr("Error Aligning Images"),
                           QStringLiteral("Align Images"),
                           QObject::tr("Aligning Images into Point Cloud..."),
                           TaskStep::projectStatus());
    }
    return commandTask("setReconstructionRegionAuto",
                       QObject::tr("Error Setting Reconstruction Region Auto"),
                       QStringLiteral("SetReconRegionAuto"),
                       QObject::tr("Setting Reconstruction Region to Auto..."),
                       TaskStep::selectTriangles(model));
}

std::optional<TaskStep> computeFollowUp(NodeController *controller, ModelType model)
{
    const int pointCount = controller
        ? controller->scene().openedProject.pointCount.value_or(0)
        : 0;
    if (pointCount > NodeController::SimplifyPointThreshold) {
        return TaskStep::simplifyAndExport(model);
    }
    return TaskStep::exportSelected(model);
}

QString encodedArchiveName(ModelType model)
{
    return NodeCommand::encodeQueryValue(modelTypeName(model)).value_or(QString()) + ".zip";
}

} // namespace

// --- CalculateModel ---

CalculateModel::CalculateModel(NodeController *controller, ModelType model)
    : ProjectTaskCommand(controller, calculateTask(model))
    , model_(model)
{
    if (model == ModelType::Alignment) {
        conflictingTasks_ = {QStringLiteral("Align Images"), QStringLiteral("Add File To Project")};
    } else {
        conflictingTasks_ = {QStringLiteral("Calculating Model"),
                             QStringLiteral("SelectTrianglesInsideReconReg"),
                             QStringLiteral("SetReconRegionAuto")};
    }
}

void CalculateModel::execute(CommandCompletion completion)
{
    if (controller_) {
        const SceneState &scene = controller_->scene();
        if (scene.mediaUpload || scene.openedProject.hasPendingTask(conflictingTasks_)) {
            LOG_VERBOSE() << "Node: calculation of" << modelTypeName(model_)
                          << "skipped, upload or conflicting task in progress";
            completion(true, false, std::nullopt);
            return;
        }
    }
    ProjectTaskCommand::execute(std::move(completion));
}

// --- SelectTriangles ---

SelectTriangles::SelectTriangles(NodeController *controller, ModelType model)
    : ProjectTaskCommand(controller,
                         commandTask("selectTrianglesInsideReconReg",
                                     QObject::tr("Error Selecting Triangles Inside Reconstruction Region"),
                                     QStringLiteral("SelectTrianglesInsideReconReg"),
                                     QObject::tr("Selecting Triangles Inside Reconstruction Region..."),
                                     TaskStep::computeModel(model)))
{
}

// --- ComputeModel ---

ComputeModel::ComputeModel(NodeController *controller, ModelType model)
    : ProjectTaskCommand(controller,
                         commandTask(commandForModel(model),
                                     QObject::tr("Error Calculating %1").arg(modelTypeName(model)),
                                     QStringLiteral("Calculating Model"),
                                     QObject::tr("Calculating %1...").arg(modelTypeName(model)),
                                     computeFollowUp(controller, model)))
{
}

QString ComputeModel::commandForModel(ModelType model)
{
    switch (model) {
    case ModelType::Preview:
        return QStringLiteral("calculatePreviewModel");
    case ModelType::Normal:
        return QStringLiteral("calculateNormalModel");
    case ModelType::Colorized:
        return QStringLiteral("calculateTexture");
    case ModelType::Alignment:
        break;
    }
    return QStringLiteral("align");
}

// --- SimplifyAndExportModel ---

SimplifyAndExportModel::SimplifyAndExportModel(NodeController *controller, ModelType model)
    : ProjectTaskCommand(controller,
                         commandTask("simplify",
                                     QObject::tr("Error Simplifying %1").arg(modelTypeName(model)),
                                     QStringLiteral("SimplifyExportModel"),
                                     QObject::tr("Simplifying Exported Model..."),
                                     TaskStep::exportSelected(model)))
{
}

// --- ExportSelectedModel ---

ExportSelectedModel::ExportSelectedModel(NodeController *controller, ModelType model)
    : ProjectTaskCommand(controller,
                         commandTask("exportModelToZip&param1=" + encodedArchiveName(model)
                                         + "&param2=obj",
                                     QObject::tr("Error Exporting %1").arg(modelTypeName(model)),
                                     QStringLiteral("SelectModelExport"),
                                     QObject::tr("Exporting Selected Model..."),
                                     TaskStep::downloadModel(model)))
    , model_(model)
{
}

void ExportSelectedModel::execute(CommandCompletion completion)
{
    QPointer<NodeController> controller = controller_;
    const ModelType model = model_;
    ProjectTaskCommand::execute([controller, model, completion](bool success, bool retryable,
                                                                const std::optional<CommandError> &err) {
        // A skipped export leaves no task behind, so only a registered task counts
        if (success && controller && controller->scene().openedProject.hasPendingTask(
                {QStringLiteral("SelectModelExport")})) {
            controller->scene().openedProject.exportModelReady = model;
        }
        completion(success, retryable, err);
    });
}

// --- DownloadModel ---

DownloadModel::DownloadModel(NodeController *controller, ModelType model)
    : controller_(controller)
    , model_(model)
{
}

CommandError DownloadModel::error(const QString &message) const
{
    return CommandError{QObject::tr("Error Downloading %1").arg(modelTypeName(model_)), message};
}

void DownloadModel::execute(CommandCompletion completion)
{
    if (!controller_ || !controller_->connection() || !controller_->scene().connected
            || !controller_->scene().openedProject.loaded || model_ == ModelType::Alignment) {
        completion(true, false, std::nullopt);
        return;
    }

    const QString projectDir = controller_->projectExportDir();
    if (projectDir.isEmpty()) {
        LOG_VERBOSE() << "Node: no export directory, skipping download of" << modelTypeName(model_);
        completion(true, false, std::nullopt);
        return;
    }

    if (!QDir().mkpath(projectDir)) {
        qWarning() << "Node: cannot create" << projectDir;
        completion(false, false, error(QObject::tr("Could not create directory %1.").arg(projectDir)));
        return;
    }

    ProjectUpdate update;
    update.kind = ProjectUpdate::Kind::DownloadModel;
    update.model = model_;
    controller_->scene().openedProject.update = update;
    controller_->modelData().savedModels.remove(model_);

    const QString archiveName = modelTypeName(model_) + ".zip";
    const HttpRequest request = controller_->constructRequest(
        "/project/download?name=" + encodedArchiveName(model_) + "&folder=output");

    LOG_VERBOSE() << "Node: downloading" << archiveName << "into" << projectDir;

    std::shared_ptr<Command> self = shared_from_this();
    controller_->connection()->downloadFile(
        request, projectDir, archiveName, nullptr,
        [this, self, projectDir, completion](const TransportResult &result) {
            finish(result, projectDir, completion);
        });
}

void DownloadModel::finish(const TransportResult &result, const QString &projectDir,
                           const CommandCompletion &completion)
{
    clearUpdateState();

    const QString name = modelTypeName(model_);
    const QString archivePath = QDir(projectDir).filePath(name + ".zip");

    if (!result.ok()) {
        if (result.error->kind == TransportError::Kind::Cancellation) {
            QFile::remove(archivePath);
        }
        qWarning() << "Node: download of" << name << "failed:" << result.error->message;
        completion(false, result.error->isRetryable(),
                   error(QObject::tr("An issue occurred while sending the request, error: %1")
                             .arg(result.error->message)));
        return;
    }

    const std::optional<HttpResponseParser> response = HttpResponseParser::parse(result.data);
    if (!response) {
        completion(false, false,
                   error(QObject::tr("An issue was encountered while parsing the response from RCNode.")));
        return;
    }

    if (response->statusCode() != 200) {
        const QString message = response->bodyMessage();
        completion(false, false,
                   error(QObject::tr("An issue was encountered while parsing the response from RCNode. "
                                     "Status Code: %1 with message: %2.")
                             .arg(response->statusCode())
                             .arg(message.isEmpty() ? QStringLiteral("Unknown") : message)));
        return;
    }

    const QString modelDir = QDir(projectDir).filePath(name);
    QDir(modelDir).removeRecursively();

    const ZipExtractor::Result extracted = ZipExtractor::extract(archivePath, modelDir);
    QFile::remove(archivePath);
    if (!extracted.success) {
        qWarning() << "Zip:" << archivePath << extracted.errorMessage;
        completion(false, false,
                   error(QObject::tr("The downloaded archive could not be extracted. %1")
                             .arg(extracted.errorMessage)));
        return;
    }

    const QString modelPath = QDir(modelDir).filePath(QString::fromLatin1(ModelFileName));
    if (controller_) {
        controller_->modelData().savedModels.insert(model_, modelPath);
        emit controller_->modelSaved(name, modelPath);
    }
    qDebug() << "Node: saved" << name << "to" << modelPath;
    completion(true, false, std::nullopt);
}

void DownloadModel::clearUpdateState()
{
    if (controller_) {
        controller_->scene().openedProject.update.reset();
    }
}
