#include "templatecommands.h"

#include <QDebug>
#include <QJsonObject>

#include "httpresponseparser.h"
#include "jsonfields.h"
#include "nodecontroller.h"
#include "utils/logging.h"

namespace {

QString exportStem(TemplateExportType type)
{
    switch (type) {
    case TemplateExportType::ProjectInfo:
        return QStringLiteral("crfly-projectinfo");
    case TemplateExportType::PointCloud:
        return QStringLiteral("crfly-pointcloud");
    case TemplateExportType::AlignCameras:
        return QStringLiteral("crfly-aligncameras");
    }
    return QString();
}

QString uploadErrorTitle(TemplateExportType type)
{
    switch (type) {
    case TemplateExportType::ProjectInfo:
        return QObject::tr("Error Uploading Template File (Project Information Export) to RCNode");
    case TemplateExportType::PointCloud:
        return QObject::tr("Error Uploading Template File (PointCloud Export) to RCNode");
    case TemplateExportType::AlignCameras:
        return QObject::tr("Error Uploading Template File (Camera Export) to RCNode");
    }
    return QString();
}

ProjectTask evaluateTask(NodeController *controller, TemplateExportType type)
{
    QString guid;
    if (controller) {
        const SceneState &scene = controller->scene();
        guid = scene.projectGuids.value(scene.openedProject.name);
    }
    const QString file = EvaluateTemplate::exportFile(type, guid);
    const QString typeName = templateExportTypeName(type);

    ProjectTask task;
    task.path = QString("/project/command?name=exportReport&param1=%1&param2=%2")
                    .arg(NodeCommand::encodeQueryValue(file).value_or(QString()),
                         CreateTemplateFiles::templateFile(type));
    task.errorTitle = QObject::tr("Error Evaluating Template File (%1 Export)").arg(typeName);
    task.taskName = QString("Evaluate %1").arg(typeName);
    task.taskDescription = QObject::tr("Exporting %1...").arg(typeName.toLower());
    task.followUp = TaskStep::downloadTemplateExport(file, type);
    return task;
}

NodeRequest downloadRequest(const QString &file, TemplateExportType type)
{
    NodeRequest request;
    request.path = QString("/project/download?name=%1&folder=output")
                       .arg(NodeCommand::encodeQueryValue(file).value_or(QString()));
    request.acceptStatusCode = 200;
    request.errorTitle = QObject::tr("Error Downloading Template Export (%1) from RCNode")
                             .arg(templateExportTypeName(type));
    return request;
}

} // namespace

// --- CreateTemplateFiles ---

CreateTemplateFiles::CreateTemplateFiles(NodeController *controller)
    : controller_(controller)
{
}

QString CreateTemplateFiles::templateFile(TemplateExportType type)
{
    switch (type) {
    case TemplateExportType::ProjectInfo:
        return QString::fromLatin1(ProjectInfoTemplate);
    case TemplateExportType::PointCloud:
        return QString::fromLatin1(PointCloudTemplate);
    case TemplateExportType::AlignCameras:
        return QString::fromLatin1(AlignCamerasTemplate);
    }
    return QString();
}

QByteArray CreateTemplateFiles::templateBody(TemplateExportType type)
{
    switch (type) {
    case TemplateExportType::ProjectInfo:
        return QByteArrayLiteral(
            "$Using(\"CapturingReality.Report.ProjectInformationExportFunctionSet\")"
            "$Using(\"CapturingReality.Report.SfmExportFunctionSet\")"
            "{$ExportProjectInfo(\"imageCount\":$(imageCount), \"componentCount\":$(componentCount), "
            "\"pointCount\": $(pointCount),\"cameraCount\": $(cameraCount), "
            "\"measurementCount\": $(measurementCount), \"displayScale\":$(displayScale)) }");
    case TemplateExportType::PointCloud:
        return QByteArrayLiteral(
            "$Using(\"CapturingReality.Report.SfmExportFunctionSet\")"
            "$ExportPointsEx(\"weak|ill|outlier\",0,999999,$(aX:.4),$(aY:.4),$(aZ:.4),"
            "$(r:c),$(g:c),$(b:c),)$Strip(1)");
    case TemplateExportType::AlignCameras:
        return QByteArrayLiteral(
            "$Using(\"CapturingReality.Report.SfmExportFunctionSet\")"
            "$ExportCameras($(invYaw:.4),$(invPitch:.4),$(invRoll:.4),"
            "$(aX:.4),$(aY:.4),$(aZ:.4),)$Strip(1)");
    }
    return QByteArray();
}

void CreateTemplateFiles::execute(CommandCompletion completion)
{
    if (controller_) {
        const TemplateExportType types[] = {TemplateExportType::ProjectInfo,
                                            TemplateExportType::PointCloud,
                                            TemplateExportType::AlignCameras};
        for (TemplateExportType type : types) {
            NodeRequest request;
            request.path = QString("/project/upload?name=%1&folder=output").arg(templateFile(type));
            request.method = HttpRequest::Method::Post;
            request.body = templateBody(type);
            request.acceptStatusCode = 200;
            request.errorTitle = uploadErrorTitle(type);
            controller_->pushCommand(std::make_shared<ProjectCommand>(
                controller_.data(), request, ProjectCommand::RequiredProjectState::Opened));
        }
    }
    completion(true, false, std::nullopt);
}

// --- EvaluateTemplate ---

EvaluateTemplate::EvaluateTemplate(NodeController *controller, TemplateExportType type)
    : ProjectTaskCommand(controller, evaluateTask(controller, type))
    , type_(type)
{
}

QString EvaluateTemplate::exportFile(TemplateExportType type, const QString &projectGuid)
{
    return QString("%1(%2).json").arg(exportStem(type), projectGuid);
}

// --- DownloadTemplateExport ---

DownloadTemplateExport::DownloadTemplateExport(NodeController *controller, const QString &file,
                                               TemplateExportType type)
    : ProjectCommand(controller, downloadRequest(file, type), RequiredProjectState::Opened)
    , type_(type)
{
}

void DownloadTemplateExport::execute(CommandCompletion completion)
{
    if (controller_) {
        ProjectUpdate update;
        update.kind = ProjectUpdate::Kind::FetchDataFromExports;
        controller_->scene().openedProject.update = update;
    }

    QPointer<NodeController> controller = controller_;
    const TemplateExportType type = type_;
    ProjectCommand::execute([controller, type, completion](bool success, bool retryable,
                                                           const std::optional<CommandError> &err) {
        if (controller) {
            controller->scene().openedProject.update.reset();
            if (type == TemplateExportType::ProjectInfo) {
                controller->markReadyToUpload();
            }
        }
        completion(success, retryable, err);
    });
}

void DownloadTemplateExport::handleResponse(const HttpResponseParser &response,
                                            CommandCompletion completion)
{
    if (!controller_) {
        completion(true, false, std::nullopt);
        return;
    }

    if (type_ == TemplateExportType::ProjectInfo) {
        applyProjectInfo(response, completion);
        return;
    }

    const std::optional<QList<std::array<float, 6>>> records = parseSextets(response.body());
    if (!records) {
        qWarning() << "Node:" << templateExportTypeName(type_) << "export is malformed";
        completion(false, false, error(invalidStructureMessage()));
        return;
    }

    const ProjectInfo &project = controller_->scene().openedProject;
    SceneModelData &modelData = controller_->modelData();
    if (type_ == TemplateExportType::PointCloud) {
        modelData.pointCloud = project.pointCount.value_or(0) > 0
            ? toPointCloud(*records, modelData.displayScale)
            : QList<PointVertex>();
        LOG_VERBOSE() << "Node: point cloud has" << modelData.pointCloud.size() << "points";
    } else {
        modelData.alignmentCameras = project.cameraCount.value_or(0) > 0
            ? toCameras(*records, modelData.displayScale)
            : QList<CameraVertex>();
        LOG_VERBOSE() << "Node: alignment has" << modelData.alignmentCameras.size() << "cameras";
    }
    completion(true, false, std::nullopt);
}

void DownloadTemplateExport::applyProjectInfo(const HttpResponseParser &response,
                                              const CommandCompletion &completion)
{
    const std::optional<QJsonObject> object = response.bodyToObject();
    if (!object) {
        completion(false, false, error(invalidStructureMessage()));
        return;
    }

    const std::optional<qint64> imageCount = jsonInt(*object, "imageCount");
    const std::optional<qint64> componentCount = jsonInt(*object, "componentCount");
    const std::optional<qint64> pointCount = jsonInt(*object, "pointCount");
    const std::optional<qint64> cameraCount = jsonInt(*object, "cameraCount");
    const std::optional<double> displayScale = jsonDouble(*object, "displayScale");
    const std::optional<qint64> measurementCount = jsonInt(*object, "measurementCount");
    if (!imageCount || !componentCount || !pointCount || !cameraCount || !displayScale
            || !measurementCount) {
        completion(false, false, error(invalidStructureMessage()));
        return;
    }

    ProjectInfo &project = controller_->scene().openedProject;
    if (project.pointCount != static_cast<int>(*pointCount)) {
        controller_->pushCommand(std::make_shared<EvaluatePointCloud>(controller_.data()));
    }
    if (project.cameraCount != static_cast<int>(*cameraCount)) {
        controller_->pushCommand(std::make_shared<EvaluateAlignmentCameras>(controller_.data()));
    }

    project.imageCount = static_cast<int>(*imageCount);
    project.componentCount = static_cast<int>(*componentCount);
    project.pointCount = static_cast<int>(*pointCount);
    project.cameraCount = static_cast<int>(*cameraCount);
    project.measurementCount = static_cast<int>(*measurementCount);
    controller_->modelData().displayScale = static_cast<float>(*displayScale);

    LOG_VERBOSE() << "Node: project has" << *imageCount << "images," << *pointCount << "points,"
                  << *cameraCount << "cameras";
    completion(true, false, std::nullopt);
}

std::optional<QList<std::array<float, 6>>> DownloadTemplateExport::parseSextets(const QByteArray &data)
{
    QList<QByteArray> parts = data.split(',');
    // Every record ends with a separator, so a trailing empty field is expected
    while (!parts.isEmpty() && parts.last().trimmed().isEmpty()) {
        parts.removeLast();
    }
    if (parts.size() % 6 != 0) {
        return std::nullopt;
    }

    QList<std::array<float, 6>> records;
    records.reserve(parts.size() / 6);
    for (int i = 0; i < parts.size(); i += 6) {
        std::array<float, 6> record{};
        for (int j = 0; j < 6; ++j) {
            bool ok = false;
            record[j] = parts.at(i + j).trimmed().toFloat(&ok);
            if (!ok) {
                return std::nullopt;
            }
        }
        records.append(record);
    }
    return records;
}

QList<PointVertex> DownloadTemplateExport::toPointCloud(const QList<std::array<float, 6>> &records,
                                                        float displayScale)
{
    QList<PointVertex> points;
    points.reserve(records.size());
    for (const auto &r : records) {
        PointVertex vertex;
        vertex.x = r[1] * displayScale;
        vertex.y = r[2] * displayScale;
        vertex.z = r[0] * displayScale;
        vertex.r = r[3] / 255.0f;
        vertex.g = r[4] / 255.0f;
        vertex.b = r[5] / 255.0f;
        points.append(vertex);
    }
    return points;
}

QList<CameraVertex> DownloadTemplateExport::toCameras(const QList<std::array<float, 6>> &records,
                                                      float displayScale)
{
    QList<CameraVertex> cameras;
    cameras.reserve(records.size());
    for (const auto &r : records) {
        CameraVertex camera;
        camera.yaw = r[0];
        camera.pitch = r[1];
        camera.roll = r[2];
        camera.x = r[3] * displayScale;
        camera.y = r[4] * displayScale;
        camera.z = r[5] * displayScale;
        cameras.append(camera);
    }
    return cameras;
}
