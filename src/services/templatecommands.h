/**
 * @file templatecommands.h
 * @brief Report templates used to read project data back from the node.
 *
 * The node cannot be queried for project statistics or sparse geometry
 * directly. Instead small report templates are uploaded into the project's
 * output folder, evaluated on demand with "exportReport" and the resulting
 * files downloaded and parsed.
 */

#ifndef TEMPLATECOMMANDS_H
#define TEMPLATECOMMANDS_H

#include <QList>

#include <array>
#include <optional>

#include "models/modeltype.h"
#include "models/projectstate.h"
#include "projecttaskcommand.h"

/**
 * @brief Queues the uploads of the three report templates.
 */
class CreateTemplateFiles : public Command
{
public:
    explicit CreateTemplateFiles(NodeController *controller);

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("CreateTemplateFiles"); }

    /// @name Template files
    /// @{
    static constexpr char ProjectInfoTemplate[] = "crfly-projectinfo.tpl";
    static constexpr char PointCloudTemplate[] = "crfly-pointcloud.tpl";
    static constexpr char AlignCamerasTemplate[] = "crfly-aligncameras.tpl";
    /// @}

    [[nodiscard]] static QByteArray templateBody(TemplateExportType type);
    [[nodiscard]] static QString templateFile(TemplateExportType type);

private:
    QPointer<NodeController> controller_;
};

/**
 * @brief Evaluates a report template into "crfly-<kind>(<project guid>).json".
 *
 * The export file is downloaded and parsed by DownloadTemplateExport once
 * the task has finished.
 */
class EvaluateTemplate : public ProjectTaskCommand
{
public:
    EvaluateTemplate(NodeController *controller, TemplateExportType type);

    [[nodiscard]] QString name() const override { return QStringLiteral("EvaluateTemplate"); }
    [[nodiscard]] TemplateExportType exportType() const { return type_; }

    /**
     * @brief Export file name for the given project guid.
     */
    [[nodiscard]] static QString exportFile(TemplateExportType type, const QString &projectGuid);

private:
    TemplateExportType type_;
};

class EvaluateProjectInfo : public EvaluateTemplate
{
public:
    explicit EvaluateProjectInfo(NodeController *controller)
        : EvaluateTemplate(controller, TemplateExportType::ProjectInfo) {}
    [[nodiscard]] QString name() const override { return QStringLiteral("EvaluateProjectInfo"); }
};

class EvaluatePointCloud : public EvaluateTemplate
{
public:
    explicit EvaluatePointCloud(NodeController *controller)
        : EvaluateTemplate(controller, TemplateExportType::PointCloud) {}
    [[nodiscard]] QString name() const override { return QStringLiteral("EvaluatePointCloud"); }
};

class EvaluateAlignmentCameras : public EvaluateTemplate
{
public:
    explicit EvaluateAlignmentCameras(NodeController *controller)
        : EvaluateTemplate(controller, TemplateExportType::AlignCameras) {}
    [[nodiscard]] QString name() const override { return QStringLiteral("EvaluateAlignmentCameras"); }
};

/**
 * @brief Downloads an evaluated report and applies it to the scene.
 *
 * - ProjectInfo: image, component, point, camera and measurement counts
 *   and the display scale. Changed point or camera counts queue a new
 *   point cloud or camera evaluation. The project becomes ready to upload.
 * - PointCloud: comma separated "z,x,y,r,g,b" records.
 * - AlignCameras: comma separated "yaw,pitch,roll,x,y,z" records.
 *
 * Positions are multiplied by the display scale and colours mapped to 0..1.
 */
class DownloadTemplateExport : public ProjectCommand
{
public:
    DownloadTemplateExport(NodeController *controller, const QString &file,
                           TemplateExportType type);

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("DownloadTemplateExport"); }

    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;

    /**
     * @brief Parses comma separated numbers in groups of six.
     * @return The records, or std::nullopt if a value is not a number or
     *         the count is not a multiple of six.
     */
    [[nodiscard]] static std::optional<QList<std::array<float, 6>>> parseSextets(const QByteArray &data);

    [[nodiscard]] static QList<PointVertex> toPointCloud(const QList<std::array<float, 6>> &records,
                                                         float displayScale);
    [[nodiscard]] static QList<CameraVertex> toCameras(const QList<std::array<float, 6>> &records,
                                                       float displayScale);

private:
    void applyProjectInfo(const HttpResponseParser &response, const CommandCompletion &completion);

    TemplateExportType type_;
};

#endif // TEMPLATECOMMANDS_H
