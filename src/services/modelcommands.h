/**
 * @file modelcommands.h
 * @brief Commands of the remote model pipeline and the model download.
 */

#ifndef MODELCOMMANDS_H
#define MODELCOMMANDS_H

#include <QStringList>

#include "models/modeltype.h"
#include "projecttaskcommand.h"
#include "transporterror.h"

/**
 * @brief Starts computing a model, or aligning the images for Alignment.
 *
 * Skipped while media is being uploaded or while a task of the same stage
 * is still pending on the node.
 */
class CalculateModel : public ProjectTaskCommand
{
public:
    CalculateModel(NodeController *controller, ModelType model);

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("CalculateModel"); }

    [[nodiscard]] ModelType model() const { return model_; }
    [[nodiscard]] const QStringList &conflictingTasks() const { return conflictingTasks_; }

private:
    ModelType model_;
    QStringList conflictingTasks_;
};

/**
 * @brief Selects the triangles inside the reconstruction region.
 */
class SelectTriangles : public ProjectTaskCommand
{
public:
    SelectTriangles(NodeController *controller, ModelType model);
    [[nodiscard]] QString name() const override { return QStringLiteral("SelectTriangles"); }
};

/**
 * @brief Runs the model calculation proper.
 *
 * The follow-up is chosen when the command is built: models of projects
 * with more than NodeController::SimplifyPointThreshold tie points are
 * simplified before export.
 */
class ComputeModel : public ProjectTaskCommand
{
public:
    ComputeModel(NodeController *controller, ModelType model);
    [[nodiscard]] QString name() const override { return QStringLiteral("ComputeModel"); }

    [[nodiscard]] static QString commandForModel(ModelType model);
};

class SimplifyAndExportModel : public ProjectTaskCommand
{
public:
    SimplifyAndExportModel(NodeController *controller, ModelType model);
    [[nodiscard]] QString name() const override { return QStringLiteral("SimplifyAndExportModel"); }
};

/**
 * @brief Exports the selected model as an OBJ inside "<model name>.zip".
 *
 * Marks the model as ready for export once the node accepted the task.
 */
class ExportSelectedModel : public ProjectTaskCommand
{
public:
    ExportSelectedModel(NodeController *controller, ModelType model);

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("ExportSelectedModel"); }

private:
    ModelType model_;
};

/**
 * @brief Downloads an exported model archive and unpacks it.
 *
 * The archive is written to "<export dir>/<project>/<model name>.zip",
 * extracted into the "<model name>" directory next to it and removed.
 * The unpacked model.obj is then recorded in the scene model data.
 */
class DownloadModel : public Command
{
public:
    DownloadModel(NodeController *controller, ModelType model);

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("DownloadModel"); }

    [[nodiscard]] ModelType model() const { return model_; }

    static constexpr char ModelFileName[] = "model.obj";

private:
    [[nodiscard]] CommandError error(const QString &message) const;
    void finish(const TransportResult &result, const QString &projectDir,
                const CommandCompletion &completion);
    void clearUpdateState();

    QPointer<NodeController> controller_;
    ModelType model_;
};

#endif // MODELCOMMANDS_H
