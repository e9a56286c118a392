/**
 * @file taskstep.h
 * @brief Descriptor of the command to run once a remote task finishes.
 */

#ifndef TASKSTEP_H
#define TASKSTEP_H

#include <QString>

#include "modeltype.h"

/**
 * @brief Tagged, inspectable follow-up of a remote task.
 *
 * Steps are stored in the task table instead of prebuilt commands, so the
 * pipeline can be examined and tested without a connection. NodeController
 * turns a step into its command with commandForStep() at the time the step
 * becomes due.
 *
 * The model pipeline chains as follows:
 * @code
 * CalculateModel(alignment) -> ProjectStatus
 * CalculateModel(m)  -> SelectTriangles(m) -> ComputeModel(m)
 *   -> SimplifyAndExport(m) -> ExportSelected(m) -> DownloadModel(m)
 *   (or ComputeModel(m) -> ExportSelected(m) for small point clouds)
 * @endcode
 */
struct TaskStep
{
    enum class Kind {
        ProjectStatus,
        CalculateModel,
        SelectTriangles,
        ComputeModel,
        SimplifyAndExport,
        ExportSelected,
        DownloadModel,
        DownloadTemplateExport
    };

    Kind kind = Kind::ProjectStatus;
    ModelType model = ModelType::Alignment;
    QString file;                                          ///< DownloadTemplateExport only
    TemplateExportType exportType = TemplateExportType::ProjectInfo;

    [[nodiscard]] static TaskStep projectStatus();
    [[nodiscard]] static TaskStep calculateModel(ModelType model);
    [[nodiscard]] static TaskStep selectTriangles(ModelType model);
    [[nodiscard]] static TaskStep computeModel(ModelType model);
    [[nodiscard]] static TaskStep simplifyAndExport(ModelType model);
    [[nodiscard]] static TaskStep exportSelected(ModelType model);
    [[nodiscard]] static TaskStep downloadModel(ModelType model);
    [[nodiscard]] static TaskStep downloadTemplateExport(const QString &file, TemplateExportType type);

    /**
     * @brief Human-readable form used in logs, e.g. "DownloadModel(Preview Model)".
     */
    [[nodiscard]] QString describe() const;

    bool operator==(const TaskStep &other) const;
    bool operator!=(const TaskStep &other) const { return !(*this == other); }
};

#endif // TASKSTEP_H
