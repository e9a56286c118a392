/**
 * @file projectstate.h
 * @brief Client-side view of the reconstruction node and its opened project.
 */

#ifndef PROJECTSTATE_H
#define PROJECTSTATE_H

#include <QList>
#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>

#include <limits>
#include <optional>

#include "modeltype.h"
#include "taskstep.h"
#include "transferstate.h"

/// Project name shown while no project is loaded
constexpr char NoProjectName[] = "<none>";

/**
 * @brief Snapshot of a remote task as last reported by the node.
 */
struct TaskStatus
{
    QString taskName;
    QString taskDescription;
    std::optional<qint64> timeStart;
    std::optional<qint64> timeEnd;
    QString state;   ///< "scheduled", "started", "finished", "failed"; empty until polled
};

/**
 * @brief Entry of the task table: what to do once the task finishes.
 */
struct WaitingTask
{
    std::optional<TaskStep> followUp;
    TaskStatus status;
};

/**
 * @brief Long-running refresh the project is currently going through.
 */
struct ProjectUpdate
{
    enum class Kind {
        FetchInputList,
        FetchOutputList,
        FetchDataFromExports,
        DownloadModel
    };

    Kind kind = Kind::FetchInputList;
    ModelType model = ModelType::Alignment;   ///< DownloadModel only

    [[nodiscard]] QString describe() const;
};

/**
 * @brief State of the project opened on the node.
 *
 * The status fields are absent until the first GetProjectStatus response.
 * changeCounter is only adopted by the reconciliation in GetProjectStatus,
 * which is what limits list refreshes to one per observed change.
 */
struct ProjectInfo
{
    bool loaded = false;
    bool readyToUpload = false;
    QString name = QString::fromLatin1(NoProjectName);
    std::optional<QString> sessionId;
    std::optional<ProjectUpdate> update;

    QMap<QString, WaitingTask> waitingOnTask;   ///< Keyed by remote task id
    std::optional<ModelType> exportModelReady;
    QSet<QString> fileList;

    /// @name From the project information export
    /// @{
    std::optional<int> imageCount;
    std::optional<int> componentCount;
    std::optional<int> pointCount;
    std::optional<int> cameraCount;
    std::optional<int> measurementCount;
    /// @}

    /// @name From /project/status
    /// @{
    std::optional<bool> restarted;
    std::optional<double> progress;
    std::optional<double> timeTotal;
    std::optional<double> timeEstimation;
    std::optional<int> errorCode;
    std::optional<int> changeCounter;
    std::optional<int> savedChangeCounter;
    std::optional<int> processID;
    /// @}

    /**
     * @brief Returns true if a pending task has one of the given names.
     */
    [[nodiscard]] bool hasPendingTask(const QStringList &taskNames) const;

    [[nodiscard]] QStringList pendingTaskIds() const { return waitingOnTask.keys(); }
};

/**
 * @brief Node-wide state owned by NodeController.
 */
struct SceneState
{
    bool connected = false;
    bool connectionLost = false;
    bool interactionDisabled = false;

    ProjectInfo openedProject;
    QString lastProjectName;   ///< Most recently loaded project, survives unloads

    QMap<QString, qint64> projectList;   ///< Name to timestamp
    QMap<QString, QString> projectGuids; ///< Name to guid

    std::optional<MediaUploadState> mediaUpload;

    QString nodeStatus;
    int availableSessions = 0;
    QString exportedModelsDir;   ///< Empty if the directory is unavailable

    SceneState() { resetProjectList(); }

    /**
     * @brief Replaces the project list with the "<none>" placeholder.
     */
    void resetProjectList();

    [[nodiscard]] std::optional<QString> projectNameForGuid(const QString &guid) const;
};

/**
 * @brief Vertex of the evaluated sparse point cloud.
 */
struct PointVertex
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

/**
 * @brief Position and orientation of an aligned camera.
 */
struct CameraVertex
{
    float yaw = 0.0f;
    float pitch = 0.0f;
    float roll = 0.0f;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

/**
 * @brief Geometry and downloaded models of the opened project.
 */
struct SceneModelData
{
    QList<PointVertex> pointCloud;
    QList<CameraVertex> alignmentCameras;
    QMap<ModelType, QString> savedModels;   ///< Path of the unpacked model.obj
    float displayScale = 1.0f;
};

/**
 * @brief Project-level request from the front end.
 */
struct ProjectAction
{
    enum class Kind {
        Refresh,
        ChangeTo,
        Save,
        Close,
        Delete
    };

    Kind kind = Kind::Refresh;
    QString projectName;   ///< ChangeTo only

    [[nodiscard]] static ProjectAction refresh() { return {Kind::Refresh, QString()}; }
    [[nodiscard]] static ProjectAction changeTo(const QString &name) { return {Kind::ChangeTo, name}; }
    [[nodiscard]] static ProjectAction save() { return {Kind::Save, QString()}; }
    [[nodiscard]] static ProjectAction close() { return {Kind::Close, QString()}; }
    [[nodiscard]] static ProjectAction remove() { return {Kind::Delete, QString()}; }
};

enum class TransferAction {
    Resume,
    Pause,
    Stop
};

#endif // PROJECTSTATE_H
