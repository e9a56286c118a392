/**
 * @file nodecontroller.h
 * @brief Composition root for all work against a reconstruction node.
 */

#ifndef NODECONTROLLER_H
#define NODECONTROLLER_H

#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QUuid>

#include <optional>

#include "command.h"
#include "httpconnection.h"
#include "httprequest.h"
#include "models/projectstate.h"
#include "models/taskstep.h"

class CommandQueueController;
class IAlertSink;
class SpeedSampler;
struct NodeSettings;

/**
 * @brief Owns the node connection, its command queue and the scene state.
 *
 * NodeController discovers a node among candidate addresses, keeps one
 * keep-alive HttpConnection to it and reacts to its state: execution is
 * enabled while connected, paused while the connection is being recovered,
 * and everything project-related is unloaded once it is gone for good.
 *
 * While connected it polls the node, on the foreground or background
 * interval, by queueing status and task commands. Node commands read and
 * update the state held here; they are created by the front end through
 * manageProject(), manageUpload(), uploadMedia() and refreshModel(), or by
 * other commands and finished remote tasks through commandForStep().
 *
 * @par Example usage:
 * @code
 * NodeController *node = new NodeController(errorHandler, this);
 * node->applySettings(settings);
 * connect(node, &NodeController::connectionAttemptFinished, this, [node](bool ok) {
 *     if (ok) {
 *         node->manageProject(ProjectAction::changeTo("survey"));
 *     }
 * });
 * node->startConnectionTo({"192.168.1.20", "10.0.0.5"}, token);
 * @endcode
 */
class NodeController : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultPort = 8000;
    static constexpr int DefaultProbeTimeoutMs = 2000;
    static constexpr int DefaultConnectTimeoutMs = 10000;
    static constexpr int DefaultForegroundIntervalMs = 1000;
    static constexpr int DefaultBackgroundIntervalMs = 5000;

    /// Projects saved by the node show up in its list after this delay
    static constexpr int ProjectListRefreshDelayMs = 1000;

    /// Above this many tie points a model is simplified before export
    static constexpr int SimplifyPointThreshold = 100000;

    /**
     * @brief Constructs a controller.
     * @param alertSink Receiver of terminal failures (not owned, may be null).
     * @param parent Optional parent QObject for memory management.
     */
    explicit NodeController(IAlertSink *alertSink, QObject *parent = nullptr);
    ~NodeController() override;

    /**
     * @brief Applies port, timeouts, retry policy, poll intervals and the
     *        exported models directory.
     */
    void applySettings(const NodeSettings &settings);

    /// @name State Access
    /// @{
    [[nodiscard]] SceneState &scene() { return scene_; }
    [[nodiscard]] const SceneState &scene() const { return scene_; }
    [[nodiscard]] SceneModelData &modelData() { return modelData_; }
    [[nodiscard]] const SceneModelData &modelData() const { return modelData_; }
    [[nodiscard]] CommandQueueController *queue() const { return queue_; }
    [[nodiscard]] SpeedSampler *uploadSpeedSampler() const { return speedSampler_; }
    [[nodiscard]] HttpConnection *connection() const { return connection_; }
    [[nodiscard]] QString authToken() const { return authToken_; }
    void setAuthToken(const QString &token) { authToken_ = token; }
    [[nodiscard]] bool inBackground() const { return inBackground_; }
    [[nodiscard]] quint64 autoUpdateGeneration() const { return autoUpdateGeneration_; }
    /// @}

    /// @name Queue Shortcuts
    /// @{
    void pushCommand(CommandPtr command);
    void pushCommandOnce(CommandPtr command);
    void prependCommand(CommandPtr command);
    void pushCommandDelayed(CommandPtr command, int delayMs);
    /// @}

    /**
     * @brief Forwards an alert to the alert sink.
     */
    void showAlert(const QString &title, const QString &message);

    /**
     * @brief Builds a request carrying the node's authorization headers.
     *
     * Adds "Authorization: Bearer <token>" (the given token or the current
     * one) and "Session" while a project session exists. A POST with a body
     * also gets "Content-Type: application/octet-stream" and Content-Length.
     */
    [[nodiscard]] HttpRequest constructRequest(const QString &path,
                                               HttpRequest::Method method = HttpRequest::Method::Get,
                                               const std::optional<QByteArray> &data = std::nullopt,
                                               const std::optional<QString> &authToken = std::nullopt) const;

    /// @name Connection
    /// @{

    /**
     * @brief Looks for a node among the given addresses and connects to it.
     *
     * Every address is probed in parallel with a short-lived connection and
     * "GET /node/connectuser". The first address answering 200 wins and a
     * keep-alive connection is opened to it. connectionAttemptFinished()
     * reports the outcome.
     */
    void startConnectionTo(const QStringList &addresses, const QString &authToken);

    /**
     * @brief Adopts an established connection (ownership is taken).
     */
    void attachConnection(HttpConnection *connection);

    /**
     * @brief Terminates the node connection.
     */
    void disconnectNode();
    /// @}

    /// @name Front-end Operations
    /// @{
    void manageProject(const ProjectAction &action);
    void manageUpload(TransferAction action);
    /**
     * @brief Uploads media into the opened project.
     *
     * Until the project information has been evaluated the project file
     * list may be incomplete, so files are held back and uploaded once
     * markReadyToUpload() is called.
     */
    void uploadMedia(const QStringList &files);
    void refreshModel(ModelType model);
    void enterFromBackground();
    void leaveToBackground();
    /// @}

    /// @name Used by Commands
    /// @{

    /**
     * @brief Marks a project as opened with the session the node issued.
     */
    void loadProject(const QString &name, const std::optional<QString> &sessionId);

    /**
     * @brief Forgets the opened project, its upload and its geometry.
     */
    void projectUnload();

    /**
     * @brief Marks the opened project ready for uploads and starts the
     *        uploads held back until then.
     */
    void markReadyToUpload();

    [[nodiscard]] const QStringList &heldUploads() const { return heldUploads_; }

    /**
     * @brief Records models already unpacked in the export directory.
     */
    void loadSavedModels();

    /**
     * @brief Queues downloads for exported models found in the output folder.
     */
    void observeOutputFolder(const QStringList &files);

    /**
     * @brief Starts a new upload speed sampling run.
     */
    void startUpdatingUploadSpeed();

    /**
     * @brief Builds the command a task step stands for.
     */
    [[nodiscard]] CommandPtr commandForStep(const TaskStep &step);

    /**
     * @brief Directory models of the opened project are exported into.
     * @return Empty if there is no export directory or no loaded project.
     */
    [[nodiscard]] QString projectExportDir() const;
    /// @}

signals:
    void connectionAttemptFinished(bool success);
    void connectionStateChanged(HttpConnection::State state);
    void projectLoaded(const QString &name);
    void projectUnloaded();
    void projectReadyToUpload(const QString &name);
    void modelSaved(const QString &modelName, const QString &path);
    void interactionDisabledChanged(bool disabled);

private:
    struct ConnectionAttempt;

    void observeConnection(HttpConnection::State state);
    void detachConnection();
    void nodeAutoUpdate(quint64 generation);
    void scheduleAutoUpdate(quint64 generation);
    void probeAddress(const std::shared_ptr<ConnectionAttempt> &attempt, const QString &address);
    void finishProbe(const std::shared_ptr<ConnectionAttempt> &attempt, const QString &address,
                     bool success);
    void openNodeConnection(const std::shared_ptr<ConnectionAttempt> &attempt,
                            const QString &address);

    IAlertSink *alertSink_ = nullptr;
    CommandQueueController *queue_ = nullptr;
    SpeedSampler *speedSampler_ = nullptr;

    QPointer<HttpConnection> connection_;
    QUuid connectionObserverId_;
    QString authToken_;
    quint64 connectionAttemptId_ = 0;

    SceneState scene_;
    SceneModelData modelData_;
    QStringList heldUploads_;

    int port_ = DefaultPort;
    int probeTimeoutMs_ = DefaultProbeTimeoutMs;
    int connectTimeoutMs_ = DefaultConnectTimeoutMs;
    int foregroundIntervalMs_ = DefaultForegroundIntervalMs;
    int backgroundIntervalMs_ = DefaultBackgroundIntervalMs;

    bool inBackground_ = false;
    quint64 autoUpdateGeneration_ = 0;
};

#endif // NODECONTROLLER_H
