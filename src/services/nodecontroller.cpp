#include "nodecontroller.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTimer>

#include "commandqueuecontroller.h"
#include "httpresponseparser.h"
#include "ialertsink.h"
#include "modelcommands.h"
#include "models/speedsampler.h"
#include "nodecommands.h"
#include "nodesettings.h"
#include "projectcommands.h"
#include "templatecommands.h"
#include "uploadcommands.h"
#include "utils/logging.h"

namespace {

QString prepareExportDirectory(const QString &path)
{
    if (path.isEmpty()) {
        return QString();
    }
    if (!QDir().mkpath(path)) {
        qWarning() << "Node: cannot create exported models directory" << path;
        return QString();
    }
    return QDir(path).absolutePath();
}

} // namespace

struct NodeController::ConnectionAttempt
{
    quint64 id = 0;
    int pendingProbes = 0;
    bool finished = false;
    QString authToken;
};

NodeController::NodeController(IAlertSink *alertSink, QObject *parent)
    : QObject(parent)
    , alertSink_(alertSink)
    , queue_(new CommandQueueController(alertSink, this))
    , speedSampler_(new SpeedSampler(this))
{
    speedSampler_->setStateProvider([this]() -> TransferState * {
        return scene_.mediaUpload ? &*scene_.mediaUpload : nullptr;
    });

    connect(queue_, &CommandQueueController::interactionDisabledChanged,
            this, [this](bool disabled) {
        scene_.interactionDisabled = disabled;
        emit interactionDisabledChanged(disabled);
    });

    scene_.exportedModelsDir = prepareExportDirectory(NodeSettings::defaultExportDirectory());
}

NodeController::~NodeController()
{
    if (connection_) {
        connection_->removeStateObserver(connectionObserverId_);
    }
}

void NodeController::applySettings(const NodeSettings &settings)
{
    port_ = settings.port;
    probeTimeoutMs_ = settings.probeTimeoutMs;
    connectTimeoutMs_ = settings.connectTimeoutMs;
    foregroundIntervalMs_ = settings.foregroundIntervalMs;
    backgroundIntervalMs_ = settings.backgroundIntervalMs;
    queue_->setMaxRetries(settings.retries);
    queue_->setRetryTimeoutMs(settings.retryTimeoutMs);
    if (!settings.authToken.isEmpty()) {
        authToken_ = settings.authToken;
    }
    scene_.exportedModelsDir = prepareExportDirectory(settings.exportDirectory);

    LOG_VERBOSE() << "Node: port" << port_ << "retries" << settings.retries
                  << "export dir" << scene_.exportedModelsDir;
}

// --- Queue shortcuts ---

void NodeController::pushCommand(CommandPtr command)
{
    queue_->pushCommand(std::move(command));
}

void NodeController::pushCommandOnce(CommandPtr command)
{
    queue_->pushCommandOnce(std::move(command));
}

void NodeController::prependCommand(CommandPtr command)
{
    queue_->prependCommand(std::move(command));
}

void NodeController::pushCommandDelayed(CommandPtr command, int delayMs)
{
    QTimer::singleShot(delayMs, this, [this, command]() {
        pushCommand(command);
    });
}

void NodeController::showAlert(const QString &title, const QString &message)
{
    if (alertSink_) {
        alertSink_->showAlert(title, message);
    } else {
        qWarning().noquote() << "Node:" << title << "-" << message;
    }
}

HttpRequest NodeController::constructRequest(const QString &path, HttpRequest::Method method,
                                             const std::optional<QByteArray> &data,
                                             const std::optional<QString> &authToken) const
{
    HttpRequest request;
    request.urlPath = path;
    request.method = method;
    request.setHeader(QStringLiteral("Authorization"),
                      QStringLiteral("Bearer %1").arg(authToken.value_or(authToken_)));
    if (scene_.openedProject.sessionId) {
        request.setHeader(QStringLiteral("Session"), *scene_.openedProject.sessionId);
    }
    if (method == HttpRequest::Method::Post && data) {
        request.setHeader(QStringLiteral("Content-Type"), QStringLiteral("application/octet-stream"));
        request.setHeader(QStringLiteral("Content-Length"), QString::number(data->size()));
        request.body = data;
    }
    return request;
}

// --- Connection ---

void NodeController::startConnectionTo(const QStringList &addresses, const QString &authToken)
{
    if (connection_) {
        qDebug() << "Node: dropping current connection before connecting again";
        disconnectNode();
    }

    auto attempt = std::make_shared<ConnectionAttempt>();
    attempt->id = ++connectionAttemptId_;
    attempt->authToken = authToken;
    attempt->pendingProbes = addresses.size();

    if (addresses.isEmpty()) {
        qWarning() << "Node: no addresses to connect to";
        emit connectionAttemptFinished(false);
        return;
    }

    qDebug() << "Node: probing" << addresses.join(", ") << "on port" << port_;
    for (const QString &address : addresses) {
        probeAddress(attempt, address);
    }
}

void NodeController::probeAddress(const std::shared_ptr<ConnectionAttempt> &attempt,
                                  const QString &address)
{
    // Probes do not reconnect, so the request is only sent once connected
    QPointer<HttpConnection> probe = new HttpConnection(this);
    auto settled = std::make_shared<bool>(false);

    auto settle = [this, probe, attempt, address, settled](bool success) {
        if (*settled) {
            return;
        }
        *settled = true;
        LOG_VERBOSE() << "Node: probe of" << address << (success ? "succeeded" : "failed");
        if (probe) {
            probe->terminateConnection();
            probe->deleteLater();
        }
        finishProbe(attempt, address, success);
    };

    probe->addStateObserver([this, probe, attempt, settle, settled](HttpConnection::State state) {
        if (*settled || !probe) {
            return;
        }
        if (state == HttpConnection::State::Connected) {
            probe->send(constructRequest(QStringLiteral("/node/connectuser"), HttpRequest::Method::Get,
                                         std::nullopt, attempt->authToken),
                        [settle](const TransportResult &result) {
                bool success = false;
                if (result.ok()) {
                    const std::optional<HttpResponseParser> response =
                        HttpResponseParser::parse(result.data);
                    success = response && response->statusCode() == 200;
                }
                settle(success);
            });
        } else if (state == HttpConnection::State::Disconnected) {
            settle(false);
        }
    });
    probe->open(address, static_cast<quint16>(port_), probeTimeoutMs_, false);
}

void NodeController::finishProbe(const std::shared_ptr<ConnectionAttempt> &attempt,
                                 const QString &address, bool success)
{
    if (attempt->finished || attempt->id != connectionAttemptId_) {
        return;
    }

    attempt->pendingProbes--;
    if (success) {
        attempt->finished = true;
        openNodeConnection(attempt, address);
    } else if (attempt->pendingProbes <= 0) {
        attempt->finished = true;
        qWarning() << "Node: no node answered";
        emit connectionAttemptFinished(false);
    }
}

void NodeController::openNodeConnection(const std::shared_ptr<ConnectionAttempt> &attempt,
                                        const QString &address)
{
    qDebug() << "Node: connecting to" << address;

    HttpConnection *connection = new HttpConnection(this);
    auto observerId = std::make_shared<QUuid>();
    *observerId = connection->addStateObserver(
        [this, connection, attempt, observerId](HttpConnection::State state) {
        if (state == HttpConnection::State::Connected) {
            connection->removeStateObserver(*observerId);
            if (attempt->id != connectionAttemptId_) {
                connection->terminateConnection();
                connection->deleteLater();
                return;
            }
            authToken_ = attempt->authToken;
            attachConnection(connection);
            emit connectionAttemptFinished(true);
        } else if (state == HttpConnection::State::Disconnected) {
            connection->removeStateObserver(*observerId);
            connection->deleteLater();
            if (attempt->id == connectionAttemptId_) {
                emit connectionAttemptFinished(false);
            }
        }
    });
    connection->open(address, static_cast<quint16>(port_), connectTimeoutMs_, true);
}

void NodeController::attachConnection(HttpConnection *connection)
{
    if (!connection) {
        return;
    }
    if (connection_ && connection_ != connection) {
        detachConnection();
    }
    connection->setParent(this);
    connection_ = connection;
    connectionObserverId_ = connection->addStateObserver([this](HttpConnection::State state) {
        observeConnection(state);
    });
}

void NodeController::detachConnection()
{
    if (!connection_) {
        return;
    }
    connection_->removeStateObserver(connectionObserverId_);
    connection_->deleteLater();
    connection_.clear();
    connectionObserverId_ = QUuid();
}

void NodeController::disconnectNode()
{
    if (connection_) {
        connection_->terminateConnection();
    }
}

void NodeController::observeConnection(HttpConnection::State state)
{
    switch (state) {
    case HttpConnection::State::Connected:
        qDebug() << "Node: connected";
        scene_.connected = true;
        scene_.connectionLost = false;
        queue_->setCommandExecutionEnabled(true);
        nodeAutoUpdate(++autoUpdateGeneration_);
        break;
    case HttpConnection::State::Disconnected:
        qDebug() << "Node: disconnected";
        scene_.connected = false;
        scene_.connectionLost = false;
        queue_->setCommandExecutionEnabled(false);
        projectUnload();
        detachConnection();
        scene_.availableSessions = 0;
        scene_.projectList.clear();
        scene_.projectGuids.clear();
        scene_.mediaUpload.reset();
        break;
    case HttpConnection::State::Lost:
        qDebug() << "Node: connection lost, waiting for it to recover";
        scene_.connectionLost = true;
        queue_->setCommandExecutionEnabled(false);
        break;
    case HttpConnection::State::Started:
    case HttpConnection::State::Connecting:
        break;
    }
    emit connectionStateChanged(state);
}

void NodeController::nodeAutoUpdate(quint64 generation)
{
    if (generation != autoUpdateGeneration_ || !queue_->commandExecutionEnabled()) {
        return;
    }

    // A slow queue must not collect one poll per tick
    const ProjectInfo &project = scene_.openedProject;
    if (!project.waitingOnTask.isEmpty()) {
        pushCommandOnce(std::make_shared<GetProjectTasks>(this, project.pendingTaskIds()));
        pushCommandOnce(std::make_shared<GetProjectStatus>(this));
    } else if (queue_->commandInQueueCount() == 0) {
        if (project.loaded) {
            pushCommand(std::make_shared<GetProjectStatus>(this));
        } else {
            pushCommand(std::make_shared<GetNodeStatus>(this));
        }
    }

    scheduleAutoUpdate(generation);
}

void NodeController::scheduleAutoUpdate(quint64 generation)
{
    const int interval = inBackground_ ? backgroundIntervalMs_ : foregroundIntervalMs_;
    QTimer::singleShot(interval, this, [this, generation]() {
        nodeAutoUpdate(generation);
    });
}

// --- Front-end operations ---

void NodeController::manageProject(const ProjectAction &action)
{
    switch (action.kind) {
    case ProjectAction::Kind::Refresh:
        pushCommand(std::make_shared<GetNodeProjects>(this));
        pushCommand(std::make_shared<GetProjectStatus>(this));
        break;
    case ProjectAction::Kind::ChangeTo: {
        const auto guid = scene_.projectGuids.constFind(action.projectName);
        if (guid == scene_.projectGuids.constEnd()) {
            pushCommand(std::make_shared<GetProjectCreate>(this, action.projectName));
        } else {
            pushCommand(std::make_shared<GetProjectOpen>(this, guid.value()));
        }
        pushCommand(std::make_shared<GetProjectList>(this, GetProjectList::Folder::Output));
        break;
    }
    case ProjectAction::Kind::Save:
        pushCommand(std::make_shared<GetProjectSave>(this, scene_.openedProject.name));
        break;
    case ProjectAction::Kind::Close:
        pushCommand(std::make_shared<GetProjectSave>(this, scene_.openedProject.name));
        pushCommand(std::make_shared<GetProjectClose>(this));
        break;
    case ProjectAction::Kind::Delete: {
        const QString guid = scene_.projectGuids.value(scene_.openedProject.name);
        if (guid.isEmpty()) {
            showAlert(tr("Error Deleting RCNode Project"),
                      tr("The selected project for deletion is not in the list of projects."));
        } else {
            pushCommand(std::make_shared<GetProjectDelete>(this, guid));
        }
        break;
    }
    }
}

void NodeController::manageUpload(TransferAction action)
{
    if (!scene_.mediaUpload) {
        return;
    }

    MediaUploadState &state = *scene_.mediaUpload;
    switch (action) {
    case TransferAction::Resume:
        pushCommand(std::make_shared<StartMediaUpload>(this, QStringList()));
        break;
    case TransferAction::Pause:
        if (connection_ && !state.paused && connection_->isUploading()) {
            connection_->cancel();
        }
        state.paused = true;
        state.transferredBytes -= state.currentFileOffset;
        state.currentFileOffset = 0;
        break;
    case TransferAction::Stop:
        if (connection_ && !state.paused && connection_->isUploading()) {
            connection_->cancel();
        }
        scene_.mediaUpload.reset();
        speedSampler_->stop();
        break;
    }
}

void NodeController::uploadMedia(const QStringList &files)
{
    if (scene_.openedProject.loaded && !scene_.openedProject.readyToUpload) {
        LOG_VERBOSE() << "Upload: holding" << files.size() << "files until the project is evaluated";
        heldUploads_.append(files);
        return;
    }
    pushCommand(std::make_shared<StartMediaUpload>(this, files));
}

void NodeController::refreshModel(ModelType model)
{
    modelData_.savedModels.remove(model);
    pushCommand(std::make_shared<CalculateModel>(this, model));
}

void NodeController::enterFromBackground()
{
    inBackground_ = false;
    if (scene_.openedProject.loaded) {
        loadSavedModels();
    }
}

void NodeController::leaveToBackground()
{
    inBackground_ = true;
    if (scene_.openedProject.loaded) {
        pushCommand(std::make_shared<GetProjectSave>(this, scene_.openedProject.name));
    }
    disconnectNode();
}

// --- Used by commands ---

void NodeController::loadProject(const QString &name, const std::optional<QString> &sessionId)
{
    ProjectInfo project;
    project.loaded = true;
    project.name = name;
    project.sessionId = sessionId;
    scene_.openedProject = project;
    scene_.lastProjectName = name;

    qDebug() << "Node: project" << name << "loaded" << (sessionId ? "with session" : "without session");
    emit projectLoaded(name);
}

void NodeController::markReadyToUpload()
{
    ProjectInfo &project = scene_.openedProject;
    if (!project.loaded || project.readyToUpload) {
        return;
    }
    project.readyToUpload = true;
    qDebug() << "Node: project" << project.name << "is ready for uploads";
    emit projectReadyToUpload(project.name);

    if (!heldUploads_.isEmpty()) {
        const QStringList files = heldUploads_;
        heldUploads_.clear();
        pushCommand(std::make_shared<StartMediaUpload>(this, files));
    }
}

void NodeController::projectUnload()
{
    const bool wasLoaded = scene_.openedProject.loaded;
    scene_.openedProject = ProjectInfo();
    scene_.mediaUpload.reset();
    heldUploads_.clear();
    modelData_.pointCloud.clear();
    modelData_.alignmentCameras.clear();
    modelData_.savedModels.clear();
    speedSampler_->stop();

    if (wasLoaded) {
        qDebug() << "Node: project unloaded";
        if (alertSink_) {
            alertSink_->requestDefaultView();
        }
        emit projectUnloaded();
    }
}

QString NodeController::projectExportDir() const
{
    if (scene_.exportedModelsDir.isEmpty() || !scene_.openedProject.loaded) {
        return QString();
    }
    return QDir(scene_.exportedModelsDir).filePath(scene_.openedProject.name);
}

void NodeController::loadSavedModels()
{
    const QString projectDir = projectExportDir();
    if (projectDir.isEmpty()) {
        return;
    }

    for (ModelType model : allModelTypes()) {
        if (model == ModelType::Alignment) {
            continue;
        }
        const QString modelDir = QDir(projectDir).filePath(modelTypeName(model));
        const QString modelPath = QDir(modelDir).filePath(QString::fromLatin1(DownloadModel::ModelFileName));
        if (!QFileInfo(modelDir).isDir()) {
            modelData_.savedModels.remove(model);
        } else if (QFileInfo::exists(modelPath)) {
            LOG_VERBOSE() << "Node: found saved" << modelTypeName(model);
            modelData_.savedModels.insert(model, modelPath);
        }
    }
}

void NodeController::observeOutputFolder(const QStringList &files)
{
    QList<ModelType> queued;

    ProjectInfo &project = scene_.openedProject;
    if (project.exportModelReady
            && files.contains(modelTypeName(*project.exportModelReady) + ".zip")) {
        const ModelType model = *project.exportModelReady;
        pushCommand(std::make_shared<DownloadModel>(this, model));
        queued.append(model);
        project.exportModelReady.reset();
    }

    for (ModelType model : allModelTypes()) {
        if (model == ModelType::Alignment || queued.contains(model)) {
            continue;
        }
        if (!modelData_.savedModels.contains(model) && files.contains(modelTypeName(model) + ".zip")) {
            pushCommand(std::make_shared<DownloadModel>(this, model));
        }
    }
}

void NodeController::startUpdatingUploadSpeed()
{
    speedSampler_->start();
}

CommandPtr NodeController::commandForStep(const TaskStep &step)
{
    switch (step.kind) {
    case TaskStep::Kind::ProjectStatus:
        return std::make_shared<GetProjectStatus>(this);
    case TaskStep::Kind::CalculateModel:
        return std::make_shared<CalculateModel>(this, step.model);
    case TaskStep::Kind::SelectTriangles:
        return std::make_shared<SelectTriangles>(this, step.model);
    case TaskStep::Kind::ComputeModel:
        if (step.model == ModelType::Alignment) {
            return std::make_shared<CalculateModel>(this, step.model);
        }
        return std::make_shared<ComputeModel>(this, step.model);
    case TaskStep::Kind::SimplifyAndExport:
        return std::make_shared<SimplifyAndExportModel>(this, step.model);
    case TaskStep::Kind::ExportSelected:
        return std::make_shared<ExportSelectedModel>(this, step.model);
    case TaskStep::Kind::DownloadModel:
        return std::make_shared<DownloadModel>(this, step.model);
    case TaskStep::Kind::DownloadTemplateExport:
        return std::make_shared<DownloadTemplateExport>(this, step.file, step.exportType);
    }
    return std::make_shared<GetProjectStatus>(this);
}
