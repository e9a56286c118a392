#include "uploadcommands.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QSet>

#include "httpconnection.h"
#include "httpresponseparser.h"
#include "jsonfields.h"
#include "models/speedsampler.h"
#include "nodecommand.h"
#include "nodecontroller.h"
#include "utils/logging.h"

namespace {

CommandError uploadError(const QString &message)
{
    return CommandError{QObject::tr("Error Uploading Media to RC"), message};
}

} // namespace

// --- StartMediaUpload ---

StartMediaUpload::StartMediaUpload(NodeController *controller, const QStringList &files,
                                   bool startIfUserPaused)
    : controller_(controller)
    , files_(files)
    , startIfUserPaused_(startIfUserPaused)
{
}

QString StartMediaUpload::uploadName(const QString &filePath)
{
    QString fileName = QFileInfo(filePath).fileName();
    if (fileName.startsWith(QLatin1String(TemporaryPrefix))) {
        fileName.remove(0, static_cast<int>(qstrlen(TemporaryPrefix)));
    }
    return fileName;
}

void StartMediaUpload::execute(CommandCompletion completion)
{
    if (!controller_) {
        completion(true, false, std::nullopt);
        return;
    }

    SceneState &scene = controller_->scene();
    const QStringList uploading = scene.mediaUpload ? scene.mediaUpload->uploadSet : QStringList();
    const QSet<QString> &projectFiles = scene.openedProject.fileList;

    QStringList uploadSet;
    QSet<QString> uploadNames;
    qint64 addedBytes = 0;
    int addedItems = 0;

    auto accept = [&](const QString &path) {
        const QString name = uploadName(path);
        if (uploadSet.contains(path) || uploadNames.contains(name)) {
            return false;
        }
        if (!QFileInfo::exists(path) || projectFiles.contains(name)) {
            return false;
        }
        uploadSet.append(path);
        uploadNames.insert(name);
        return true;
    };

    for (const QString &path : uploading) {
        accept(path);
    }
    for (const QString &path : files_) {
        if (accept(path)) {
            addedBytes += QFileInfo(path).size();
            ++addedItems;
        } else {
            LOG_VERBOSE() << "Upload: skipping" << path;
        }
    }

    int dropped = 0;
    for (const QString &path : uploading) {
        if (!uploadSet.contains(path)) {
            ++dropped;
        }
    }

    if (uploadSet.isEmpty()) {
        if (scene.mediaUpload) {
            LOG_VERBOSE() << "Upload: nothing left to upload, clearing session";
        }
        scene.mediaUpload.reset();
        if (dropped > 0) {
            controller_->showAlert(QObject::tr("Error Uploading Media"),
                                   QObject::tr("Files that are not saved in device were detected. "
                                               "The upload will proceed without these (%1) files.")
                                       .arg(dropped));
        }
        completion(true, false, std::nullopt);
        return;
    }

    if (!scene.mediaUpload) {
        scene.mediaUpload = MediaUploadState();
    }
    MediaUploadState &state = *scene.mediaUpload;
    state.uploadSet = uploadSet;
    state.totalBytes += addedBytes;
    state.totalItems += addedItems;

    if (dropped > 0) {
        qint64 remaining = 0;
        for (const QString &path : uploadSet) {
            remaining += QFileInfo(path).size();
        }
        state.totalBytes = state.transferredBytes - state.currentFileOffset + remaining;
        state.totalItems -= dropped;
        controller_->showAlert(QObject::tr("Error Uploading Media"),
                               QObject::tr("Files that are not saved in device were detected. "
                                           "The upload will proceed without these (%1) files.")
                                   .arg(dropped));
    }

    if (state.paused) {
        state.lastSampledBytes = state.transferredBytes;
    }

    qDebug() << "Upload:" << state.uploadSet.size() << "files pending," << state.totalBytes << "bytes";

    if (startIfUserPaused_ || state.forcePaused) {
        state.paused = false;
        state.forcePaused = false;
        controller_->pushCommand(std::make_shared<UploadMedia>(controller_.data()));
        controller_->startUpdatingUploadSpeed();
    }
    completion(true, false, std::nullopt);
}

// --- UploadMedia ---

UploadMedia::UploadMedia(NodeController *controller)
    : controller_(controller)
{
}

void UploadMedia::execute(CommandCompletion completion)
{
    if (!controller_ || !controller_->scene().openedProject.loaded
            || !controller_->scene().mediaUpload || controller_->scene().mediaUpload->paused) {
        completion(true, false, std::nullopt);
        return;
    }

    MediaUploadState &state = *controller_->scene().mediaUpload;
    if (state.uploadSet.isEmpty()) {
        LOG_VERBOSE() << "Upload: session finished";
        controller_->scene().mediaUpload.reset();
        completion(true, false, std::nullopt);
        return;
    }

    HttpConnection *connection = controller_->connection();
    if (!connection) {
        completion(false, true, uploadError(QObject::tr("Connection with RealityCapture is not established.")));
        return;
    }

    const QString filePath = state.uploadSet.first();
    const QString fileName = StartMediaUpload::uploadName(filePath);
    const std::optional<QString> encodedName = NodeCommand::encodeQueryValue(fileName);
    if (!encodedName) {
        state.uploadSet.removeFirst();
        completion(false, false, uploadError(QObject::tr("File name %1 could not be encoded.").arg(fileName)));
        return;
    }

    state.currentFileOffset = 0;
    const qint64 fileSize = QFileInfo(filePath).size();
    const HttpRequest request = controller_->constructRequest(
        "/project/command?name=add&param1=" + *encodedName, HttpRequest::Method::Post);

    LOG_VERBOSE() << "Upload: sending" << filePath;

    QPointer<NodeController> controller = controller_;
    std::shared_ptr<Command> self = shared_from_this();

    auto onBytesSent = [controller](qint64 bytes) {
        if (!controller) {
            return;
        }
        std::optional<MediaUploadState> &upload = controller->scene().mediaUpload;
        if (!upload || upload->paused) {
            if (controller->connection()) {
                controller->connection()->cancel();
            }
            return;
        }
        upload->transferredBytes += bytes;
        upload->currentFileOffset += bytes;
    };

    connection->sendFile(request, filePath, onBytesSent,
                         [controller, self, filePath, fileName, fileSize, completion](const TransportResult &result) {
        if (!controller) {
            completion(true, false, std::nullopt);
            return;
        }
        std::optional<MediaUploadState> &upload = controller->scene().mediaUpload;

        if (!result.ok()) {
            if (result.error->kind == TransportError::Kind::Cancellation) {
                // Paused or stopped by the user, counters were already adjusted
                LOG_VERBOSE() << "Upload: cancelled" << filePath;
                completion(true, false, std::nullopt);
                return;
            }
            qWarning() << "Upload: sending" << filePath << "failed:" << result.error->message;
            if (upload) {
                upload->paused = true;
                upload->transferredBytes -= upload->currentFileOffset;
                upload->currentFileOffset = 0;
            }
            completion(false, result.error->isRetryable(),
                       uploadError(QObject::tr("An issue occurred while sending the request, error: %1")
                                       .arg(result.error->message)));
            return;
        }

        const std::optional<HttpResponseParser> response = HttpResponseParser::parse(result.data);
        if (!response) {
            completion(false, false,
                       uploadError(QObject::tr("An issue was encountered while parsing the response from RCNode.")));
            return;
        }

        const QJsonObject object = response->bodyToObject().value_or(QJsonObject());
        const std::optional<QString> taskId = jsonString(object, "taskID");
        if (!taskId) {
            if (upload) {
                upload->paused = true;
            }
            QString description = QObject::tr("The response from RCNode was invalid. The structure "
                                              "of the response does not align with the expected "
                                              "API format.");
            const std::optional<qint64> code = jsonInt(object, "code");
            const std::optional<QString> message = jsonString(object, "message");
            if (code && message) {
                description = QObject::tr("An issue was encountered while parsing the response from "
                                          "RCNode, error(%1): %2").arg(*code).arg(*message);
            }
            completion(false, false, uploadError(description));
            return;
        }

        if (StartMediaUpload::uploadName(filePath) != QFileInfo(filePath).fileName()) {
            QFile::remove(filePath);
        }

        ProjectInfo &project = controller->scene().openedProject;
        project.fileList.insert(fileName);
        if (upload) {
            // A pause after the last chunk already took this file back out
            upload->transferredBytes += fileSize - upload->currentFileOffset;
            upload->transferredItems += 1;
            upload->currentFileOffset = 0;
            upload->uploadSet.removeAll(filePath);
        }

        WaitingTask waiting;
        waiting.followUp = TaskStep::calculateModel(ModelType::Alignment);
        waiting.status.taskName = QStringLiteral("Add File To Project");
        waiting.status.taskDescription = QObject::tr("Adding file to project...");
        project.waitingOnTask.insert(*taskId, waiting);

        qDebug() << "Upload:" << fileName << "added as task" << *taskId;
        controller->pushCommand(std::make_shared<UploadMedia>(controller.data()));
        completion(true, false, std::nullopt);
    });
}
