#include "httpconnection.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

#include "utils/logging.h"

namespace {

const QByteArray HeaderTerminator("\r\n\r\n");

} // namespace

HttpConnection::HttpConnection(QObject *parent)
    : QObject(parent)
    , socket_(new QTcpSocket(this))
    , connectionTimer_(new QTimer(this))
    , reconnectTimer_(new QTimer(this))
{
    connectionTimer_->setSingleShot(true);
    connect(connectionTimer_, &QTimer::timeout,
            this, &HttpConnection::onConnectionTimeout);

    reconnectTimer_->setSingleShot(true);
    connect(reconnectTimer_, &QTimer::timeout,
            this, &HttpConnection::onReconnectTimer);

    connect(socket_, &QTcpSocket::connected,
            this, &HttpConnection::onSocketConnected);
    connect(socket_, &QTcpSocket::disconnected,
            this, &HttpConnection::onSocketDisconnected);
    connect(socket_, &QTcpSocket::readyRead,
            this, &HttpConnection::onSocketReadyRead);
    connect(socket_, &QTcpSocket::bytesWritten,
            this, &HttpConnection::onSocketBytesWritten);
    connect(socket_, &QTcpSocket::errorOccurred,
            this, &HttpConnection::onSocketError);
}

HttpConnection::~HttpConnection()
{
    // Handlers may reference objects already being torn down
    socket_->disconnect(this);
    operation_.reset();
    socket_->abort();
}

void HttpConnection::open(const QString &host, quint16 port, int timeoutMs, bool keepAlive)
{
    if (state_ == State::Connecting || state_ == State::Connected) {
        qDebug() << "HTTP: open called but state is" << state_;
        return;
    }

    host_ = host;
    port_ = port;
    timeoutMs_ = timeoutMs;
    keepAlive_ = keepAlive;
    reconnecting_ = false;
    reconnectAttempts_ = 0;

    qDebug() << "HTTP: Connecting to" << host_ << ":" << port_
             << (keepAlive_ ? "(keep-alive)" : "");
    connectSocket();
}

QUuid HttpConnection::addStateObserver(StateObserver observer)
{
    const QUuid id = QUuid::createUuid();
    observers_.insert(id, observer);
    if (observer) {
        observer(state_);
    }
    return id;
}

void HttpConnection::removeStateObserver(const QUuid &id)
{
    observers_.remove(id);
}

void HttpConnection::setState(State state)
{
    if (state_ == state) {
        return;
    }
    state_ = state;
    LOG_VERBOSE() << "HTTP: state" << state;
    emit stateChanged(state);

    // Observers may deregister themselves while being notified
    const auto observers = observers_;
    for (const auto &observer : observers) {
        if (observer) {
            observer(state);
        }
    }
}

void HttpConnection::connectSocket()
{
    abortSocket();
    setState(State::Connecting);
    if (timeoutMs_ > 0) {
        connectionTimer_->start(timeoutMs_);
    }
    socket_->connectToHost(host_, port_);
}

void HttpConnection::abortSocket()
{
    if (socket_->state() == QAbstractSocket::UnconnectedState) {
        return;
    }
    terminating_ = true;
    socket_->abort();
    terminating_ = false;
}

// --- Requests ---

void HttpConnection::send(const HttpRequest &request, ResponseHandler handler)
{
    auto operation = std::make_unique<PendingOperation>();
    operation->kind = OperationKind::Send;
    operation->outgoing = request.serialize();
    operation->handler = std::move(handler);
    beginOperation(std::move(operation));
}

void HttpConnection::sendFile(const HttpRequest &request, const QString &filePath,
                              ProgressHandler onBytesSent, ResponseHandler handler)
{
    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        if (handler) {
            handler(TransportResult::failure(TransportError::Kind::Application,
                                             tr("File not found: %1").arg(filePath)));
        }
        return;
    }

    auto file = std::make_unique<QFile>(filePath);
    if (!file->open(QIODevice::ReadOnly)) {
        if (handler) {
            handler(TransportResult::failure(TransportError::Kind::Application,
                                             tr("Could not open file %1: %2")
                                                 .arg(filePath, file->errorString())));
        }
        return;
    }

    HttpRequest fileRequest = request;
    fileRequest.body.reset();
    fileRequest.setHeader(QStringLiteral("Content-Length"), QString::number(file->size()));

    auto operation = std::make_unique<PendingOperation>();
    operation->kind = OperationKind::Upload;
    operation->outgoing = fileRequest.serializeHead();
    operation->uploadFile = std::move(file);
    operation->progress = std::move(onBytesSent);
    operation->handler = std::move(handler);
    beginOperation(std::move(operation));
}

void HttpConnection::downloadFile(const HttpRequest &request, const QString &destinationDir,
                                  const QString &destinationName, ProgressHandler onBytesReceived,
                                  ResponseHandler handler)
{
    if (operation_) {
        if (handler) {
            handler(TransportResult::failure(TransportError::Kind::Application,
                                             tr("Another transfer is already in progress")));
        }
        return;
    }

    QDir dir(destinationDir);
    if (!dir.exists() && !QDir().mkpath(destinationDir)) {
        if (handler) {
            handler(TransportResult::failure(TransportError::Kind::Application,
                                             tr("Could not create directory %1").arg(destinationDir)));
        }
        return;
    }

    const QString path = dir.filePath(destinationName);
    if (QFile::exists(path) && !QFile::remove(path)) {
        if (handler) {
            handler(TransportResult::failure(TransportError::Kind::Application,
                                             tr("Could not replace existing file %1").arg(path)));
        }
        return;
    }

    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (handler) {
            handler(TransportResult::failure(TransportError::Kind::Application,
                                             tr("Could not create file %1: %2")
                                                 .arg(path, file->errorString())));
        }
        return;
    }

    auto operation = std::make_unique<PendingOperation>();
    operation->kind = OperationKind::Download;
    operation->outgoing = request.serialize();
    operation->downloadFile = std::move(file);
    operation->progress = std::move(onBytesReceived);
    operation->handler = std::move(handler);
    beginOperation(std::move(operation));
}

bool HttpConnection::isUploading() const
{
    return operation_ && operation_->kind == OperationKind::Upload;
}

void HttpConnection::cancel()
{
    if (!operation_ || operation_->kind == OperationKind::Send) {
        return;
    }
    LOG_VERBOSE() << "HTTP: cancel requested";
    cancelRequested_ = true;

    // Downloads are otherwise only checked when data arrives
    if (operation_->kind == OperationKind::Download) {
        QMetaObject::invokeMethod(this, &HttpConnection::checkCancellation, Qt::QueuedConnection);
    }
}

void HttpConnection::terminateConnection(bool tryToRestart)
{
    qDebug() << "HTTP: Terminating connection to" << host_
             << (tryToRestart ? "(restart)" : "");

    connectionTimer_->stop();
    reconnectTimer_->stop();
    failOperation(TransportError::Kind::Connection, tr("Connection was terminated"));
    abortSocket();

    if (tryToRestart && !host_.isEmpty()) {
        reconnecting_ = true;
        reconnectAttempts_ = 0;
        setState(State::Lost);
        connectSocket();
    } else {
        reconnecting_ = false;
        setState(State::Disconnected);
    }
}

// --- Operation handling ---

void HttpConnection::beginOperation(std::unique_ptr<PendingOperation> operation)
{
    if (operation_) {
        if (operation->handler) {
            operation->handler(TransportResult::failure(TransportError::Kind::Application,
                                                        tr("Another transfer is already in progress")));
        }
        return;
    }

    cancelRequested_ = false;

    if (state_ == State::Connected) {
        operation_ = std::move(operation);
        startWriting();
        return;
    }

    const bool canReopen = keepAlive_ && !host_.isEmpty() &&
                           state_ != State::Started;
    if (!canReopen) {
        if (operation->handler) {
            operation->handler(TransportResult::failure(TransportError::Kind::Connection,
                                                        tr("Socket is not connected")));
        }
        return;
    }

    LOG_VERBOSE() << "HTTP: Request queued until connection is re-established";
    operation->phase = Phase::WaitingForConnection;
    operation_ = std::move(operation);

    if (state_ != State::Connecting) {
        reconnectTimer_->stop();
        reconnecting_ = true;
        reconnectAttempts_ = 0;
        connectSocket();
    }
}

void HttpConnection::startWriting()
{
    PendingOperation *op = operation_.get();
    op->phase = (op->kind == OperationKind::Upload) ? Phase::Uploading : Phase::AwaitingResponse;
    LOG_VERBOSE() << "HTTP: >>" << op->outgoing.left(op->outgoing.indexOf("\r\n"));
    socket_->write(op->outgoing);
    op->outgoing.clear();
}

void HttpConnection::onSocketBytesWritten(qint64 bytes)
{
    Q_UNUSED(bytes)

    PendingOperation *op = operation_.get();
    if (!op || op->phase != Phase::Uploading || socket_->bytesToWrite() > 0) {
        return;
    }

    if (op->chunkInFlight > 0) {
        const qint64 sent = op->chunkInFlight;
        op->chunkInFlight = 0;
        if (op->progress) {
            op->progress(sent);
        }
        // The progress callback may have cancelled or terminated
        if (operation_.get() != op) {
            return;
        }
    }

    writeNextChunk();
}

void HttpConnection::writeNextChunk()
{
    PendingOperation *op = operation_.get();

    if (cancelRequested_) {
        cancelOperation(tr("Upload was cancelled."));
        return;
    }

    const QByteArray chunk = op->uploadFile->read(UploadChunkSize);
    if (chunk.isEmpty()) {
        if (!op->uploadFile->atEnd()) {
            const QString message = tr("Could not read file %1: %2")
                                        .arg(op->uploadFile->fileName(),
                                             op->uploadFile->errorString());
            failOperation(TransportError::Kind::Application, message);
            terminateConnection(true);
            return;
        }
        op->uploadFile->close();
        op->phase = Phase::AwaitingResponse;
        // The peer may already have answered
        processIncoming(QByteArray());
        return;
    }

    op->chunkInFlight = chunk.size();
    socket_->write(chunk);
}

void HttpConnection::onSocketReadyRead()
{
    const QByteArray data = socket_->readAll();
    if (!operation_ || operation_->phase == Phase::WaitingForConnection) {
        LOG_VERBOSE() << "HTTP: Discarding" << data.size() << "unsolicited bytes";
        return;
    }
    processIncoming(data);
}

void HttpConnection::processIncoming(const QByteArray &data)
{
    PendingOperation *op = operation_.get();
    if (!op) {
        return;
    }

    if (op->kind == OperationKind::Download && cancelRequested_) {
        cancelOperation(tr("Download was cancelled."));
        return;
    }

    if (!op->headersComplete) {
        op->buffer.append(data);
        if (op->phase != Phase::AwaitingResponse) {
            return;
        }

        const int headerEnd = op->buffer.indexOf(HeaderTerminator);
        if (headerEnd < 0) {
            return;
        }

        const QByteArray head = op->buffer.left(headerEnd);
        const QByteArray body = op->buffer.mid(headerEnd + HeaderTerminator.size());
        op->headersComplete = true;
        op->statusCode = parseStatusCode(head);
        op->expectedBodyLength = parseContentLength(head);
        op->streamBodyToFile = op->kind == OperationKind::Download &&
                               op->statusCode >= 200 && op->statusCode < 300;
        op->buffer = head + HeaderTerminator;

        LOG_VERBOSE() << "HTTP: <<" << op->statusCode
                      << "content-length" << op->expectedBodyLength;

        acceptBody(body);
    } else {
        acceptBody(data);
    }

    // acceptBody may have failed the operation
    if (operation_.get() != op) {
        return;
    }

    if (op->expectedBodyLength >= 0 && op->bodyReceived >= op->expectedBodyLength) {
        finishOperation(TransportResult::success(op->buffer));
    }
}

void HttpConnection::acceptBody(const QByteArray &data)
{
    PendingOperation *op = operation_.get();

    QByteArray body = data;
    if (op->expectedBodyLength >= 0) {
        const qint64 remaining = op->expectedBodyLength - op->bodyReceived;
        if (body.size() > remaining) {
            body.truncate(static_cast<int>(qMax<qint64>(0, remaining)));
        }
    }
    if (body.isEmpty()) {
        return;
    }

    op->bodyReceived += body.size();

    if (!op->streamBodyToFile) {
        op->buffer.append(body);
        return;
    }

    if (op->downloadFile->write(body) != body.size()) {
        const QString message = tr("Could not write file %1: %2")
                                    .arg(op->downloadFile->fileName(),
                                         op->downloadFile->errorString());
        failOperation(TransportError::Kind::Application, message);
        terminateConnection(true);
        return;
    }

    if (op->progress) {
        op->progress(body.size());
    }
}

void HttpConnection::checkCancellation()
{
    if (operation_ && operation_->kind == OperationKind::Download && cancelRequested_) {
        cancelOperation(tr("Download was cancelled."));
    }
}

void HttpConnection::cancelOperation(const QString &message)
{
    qDebug() << "HTTP:" << message;

    std::unique_ptr<PendingOperation> op = std::move(operation_);
    cancelRequested_ = false;
    if (op->uploadFile) {
        op->uploadFile->close();
    }
    if (op->downloadFile) {
        op->downloadFile->close();
    }

    // The stream is in an unknown state after an abort
    terminateConnection(true);

    if (op->handler) {
        op->handler(TransportResult::failure(TransportError::Kind::Cancellation, message));
    }
}

void HttpConnection::finishOperation(const TransportResult &result)
{
    std::unique_ptr<PendingOperation> op = std::move(operation_);
    cancelRequested_ = false;
    if (!op) {
        return;
    }
    if (op->uploadFile) {
        op->uploadFile->close();
    }
    if (op->downloadFile) {
        op->downloadFile->close();
    }
    if (op->handler) {
        op->handler(result);
    }
}

void HttpConnection::failOperation(TransportError::Kind kind, const QString &message)
{
    if (!operation_) {
        return;
    }
    qDebug() << "HTTP:" << TransportError::kindName(kind) << message;
    finishOperation(TransportResult::failure(kind, message));
}

qint64 HttpConnection::parseContentLength(const QByteArray &head)
{
    const QList<QByteArray> lines = head.split('\n');
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            continue;
        }
        if (line.left(colon).trimmed().toLower() == "content-length") {
            bool ok = false;
            const qint64 length = line.mid(colon + 1).trimmed().toLongLong(&ok);
            if (ok && length >= 0) {
                return length;
            }
        }
    }
    return -1;
}

int HttpConnection::parseStatusCode(const QByteArray &head)
{
    const int lineEnd = head.indexOf("\r\n");
    const QByteArray statusLine = lineEnd < 0 ? head : head.left(lineEnd);
    const QList<QByteArray> parts = statusLine.split(' ');
    if (parts.size() < 2) {
        return 0;
    }
    return parts.at(1).toInt();
}

// --- Socket events ---

void HttpConnection::onSocketConnected()
{
    connectionTimer_->stop();
    reconnecting_ = false;
    reconnectAttempts_ = 0;
    socket_->setSocketOption(QAbstractSocket::KeepAliveOption, keepAlive_ ? 1 : 0);

    qDebug() << "HTTP: Connected to" << host_ << ":" << port_;
    setState(State::Connected);

    if (operation_ && operation_->phase == Phase::WaitingForConnection &&
        state_ == State::Connected) {
        startWriting();
    }
}

void HttpConnection::onSocketDisconnected()
{
    if (terminating_) {
        return;
    }
    qDebug() << "HTTP: Socket disconnected";
    handleConnectionDropped();
}

void HttpConnection::onSocketError(QAbstractSocket::SocketError socketError)
{
    if (terminating_) {
        return;
    }

    qDebug() << "HTTP: Socket error:" << socketError << socket_->errorString();

    if (state_ == State::Connecting) {
        connectionTimer_->stop();
        handleConnectFailure(socket_->errorString());
    } else if (state_ == State::Connected &&
               socket_->state() == QAbstractSocket::UnconnectedState) {
        handleConnectionDropped();
    }
}

void HttpConnection::onConnectionTimeout()
{
    qDebug() << "HTTP: Connection timeout";
    abortSocket();
    handleConnectFailure(tr("Connection to %1:%2 timed out").arg(host_).arg(port_));
}

void HttpConnection::handleConnectFailure(const QString &message)
{
    if (reconnecting_ && keepAlive_) {
        startReconnect();
        return;
    }

    reconnecting_ = false;
    setState(State::Disconnected);
    failOperation(TransportError::Kind::Connection, message);
    emit connectionError(message);
}

void HttpConnection::handleConnectionDropped()
{
    if (state_ != State::Connected) {
        return;
    }

    if (operation_) {
        PendingOperation *op = operation_.get();
        // Without a declared length the peer closing marks the end of the body
        if (op->phase == Phase::AwaitingResponse && op->headersComplete &&
            op->expectedBodyLength < 0) {
            finishOperation(TransportResult::success(op->buffer));
        } else {
            failOperation(TransportError::Kind::Connection, tr("Connection closed by peer"));
        }
    }

    if (keepAlive_ && !host_.isEmpty()) {
        reconnecting_ = true;
        reconnectAttempts_ = 0;
        setState(State::Lost);
        connectSocket();
    } else {
        setState(State::Disconnected);
    }
}

void HttpConnection::startReconnect()
{
    reconnectAttempts_++;

    if (reconnectAttempts_ > MaxReconnectAttempts) {
        reconnecting_ = false;
        setState(State::Disconnected);
        const QString message = tr("Failed to reconnect after %1 attempts")
                                    .arg(MaxReconnectAttempts);
        failOperation(TransportError::Kind::Connection, message);
        emit connectionError(message);
        return;
    }

    LOG_VERBOSE() << "HTTP: Reconnect attempt" << reconnectAttempts_ << "scheduled";
    setState(State::Lost);
    reconnectTimer_->start(ReconnectIntervalMs);
}

void HttpConnection::onReconnectTimer()
{
    if (state_ != State::Lost) {
        return;
    }
    connectSocket();
}
