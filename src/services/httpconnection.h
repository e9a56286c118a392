/**
 * @file httpconnection.h
 * @brief Keep-alive HTTP/1.1 client implemented directly on a QTcpSocket.
 *
 * Provides request/response exchange, streaming file upload and download
 * with progress reporting and cooperative cancellation, connection state
 * observation and automatic reconnection.
 */

#ifndef HTTPCONNECTION_H
#define HTTPCONNECTION_H

#include <QFile>
#include <QMap>
#include <QObject>
#include <QTcpSocket>
#include <QTimer>
#include <QUuid>

#include <functional>
#include <memory>

#include "httprequest.h"
#include "transporterror.h"

/**
 * @brief Minimal HTTP/1.1 client over a single raw socket.
 *
 * The connection carries one logical operation at a time: a second send,
 * sendFile or downloadFile issued while one is in flight fails with an
 * application error. Results are delivered through the handler passed to
 * each call, on the thread that owns the connection.
 *
 * When the connection is opened with keepAlive, an unexpected drop moves
 * the state to Lost and reconnection is attempted automatically. A request
 * issued while the connection is not connected first reopens it.
 *
 * @par Example usage:
 * @code
 * HttpConnection *conn = new HttpConnection(this);
 * conn->addStateObserver([](HttpConnection::State state) {
 *     qDebug() << "state" << state;
 * });
 * conn->open("192.168.1.20", 8000, 10000, true);
 *
 * HttpRequest request;
 * request.urlPath = "/node/status";
 * conn->send(request, [](const TransportResult &result) {
 *     if (result.ok()) {
 *         auto response = HttpResponseParser::parse(result.data);
 *     }
 * });
 * @endcode
 */
class HttpConnection : public QObject
{
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    /**
     * @brief Lifecycle state of the connection.
     */
    enum class State {
        Started,        ///< Created, never opened
        Connecting,     ///< Socket connection in progress
        Connected,      ///< Ready to exchange data
        Disconnected,   ///< Closed; no automatic recovery
        Lost            ///< Dropped unexpectedly or restarting; recovery in progress
    };
    Q_ENUM(State)

    using StateObserver = std::function<void(State)>;
    using ResponseHandler = std::function<void(const TransportResult &result)>;
    using ProgressHandler = std::function<void(qint64 bytes)>;

    static constexpr int UploadChunkSize = 65536;
    static constexpr int MaxReconnectAttempts = 5;
    static constexpr int ReconnectIntervalMs = 1000;

    /**
     * @brief Constructs an unopened connection.
     * @param parent Optional parent QObject for memory management.
     */
    explicit HttpConnection(QObject *parent = nullptr);

    /**
     * @brief Destructor. Aborts the socket; pending handlers are dropped.
     */
    ~HttpConnection() override;

    /**
     * @brief Opens the socket.
     * @param host Hostname or IP address of the peer.
     * @param port TCP port of the peer.
     * @param timeoutMs Connection establishment timeout in milliseconds.
     * @param keepAlive Enables TCP keep-alive and automatic reconnection.
     *
     * Emits stateChanged(Connected) when ready, or connectionError() and
     * stateChanged(Disconnected) on failure or timeout.
     */
    void open(const QString &host, quint16 port, int timeoutMs, bool keepAlive);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == State::Connected; }
    [[nodiscard]] bool isBusy() const { return operation_ != nullptr; }
    [[nodiscard]] bool isUploading() const;
    [[nodiscard]] QString host() const { return host_; }
    [[nodiscard]] quint16 port() const { return port_; }
    [[nodiscard]] bool keepAlive() const { return keepAlive_; }

    /// @name State Observers
    /// @{

    /**
     * @brief Registers a state observer.
     * @param observer Callback invoked with the current state immediately
     *        and then on every state change.
     * @return Id used to deregister the observer.
     */
    QUuid addStateObserver(StateObserver observer);

    /**
     * @brief Deregisters a state observer.
     * @param id Id returned by addStateObserver().
     */
    void removeStateObserver(const QUuid &id);
    /// @}

    /// @name Requests
    /// @{

    /**
     * @brief Sends a request and collects the full response.
     * @param request The request to serialize and send.
     * @param handler Receives the raw response bytes or an error.
     *
     * The response is complete once Content-Length body bytes have arrived,
     * or when the peer closes the socket if no length was declared.
     */
    void send(const HttpRequest &request, ResponseHandler handler);

    /**
     * @brief Streams a local file as the request body.
     * @param request The request; Content-Length is set from the file size.
     * @param filePath Local file to upload.
     * @param onBytesSent Called with the size of each chunk handed to the socket.
     * @param handler Receives the raw response bytes or an error.
     *
     * A missing file fails before anything is written. cancel() is checked
     * between chunks; cancelling restarts the connection and fails with a
     * cancellation error.
     */
    void sendFile(const HttpRequest &request, const QString &filePath,
                  ProgressHandler onBytesSent, ResponseHandler handler);

    /**
     * @brief Sends a request and streams a successful response body to disk.
     * @param request The request to send.
     * @param destinationDir Directory for the file; created if absent.
     * @param destinationName File name; an existing file is replaced.
     * @param onBytesReceived Called with the size of each body chunk written.
     * @param handler Receives status line and headers, or an error.
     *
     * For a 2xx response the body goes to the file and the returned buffer
     * ends at the blank line. Any other status keeps its body in the
     * returned buffer and writes nothing to the file. On cancellation the
     * partial file is left in place for the caller to remove.
     */
    void downloadFile(const HttpRequest &request, const QString &destinationDir,
                      const QString &destinationName, ProgressHandler onBytesReceived,
                      ResponseHandler handler);

    /**
     * @brief Requests cancellation of the in-flight upload or download.
     *
     * An upload whose body has been sent completely is no longer cancelled;
     * its response is delivered as usual.
     */
    void cancel();

    /**
     * @brief Closes the socket.
     * @param tryToRestart When true, reopens with the original parameters
     *        (state Lost, then Connected or Disconnected).
     *
     * Any in-flight operation fails with a connection error.
     */
    void terminateConnection(bool tryToRestart = false);
    /// @}

signals:
    /**
     * @brief Emitted when the connection state changes.
     * @param state The new state.
     */
    void stateChanged(HttpConnection::State state);

    /**
     * @brief Emitted when opening or reopening the socket fails for good.
     * @param message Human-readable error description.
     */
    void connectionError(const QString &message);

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketReadyRead();
    void onSocketBytesWritten(qint64 bytes);
    void onSocketError(QAbstractSocket::SocketError socketError);
    void onConnectionTimeout();
    void onReconnectTimer();

private:
    enum class OperationKind {
        Send,
        Upload,
        Download
    };

    enum class Phase {
        WaitingForConnection,
        Uploading,
        AwaitingResponse
    };

    struct PendingOperation {
        OperationKind kind = OperationKind::Send;
        Phase phase = Phase::AwaitingResponse;
        QByteArray outgoing;
        std::unique_ptr<QFile> uploadFile;
        qint64 chunkInFlight = 0;
        std::unique_ptr<QFile> downloadFile;
        ProgressHandler progress;
        ResponseHandler handler;
        QByteArray buffer;
        bool headersComplete = false;
        bool streamBodyToFile = false;
        int statusCode = 0;
        qint64 expectedBodyLength = -1;
        qint64 bodyReceived = 0;
    };

    void setState(State state);
    void connectSocket();
    void abortSocket();
    void beginOperation(std::unique_ptr<PendingOperation> operation);
    void startWriting();
    void writeNextChunk();
    void processIncoming(const QByteArray &data);
    void acceptBody(const QByteArray &data);
    void checkCancellation();
    void cancelOperation(const QString &message);
    void finishOperation(const TransportResult &result);
    void failOperation(TransportError::Kind kind, const QString &message);
    void handleConnectFailure(const QString &message);
    void handleConnectionDropped();
    void startReconnect();

    static qint64 parseContentLength(const QByteArray &head);
    static int parseStatusCode(const QByteArray &head);

    QTcpSocket *socket_ = nullptr;
    QTimer *connectionTimer_ = nullptr;
    QTimer *reconnectTimer_ = nullptr;

    // Connection parameters
    QString host_;
    quint16 port_ = 0;
    int timeoutMs_ = 0;
    bool keepAlive_ = false;

    State state_ = State::Started;
    QMap<QUuid, StateObserver> observers_;

    std::unique_ptr<PendingOperation> operation_;
    bool cancelRequested_ = false;
    bool terminating_ = false;

    // Reconnection
    bool reconnecting_ = false;
    int reconnectAttempts_ = 0;
};

#endif // HTTPCONNECTION_H
