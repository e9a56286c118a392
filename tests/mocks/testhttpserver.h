/**
 * @file testhttpserver.h
 * @brief Local HTTP/1.1 server answering with scripted responses.
 *
 * Accepts any number of connections on 127.0.0.1. Each complete request
 * (headers plus Content-Length body bytes) is recorded and passed to the
 * handler, whose return value is written back verbatim. Without a handler
 * every request gets "200 OK" with an empty JSON object.
 */

#ifndef TESTHTTPSERVER_H
#define TESTHTTPSERVER_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QMap>
#include <QObject>
#include <QPair>
#include <QPointer>
#include <QTcpServer>

#include <functional>

class QTcpSocket;

class TestHttpServer : public QObject
{
    Q_OBJECT

public:
    struct Request {
        QByteArray method;
        QByteArray path;
        QMap<QByteArray, QByteArray> headers;   ///< Keys lower-cased
        QByteArray body;
    };

    using Handler = std::function<QByteArray(const Request &request)>;

    explicit TestHttpServer(QObject *parent = nullptr);
    ~TestHttpServer() override;

    bool listen();
    [[nodiscard]] quint16 port() const { return server_->serverPort(); }

    void setHandler(Handler handler) { handler_ = std::move(handler); }

    /// When false, complete requests are recorded and held unanswered
    void setResponding(bool responding) { responding_ = responding; }

    /// Answers the requests held while not responding
    void answerHeld();
    [[nodiscard]] int heldCount() const { return held_.size(); }

    /// Closes the client socket after each response
    void setCloseAfterResponse(bool close) { closeAfterResponse_ = close; }

    [[nodiscard]] const QList<Request> &requests() const { return requests_; }
    [[nodiscard]] int connectionCount() const { return connectionCount_; }
    [[nodiscard]] qint64 bytesReceived() const { return bytesReceived_; }

    /// Drops every client connection
    void disconnectClients();

    [[nodiscard]] static QByteArray response(int status, const QByteArray &body = QByteArray(),
                                             const QByteArray &extraHeaders = QByteArray());
    [[nodiscard]] static QByteArray jsonResponse(int status, const QByteArray &json,
                                                 const QByteArray &extraHeaders = QByteArray());

signals:
    void requestReceived(const QByteArray &path);

private slots:
    void onNewConnection();
    void onReadyRead();

private:
    bool processBuffer(QTcpSocket *socket);
    void reply(QTcpSocket *socket, const Request &request);

    QTcpServer *server_ = nullptr;
    QHash<QTcpSocket *, QByteArray> buffers_;
    Handler handler_;
    QList<Request> requests_;
    QList<QPair<QPointer<QTcpSocket>, Request>> held_;
    bool responding_ = true;
    bool closeAfterResponse_ = false;
    int connectionCount_ = 0;
    qint64 bytesReceived_ = 0;
};

#endif // TESTHTTPSERVER_H
