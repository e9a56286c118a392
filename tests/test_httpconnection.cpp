/**
 * @file test_httpconnection.cpp
 * @brief Unit tests for HttpConnection against a local HTTP server.
 *
 * Tests verify:
 * - Connection state observation
 * - Request/response exchange and framing by Content-Length
 * - Chunked file upload with progress and cancellation
 * - File download for success and error statuses
 * - Precondition failures reported before anything is sent
 */

#include <QtTest/QtTest>
#include <QFile>
#include <QTemporaryDir>

#include "mocks/testhttpserver.h"
#include "services/httpconnection.h"
#include "services/httpresponseparser.h"

class TestHttpConnection : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // State
    void testObserverSeesCurrentStateImmediately();
    void testOpenReachesConnected();
    void testOpenToClosedPortEndsDisconnected();
    void testTerminateWithoutRestartDisconnects();

    // Send
    void testSendReturnsFullResponse();
    void testSendBeforeOpenFails();
    void testSendWhileBusyFails();
    void testSendWaitsForKeepAliveConnection();

    // Upload
    void testUploadSendsWholeFileWithProgress();
    void testUploadMissingFileFailsImmediately();
    void testCancelUploadReportsCancellation();

    // Download
    void testDownloadWritesBodyToFile();
    void testDownloadErrorKeepsBodyInBuffer();
    void testCancelDownloadKeepsPartialFile();

private:
    HttpConnection *openConnection(bool keepAlive = true);
    QString writeFile(const QString &name, int size);

    TestHttpServer *server_ = nullptr;
    QTemporaryDir *tempDir_ = nullptr;
};

void TestHttpConnection::init()
{
    server_ = new TestHttpServer();
    QVERIFY(server_->listen());
    tempDir_ = new QTemporaryDir();
    QVERIFY(tempDir_->isValid());
}

void TestHttpConnection::cleanup()
{
    delete server_;
    server_ = nullptr;
    delete tempDir_;
    tempDir_ = nullptr;
}

HttpConnection *TestHttpConnection::openConnection(bool keepAlive)
{
    auto *connection = new HttpConnection(this);
    connection->open(QStringLiteral("127.0.0.1"), server_->port(), 2000, keepAlive);
    return connection;
}

QString TestHttpConnection::writeFile(const QString &name, int size)
{
    QByteArray content(size, '\0');
    for (int i = 0; i < size; ++i) {
        content[i] = static_cast<char>('a' + (i % 26));
    }
    const QString path = tempDir_->filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write(content);
    }
    return path;
}

// --- State ---

void TestHttpConnection::testObserverSeesCurrentStateImmediately()
{
    HttpConnection connection;
    QList<HttpConnection::State> states;
    connection.addStateObserver([&states](HttpConnection::State state) {
        states.append(state);
    });

    QCOMPARE(states.size(), 1);
    QCOMPARE(states.first(), HttpConnection::State::Started);
}

void TestHttpConnection::testOpenReachesConnected()
{
    HttpConnection *connection = openConnection();
    QList<HttpConnection::State> states;
    connection->addStateObserver([&states](HttpConnection::State state) {
        states.append(state);
    });

    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);
    QVERIFY(states.contains(HttpConnection::State::Connecting));
    QCOMPARE(states.last(), HttpConnection::State::Connected);
    QTRY_COMPARE(server_->connectionCount(), 1);
    delete connection;
}

void TestHttpConnection::testOpenToClosedPortEndsDisconnected()
{
    const quint16 port = server_->port();
    delete server_;
    server_ = nullptr;

    HttpConnection connection;
    connection.open(QStringLiteral("127.0.0.1"), port, 500, false);

    QTRY_COMPARE(connection.state(), HttpConnection::State::Disconnected);
}

void TestHttpConnection::testTerminateWithoutRestartDisconnects()
{
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    connection->terminateConnection();

    QCOMPARE(connection->state(), HttpConnection::State::Disconnected);
    delete connection;
}

// --- Send ---

void TestHttpConnection::testSendReturnsFullResponse()
{
    server_->setHandler([](const TestHttpServer::Request &request) {
        return TestHttpServer::jsonResponse(200, "{\"path\":\"" + request.path + "\"}");
    });
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    HttpRequest request;
    request.urlPath = QStringLiteral("/node/connection");
    request.setHeader(QStringLiteral("Authorization"), QStringLiteral("Bearer token"));

    std::optional<TransportResult> result;
    connection->send(request, [&result](const TransportResult &r) { result = r; });

    QTRY_VERIFY(result.has_value());
    QVERIFY(result->ok());
    const std::optional<HttpResponseParser> response = HttpResponseParser::parse(result->data);
    QVERIFY(response.has_value());
    QCOMPARE(response->statusCode(), 200);
    QCOMPARE(response->body(), QByteArray("{\"path\":\"/node/connection\"}"));

    QCOMPARE(server_->requests().size(), 1);
    QCOMPARE(server_->requests().first().method, QByteArray("GET"));
    QCOMPARE(server_->requests().first().headers.value("authorization"), QByteArray("Bearer token"));
    QVERIFY(!connection->isBusy());
    delete connection;
}

void TestHttpConnection::testSendBeforeOpenFails()
{
    HttpConnection connection;
    HttpRequest request;
    request.urlPath = QStringLiteral("/node/connection");

    std::optional<TransportResult> result;
    connection.send(request, [&result](const TransportResult &r) { result = r; });

    QVERIFY(result.has_value());
    QVERIFY(!result->ok());
    QCOMPARE(result->error->kind, TransportError::Kind::Connection);
}

void TestHttpConnection::testSendWhileBusyFails()
{
    server_->setResponding(false);
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    HttpRequest request;
    request.urlPath = QStringLiteral("/project/list");
    connection->send(request, [](const TransportResult &) {});
    QVERIFY(connection->isBusy());

    std::optional<TransportResult> second;
    connection->send(request, [&second](const TransportResult &r) { second = r; });

    QVERIFY(second.has_value());
    QCOMPARE(second->error->kind, TransportError::Kind::Application);
    delete connection;
}

void TestHttpConnection::testSendWaitsForKeepAliveConnection()
{
    HttpConnection *connection = openConnection(true);
    QCOMPARE(connection->state(), HttpConnection::State::Connecting);

    HttpRequest request;
    request.urlPath = QStringLiteral("/project/list");
    std::optional<TransportResult> result;
    connection->send(request, [&result](const TransportResult &r) { result = r; });

    QTRY_VERIFY(result.has_value());
    QVERIFY(result->ok());
    QCOMPARE(server_->requests().size(), 1);
    delete connection;
}

// --- Upload ---

void TestHttpConnection::testUploadSendsWholeFileWithProgress()
{
    const int size = HttpConnection::UploadChunkSize * 3 + 100;
    const QString path = writeFile(QStringLiteral("image.jpg"), size);
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.urlPath = QStringLiteral("/project/command?name=add&param1=image.jpg");

    qint64 progressTotal = 0;
    int progressCalls = 0;
    std::optional<TransportResult> result;
    connection->sendFile(request, path,
                         [&](qint64 bytes) {
                             progressTotal += bytes;
                             progressCalls++;
                         },
                         [&result](const TransportResult &r) { result = r; });

    QTRY_VERIFY(result.has_value());
    QVERIFY(result->ok());
    QCOMPARE(progressTotal, static_cast<qint64>(size));
    QVERIFY(progressCalls >= 4);

    QCOMPARE(server_->requests().size(), 1);
    const TestHttpServer::Request &received = server_->requests().first();
    QCOMPARE(received.method, QByteArray("POST"));
    QCOMPARE(received.headers.value("content-length"), QByteArray::number(size));
    QCOMPARE(received.body.size(), size);
    QCOMPARE(received.body.left(3), QByteArray("abc"));
    delete connection;
}

void TestHttpConnection::testUploadMissingFileFailsImmediately()
{
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.urlPath = QStringLiteral("/project/command?name=add");

    std::optional<TransportResult> result;
    connection->sendFile(request, tempDir_->filePath(QStringLiteral("missing.jpg")), nullptr,
                         [&result](const TransportResult &r) { result = r; });

    QVERIFY(result.has_value());
    QCOMPARE(result->error->kind, TransportError::Kind::Application);
    QVERIFY(!connection->isBusy());
    QCOMPARE(server_->requests().size(), 0);
    delete connection;
}

void TestHttpConnection::testCancelUploadReportsCancellation()
{
    const QString path = writeFile(QStringLiteral("large.jpg"), HttpConnection::UploadChunkSize * 8);
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    HttpRequest request;
    request.method = HttpRequest::Method::Post;
    request.urlPath = QStringLiteral("/project/command?name=add&param1=large.jpg");

    qint64 sent = 0;
    std::optional<TransportResult> result;
    connection->sendFile(request, path,
                         [connection, &sent](qint64 bytes) {
                             sent += bytes;
                             connection->cancel();
                         },
                         [&result](const TransportResult &r) { result = r; });

    QTRY_VERIFY(result.has_value());
    QCOMPARE(result->error->kind, TransportError::Kind::Cancellation);
    QVERIFY(!connection->isBusy());
    QVERIFY(sent > 0);
    QVERIFY(sent < HttpConnection::UploadChunkSize * 8);

    // Reported progress matches what reached the peer after the request head
    HttpRequest sentRequest = request;
    sentRequest.setHeader(QStringLiteral("Content-Length"),
                          QString::number(HttpConnection::UploadChunkSize * 8));
    const qint64 headSize = sentRequest.serializeHead().size();
    QTRY_COMPARE(server_->bytesReceived(), headSize + sent);

    // The connection restarts after a cancelled transfer
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);
    QCOMPARE(server_->requests().size(), 0);
    delete connection;
}

// --- Download ---

void TestHttpConnection::testDownloadWritesBodyToFile()
{
    const QByteArray payload(HttpConnection::UploadChunkSize + 10, 'z');
    server_->setHandler([payload](const TestHttpServer::Request &) {
        return TestHttpServer::response(200, payload,
                                        "Content-Type: application/octet-stream\r\n");
    });
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    HttpRequest request;
    request.urlPath = QStringLiteral("/project/download?name=model.zip&folder=output");

    qint64 progressTotal = 0;
    std::optional<TransportResult> result;
    const QString dir = tempDir_->filePath(QStringLiteral("exports"));
    connection->downloadFile(request, dir, QStringLiteral("model.zip"),
                             [&progressTotal](qint64 bytes) { progressTotal += bytes; },
                             [&result](const TransportResult &r) { result = r; });

    QTRY_VERIFY(result.has_value());
    QVERIFY(result->ok());
    QCOMPARE(progressTotal, static_cast<qint64>(payload.size()));

    const std::optional<HttpResponseParser> response = HttpResponseParser::parse(result->data);
    QVERIFY(response.has_value());
    QCOMPARE(response->statusCode(), 200);
    QVERIFY(response->body().isEmpty());

    QFile file(QDir(dir).filePath(QStringLiteral("model.zip")));
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), payload);
    delete connection;
}

void TestHttpConnection::testDownloadErrorKeepsBodyInBuffer()
{
    server_->setHandler([](const TestHttpServer::Request &) {
        return TestHttpServer::jsonResponse(404, "{\"code\":404,\"message\":\"not found\"}");
    });
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    HttpRequest request;
    request.urlPath = QStringLiteral("/project/download?name=missing.zip&folder=output");

    std::optional<TransportResult> result;
    connection->downloadFile(request, tempDir_->path(), QStringLiteral("missing.zip"), nullptr,
                             [&result](const TransportResult &r) { result = r; });

    QTRY_VERIFY(result.has_value());
    QVERIFY(result->ok());
    const std::optional<HttpResponseParser> response = HttpResponseParser::parse(result->data);
    QVERIFY(response.has_value());
    QCOMPARE(response->statusCode(), 404);
    QCOMPARE(response->body(), QByteArray("{\"code\":404,\"message\":\"not found\"}"));

    QCOMPARE(QFileInfo(tempDir_->filePath(QStringLiteral("missing.zip"))).size(), 0);
    delete connection;
}

void TestHttpConnection::testCancelDownloadKeepsPartialFile()
{
    // Announces more than it sends so the transfer stays open
    server_->setHandler([](const TestHttpServer::Request &) {
        return QByteArray("HTTP/1.1 200 OK\r\nContent-Length: 100000\r\n\r\n") + QByteArray(1000, 'p');
    });
    HttpConnection *connection = openConnection();
    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);

    HttpRequest request;
    request.urlPath = QStringLiteral("/project/download?name=model.zip&folder=output");

    qint64 received = 0;
    std::optional<TransportResult> result;
    const QString dir = tempDir_->filePath(QStringLiteral("exports"));
    connection->downloadFile(request, dir, QStringLiteral("model.zip"),
                             [connection, &received](qint64 bytes) {
                                 received += bytes;
                                 connection->cancel();
                             },
                             [&result](const TransportResult &r) { result = r; });

    QTRY_VERIFY(result.has_value());
    QVERIFY(!result->ok());
    QCOMPARE(result->error->kind, TransportError::Kind::Cancellation);
    QVERIFY(!connection->isBusy());

    // Removing the partial file is up to the caller
    QFile file(QDir(dir).filePath(QStringLiteral("model.zip")));
    QVERIFY(file.exists());
    QVERIFY(received > 0);
    QCOMPARE(file.size(), received);

    QTRY_COMPARE(connection->state(), HttpConnection::State::Connected);
    delete connection;
}

QTEST_MAIN(TestHttpConnection)
#include "test_httpconnection.moc"
