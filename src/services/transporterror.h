/**
 * @file transporterror.h
 * @brief Error and result types reported by HttpConnection.
 */

#ifndef TRANSPORTERROR_H
#define TRANSPORTERROR_H

#include <QByteArray>
#include <QString>

#include <optional>

/**
 * @brief Classified transport failure.
 */
struct TransportError
{
    enum class Kind {
        Connection,     ///< Socket open/timeout failures, connection closed or not connected
        Protocol,       ///< Unexpected status code or malformed/unshaped body
        Cancellation,   ///< Caller cancelled an in-flight transfer
        Application     ///< Precondition violations (missing file, busy connection, ...)
    };

    Kind kind = Kind::Connection;
    QString message;

    /// Application failures are local and repeat on every attempt
    [[nodiscard]] bool isRetryable() const { return kind != Kind::Application; }

    [[nodiscard]] static QString kindName(Kind kind)
    {
        switch (kind) {
        case Kind::Connection:
            return QStringLiteral("ConnectionError");
        case Kind::Protocol:
            return QStringLiteral("ProtocolError");
        case Kind::Cancellation:
            return QStringLiteral("CancellationError");
        case Kind::Application:
            return QStringLiteral("ApplicationError");
        }
        return QStringLiteral("UnknownError");
    }
};

/**
 * @brief Outcome of a send, sendFile or downloadFile call.
 *
 * On success @c data holds the raw response bytes for HttpResponseParser.
 */
struct TransportResult
{
    QByteArray data;
    std::optional<TransportError> error;

    [[nodiscard]] bool ok() const { return !error.has_value(); }

    [[nodiscard]] static TransportResult success(const QByteArray &data)
    {
        TransportResult result;
        result.data = data;
        return result;
    }

    [[nodiscard]] static TransportResult failure(TransportError::Kind kind, const QString &message)
    {
        TransportResult result;
        result.error = TransportError{kind, message};
        return result;
    }
};

#endif // TRANSPORTERROR_H
