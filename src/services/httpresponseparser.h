/**
 * @file httpresponseparser.h
 * @brief Decoder for raw HTTP/1.1 response buffers.
 *
 * Splits a raw response into status code, header map and body, and offers
 * helpers that decode the body as one of the three JSON shapes the node
 * API returns.
 */

#ifndef HTTPRESPONSEPARSER_H
#define HTTPRESPONSEPARSER_H

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief Parsed HTTP response.
 *
 * Instances are only produced by parse(). Parsing has no side effects.
 *
 * @par Example usage:
 * @code
 * auto response = HttpResponseParser::parse(rawBytes);
 * if (response && response->statusCode() == 200) {
 *     if (auto status = response->bodyToObject()) {
 *         qDebug() << status->value("status").toString();
 *     }
 * }
 * @endcode
 */
class HttpResponseParser
{
public:
    /**
     * @brief Parses a raw response buffer.
     * @param data Status line, header block, blank line and optional body.
     * @return The parsed response, or std::nullopt if the buffer is empty,
     *         has no header terminator, or the status line is malformed.
     *
     * Header lines without a ": " separator are skipped. Keys are kept
     * exactly as received; a repeated key keeps the last value.
     */
    [[nodiscard]] static std::optional<HttpResponseParser> parse(const QByteArray &data);

    [[nodiscard]] int statusCode() const { return statusCode_; }
    [[nodiscard]] const QMap<QString, QString> &headers() const { return headers_; }
    [[nodiscard]] const QByteArray &body() const { return body_; }

    /**
     * @brief Returns a header value.
     * @param name Header name (case-sensitive).
     * @return The value, or std::nullopt if absent.
     */
    [[nodiscard]] std::optional<QString> header(const QString &name) const;

    /// @name JSON Shape Helpers
    /// @{

    /// Body as a flat list of strings ("1D")
    [[nodiscard]] std::optional<QStringList> bodyToStringList() const;

    /// Body as a single key/value object ("2D")
    [[nodiscard]] std::optional<QJsonObject> bodyToObject() const;

    /// Body as a list of key/value objects ("3D")
    [[nodiscard]] std::optional<QList<QJsonObject>> bodyToObjectList() const;

    /**
     * @brief Returns the "message" field of a 2D body, if any.
     *
     * Used when surfacing errors reported by the peer.
     */
    [[nodiscard]] QString bodyMessage() const;
    /// @}

    /// @name Static Decoders
    /// @{
    [[nodiscard]] static std::optional<QStringList> parseToStringList(const QByteArray &data);
    [[nodiscard]] static std::optional<QJsonObject> parseToObject(const QByteArray &data);
    [[nodiscard]] static std::optional<QList<QJsonObject>> parseToObjectList(const QByteArray &data);
    /// @}

private:
    HttpResponseParser() = default;

    int statusCode_ = 0;
    QMap<QString, QString> headers_;
    QByteArray body_;
};

#endif // HTTPRESPONSEPARSER_H
