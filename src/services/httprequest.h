/**
 * @file httprequest.h
 * @brief Request description sent over an HttpConnection.
 */

#ifndef HTTPREQUEST_H
#define HTTPREQUEST_H

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>

#include <optional>

/**
 * @brief A minimal HTTP/1.1 request.
 *
 * Headers keep their insertion order so the serialized request is
 * deterministic. Setting a header that already exists replaces its value.
 */
struct HttpRequest
{
    enum class Method {
        Get,
        Post
    };

    QString urlPath;
    Method method = Method::Get;
    QList<QPair<QString, QString>> headers;
    std::optional<QByteArray> body;

    /**
     * @brief Sets or replaces a header value.
     * @param name Header name (case-sensitive).
     * @param value Header value.
     */
    void setHeader(const QString &name, const QString &value);

    /**
     * @brief Returns the value of a header.
     * @param name Header name (case-sensitive).
     * @return The value, or a null string if not present.
     */
    [[nodiscard]] QString header(const QString &name) const;

    /**
     * @brief Serializes the request line and header block.
     *
     * Produces "METHOD path HTTP/1.1\r\n", one "Name: value\r\n" line per
     * header and the terminating "\r\n". The body is not included.
     */
    [[nodiscard]] QByteArray serializeHead() const;

    /**
     * @brief Serializes the full request including the optional body.
     */
    [[nodiscard]] QByteArray serialize() const;

    [[nodiscard]] static QString methodName(Method method);
};

#endif // HTTPREQUEST_H
