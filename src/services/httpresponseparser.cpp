#include "httpresponseparser.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace {

const QByteArray HeaderTerminator("\r\n\r\n");
const QByteArray LineSeparator("\r\n");
const QByteArray HeaderSeparator(": ");

std::optional<QJsonDocument> parseJson(const QByteArray &data)
{
    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        return std::nullopt;
    }
    return doc;
}

} // namespace

std::optional<HttpResponseParser> HttpResponseParser::parse(const QByteArray &data)
{
    if (data.isEmpty()) {
        return std::nullopt;
    }

    const int headerEnd = data.indexOf(HeaderTerminator);
    if (headerEnd < 0) {
        return std::nullopt;
    }

    const QByteArray head = data.left(headerEnd);
    const QList<QByteArray> lines = head.split('\n');
    if (lines.isEmpty()) {
        return std::nullopt;
    }

    // Status line: PROTOCOL STATUS-CODE [reason]
    QByteArray statusLine = lines.first();
    if (statusLine.endsWith('\r')) {
        statusLine.chop(1);
    }
    const QList<QByteArray> statusParts = statusLine.split(' ');
    if (statusParts.size() < 2 || statusParts.at(0).isEmpty()) {
        return std::nullopt;
    }

    bool ok = false;
    const int status = statusParts.at(1).toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }

    HttpResponseParser response;
    response.statusCode_ = status;
    response.body_ = data.mid(headerEnd + HeaderTerminator.size());

    for (int i = 1; i < lines.size(); ++i) {
        QByteArray line = lines.at(i);
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        const int sep = line.indexOf(HeaderSeparator);
        if (sep <= 0) {
            continue;
        }
        response.headers_.insert(QString::fromUtf8(line.left(sep)),
                                 QString::fromUtf8(line.mid(sep + HeaderSeparator.size())));
    }

    return response;
}

std::optional<QString> HttpResponseParser::header(const QString &name) const
{
    auto it = headers_.constFind(name);
    if (it == headers_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

std::optional<QStringList> HttpResponseParser::bodyToStringList() const
{
    return parseToStringList(body_);
}

std::optional<QJsonObject> HttpResponseParser::bodyToObject() const
{
    return parseToObject(body_);
}

std::optional<QList<QJsonObject>> HttpResponseParser::bodyToObjectList() const
{
    return parseToObjectList(body_);
}

QString HttpResponseParser::bodyMessage() const
{
    auto object = bodyToObject();
    if (!object) {
        return QString();
    }
    const QJsonValue message = object->value(QStringLiteral("message"));
    return message.isString() ? message.toString() : QString();
}

std::optional<QStringList> HttpResponseParser::parseToStringList(const QByteArray &data)
{
    auto doc = parseJson(data);
    if (!doc || !doc->isArray()) {
        return std::nullopt;
    }

    QStringList result;
    const QJsonArray array = doc->array();
    for (const QJsonValue &value : array) {
        if (!value.isString()) {
            return std::nullopt;
        }
        result.append(value.toString());
    }
    return result;
}

std::optional<QJsonObject> HttpResponseParser::parseToObject(const QByteArray &data)
{
    auto doc = parseJson(data);
    if (!doc || !doc->isObject()) {
        return std::nullopt;
    }
    return doc->object();
}

std::optional<QList<QJsonObject>> HttpResponseParser::parseToObjectList(const QByteArray &data)
{
    auto doc = parseJson(data);
    if (!doc || !doc->isArray()) {
        return std::nullopt;
    }

    QList<QJsonObject> result;
    const QJsonArray array = doc->array();
    for (const QJsonValue &value : array) {
        if (!value.isObject()) {
            return std::nullopt;
        }
        result.append(value.toObject());
    }
    return result;
}
