#include "httprequest.h"

void HttpRequest::setHeader(const QString &name, const QString &value)
{
    for (auto &entry : headers) {
        if (entry.first == name) {
            entry.second = value;
            return;
        }
    }
    headers.append(qMakePair(name, value));
}

QString HttpRequest::header(const QString &name) const
{
    for (const auto &entry : headers) {
        if (entry.first == name) {
            return entry.second;
        }
    }
    return QString();
}

QByteArray HttpRequest::serializeHead() const
{
    QByteArray head;
    head.append(methodName(method).toLatin1());
    head.append(' ');
    head.append(urlPath.toUtf8());
    head.append(" HTTP/1.1\r\n");
    for (const auto &entry : headers) {
        head.append(entry.first.toUtf8());
        head.append(": ");
        head.append(entry.second.toUtf8());
        head.append("\r\n");
    }
    head.append("\r\n");
    return head;
}

QByteArray HttpRequest::serialize() const
{
    QByteArray data = serializeHead();
    if (body) {
        data.append(*body);
    }
    return data;
}

QString HttpRequest::methodName(Method method)
{
    switch (method) {
    case Method::Get:
        return QStringLiteral("GET");
    case Method::Post:
        return QStringLiteral("POST");
    }
    return QStringLiteral("GET");
}
