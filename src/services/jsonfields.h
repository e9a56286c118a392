/**
 * @file jsonfields.h
 * @brief Typed access to fields of node JSON responses.
 *
 * Each accessor returns std::nullopt when the key is missing or holds a
 * value of another type, so a response can be validated field by field.
 */

#ifndef JSONFIELDS_H
#define JSONFIELDS_H

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <cmath>
#include <optional>

/// Integer field; a number with a fractional part does not qualify
[[nodiscard]] inline std::optional<qint64> jsonInt(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double number = value.toDouble();
    if (std::floor(number) != number) {
        return std::nullopt;
    }
    return static_cast<qint64>(number);
}

[[nodiscard]] inline std::optional<double> jsonDouble(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toDouble();
}

[[nodiscard]] inline std::optional<bool> jsonBool(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (!value.isBool()) {
        return std::nullopt;
    }
    return value.toBool();
}

[[nodiscard]] inline std::optional<QString> jsonString(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

#endif // JSONFIELDS_H
