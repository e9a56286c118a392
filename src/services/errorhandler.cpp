#include "errorhandler.h"

#include <QDebug>

namespace {

QString joinTitleAndDetails(const QString &title, const QString &details)
{
    if (details.isEmpty() || details == title) {
        return title;
    }
    return QStringLiteral("%1: %2").arg(title, details);
}

} // namespace

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    emit statusMessage(joinTitleAndDetails(title, details), timeoutForSeverity(severity));

    if (severity != ErrorSeverity::Critical) {
        return;
    }
    emit alertRaised(title, details.isEmpty() ? title : details);
}

void ErrorHandler::showAlert(const QString &title, const QString &message)
{
    handleError(categoryForAlert(title), ErrorSeverity::Critical, title, message);
}

void ErrorHandler::requestDefaultView()
{
    emit defaultViewRequested();
}

void ErrorHandler::handleConnectionError(const QString &message)
{
    handleError(ErrorCategory::Connection, ErrorSeverity::Critical,
                tr("Connection Error"), message);
}

void ErrorHandler::handleTransportError(const TransportError &error)
{
    const QString title = TransportError::kindName(error.kind);
    switch (error.kind) {
    case TransportError::Kind::Cancellation:
        handleError(ErrorCategory::FileOperation, ErrorSeverity::Info, title, error.message);
        break;
    case TransportError::Kind::Connection:
        handleError(ErrorCategory::Connection, ErrorSeverity::Warning, title, error.message);
        break;
    case TransportError::Kind::Protocol:
        handleError(ErrorCategory::System, ErrorSeverity::Warning, title, error.message);
        break;
    case TransportError::Kind::Application:
        handleError(ErrorCategory::Validation, ErrorSeverity::Warning, title, error.message);
        break;
    }
}

ErrorCategory ErrorHandler::categoryForAlert(const QString &title)
{
    if (title.contains(QLatin1String("Uploading"), Qt::CaseInsensitive)
            || title.contains(QLatin1String("Downloading"), Qt::CaseInsensitive)) {
        return ErrorCategory::FileOperation;
    }
    if (title.contains(QLatin1String("Connection"), Qt::CaseInsensitive)) {
        return ErrorCategory::Connection;
    }
    return ErrorCategory::System;
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    const QString line = QStringLiteral("[%1/%2] %3")
        .arg(categoryToString(category), severityToString(severity),
             joinTitleAndDetails(title, details));

    if (severity == ErrorSeverity::Critical) {
        qCritical().noquote() << line;
    } else if (severity == ErrorSeverity::Warning) {
        qWarning().noquote() << line;
    } else {
        qInfo().noquote() << line;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::FileOperation:
        return QStringLiteral("File");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
