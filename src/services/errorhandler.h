/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error reporting.
 *
 * This service standardizes how errors are categorized, logged and surfaced
 * to whatever front end is attached, so every subsystem reports the same way.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "ialertsink.h"
#include "transporterror.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Connection,     ///< Node socket and probe errors
    FileOperation,  ///< Upload, download and archive errors
    Validation,     ///< Bad input, unknown projects, configuration errors
    System          ///< Command failures and general application errors
};

/**
 * @brief Severity levels determining how errors are surfaced.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - status message only, short timeout
    Warning,   ///< Warning - status message, longer timeout
    Critical   ///< Critical - status message + alert
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error reporting across the application:
 * - Categorizes errors for appropriate handling
 * - Surfaces errors based on severity (status message vs alert)
 * - Logs errors for debugging
 *
 * It is also the production IAlertSink: terminal command failures from a
 * CommandQueueController arrive through showAlert() and are reported as
 * critical errors, categorized by categoryForAlert().
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(node, &NodeController::connectionAttemptFinished, this, [handler](bool ok) {
 *     if (!ok) {
 *         handler->handleConnectionError(tr("No node answered"));
 *     }
 * });
 * connect(handler, &ErrorHandler::alertRaised,
 *         this, [](const QString &title, const QString &message) {
 *             std::cerr << qPrintable(title) << ": " << qPrintable(message) << "\n";
 *         });
 *
 * CommandQueueController *queue = new CommandQueueController(handler, this);
 * @endcode
 */
class ErrorHandler : public QObject, public IAlertSink
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /**
     * @brief Reports a terminal command failure as a critical error.
     */
    void showAlert(const QString &title, const QString &message) override;

    /**
     * @brief Forwards a navigation request as defaultViewRequested().
     */
    void requestDefaultView() override;
    /// @}

    /// @name Node Error Sources
    /// @{

    /**
     * @brief Handles the loss of the node connection (critical severity).
     * @param message The error message.
     */
    void handleConnectionError(const QString &message);

    /**
     * @brief Handles a transport failure reported by HttpConnection.
     *
     * Cancellations are informational. Other kinds are warnings, since the
     * command queue retries them and alerts on its own once they are final.
     */
    void handleTransportError(const TransportError &error);
    /// @}

    /**
     * @brief Category of a node alert, derived from its title.
     *
     * Upload and download failures are FileOperation, failures mentioning a
     * connection are Connection and everything else is System.
     */
    [[nodiscard]] static ErrorCategory categoryForAlert(const QString &title);

    /**
     * @brief Gets the status message timeout for a severity level.
     * @param severity The error severity.
     * @return Timeout in milliseconds, 0 for no timeout.
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

    /**
     * @brief Converts category to string for logging.
     */
    [[nodiscard]] static QString categoryToString(ErrorCategory category);

    /**
     * @brief Converts severity to string for logging.
     */
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted to display a status message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted for critical errors that must reach the user.
     * @param title Alert title.
     * @param message Alert message.
     */
    void alertRaised(const QString &title, const QString &message);

    /**
     * @brief Emitted when the front end should return to its default view.
     */
    void defaultViewRequested();

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);
};

#endif // ERRORHANDLER_H
