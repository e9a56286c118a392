/**
 * @file ialertsink.h
 * @brief Boundary through which unrecoverable failures reach the user.
 */

#ifndef IALERTSINK_H
#define IALERTSINK_H

#include <QString>

/**
 * @brief Receiver of titled alerts for terminal, non-retryable failures
 *        and of navigation requests.
 *
 * The core only reports through this interface; it never uses it to drive
 * control flow. ErrorHandler is the production implementation and tests
 * inject a recording mock.
 */
class IAlertSink
{
public:
    virtual ~IAlertSink() = default;

    /**
     * @brief Presents an alert.
     * @param title Short alert title.
     * @param message Human-readable details.
     */
    virtual void showAlert(const QString &title, const QString &message) = 0;

    /**
     * @brief Asks the front end to leave views whose state has gone away.
     *
     * Called when the opened project is unloaded. A front end without
     * views may ignore it.
     */
    virtual void requestDefaultView() = 0;
};

#endif // IALERTSINK_H
