/**
 * @file commandqueuecontroller.h
 * @brief Serial executor of Commands against a single peer.
 *
 * Runs queued commands one at a time, retries transient failures with a
 * fixed back-off and reports terminal failures through an IAlertSink.
 */

#ifndef COMMANDQUEUECONTROLLER_H
#define COMMANDQUEUECONTROLLER_H

#include <QList>
#include <QObject>
#include <QStringList>
#include <QTimer>

#include "command.h"

class IAlertSink;

/**
 * @brief FIFO command queue with prepend and retry support.
 *
 * At most one command executes at a time. Commands run in push order,
 * except that prependCommand() puts a command in front of everything still
 * queued (it never preempts the running command). A command that fails
 * with @c retryable set is held apart from the queue and re-run as the
 * identical instance after retryTimeoutMs(), ahead of every queued and
 * prepended command. Retries stop after
 * maxRetries() and the failure is reported once through the alert sink.
 *
 * Draining only happens while command execution is enabled. Owners turn
 * execution off while their peer is unreachable and back on once it
 * returns; queued commands are kept in the meantime.
 *
 * @par Example usage:
 * @code
 * CommandQueueController *queue = new CommandQueueController(errorHandler, this);
 * queue->setMaxRetries(3);
 * queue->setRetryTimeoutMs(1000);
 * queue->setCommandExecutionEnabled(true);
 *
 * queue->pushCommand(std::make_shared<GetNodeStatus>(controller));
 * @endcode
 */
class CommandQueueController : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultMaxRetries = 3;
    static constexpr int DefaultRetryTimeoutMs = 1000;

    /**
     * @brief Constructs a queue controller.
     * @param alertSink Receiver of terminal failures (not owned, may be null).
     * @param parent Optional parent QObject for memory management.
     */
    explicit CommandQueueController(IAlertSink *alertSink, QObject *parent = nullptr);

    /**
     * @brief Destructor. Pending commands are discarded.
     */
    ~CommandQueueController() override;

    /// @name Retry Policy
    /// @{
    void setMaxRetries(int retries);
    [[nodiscard]] int maxRetries() const { return maxRetries_; }
    void setRetryTimeoutMs(int timeoutMs);
    [[nodiscard]] int retryTimeoutMs() const { return retryTimeoutMs_; }
    /// @}

    /// @name Queue Operations
    /// @{

    /**
     * @brief Appends a command; starts draining if idle.
     */
    void pushCommand(CommandPtr command);

    /**
     * @brief Appends a command unless one with the same name is queued.
     */
    void pushCommandOnce(CommandPtr command);

    /**
     * @brief Inserts a command at the head of the queue.
     *
     * The command runs right after the one currently executing.
     */
    void prependCommand(CommandPtr command);

    /**
     * @brief Returns the number of queued (not running) commands,
     *        including one waiting for its retry.
     */
    [[nodiscard]] int commandInQueueCount() const { return queue_.size() + (retrying_ ? 1 : 0); }

    /**
     * @brief Returns the names of queued commands, head first.
     *
     * A command waiting for its retry is listed first.
     */
    [[nodiscard]] QStringList pendingCommandNames() const;

    /**
     * @brief Removes all queued commands. The running command is unaffected.
     */
    void clearCommandQueue();
    /// @}

    /// @name Execution State
    /// @{

    /**
     * @brief Enables or disables draining.
     *
     * Enabling resumes an idle, non-empty queue.
     */
    void setCommandExecutionEnabled(bool enabled);
    [[nodiscard]] bool commandExecutionEnabled() const { return executionEnabled_; }

    /**
     * @brief Returns true while a command runs or a retry is pending.
     */
    [[nodiscard]] bool isExecutingCommand() const { return executing_; }

    /**
     * @brief Returns true while a command that blocks interaction runs.
     */
    [[nodiscard]] bool isInteractionDisabled() const { return interactionDisabled_; }

    /**
     * @brief Returns the retry count of the command at the head.
     */
    [[nodiscard]] int currentRetryCount() const { return retryCount_; }
    /// @}

signals:
    /**
     * @brief Emitted before a command's execute() is called.
     * @param name Command name.
     */
    void commandStarted(const QString &name);

    /**
     * @brief Emitted when a command leaves the queue for good.
     * @param name Command name.
     * @param success True if it succeeded.
     */
    void commandFinished(const QString &name, bool success);

    /**
     * @brief Emitted when a command is scheduled for another attempt.
     * @param name Command name.
     * @param attempt Retry number, starting at 1.
     */
    void commandRetryScheduled(const QString &name, int attempt);

    /**
     * @brief Emitted when the interaction-disabled flag changes.
     */
    void interactionDisabledChanged(bool disabled);

    /**
     * @brief Emitted when the queue runs out of commands.
     */
    void queueIdle();

private slots:
    void processNextCommand();

private:
    void scheduleDrain();
    [[nodiscard]] bool hasWork() const { return retrying_ || !queue_.isEmpty(); }
    void onCommandCompleted(quint64 token, bool success, bool retryable,
                            const std::optional<CommandError> &error);
    void reportFailure(const std::optional<CommandError> &error);
    void setInteractionDisabled(bool disabled);

    IAlertSink *alertSink_ = nullptr;

    QList<CommandPtr> queue_;
    CommandPtr retrying_;
    CommandPtr current_;
    quint64 executionToken_ = 0;

    bool executing_ = false;
    bool executionEnabled_ = false;
    bool interactionDisabled_ = false;

    int maxRetries_ = DefaultMaxRetries;
    int retryTimeoutMs_ = DefaultRetryTimeoutMs;
    int retryCount_ = 0;
    QTimer *retryTimer_ = nullptr;
};

#endif // COMMANDQUEUECONTROLLER_H
