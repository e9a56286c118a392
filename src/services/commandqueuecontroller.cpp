#include "commandqueuecontroller.h"

#include <QDebug>
#include <QPointer>

#include "ialertsink.h"
#include "utils/logging.h"

CommandQueueController::CommandQueueController(IAlertSink *alertSink, QObject *parent)
    : QObject(parent)
    , alertSink_(alertSink)
    , retryTimer_(new QTimer(this))
{
    retryTimer_->setSingleShot(true);
    connect(retryTimer_, &QTimer::timeout,
            this, &CommandQueueController::processNextCommand);
}

CommandQueueController::~CommandQueueController() = default;

void CommandQueueController::setMaxRetries(int retries)
{
    maxRetries_ = qMax(0, retries);
}

void CommandQueueController::setRetryTimeoutMs(int timeoutMs)
{
    retryTimeoutMs_ = qMax(0, timeoutMs);
}

void CommandQueueController::pushCommand(CommandPtr command)
{
    if (!command) {
        return;
    }
    LOG_VERBOSE() << "Queue: push" << command->name();
    queue_.append(std::move(command));
    scheduleDrain();
}

void CommandQueueController::pushCommandOnce(CommandPtr command)
{
    if (!command) {
        return;
    }
    const QString name = command->name();
    if (retrying_ && retrying_->name() == name) {
        LOG_VERBOSE() << "Queue:" << name << "already waiting for a retry";
        return;
    }
    for (const auto &queued : queue_) {
        if (queued->name() == name) {
            LOG_VERBOSE() << "Queue:" << name << "already queued";
            return;
        }
    }
    pushCommand(std::move(command));
}

void CommandQueueController::prependCommand(CommandPtr command)
{
    if (!command) {
        return;
    }
    LOG_VERBOSE() << "Queue: prepend" << command->name();
    queue_.prepend(std::move(command));
    scheduleDrain();
}

QStringList CommandQueueController::pendingCommandNames() const
{
    QStringList names;
    names.reserve(commandInQueueCount());
    if (retrying_) {
        names.append(retrying_->name());
    }
    for (const auto &command : queue_) {
        names.append(command->name());
    }
    return names;
}

void CommandQueueController::clearCommandQueue()
{
    LOG_VERBOSE() << "Queue: clearing" << commandInQueueCount() << "commands";
    queue_.clear();
    retrying_.reset();
    if (retryTimer_->isActive()) {
        retryTimer_->stop();
        retryCount_ = 0;
        executing_ = false;
    }
}

void CommandQueueController::setCommandExecutionEnabled(bool enabled)
{
    if (executionEnabled_ == enabled) {
        return;
    }
    LOG_VERBOSE() << "Queue: execution" << (enabled ? "enabled" : "disabled");
    executionEnabled_ = enabled;
    if (enabled) {
        scheduleDrain();
    }
}

void CommandQueueController::scheduleDrain()
{
    if (executing_ || !hasWork()) {
        return;
    }
    executing_ = true;
    QTimer::singleShot(0, this, &CommandQueueController::processNextCommand);
}

void CommandQueueController::processNextCommand()
{
    if (current_ || retryTimer_->isActive()) {
        return;
    }

    if (!hasWork() || !executionEnabled_) {
        const bool wasExecuting = executing_;
        executing_ = false;
        if (wasExecuting && !hasWork()) {
            emit queueIdle();
        }
        return;
    }

    executing_ = true;
    if (retrying_) {
        current_ = std::move(retrying_);
        retrying_.reset();
    } else {
        current_ = queue_.takeFirst();
    }
    const quint64 token = ++executionToken_;
    const QString name = current_->name();

    if (current_->disablesInteraction()) {
        setInteractionDisabled(true);
    }

    LOG_VERBOSE() << "Queue: executing" << name;
    emit commandStarted(name);

    // Completion is handled on the next event loop turn so that the command
    // is never released while its own code is still on the stack.
    QPointer<CommandQueueController> self(this);
    CommandPtr command = current_;
    command->execute([self, token](bool success, bool retryable,
                                   const std::optional<CommandError> &error) {
        if (!self) {
            return;
        }
        QMetaObject::invokeMethod(self.data(), [self, token, success, retryable, error]() {
            if (self) {
                self->onCommandCompleted(token, success, retryable, error);
            }
        }, Qt::QueuedConnection);
    });
}

void CommandQueueController::onCommandCompleted(quint64 token, bool success, bool retryable,
                                                const std::optional<CommandError> &error)
{
    if (!current_ || token != executionToken_) {
        qWarning() << "Queue: ignoring repeated completion of a finished command";
        return;
    }

    CommandPtr command = std::move(current_);
    current_.reset();
    const QString name = command->name();

    if (command->disablesInteraction()) {
        setInteractionDisabled(false);
    }

    if (success) {
        retryCount_ = 0;
        LOG_VERBOSE() << "Queue:" << name << "succeeded";
        emit commandFinished(name, true);
        processNextCommand();
        return;
    }

    if (!executionEnabled_ && retryable) {
        // Peer went away mid-command; keep it for when execution resumes
        LOG_VERBOSE() << "Queue:" << name << "failed while execution is disabled, keeping it";
        retrying_ = std::move(command);
        executing_ = false;
        return;
    }

    retryCount_++;
    if (!retryable || retryCount_ > maxRetries_) {
        qWarning() << "Queue:" << name << "failed"
                   << (retryable ? "after retries were exhausted" : "(not retryable)");
        retryCount_ = 0;
        reportFailure(error);
        emit commandFinished(name, false);
        processNextCommand();
        return;
    }

    LOG_VERBOSE() << "Queue:" << name << "retry" << retryCount_ << "of" << maxRetries_
                  << "in" << retryTimeoutMs_ << "ms";
    retrying_ = std::move(command);
    emit commandRetryScheduled(name, retryCount_);
    retryTimer_->start(retryTimeoutMs_);
}

void CommandQueueController::reportFailure(const std::optional<CommandError> &error)
{
    const QString title = error ? error->title : tr("Unexpected Error Occurred");
    const QString message = error
        ? error->message
        : tr("An error occurred during execution due to an undefined error message!");

    if (alertSink_) {
        alertSink_->showAlert(title, message);
    } else {
        qWarning().noquote() << "Queue:" << title << "-" << message;
    }
}

void CommandQueueController::setInteractionDisabled(bool disabled)
{
    if (interactionDisabled_ != disabled) {
        interactionDisabled_ = disabled;
        emit interactionDisabledChanged(disabled);
    }
}
