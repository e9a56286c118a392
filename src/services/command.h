/**
 * @file command.h
 * @brief Unit-of-work abstraction executed by CommandQueueController.
 */

#ifndef COMMAND_H
#define COMMAND_H

#include <QString>

#include <functional>
#include <memory>
#include <optional>

/**
 * @brief User-facing description of a failed command.
 */
struct CommandError
{
    QString title;
    QString message;
};

/**
 * @brief Completion callback of Command::execute().
 *
 * @c success reports the outcome. A failure with @c retryable set is
 * eligible for automatic re-execution by the queue; otherwise the error is
 * surfaced immediately.
 */
using CommandCompletion = std::function<void(bool success, bool retryable,
                                             const std::optional<CommandError> &error)>;

/**
 * @brief Polymorphic unit of work.
 *
 * execute() must eventually invoke its completion exactly once. Commands
 * are held by shared ownership so that the queue can re-run the identical
 * instance on retry, and a command can re-queue itself behind a
 * prerequisite it discovered.
 */
class Command : public std::enable_shared_from_this<Command>
{
public:
    virtual ~Command() = default;

    /**
     * @brief Runs the command.
     * @param completion Invoked once with the outcome.
     */
    virtual void execute(CommandCompletion completion) = 0;

    /**
     * @brief Type name used for logging and de-duplication.
     */
    [[nodiscard]] virtual QString name() const = 0;

    /**
     * @brief Whether conflicting user interaction must be blocked while
     *        this command runs.
     */
    [[nodiscard]] virtual bool disablesInteraction() const { return false; }
};

using CommandPtr = std::shared_ptr<Command>;

#endif // COMMAND_H
