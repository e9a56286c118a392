/**
 * @file projectcommand.h
 * @brief Node command that depends on whether a project is opened.
 */

#ifndef PROJECTCOMMAND_H
#define PROJECTCOMMAND_H

#include "nodecommand.h"

/**
 * @brief NodeCommand with a project state precondition.
 *
 * When the precondition does not hold, the policy decides what happens:
 * - Skip: the command completes successfully without sending anything.
 * - InjectPrerequisite: the command re-queues itself at the head and puts
 *   an open of the last loaded project (or a close) in front of it. If the
 *   state still does not match after that, it fails without retry. When
 *   there is no project to open, it is skipped.
 *
 * Commands that change the project itself block conflicting interaction
 * while they run.
 */
class ProjectCommand : public NodeCommand
{
public:
    enum class RequiredProjectState {
        None,
        Opened,
        Closed
    };

    enum class MismatchPolicy {
        Skip,
        InjectPrerequisite
    };

    ProjectCommand(NodeController *controller, NodeRequest request,
                   RequiredProjectState requiredState,
                   bool disablesInteraction = false,
                   MismatchPolicy policy = MismatchPolicy::InjectPrerequisite);
    ~ProjectCommand() override = default;

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("ProjectCommand"); }
    [[nodiscard]] bool disablesInteraction() const override { return disablesInteraction_; }

    [[nodiscard]] RequiredProjectState requiredState() const { return requiredState_; }

protected:
    /**
     * @brief Runs once the project state precondition holds.
     *
     * The default implementation sends the request.
     */
    virtual void executeWithProject(CommandCompletion completion);

private:
    [[nodiscard]] bool projectStateMatches() const;

    RequiredProjectState requiredState_;
    bool disablesInteraction_;
    MismatchPolicy policy_;
    bool prerequisiteInjected_ = false;
};

#endif // PROJECTCOMMAND_H
