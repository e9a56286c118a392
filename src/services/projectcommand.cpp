#include "projectcommand.h"

#include <QDebug>

#include "nodecontroller.h"
#include "projectcommands.h"
#include "utils/logging.h"

ProjectCommand::ProjectCommand(NodeController *controller, NodeRequest request,
                               RequiredProjectState requiredState, bool disablesInteraction,
                               MismatchPolicy policy)
    : NodeCommand(controller, std::move(request))
    , requiredState_(requiredState)
    , disablesInteraction_(disablesInteraction)
    , policy_(policy)
{
}

void ProjectCommand::execute(CommandCompletion completion)
{
    if (!controller_ || projectStateMatches()) {
        executeWithProject(std::move(completion));
        return;
    }

    if (policy_ == MismatchPolicy::Skip) {
        LOG_VERBOSE() << "Node:" << name() << "skipped, project state does not match";
        completion(true, false, std::nullopt);
        return;
    }

    const bool wantOpened = requiredState_ == RequiredProjectState::Opened;

    if (prerequisiteInjected_) {
        qWarning() << "Node:" << name() << "project state still does not match after"
                   << (wantOpened ? "opening" : "closing") << "the project";
        completion(false, false,
                   error(wantOpened ? QObject::tr("No project is opened on RCNode.")
                                    : QObject::tr("A project is still opened on RCNode.")));
        return;
    }

    CommandPtr prerequisite;
    if (wantOpened) {
        const SceneState &scene = controller_->scene();
        const QString guid = scene.projectGuids.value(scene.lastProjectName);
        if (guid.isEmpty()) {
            LOG_VERBOSE() << "Node:" << name() << "skipped, no project to open";
            completion(true, false, std::nullopt);
            return;
        }
        prerequisite = std::make_shared<GetProjectOpen>(controller_.data(), guid);
    } else {
        prerequisite = std::make_shared<GetProjectClose>(controller_.data());
    }

    LOG_VERBOSE() << "Node:" << name() << "requeued behind" << prerequisite->name();
    prerequisiteInjected_ = true;
    controller_->prependCommand(shared_from_this());
    controller_->prependCommand(prerequisite);
    completion(true, false, std::nullopt);
}

void ProjectCommand::executeWithProject(CommandCompletion completion)
{
    sendRequest(std::move(completion));
}

bool ProjectCommand::projectStateMatches() const
{
    const bool loaded = controller_->scene().openedProject.loaded;
    switch (requiredState_) {
    case RequiredProjectState::None:
        return true;
    case RequiredProjectState::Opened:
        return loaded;
    case RequiredProjectState::Closed:
        return !loaded;
    }
    return true;
}
