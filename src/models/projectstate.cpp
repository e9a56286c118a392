#include "projectstate.h"

QString ProjectUpdate::describe() const
{
    switch (kind) {
    case Kind::FetchInputList:
        return QStringLiteral("Fetching project input list...");
    case Kind::FetchOutputList:
        return QStringLiteral("Fetching project output list...");
    case Kind::FetchDataFromExports:
        return QStringLiteral("Fetching data from template exports...");
    case Kind::DownloadModel:
        return QString("Downloading and loading %1...").arg(modelTypeName(model));
    }
    return QString();
}

bool ProjectInfo::hasPendingTask(const QStringList &taskNames) const
{
    for (const WaitingTask &task : waitingOnTask) {
        if (taskNames.contains(task.status.taskName)) {
            return true;
        }
    }
    return false;
}

void SceneState::resetProjectList()
{
    projectList.clear();
    projectList.insert(QString::fromLatin1(NoProjectName), std::numeric_limits<int>::max());
    projectGuids.clear();
}

std::optional<QString> SceneState::projectNameForGuid(const QString &guid) const
{
    for (auto it = projectGuids.cbegin(); it != projectGuids.cend(); ++it) {
        if (it.value() == guid) {
            return it.key();
        }
    }
    return std::nullopt;
}
