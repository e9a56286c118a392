#include "nodecommands.h"

#include <QDebug>

#include <limits>

#include "httpresponseparser.h"
#include "jsonfields.h"
#include "nodecontroller.h"

namespace {

NodeRequest nodeRequest(const QString &path, NodeRequest::ResponseShape shape,
                        const QString &errorTitle)
{
    NodeRequest request;
    request.path = path;
    request.shape = shape;
    request.acceptStatusCode = 200;
    request.errorTitle = errorTitle;
    return request;
}

} // namespace

GetNodeProjects::GetNodeProjects(NodeController *controller)
    : NodeCommand(controller, nodeRequest(QStringLiteral("/node/projects"),
                                          NodeRequest::ResponseShape::ObjectList,
                                          QObject::tr("Error Getting RCNode Project List")))
{
}

void GetNodeProjects::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    QMap<QString, qint64> projectList;
    QMap<QString, QString> projectGuids;

    const QList<QJsonObject> projects = response.bodyToObjectList().value_or(QList<QJsonObject>());
    for (const QJsonObject &project : projects) {
        const std::optional<QString> name = jsonString(project, "name");
        const std::optional<QString> guid = jsonString(project, "guid");
        const std::optional<qint64> timeStamp = jsonInt(project, "timeStamp");
        if (!name || !guid || !timeStamp) {
            completion(false, false, error(invalidStructureMessage()));
            return;
        }
        projectList.insert(*name, *timeStamp);
        projectGuids.insert(*name, *guid);
    }

    if (projectList.isEmpty()) {
        projectList.insert(QString::fromLatin1(NoProjectName), std::numeric_limits<int>::max());
    }

    if (controller_) {
        controller_->scene().projectList = projectList;
        controller_->scene().projectGuids = projectGuids;
    }
    completion(true, false, std::nullopt);
}

GetNodeStatus::GetNodeStatus(NodeController *controller)
    : NodeCommand(controller, nodeRequest(QStringLiteral("/node/status"),
                                          NodeRequest::ResponseShape::Object,
                                          QObject::tr("Error Getting RCNode Status")))
{
}

void GetNodeStatus::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    const QJsonObject object = response.bodyToObject().value_or(QJsonObject());
    const std::optional<QString> status = jsonString(object, "status");
    const std::optional<qint64> activeSessions = jsonInt(object, "activeSessions");
    const std::optional<qint64> maxSessions = jsonInt(object, "maxSessions");
    if (!status || !activeSessions || !maxSessions) {
        completion(false, false, error(invalidStructureMessage()));
        return;
    }

    if (controller_) {
        SceneState &scene = controller_->scene();
        if (scene.nodeStatus != *status) {
            qDebug() << "Node: status" << *status;
            scene.nodeStatus = *status;
        }
        scene.availableSessions = static_cast<int>(*maxSessions - *activeSessions);
    }
    completion(true, false, std::nullopt);
}
