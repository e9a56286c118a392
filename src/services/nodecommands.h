/**
 * @file nodecommands.h
 * @brief Node-wide queries that do not need an opened project.
 */

#ifndef NODECOMMANDS_H
#define NODECOMMANDS_H

#include "nodecommand.h"

/**
 * @brief Fetches the node's project list ("/node/projects").
 *
 * Replaces the project list and guid map. Each entry must carry "name",
 * "guid" and "timeStamp"; an empty list is shown as the "<none>" entry.
 */
class GetNodeProjects : public NodeCommand
{
public:
    explicit GetNodeProjects(NodeController *controller);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetNodeProjects"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;
};

/**
 * @brief Fetches the node status and its free session count ("/node/status").
 */
class GetNodeStatus : public NodeCommand
{
public:
    explicit GetNodeStatus(NodeController *controller);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetNodeStatus"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;
};

#endif // NODECOMMANDS_H
