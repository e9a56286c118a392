/**
 * @file projectcommands.h
 * @brief Commands managing and synchronizing the opened project.
 */

#ifndef PROJECTCOMMANDS_H
#define PROJECTCOMMANDS_H

#include <QStringList>

#include "projectcommand.h"

/// @name Synchronization
/// @{

/**
 * @brief Polls the opened project's status ("/project/status").
 *
 * When the node's change counter moves while no upload runs and no task is
 * pending, the data folder listing and the project information export are
 * refreshed once and the new counter is adopted.
 */
class GetProjectStatus : public ProjectCommand
{
public:
    explicit GetProjectStatus(NodeController *controller);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectStatus"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;
};

/**
 * @brief Polls pending remote tasks ("/project/tasks?taskIDs=...").
 *
 * Finished tasks queue their follow-up step; failed tasks are cleared on
 * the node and reported. Both leave the task table.
 */
class GetProjectTasks : public ProjectCommand
{
public:
    GetProjectTasks(NodeController *controller, const QStringList &taskIds);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectTasks"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;

protected:
    void executeWithProject(CommandCompletion completion) override;
};

/**
 * @brief Clears finished task records on the node ("/project/cleartasks").
 */
class GetProjectClearTasks : public ProjectCommand
{
public:
    GetProjectClearTasks(NodeController *controller, const QStringList &taskIds);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectClearTasks"); }
};

/**
 * @brief Lists a project folder ("/project/list?folder=data|output").
 *
 * The data folder replaces the known project files; the output folder is
 * scanned for exported models ready to download.
 */
class GetProjectList : public ProjectCommand
{
public:
    enum class Folder {
        Data,
        Output
    };

    GetProjectList(NodeController *controller, Folder folder = Folder::Data);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectList"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;

    [[nodiscard]] Folder folder() const { return folder_; }

protected:
    void executeWithProject(CommandCompletion completion) override;

private:
    Folder folder_;
};
/// @}

/// @name Management
/// @{

class GetProjectClose : public ProjectCommand
{
public:
    explicit GetProjectClose(NodeController *controller);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectClose"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;
};

/**
 * @brief Creates a project and names it by saving it right away.
 *
 * A name that cannot be encoded is replaced by "cr_fly_<unix time>".
 */
class GetProjectCreate : public ProjectCommand
{
public:
    GetProjectCreate(NodeController *controller, const QString &projectName);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectCreate"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;

private:
    QString projectName_;
};

/**
 * @brief Opens a project by guid.
 *
 * Closes a different loaded project first; opening the loaded project again
 * does nothing.
 */
class GetProjectOpen : public ProjectCommand
{
public:
    GetProjectOpen(NodeController *controller, const QString &projectGuid);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectOpen"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;

    [[nodiscard]] QString projectGuid() const { return projectGuid_; }

protected:
    void executeWithProject(CommandCompletion completion) override;

private:
    QString projectGuid_;
};

class GetProjectSave : public ProjectCommand
{
public:
    GetProjectSave(NodeController *controller, const QString &projectName);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectSave"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;

protected:
    void executeWithProject(CommandCompletion completion) override;

private:
    QString encodedName_;
};

/**
 * @brief Deletes a project by guid, closing the loaded project first.
 */
class GetProjectDelete : public ProjectCommand
{
public:
    GetProjectDelete(NodeController *controller, const QString &projectGuid);

    [[nodiscard]] QString name() const override { return QStringLiteral("GetProjectDelete"); }
    void handleResponse(const HttpResponseParser &response, CommandCompletion completion) override;

protected:
    void executeWithProject(CommandCompletion completion) override;

private:
    QString projectGuid_;
};
/// @}

#endif // PROJECTCOMMANDS_H
