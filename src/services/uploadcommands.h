/**
 * @file uploadcommands.h
 * @brief Upload of local media files into the opened project.
 */

#ifndef UPLOADCOMMANDS_H
#define UPLOADCOMMANDS_H

#include <QPointer>
#include <QStringList>

#include "command.h"

class NodeController;

/**
 * @brief Merges files into the upload session and starts uploading.
 *
 * Files that no longer exist locally, or that the project already contains,
 * are dropped. Dropping a file that was already part of the session
 * recomputes the session totals and raises an alert. The session is created
 * on first use and cleared once nothing is left to upload.
 *
 * Uploading starts when files remain, unless the user paused the session
 * and @c startIfUserPaused is false. A session paused by the system is
 * always resumed.
 */
class StartMediaUpload : public Command
{
public:
    StartMediaUpload(NodeController *controller, const QStringList &files,
                     bool startIfUserPaused = true);

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("StartMediaUpload"); }

    /**
     * @brief Name a local file is uploaded under: its file name without the
     *        "_tmp." prefix used for temporary copies.
     */
    [[nodiscard]] static QString uploadName(const QString &filePath);

    static constexpr char TemporaryPrefix[] = "_tmp.";

private:
    QPointer<NodeController> controller_;
    QStringList files_;
    bool startIfUserPaused_;
};

/**
 * @brief Uploads the first file of the session and queues itself again.
 *
 * Each uploaded file is registered as an "Add File To Project" task whose
 * follow-up aligns the images. Temporary copies are removed once the node
 * accepted them.
 */
class UploadMedia : public Command
{
public:
    explicit UploadMedia(NodeController *controller);

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("UploadMedia"); }

private:
    QPointer<NodeController> controller_;
};

#endif // UPLOADCOMMANDS_H
