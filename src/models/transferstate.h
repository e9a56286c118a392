/**
 * @file transferstate.h
 * @brief Progress counters shared by long-running media transfers.
 */

#ifndef TRANSFERSTATE_H
#define TRANSFERSTATE_H

#include <QStringList>
#include <QtGlobal>

/**
 * @brief Counters and flags describing one transfer session.
 *
 * lastSampledBytes never exceeds transferredBytes; SpeedSampler clamps it
 * before computing a delta. Speed is only recomputed while not paused.
 */
struct TransferState
{
    bool paused = false;
    bool forcePaused = false;   ///< Paused by the system rather than the user

    int totalItems = 0;
    qint64 totalBytes = 0;
    int transferredItems = 0;
    qint64 transferredBytes = 0;

    qint64 lastSampledBytes = 0;
    double speedBytesPerSecond = 0.0;
};

/**
 * @brief Upload of local media files into the opened project.
 */
struct MediaUploadState : TransferState
{
    QStringList uploadSet;          ///< Local file paths still to upload, in order
    qint64 currentFileOffset = 0;   ///< Bytes of the file in flight already counted
};

#endif // TRANSFERSTATE_H
