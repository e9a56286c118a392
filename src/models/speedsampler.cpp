#include "speedsampler.h"

#include <QTimer>

#include "transferstate.h"
#include "utils/logging.h"

SpeedSampler::SpeedSampler(QObject *parent)
    : QObject(parent)
{
}

void SpeedSampler::setStateProvider(StateProvider provider)
{
    stateProvider_ = std::move(provider);
}

quint64 SpeedSampler::start()
{
    const quint64 runId = ++runId_;
    LOG_VERBOSE() << "Speed: starting run" << runId;
    tick(runId);
    return runId;
}

void SpeedSampler::stop()
{
    ++runId_;
}

bool SpeedSampler::tick(quint64 runId)
{
    if (runId != runId_) {
        return false;
    }

    TransferState *state = stateProvider_ ? stateProvider_() : nullptr;
    if (!state) {
        return false;
    }

    if (state->paused) {
        state->speedBytesPerSecond = 0.0;
        emit speedUpdated(0.0);
        return false;
    }

    if (state->lastSampledBytes > state->transferredBytes) {
        state->lastSampledBytes = state->transferredBytes;
    }

    const qint64 delta = state->transferredBytes - state->lastSampledBytes;
    state->speedBytesPerSecond = static_cast<double>(delta) * (1000.0 / IntervalMs);
    state->lastSampledBytes = state->transferredBytes;
    emit speedUpdated(state->speedBytesPerSecond);

    scheduleTick(runId);
    return true;
}

void SpeedSampler::scheduleTick(quint64 runId)
{
    QTimer::singleShot(IntervalMs, this, [this, runId]() { tick(runId); });
}
