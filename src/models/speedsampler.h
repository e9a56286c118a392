/**
 * @file speedsampler.h
 * @brief Periodic transfer speed estimation.
 */

#ifndef SPEEDSAMPLER_H
#define SPEEDSAMPLER_H

#include <QObject>

#include <functional>

struct TransferState;

/**
 * @brief Samples a TransferState every IntervalMs and derives its speed.
 *
 * Each start() begins a new run identified by a generation counter. A tick
 * belonging to an older run ends that chain, so restarting never produces
 * two concurrent samplers. A tick also ends the chain when no transfer is
 * available or the transfer is paused (after reporting zero speed).
 *
 * @par Example usage:
 * @code
 * SpeedSampler *sampler = new SpeedSampler(this);
 * sampler->setStateProvider([this]() -> TransferState * {
 *     return scene_.mediaUpload ? &*scene_.mediaUpload : nullptr;
 * });
 * sampler->start();
 * @endcode
 */
class SpeedSampler : public QObject
{
    Q_OBJECT

public:
    static constexpr int IntervalMs = 500;

    using StateProvider = std::function<TransferState *()>;

    explicit SpeedSampler(QObject *parent = nullptr);
    ~SpeedSampler() override = default;

    /**
     * @brief Sets the callback returning the sampled transfer (or null).
     */
    void setStateProvider(StateProvider provider);

    /**
     * @brief Starts a new sampling run, superseding any previous one.
     *
     * The first sample is taken immediately, so the bytes transferred at
     * start become the baseline of the next interval.
     * @return The id of the new run.
     */
    quint64 start();

    /**
     * @brief Invalidates the current run.
     */
    void stop();

    [[nodiscard]] quint64 currentRun() const { return runId_; }

    /**
     * @brief Performs one sample for the given run.
     * @param runId Run the tick belongs to.
     * @return True if the run continues and another tick was scheduled.
     */
    bool tick(quint64 runId);

signals:
    /**
     * @brief Emitted after each sample.
     * @param bytesPerSecond Current speed, 0 while paused.
     */
    void speedUpdated(double bytesPerSecond);

private:
    void scheduleTick(quint64 runId);

    StateProvider stateProvider_;
    quint64 runId_ = 0;
};

#endif // SPEEDSAMPLER_H
