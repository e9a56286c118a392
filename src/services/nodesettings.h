/**
 * @file nodesettings.h
 * @brief Persisted configuration of the node client.
 */

#ifndef NODESETTINGS_H
#define NODESETTINGS_H

#include <QString>
#include <QStringList>

class QSettings;

/**
 * @brief Connection, queue and polling settings.
 *
 * Values are stored in QSettings under the "node/", "queue/", "poll/" and
 * "models/" groups. Missing keys fall back to the defaults below; command
 * line options are applied on top of the loaded values by main().
 *
 * @par Example usage:
 * @code
 * NodeSettings settings;
 * settings.load();
 * settings.port = 8001;
 * settings.save();
 * @endcode
 */
struct NodeSettings
{
    static constexpr int DefaultPort = 8000;
    static constexpr int DefaultConnectTimeoutMs = 10000;
    static constexpr int DefaultProbeTimeoutMs = 2000;
    static constexpr int DefaultRetries = 3;
    static constexpr int DefaultRetryTimeoutMs = 1000;
    static constexpr int DefaultForegroundIntervalMs = 1000;
    static constexpr int DefaultBackgroundIntervalMs = 5000;

    QStringList addresses;
    int port = DefaultPort;
    QString authToken;
    int connectTimeoutMs = DefaultConnectTimeoutMs;
    int probeTimeoutMs = DefaultProbeTimeoutMs;

    int retries = DefaultRetries;
    int retryTimeoutMs = DefaultRetryTimeoutMs;

    int foregroundIntervalMs = DefaultForegroundIntervalMs;
    int backgroundIntervalMs = DefaultBackgroundIntervalMs;

    QString exportDirectory = defaultExportDirectory();

    /// @name Persistence
    /// @{
    void load();
    void load(QSettings &settings);
    void save() const;
    void save(QSettings &settings) const;
    /// @}

    /**
     * @brief "<AppDataLocation>/Exported Models".
     */
    [[nodiscard]] static QString defaultExportDirectory();
};

#endif // NODESETTINGS_H
