#include "nodesettings.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

#include "utils/logging.h"

namespace {

int positiveOr(const QVariant &value, int fallback)
{
    bool ok = false;
    const int result = value.toInt(&ok);
    return (ok && result > 0) ? result : fallback;
}

} // namespace

void NodeSettings::load()
{
    QSettings settings;
    load(settings);
}

void NodeSettings::load(QSettings &settings)
{
    addresses = settings.value("node/addresses").toStringList();
    port = positiveOr(settings.value("node/port", DefaultPort), DefaultPort);
    authToken = settings.value("node/authToken").toString();
    connectTimeoutMs = positiveOr(settings.value("node/connectTimeoutMs", DefaultConnectTimeoutMs),
                                  DefaultConnectTimeoutMs);
    probeTimeoutMs = positiveOr(settings.value("node/probeTimeoutMs", DefaultProbeTimeoutMs),
                                DefaultProbeTimeoutMs);

    // Zero retries is a valid policy
    bool ok = false;
    retries = settings.value("queue/retries", DefaultRetries).toInt(&ok);
    if (!ok || retries < 0) {
        retries = DefaultRetries;
    }
    retryTimeoutMs = positiveOr(settings.value("queue/retryTimeoutMs", DefaultRetryTimeoutMs),
                                DefaultRetryTimeoutMs);

    foregroundIntervalMs = positiveOr(settings.value("poll/foregroundIntervalMs",
                                                     DefaultForegroundIntervalMs),
                                      DefaultForegroundIntervalMs);
    backgroundIntervalMs = positiveOr(settings.value("poll/backgroundIntervalMs",
                                                     DefaultBackgroundIntervalMs),
                                      DefaultBackgroundIntervalMs);

    exportDirectory = settings.value("models/exportDirectory", defaultExportDirectory()).toString();

    LOG_VERBOSE() << "Settings: loaded" << addresses.size() << "node addresses, port" << port;
}

void NodeSettings::save() const
{
    QSettings settings;
    save(settings);
}

void NodeSettings::save(QSettings &settings) const
{
    settings.setValue("node/addresses", addresses);
    settings.setValue("node/port", port);
    settings.setValue("node/authToken", authToken);
    settings.setValue("node/connectTimeoutMs", connectTimeoutMs);
    settings.setValue("node/probeTimeoutMs", probeTimeoutMs);
    settings.setValue("queue/retries", retries);
    settings.setValue("queue/retryTimeoutMs", retryTimeoutMs);
    settings.setValue("poll/foregroundIntervalMs", foregroundIntervalMs);
    settings.setValue("poll/backgroundIntervalMs", backgroundIntervalMs);
    settings.setValue("models/exportDirectory", exportDirectory);
}

QString NodeSettings::defaultExportDirectory()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(base).filePath("Exported Models");
}
