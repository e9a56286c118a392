#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>

#include <iostream>

#include "models/modeltype.h"
#include "services/commandqueuecontroller.h"
#include "services/errorhandler.h"
#include "services/nodecontroller.h"
#include "services/nodesettings.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("crnode");
    app.setApplicationVersion(CRNODE_VERSION);
    app.setOrganizationName("crnode");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Command client for RealityCapture reconstruction nodes");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption addressOption(
        "address", "Candidate node address (repeatable).", "host");
    QCommandLineOption portOption(
        "port", "Node TCP port.", "port");
    QCommandLineOption tokenOption(
        "token", "Node authorization token.", "token");
    QCommandLineOption exportDirOption(
        "export-dir", "Directory exported models are unpacked into.", "dir");
    QCommandLineOption projectOption(
        "project", "Open the project, or create it if the node does not know it.", "name");
    QCommandLineOption uploadOption(
        "upload", "Media file to upload into the project (repeatable).", "file");
    QCommandLineOption calculateOption(
        "calculate", "Model to calculate: alignment, preview, normal or colorized.", "model");
    parser.addOptions({verboseOption, addressOption, portOption, tokenOption, exportDirOption,
                       projectOption, uploadOption, calculateOption});

    parser.process(app);

    // Set verbose logging flag
    crnode::verboseLogging = parser.isSet(verboseOption);

    if (crnode::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    NodeSettings settings;
    settings.load();
    if (parser.isSet(addressOption)) {
        settings.addresses = parser.values(addressOption);
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const int port = parser.value(portOption).toInt(&ok);
        if (!ok || port <= 0 || port > 65535) {
            std::cerr << "Invalid port: " << qPrintable(parser.value(portOption)) << "\n";
            return 1;
        }
        settings.port = port;
    }
    if (parser.isSet(tokenOption)) {
        settings.authToken = parser.value(tokenOption);
    }
    if (parser.isSet(exportDirOption)) {
        settings.exportDirectory = parser.value(exportDirOption);
    }

    std::optional<ModelType> calculate;
    if (parser.isSet(calculateOption)) {
        calculate = modelTypeFromString(parser.value(calculateOption));
        if (!calculate) {
            std::cerr << "Unknown model: " << qPrintable(parser.value(calculateOption)) << "\n";
            return 1;
        }
    }

    QStringList uploads;
    for (const QString &file : parser.values(uploadOption)) {
        uploads.append(QFileInfo(file).absoluteFilePath());
    }

    if (settings.addresses.isEmpty()) {
        std::cerr << "No node address given; use --address or set node/addresses.\n";
        return 1;
    }

    ErrorHandler errorHandler;
    QObject::connect(&errorHandler, &ErrorHandler::alertRaised,
                     [](const QString &title, const QString &message) {
        std::cerr << qPrintable(title) << ": " << qPrintable(message) << "\n";
    });
    QObject::connect(&errorHandler, &ErrorHandler::statusMessage, [](const QString &message) {
        LOG_VERBOSE() << "Status:" << message;
    });

    NodeController node(&errorHandler);
    node.applySettings(settings);

    const QString projectName = parser.value(projectOption);
    bool projectRequested = false;
    bool projectStarted = false;
    bool wasConnected = false;

    QObject::connect(&node, &NodeController::connectionAttemptFinished, &app,
                     [&](bool success) {
        if (!success) {
            errorHandler.handleConnectionError(
                QObject::tr("No node answered at %1").arg(settings.addresses.join(", ")));
            app.exit(1);
            return;
        }
        qInfo() << "Node: connected to" << node.connection()->host();
        QObject::connect(node.connection(), &HttpConnection::connectionError, &app,
                         [&errorHandler](const QString &message) {
            errorHandler.handleTransportError({TransportError::Kind::Connection, message});
        });
        node.manageProject(ProjectAction::refresh());
    });

    QObject::connect(node.queue(), &CommandQueueController::commandFinished, &app,
                     [&](const QString &name, bool success) {
        if (name != QLatin1String("GetNodeProjects") || projectRequested || projectName.isEmpty()) {
            return;
        }
        if (!success) {
            app.exit(1);
            return;
        }
        projectRequested = true;
        node.manageProject(ProjectAction::changeTo(projectName));
    });

    QObject::connect(&node, &NodeController::projectLoaded, &app, [&](const QString &name) {
        qInfo() << "Node: project" << name << "is open";
        if (projectStarted) {
            return;
        }
        projectStarted = true;
        if (!uploads.isEmpty()) {
            node.uploadMedia(uploads);
        }
        if (calculate) {
            node.refreshModel(*calculate);
        }
    });

    QObject::connect(&node, &NodeController::projectReadyToUpload, &app, [](const QString &name) {
        qInfo() << "Node: project" << name << "accepts uploads";
    });

    QObject::connect(&node, &NodeController::modelSaved, &app,
                     [](const QString &modelName, const QString &path) {
        std::cout << qPrintable(modelName) << ": " << qPrintable(path) << std::endl;
    });

    QObject::connect(&node, &NodeController::connectionStateChanged, &app,
                     [&](HttpConnection::State state) {
        if (state == HttpConnection::State::Connected) {
            wasConnected = true;
        } else if (state == HttpConnection::State::Disconnected && wasConnected) {
            errorHandler.handleConnectionError(QObject::tr("Connection with the node was closed."));
            app.exit(1);
        }
    });

    node.startConnectionTo(settings.addresses, settings.authToken);

    return app.exec();
}
