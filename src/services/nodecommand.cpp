#include "nodecommand.h"

#include <QDebug>
#include <QUrl>

#include "httpconnection.h"
#include "httpresponseparser.h"
#include "nodecontroller.h"
#include "transporterror.h"
#include "utils/logging.h"

NodeCommand::NodeCommand(NodeController *controller, NodeRequest request)
    : controller_(controller)
    , request_(std::move(request))
{
}

void NodeCommand::execute(CommandCompletion completion)
{
    sendRequest(std::move(completion));
}

void NodeCommand::sendRequest(CommandCompletion completion)
{
    HttpConnection *connection = controller_ ? controller_->connection() : nullptr;
    if (!connection) {
        completion(false, true, error(QObject::tr("Connection with RealityCapture is not established.")));
        return;
    }

    const HttpRequest httpRequest = controller_->constructRequest(request_.path, request_.method,
                                                                  request_.body);
    LOG_VERBOSE() << "Node:" << name() << HttpRequest::methodName(request_.method) << request_.path;

    // Keep the command alive until the response arrives
    std::shared_ptr<Command> self = shared_from_this();
    connection->send(httpRequest, [this, self, completion](const TransportResult &result) {
        if (!result.ok()) {
            failWithTransportError(*result.error, completion);
            return;
        }

        const std::optional<HttpResponseParser> response = HttpResponseParser::parse(result.data);
        if (!response) {
            qWarning() << "Node:" << name() << "received an unparsable response";
            if (controller_ && controller_->connection()) {
                controller_->connection()->terminateConnection();
            }
            completion(false, false,
                       error(QObject::tr("An issue was encountered while parsing the response from RCNode. %1")
                                 .arg(QString::fromUtf8(result.data.left(256)))));
            return;
        }

        bool hasExpectedShape = true;
        switch (request_.shape) {
        case NodeRequest::ResponseShape::None:
            break;
        case NodeRequest::ResponseShape::StringList:
            hasExpectedShape = response->bodyToStringList().has_value();
            break;
        case NodeRequest::ResponseShape::Object:
            hasExpectedShape = response->bodyToObject().has_value();
            break;
        case NodeRequest::ResponseShape::ObjectList:
            hasExpectedShape = response->bodyToObjectList().has_value();
            break;
        }

        if (response->statusCode() != request_.acceptStatusCode || !hasExpectedShape) {
            qWarning() << "Node:" << name() << "unexpected response, status" << response->statusCode()
                       << (hasExpectedShape ? "" : "with unexpected body");
            if (controller_ && controller_->connection()) {
                controller_->connection()->terminateConnection();
            }
            const QString message = response->bodyMessage();
            completion(false, false,
                       error(QObject::tr("The response from RCNode was invalid. Error: %1")
                                 .arg(message.isEmpty() ? QStringLiteral("Unknown") : message)));
            return;
        }

        handleResponse(*response, completion);
    });
}

void NodeCommand::handleResponse(const HttpResponseParser &response, CommandCompletion completion)
{
    Q_UNUSED(response)
    completion(true, false, std::nullopt);
}

std::optional<QString> NodeCommand::encodeQueryValue(const QString &value)
{
    if (value.isEmpty() || !value.isValidUtf16()) {
        return std::nullopt;
    }
    return QString::fromLatin1(QUrl::toPercentEncoding(value));
}

CommandError NodeCommand::error(const QString &message) const
{
    return CommandError{request_.errorTitle, message};
}

QString NodeCommand::invalidStructureMessage()
{
    return QObject::tr("The response from RCNode was invalid. The structure of the response "
                       "does not align with the expected API format.");
}

void NodeCommand::failWithTransportError(const TransportError &transportError,
                                         const CommandCompletion &completion)
{
    qWarning() << "Node:" << name() << TransportError::kindName(transportError.kind)
               << transportError.message;

    // Application failures happen before anything is written, the connection stays usable
    HttpConnection *connection = controller_ ? controller_->connection() : nullptr;
    if (connection && transportError.isRetryable()) {
        const HttpConnection::State state = connection->state();
        if (state != HttpConnection::State::Lost && state != HttpConnection::State::Connecting) {
            connection->terminateConnection(true);
        }
    }

    completion(false, transportError.isRetryable(),
               error(QObject::tr("An issue occurred while sending the request, error: %1")
                         .arg(transportError.message)));
}
