/**
 * @file nodecommand.h
 * @brief Base class of commands that issue one request to the node.
 */

#ifndef NODECOMMAND_H
#define NODECOMMAND_H

#include <QByteArray>
#include <QPointer>
#include <QString>

#include <optional>

#include "command.h"
#include "httprequest.h"

class HttpResponseParser;
class NodeController;
struct TransportError;

/**
 * @brief Describes a node request and what counts as a valid answer.
 */
struct NodeRequest
{
    enum class ResponseShape {
        None,         ///< Body is not inspected
        StringList,   ///< Flat JSON array of strings
        Object,       ///< Single JSON object
        ObjectList    ///< JSON array of objects
    };

    QString path;
    HttpRequest::Method method = HttpRequest::Method::Get;
    std::optional<QByteArray> body;
    ResponseShape shape = ResponseShape::None;
    int acceptStatusCode = 200;
    QString errorTitle;
};

/**
 * @brief Sends a NodeRequest and validates the response.
 *
 * A response is valid when its status matches NodeRequest::acceptStatusCode
 * and its body has the expected JSON shape; it is then handed to
 * handleResponse(), which subclasses override to update the scene state.
 *
 * Failures are classified for the queue:
 * - no connection, or a transport error: retryable. A transport error also
 *   restarts the connection unless it is already being recovered.
 * - unparsable response, unexpected status or shape: the connection is
 *   terminated and the failure is not retryable.
 */
class NodeCommand : public Command
{
public:
    NodeCommand(NodeController *controller, NodeRequest request);
    ~NodeCommand() override = default;

    void execute(CommandCompletion completion) override;
    [[nodiscard]] QString name() const override { return QStringLiteral("NodeCommand"); }

    /**
     * @brief Handles a response that passed status and shape validation.
     *
     * The default implementation succeeds.
     */
    virtual void handleResponse(const HttpResponseParser &response, CommandCompletion completion);

    [[nodiscard]] const NodeRequest &request() const { return request_; }

    /**
     * @brief Percent-encodes a value for use in a query string.
     * @return The encoded value, or std::nullopt for an empty value or one
     *         that is not valid UTF-16.
     */
    [[nodiscard]] static std::optional<QString> encodeQueryValue(const QString &value);

protected:
    /**
     * @brief Sends the request without any project state checks.
     */
    void sendRequest(CommandCompletion completion);

    /**
     * @brief Error carrying this request's title.
     */
    [[nodiscard]] CommandError error(const QString &message) const;

    /**
     * @brief Message used when a valid status carries an unexpected body.
     */
    [[nodiscard]] static QString invalidStructureMessage();

    /**
     * @brief Reacts to a transport failure and reports it as retryable.
     */
    void failWithTransportError(const TransportError &transportError,
                                const CommandCompletion &completion);

    QPointer<NodeController> controller_;
    NodeRequest request_;
};

#endif // NODECOMMAND_H
