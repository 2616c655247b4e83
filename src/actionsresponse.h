// voicebridge/actionsresponse.h
#pragma once

#include <QJsonObject>
#include <QString>

#include "types.h"

namespace voicebridge {

// Wraps a payload into the {requestId, payload} envelope the assistant expects.
QJsonObject makeActionsResponse(const QString &requestId, const QJsonObject &payload);

QJsonObject deviceToJson(const DeviceDescriptor &device);
QJsonObject queryResultToJson(const QueryResult &result);
QJsonObject invocationToJson(const ServiceInvocation &invocation);

} // namespace voicebridge
