#include "actionsresponse.h"

#include <QJsonArray>

namespace voicebridge {

QJsonObject makeActionsResponse(const QString &requestId, const QJsonObject &payload)
{
    QJsonObject out;
    out.insert(QStringLiteral("requestId"), requestId);
    out.insert(QStringLiteral("payload"), payload);
    return out;
}

QJsonObject deviceToJson(const DeviceDescriptor &device)
{
    QJsonObject name;
    if (!device.name.isNull())
        name.insert(QStringLiteral("name"), device.name);
    if (device.nicknames.has_value())
        name.insert(QStringLiteral("nicknames"), *device.nicknames);

    QJsonObject out;
    out.insert(QStringLiteral("id"), device.id);
    out.insert(QStringLiteral("type"), device.type);
    out.insert(QStringLiteral("traits"), QJsonArray::fromStringList(device.traits));
    out.insert(QStringLiteral("name"), name);
    out.insert(QStringLiteral("willReportState"), device.willReportState);
    return out;
}

QJsonObject queryResultToJson(const QueryResult &result)
{
    QJsonObject out;
    out.insert(QStringLiteral("on"), result.on);
    out.insert(QStringLiteral("online"), result.online);
    out.insert(QStringLiteral("brightness"), result.brightness);
    return out;
}

QJsonObject invocationToJson(const ServiceInvocation &invocation)
{
    QJsonObject out;
    out.insert(QStringLiteral("service"), invocation.service);
    out.insert(QStringLiteral("data"), invocation.args);
    return out;
}

} // namespace voicebridge
