#include "entitysnapshot.h"

#include <QJsonValue>

namespace voicebridge {

QString domainFromEntityId(const QString &entityId)
{
    const qsizetype dot = entityId.indexOf(QLatin1Char('.'));
    if (dot < 0)
        return entityId;
    return entityId.left(dot);
}

bool entityFromJson(const QJsonObject &obj, EntitySnapshot &out, QString &errorString)
{
    errorString.clear();

    const QString entityId = obj.value(QLatin1String(kAttrEntityId)).toString().trimmed();
    if (entityId.isEmpty()) {
        errorString = QStringLiteral("Entity state has no entity_id.");
        return false;
    }
    const qsizetype dot = entityId.indexOf(QLatin1Char('.'));
    if (dot <= 0 || dot == entityId.size() - 1) {
        errorString = QStringLiteral("Malformed entity_id: %1").arg(entityId);
        return false;
    }

    const QJsonValue attributes = obj.value(QStringLiteral("attributes"));
    if (!attributes.isUndefined() && !attributes.isNull() && !attributes.isObject()) {
        errorString = QStringLiteral("Attributes of %1 must be an object.").arg(entityId);
        return false;
    }

    out.entityId = entityId;
    out.domain = domainFromEntityId(entityId);
    out.state = obj.value(QStringLiteral("state")).toString();
    out.attributes = attributes.toObject();
    return true;
}

} // namespace voicebridge
