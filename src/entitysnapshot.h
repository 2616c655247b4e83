// voicebridge/entitysnapshot.h
#pragma once

#include <QJsonObject>
#include <QString>

#include "types.h"

namespace voicebridge {

// Prefix of an entity id up to the first '.'; the whole id when it has none.
QString domainFromEntityId(const QString &entityId);

// Reads a registry state object {"entity_id", "state", "attributes"}.
bool entityFromJson(const QJsonObject &obj, EntitySnapshot &out, QString &errorString);

} // namespace voicebridge
