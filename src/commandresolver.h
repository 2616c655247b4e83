// voicebridge/commandresolver.h
#pragma once

#include <QJsonObject>
#include <QString>

#include "types.h"

namespace voicebridge {

// Maps a protocol command name to Command; unrecognized names yield Command::Unknown.
Command commandFromString(const QString &name);
QString commandToString(Command command);

// Resolves an assistant command into the registry service call that carries it out.
//
// The domain is taken from the entity id prefix. Media player and cover
// brightness commands are redirected to volume and position services, cover
// on/off becomes open/close. Anything that is not an explicit "on": true
// request or a brightness command resolves to turn_off. The result's args
// always carry entity_id.
ServiceInvocation determineService(const QString &entityId,
                                   Command command,
                                   const QJsonObject &params);

} // namespace voicebridge
