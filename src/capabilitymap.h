// voicebridge/capabilitymap.h
#pragma once

#include <QString>
#include <QStringList>

#include "types.h"

namespace voicebridge {

// Returns the capability entry for an entity domain, or nullptr when the
// domain cannot be exposed to the assistant. The table is immutable and
// safe to read from any thread.
const CapabilityEntry *capabilityFor(const QString &domain);

// Sorted list of every domain the map knows about.
QStringList supportedDomains();

} // namespace voicebridge
