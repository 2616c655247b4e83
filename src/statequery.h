// voicebridge/statequery.h
#pragma once

#include "types.h"

namespace voicebridge {

// Normalizes an entity's state into the assistant's on/online/brightness form.
// Never fails, unsupported domains get a best-effort result.
QueryResult queryDevice(const EntitySnapshot &entity);

} // namespace voicebridge
