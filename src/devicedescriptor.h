// voicebridge/devicedescriptor.h
#pragma once

#include <optional>

#include "types.h"

namespace voicebridge {

// Converts a registry entity into an assistant device descriptor.
//
// Returns std::nullopt when the entity's domain has no capability entry;
// callers skip such entities. A non-list "aliases" attribute is dropped
// with a warning, the descriptor is still built.
std::optional<DeviceDescriptor> entityToDevice(const EntitySnapshot &entity);

} // namespace voicebridge
