// voicebridge/types.h
#pragma once

#include <optional>

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <QtGlobal>

namespace voicebridge {

// ============================================================================
// PROTOCOL VOCABULARY
// ============================================================================
inline constexpr char kPrefixTypes[]  = "action.devices.types.";
inline constexpr char kPrefixTraits[] = "action.devices.traits.";

inline constexpr char kCommandOnOff[]      = "action.devices.commands.OnOff";
inline constexpr char kCommandBrightness[] = "action.devices.commands.BrightnessAbsolute";

// ============================================================================
// REGISTRY VOCABULARY
// ============================================================================
inline constexpr char kDomainGroup[]       = "group";
inline constexpr char kDomainSwitch[]      = "switch";
inline constexpr char kDomainFan[]         = "fan";
inline constexpr char kDomainLight[]       = "light";
inline constexpr char kDomainCover[]       = "cover";
inline constexpr char kDomainMediaPlayer[] = "media_player";

inline constexpr char kStateOff[] = "off";

inline constexpr char kAttrEntityId[]          = "entity_id";
inline constexpr char kAttrFriendlyName[]      = "friendly_name";
inline constexpr char kAttrAssistantName[]     = "google_assistant_name";
inline constexpr char kAttrAliases[]           = "aliases";
inline constexpr char kAttrSupportedFeatures[] = "supported_features";
inline constexpr char kAttrBrightness[]        = "brightness";   // 0-255
inline constexpr char kAttrVolumeLevel[]       = "volume_level"; // 0.0-1.0

inline constexpr char kServiceTurnOn[]           = "turn_on";
inline constexpr char kServiceTurnOff[]          = "turn_off";
inline constexpr char kServiceVolumeSet[]        = "volume_set";
inline constexpr char kServiceSetCoverPosition[] = "set_cover_position";
inline constexpr char kServiceOpenCover[]        = "open_cover";
inline constexpr char kServiceCloseCover[]       = "close_cover";

// Feature bits as reported in supported_features.
inline constexpr quint32 kLightSupportBrightness = 0x01;
inline constexpr quint32 kLightSupportColorTemp  = 0x02;
inline constexpr quint32 kLightSupportRgbColor   = 0x10;
inline constexpr quint32 kCoverSupportSetPosition   = 0x04;
inline constexpr quint32 kMediaPlayerSupportVolumeSet = 0x04;

// ============================================================================
// COMMANDS
// ============================================================================
enum class Command : quint8 {
    Unknown            = 0,
    OnOff              = 1,
    BrightnessAbsolute = 2
};

// ============================================================================
// CAPABILITY MAP ENTRIES
// ============================================================================
struct FeatureTrait {
    quint32 flag = 0;   // bit in supported_features
    QString trait;      // unprefixed trait name
};

struct CapabilityEntry {
    QString deviceType;               // unprefixed, e.g. "LIGHT"
    QString baseTrait;                // always exposed
    QList<FeatureTrait> featureTraits; // declared order is the output order
};

// ============================================================================
// TRANSLATOR INPUT / OUTPUT
// ============================================================================

// Registry state of a single entity, valid for the duration of one call.
struct EntitySnapshot {
    QString     entityId;   // "<domain>.<object_id>"
    QString     domain;
    QString     state;
    QJsonObject attributes;
};

// Discovery record handed to the assistant.
struct DeviceDescriptor {
    QString     id;
    QString     type;
    QStringList traits;
    QString     name;                   // null when the entity carries no name
    std::optional<QJsonArray> nicknames;
    bool        willReportState = false;
};

struct QueryResult {
    bool on = false;
    bool online = true;
    int  brightness = 0;                // percent, 0-100
};

// Service call to be executed against the registry by the caller.
struct ServiceInvocation {
    QString     service;
    QJsonObject args;                   // always carries entity_id
};

} // namespace voicebridge
