#include "devicedescriptor.h"

#include <QJsonValue>

#include "capabilitymap.h"
#include "translatorlog.h"

namespace voicebridge {

namespace {

// Empty or non-string names count as absent; no usable name leaves it null.
QString displayName(const QJsonObject &attributes)
{
    const QString assistantName = attributes.value(QLatin1String(kAttrAssistantName)).toString();
    if (!assistantName.isEmpty())
        return assistantName;
    const QString friendlyName = attributes.value(QLatin1String(kAttrFriendlyName)).toString();
    if (!friendlyName.isEmpty())
        return friendlyName;
    return QString();
}

quint32 supportedFeatures(const QJsonObject &attributes)
{
    const QJsonValue value = attributes.value(QLatin1String(kAttrSupportedFeatures));
    if (!value.isDouble())
        return 0;
    return static_cast<quint32>(value.toInteger());
}

} // namespace

std::optional<DeviceDescriptor> entityToDevice(const EntitySnapshot &entity)
{
    const CapabilityEntry *capability = capabilityFor(entity.domain);
    if (!capability) {
        qCDebug(translatorLog) << "No capability mapping for" << entity.entityId;
        return std::nullopt;
    }

    DeviceDescriptor device;
    device.id = entity.entityId;
    device.type = QString::fromLatin1(kPrefixTypes) + capability->deviceType;
    device.traits.append(QString::fromLatin1(kPrefixTraits) + capability->baseTrait);
    device.name = displayName(entity.attributes);

    const QJsonValue aliases = entity.attributes.value(QLatin1String(kAttrAliases));
    if (aliases.isArray()) {
        device.nicknames = aliases.toArray();
    } else if (!aliases.isUndefined()) {
        qCWarning(translatorLog) << kAttrAliases << "must be a list, ignoring it for" << entity.entityId;
    }

    const quint32 supported = supportedFeatures(entity.attributes);
    for (const FeatureTrait &feature : capability->featureTraits) {
        if ((feature.flag & supported) != 0)
            device.traits.append(QString::fromLatin1(kPrefixTraits) + feature.trait);
    }

    device.willReportState = false;
    return device;
}

} // namespace voicebridge
