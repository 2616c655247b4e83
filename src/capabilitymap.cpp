#include "capabilitymap.h"

#include <utility>

#include <QHash>

namespace voicebridge {

namespace {

CapabilityEntry entry(const char *deviceType,
                      const char *baseTrait,
                      QList<FeatureTrait> featureTraits = {})
{
    CapabilityEntry out;
    out.deviceType = QString::fromLatin1(deviceType);
    out.baseTrait = QString::fromLatin1(baseTrait);
    out.featureTraits = std::move(featureTraits);
    return out;
}

FeatureTrait feature(quint32 flag, const char *trait)
{
    FeatureTrait out;
    out.flag = flag;
    out.trait = QString::fromLatin1(trait);
    return out;
}

QHash<QString, CapabilityEntry> buildCapabilityMap()
{
    QHash<QString, CapabilityEntry> map;
    map.insert(QString::fromLatin1(kDomainGroup), entry("SCENE", "ActivateScene"));
    map.insert(QString::fromLatin1(kDomainSwitch), entry("SWITCH", "OnOff"));
    map.insert(QString::fromLatin1(kDomainFan), entry("SWITCH", "OnOff"));
    map.insert(QString::fromLatin1(kDomainLight),
               entry("LIGHT", "OnOff", {
                   feature(kLightSupportBrightness, "Brightness"),
                   feature(kLightSupportRgbColor, "ColorSpectrum"),
                   feature(kLightSupportColorTemp, "ColorTemperature"),
               }));
    map.insert(QString::fromLatin1(kDomainCover),
               entry("LIGHT", "OnOff", {
                   feature(kCoverSupportSetPosition, "Brightness"),
               }));
    map.insert(QString::fromLatin1(kDomainMediaPlayer),
               entry("LIGHT", "OnOff", {
                   feature(kMediaPlayerSupportVolumeSet, "Brightness"),
               }));
    return map;
}

const QHash<QString, CapabilityEntry> &capabilityMap()
{
    static const QHash<QString, CapabilityEntry> map = buildCapabilityMap();
    return map;
}

} // namespace

const CapabilityEntry *capabilityFor(const QString &domain)
{
    const QHash<QString, CapabilityEntry> &map = capabilityMap();
    const auto it = map.constFind(domain);
    if (it == map.constEnd())
        return nullptr;
    return &it.value();
}

QStringList supportedDomains()
{
    QStringList domains = capabilityMap().keys();
    domains.sort();
    return domains;
}

} // namespace voicebridge
