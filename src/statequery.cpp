#include "statequery.h"

#include <optional>

#include <QJsonValue>
#include <QtGlobal>

namespace voicebridge {

namespace {

constexpr double kRawBrightnessMax = 255.0;

std::optional<double> numericAttribute(const QJsonObject &attributes, const char *key)
{
    const QJsonValue value = attributes.value(QLatin1String(key));
    if (!value.isDouble())
        return std::nullopt;
    return value.toDouble();
}

// Registry brightness 0-255 to percent, truncated.
int scaleToPercent(double raw)
{
    const double clamped = qBound(0.0, raw, kRawBrightnessMax);
    return static_cast<int>(100.0 * clamped / kRawBrightnessMax);
}

} // namespace

QueryResult queryDevice(const EntitySnapshot &entity)
{
    QueryResult result;
    result.on = entity.state != QLatin1String(kStateOff);
    const double defaultBrightness = result.on ? kRawBrightnessMax : 0.0;

    std::optional<double> brightness;
    const QJsonValue brightnessValue = entity.attributes.value(QLatin1String(kAttrBrightness));
    if (brightnessValue.isUndefined())
        brightness = defaultBrightness;
    else if (brightnessValue.isDouble())
        brightness = brightnessValue.toDouble();

    if (entity.domain == QLatin1String(kDomainMediaPlayer)) {
        const double level = numericAttribute(entity.attributes, kAttrVolumeLevel)
                                 .value_or(result.on ? 1.0 : 0.0);
        brightness = qRound(qMin(1.0, level) * kRawBrightnessMax);
    }

    // Explicit null or a non-numeric reading.
    if (!brightness.has_value())
        brightness = defaultBrightness;

    result.brightness = scaleToPercent(*brightness);
    result.online = true;
    return result;
}

} // namespace voicebridge
