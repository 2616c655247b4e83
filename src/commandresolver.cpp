#include "commandresolver.h"

#include <QJsonValue>
#include <QtGlobal>

#include "entitysnapshot.h"
#include "translatorlog.h"

namespace voicebridge {

namespace {

constexpr double kRawBrightnessMax = 255.0;

bool requestsOn(const QJsonObject &params)
{
    const QJsonValue on = params.value(QStringLiteral("on"));
    return on.isBool() && on.toBool();
}

// Percent 0-100 to registry brightness 0-255.
int scaleFromPercent(double percent)
{
    const double clamped = qBound(0.0, percent, 100.0);
    return qRound(clamped / 100.0 * kRawBrightnessMax);
}

ServiceInvocation invocation(const char *service, QJsonObject args)
{
    ServiceInvocation out;
    out.service = QString::fromLatin1(service);
    out.args = args;
    return out;
}

} // namespace

Command commandFromString(const QString &name)
{
    if (name == QLatin1String(kCommandOnOff))
        return Command::OnOff;
    if (name == QLatin1String(kCommandBrightness))
        return Command::BrightnessAbsolute;
    return Command::Unknown;
}

QString commandToString(Command command)
{
    switch (command) {
    case Command::OnOff:
        return QString::fromLatin1(kCommandOnOff);
    case Command::BrightnessAbsolute:
        return QString::fromLatin1(kCommandBrightness);
    case Command::Unknown:
        break;
    }
    return QString();
}

ServiceInvocation determineService(const QString &entityId,
                                   Command command,
                                   const QJsonObject &params)
{
    const QString domain = domainFromEntityId(entityId);
    const QJsonValue brightness = params.value(QStringLiteral("brightness"));

    QJsonObject args;
    args.insert(QLatin1String(kAttrEntityId), entityId);

    if (domain == QLatin1String(kDomainMediaPlayer) && command == Command::BrightnessAbsolute) {
        args.insert(QStringLiteral("volume"), brightness.toDouble(0.0) / 100.0);
        return invocation(kServiceVolumeSet, args);
    }

    if (domain == QLatin1String(kDomainCover)) {
        if (command == Command::BrightnessAbsolute) {
            args.insert(QStringLiteral("position"), brightness.isUndefined() ? QJsonValue(0) : brightness);
            return invocation(kServiceSetCoverPosition, args);
        }
        if (command == Command::OnOff)
            return invocation(requestsOn(params) ? kServiceOpenCover : kServiceCloseCover, args);
    }

    if (command == Command::BrightnessAbsolute) {
        if (brightness.isDouble()) {
            args.insert(QLatin1String(kAttrBrightness), scaleFromPercent(brightness.toDouble()));
        } else {
            qCWarning(translatorLog) << "Brightness command without numeric brightness for" << entityId;
        }
        return invocation(kServiceTurnOn, args);
    }

    if (command == Command::OnOff && requestsOn(params))
        return invocation(kServiceTurnOn, args);
    return invocation(kServiceTurnOff, args);
}

} // namespace voicebridge
