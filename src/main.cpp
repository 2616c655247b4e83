#include <cstdio>
#include <iostream>
#include <optional>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QLoggingCategory>
#include <QStringList>

#include "actionsresponse.h"
#include "commandresolver.h"
#include "devicedescriptor.h"
#include "entitysnapshot.h"
#include "statequery.h"
#include "translatorlog.h"

namespace {

namespace vb = voicebridge;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInput = 2;

bool readInput(const QString &path, QByteArray &data, QString &errorString)
{
    QFile file;
    bool opened = false;
    if (path.isEmpty() || path == QStringLiteral("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        errorString = QStringLiteral("cannot open %1: %2")
                          .arg(path.isEmpty() ? QStringLiteral("stdin") : path, file.errorString());
        return false;
    }
    data = file.readAll();
    return true;
}

bool parseEntities(const QByteArray &data, QList<vb::EntitySnapshot> &entities, QString &errorString)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError) {
        errorString = QStringLiteral("invalid JSON: %1").arg(err.errorString());
        return false;
    }

    QJsonArray states;
    if (doc.isArray()) {
        states = doc.array();
    } else if (doc.isObject()) {
        states.append(doc.object());
    } else {
        errorString = QStringLiteral("expected an entity state or an array of them");
        return false;
    }

    for (const QJsonValue &value : states) {
        if (!value.isObject()) {
            errorString = QStringLiteral("entity state must be an object");
            return false;
        }
        vb::EntitySnapshot entity;
        if (!vb::entityFromJson(value.toObject(), entity, errorString))
            return false;
        entities.append(entity);
    }
    return true;
}

QJsonObject syncPayload(const QList<vb::EntitySnapshot> &entities)
{
    QJsonArray devices;
    for (const vb::EntitySnapshot &entity : entities) {
        const std::optional<vb::DeviceDescriptor> device = vb::entityToDevice(entity);
        if (!device)
            continue;
        devices.append(vb::deviceToJson(*device));
    }
    qCInfo(translatorLog) << "Exposing" << devices.size() << "of" << entities.size() << "entities";
    QJsonObject payload;
    payload.insert(QStringLiteral("devices"), devices);
    return payload;
}

QJsonObject queryPayload(const QList<vb::EntitySnapshot> &entities)
{
    QJsonObject devices;
    for (const vb::EntitySnapshot &entity : entities)
        devices.insert(entity.entityId, vb::queryResultToJson(vb::queryDevice(entity)));
    QJsonObject payload;
    payload.insert(QStringLiteral("devices"), devices);
    return payload;
}

QJsonObject executePayload(const QList<vb::EntitySnapshot> &entities,
                           vb::Command command,
                           const QJsonObject &params)
{
    QJsonArray invocations;
    for (const vb::EntitySnapshot &entity : entities) {
        const vb::ServiceInvocation invocation = vb::determineService(entity.entityId, command, params);
        qCDebug(translatorLog) << entity.entityId << "->" << invocation.service;
        invocations.append(vb::invocationToJson(invocation));
    }
    QJsonObject payload;
    payload.insert(QStringLiteral("invocations"), invocations);
    return payload;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("voicebridge-translate"));
    QCoreApplication::setApplicationVersion(QStringLiteral(VOICEBRIDGE_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Translate registry entity states into voice assistant sync, query and execute responses."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("intent"), QStringLiteral("One of sync, query, execute."));
    parser.addPositionalArgument(QStringLiteral("input"),
                                 QStringLiteral("JSON file with entity states, stdin when omitted."),
                                 QStringLiteral("[input]"));

    const QCommandLineOption requestIdOption(QStringLiteral("request-id"),
                                             QStringLiteral("Request id echoed in the response."),
                                             QStringLiteral("id"), QStringLiteral("0"));
    const QCommandLineOption commandOption(QStringLiteral("command"),
                                           QStringLiteral("Assistant command for execute."),
                                           QStringLiteral("name"), QString::fromLatin1(vb::kCommandOnOff));
    const QCommandLineOption paramsOption(QStringLiteral("params"),
                                          QStringLiteral("JSON object with command parameters."),
                                          QStringLiteral("json"), QStringLiteral("{}"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"),
                                           QStringLiteral("Enable debug output of the translator."));
    parser.addOption(requestIdOption);
    parser.addOption(commandOption);
    parser.addOption(paramsOption);
    parser.addOption(verboseOption);
    parser.process(app);

    if (parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules(QStringLiteral("voicebridge.translator.debug=true"));

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || args.size() > 2) {
        std::cerr << parser.helpText().toStdString();
        return kExitUsage;
    }

    const QString intent = args.at(0).toLower();
    if (intent != QStringLiteral("sync") && intent != QStringLiteral("query")
        && intent != QStringLiteral("execute")) {
        std::cerr << "unknown intent: " << intent.toStdString() << '\n';
        return kExitUsage;
    }

    QJsonObject params;
    vb::Command command = vb::Command::Unknown;
    if (intent == QStringLiteral("execute")) {
        QJsonParseError err;
        const QJsonDocument paramsDoc = QJsonDocument::fromJson(parser.value(paramsOption).toUtf8(), &err);
        if (err.error != QJsonParseError::NoError || !paramsDoc.isObject()) {
            std::cerr << "--params must be a JSON object" << '\n';
            return kExitUsage;
        }
        params = paramsDoc.object();
        command = vb::commandFromString(parser.value(commandOption));
        if (command == vb::Command::Unknown)
            qCWarning(translatorLog) << "Unrecognized command" << parser.value(commandOption);
    }

    QByteArray data;
    QString errorString;
    if (!readInput(args.size() > 1 ? args.at(1) : QString(), data, errorString)) {
        std::cerr << errorString.toStdString() << '\n';
        return kExitInput;
    }

    QList<vb::EntitySnapshot> entities;
    if (!parseEntities(data, entities, errorString)) {
        std::cerr << errorString.toStdString() << '\n';
        return kExitInput;
    }

    QJsonObject payload;
    if (intent == QStringLiteral("sync"))
        payload = syncPayload(entities);
    else if (intent == QStringLiteral("query"))
        payload = queryPayload(entities);
    else
        payload = executePayload(entities, command, params);

    const QJsonObject response = vb::makeActionsResponse(parser.value(requestIdOption), payload);
    std::cout << QJsonDocument(response).toJson(QJsonDocument::Indented).toStdString();
    return kExitOk;
}
