#include <QJsonArray>
#include <QJsonObject>
#include <QtTest>

#include "actionsresponse.h"
#include "commandresolver.h"
#include "devicedescriptor.h"
#include "entitysnapshot.h"
#include "statequery.h"

using namespace voicebridge;

class TestActionsResponse : public QObject
{
    Q_OBJECT

private slots:
    void envelope();
    void deviceJson();
    void deviceJsonWithoutName();
    void queryJson();
    void invocationJson();
};

void TestActionsResponse::envelope()
{
    QJsonObject payload;
    payload.insert(QStringLiteral("devices"), QJsonArray());

    const QJsonObject response = makeActionsResponse(QStringLiteral("ff36a3cc-ec34-11e6-b1a0-64510650abcf"), payload);
    QCOMPARE(int(response.size()), 2);
    QCOMPARE(response.value(QStringLiteral("requestId")).toString(),
             QStringLiteral("ff36a3cc-ec34-11e6-b1a0-64510650abcf"));
    QCOMPARE(response.value(QStringLiteral("payload")).toObject(), payload);
}

void TestActionsResponse::deviceJson()
{
    QJsonObject attributes;
    attributes.insert(QStringLiteral("friendly_name"), QStringLiteral("Garage door"));
    attributes.insert(QStringLiteral("aliases"), QJsonArray{QStringLiteral("door")});
    attributes.insert(QStringLiteral("supported_features"), 4);

    EntitySnapshot entity;
    entity.entityId = QStringLiteral("cover.garage");
    entity.domain = domainFromEntityId(entity.entityId);
    entity.state = QStringLiteral("open");
    entity.attributes = attributes;

    const std::optional<DeviceDescriptor> device = entityToDevice(entity);
    QVERIFY(device.has_value());

    const QJsonObject json = deviceToJson(*device);
    QCOMPARE(json.value(QStringLiteral("id")).toString(), QStringLiteral("cover.garage"));
    QCOMPARE(json.value(QStringLiteral("type")).toString(), QStringLiteral("action.devices.types.LIGHT"));
    const QJsonArray traits{QStringLiteral("action.devices.traits.OnOff"),
                            QStringLiteral("action.devices.traits.Brightness")};
    QCOMPARE(json.value(QStringLiteral("traits")).toArray(), traits);
    QCOMPARE(json.value(QStringLiteral("willReportState")).toBool(true), false);

    const QJsonObject name = json.value(QStringLiteral("name")).toObject();
    QCOMPARE(name.value(QStringLiteral("name")).toString(), QStringLiteral("Garage door"));
    QCOMPARE(name.value(QStringLiteral("nicknames")).toArray(), QJsonArray{QStringLiteral("door")});
}

void TestActionsResponse::deviceJsonWithoutName()
{
    DeviceDescriptor device;
    device.id = QStringLiteral("switch.x");
    device.type = QStringLiteral("action.devices.types.SWITCH");
    device.traits = QStringList{QStringLiteral("action.devices.traits.OnOff")};

    const QJsonObject json = deviceToJson(device);
    QVERIFY(json.value(QStringLiteral("name")).isObject());
    QVERIFY(json.value(QStringLiteral("name")).toObject().isEmpty());
}

void TestActionsResponse::queryJson()
{
    EntitySnapshot entity;
    entity.entityId = QStringLiteral("light.kitchen");
    entity.domain = QStringLiteral("light");
    entity.state = QStringLiteral("on");
    entity.attributes.insert(QStringLiteral("brightness"), 128);

    const QJsonObject json = queryResultToJson(queryDevice(entity));
    QCOMPARE(int(json.size()), 3);
    QCOMPARE(json.value(QStringLiteral("on")).toBool(), true);
    QCOMPARE(json.value(QStringLiteral("online")).toBool(), true);
    QCOMPARE(json.value(QStringLiteral("brightness")).toInt(), 50);
}

void TestActionsResponse::invocationJson()
{
    QJsonObject params;
    params.insert(QStringLiteral("brightness"), 50);
    const ServiceInvocation invocation =
        determineService(QStringLiteral("light.kitchen"), Command::BrightnessAbsolute, params);

    const QJsonObject json = invocationToJson(invocation);
    QCOMPARE(json.value(QStringLiteral("service")).toString(), QStringLiteral("turn_on"));
    const QJsonObject data = json.value(QStringLiteral("data")).toObject();
    QCOMPARE(data.value(QStringLiteral("entity_id")).toString(), QStringLiteral("light.kitchen"));
    QCOMPARE(data.value(QStringLiteral("brightness")).toInt(), 128);
}

QTEST_APPLESS_MAIN(TestActionsResponse)
#include "tst_actionsresponse.moc"
