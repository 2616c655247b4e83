#include <QJsonArray>
#include <QJsonObject>
#include <QtTest>

#include "entitysnapshot.h"

using namespace voicebridge;

class TestEntitySnapshot : public QObject
{
    Q_OBJECT

private slots:
    void domainFromEntityId_data();
    void domainFromEntityId();
    void parsesRegistryState();
    void missingAttributesIsEmpty();
    void rejectsMissingEntityId();
    void rejectsMalformedEntityId_data();
    void rejectsMalformedEntityId();
    void rejectsNonObjectAttributes();
};

void TestEntitySnapshot::domainFromEntityId_data()
{
    QTest::addColumn<QString>("entityId");
    QTest::addColumn<QString>("domain");

    QTest::newRow("plain") << "light.kitchen" << "light";
    QTest::newRow("underscore") << "media_player.living_room" << "media_player";
    QTest::newRow("first dot") << "cover.garage.left" << "cover";
    QTest::newRow("no dot") << "switch" << "switch";
}

void TestEntitySnapshot::domainFromEntityId()
{
    QFETCH(QString, entityId);
    QFETCH(QString, domain);
    QCOMPARE(voicebridge::domainFromEntityId(entityId), domain);
}

void TestEntitySnapshot::parsesRegistryState()
{
    QJsonObject attributes;
    attributes.insert(QStringLiteral("friendly_name"), QStringLiteral("Kitchen"));
    attributes.insert(QStringLiteral("brightness"), 128);

    QJsonObject obj;
    obj.insert(QStringLiteral("entity_id"), QStringLiteral("light.kitchen"));
    obj.insert(QStringLiteral("state"), QStringLiteral("on"));
    obj.insert(QStringLiteral("attributes"), attributes);

    EntitySnapshot entity;
    QString error;
    QVERIFY(entityFromJson(obj, entity, error));
    QVERIFY(error.isEmpty());
    QCOMPARE(entity.entityId, QStringLiteral("light.kitchen"));
    QCOMPARE(entity.domain, QStringLiteral("light"));
    QCOMPARE(entity.state, QStringLiteral("on"));
    QCOMPARE(entity.attributes, attributes);
}

void TestEntitySnapshot::missingAttributesIsEmpty()
{
    QJsonObject obj;
    obj.insert(QStringLiteral("entity_id"), QStringLiteral("switch.x"));
    obj.insert(QStringLiteral("state"), QStringLiteral("off"));

    EntitySnapshot entity;
    QString error;
    QVERIFY(entityFromJson(obj, entity, error));
    QVERIFY(entity.attributes.isEmpty());
}

void TestEntitySnapshot::rejectsMissingEntityId()
{
    QJsonObject obj;
    obj.insert(QStringLiteral("state"), QStringLiteral("on"));

    EntitySnapshot entity;
    QString error;
    QVERIFY(!entityFromJson(obj, entity, error));
    QVERIFY(error.contains(QStringLiteral("entity_id")));
}

void TestEntitySnapshot::rejectsMalformedEntityId_data()
{
    QTest::addColumn<QString>("entityId");

    QTest::newRow("no dot") << "kitchen";
    QTest::newRow("leading dot") << ".kitchen";
    QTest::newRow("trailing dot") << "light.";
}

void TestEntitySnapshot::rejectsMalformedEntityId()
{
    QFETCH(QString, entityId);

    QJsonObject obj;
    obj.insert(QStringLiteral("entity_id"), entityId);

    EntitySnapshot entity;
    QString error;
    QVERIFY(!entityFromJson(obj, entity, error));
    QVERIFY(error.contains(entityId));
}

void TestEntitySnapshot::rejectsNonObjectAttributes()
{
    QJsonObject obj;
    obj.insert(QStringLiteral("entity_id"), QStringLiteral("light.kitchen"));
    obj.insert(QStringLiteral("attributes"), QJsonArray{1, 2});

    EntitySnapshot entity;
    QString error;
    QVERIFY(!entityFromJson(obj, entity, error));
    QVERIFY(!error.isEmpty());
}

QTEST_APPLESS_MAIN(TestEntitySnapshot)
#include "tst_entitysnapshot.moc"
