#include <QTest>
#include "core/services/StateRegistry.hpp"

class TestStateRegistry : public QObject {
    Q_OBJECT
private slots:
    void testSetAndRead()
    {
        hab::StateRegistry registry;
        registry.setState("media_player.a", {{"state", "playing"}});

        QCOMPARE(registry.state("media_player.a")["state"].toString(), QString("playing"));
        QVERIFY(registry.state("media_player.b").isEmpty());
        QCOMPARE(registry.entityIds(), QStringList({"media_player.a"}));
    }

    void testListenerIsQueued()
    {
        hab::StateRegistry registry;
        QVariantMap received;
        int subId = registry.subscribe("media_player.a",
            [&](const QString&, const QVariantMap& attrs) { received = attrs; });

        registry.setState("media_player.a", {{"state", "idle"}});
        // Delivered through the event loop
        QVERIFY(received.isEmpty());
        QCoreApplication::processEvents();

        QCOMPARE(received["state"].toString(), QString("idle"));
        QVERIFY(subId > 0);
    }

    void testUnchangedStateNotRepeated()
    {
        hab::StateRegistry registry;
        int count = 0;
        registry.subscribe("media_player.a", [&](const QString&, const QVariantMap&) { ++count; });

        registry.setState("media_player.a", {{"state", "idle"}});
        registry.setState("media_player.a", {{"state", "idle"}});
        QCoreApplication::processEvents();
        QCOMPARE(count, 1);

        registry.setState("media_player.a", {{"state", "paused"}});
        QCoreApplication::processEvents();
        QCOMPARE(count, 2);
    }

    void testWildcardListener()
    {
        hab::StateRegistry registry;
        QStringList seen;
        registry.subscribe(QString(), [&](const QString& id, const QVariantMap&) { seen << id; });

        registry.setState("media_player.a", {{"state", "idle"}});
        registry.setState("media_player.b", {{"state", "idle"}});
        QCoreApplication::processEvents();

        QCOMPARE(seen, QStringList({"media_player.a", "media_player.b"}));
    }

    void testUnsubscribe()
    {
        hab::StateRegistry registry;
        int count = 0;
        int subId = registry.subscribe("media_player.a",
            [&](const QString&, const QVariantMap&) { ++count; });

        registry.setState("media_player.a", {{"state", "idle"}});
        QCoreApplication::processEvents();
        registry.unsubscribe(subId);
        registry.setState("media_player.a", {{"state", "off"}});
        QCoreApplication::processEvents();

        QCOMPARE(count, 1);
    }

    void testRemoveState()
    {
        hab::StateRegistry registry;
        bool cleared = false;
        registry.setState("media_player.a", {{"state", "idle"}});
        registry.subscribe("media_player.a",
            [&](const QString&, const QVariantMap& attrs) { cleared = attrs.isEmpty(); });

        registry.removeState("media_player.a");
        QCoreApplication::processEvents();

        QVERIFY(cleared);
        QVERIFY(registry.entityIds().isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestStateRegistry)
#include "test_state_registry.moc"
