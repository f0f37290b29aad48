#include <QtTest/QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <ham/Mirror/StateReconciler.hpp>

namespace {

QByteArray snapshot(const QString& state, const QString& title = QString(),
                    double duration = 200, double position = 10)
{
    QJsonObject obj;
    obj["state"] = state;
    obj["volume"] = 55;
    obj["muted"] = false;
    obj["title"] = title.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(title);
    obj["artist"] = title.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(title + " artist");
    obj["albumtitle"] = title.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(title + " album");
    obj["albumartist"] = title.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(title + " album artist");
    obj["duration"] = duration;
    obj["currentposition"] = position;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

} // namespace

class TestStateReconciler : public QObject {
    Q_OBJECT
private:
    QDateTime now_ = QDateTime::fromMSecsSinceEpoch(1700000000000LL, Qt::UTC);
    ham::StateReconciler reconciler_{[this]() { return now_; }};

private slots:
    void init()
    {
        now_ = QDateTime::fromMSecsSinceEpoch(1700000000000LL, Qt::UTC);
    }

    void testRequiredFieldsAlwaysApplied()
    {
        ham::DeviceMirror mirror("id", "Desk");
        QVERIFY(reconciler_.applyPayload(mirror, R"({"state":"PAUSED","volume":80,"muted":true})"));
        QCOMPARE(mirror.playback(), ham::PlaybackState::Paused);
        QCOMPARE(mirror.volume(), 80);
        QVERIFY(mirror.muted());
        QVERIFY(mirror.markedAvailable());
        QCOMPARE(mirror.lastUpdated(), now_);
        QVERIFY(mirror.isAvailable(now_));
    }

    void testTitledSnapshotReplacesIdentityAsUnit()
    {
        ham::DeviceMirror mirror("id", "Desk");
        reconciler_.applyPayload(mirror, snapshot("playing", "First"));
        QCOMPARE(mirror.track().identity.title, QString("First"));

        now_ = now_.addSecs(3);
        QVERIFY(reconciler_.applyPayload(mirror, snapshot("playing", "Second", 300, 42)));

        const auto& track = mirror.track();
        QCOMPARE(track.identity.title, QString("Second"));
        QCOMPARE(track.identity.artist, QString("Second artist"));
        QCOMPARE(track.identity.albumName, QString("Second album"));
        QCOMPARE(track.identity.albumArtist, QString("Second album artist"));
        QCOMPARE(track.durationSeconds, 300.0);
        QCOMPARE(track.positionSeconds, 42.0);
        QCOMPARE(track.positionTimestamp, now_);
    }

    void testUntitledSnapshotKeepsIdentity()
    {
        ham::DeviceMirror mirror("id", "Desk");
        reconciler_.applyPayload(mirror, snapshot("playing", "Kept"));

        now_ = now_.addSecs(1);
        reconciler_.applyPayload(mirror, snapshot("playing", QString(), 180, 90));

        QCOMPARE(mirror.track().identity.title, QString("Kept"));
        QCOMPARE(mirror.track().identity.artist, QString("Kept artist"));
        // Position and duration still move independently
        QCOMPARE(mirror.track().durationSeconds, 180.0);
        QCOMPARE(mirror.track().positionSeconds, 90.0);
        QCOMPARE(mirror.track().positionTimestamp, now_);
    }

    void testPartialIdentityNeverMerged()
    {
        ham::DeviceMirror mirror("id", "Desk");
        reconciler_.applyPayload(mirror, snapshot("playing", "Full"));

        // Artist without title must not overwrite just the artist
        reconciler_.applyPayload(mirror,
            R"({"state":"playing","volume":5,"muted":false,"title":"","artist":"Intruder"})");
        QCOMPARE(mirror.track().identity.artist, QString("Full artist"));
    }

    void testOffFreezesTrack()
    {
        ham::DeviceMirror mirror("id", "Desk");
        reconciler_.applyPayload(mirror, snapshot("playing", "Before", 250, 30));
        const ham::TrackInfo before = mirror.track();

        now_ = now_.addSecs(2);
        QVERIFY(reconciler_.applyPayload(mirror, snapshot("off", "After", 999, 500)));

        QCOMPARE(mirror.playback(), ham::PlaybackState::Off);
        QVERIFY(mirror.track().identity == before.identity);
        QCOMPARE(mirror.track().durationSeconds, before.durationSeconds);
        QCOMPARE(mirror.track().positionSeconds, before.positionSeconds);
        QCOMPARE(mirror.track().positionTimestamp, before.positionTimestamp);
        // Freshness still advances
        QCOMPARE(mirror.lastUpdated(), now_);
    }

    void testUnknownStateIsIdleNotOff()
    {
        ham::DeviceMirror mirror("id", "Desk");
        QVERIFY(reconciler_.applyPayload(mirror, snapshot("weird", "Track")));
        QCOMPARE(mirror.playback(), ham::PlaybackState::Idle);
        // Idle is not Off: metadata is applied
        QCOMPARE(mirror.track().identity.title, QString("Track"));
    }

    void testIdempotent()
    {
        ham::DeviceMirror once("id", "Desk");
        ham::DeviceMirror twice("id", "Desk");
        const QByteArray payload = snapshot("playing", "Same", 120, 60);

        reconciler_.applyPayload(once, payload);
        reconciler_.applyPayload(twice, payload);
        now_ = now_.addMSecs(700);
        reconciler_.applyPayload(twice, payload);

        QCOMPARE(twice.playback(), once.playback());
        QCOMPARE(twice.volume(), once.volume());
        QCOMPARE(twice.muted(), once.muted());
        QVERIFY(twice.track().identity == once.track().identity);
        QCOMPARE(twice.track().durationSeconds, once.track().durationSeconds);
        QCOMPARE(twice.track().positionSeconds, once.track().positionSeconds);
        // Only the timestamps advance
        QCOMPARE(twice.lastUpdated(), now_);
        QCOMPARE(twice.track().positionTimestamp, now_);
        QVERIFY(once.lastUpdated() < twice.lastUpdated());
    }

    void testMalformedPayloadLeavesMirrorUntouched()
    {
        ham::DeviceMirror mirror("id", "Desk");
        reconciler_.applyPayload(mirror, snapshot("paused", "Stable"));
        const QDateTime stamped = mirror.lastUpdated();

        now_ = now_.addSecs(1);
        QVERIFY(!reconciler_.applyPayload(mirror, "garbage{"));
        QVERIFY(!reconciler_.applyPayload(mirror, R"({"state":"playing","volume":99})"));

        QCOMPARE(mirror.playback(), ham::PlaybackState::Paused);
        QCOMPARE(mirror.volume(), 55);
        QCOMPARE(mirror.track().identity.title, QString("Stable"));
        QCOMPARE(mirror.lastUpdated(), stamped);
    }

    void testVolumeOutOfRangeClamped_data()
    {
        QTest::addColumn<QByteArray>("volume");
        QTest::addColumn<int>("expected");
        QTest::newRow("above") << QByteArray("140") << 100;
        QTest::newRow("below") << QByteArray("-3") << 0;
        QTest::newRow("huge") << QByteArray("1e20") << 100;
        QTest::newRow("huge negative") << QByteArray("-1e20") << 0;
        QTest::newRow("fraction") << QByteArray("42.6") << 43;
    }

    void testVolumeOutOfRangeClamped()
    {
        QFETCH(QByteArray, volume);
        QFETCH(int, expected);

        ham::DeviceMirror mirror("id", "Desk");
        QVERIFY(reconciler_.applyPayload(mirror,
            R"({"state":"idle","volume":)" + volume + R"(,"muted":false})"));
        QCOMPARE(mirror.volume(), expected);
    }

    void testAvailabilityExpires()
    {
        ham::DeviceMirror mirror("id", "Desk");
        reconciler_.applyPayload(mirror, snapshot("playing", "A"));
        QVERIFY(mirror.isAvailable(now_.addMSecs(4999)));
        QVERIFY(!mirror.isAvailable(now_.addMSecs(5000)));
    }
};

QTEST_GUILESS_MAIN(TestStateReconciler)
#include "test_state_reconciler.moc"
