#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <ham/Host/IThumbnailSink.hpp>
#include <ham/Mirror/AgentMirror.hpp>
#include <ham/Mirror/MediaFeatures.hpp>
#include <ham/Transport/ReplayTransport.hpp>

namespace {

class FakeThumbnails : public ham::IThumbnailSink {
public:
    void storeThumbnail(const QString& entryId, const QByteArray& image) override
    {
        images[entryId] = image;
    }

    QString thumbnailPath(const QString& entityId) const override
    {
        return "/api/hass_agent/" + entityId + "/thumbnail.png";
    }

    QHash<QString, QByteArray> images;
};

ham::DeviceInfo desktop()
{
    ham::DeviceInfo info;
    info.uniqueId = "a1b2";
    info.entryId = "entry-7";
    info.name = "Work Desktop";
    info.manufacturer = "HASS.Agent";
    info.model = "Windows";
    return info;
}

const char* kStateTopic = "hass.agent/media_player/Work Desktop/state";
const char* kThumbTopic = "hass.agent/media_player/Work Desktop/thumbnail";

} // namespace

class TestAgentMirror : public QObject {
    Q_OBJECT
private:
    QDateTime now_;

private slots:
    void init()
    {
        now_ = QDateTime::fromMSecsSinceEpoch(1700000000000LL, Qt::UTC);
    }

    void testIdentity()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);
        QCOMPARE(entity.uniqueId(), QString("media_player_a1b2"));
        QCOMPARE(entity.entityId(), QString("media_player.work_desktop"));
        QCOMPARE(entity.name(), QString("Work Desktop"));
    }

    void testEntityIdTransliterates_data()
    {
        QTest::addColumn<QString>("name");
        QTest::addColumn<QString>("entityId");
        QTest::newRow("umlaut") << QString::fromUtf8("Büro") << QString("media_player.buro");
        QTest::newRow("accent") << QString::fromUtf8("Café Desk") << QString("media_player.cafe_desk");
        QTest::newRow("punctuation") << QString("--Den PC!--") << QString("media_player.den_pc");
        QTest::newRow("nothing usable") << QString::fromUtf8("日本") << QString("media_player.unnamed");
    }

    void testEntityIdTransliterates()
    {
        QFETCH(QString, name);
        QFETCH(QString, entityId);

        ham::DeviceInfo info = desktop();
        info.name = name;
        ham::ReplayTransport transport;
        ham::AgentMirror entity(info, &transport, nullptr, nullptr);
        QCOMPARE(entity.entityId(), entityId);
    }

    void testStartSubscribesBothTopics()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);

        QVERIFY(entity.start());
        QVERIFY(entity.isStarted());
        QCOMPARE(transport.subscribedTopics(), QStringList({kStateTopic, kThumbTopic}));
        QCOMPARE(transport.subscriptionQos(kStateTopic), quint8(0));

        // Second start is a no-op
        QVERIFY(entity.start());
        QCOMPARE(transport.subscribedTopics().size(), 2);
    }

    void testStopIsIdempotent()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);

        entity.stop();  // never started
        QVERIFY(entity.start());
        entity.stop();
        entity.stop();
        QVERIFY(!entity.isStarted());
        QVERIFY(transport.subscribedTopics().isEmpty());
    }

    void testStateMessageUpdatesAndNotifies()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);
        entity.setClock([this]() { return now_; });
        QSignalSpy spy(&entity, &ham::AgentMirror::stateChanged);
        entity.start();

        transport.feedMessage(kStateTopic,
            R"({"state":"playing","volume":30,"muted":false,"title":"Tune","artist":"Me",)"
            R"("albumtitle":"LP","albumartist":"Me","duration":100,"currentposition":5})");

        QCOMPARE(spy.count(), 1);
        QCOMPARE(entity.state(), ham::PlaybackState::Playing);
        QCOMPARE(entity.volumeLevel(), 0.3);
        QVERIFY(entity.isAvailable());

        QVariantMap attrs = entity.attributes();
        QCOMPARE(attrs["state"].toString(), QString("playing"));
        QCOMPARE(attrs["media_title"].toString(), QString("Tune"));
        QCOMPARE(attrs["media_position"].toDouble(), 5.0);
        QCOMPARE(attrs["supported_features"].toInt(), ham::AGENT_SUPPORTED_FEATURES);
        QCOMPARE(attrs["device_class"].toString(), QString("speaker"));
        QCOMPARE(attrs["media_content_type"].toString(), QString("music"));
    }

    void testStalenessReportedAsUnavailable()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);
        entity.setClock([this]() { return now_; });
        entity.start();

        QVERIFY(!entity.isAvailable());
        transport.feedMessage(kStateTopic, R"({"state":"idle","volume":0,"muted":false})");
        QVERIFY(entity.isAvailable());

        now_ = now_.addMSecs(4999);
        QVERIFY(entity.isAvailable());
        now_ = now_.addMSecs(1);
        QVERIFY(!entity.isAvailable());
        QCOMPARE(entity.attributes()["state"].toString(), QString("unavailable"));
    }

    void testMalformedStateDoesNotNotify()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);
        QSignalSpy spy(&entity, &ham::AgentMirror::stateChanged);
        entity.start();

        transport.feedMessage(kStateTopic, "\x89PNG not json");
        transport.feedMessage(kStateTopic, R"({"state":"playing"})");

        QCOMPARE(spy.count(), 0);
        QCOMPARE(entity.state(), ham::PlaybackState::Idle);
        QVERIFY(!entity.isAvailable());
    }

    void testThumbnailStoredWithCacheBuster()
    {
        ham::ReplayTransport transport;
        FakeThumbnails thumbs;
        ham::AgentMirror entity(desktop(), &transport, &thumbs, nullptr);
        entity.setClock([this]() { return now_; });
        QSignalSpy spy(&entity, &ham::AgentMirror::stateChanged);
        entity.start();

        const QByteArray png("\x89PNG\r\n\x1a\n\x00\x01", 10);
        transport.feedMessage(kThumbTopic, png);

        QCOMPARE(thumbs.images.value("entry-7"), png);
        QCOMPARE(entity.mediaImageUrl(),
                 QString("/api/hass_agent/media_player.work_desktop/thumbnail.png?time=1700000000.000"));
        QCOMPARE(spy.count(), 1);

        now_ = now_.addMSecs(1500);
        transport.feedMessage(kThumbTopic, png);
        QVERIFY(entity.mediaImageUrl().endsWith("?time=1700000001.500"));
    }

    void testMessagesAfterStopIgnored()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);
        QSignalSpy spy(&entity, &ham::AgentMirror::stateChanged);
        entity.start();
        entity.stop();

        transport.feedMessage(kStateTopic, R"({"state":"playing","volume":1,"muted":false})");
        QCOMPARE(spy.count(), 0);
        QCOMPARE(entity.state(), ham::PlaybackState::Idle);
    }

    void testCommandsRequireStart()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);

        QCOMPARE(entity.mediaPlay(), ham::DispatchStatus::Rejected);
        QVERIFY(transport.published().isEmpty());
        QCOMPARE(entity.state(), ham::PlaybackState::Idle);
    }

    void testOptimisticCommandsNotify()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);
        QSignalSpy spy(&entity, &ham::AgentMirror::stateChanged);
        entity.start();

        QCOMPARE(entity.mediaPause(), ham::DispatchStatus::Sent);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(entity.state(), ham::PlaybackState::Paused);

        entity.mediaNextTrack();  // no local effect, no notification
        QCOMPARE(spy.count(), 1);

        entity.playMedia("video/mp4", "id123");
        QCOMPARE(spy.count(), 1);

        entity.mediaSeek(12);
        QCOMPARE(spy.count(), 2);
        QCOMPARE(transport.published().size(), 3);
    }

    void testSnapshotOverridesOptimisticState()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);
        entity.start();

        entity.mediaPlay();
        QCOMPARE(entity.state(), ham::PlaybackState::Playing);

        transport.feedMessage(kStateTopic, R"({"state":"paused","volume":10,"muted":false})");
        QCOMPARE(entity.state(), ham::PlaybackState::Paused);
    }

    void testPlayMediaEndToEnd()
    {
        ham::ReplayTransport transport;
        ham::AgentMirror entity(desktop(), &transport, nullptr, nullptr);
        entity.start();

        QVariantMap extra{{"metadata", QVariantMap{{"title", "Song A"}}}};
        QCOMPARE(entity.playMedia("music", "http://files/a.mp3", extra), ham::DispatchStatus::Sent);

        QCOMPARE(entity.mediaContentId(), QString("http://files/a.mp3"));
        QCOMPARE(entity.attributes()["media_title"].toString(), QString("Song A"));

        QCOMPARE(transport.published().size(), 1);
        QCOMPARE(transport.published().first().topic, QString("hass.agent/media_player/Work Desktop/cmd"));
        QJsonObject env = QJsonDocument::fromJson(transport.published().first().payload).object();
        QCOMPARE(env["info"].toObject()["title"].toString(), QString("Song A"));
    }

    void testBrowseFilter()
    {
        QVERIFY(ham::AgentMirror::acceptsBrowseItem("audio/mpeg"));
        QVERIFY(!ham::AgentMirror::acceptsBrowseItem("video/mp4"));
        QVERIFY(!ham::AgentMirror::acceptsBrowseItem("music"));
    }
};

QTEST_GUILESS_MAIN(TestAgentMirror)
#include "test_agent_mirror.moc"
