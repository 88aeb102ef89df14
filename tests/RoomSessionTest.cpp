#include <gtest/gtest.h>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMap>
#include <QWebSocket>
#include <QWebSocketServer>
#include <QTimer>
#include <memory>
#include <optional>

#include "LoopbackPeerConnection.hpp"
#include "RoomSession.hpp"
#include "TestUtils.hpp"

// Routes signal frames by recipient and announces joins to the rest of the room.
class RoutingRelay {
public:
    RoutingRelay() : server("routing-relay", QWebSocketServer::NonSecureMode) {
        server.listen(QHostAddress::LocalHost, 0);
        QObject::connect(&server, &QWebSocketServer::newConnection, [this]() {
            QWebSocket* s = server.nextPendingConnection();
            QObject::connect(s, &QWebSocket::textMessageReceived, [this, s](const QString& text) {
                onFrame(s, QJsonDocument::fromJson(text.toUtf8()).object());
            });
        });
    }

    QUrl url() const { return QUrl(QString("ws://127.0.0.1:%1").arg(server.serverPort())); }

    QMap<QString, QWebSocket*> members;
    QWebSocketServer server;

private:
    static void send(QWebSocket* s, const QJsonObject& frame) {
        s->sendTextMessage(QString::fromUtf8(QJsonDocument(frame).toJson(QJsonDocument::Compact)));
    }

    void onFrame(QWebSocket* s, const QJsonObject& frame) {
        const QString type = frame.value("type").toString();
        if (type == "join") {
            const QString id = frame.value("peerId").toString();
            for (auto it = members.cbegin(); it != members.cend(); ++it) {
                send(it.value(), QJsonObject{{"type", "peer-joined"}, {"peerId", id}});
                send(s, QJsonObject{{"type", "peer-joined"}, {"peerId", it.key()}});
            }
            members.insert(id, s);
        } else if (type == "signal") {
            QWebSocket* to = members.value(frame.value("signal").toObject().value("to").toString());
            if (to) send(to, frame);
        }
    }
};

static RoomSession::Config sessionConfig(const QUrl& relay, const QString& peerId) {
    RoomSession::Config c;
    c.relayUrl = relay;
    c.roomCode = "ROOM1234";
    c.peerId = peerId;
    c.connectTimeoutMs = 5000;
    return c;
}

// Runs an async key operation to completion.
static EncryptionMetadata createKey(RoomSession& session, const QString& password) {
    std::optional<EncryptionMetadata> meta;
    session.createRoomKey(password, [&](const EncryptionMetadata& m) { meta = m; });
    EXPECT_TRUE(waitUntil([&] { return meta.has_value(); }, 15000));
    return meta.value_or(EncryptionMetadata());
}

static bool unlock(RoomSession& session, const QString& password, const EncryptionMetadata& meta) {
    std::optional<bool> ok;
    session.unlockRoom(password, meta.salt, meta.keyHash, [&](bool r) { ok = r; });
    EXPECT_TRUE(waitUntil([&] { return ok.has_value(); }, 15000));
    return ok.value_or(false);
}

TEST(RoomSessionTest, MembersUnlockWithSharedMetadata) {
    RoomSession owner(sessionConfig(QUrl("ws://127.0.0.1:9"), "owner"));
    RoomSession guest(sessionConfig(QUrl("ws://127.0.0.1:9"), "guest"));

    EXPECT_FALSE(owner.hasRoomKey());
    const EncryptionMetadata meta = createKey(owner, "hunter2");
    EXPECT_TRUE(owner.hasRoomKey());

    QStringList statuses;
    QObject::connect(&guest, &RoomSession::status, [&](const QString& s) { statuses << s; });

    EXPECT_FALSE(unlock(guest, "wrong", meta));
    EXPECT_FALSE(guest.hasRoomKey());
    EXPECT_TRUE(unlock(guest, "hunter2", meta));
    EXPECT_TRUE(guest.hasRoomKey());
    EXPECT_EQ(statuses, QStringList({"crypto: wrong room password", "crypto: room unlocked"}));
}

TEST(RoomSessionTest, KeyDerivationLeavesTheEventLoopRunning) {
    RoomSession session(sessionConfig(QUrl("ws://127.0.0.1:9"), "alice"));

    bool created = false;
    session.createRoomKey("pw", [&](const EncryptionMetadata&) { created = true; });
    // the key lands through the event loop, never inside the call
    EXPECT_FALSE(created);
    EXPECT_FALSE(session.hasRoomKey());

    int ticks = 0;
    QTimer ticker;
    QObject::connect(&ticker, &QTimer::timeout, [&]() { ++ticks; });
    ticker.start(0);
    ASSERT_TRUE(waitUntil([&] { return created; }, 15000));
    EXPECT_GT(ticks, 0);
    EXPECT_TRUE(session.hasRoomKey());
}

TEST(RoomSessionTest, EncryptedSendWithoutKeyIsRefused) {
    RoomSession session(sessionConfig(QUrl("ws://127.0.0.1:9"), "alice"));

    QString error;
    const QString id = session.sendFile("bob", {"f", "", QByteArray("x")}, true, &error);
    EXPECT_TRUE(id.isEmpty());
    EXPECT_EQ(error, CryptoEngine::errorString(CryptoError::MissingKey));
    EXPECT_TRUE(session.peers().transfers().isEmpty());

    error.clear();
    bool called = false;
    EXPECT_FALSE(session.broadcastFile({"f", "", QByteArray("x")}, true,
                                       [&](const RoomSession::BroadcastResults&) { called = true; },
                                       &error));
    EXPECT_FALSE(error.isEmpty());
    spin(20);
    EXPECT_FALSE(called);
}

TEST(RoomSessionTest, StopForgetsKeysAndPresence) {
    RoomSession session(sessionConfig(QUrl("ws://127.0.0.1:9"), "alice"));
    createKey(session, "pw");
    session.peers().addPeer({"bob", "Bob", {}});

    session.stop();
    EXPECT_FALSE(session.hasRoomKey());
    EXPECT_TRUE(session.peers().availablePeers().isEmpty());
}

TEST(RoomSessionTest, EncryptedFileCrossesTheRoom) {
    RoutingRelay relay;
    LoopbackNetwork net;

    RoomSession alice(sessionConfig(relay.url(), "alice"));
    RoomSession bob(sessionConfig(relay.url(), "bob"));
    for (RoomSession* s : {&alice, &bob}) {
        const QString self = s->config().peerId;
        s->peers().setConnectionFactory([&net, self](const QString& remote) -> std::unique_ptr<PeerConnection> {
            return std::make_unique<LoopbackPeerConnection>(&net, self, remote);
        });
    }

    const EncryptionMetadata meta = createKey(alice, "shared secret");
    ASSERT_TRUE(unlock(bob, "shared secret", meta));

    QList<FilePayload> received;
    QObject::connect(&bob.peers(), &PeerManager::fileReceived,
                     [&](const QString&, const QString&, const FilePayload& f) { received << f; });

    alice.start();
    ASSERT_TRUE(waitUntil([&] { return alice.signaling().isConnected(); }));
    bob.start();
    ASSERT_TRUE(waitUntil([&] { return alice.peers().availablePeers().size() == 1 &&
                                       bob.peers().availablePeers().size() == 1; }));

    const QByteArray plain = patternBytes(150000);
    QString error;
    const QString id = alice.sendFile("bob", {"secret.bin", "application/octet-stream", plain}, true, &error);
    ASSERT_FALSE(id.isEmpty()) << error.toStdString();
    // the task is registered once the payload is sealed
    EXPECT_FALSE(alice.peers().transfer(id));

    ASSERT_TRUE(waitUntil([&] { return received.size() == 1; }));
    EXPECT_EQ(received.first().name, QString("secret.bin"));
    EXPECT_EQ(received.first().data, plain);
    ASSERT_TRUE(waitUntil([&] {
        const auto t = alice.peers().transfer(id);
        return t && t->status == TransferStatus::Completed;
    }));

    std::optional<RoomSession::BroadcastResults> results;
    ASSERT_TRUE(alice.broadcastFile({"all.bin", "", patternBytes(2000)}, true,
                                    [&](const RoomSession::BroadcastResults& r) { results = r; }));
    ASSERT_TRUE(waitUntil([&] { return results.has_value() && received.size() == 2; }));
    ASSERT_EQ(results->size(), 1);
    EXPECT_TRUE(results->value("bob").ok());
    EXPECT_EQ(received.last().data, patternBytes(2000));

    alice.stop();
    bob.stop();
}
