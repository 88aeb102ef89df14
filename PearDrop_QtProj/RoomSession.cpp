#include "RoomSession.hpp"
#include "FutureWatch.hpp"

#include <QDateTime>
#include <QDebug>
#include <QUuid>

static SignalingClient::Config signalingConfig(const RoomSession::Config& c) {
    SignalingClient::Config s;
    s.url = c.relayUrl;
    s.roomCode = c.roomCode;
    s.peerId = c.peerId;
    s.heartbeatIntervalMs = c.heartbeatIntervalMs;
    s.reconnectBaseDelayMs = c.reconnectBaseDelayMs;
    s.maxReconnectAttempts = c.maxReconnectAttempts;
    return s;
}

static PeerManager::Config peerConfig(const RoomSession::Config& c) {
    PeerManager::Config p;
    p.roomCode = c.roomCode;
    p.localPeerId = c.peerId;
    p.iceServers = c.iceServers;
    p.connectTimeoutMs = c.connectTimeoutMs;
    return p;
}

RoomSession::RoomSession(const Config& config, QObject* parent)
    : QObject(parent),
    m_config(config),
    m_keys(&m_crypto),
    m_signaling(signalingConfig(config), this),
    m_peers(peerConfig(config), &m_keys, this) {

    connect(&m_signaling, &SignalingClient::status, this, &RoomSession::status);
    connect(&m_signaling, &SignalingClient::signalReceived, &m_peers, &PeerManager::handleSignal);
    connect(&m_signaling, &SignalingClient::peerJoined, this, &RoomSession::onPeerJoined);
    connect(&m_signaling, &SignalingClient::peerLeft, this, &RoomSession::onPeerLeft);
    connect(&m_peers, &PeerManager::signalReady, &m_signaling, &SignalingClient::sendSignal);
    connect(&m_peers, &PeerManager::transferProgress, this, &RoomSession::onTransferProgress);

    connect(&m_peers, &PeerManager::peerConnected, this, [this](const QString& id) {
        emit status(QString("peer: connected to %1").arg(id));
    });
    connect(&m_peers, &PeerManager::peerDisconnected, this, [this](const QString& id) {
        emit status(QString("peer: disconnected from %1").arg(id));
    });
}

RoomSession::~RoomSession() {
    m_signaling.disconnect(this);
    m_peers.disconnect(this);
}

void RoomSession::start() {
    emit status(QString("room %1: joining as %2").arg(m_config.roomCode, m_config.peerId));
    m_signaling.connectToRelay();
}

void RoomSession::stop() {
    m_signaling.disconnectFromRelay();
    m_peers.close();
    m_peers.setPeers({});
    m_keys.clearAllKeys();
    emit status(QString("room %1: left").arg(m_config.roomCode));
}

void RoomSession::createRoomKey(const QString& password,
                                std::function<void(const EncryptionMetadata&)> done) {
    m_keys.deriveKeyForRoomAsync(this, m_config.roomCode, password,
                                 [this, done](const EncryptionMetadata& meta) {
        emit status("crypto: room key created");
        if (done) done(meta);
    });
}

void RoomSession::unlockRoom(const QString& password, const QString& saltB64, const QString& keyHash,
                             std::function<void(bool)> done) {
    m_keys.unlockRoomAsync(this, m_config.roomCode, password, saltB64, keyHash,
                           [this, done](bool ok) {
        emit status(ok ? "crypto: room unlocked" : "crypto: wrong room password");
        if (done) done(ok);
    });
}

bool RoomSession::hasRoomKey() const {
    return m_keys.hasKeyForRoom(m_config.roomCode);
}

bool RoomSession::checkKey(const QString& what, const FilePayload& file, QString* error) {
    if (hasRoomKey()) return true;
    const QString why = CryptoEngine::errorString(CryptoError::MissingKey);
    emit status(QString("%1 %2: %3").arg(what, file.name, why));
    if (error) *error = why;
    return false;
}

QString RoomSession::sendFile(const QString& peerId, const FilePayload& file, bool encrypt,
                              QString* error) {
    if (!encrypt) return m_peers.sendFile(peerId, file);
    if (!checkKey("send", file, error)) return {};

    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    whenFinished(this, m_keys.encryptBytesAsync(m_config.roomCode, file.data),
                 [this, peerId, file, id](const EncryptionResult& sealed) {
        if (!sealed.isValid()) {
            const QString why = CryptoEngine::errorString(CryptoError::MissingKey);
            emit status(QString("send %1: %2").arg(file.name, why));
            emit sendFailed(id, why);
            return;
        }
        m_peers.sendFile(peerId, FilePayload{file.name, file.mimeType, sealed.ciphertext},
                         true, sealed.iv, id);
    });
    return id;
}

bool RoomSession::broadcastFile(const FilePayload& file, bool encrypt,
                                std::function<void(const BroadcastResults&)> done, QString* error) {
    if (!encrypt) {
        const BroadcastResults results = m_peers.broadcastFile(file);
        if (done) done(results);
        return true;
    }
    if (!checkKey("broadcast", file, error)) return false;

    // sealed once, the same ciphertext goes to every peer
    whenFinished(this, m_keys.encryptBytesAsync(m_config.roomCode, file.data),
                 [this, file, done](const EncryptionResult& sealed) {
        BroadcastResults results;
        if (sealed.isValid()) {
            results = m_peers.broadcastFile(FilePayload{file.name, file.mimeType, sealed.ciphertext},
                                            true, sealed.iv);
        } else {
            emit status(QString("broadcast %1: %2")
                            .arg(file.name, CryptoEngine::errorString(CryptoError::MissingKey)));
        }
        if (done) done(results);
    });
    return true;
}

void RoomSession::onPeerJoined(const QString& peerId) {
    m_peers.addPeer(PeerInfo{peerId, {}, QDateTime::currentDateTimeUtc()});
    emit status(QString("room %1: %2 joined").arg(m_config.roomCode, peerId));
}

void RoomSession::onPeerLeft(const QString& peerId) {
    m_peers.removePeer(peerId);
    emit status(QString("room %1: %2 left").arg(m_config.roomCode, peerId));
}

void RoomSession::onTransferProgress(const TransferTask& task) {
    if (!isTerminal(task.status)) return;
    const QString dir = task.direction == TransferDirection::Send ? "send" : "receive";
    if (task.error.isEmpty()) {
        emit status(QString("%1 %2: %3").arg(dir, task.filename, transferStatusName(task.status)));
    } else {
        emit status(QString("%1 %2: %3 (%4)")
                        .arg(dir, task.filename, transferStatusName(task.status), task.error));
    }
}
