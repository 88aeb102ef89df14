#pragma once
#include <QObject>
#include <QUrl>
#include <functional>

#include "CryptoEngine.hpp"
#include "PeerManager.hpp"
#include "RoomKeyStore.hpp"
#include "SignalingClient.hpp"

// One joined room: key store, relay connection and peer connections, wired
// together.
class RoomSession : public QObject {
    Q_OBJECT
public:
    struct Config {
        QUrl relayUrl;
        QString roomCode;
        QString peerId;
        QStringList iceServers;
        int connectTimeoutMs = 30000;
        int heartbeatIntervalMs = 30000;
        int reconnectBaseDelayMs = 1000;
        int maxReconnectAttempts = 5;
    };

    explicit RoomSession(const Config& config, QObject* parent=nullptr);
    ~RoomSession() override;

    void start();
    void stop();

    const Config& config() const { return m_config; }

    using BroadcastResults = QMap<QString, PeerManager::BroadcastResult>;

    // Key derivation runs off the event loop; done fires on this object's
    // thread. The metadata is what other members need to unlock.
    void createRoomKey(const QString& password,
                       std::function<void(const EncryptionMetadata&)> done = {});
    void unlockRoom(const QString& password, const QString& saltB64, const QString& keyHash,
                    std::function<void(bool)> done = {});
    bool hasRoomKey() const;

    // Empty id (and *error set) when encryption was requested without a room key.
    // An encrypted send shows up in peers() once its payload is sealed; if that
    // fails, sendFailed is emitted instead.
    QString sendFile(const QString& peerId, const FilePayload& file, bool encrypt = false,
                     QString* error = nullptr);
    // false (and *error set) when encryption was requested without a room key.
    // done receives one result per connected peer.
    bool broadcastFile(const FilePayload& file, bool encrypt,
                       std::function<void(const BroadcastResults&)> done,
                       QString* error = nullptr);

    PeerManager& peers() { return m_peers; }
    SignalingClient& signaling() { return m_signaling; }
    const RoomKeyStore& keys() const { return m_keys; }

signals:
    void status(const QString& s);
    void sendFailed(const QString& transferId, const QString& error);

private slots:
    void onPeerJoined(const QString& peerId);
    void onPeerLeft(const QString& peerId);
    void onTransferProgress(const TransferTask& task);

private:
    bool checkKey(const QString& what, const FilePayload& file, QString* error);

    Config m_config;
    CryptoEngine m_crypto;
    RoomKeyStore m_keys;
    SignalingClient m_signaling;
    PeerManager m_peers;
};
