#pragma once
#include <QDateTime>
#include <QMap>
#include <QObject>
#include <QStringList>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "PeerConnection.hpp"
#include "SignalMessage.hpp"
#include "TransferTypes.hpp"

class FileTransfer;
class QTimer;
class RoomKeyStore;

// Presence entry mirrored from the relay / room API.
struct PeerInfo {
    QString peerId;
    QString displayName;
    QDateTime joinedAt;
};

// Owns every PeerConnection of one room session, routes negotiation messages
// and keeps the transfer task table.
class PeerManager : public QObject {
    Q_OBJECT
public:
    struct Config {
        QString roomCode;
        QString localPeerId;
        QStringList iceServers;
        int connectTimeoutMs = 30000;
    };

    struct Peer {
        QString peerId;
        QString displayName;
        PeerConnection* connection = nullptr;
        FileTransfer* fileTransfer = nullptr;
        PeerConnection::State state;
        bool isConnected = false;
        bool offerSent = false;
        bool answerSent = false;
    };

    struct BroadcastResult {
        QString transferId;
        QString error;

        bool ok() const { return error.isEmpty(); }
    };

    using ConnectionFactory = std::function<std::unique_ptr<PeerConnection>(const QString& remotePeerId)>;
    // peer is null exactly when error is set
    using ConnectCallback = std::function<void(Peer* peer, const QString& error)>;

    // keys (optional) decrypts inbound encrypted transfers for config.roomCode.
    explicit PeerManager(const Config& config, RoomKeyStore* keys = nullptr, QObject* parent=nullptr);
    ~PeerManager() override;

    void setConnectionFactory(ConnectionFactory factory);
    const Config& config() const { return m_config; }

    void connectToPeer(const QString& peerId, ConnectCallback callback = {});
    void disconnectPeer(const QString& peerId);
    void close();

    Peer* peer(const QString& peerId) const;
    QStringList connectedPeers() const;

    // transferId is used when it is a free, well-formed id; otherwise a fresh
    // one is minted.
    QString sendFile(const QString& peerId, const FilePayload& file,
                     bool encrypted = false, const QString& iv = {},
                     const QString& transferId = {});
    QMap<QString, BroadcastResult> broadcastFile(const FilePayload& file,
                                                 bool encrypted = false, const QString& iv = {});
    void cancelTransfer(const QString& transferId);
    void cleanupTransfer(const QString& transferId);

    std::optional<TransferTask> transfer(const QString& transferId) const;
    QList<TransferTask> activeTransfers() const;
    QList<TransferTask> transfers() const;

    void handleSignal(const SignalMessage& signal);

    void setPeers(const QList<PeerInfo>& peers);
    void addPeer(const PeerInfo& info);
    void removePeer(const QString& peerId);
    QList<PeerInfo> availablePeers() const;

signals:
    void peerConnected(const QString& peerId);
    void peerDisconnected(const QString& peerId);
    void transferProgress(const TransferTask& task);
    void fileReceived(const QString& peerId, const QString& transferId, const FilePayload& file);
    void signalReady(const SignalMessage& signal);

private:
    struct PendingConnect {
        QTimer* timer = nullptr;
        std::vector<ConnectCallback> callbacks;
    };

    Peer* createPeer(const QString& peerId);
    bool attachConnection(Peer* peer);
    void detachConnection(Peer* peer);
    void teardownPeer(const QString& peerId, const QString& reason);
    void completeConnect(const QString& peerId, const QString& error);

    void onPeerStateChanged(const QString& peerId);
    void onTransferProgress(const QString& peerId, const TransferProgress& progress);
    void failTask(const QString& transferId, TransferStatus status, const QString& error);

    void handleOffer(const SignalMessage& offer);

    Config m_config;
    RoomKeyStore* m_keys = nullptr;
    ConnectionFactory m_factory;

    std::map<QString, std::unique_ptr<Peer>> m_peers;
    std::map<QString, PendingConnect> m_pending;
    std::map<QString, TransferTask> m_tasks;
    QMap<QString, PeerInfo> m_presence;
};
