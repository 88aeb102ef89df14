#include "PeerManager.hpp"
#include "FileTransfer.hpp"
#include "RoomKeyStore.hpp"
#include "RtcPeerConnection.hpp"

#include <QDebug>
#include <QTimer>
#include <QUuid>
#include <exception>

namespace {

bool isDead(const PeerConnection::State& s) {
    return s.connection == PeerConnection::ConnectionState::Failed
        || s.connection == PeerConnection::ConnectionState::Closed
        || s.channel == PeerConnection::ChannelState::Closed;
}

} // namespace

PeerManager::PeerManager(const Config& config, RoomKeyStore* keys, QObject* parent)
    : QObject(parent), m_config(config), m_keys(keys) {

    m_factory = [this](const QString&) -> std::unique_ptr<PeerConnection> {
        RtcPeerConnection::Config cfg;
        cfg.peerId = m_config.localPeerId;
        cfg.roomCode = m_config.roomCode;
        cfg.iceServers = m_config.iceServers;
        try {
            return std::make_unique<RtcPeerConnection>(cfg);
        } catch (const std::exception& e) {
            qWarning() << "PeerManager: cannot create connection:" << e.what();
            return nullptr;
        }
    };
}

PeerManager::~PeerManager() {
    close();
}

void PeerManager::setConnectionFactory(ConnectionFactory factory) {
    m_factory = std::move(factory);
}

PeerManager::Peer* PeerManager::peer(const QString& peerId) const {
    auto it = m_peers.find(peerId);
    return it == m_peers.end() ? nullptr : it->second.get();
}

QStringList PeerManager::connectedPeers() const {
    QStringList ids;
    for (const auto& [id, p] : m_peers) {
        if (p->isConnected) ids << id;
    }
    return ids;
}

PeerManager::Peer* PeerManager::createPeer(const QString& peerId) {
    auto p = std::make_unique<Peer>();
    p->peerId = peerId;
    p->displayName = m_presence.value(peerId).displayName;
    if (!attachConnection(p.get())) return nullptr;

    Peer* raw = p.get();
    m_peers[peerId] = std::move(p);
    return raw;
}

bool PeerManager::attachConnection(Peer* p) {
    std::unique_ptr<PeerConnection> conn = m_factory ? m_factory(p->peerId) : nullptr;
    if (!conn) {
        qWarning() << "PeerManager: no connection available for" << p->peerId;
        return false;
    }

    // Qt ownership from here on; the FileTransfer dies with its connection
    PeerConnection* c = conn.release();
    c->setParent(this);
    auto* ft = new FileTransfer(c, c);
    if (m_keys) {
        RoomKeyStore* keys = m_keys;
        const QString room = m_config.roomCode;
        ft->setDecryptor([keys, room](const QByteArray& ct, const QString& iv) {
            return keys->decryptBytesAsync(room, ct, iv);
        });
    }

    p->connection = c;
    p->fileTransfer = ft;
    p->state = c->state();
    p->isConnected = c->isReady();
    p->offerSent = false;
    p->answerSent = false;

    const QString peerId = p->peerId;
    connect(c, &PeerConnection::stateChanged, this, [this, peerId]() { onPeerStateChanged(peerId); });
    connect(c, &PeerConnection::localSignal, this, &PeerManager::signalReady);
    connect(ft, &FileTransfer::progress, this, [this, peerId](const TransferProgress& pr) {
        onTransferProgress(peerId, pr);
    });
    connect(ft, &FileTransfer::fileReceived, this, [this, peerId](const QString& id, const FilePayload& f) {
        emit fileReceived(peerId, id, f);
    });
    return true;
}

void PeerManager::detachConnection(Peer* p) {
    if (!p->connection) return;
    PeerConnection* c = p->connection;
    FileTransfer* ft = p->fileTransfer;
    p->connection = nullptr;
    p->fileTransfer = nullptr;

    // state changes from here on are ours, not the remote's
    c->disconnect(this);
    c->close();
    // close() fails in-flight transfers; let that reach the task table first
    ft->disconnect(this);
    c->deleteLater();
}

void PeerManager::connectToPeer(const QString& peerId, ConnectCallback callback) {
    auto done = [&callback](Peer* p, const QString& error) {
        if (callback) callback(p, error);
    };

    if (peerId.isEmpty() || peerId == m_config.localPeerId) {
        done(nullptr, QStringLiteral("Invalid peer id"));
        return;
    }

    Peer* p = peer(peerId);
    if (p && p->isConnected) {
        done(p, {});
        return;
    }

    auto pending = m_pending.find(peerId);
    if (pending != m_pending.end()) {
        if (callback) pending->second.callbacks.push_back(std::move(callback));
        return;
    }

    // a dead connection is replaced rather than waited on
    if (p && isDead(p->state)) {
        detachConnection(p);
        if (!attachConnection(p)) {
            m_peers.erase(peerId);
            done(nullptr, QStringLiteral("Failed to create connection"));
            return;
        }
    }

    const bool needOffer = !p || (!p->offerSent && !p->answerSent);
    if (!p) p = createPeer(peerId);
    if (!p) {
        done(nullptr, QStringLiteral("Failed to create connection"));
        return;
    }

    PendingConnect pc;
    pc.timer = new QTimer(this);
    pc.timer->setSingleShot(true);
    connect(pc.timer, &QTimer::timeout, this, [this, peerId]() {
        qWarning() << "PeerManager: connection to" << peerId << "timed out";
        completeConnect(peerId, QStringLiteral("Connection timeout"));
        teardownPeer(peerId, QStringLiteral("Connection timeout"));
    });
    if (callback) pc.callbacks.push_back(std::move(callback));
    pc.timer->start(m_config.connectTimeoutMs);
    m_pending[peerId] = std::move(pc);

    // an inbound offer may already be negotiating; then we only wait for it
    if (!needOffer) return;

    const SignalMessage offer = p->connection->createOffer(peerId);
    if (!offer.isValid()) {
        completeConnect(peerId, QStringLiteral("Failed to create offer"));
        return;
    }
    p->offerSent = true;
    qDebug() << "PeerManager: offering to" << peerId;
    emit signalReady(offer);
}

void PeerManager::completeConnect(const QString& peerId, const QString& error) {
    auto it = m_pending.find(peerId);
    if (it == m_pending.end()) return;

    PendingConnect pc = std::move(it->second);
    m_pending.erase(it);
    pc.timer->stop();
    pc.timer->deleteLater();

    // a callback may tear the peer down; look it up again for each one
    for (ConnectCallback& cb : pc.callbacks) {
        Peer* p = error.isEmpty() ? peer(peerId) : nullptr;
        const QString reason = (!error.isEmpty() || p) ? error : QStringLiteral("Peer disconnected");
        cb(p, reason);
    }
}

void PeerManager::onPeerStateChanged(const QString& peerId) {
    Peer* p = peer(peerId);
    if (!p || !p->connection) return;

    const bool wasConnected = p->isConnected;
    p->state = p->connection->state();
    // ICE may dip to Disconnected and recover while the channel stays open
    p->isConnected = wasConnected ? !isDead(p->state) : p->connection->isReady();

    if (!wasConnected && p->isConnected) {
        qInfo() << "PeerManager: connected to" << peerId;
        emit peerConnected(peerId);
        completeConnect(peerId, {});
    } else if (isDead(p->state)) {
        if (wasConnected) {
            qInfo() << "PeerManager: lost" << peerId;
            emit peerDisconnected(peerId);
        }
        completeConnect(peerId, QStringLiteral("Connection failed"));
    }
}

void PeerManager::teardownPeer(const QString& peerId, const QString& reason) {
    completeConnect(peerId, reason);

    auto it = m_peers.find(peerId);
    if (it == m_peers.end()) return;
    std::unique_ptr<Peer> p = std::move(it->second);
    m_peers.erase(it);

    const bool wasConnected = p->isConnected;
    detachConnection(p.get());
    if (wasConnected) emit peerDisconnected(peerId);
}

void PeerManager::disconnectPeer(const QString& peerId) {
    teardownPeer(peerId, QStringLiteral("Peer disconnected"));

    for (auto it = m_tasks.begin(); it != m_tasks.end();) {
        if (it->second.peerId == peerId) it = m_tasks.erase(it);
        else ++it;
    }
}

void PeerManager::close() {
    QStringList ids;
    for (const auto& [id, p] : m_peers) ids << id;
    for (const auto& [id, pc] : m_pending) {
        if (!ids.contains(id)) ids << id;
    }
    for (const QString& id : ids) teardownPeer(id, QStringLiteral("Peer manager closed"));
    m_tasks.clear();
}

QString PeerManager::sendFile(const QString& peerId, const FilePayload& file,
                              bool encrypted, const QString& iv, const QString& transferId) {
    TransferTask task;
    task.transferId = transferId;
    if (task.transferId.size() != FileTransfer::TransferIdBytes || m_tasks.count(task.transferId))
        task.transferId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    task.peerId = peerId;
    task.direction = TransferDirection::Send;
    task.filename = file.name;
    task.totalSize = file.data.size();
    const QString id = task.transferId;
    m_tasks[id] = task;
    emit transferProgress(task);

    connectToPeer(peerId, [this, id, file, encrypted, iv](Peer* p, const QString& error) {
        auto it = m_tasks.find(id);
        if (it == m_tasks.end() || isTerminal(it->second.status)) return;
        if (!p) {
            failTask(id, TransferStatus::Failed, error);
            return;
        }
        p->fileTransfer->sendFile(file, encrypted, iv, id);
    });
    return id;
}

QMap<QString, PeerManager::BroadcastResult> PeerManager::broadcastFile(const FilePayload& file,
                                                                      bool encrypted, const QString& iv) {
    QMap<QString, BroadcastResult> results;
    for (const QString& peerId : connectedPeers()) {
        BroadcastResult r;
        r.transferId = sendFile(peerId, file, encrypted, iv);
        const auto t = transfer(r.transferId);
        if (t && t->status == TransferStatus::Failed) r.error = t->error;
        results.insert(peerId, r);
    }
    return results;
}

void PeerManager::cancelTransfer(const QString& transferId) {
    auto it = m_tasks.find(transferId);
    if (it == m_tasks.end() || isTerminal(it->second.status)) return;

    Peer* p = peer(it->second.peerId);
    if (p && p->fileTransfer) p->fileTransfer->cancelTransfer(transferId);

    // still waiting for the connection: FileTransfer never saw it
    failTask(transferId, TransferStatus::Cancelled, {});
}

void PeerManager::cleanupTransfer(const QString& transferId) {
    auto it = m_tasks.find(transferId);
    if (it == m_tasks.end()) return;
    Peer* p = peer(it->second.peerId);
    if (p && p->fileTransfer) p->fileTransfer->cleanupTransfer(transferId);
    m_tasks.erase(it);
}

std::optional<TransferTask> PeerManager::transfer(const QString& transferId) const {
    auto it = m_tasks.find(transferId);
    if (it == m_tasks.end()) return std::nullopt;
    return it->second;
}

QList<TransferTask> PeerManager::activeTransfers() const {
    QList<TransferTask> out;
    for (const auto& [id, t] : m_tasks) {
        if (!isTerminal(t.status)) out << t;
    }
    return out;
}

QList<TransferTask> PeerManager::transfers() const {
    QList<TransferTask> out;
    for (const auto& [id, t] : m_tasks) out << t;
    return out;
}

void PeerManager::failTask(const QString& transferId, TransferStatus status, const QString& error) {
    auto it = m_tasks.find(transferId);
    if (it == m_tasks.end()) return;
    if (!it->second.setStatus(status, error)) return;
    emit transferProgress(it->second);
}

void PeerManager::onTransferProgress(const QString& peerId, const TransferProgress& progress) {
    auto it = m_tasks.find(progress.transferId);
    if (it == m_tasks.end()) {
        // inbound transfers surface here, on their first chunk
        TransferTask t;
        t.transferId = progress.transferId;
        t.peerId = peerId;
        t.direction = TransferDirection::Receive;
        t.filename = progress.filename;
        t.totalSize = progress.totalSize;
        it = m_tasks.emplace(progress.transferId, t).first;
    }

    TransferTask& task = it->second;
    if (task.peerId != peerId) {
        qWarning() << "PeerManager:" << peerId << "reported progress for" << progress.transferId
                   << "owned by" << task.peerId;
        return;
    }
    if (!task.apply(progress)) return;

    if (task.direction == TransferDirection::Receive && task.status == TransferStatus::Completed) {
        Peer* p = peer(peerId);
        if (p && p->fileTransfer) task.file = p->fileTransfer->receivedFile(task.transferId);
    }
    emit transferProgress(task);
}

void PeerManager::handleSignal(const SignalMessage& signal) {
    if (signal.to != m_config.localPeerId) {
        qDebug() << "PeerManager: ignoring signal addressed to" << signal.to;
        return;
    }
    if (!signal.roomCode.isEmpty() && signal.roomCode != m_config.roomCode) {
        qDebug() << "PeerManager: ignoring signal for room" << signal.roomCode;
        return;
    }
    if (signal.from.isEmpty() || signal.from == m_config.localPeerId) return;

    switch (signal.type) {
    case SignalMessage::Type::Offer:
        handleOffer(signal);
        break;
    case SignalMessage::Type::Answer:
        if (Peer* p = peer(signal.from)) p->connection->handleAnswer(signal);
        else qDebug() << "PeerManager: answer from unknown peer" << signal.from;
        break;
    case SignalMessage::Type::IceCandidate:
        if (Peer* p = peer(signal.from)) p->connection->handleIceCandidate(signal);
        else qDebug() << "PeerManager: candidate from unknown peer" << signal.from;
        break;
    }
}

void PeerManager::handleOffer(const SignalMessage& offer) {
    Peer* p = peer(offer.from);

    if (p && p->offerSent && !p->isConnected) {
        // both sides offered: the lower peer id keeps its offer
        if (m_config.localPeerId < offer.from) {
            qDebug() << "PeerManager: offer collision with" << offer.from << ", keeping ours";
            return;
        }
        qDebug() << "PeerManager: offer collision with" << offer.from << ", answering theirs";
    }

    if (p && (p->offerSent || p->answerSent || p->isConnected || isDead(p->state))) {
        // renegotiation from scratch: the remote dropped its side
        const bool wasConnected = p->isConnected;
        detachConnection(p);
        if (!attachConnection(p)) {
            teardownPeer(offer.from, QStringLiteral("Failed to create connection"));
            return;
        }
        if (wasConnected) emit peerDisconnected(offer.from);
    }

    if (!p) p = createPeer(offer.from);
    if (!p) return;

    const SignalMessage answer = p->connection->handleOffer(offer);
    if (!answer.isValid()) {
        qWarning() << "PeerManager: could not answer" << offer.from;
        return;
    }
    p->answerSent = true;
    emit signalReady(answer);
}

void PeerManager::setPeers(const QList<PeerInfo>& peers) {
    m_presence.clear();
    for (const PeerInfo& info : peers) addPeer(info);
}

void PeerManager::addPeer(const PeerInfo& info) {
    if (info.peerId.isEmpty() || info.peerId == m_config.localPeerId) return;
    PeerInfo entry = info;
    if (!entry.joinedAt.isValid()) entry.joinedAt = QDateTime::currentDateTimeUtc();
    m_presence.insert(entry.peerId, entry);
    if (Peer* p = peer(entry.peerId)) {
        if (!entry.displayName.isEmpty()) p->displayName = entry.displayName;
    }
}

void PeerManager::removePeer(const QString& peerId) {
    m_presence.remove(peerId);
    disconnectPeer(peerId);
}

QList<PeerInfo> PeerManager::availablePeers() const {
    return m_presence.values();
}
