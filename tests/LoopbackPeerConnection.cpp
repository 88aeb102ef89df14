#include "LoopbackPeerConnection.hpp"
#include <QMetaObject>

static QString endpointKey(const QString& local, const QString& remote) {
    return local + "->" + remote;
}

void LoopbackNetwork::attach(const QString& local, const QString& remote, LoopbackPeerConnection* c) {
    m_endpoints[endpointKey(local, remote)] = c;
}

void LoopbackNetwork::detach(const QString& local, const QString& remote, LoopbackPeerConnection* c) {
    const QString key = endpointKey(local, remote);
    if (m_endpoints.value(key) == c) m_endpoints.remove(key);
}

LoopbackPeerConnection* LoopbackNetwork::find(const QString& local, const QString& remote) const {
    return m_endpoints.value(endpointKey(local, remote));
}

LoopbackPeerConnection::LoopbackPeerConnection(LoopbackNetwork* network, const QString& localId,
                                               const QString& remoteId, QObject* parent)
    : PeerConnection(parent), m_network(network), m_localId(localId), m_remoteId(remoteId) {
    m_state.peerId = localId;
}

LoopbackPeerConnection::~LoopbackPeerConnection() {
    m_network->detach(m_localId, m_remoteId, this);
}

SignalMessage LoopbackPeerConnection::message(SignalMessage::Type type, const QString& to) const {
    SignalMessage s;
    s.type = type;
    s.from = m_localId;
    s.to = to;
    s.roomCode = m_network->roomCode;
    s.payload["sdp"] = "loopback";
    return s;
}

SignalMessage LoopbackPeerConnection::createOffer(const QString& targetPeerId) {
    m_remoteId = targetPeerId;
    m_network->attach(m_localId, m_remoteId, this);
    ++m_network->offersCreated;
    setState(ConnectionState::Connecting, ChannelState::Connecting);

    // one trickled candidate, after the offer itself has gone out
    SignalMessage cand = message(SignalMessage::Type::IceCandidate, targetPeerId);
    cand.payload = QJsonObject{{"candidate", "candidate:1 1 udp 1 127.0.0.1 9 typ host"}, {"sdpMid", "0"}};
    QMetaObject::invokeMethod(this, [this, cand]() { emit localSignal(cand); }, Qt::QueuedConnection);

    return message(SignalMessage::Type::Offer, targetPeerId);
}

SignalMessage LoopbackPeerConnection::handleOffer(const SignalMessage& offer) {
    m_remoteId = offer.from;
    m_network->attach(m_localId, m_remoteId, this);
    setState(ConnectionState::Connecting, ChannelState::Connecting);
    return message(SignalMessage::Type::Answer, offer.from);
}

void LoopbackPeerConnection::handleAnswer(const SignalMessage& answer) {
    LoopbackPeerConnection* other = m_network->find(answer.from, m_localId);
    if (!other) return;
    link(other);
}

void LoopbackPeerConnection::handleIceCandidate(const SignalMessage&) {
    ++m_network->candidatesSeen;
}

void LoopbackPeerConnection::link(LoopbackPeerConnection* other) {
    m_partner = other;
    other->m_partner = this;
    if (!m_network->autoOpen) return;

    QPointer<LoopbackPeerConnection> a(this);
    QPointer<LoopbackPeerConnection> b(other);
    QMetaObject::invokeMethod(this, [a, b]() {
        if (a) a->open();
        if (b) b->open();
    }, Qt::QueuedConnection);
}

void LoopbackPeerConnection::open() {
    setState(ConnectionState::Connected, ChannelState::Open);
}

void LoopbackPeerConnection::fail() {
    setState(ConnectionState::Failed, ChannelState::Closed);
}

void LoopbackPeerConnection::drain() {
    m_buffered = 0;
    emit bufferedAmountLow();
}

bool LoopbackPeerConnection::sendText(const QString& text) {
    if (!channelOpen() || m_refuseWrites) return false;
    sentTexts << text;
    QPointer<LoopbackPeerConnection> to = m_partner;
    QMetaObject::invokeMethod(this, [to, text]() {
        if (to && to->channelOpen()) emit to->textReceived(text);
    }, Qt::QueuedConnection);
    return true;
}

bool LoopbackPeerConnection::sendBinary(const QByteArray& data) {
    if (!channelOpen() || m_refuseWrites) return false;
    ++sentBinaryFrames;
    const QByteArrayList frames = m_network->binaryHook ? m_network->binaryHook(data)
                                                        : QByteArrayList{data};
    QPointer<LoopbackPeerConnection> to = m_partner;
    for (const QByteArray& frame : frames) {
        QMetaObject::invokeMethod(this, [to, frame]() {
            if (to && to->channelOpen()) emit to->binaryReceived(frame);
        }, Qt::QueuedConnection);
    }
    return true;
}

void LoopbackPeerConnection::close() {
    if (m_state.connection == ConnectionState::Closed) return;
    QPointer<LoopbackPeerConnection> to = m_partner;
    m_partner = nullptr;
    m_network->detach(m_localId, m_remoteId, this);
    setState(ConnectionState::Closed, ChannelState::Closed);
    if (to) {
        QMetaObject::invokeMethod(to, [to]() {
            if (to) to->remoteClosed();
        }, Qt::QueuedConnection);
    }
}

void LoopbackPeerConnection::remoteClosed() {
    m_partner = nullptr;
    if (m_state.connection == ConnectionState::Closed) return;
    setState(ConnectionState::Disconnected, ChannelState::Closed);
}

void LoopbackPeerConnection::setState(ConnectionState c, ChannelState ch) {
    if (m_state.connection == c && m_state.channel == ch) return;
    m_state.connection = c;
    m_state.channel = ch;
    emit stateChanged();
}
