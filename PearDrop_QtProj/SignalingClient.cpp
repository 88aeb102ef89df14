#include "SignalingClient.hpp"
#include "SignalingProtocol.hpp"
#include <QDebug>

SignalingClient::SignalingClient(const Config& config, QObject* parent)
    : QObject(parent), m_config(config) {

    m_heartbeat.setInterval(m_config.heartbeatIntervalMs);
    m_reconnectTimer.setSingleShot(true);

    connect(&m_socket, &QWebSocket::connected, this, &SignalingClient::onConnected);
    connect(&m_socket, &QWebSocket::disconnected, this, &SignalingClient::onDisconnected);
    connect(&m_socket, &QWebSocket::textMessageReceived, this, &SignalingClient::onTextMessage);
#if QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
    connect(&m_socket, &QWebSocket::errorOccurred, this, &SignalingClient::onSocketError);
#else
    connect(&m_socket, QOverload<QAbstractSocket::SocketError>::of(&QWebSocket::error),
            this, &SignalingClient::onSocketError);
#endif
    connect(&m_heartbeat, &QTimer::timeout, this, &SignalingClient::sendPing);
    connect(&m_reconnectTimer, &QTimer::timeout, this, &SignalingClient::openSocket);
}

SignalingClient::~SignalingClient() {
    m_manualClose = true;
    m_closeHandled = true;
    m_reconnectTimer.stop();
    m_heartbeat.stop();
    m_socket.disconnect(this);
    m_socket.abort();
}

int SignalingClient::reconnectDelayMs(int attempt, int baseDelayMs) {
    return baseDelayMs * (1 << attempt);
}

bool SignalingClient::isConnected() const {
    return m_state == State::Connected && m_socket.state() == QAbstractSocket::ConnectedState;
}

void SignalingClient::connectToRelay() {
    if (m_state == State::Connected || m_state == State::Connecting) return;

    // an explicit call re-arms the client after a terminal failure
    if (m_state == State::Error) m_reconnectAttempts = 0;
    m_manualClose = false;
    m_reconnectTimer.stop();
    openSocket();
}

void SignalingClient::openSocket() {
    if (m_socket.state() != QAbstractSocket::UnconnectedState) {
        m_closeHandled = true;
        m_socket.abort();
    }

    m_closeHandled = false;
    setState(State::Connecting);
    qDebug() << "signaling: connecting to" << m_config.url.toString();
    m_socket.open(m_config.url);
}

void SignalingClient::disconnectFromRelay() {
    m_manualClose = true;
    m_reconnectTimer.stop();
    m_heartbeat.stop();

    if (m_socket.state() == QAbstractSocket::ConnectedState) {
        // let the relay free our presence now instead of on heartbeat timeout
        send(ClientFrames::leave(m_config.roomCode, m_config.peerId));
        m_closeHandled = true;
        m_socket.close();
    } else {
        m_closeHandled = true;
        m_socket.abort();
    }
    setState(State::Disconnected);
}

void SignalingClient::sendSignal(const SignalMessage& signal) {
    send(ClientFrames::signal(signal));
}

void SignalingClient::broadcast(const QJsonValue& data) {
    send(ClientFrames::broadcast(m_config.roomCode, data));
}

void SignalingClient::send(const QByteArray& frame) {
    if (m_socket.state() != QAbstractSocket::ConnectedState) {
        qDebug() << "signaling: not connected, dropping frame";
        return;
    }
    m_socket.sendTextMessage(QString::fromUtf8(frame));
}

void SignalingClient::onConnected() {
    m_reconnectAttempts = 0;
    setState(State::Connected);
    emit status(QString("signaling: connected to %1").arg(m_config.url.toString()));

    send(ClientFrames::join(m_config.roomCode, m_config.peerId));
    m_heartbeat.start(m_config.heartbeatIntervalMs);
}

void SignalingClient::onDisconnected() {
    handleClose();
}

void SignalingClient::onSocketError(QAbstractSocket::SocketError err) {
    qWarning() << "signaling: socket error" << err << m_socket.errorString();
    emit relayError(m_socket.errorString());

    // a failed handshake may not be followed by disconnected()
    if (m_socket.state() == QAbstractSocket::UnconnectedState)
        handleClose();
}

void SignalingClient::handleClose() {
    if (m_closeHandled) return;
    m_closeHandled = true;
    m_heartbeat.stop();

    setState(State::Disconnected);
    if (!m_manualClose) scheduleReconnect();
}

void SignalingClient::scheduleReconnect() {
    if (m_reconnectAttempts >= m_config.maxReconnectAttempts) {
        qWarning() << "signaling: max reconnect attempts reached";
        setState(State::Error);
        emit status("signaling: disconnected, manual reconnect required");
        return;
    }

    const int delay = reconnectDelayMs(m_reconnectAttempts, m_config.reconnectBaseDelayMs);
    ++m_reconnectAttempts;
    emit reconnectScheduled(m_reconnectAttempts, delay);
    emit status(QString("signaling: reconnect %1/%2 in %3 ms")
                    .arg(m_reconnectAttempts).arg(m_config.maxReconnectAttempts).arg(delay));
    m_reconnectTimer.start(delay);
}

void SignalingClient::sendPing() {
    send(ClientFrames::ping());
}

void SignalingClient::onTextMessage(const QString& text) {
    const auto msg = RelayMessage::parse(text.toUtf8());
    if (!msg) {
        qWarning() << "signaling: dropping malformed or unknown frame";
        return;
    }
    dispatch(*msg);
}

void SignalingClient::dispatch(const RelayMessage& msg) {
    switch (msg.type) {
    case RelayMessage::Type::Signal:
        emit signalReceived(msg.signal);
        break;
    case RelayMessage::Type::PeerJoined:
        if (msg.peerId != m_config.peerId) emit peerJoined(msg.peerId);
        break;
    case RelayMessage::Type::PeerLeft:
        if (msg.peerId != m_config.peerId) emit peerLeft(msg.peerId);
        break;
    case RelayMessage::Type::RoomPeers:
        for (const QString& id : msg.peers) {
            if (id != m_config.peerId) emit peerJoined(id);
        }
        break;
    case RelayMessage::Type::Pong:
        break;
    case RelayMessage::Type::Error:
        qWarning() << "signaling: relay error:" << msg.error;
        emit relayError(msg.error);
        emit status(QString("signaling error: %1").arg(msg.error));
        break;
    }
}

void SignalingClient::setState(State s) {
    if (m_state == s) return;
    m_state = s;
    emit stateChanged(s);
}
