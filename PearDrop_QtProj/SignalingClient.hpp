#pragma once
#include <QObject>
#include <QTimer>
#include <QUrl>
#include <QWebSocket>

#include "SignalMessage.hpp"

struct RelayMessage;

// Room-scoped control channel to the signaling relay. Reconnects with
// exponential backoff after an unexpected close and gives up after
// maxReconnectAttempts, leaving the client in State::Error until the next
// explicit connectToRelay().
class SignalingClient : public QObject {
    Q_OBJECT
public:
    enum class State { Disconnected, Connecting, Connected, Error };
    Q_ENUM(State)

    struct Config {
        QUrl url;
        QString roomCode;
        QString peerId;
        int heartbeatIntervalMs = 30000;
        int reconnectBaseDelayMs = 1000;
        int maxReconnectAttempts = 5;
    };

    explicit SignalingClient(const Config& config, QObject* parent=nullptr);
    ~SignalingClient() override;

    void connectToRelay();
    void disconnectFromRelay();

    void sendSignal(const SignalMessage& signal);
    void broadcast(const QJsonValue& data);

    State state() const { return m_state; }
    bool isConnected() const;
    int reconnectAttempts() const { return m_reconnectAttempts; }
    const Config& config() const { return m_config; }

    // base * 2^attempt, attempt counted from 0
    static int reconnectDelayMs(int attempt, int baseDelayMs);

signals:
    void signalReceived(const SignalMessage& signal);
    void peerJoined(const QString& peerId);
    void peerLeft(const QString& peerId);
    void stateChanged(SignalingClient::State state);
    void relayError(const QString& message);
    void reconnectScheduled(int attempt, int delayMs);
    void status(const QString& s);

private slots:
    void onConnected();
    void onDisconnected();
    void onTextMessage(const QString& text);
    void onSocketError(QAbstractSocket::SocketError err);
    void sendPing();

private:
    void openSocket();
    void handleClose();
    void scheduleReconnect();
    void dispatch(const RelayMessage& msg);
    void send(const QByteArray& frame);
    void setState(State s);

    Config m_config;
    QWebSocket m_socket;
    QTimer m_heartbeat;
    QTimer m_reconnectTimer;

    State m_state = State::Disconnected;
    int m_reconnectAttempts = 0;
    bool m_manualClose = false;
    bool m_closeHandled = true;
};
