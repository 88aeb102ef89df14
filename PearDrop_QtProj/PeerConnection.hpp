#pragma once
#include <QByteArray>
#include <QObject>
#include "SignalMessage.hpp"

// One negotiated transport to a single remote peer: a single ordered,
// bounded-retransmit data channel. Negotiation messages produced here are
// relayed by the caller; trickled ICE candidates come out of localSignal().
class PeerConnection : public QObject {
    Q_OBJECT
public:
    enum class ConnectionState { New, Connecting, Connected, Disconnected, Failed, Closed };
    Q_ENUM(ConnectionState)
    enum class ChannelState { None, Connecting, Open, Closing, Closed };
    Q_ENUM(ChannelState)

    struct State {
        QString peerId;  // local identity
        ConnectionState connection = ConnectionState::New;
        ChannelState channel = ChannelState::None;
    };

    explicit PeerConnection(QObject* parent=nullptr) : QObject(parent) {}
    ~PeerConnection() override = default;

    // All four return an invalid SignalMessage / log on failure.
    virtual SignalMessage createOffer(const QString& targetPeerId) = 0;
    virtual SignalMessage handleOffer(const SignalMessage& offer) = 0;
    virtual void handleAnswer(const SignalMessage& answer) = 0;
    virtual void handleIceCandidate(const SignalMessage& candidate) = 0;

    // false when the channel is not open or the write was refused
    virtual bool sendText(const QString& text) = 0;
    virtual bool sendBinary(const QByteArray& data) = 0;
    virtual qint64 bufferedAmount() const = 0;

    virtual State state() const = 0;
    virtual void close() = 0;

    bool isReady() const {
        const State s = state();
        return s.connection == ConnectionState::Connected && s.channel == ChannelState::Open;
    }

signals:
    void stateChanged();
    void localSignal(const SignalMessage& signal);
    void textReceived(const QString& text);
    void binaryReceived(const QByteArray& data);
    void bufferedAmountLow();
};
