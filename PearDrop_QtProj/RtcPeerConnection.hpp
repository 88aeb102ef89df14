#pragma once
#include <vector>
#include <QStringList>
#include <memory>
#include <variant>

#include <rtc/rtc.hpp>

#include "PeerConnection.hpp"

// libdatachannel-backed PeerConnection. libdatachannel invokes its callbacks on
// its own threads; every one of them is re-posted to this object's thread.
class RtcPeerConnection : public PeerConnection {
    Q_OBJECT
public:
    struct Config {
        QString peerId;       // local identity
        QString roomCode;
        QStringList iceServers;
    };

    static constexpr const char* ChannelLabel = "file-transfer";
    static constexpr unsigned MaxRetransmits = 3;
    static constexpr size_t BufferedAmountLowThreshold = 256 * 1024;

    explicit RtcPeerConnection(const Config& config, QObject* parent=nullptr);
    ~RtcPeerConnection() override;

    SignalMessage createOffer(const QString& targetPeerId) override;
    SignalMessage handleOffer(const SignalMessage& offer) override;
    void handleAnswer(const SignalMessage& answer) override;
    void handleIceCandidate(const SignalMessage& candidate) override;

    bool sendText(const QString& text) override;
    bool sendBinary(const QByteArray& data) override;
    qint64 bufferedAmount() const override;

    State state() const override { return m_state; }
    void close() override;

private:
    void attachChannel(std::shared_ptr<rtc::DataChannel> dc);
    void setConnectionState(ConnectionState s);
    void setChannelState(ChannelState s);
    void flushPendingCandidates();
    SignalMessage localDescriptionSignal(SignalMessage::Type type, const QString& to) const;

    Config m_config;
    QString m_remotePeerId;
    std::shared_ptr<rtc::PeerConnection> m_pc;
    std::shared_ptr<rtc::DataChannel> m_dc;
    std::vector<rtc::Candidate> m_pendingCandidates;
    State m_state;
    bool m_closed = false;
};
