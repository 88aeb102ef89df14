#include "RtcPeerConnection.hpp"
#include <QDebug>
#include <QMetaObject>
#include <cstddef>
#include <exception>

static PeerConnection::ConnectionState fromRtc(rtc::PeerConnection::State s) {
    using S = rtc::PeerConnection::State;
    switch (s) {
    case S::New: return PeerConnection::ConnectionState::New;
    case S::Connecting: return PeerConnection::ConnectionState::Connecting;
    case S::Connected: return PeerConnection::ConnectionState::Connected;
    case S::Disconnected: return PeerConnection::ConnectionState::Disconnected;
    case S::Failed: return PeerConnection::ConnectionState::Failed;
    case S::Closed: return PeerConnection::ConnectionState::Closed;
    }
    return PeerConnection::ConnectionState::Failed;
}

RtcPeerConnection::RtcPeerConnection(const Config& config, QObject* parent)
    : PeerConnection(parent), m_config(config) {

    m_state.peerId = m_config.peerId;

    rtc::Configuration cfg;
    for (const QString& url : m_config.iceServers)
        cfg.iceServers.emplace_back(url.toStdString());
    // offers/answers are driven explicitly through the relay
    cfg.disableAutoNegotiation = true;

    m_pc = std::make_shared<rtc::PeerConnection>(cfg);

    m_pc->onStateChange([this](rtc::PeerConnection::State s) {
        QMetaObject::invokeMethod(this, [this, s]() {
            setConnectionState(fromRtc(s));
        }, Qt::QueuedConnection);
    });

    m_pc->onLocalCandidate([this](rtc::Candidate cand) {
        const QString candidate = QString::fromStdString(cand.candidate());
        const QString mid = QString::fromStdString(cand.mid());
        QMetaObject::invokeMethod(this, [this, candidate, mid]() {
            SignalMessage s;
            s.type = SignalMessage::Type::IceCandidate;
            s.from = m_config.peerId;
            s.to = m_remotePeerId;
            s.roomCode = m_config.roomCode;
            s.payload["candidate"] = candidate;
            s.payload["sdpMid"] = mid;
            emit localSignal(s);
        }, Qt::QueuedConnection);
    });

    m_pc->onDataChannel([this](std::shared_ptr<rtc::DataChannel> dc) {
        QMetaObject::invokeMethod(this, [this, dc]() {
            attachChannel(dc);
        }, Qt::QueuedConnection);
    });
}

RtcPeerConnection::~RtcPeerConnection() {
    close();
    // the rtc threads must not reach this object once it is gone
    if (m_dc) m_dc->resetCallbacks();
    m_pc->resetCallbacks();
}

void RtcPeerConnection::attachChannel(std::shared_ptr<rtc::DataChannel> dc) {
    if (m_closed) {
        dc->close();
        return;
    }
    if (m_dc && m_dc != dc) {
        qWarning() << "rtc: replacing data channel for" << m_remotePeerId;
        m_dc->resetCallbacks();
    }
    m_dc = dc;
    m_dc->setBufferedAmountLowThreshold(BufferedAmountLowThreshold);

    m_dc->onOpen([this]() {
        QMetaObject::invokeMethod(this, [this]() {
            setChannelState(ChannelState::Open);
        }, Qt::QueuedConnection);
    });
    m_dc->onClosed([this]() {
        QMetaObject::invokeMethod(this, [this]() {
            setChannelState(ChannelState::Closed);
        }, Qt::QueuedConnection);
    });
    m_dc->onError([this](std::string error) {
        const QString text = QString::fromStdString(error);
        QMetaObject::invokeMethod(this, [this, text]() {
            qWarning() << "rtc: data channel error with" << m_remotePeerId << ":" << text;
        }, Qt::QueuedConnection);
    });
    m_dc->onBufferedAmountLow([this]() {
        QMetaObject::invokeMethod(this, [this]() {
            emit bufferedAmountLow();
        }, Qt::QueuedConnection);
    });
    m_dc->onMessage([this](rtc::message_variant data) {
        if (std::holds_alternative<rtc::binary>(data)) {
            const rtc::binary& bin = std::get<rtc::binary>(data);
            const QByteArray bytes(reinterpret_cast<const char*>(bin.data()), int(bin.size()));
            QMetaObject::invokeMethod(this, [this, bytes]() {
                emit binaryReceived(bytes);
            }, Qt::QueuedConnection);
        } else {
            const QString text = QString::fromStdString(std::get<rtc::string>(data));
            QMetaObject::invokeMethod(this, [this, text]() {
                emit textReceived(text);
            }, Qt::QueuedConnection);
        }
    });

    setChannelState(m_dc->isOpen() ? ChannelState::Open : ChannelState::Connecting);
}

SignalMessage RtcPeerConnection::localDescriptionSignal(SignalMessage::Type type, const QString& to) const {
    const auto desc = m_pc->localDescription();
    if (!desc) return {};

    SignalMessage s;
    s.type = type;
    s.from = m_config.peerId;
    s.to = to;
    s.roomCode = m_config.roomCode;
    s.payload["type"] = QString::fromStdString(desc->typeString());
    s.payload["sdp"] = QString::fromStdString(std::string(*desc));
    return s;
}

SignalMessage RtcPeerConnection::createOffer(const QString& targetPeerId) {
    m_remotePeerId = targetPeerId;
    try {
        if (!m_dc) {
            rtc::DataChannelInit init;
            init.reliability.unordered = false;
            init.reliability.maxRetransmits = MaxRetransmits;
            attachChannel(m_pc->createDataChannel(ChannelLabel, init));
        }
        m_pc->setLocalDescription(rtc::Description::Type::Offer);
    } catch (const std::exception& e) {
        qWarning() << "rtc: createOffer failed for" << targetPeerId << ":" << e.what();
        return {};
    }
    return localDescriptionSignal(SignalMessage::Type::Offer, targetPeerId);
}

SignalMessage RtcPeerConnection::handleOffer(const SignalMessage& offer) {
    m_remotePeerId = offer.from;
    const QString sdp = offer.payload.value("sdp").toString();
    if (sdp.isEmpty()) {
        qWarning() << "rtc: offer from" << offer.from << "has no sdp";
        return {};
    }

    try {
        m_pc->setRemoteDescription(rtc::Description(sdp.toStdString(), "offer"));
        flushPendingCandidates();
        m_pc->setLocalDescription(rtc::Description::Type::Answer);
    } catch (const std::exception& e) {
        qWarning() << "rtc: handleOffer failed for" << offer.from << ":" << e.what();
        return {};
    }
    return localDescriptionSignal(SignalMessage::Type::Answer, offer.from);
}

void RtcPeerConnection::handleAnswer(const SignalMessage& answer) {
    const QString sdp = answer.payload.value("sdp").toString();
    if (sdp.isEmpty()) {
        qWarning() << "rtc: answer from" << answer.from << "has no sdp";
        return;
    }

    try {
        m_pc->setRemoteDescription(rtc::Description(sdp.toStdString(), "answer"));
        flushPendingCandidates();
    } catch (const std::exception& e) {
        qWarning() << "rtc: handleAnswer failed for" << answer.from << ":" << e.what();
    }
}

void RtcPeerConnection::handleIceCandidate(const SignalMessage& candidate) {
    const QString cand = candidate.payload.value("candidate").toString();
    // empty candidate marks end-of-candidates
    if (cand.isEmpty()) return;

    try {
        rtc::Candidate c(cand.toStdString(), candidate.payload.value("sdpMid").toString().toStdString());
        if (!m_pc->remoteDescription()) {
            m_pendingCandidates.push_back(c);
            return;
        }
        m_pc->addRemoteCandidate(c);
    } catch (const std::exception& e) {
        qWarning() << "rtc: bad candidate from" << candidate.from << ":" << e.what();
    }
}

void RtcPeerConnection::flushPendingCandidates() {
    std::vector<rtc::Candidate> pending;
    pending.swap(m_pendingCandidates);
    for (const rtc::Candidate& c : pending) {
        try {
            m_pc->addRemoteCandidate(c);
        } catch (const std::exception& e) {
            qWarning() << "rtc: bad queued candidate for" << m_remotePeerId << ":" << e.what();
        }
    }
}

bool RtcPeerConnection::sendText(const QString& text) {
    if (!m_dc || !m_dc->isOpen()) return false;
    try {
        // false only means "buffered", not refused
        m_dc->send(text.toStdString());
    } catch (const std::exception& e) {
        qWarning() << "rtc: send failed:" << e.what();
        return false;
    }
    return true;
}

bool RtcPeerConnection::sendBinary(const QByteArray& data) {
    if (!m_dc || !m_dc->isOpen()) return false;
    try {
        m_dc->send(reinterpret_cast<const std::byte*>(data.constData()), size_t(data.size()));
    } catch (const std::exception& e) {
        qWarning() << "rtc: send failed:" << e.what();
        return false;
    }
    return true;
}

qint64 RtcPeerConnection::bufferedAmount() const {
    return m_dc ? qint64(m_dc->bufferedAmount()) : 0;
}

void RtcPeerConnection::close() {
    // the state mirror may already read Closed from a queued rtc callback
    if (m_closed) return;
    m_closed = true;

    if (m_dc) {
        m_dc->resetCallbacks();
        m_dc->close();
    }
    m_pc->resetCallbacks();
    m_pc->close();

    setChannelState(ChannelState::Closed);
    setConnectionState(ConnectionState::Closed);
}

void RtcPeerConnection::setConnectionState(ConnectionState s) {
    if (m_state.connection == s) return;
    // queued callbacks can land after close()
    if (m_state.connection == ConnectionState::Closed) return;
    m_state.connection = s;
    emit stateChanged();
}

void RtcPeerConnection::setChannelState(ChannelState s) {
    if (m_state.channel == s) return;
    if (m_state.channel == ChannelState::Closed && s != ChannelState::Closed) return;
    m_state.channel = s;
    emit stateChanged();
}
