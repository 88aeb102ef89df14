#include "SignalingProtocol.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

static std::optional<RelayMessage::Type> relayTypeFromString(const QString& t) {
    if (t == QLatin1String("signal")) return RelayMessage::Type::Signal;
    if (t == QLatin1String("peer-joined")) return RelayMessage::Type::PeerJoined;
    if (t == QLatin1String("peer-left")) return RelayMessage::Type::PeerLeft;
    if (t == QLatin1String("room-peers")) return RelayMessage::Type::RoomPeers;
    if (t == QLatin1String("pong")) return RelayMessage::Type::Pong;
    if (t == QLatin1String("error")) return RelayMessage::Type::Error;
    return std::nullopt;
}

std::optional<RelayMessage> RelayMessage::parse(const QByteArray& frame) {
    const QJsonDocument doc = QJsonDocument::fromJson(frame);
    if (!doc.isObject()) return std::nullopt;
    const QJsonObject o = doc.object();

    const auto type = relayTypeFromString(o.value("type").toString());
    if (!type) return std::nullopt;

    RelayMessage msg;
    msg.type = *type;

    switch (msg.type) {
    case Type::Signal:
        if (!SignalMessage::fromJson(o.value("signal").toObject(), &msg.signal))
            return std::nullopt;
        break;
    case Type::PeerJoined:
    case Type::PeerLeft:
        msg.peerId = o.value("peerId").toString();
        if (msg.peerId.isEmpty()) return std::nullopt;
        break;
    case Type::RoomPeers:
        for (const QJsonValue& v : o.value("peers").toArray()) {
            const QString id = v.toString();
            if (!id.isEmpty()) msg.peers << id;
        }
        break;
    case Type::Pong:
        break;
    case Type::Error: {
        // relays send either a plain string or {code, message}
        const QJsonValue e = o.value("error");
        msg.error = e.isObject() ? e.toObject().value("message").toString() : e.toString();
        break;
    }
    }
    return msg;
}

namespace ClientFrames {

static QByteArray compact(const QJsonObject& j) {
    return QJsonDocument(j).toJson(QJsonDocument::Compact);
}

QByteArray join(const QString& roomCode, const QString& peerId) {
    QJsonObject j;
    j["type"] = "join";
    j["roomCode"] = roomCode;
    j["peerId"] = peerId;
    return compact(j);
}

QByteArray leave(const QString& roomCode, const QString& peerId) {
    QJsonObject j;
    j["type"] = "leave";
    j["roomCode"] = roomCode;
    j["peerId"] = peerId;
    return compact(j);
}

QByteArray signal(const SignalMessage& signal) {
    QJsonObject j;
    j["type"] = "signal";
    j["signal"] = signal.toJson();
    return compact(j);
}

QByteArray broadcast(const QString& roomCode, const QJsonValue& data) {
    QJsonObject j;
    j["type"] = "broadcast";
    j["roomCode"] = roomCode;
    j["data"] = data;
    return compact(j);
}

QByteArray ping() {
    QJsonObject j;
    j["type"] = "ping";
    return compact(j);
}

}
