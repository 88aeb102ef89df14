#include "SignalMessage.hpp"

QString SignalMessage::typeName(Type t) {
    switch (t) {
    case Type::Offer: return QStringLiteral("offer");
    case Type::Answer: return QStringLiteral("answer");
    case Type::IceCandidate: return QStringLiteral("ice-candidate");
    }
    return {};
}

QJsonObject SignalMessage::toJson() const {
    QJsonObject j;
    j["type"] = typeName(type);
    j["from"] = from;
    j["to"] = to;
    j["roomCode"] = roomCode;
    j["payload"] = payload;
    return j;
}

bool SignalMessage::fromJson(const QJsonObject& o, SignalMessage* out) {
    const QString t = o.value("type").toString();
    Type type;
    if (t == QLatin1String("offer")) type = Type::Offer;
    else if (t == QLatin1String("answer")) type = Type::Answer;
    else if (t == QLatin1String("ice-candidate")) type = Type::IceCandidate;
    else return false;

    const QString from = o.value("from").toString();
    if (from.isEmpty() || !o.value("payload").isObject()) return false;

    out->type = type;
    out->from = from;
    out->to = o.value("to").toString();
    out->roomCode = o.value("roomCode").toString();
    out->payload = o.value("payload").toObject();
    return true;
}
