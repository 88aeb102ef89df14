#pragma once
#include <QJsonObject>
#include <QString>

// Negotiation message relayed between two peers. The payload is opaque to
// everything but the PeerConnection layer.
struct SignalMessage {
    enum class Type { Offer, Answer, IceCandidate };

    Type type = Type::Offer;
    QString from;
    QString to;
    QString roomCode;
    QJsonObject payload;

    bool isValid() const { return !from.isEmpty() && !payload.isEmpty(); }

    QJsonObject toJson() const;
    // Returns false (and leaves out untouched) for unknown types or missing fields.
    static bool fromJson(const QJsonObject& o, SignalMessage* out);

    static QString typeName(Type t);
};
