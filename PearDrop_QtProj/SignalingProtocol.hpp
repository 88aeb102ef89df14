#pragma once
#include <QByteArray>
#include <QJsonValue>
#include <QStringList>
#include <optional>
#include "SignalMessage.hpp"

// Relay -> client frames.
struct RelayMessage {
    enum class Type { Signal, PeerJoined, PeerLeft, RoomPeers, Pong, Error };

    Type type = Type::Pong;
    SignalMessage signal;   // Signal
    QString peerId;         // PeerJoined / PeerLeft
    QStringList peers;      // RoomPeers
    QString error;          // Error

    // nullopt for malformed JSON, unknown types or missing required fields
    static std::optional<RelayMessage> parse(const QByteArray& frame);
};

// Client -> relay frames.
namespace ClientFrames {
QByteArray join(const QString& roomCode, const QString& peerId);
QByteArray leave(const QString& roomCode, const QString& peerId);
QByteArray signal(const SignalMessage& signal);
QByteArray broadcast(const QString& roomCode, const QJsonValue& data);
QByteArray ping();
}
