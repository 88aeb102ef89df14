#pragma once
#include <QProcessEnvironment>
#include <QStringList>
#include <QUrl>

// Command line for the peardrop CLI. Options override the PEARDROP_*
// environment, which overrides the built-in defaults.
struct AppConfig {
    static constexpr const char* DefaultRelayUrl = "ws://127.0.0.1:4000/ws";
    static constexpr const char* DefaultStunServer = "stun:stun.l.google.com:19302";

    QUrl relayUrl;
    QString roomCode;      // empty: generate one
    QString peerId;        // empty: generate one
    QStringList iceServers;
    QString outputDir = ".";

    QString password;
    QString salt;          // with keyHash: unlock an existing room key
    QString keyHash;
    bool encrypt = false;

    QStringList sendFiles;
    QString targetPeer;    // empty: every peer in the room
    int connectTimeoutMs = 30000;
    bool verbose = false;

    bool helpRequested = false;
    bool versionRequested = false;
    QString helpText;

    // false with *error set on invalid input
    static bool parse(const QStringList& arguments, const QProcessEnvironment& env,
                      AppConfig* out, QString* error);
};
