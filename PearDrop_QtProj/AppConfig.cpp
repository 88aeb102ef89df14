#include "AppConfig.hpp"
#include <QCommandLineParser>
#include <QFileInfo>
#include <QRegularExpression>

static QStringList splitList(const QString& s) {
    QStringList out;
    for (const QString& part : s.split(',')) {
        const QString t = part.trimmed();
        if (!t.isEmpty()) out << t;
    }
    return out;
}

// scheme:[user[:pass]@]host[:port][?transport=udp|tcp|tls]
static bool isIceServerUrl(const QString& url) {
    static const QRegularExpression re(
        QStringLiteral("^(stun|stuns|turn|turns):(//)?([^@]+@)?[^:@/?\\s]+(:\\d{1,5})?"
                       "(\\?transport=(udp|tcp|tls))?$"));
    return re.match(url).hasMatch();
}

bool AppConfig::parse(const QStringList& arguments, const QProcessEnvironment& env,
                      AppConfig* out, QString* error) {
    QCommandLineParser parser;
    parser.setApplicationDescription("Peer-to-peer, end-to-end encrypted file drop.");
    const QCommandLineOption helpOpt = parser.addHelpOption();
    const QCommandLineOption versionOpt = parser.addVersionOption();

    const QCommandLineOption relayOpt({"r", "relay"}, "Signaling relay WebSocket URL.", "url");
    const QCommandLineOption roomOpt("room", "Room code to join.", "code");
    const QCommandLineOption peerOpt("peer-id", "Local peer id.", "id");
    const QCommandLineOption stunOpt("stun", "STUN/TURN server (repeatable).", "url");
    const QCommandLineOption outOpt({"o", "out"}, "Directory for received files.", "dir");
    const QCommandLineOption passwordOpt({"p", "password"}, "Room password.", "password");
    const QCommandLineOption saltOpt("salt", "Room key salt (base64).", "salt");
    const QCommandLineOption keyHashOpt("key-hash", "Room key hash (hex).", "hash");
    const QCommandLineOption encryptOpt({"e", "encrypt"}, "Encrypt sent files with the room key.");
    const QCommandLineOption sendOpt({"s", "send"}, "File to send (repeatable).", "path");
    const QCommandLineOption toOpt("to", "Send only to this peer.", "id");
    const QCommandLineOption timeoutOpt("connect-timeout", "Peer connect timeout in ms.", "ms");
    const QCommandLineOption verboseOpt({"v", "verbose"}, "Debug logging.");

    parser.addOptions({relayOpt, roomOpt, peerOpt, stunOpt, outOpt, passwordOpt, saltOpt,
                       keyHashOpt, encryptOpt, sendOpt, toOpt, timeoutOpt, verboseOpt});

    if (!parser.parse(arguments)) {
        if (error) *error = parser.errorText();
        return false;
    }

    AppConfig c;
    c.helpRequested = parser.isSet(helpOpt);
    c.versionRequested = parser.isSet(versionOpt);
    c.helpText = parser.helpText();
    if (c.helpRequested || c.versionRequested) {
        *out = c;
        return true;
    }

    const QString relay = parser.isSet(relayOpt) ? parser.value(relayOpt)
                                                 : env.value("PEARDROP_RELAY_URL", DefaultRelayUrl);
    c.relayUrl = QUrl(relay);
    if (!c.relayUrl.isValid() || (c.relayUrl.scheme() != "ws" && c.relayUrl.scheme() != "wss")) {
        if (error) *error = QString("invalid relay url: %1").arg(relay);
        return false;
    }

    c.roomCode = parser.isSet(roomOpt) ? parser.value(roomOpt) : env.value("PEARDROP_ROOM");
    c.roomCode = c.roomCode.trimmed().toUpper();
    c.peerId = parser.value(peerOpt);

    if (parser.isSet(stunOpt)) {
        for (const QString& v : parser.values(stunOpt)) c.iceServers << splitList(v);
    } else {
        c.iceServers = splitList(env.value("PEARDROP_STUN", DefaultStunServer));
    }
    for (const QString& url : c.iceServers) {
        if (!isIceServerUrl(url)) {
            if (error) *error = QString("invalid ICE server: %1").arg(url);
            return false;
        }
    }

    if (parser.isSet(outOpt)) c.outputDir = parser.value(outOpt);
    c.password = parser.value(passwordOpt);
    c.salt = parser.value(saltOpt);
    c.keyHash = parser.value(keyHashOpt);
    c.encrypt = parser.isSet(encryptOpt);
    c.sendFiles = parser.values(sendOpt);
    c.targetPeer = parser.value(toOpt);
    c.verbose = parser.isSet(verboseOpt);

    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        c.connectTimeoutMs = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || c.connectTimeoutMs <= 0) {
            if (error) *error = QString("invalid connect timeout: %1").arg(parser.value(timeoutOpt));
            return false;
        }
    }

    if (c.salt.isEmpty() != c.keyHash.isEmpty()) {
        if (error) *error = "--salt and --key-hash go together";
        return false;
    }
    if (!c.salt.isEmpty() && c.password.isEmpty()) {
        if (error) *error = "--salt/--key-hash need --password";
        return false;
    }
    if (c.encrypt && c.password.isEmpty()) {
        if (error) *error = "--encrypt needs --password";
        return false;
    }
    if (!c.sendFiles.isEmpty() && c.roomCode.isEmpty()) {
        if (error) *error = "--send needs --room";
        return false;
    }
    for (const QString& path : c.sendFiles) {
        if (!QFileInfo(path).isFile()) {
            if (error) *error = QString("not a file: %1").arg(path);
            return false;
        }
    }

    *out = c;
    return true;
}
