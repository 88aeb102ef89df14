#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMimeDatabase>
#include <QSaveFile>
#include <QSet>
#include <QUuid>
#include <QtGlobal>
#include <cstdio>
#include <exception>

#include <rtc/rtc.hpp>

#include "AppConfig.hpp"
#include "RoomSession.hpp"

#ifndef PEARDROP_VERSION
#define PEARDROP_VERSION "0.0.0"
#endif

static void routeRtcLogging(bool verbose) {
    rtc::InitLogger(verbose ? rtc::LogLevel::Debug : rtc::LogLevel::Warning,
                    [](rtc::LogLevel level, std::string message) {
        const QString text = QString::fromStdString(message);
        switch (level) {
        case rtc::LogLevel::Fatal:
        case rtc::LogLevel::Error:
        case rtc::LogLevel::Warning:
            qWarning().noquote() << "rtc:" << text;
            break;
        case rtc::LogLevel::Info:
            qInfo().noquote() << "rtc:" << text;
            break;
        default:
            qDebug().noquote() << "rtc:" << text;
            break;
        }
    });
}

static bool loadFile(const QString& path, FilePayload* out) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "cannot read" << path << ":" << f.errorString();
        return false;
    }
    out->name = QFileInfo(path).fileName();
    out->mimeType = QMimeDatabase().mimeTypeForFile(path).name();
    out->data = f.readAll();
    return true;
}

// Never trusts the remote name beyond its last path component, never overwrites.
static QString targetPath(const QDir& dir, const QString& remoteName) {
    QString name = QFileInfo(remoteName).fileName();
    if (name.isEmpty() || name == "." || name == "..") name = "received";

    const QFileInfo base(name);
    QString candidate = dir.filePath(name);
    for (int n = 1; QFileInfo::exists(candidate); ++n) {
        const QString suffix = base.completeSuffix();
        const QString stem = base.baseName() + QString(" (%1)").arg(n);
        candidate = dir.filePath(suffix.isEmpty() ? stem : stem + "." + suffix);
    }
    return candidate;
}

static bool saveFile(const QDir& dir, const FilePayload& file) {
    const QString path = targetPath(dir, file.name);
    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly) || out.write(file.data) != file.data.size() || !out.commit()) {
        qWarning() << "cannot write" << path << ":" << out.errorString();
        return false;
    }
    qInfo().noquote() << "saved" << path;
    return true;
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("peardrop");
    QCoreApplication::setApplicationVersion(PEARDROP_VERSION);

    AppConfig cfg;
    QString error;
    if (!AppConfig::parse(app.arguments(), QProcessEnvironment::systemEnvironment(), &cfg, &error)) {
        std::fprintf(stderr, "peardrop: %s\n", qPrintable(error));
        return 2;
    }
    if (cfg.helpRequested) {
        std::fputs(qPrintable(cfg.helpText), stdout);
        return 0;
    }
    if (cfg.versionRequested) {
        std::printf("peardrop %s\n", PEARDROP_VERSION);
        return 0;
    }

    if (!cfg.verbose) QLoggingCategory::setFilterRules("*.debug=false");
    routeRtcLogging(cfg.verbose);

    QDir outDir(cfg.outputDir);
    if (!outDir.exists() && !outDir.mkpath(".")) {
        qCritical() << "cannot create output directory" << cfg.outputDir;
        return 1;
    }

    QList<FilePayload> files;
    for (const QString& path : cfg.sendFiles) {
        FilePayload f;
        if (!loadFile(path, &f)) return 1;
        files << f;
    }

    try {
        RoomSession::Config sc;
        sc.relayUrl = cfg.relayUrl;
        sc.roomCode = cfg.roomCode;
        sc.peerId = cfg.peerId.isEmpty() ? QUuid::createUuid().toString(QUuid::WithoutBraces) : cfg.peerId;
        sc.iceServers = cfg.iceServers;
        sc.connectTimeoutMs = cfg.connectTimeoutMs;
        if (sc.roomCode.isEmpty()) {
            sc.roomCode = CryptoEngine().generateRoomCode();
            qInfo().noquote() << "room code:" << sc.roomCode;
        }

        RoomSession session(sc);
        QObject::connect(&session, &RoomSession::status, [](const QString& s) {
            qInfo().noquote() << s;
        });

        QObject::connect(&session.peers(), &PeerManager::fileReceived,
                         [&outDir](const QString& peerId, const QString&, const FilePayload& file) {
            qInfo().noquote() << "received" << file.name << "from" << peerId;
            saveFile(outDir, file);
        });

        // sender mode: push every file to each matching peer once, exit when all sends settle
        QSet<QString> served;
        QSet<QString> inFlight;
        bool anyFailed = false;
        auto sendTo = [&](const QString& peerId) {
            if (files.isEmpty() || served.contains(peerId)) return;
            if (!cfg.targetPeer.isEmpty() && peerId != cfg.targetPeer) return;
            served.insert(peerId);
            for (const FilePayload& f : files) {
                QString err;
                const QString id = session.sendFile(peerId, f, cfg.encrypt, &err);
                if (id.isEmpty()) {
                    anyFailed = true;
                    continue;
                }
                // a send can settle before sendFile returns
                const auto t = session.peers().transfer(id);
                if (t && isTerminal(t->status)) {
                    if (t->status != TransferStatus::Completed) anyFailed = true;
                    continue;
                }
                inFlight.insert(id);
            }
            if (inFlight.isEmpty()) app.exit(anyFailed ? 1 : 0);
        };

        QObject::connect(&session.signaling(), &SignalingClient::peerJoined, sendTo);
        QObject::connect(&session.peers(), &PeerManager::transferProgress, [&](const TransferTask& t) {
            if (t.direction != TransferDirection::Send || !isTerminal(t.status)) return;
            if (!inFlight.remove(t.transferId)) return;
            if (t.status != TransferStatus::Completed) anyFailed = true;
            if (inFlight.isEmpty()) app.exit(anyFailed ? 1 : 0);
        });
        QObject::connect(&session, &RoomSession::sendFailed, [&](const QString& id, const QString&) {
            if (!inFlight.remove(id)) return;
            anyFailed = true;
            if (inFlight.isEmpty()) app.exit(1);
        });
        QObject::connect(&session.signaling(), &SignalingClient::stateChanged,
                         [&app](SignalingClient::State s) {
            if (s == SignalingClient::State::Error) app.exit(1);
        });

        if (!files.isEmpty() && !cfg.targetPeer.isEmpty())
            qInfo().noquote() << "waiting for" << cfg.targetPeer << "to join" << sc.roomCode;

        // the relay is joined only once the room key is in place
        if (cfg.password.isEmpty()) {
            session.start();
        } else if (!cfg.salt.isEmpty()) {
            session.unlockRoom(cfg.password, cfg.salt, cfg.keyHash, [&](bool ok) {
                if (ok) session.start();
                else app.exit(1);
            });
        } else {
            session.createRoomKey(cfg.password, [&](const EncryptionMetadata& meta) {
                qInfo().noquote() << "share with the room: --salt" << meta.salt << "--key-hash" << meta.keyHash;
                session.start();
            });
        }

        const int rc = app.exec();
        session.stop();
        return rc;
    } catch (const std::exception& e) {
        qCritical() << "fatal:" << e.what();
        return 1;
    }
}
