#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>

enum class TransferStatus { Pending, Transferring, Completed, Failed, Cancelled };
enum class TransferDirection { Send, Receive };

QString transferStatusName(TransferStatus s);
bool isTerminal(TransferStatus s);
// pending -> transferring -> {completed, failed, cancelled}; never backwards.
// Staying in Transferring is allowed (progress updates).
bool canTransition(TransferStatus from, TransferStatus to);

// In-memory stand-in for a browser File / Blob.
struct FilePayload {
    QString name;
    QString mimeType;
    QByteArray data;
};

struct TransferMetadata {
    QString transferId;
    QString filename;
    qint64 size = 0;
    QString mimeType;
    bool encrypted = false;
    QString encryptionIV;
    QString checksum;  // hex SHA-256 of the transmitted bytes
    int totalChunks = 0;
    int chunkSize = 0;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& o, TransferMetadata* out);
};

struct TransferProgress {
    QString transferId;
    QString filename;
    qint64 totalSize = 0;
    qint64 transferredSize = 0;
    double speed = 0;  // bytes/s
    double eta = 0;    // seconds
    TransferStatus status = TransferStatus::Pending;
    QString error;
};

struct TransferTask {
    QString transferId;
    QString peerId;
    TransferDirection direction = TransferDirection::Send;
    QString filename;
    qint64 totalSize = 0;
    qint64 transferredSize = 0;
    double speed = 0;
    double eta = 0;
    TransferStatus status = TransferStatus::Pending;
    QString error;
    std::optional<FilePayload> file;  // receiving side, once completed

    // Rejects (returns false) anything that would move the status backwards
    // or out of a terminal state.
    bool apply(const TransferProgress& p);
    bool setStatus(TransferStatus s, const QString& errorText = {});
};
