#include "TransferTypes.hpp"

QString transferStatusName(TransferStatus s) {
    switch (s) {
    case TransferStatus::Pending: return QStringLiteral("pending");
    case TransferStatus::Transferring: return QStringLiteral("transferring");
    case TransferStatus::Completed: return QStringLiteral("completed");
    case TransferStatus::Failed: return QStringLiteral("failed");
    case TransferStatus::Cancelled: return QStringLiteral("cancelled");
    }
    return {};
}

bool isTerminal(TransferStatus s) {
    switch (s) {
    case TransferStatus::Pending:
    case TransferStatus::Transferring:
        return false;
    case TransferStatus::Completed:
    case TransferStatus::Failed:
    case TransferStatus::Cancelled:
        return true;
    }
    return true;
}

bool canTransition(TransferStatus from, TransferStatus to) {
    if (isTerminal(from)) return false;
    if (from == TransferStatus::Transferring && to == TransferStatus::Pending) return false;
    return true;
}

QJsonObject TransferMetadata::toJson() const {
    QJsonObject j;
    j["transferId"] = transferId;
    j["filename"] = filename;
    j["size"] = double(size);
    j["mimeType"] = mimeType;
    j["encrypted"] = encrypted;
    if (!encryptionIV.isEmpty()) j["encryptionIV"] = encryptionIV;
    j["checksum"] = checksum;
    j["totalChunks"] = totalChunks;
    j["chunkSize"] = chunkSize;
    return j;
}

bool TransferMetadata::fromJson(const QJsonObject& o, TransferMetadata* out) {
    TransferMetadata m;
    m.transferId = o.value("transferId").toString();
    m.filename = o.value("filename").toString();
    m.size = qint64(o.value("size").toDouble(-1));
    m.mimeType = o.value("mimeType").toString();
    m.encrypted = o.value("encrypted").toBool();
    m.encryptionIV = o.value("encryptionIV").toString();
    m.checksum = o.value("checksum").toString();
    m.totalChunks = o.value("totalChunks").toInt();
    m.chunkSize = o.value("chunkSize").toInt();

    if (m.transferId.isEmpty() || m.size < 0 || m.totalChunks <= 0 || m.chunkSize <= 0)
        return false;
    if (m.encrypted && m.encryptionIV.isEmpty()) return false;
    // the declared size has to fit the declared chunk layout
    const qint64 capacity = qint64(m.totalChunks) * m.chunkSize;
    if (m.size > capacity) return false;
    if (m.totalChunks > 1 && m.size <= capacity - m.chunkSize) return false;

    *out = m;
    return true;
}

bool TransferTask::apply(const TransferProgress& p) {
    if (!canTransition(status, p.status)) return false;
    transferredSize = p.transferredSize;
    speed = p.speed;
    eta = p.eta;
    status = p.status;
    error = p.error;
    return true;
}

bool TransferTask::setStatus(TransferStatus s, const QString& errorText) {
    if (!canTransition(status, s)) return false;
    status = s;
    error = errorText;
    if (isTerminal(s)) {
        speed = 0;
        eta = 0;
    }
    return true;
}
