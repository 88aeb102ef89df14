#include "FileTransfer.hpp"
#include "FutureWatch.hpp"
#include "PeerConnection.hpp"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>
#include <QtEndian>
#include <algorithm>

namespace {

enum class ControlType { Start, Ack, Complete, Cancel };

std::optional<ControlType> controlType(const QString& s) {
    if (s == "transfer-start") return ControlType::Start;
    if (s == "transfer-ack") return ControlType::Ack;
    if (s == "transfer-complete") return ControlType::Complete;
    if (s == "transfer-cancel") return ControlType::Cancel;
    return std::nullopt;
}

bool isDead(const PeerConnection::State& s) {
    return s.channel == PeerConnection::ChannelState::Closed
        || s.connection == PeerConnection::ConnectionState::Failed
        || s.connection == PeerConnection::ConnectionState::Closed;
}

} // namespace

FileTransfer::FileTransfer(PeerConnection* peer, QObject* parent)
    : QObject(parent), m_peer(peer) {
    m_clock.start();
    connect(m_peer, &PeerConnection::textReceived, this, &FileTransfer::onText);
    connect(m_peer, &PeerConnection::binaryReceived, this, &FileTransfer::onBinary);
    connect(m_peer, &PeerConnection::stateChanged, this, &FileTransfer::onPeerStateChanged);
    connect(m_peer, &PeerConnection::bufferedAmountLow, this, &FileTransfer::onBufferedAmountLow);
}

void FileTransfer::setDecryptor(Decryptor decryptor) {
    m_decryptor = std::move(decryptor);
}

int FileTransfer::chunkCount(qint64 size) {
    if (size <= 0) return 1;  // empty file still travels as one (empty) final chunk
    return int((size + ChunkSize - 1) / ChunkSize);
}

QByteArray FileTransfer::encodeChunk(const QString& transferId, quint32 index, bool isLast,
                                     const QByteArray& data) {
    QByteArray frame;
    frame.reserve(ChunkHeaderBytes + data.size());
    frame.append(transferId.toLatin1().leftJustified(TransferIdBytes, '\0', true));

    char idx[4];
    qToLittleEndian<quint32>(index, idx);
    frame.append(idx, 4);
    frame.append(char(isLast ? 0x01 : 0x00));
    frame.append(data);
    return frame;
}

bool FileTransfer::decodeChunk(const QByteArray& frame, Chunk* out) {
    if (frame.size() < ChunkHeaderBytes) return false;
    Chunk c;
    c.transferId = QString::fromLatin1(frame.constData(), TransferIdBytes);
    c.index = qFromLittleEndian<quint32>(frame.constData() + TransferIdBytes);
    c.isLast = (quint8(frame.at(TransferIdBytes + 4)) & 0x01) != 0;
    c.data = frame.mid(ChunkHeaderBytes);
    *out = c;
    return true;
}

QString FileTransfer::sendFile(const FilePayload& file, bool encrypted, const QString& iv,
                               const QString& transferId) {
    QString id = transferId;
    if (id.size() != TransferIdBytes || m_outgoing.count(id) || m_incoming.count(id)) {
        if (!id.isEmpty()) qWarning() << "FileTransfer: replacing unusable transfer id" << id;
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    Outgoing out;
    out.meta.transferId = id;
    out.meta.filename = file.name;
    out.meta.size = file.data.size();
    out.meta.mimeType = file.mimeType.isEmpty() ? QStringLiteral("application/octet-stream")
                                                : file.mimeType;
    out.meta.encrypted = encrypted;
    out.meta.encryptionIV = iv;
    out.meta.totalChunks = chunkCount(file.data.size());
    out.meta.chunkSize = ChunkSize;
    out.data = file.data;
    out.rate.start(m_clock.elapsed());

    Outgoing& stored = m_outgoing[id] = std::move(out);
    publish(stored);

    if (!channelOpen()) {
        stored.data.clear();
        finish(stored, TransferStatus::Failed, QStringLiteral("Data channel not open"));
        return id;
    }

    // queued now so sends keep their order; the pump holds at a transfer
    // whose checksum is still being computed
    m_sendQueue.append(id);
    whenFinished(this, CryptoEngine::sha256HexAsync(stored.data), [this, id](const QString& checksum) {
        auto it = m_outgoing.find(id);
        if (it == m_outgoing.end() || isTerminal(it->second.status)) return;
        it->second.meta.checksum = checksum;
        schedulePump();
    });
    return id;
}

bool FileTransfer::announce(Outgoing& out) {
    QJsonObject start;
    start["type"] = "transfer-start";
    start["metadata"] = out.meta.toJson();
    if (!m_peer->sendText(QString::fromUtf8(QJsonDocument(start).toJson(QJsonDocument::Compact))))
        return false;
    out.announced = true;
    qDebug() << "FileTransfer: sending" << out.meta.filename << out.meta.size
             << "bytes in" << out.meta.totalChunks << "chunks as" << out.meta.transferId;
    return true;
}

void FileTransfer::cancelTransfer(const QString& transferId) {
    cancel(transferId, true);
}

std::optional<FilePayload> FileTransfer::receivedFile(const QString& transferId) const {
    auto it = m_incoming.find(transferId);
    if (it == m_incoming.end()) return std::nullopt;
    return it->second.file;
}

std::optional<TransferMetadata> FileTransfer::transferMetadata(const QString& transferId) const {
    auto out = m_outgoing.find(transferId);
    if (out != m_outgoing.end()) return out->second.meta;
    auto in = m_incoming.find(transferId);
    if (in != m_incoming.end()) return in->second.meta;
    return std::nullopt;
}

void FileTransfer::cleanupTransfer(const QString& transferId) {
    m_outgoing.erase(transferId);
    m_incoming.erase(transferId);
    m_sendQueue.removeAll(transferId);
}

void FileTransfer::onText(const QString& text) {
    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "FileTransfer: bad control frame" << err.errorString();
        return;
    }
    const QJsonObject o = doc.object();
    const auto type = controlType(o.value("type").toString());
    if (!type) {
        qWarning() << "FileTransfer: unknown control type" << o.value("type").toString();
        return;
    }

    const QString id = o.value("transferId").toString();
    switch (*type) {
    case ControlType::Start:
        handleStart(o.value("metadata").toObject());
        break;
    case ControlType::Ack:
        qDebug() << "FileTransfer: peer acknowledged" << id;
        break;
    case ControlType::Complete: {
        auto it = m_incoming.find(id);
        if (it == m_incoming.end()) {
            qWarning() << "FileTransfer: completion for unknown transfer" << id;
            return;
        }
        if (!isTerminal(it->second.status)) tryFinalize(it->second, true);
        break;
    }
    case ControlType::Cancel:
        qDebug() << "FileTransfer: peer cancelled" << id;
        cancel(id, false);
        break;
    }
}

void FileTransfer::handleStart(const QJsonObject& metadata) {
    TransferMetadata meta;
    if (!TransferMetadata::fromJson(metadata, &meta) || meta.transferId.size() != TransferIdBytes) {
        qWarning() << "FileTransfer: rejecting malformed transfer-start";
        return;
    }
    if (m_incoming.count(meta.transferId) || m_outgoing.count(meta.transferId)) {
        qWarning() << "FileTransfer: duplicate transfer-start for" << meta.transferId;
        return;
    }

    Incoming in;
    in.meta = meta;
    in.rate.start(m_clock.elapsed());
    m_incoming[meta.transferId] = std::move(in);

    // progress is first published with the first chunk
    qDebug() << "FileTransfer: receiving" << meta.filename << meta.size << "bytes as"
             << meta.transferId;
    sendControl(QStringLiteral("transfer-ack"), meta.transferId);
}

void FileTransfer::onBinary(const QByteArray& frame) {
    Chunk c;
    if (!decodeChunk(frame, &c)) {
        qWarning() << "FileTransfer: short chunk frame" << frame.size();
        return;
    }
    auto it = m_incoming.find(c.transferId);
    if (it == m_incoming.end()) {
        qWarning() << "FileTransfer: chunk for unknown transfer" << c.transferId;
        return;
    }
    Incoming& in = it->second;
    if (isTerminal(in.status)) return;  // late chunk after cancel / failure

    const quint32 total = quint32(in.meta.totalChunks);
    if (c.index >= total) {
        qWarning() << "FileTransfer: chunk index out of range" << c.index << "of" << total;
        return;
    }
    if (c.isLast != (c.index == total - 1)) {
        qWarning() << "FileTransfer: inconsistent final-chunk flag at" << c.index;
        return;
    }
    if (in.chunks.contains(c.index)) {
        qWarning() << "FileTransfer: duplicate chunk" << c.index << "for" << c.transferId;
        return;
    }
    if (in.transferred + c.data.size() > in.meta.size) {
        qWarning() << "FileTransfer: chunk overruns declared size for" << c.transferId;
        return;
    }

    if (in.status == TransferStatus::Pending) in.status = TransferStatus::Transferring;
    const qint64 now = m_clock.elapsed();
    in.transferred += c.data.size();
    in.rate.addSample(now, c.data.size());
    in.chunks.insert(c.index, c.data);
    if (c.isLast) in.lastSeen = true;

    publish(in);
    tryFinalize(in, false);
}

void FileTransfer::tryFinalize(Incoming& in, bool senderDone) {
    if (in.finalizing) return;
    const bool complete = in.lastSeen
        && in.chunks.size() == in.meta.totalChunks
        && in.transferred == in.meta.size;
    if (!complete) {
        if (senderDone) {
            const QString reason = QStringLiteral("Missing chunks: received %1 of %2")
                                       .arg(in.chunks.size()).arg(in.meta.totalChunks);
            in.chunks.clear();
            finish(in, TransferStatus::Failed, reason);
        }
        return;
    }

    QByteArray assembled;
    assembled.reserve(int(in.meta.size));
    for (auto it = in.chunks.cbegin(); it != in.chunks.cend(); ++it) assembled.append(it.value());
    in.chunks.clear();
    in.finalizing = true;

    const QString id = in.meta.transferId;
    whenFinished(this, CryptoEngine::sha256HexAsync(assembled),
                 [this, id, assembled](const QString& checksum) {
        verifyAssembled(id, assembled, checksum);
    });
}

void FileTransfer::verifyAssembled(const QString& transferId, const QByteArray& assembled,
                                   const QString& checksum) {
    Incoming* in = liveIncoming(transferId);
    if (!in) return;

    if (checksum.compare(in->meta.checksum, Qt::CaseInsensitive) != 0) {
        finish(*in, TransferStatus::Failed, QStringLiteral("Checksum mismatch"));
        return;
    }
    if (!in->meta.encrypted) {
        deliver(transferId, assembled);
        return;
    }
    if (!m_decryptor) {
        finish(*in, TransferStatus::Failed, QStringLiteral("No decryption key"));
        return;
    }

    whenFinished(this, m_decryptor(assembled, in->meta.encryptionIV),
                 [this, transferId](const DecryptionResult& result) {
        Incoming* pending = liveIncoming(transferId);
        if (!pending) return;
        if (!result.ok()) {
            finish(*pending, TransferStatus::Failed,
                   QStringLiteral("Decryption failed: %1").arg(CryptoEngine::errorString(result.error)));
            return;
        }
        deliver(transferId, result.data);
    });
}

void FileTransfer::deliver(const QString& transferId, const QByteArray& content) {
    Incoming* in = liveIncoming(transferId);
    if (!in) return;
    const FilePayload file{in->meta.filename, in->meta.mimeType, content};
    in->file = file;
    // progress listeners may clean the transfer up; in is not used past here
    if (!finish(*in, TransferStatus::Completed)) return;
    qDebug() << "FileTransfer: received" << file.name << content.size() << "bytes";
    emit fileReceived(transferId, file);
}

// null once the transfer was cleaned up or reached a terminal state
FileTransfer::Incoming* FileTransfer::liveIncoming(const QString& transferId) {
    auto it = m_incoming.find(transferId);
    if (it == m_incoming.end() || isTerminal(it->second.status)) return nullptr;
    return &it->second;
}

bool FileTransfer::channelOpen() const {
    return m_peer->state().channel == PeerConnection::ChannelState::Open;
}

void FileTransfer::pumpOutgoing() {
    m_pumpScheduled = false;

    while (!m_sendQueue.isEmpty()) {
        auto it = m_outgoing.find(m_sendQueue.first());
        if (it != m_outgoing.end() && !isTerminal(it->second.status)) break;
        m_sendQueue.removeFirst();
    }
    if (m_sendQueue.isEmpty()) return;

    Outgoing& out = m_outgoing[m_sendQueue.first()];
    if (!channelOpen()) {
        out.data.clear();
        finish(out, TransferStatus::Failed, QStringLiteral("Data channel closed"));
        schedulePump();
        return;
    }
    if (!out.announced) {
        if (out.meta.checksum.isEmpty()) return;
        if (!announce(out)) {
            out.data.clear();
            finish(out, TransferStatus::Failed, QStringLiteral("Data channel closed"));
            schedulePump();
            return;
        }
    }
    if (m_peer->bufferedAmount() > MaxBufferedAmount) {
        m_waitingForDrain = true;
        return;
    }

    const int index = out.nextIndex;
    const qint64 offset = qint64(index) * ChunkSize;
    const int len = int(std::min<qint64>(ChunkSize, out.meta.size - offset));
    const bool isLast = index == out.meta.totalChunks - 1;

    const QByteArray frame = encodeChunk(out.meta.transferId, quint32(index), isLast,
                                         out.data.mid(int(offset), len));
    if (!m_peer->sendBinary(frame)) {
        out.data.clear();
        finish(out, TransferStatus::Failed, QStringLiteral("Data channel closed"));
        schedulePump();
        return;
    }

    out.status = TransferStatus::Transferring;
    out.nextIndex++;
    out.transferred += len;
    out.rate.addSample(m_clock.elapsed(), len);
    publish(out);

    if (isLast) {
        sendControl(QStringLiteral("transfer-complete"), out.meta.transferId);
        out.data.clear();
        finish(out, TransferStatus::Completed);
        m_sendQueue.removeFirst();
    }
    schedulePump();
}

void FileTransfer::cancel(const QString& transferId, bool notifyRemote) {
    bool cancelled = false;

    auto out = m_outgoing.find(transferId);
    if (out != m_outgoing.end() && !isTerminal(out->second.status)) {
        out->second.data.clear();
        cancelled = finish(out->second, TransferStatus::Cancelled);
    }
    auto in = m_incoming.find(transferId);
    if (in != m_incoming.end() && !isTerminal(in->second.status)) {
        in->second.chunks.clear();
        cancelled = finish(in->second, TransferStatus::Cancelled) || cancelled;
    }

    if (cancelled && notifyRemote && channelOpen())
        sendControl(QStringLiteral("transfer-cancel"), transferId);
}

void FileTransfer::onPeerStateChanged() {
    if (isDead(m_peer->state())) failAll(QStringLiteral("Data channel closed"));
}

void FileTransfer::onBufferedAmountLow() {
    if (!m_waitingForDrain) return;
    m_waitingForDrain = false;
    schedulePump();
}

void FileTransfer::failAll(const QString& reason) {
    for (auto& [id, out] : m_outgoing) {
        if (isTerminal(out.status)) continue;
        out.data.clear();
        finish(out, TransferStatus::Failed, reason);
    }
    for (auto& [id, in] : m_incoming) {
        if (isTerminal(in.status)) continue;
        in.chunks.clear();
        finish(in, TransferStatus::Failed, reason);
    }
    m_sendQueue.clear();
}

bool FileTransfer::finish(Active& t, TransferStatus status, const QString& error) {
    if (!canTransition(t.status, status)) return false;
    t.status = status;
    t.error = error;
    if (status == TransferStatus::Failed)
        qWarning() << "FileTransfer:" << t.meta.transferId << "failed:" << error;
    publish(t);
    return true;
}

void FileTransfer::publish(const Active& t) {
    TransferProgress p;
    p.transferId = t.meta.transferId;
    p.filename = t.meta.filename;
    p.totalSize = t.meta.size;
    p.transferredSize = t.transferred;
    p.status = t.status;
    p.error = t.error;
    if (!isTerminal(t.status)) {
        p.speed = t.rate.bytesPerSecond(m_clock.elapsed());
        p.eta = RateMeter::etaSeconds(t.meta.size - t.transferred, p.speed);
    }
    emit progress(p);
}

void FileTransfer::sendControl(const QString& type, const QString& transferId) {
    QJsonObject o;
    o["type"] = type;
    o["transferId"] = transferId;
    if (!m_peer->sendText(QString::fromUtf8(QJsonDocument(o).toJson(QJsonDocument::Compact))))
        qWarning() << "FileTransfer: could not send" << type << "for" << transferId;
}

void FileTransfer::schedulePump() {
    if (m_pumpScheduled) return;
    m_pumpScheduled = true;
    QMetaObject::invokeMethod(this, &FileTransfer::pumpOutgoing, Qt::QueuedConnection);
}
