#pragma once
#include <QElapsedTimer>
#include <QFuture>
#include <QMap>
#include <QObject>
#include <QStringList>
#include <functional>
#include <map>
#include <optional>

#include "CryptoEngine.hpp"
#include "RateMeter.hpp"
#include "TransferTypes.hpp"

class PeerConnection;

// Chunked file transfer over one PeerConnection's data channel.
//
// Control frames are JSON text (transfer-start / -ack / -complete / -cancel).
// Chunks are binary: [36 byte transfer id][u32 LE index][u8 flags][data],
// flags bit 0 marking the final chunk. The receiver reassembles strictly by
// index and only materializes the file once every chunk is in, the byte count
// matches and the checksum verifies.
class FileTransfer : public QObject {
    Q_OBJECT
public:
    static constexpr int ChunkSize = 64 * 1024;
    static constexpr int TransferIdBytes = 36;
    static constexpr int ChunkHeaderBytes = TransferIdBytes + 4 + 1;
    static constexpr qint64 MaxBufferedAmount = 1024 * 1024;

    // Must not block; the receive completes when the future resolves.
    using Decryptor = std::function<QFuture<DecryptionResult>(const QByteArray& ciphertext,
                                                              const QString& ivB64)>;

    struct Chunk {
        QString transferId;
        quint32 index = 0;
        bool isLast = false;
        QByteArray data;
    };

    explicit FileTransfer(PeerConnection* peer, QObject* parent=nullptr);

    // Used for transfers that arrive with encrypted=true.
    void setDecryptor(Decryptor decryptor);

    // An empty or malformed transferId gets a fresh UUID. Returns the id used.
    // Fails at once if the channel is not ready; otherwise transfer-start goes
    // out once the checksum has been computed off the event loop.
    QString sendFile(const FilePayload& file, bool encrypted = false,
                     const QString& iv = {}, const QString& transferId = {});
    void cancelTransfer(const QString& transferId);

    std::optional<FilePayload> receivedFile(const QString& transferId) const;
    std::optional<TransferMetadata> transferMetadata(const QString& transferId) const;
    void cleanupTransfer(const QString& transferId);

    static int chunkCount(qint64 size);
    static QByteArray encodeChunk(const QString& transferId, quint32 index, bool isLast,
                                  const QByteArray& data);
    static bool decodeChunk(const QByteArray& frame, Chunk* out);

signals:
    void progress(const TransferProgress& p);
    void fileReceived(const QString& transferId, const FilePayload& file);

private slots:
    void onText(const QString& text);
    void onBinary(const QByteArray& frame);
    void onPeerStateChanged();
    void onBufferedAmountLow();
    void pumpOutgoing();

private:
    struct Active {
        TransferMetadata meta;
        qint64 transferred = 0;
        RateMeter rate;
        TransferStatus status = TransferStatus::Pending;
        QString error;
    };

    struct Outgoing : Active {
        QByteArray data;
        int nextIndex = 0;
        bool announced = false;  // transfer-start sent
    };

    struct Incoming : Active {
        QMap<quint32, QByteArray> chunks;
        bool lastSeen = false;
        std::optional<FilePayload> file;
        bool finalizing = false;  // checksum / decryption in flight
    };

    void handleStart(const QJsonObject& metadata);
    bool announce(Outgoing& out);
    void tryFinalize(Incoming& in, bool senderDone);
    void verifyAssembled(const QString& transferId, const QByteArray& assembled,
                         const QString& checksum);
    void deliver(const QString& transferId, const QByteArray& content);
    Incoming* liveIncoming(const QString& transferId);
    bool channelOpen() const;
    void cancel(const QString& transferId, bool notifyRemote);
    void failAll(const QString& reason);
    bool finish(Active& t, TransferStatus status, const QString& error = {});
    void publish(const Active& t);
    void sendControl(const QString& type, const QString& transferId);
    void schedulePump();

    PeerConnection* m_peer = nullptr;
    Decryptor m_decryptor;
    QElapsedTimer m_clock;

    std::map<QString, Outgoing> m_outgoing;
    QStringList m_sendQueue;
    std::map<QString, Incoming> m_incoming;

    bool m_pumpScheduled = false;
    bool m_waitingForDrain = false;
};
