#include <gtest/gtest.h>
#include <memory>
#include <utility>

#include <QJsonDocument>
#include <QJsonObject>

#include "FileTransfer.hpp"
#include "LoopbackPeerConnection.hpp"
#include "RoomKeyStore.hpp"
#include "TestUtils.hpp"

static quint32 chunkIndex(const QByteArray& frame) {
    FileTransfer::Chunk c;
    FileTransfer::decodeChunk(frame, &c);
    return c.index;
}

class FileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        a = std::make_unique<LoopbackPeerConnection>(&net, "alice", "bob");
        b = std::make_unique<LoopbackPeerConnection>(&net, "bob", "alice");
        a->handleAnswer(b->handleOffer(a->createOffer("bob")));
        ASSERT_TRUE(waitUntil([&] { return a->isReady() && b->isReady(); }));

        sender = new FileTransfer(a.get(), a.get());
        receiver = new FileTransfer(b.get(), b.get());
        QObject::connect(sender, &FileTransfer::progress, [this](const TransferProgress& p) { sent << p; });
        QObject::connect(receiver, &FileTransfer::progress, [this](const TransferProgress& p) { recv << p; });
        QObject::connect(receiver, &FileTransfer::fileReceived,
                         [this](const QString&, const FilePayload& f) { files << f; });
    }

    // lets exactly one chunk out, then holds the sender on flow control
    void stallAfterFirstChunk() {
        LoopbackPeerConnection* out = a.get();
        net.binaryHook = [out](const QByteArray& frame) -> QByteArrayList {
            out->setBufferedAmount(FileTransfer::MaxBufferedAmount + 1);
            return {frame};
        };
    }

    bool senderDone() const { return !sent.isEmpty() && isTerminal(sent.last().status); }
    bool receiverDone() const { return !recv.isEmpty() && isTerminal(recv.last().status); }

    LoopbackNetwork net;
    QList<TransferProgress> sent;
    QList<TransferProgress> recv;
    QList<FilePayload> files;
    std::unique_ptr<LoopbackPeerConnection> a;
    std::unique_ptr<LoopbackPeerConnection> b;
    FileTransfer* sender = nullptr;    // owned by a
    FileTransfer* receiver = nullptr;  // owned by b
};

TEST_F(FileTransferTest, SmallFileArrivesIntact) {
    const FilePayload file{"notes.txt", "text/plain", QByteArray("pear drop")};
    const QString id = sender->sendFile(file);
    EXPECT_EQ(id.size(), FileTransfer::TransferIdBytes);

    ASSERT_TRUE(waitUntil([&] { return senderDone() && receiverDone(); }));
    EXPECT_EQ(sent.first().status, TransferStatus::Pending);
    EXPECT_EQ(sent.last().status, TransferStatus::Completed);
    EXPECT_EQ(recv.last().status, TransferStatus::Completed);
    EXPECT_EQ(recv.last().transferredSize, file.data.size());

    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(files.first().name, QString("notes.txt"));
    EXPECT_EQ(files.first().mimeType, QString("text/plain"));
    EXPECT_EQ(files.first().data, file.data);

    const auto stored = receiver->receivedFile(id);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->data, file.data);
}

TEST_F(FileTransferTest, LargeEncryptedFileDecryptsAfterReassembly) {
    CryptoEngine crypto;
    RoomKeyStore keys(&crypto);
    keys.deriveKeyForRoom("ROOM1234", "pw");
    receiver->setDecryptor([&keys](const QByteArray& ct, const QString& iv) {
        return keys.decryptBytesAsync("ROOM1234", ct, iv);
    });

    const QByteArray plain = patternBytes(1300000);
    const EncryptionResult sealed = keys.encryptBytes("ROOM1234", plain);
    ASSERT_TRUE(sealed.isValid());

    const QString id = sender->sendFile({"big.bin", "application/octet-stream", sealed.ciphertext},
                                        true, sealed.iv);
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }, 15000));
    ASSERT_EQ(recv.last().status, TransferStatus::Completed) << qPrintable(recv.last().error);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(files.first().data, plain);

    const auto meta = receiver->transferMetadata(id);
    ASSERT_TRUE(meta);
    EXPECT_EQ(meta->totalChunks, FileTransfer::chunkCount(sealed.ciphertext.size()));
    EXPECT_GT(meta->totalChunks, 1);

    // progress never goes backwards
    qint64 last = 0;
    for (const TransferProgress& p : recv) {
        EXPECT_GE(p.transferredSize, last);
        last = p.transferredSize;
    }
}

TEST_F(FileTransferTest, ZeroByteFileIsOneEmptyChunk) {
    sender->sendFile({"empty", "", QByteArray()});
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Completed);
    EXPECT_EQ(a->sentBinaryFrames, 1);
    ASSERT_EQ(files.size(), 1);
    EXPECT_TRUE(files.first().data.isEmpty());
    EXPECT_EQ(files.first().mimeType, QString("application/octet-stream"));
}

TEST_F(FileTransferTest, ReorderedChunksReassembleByIndex) {
    auto held = std::make_shared<QByteArray>();
    net.binaryHook = [held](const QByteArray& frame) -> QByteArrayList {
        if (held->isEmpty()) {
            *held = frame;
            return {};
        }
        return {frame, std::exchange(*held, QByteArray())};
    };

    const QByteArray data = patternBytes(4 * FileTransfer::ChunkSize - 10);
    sender->sendFile({"r.bin", "", data});
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Completed);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(files.first().data, data);
}

TEST_F(FileTransferTest, DuplicateChunkIsNotCounted) {
    net.binaryHook = [](const QByteArray& frame) -> QByteArrayList {
        if (chunkIndex(frame) == 1) return {frame, frame};
        return {frame};
    };

    const QByteArray data = patternBytes(3 * FileTransfer::ChunkSize);
    sender->sendFile({"d.bin", "", data});
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Completed);
    for (const TransferProgress& p : recv) EXPECT_LE(p.transferredSize, data.size());
    EXPECT_EQ(files.first().data, data);
}

TEST_F(FileTransferTest, MissingChunkFailsWhenSenderCompletes) {
    net.binaryHook = [](const QByteArray& frame) -> QByteArrayList {
        if (chunkIndex(frame) == 1) return {};
        return {frame};
    };

    const QString id = sender->sendFile({"m.bin", "", patternBytes(3 * FileTransfer::ChunkSize)});
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Failed);
    EXPECT_TRUE(recv.last().error.startsWith("Missing chunks"));
    EXPECT_TRUE(files.isEmpty());
    EXPECT_FALSE(receiver->receivedFile(id));
}

TEST_F(FileTransferTest, ChecksumMismatchFails) {
    net.binaryHook = [](const QByteArray& frame) -> QByteArrayList {
        QByteArray bad = frame;
        if (chunkIndex(frame) == 0) bad[FileTransfer::ChunkHeaderBytes] = char(bad[FileTransfer::ChunkHeaderBytes] ^ 0x5a);
        return {bad};
    };

    sender->sendFile({"c.bin", "", patternBytes(1000)});
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Failed);
    EXPECT_EQ(recv.last().error, QString("Checksum mismatch"));
    EXPECT_TRUE(files.isEmpty());
}

TEST_F(FileTransferTest, EncryptedTransferWithoutKeyFails) {
    sender->sendFile({"e.bin", "", patternBytes(100)}, true, "AAAAAAAAAAAAAAAA");
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Failed);
    EXPECT_EQ(recv.last().error, QString("No decryption key"));
}

TEST_F(FileTransferTest, WrongKeyFailsAuthentication) {
    CryptoEngine crypto;
    RoomKeyStore senderKeys(&crypto);
    RoomKeyStore receiverKeys(&crypto);
    senderKeys.deriveKeyForRoom("ROOM1234", "pw");
    receiverKeys.deriveKeyForRoom("ROOM1234", "other");
    receiver->setDecryptor([&receiverKeys](const QByteArray& ct, const QString& iv) {
        return receiverKeys.decryptBytesAsync("ROOM1234", ct, iv);
    });

    const EncryptionResult sealed = senderKeys.encryptBytes("ROOM1234", "secret");
    sender->sendFile({"s.bin", "", sealed.ciphertext}, true, sealed.iv);
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Failed);
    EXPECT_TRUE(recv.last().error.startsWith("Decryption failed"));
    EXPECT_TRUE(files.isEmpty());
}

TEST_F(FileTransferTest, SenderCancelReachesReceiver) {
    stallAfterFirstChunk();
    const QByteArray data = patternBytes(40 * FileTransfer::ChunkSize);
    const QString id = sender->sendFile({"big", "", data});
    ASSERT_TRUE(waitUntil([&] { return !recv.isEmpty(); }));

    sender->cancelTransfer(id);
    EXPECT_EQ(sent.last().status, TransferStatus::Cancelled);
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Cancelled);

    a->drain();
    spin(50);
    EXPECT_EQ(a->sentBinaryFrames, 1);
    EXPECT_EQ(sent.last().status, TransferStatus::Cancelled);
    EXPECT_TRUE(files.isEmpty());
}

TEST_F(FileTransferTest, ReceiverCancelStopsSender) {
    stallAfterFirstChunk();
    const QByteArray data = patternBytes(40 * FileTransfer::ChunkSize);
    const QString id = sender->sendFile({"big", "", data});
    ASSERT_TRUE(waitUntil([&] { return !recv.isEmpty(); }));

    receiver->cancelTransfer(id);
    ASSERT_TRUE(waitUntil([&] { return senderDone(); }));
    EXPECT_EQ(sent.last().status, TransferStatus::Cancelled);

    a->drain();
    spin(50);
    EXPECT_EQ(a->sentBinaryFrames, 1);
}

TEST_F(FileTransferTest, ChannelCloseFailsInFlightTransfers) {
    stallAfterFirstChunk();
    sender->sendFile({"big", "", patternBytes(40 * FileTransfer::ChunkSize)});
    ASSERT_TRUE(waitUntil([&] { return !recv.isEmpty(); }));

    a->close();
    ASSERT_TRUE(waitUntil([&] { return senderDone() && receiverDone(); }));
    EXPECT_EQ(sent.last().status, TransferStatus::Failed);
    EXPECT_EQ(sent.last().error, QString("Data channel closed"));
    EXPECT_EQ(recv.last().status, TransferStatus::Failed);
    EXPECT_EQ(recv.last().error, QString("Data channel closed"));
}

TEST_F(FileTransferTest, PausesWhileBufferIsFull) {
    a->setBufferedAmount(FileTransfer::MaxBufferedAmount + 1);
    sender->sendFile({"f", "", patternBytes(2 * FileTransfer::ChunkSize)});
    spin(50);
    EXPECT_EQ(a->sentBinaryFrames, 0);

    a->drain();
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Completed);
}

TEST_F(FileTransferTest, QueuedTransfersGoOneAtATime) {
    const QString first = sender->sendFile({"one", "", patternBytes(3 * FileTransfer::ChunkSize)});
    const QString second = sender->sendFile({"two", "", patternBytes(10)});

    ASSERT_TRUE(waitUntil([&] { return files.size() == 2; }));
    EXPECT_EQ(files[0].name, QString("one"));
    EXPECT_EQ(files[1].name, QString("two"));

    // the second transfer does not start before the first completes
    int firstCompletedAt = -1, secondStartedAt = -1;
    for (int i = 0; i < sent.size(); ++i) {
        if (sent[i].transferId == first && sent[i].status == TransferStatus::Completed) firstCompletedAt = i;
        if (sent[i].transferId == second && sent[i].status == TransferStatus::Transferring && secondStartedAt < 0)
            secondStartedAt = i;
    }
    EXPECT_LT(firstCompletedAt, secondStartedAt);
}

TEST_F(FileTransferTest, StartIsAnnouncedOnceTheChecksumIsReady) {
    const QByteArray data = patternBytes(1000);
    sender->sendFile({"h.bin", "", data});
    // hashing runs on the thread pool; nothing is on the wire yet
    EXPECT_TRUE(a->sentTexts.isEmpty());
    EXPECT_EQ(sent.last().status, TransferStatus::Pending);

    ASSERT_TRUE(waitUntil([&] { return !a->sentTexts.isEmpty(); }));
    const QJsonObject start = QJsonDocument::fromJson(a->sentTexts.first().toUtf8()).object();
    EXPECT_EQ(start.value("type").toString(), QString("transfer-start"));
    EXPECT_EQ(start.value("metadata").toObject().value("checksum").toString(),
              CryptoEngine::sha256Hex(data));
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    EXPECT_EQ(recv.last().status, TransferStatus::Completed);
}

TEST_F(FileTransferTest, CancelBeforeAnnounceSendsNothing) {
    const QString id = sender->sendFile({"c.bin", "", patternBytes(1000)});
    sender->cancelTransfer(id);
    EXPECT_EQ(sent.last().status, TransferStatus::Cancelled);

    spin(100);
    EXPECT_EQ(a->sentBinaryFrames, 0);
    for (const QString& text : a->sentTexts) EXPECT_FALSE(text.contains("transfer-start"));
    EXPECT_TRUE(recv.isEmpty());
}

TEST_F(FileTransferTest, ChannelCloseDuringDecryptionFailsTheReceive) {
    CryptoEngine crypto;
    RoomKeyStore keys(&crypto);
    keys.deriveKeyForRoom("ROOM1234", "pw");
    LoopbackPeerConnection* channel = b.get();
    receiver->setDecryptor([&keys, channel](const QByteArray& ct, const QString& iv) {
        // the channel goes away while the decryption is still pending
        channel->close();
        return keys.decryptBytesAsync("ROOM1234", ct, iv);
    });

    const EncryptionResult sealed = keys.encryptBytes("ROOM1234", patternBytes(5000));
    sender->sendFile({"late.bin", "", sealed.ciphertext}, true, sealed.iv);

    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    spin(100);
    EXPECT_EQ(recv.last().status, TransferStatus::Failed);
    EXPECT_EQ(recv.last().error, QString("Data channel closed"));
    EXPECT_TRUE(files.isEmpty());
}

TEST_F(FileTransferTest, IceBlipWithOpenChannelKeepsSending) {
    stallAfterFirstChunk();
    const QString id = sender->sendFile({"blip", "", patternBytes(6 * FileTransfer::ChunkSize)});
    ASSERT_TRUE(waitUntil([&] { return !recv.isEmpty(); }));

    a->setConnectionState(PeerConnection::ConnectionState::Disconnected);
    net.binaryHook = nullptr;
    a->drain();
    ASSERT_TRUE(waitUntil([&] { return senderDone() && receiverDone(); }));
    EXPECT_EQ(sent.last().status, TransferStatus::Completed) << qPrintable(sent.last().error);
    EXPECT_EQ(recv.last().status, TransferStatus::Completed);
    EXPECT_TRUE(receiver->receivedFile(id));
}

TEST_F(FileTransferTest, TerminalTransfersStayQuiet) {
    const QString id = sender->sendFile({"q", "", patternBytes(10)});
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    const int before = recv.size();

    emit b->binaryReceived(FileTransfer::encodeChunk(id, 0, true, patternBytes(10)));
    sender->cancelTransfer(id);
    spin(20);
    EXPECT_EQ(recv.size(), before);
    EXPECT_EQ(recv.last().status, TransferStatus::Completed);
}

TEST_F(FileTransferTest, CleanupForgetsTransfer) {
    const QString id = sender->sendFile({"x", "", patternBytes(10)});
    ASSERT_TRUE(waitUntil([&] { return receiverDone(); }));
    receiver->cleanupTransfer(id);
    EXPECT_FALSE(receiver->receivedFile(id));
    EXPECT_FALSE(receiver->transferMetadata(id));
}

TEST(FileTransferStandaloneTest, SendWithoutOpenChannelFails) {
    LoopbackNetwork net;
    LoopbackPeerConnection c(&net, "alice", "bob");
    FileTransfer ft(&c);
    QList<TransferProgress> events;
    QObject::connect(&ft, &FileTransfer::progress, [&](const TransferProgress& p) { events << p; });

    ft.sendFile({"f", "", QByteArray("x")});
    ASSERT_FALSE(events.isEmpty());
    EXPECT_EQ(events.last().status, TransferStatus::Failed);
    EXPECT_EQ(events.last().error, QString("Data channel not open"));
}

TEST(FileTransferStandaloneTest, ChunkFraming) {
    const QString id = "0f8fad5b-d9cb-469f-a165-70867728950e";
    const QByteArray frame = FileTransfer::encodeChunk(id, 0x01020304, true, "abc");
    ASSERT_EQ(frame.size(), FileTransfer::ChunkHeaderBytes + 3);
    EXPECT_EQ(frame.mid(36, 4), QByteArray("\x04\x03\x02\x01", 4));
    EXPECT_EQ(frame.at(40), char(0x01));

    FileTransfer::Chunk c;
    ASSERT_TRUE(FileTransfer::decodeChunk(frame, &c));
    EXPECT_EQ(c.transferId, id);
    EXPECT_EQ(c.index, 0x01020304u);
    EXPECT_TRUE(c.isLast);
    EXPECT_EQ(c.data, QByteArray("abc"));

    EXPECT_FALSE(FileTransfer::decodeChunk(frame.left(FileTransfer::ChunkHeaderBytes - 1), &c));

    EXPECT_EQ(FileTransfer::chunkCount(0), 1);
    EXPECT_EQ(FileTransfer::chunkCount(FileTransfer::ChunkSize), 1);
    EXPECT_EQ(FileTransfer::chunkCount(FileTransfer::ChunkSize + 1), 2);
}
