#pragma once
#include <QFuture>
#include <QHash>
#include <QString>
#include <functional>
#include "CryptoEngine.hpp"

class QObject;

// Non-secret: safe to hand to the relay/API so other members can unlock the room.
struct EncryptionMetadata {
    QString salt;     // base64
    QString keyHash;  // hex
};

struct EncryptedContent {
    QString data;  // base64 ciphertext
    QString iv;    // base64
};

// Per-session cache of room keys. Keys stay in memory only and are wiped on
// removal; nothing here is ever serialized.
class RoomKeyStore {
public:
    explicit RoomKeyStore(const CryptoEngine* crypto);
    ~RoomKeyStore();

    RoomKeyStore(const RoomKeyStore&) = delete;
    RoomKeyStore& operator=(const RoomKeyStore&) = delete;

    EncryptionMetadata deriveKeyForRoom(const QString& roomCode, const QString& password);

    // Stores the key only if the password verifies against expectedKeyHash.
    bool unlockRoom(const QString& roomCode, const QString& password,
                    const QString& saltB64, const QString& expectedKeyHash);

    // Same as above with the PBKDF2 work on the thread pool. done runs on
    // context's thread; context must not outlive this store.
    void deriveKeyForRoomAsync(QObject* context, const QString& roomCode, const QString& password,
                               std::function<void(const EncryptionMetadata&)> done);
    void unlockRoomAsync(QObject* context, const QString& roomCode, const QString& password,
                         const QString& saltB64, const QString& expectedKeyHash,
                         std::function<void(bool)> done);

    bool hasKeyForRoom(const QString& roomCode) const;
    EncryptionMetadata metadataForRoom(const QString& roomCode) const;
    void clearKeyForRoom(const QString& roomCode);
    void clearAllKeys();

    EncryptionResult encryptBytes(const QString& roomCode, const QByteArray& data,
                                  CryptoError* error = nullptr) const;
    QByteArray decryptBytes(const QString& roomCode, const QByteArray& ciphertext,
                            const QString& ivB64, CryptoError* error = nullptr) const;

    // The key is looked up now; the cipher work runs on the thread pool. A
    // missing key resolves to an invalid result / MissingKey.
    QFuture<EncryptionResult> encryptBytesAsync(const QString& roomCode, const QByteArray& data) const;
    QFuture<DecryptionResult> decryptBytesAsync(const QString& roomCode, const QByteArray& ciphertext,
                                                const QString& ivB64) const;

    EncryptedFile encryptFile(const QString& roomCode, const FilePayload& file,
                              CryptoError* error = nullptr) const;
    FilePayload decryptFile(const QString& roomCode, const EncryptedFile& file,
                            CryptoError* error = nullptr) const;

    QByteArray createEncryptedPackage(const QString& roomCode, const QByteArray& data,
                                      const QJsonObject& metadata = {},
                                      CryptoError* error = nullptr) const;
    OpenedPackage openEncryptedPackage(const QString& roomCode, const QByteArray& package,
                                       CryptoError* error = nullptr) const;

    EncryptedContent encryptString(const QString& roomCode, const QString& text,
                                   CryptoError* error = nullptr) const;
    QString decryptString(const QString& roomCode, const EncryptedContent& content,
                          CryptoError* error = nullptr) const;

    EncryptedContent encryptJson(const QString& roomCode, const QJsonDocument& doc,
                                 CryptoError* error = nullptr) const;
    QJsonDocument decryptJson(const QString& roomCode, const EncryptedContent& content,
                              CryptoError* error = nullptr) const;

    const CryptoEngine* crypto() const { return m_crypto; }

private:
    struct RoomKeyInfo {
        QByteArray key;
        QString salt;
        QString keyHash;
    };

    void store(const QString& roomCode, RoomKeyInfo info);
    const RoomKeyInfo* find(const QString& roomCode, CryptoError* error) const;
    static void wipe(RoomKeyInfo& info);

    const CryptoEngine* m_crypto = nullptr;
    QHash<QString, RoomKeyInfo> m_roomKeys;
};
