#pragma once
#include <QByteArray>
#include <QFuture>
#include <QIODevice>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <functional>

#include "TransferTypes.hpp"

enum class CryptoError {
    None,
    DecodeError,            // malformed base64 / IV / JSON / package
    AuthenticationFailure,  // AEAD tag mismatch
    InvalidKey,
    MissingKey              // no key loaded for the room
};

struct DerivedKey {
    QByteArray key;   // 32
    QByteArray salt;  // 16
};

struct EncryptionResult {
    QByteArray ciphertext;  // includes the 16-byte tag
    QString iv;             // base64

    bool isValid() const { return !iv.isEmpty(); }
};

struct DecryptionResult {
    QByteArray data;
    CryptoError error = CryptoError::None;

    bool ok() const { return error == CryptoError::None; }
};

// One independently sealed piece of a stream.
struct EncryptedChunk {
    int index = 0;
    QByteArray ciphertext;
    QString iv;
};

// Sealed file content travels as "<name>.encrypted", application/octet-stream;
// the original name and type ride alongside.
struct EncryptedFile {
    FilePayload file;
    QString iv;
    QString originalName;
    QString originalType;
};

struct OpenedPackage {
    QByteArray data;
    QJsonObject metadata;
    qint64 timestamp = 0;  // ms since epoch, from the package header
};

class CryptoEngine {
public:
    static constexpr int KeyBytes = 32;
    static constexpr int SaltBytes = 16;
    static constexpr int IvBytes = 12;
    static constexpr int TagBytes = 16;
    static constexpr int Pbkdf2Iterations = 100000;
    static constexpr int StreamChunkSize = 64 * 1024;

    // Throws std::runtime_error if libsodium cannot start or the CPU has no
    // AES-256-GCM support.
    CryptoEngine();

    // PBKDF2-HMAC-SHA256. An empty salt means "generate a fresh one".
    DerivedKey deriveKey(const QString& password, const QByteArray& salt = {}) const;
    QByteArray generateRandomKey() const;

    // Hex SHA-256 of the verification marker encrypted under key with a zero IV.
    // Reproducible for the same key, reveals nothing about it.
    QString createKeyHash(const QByteArray& key) const;

    // Never throws. Malformed salt or wrong password both yield false. On
    // success *derivedKey (optional) receives the key that verified.
    bool verifyPassword(const QString& password, const QString& saltB64,
                        const QString& expectedHash, QByteArray* derivedKey = nullptr) const;

    // AES-256-GCM. Fresh random 96-bit IV per call.
    EncryptionResult encrypt(const QByteArray& data, const QByteArray& key) const;
    QByteArray decrypt(const QByteArray& ciphertext, const QByteArray& key,
                       const QString& ivB64, CryptoError* error = nullptr) const;

    EncryptionResult encryptString(const QString& text, const QByteArray& key) const;
    QString decryptString(const QByteArray& ciphertext, const QByteArray& key,
                          const QString& ivB64, CryptoError* error = nullptr) const;

    EncryptionResult encryptJson(const QJsonDocument& doc, const QByteArray& key) const;
    QJsonDocument decryptJson(const QByteArray& ciphertext, const QByteArray& key,
                              const QString& ivB64, CryptoError* error = nullptr) const;

    EncryptedFile encryptFile(const FilePayload& file, const QByteArray& key) const;
    FilePayload decryptFile(const EncryptedFile& file, const QByteArray& key,
                            CryptoError* error = nullptr) const;

    // Reads in until EOF, sealing every chunkSize bytes on its own. sink returning
    // false stops early; so does a read error. An empty stream yields no chunks.
    bool encryptStream(QIODevice* in, const QByteArray& key,
                       const std::function<bool(const EncryptedChunk&)>& sink,
                       int chunkSize = StreamChunkSize) const;
    // Concatenates the opened chunks in the order given; the first failure wins.
    QByteArray decryptChunks(const QList<EncryptedChunk>& chunks, const QByteArray& key,
                             CryptoError* error = nullptr) const;

    // [u32 LE header length][header JSON {iv, metadata, timestamp}][ciphertext]
    QByteArray createEncryptedPackage(const QByteArray& data, const QByteArray& key,
                                      const QJsonObject& metadata = {}) const;
    OpenedPackage openEncryptedPackage(const QByteArray& package, const QByteArray& key,
                                       CryptoError* error = nullptr) const;

    // [12 byte IV][sealed key]
    QByteArray wrapKey(const QByteArray& keyToWrap, const QByteArray& wrappingKey) const;
    QByteArray unwrapKey(const QByteArray& wrapped, const QByteArray& unwrappingKey,
                         CryptoError* error = nullptr) const;

    // Same operations on the global thread pool; results are delivered through
    // the future, the engine itself is not referenced after the call returns.
    QFuture<DerivedKey> deriveKeyAsync(const QString& password, const QByteArray& salt = {}) const;
    // Resolves to the derived key, or an empty array when the password is wrong.
    QFuture<QByteArray> verifyPasswordAsync(const QString& password, const QString& saltB64,
                                            const QString& expectedHash) const;
    QFuture<EncryptionResult> encryptAsync(const QByteArray& data, const QByteArray& key) const;
    QFuture<DecryptionResult> decryptAsync(const QByteArray& ciphertext, const QByteArray& key,
                                           const QString& ivB64) const;
    static QFuture<QString> sha256HexAsync(const QByteArray& data);

    QByteArray randomBytes(int count) const;
    QString generateRoomCode(int length = 8) const;

    // standard base64 (with padding), as exchanged with browser clients
    static QString toBase64(const QByteArray& data);
    static QByteArray fromBase64(const QString& s, bool* ok = nullptr);

    static QString sha256Hex(const QByteArray& data);
    static QString errorString(CryptoError error);

private:
    QByteArray aeadSeal(const QByteArray& plaintext, const QByteArray& key,
                        const unsigned char* nonce) const;
};
