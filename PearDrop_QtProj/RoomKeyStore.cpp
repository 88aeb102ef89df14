#include "RoomKeyStore.hpp"
#include "FutureWatch.hpp"

#include <QtConcurrent/QtConcurrentRun>
#include <sodium.h>
#include <utility>

RoomKeyStore::RoomKeyStore(const CryptoEngine* crypto)
    : m_crypto(crypto) {}

RoomKeyStore::~RoomKeyStore() {
    clearAllKeys();
}

void RoomKeyStore::wipe(RoomKeyInfo& info) {
    if (!info.key.isEmpty())
        sodium_memzero(info.key.data(), info.key.size());
    info.key.clear();
}

void RoomKeyStore::store(const QString& roomCode, RoomKeyInfo info) {
    auto it = m_roomKeys.find(roomCode);
    if (it != m_roomKeys.end()) wipe(it.value());
    m_roomKeys[roomCode] = std::move(info);
}

EncryptionMetadata RoomKeyStore::deriveKeyForRoom(const QString& roomCode, const QString& password) {
    DerivedKey derived = m_crypto->deriveKey(password);

    RoomKeyInfo info;
    info.salt = CryptoEngine::toBase64(derived.salt);
    info.keyHash = m_crypto->createKeyHash(derived.key);
    info.key = std::move(derived.key);

    const EncryptionMetadata meta{info.salt, info.keyHash};
    store(roomCode, std::move(info));
    return meta;
}

bool RoomKeyStore::unlockRoom(const QString& roomCode, const QString& password,
                              const QString& saltB64, const QString& expectedKeyHash) {
    QByteArray key;
    if (!m_crypto->verifyPassword(password, saltB64, expectedKeyHash, &key))
        return false;

    RoomKeyInfo info;
    info.key = std::move(key);
    info.salt = saltB64;
    info.keyHash = expectedKeyHash;

    store(roomCode, std::move(info));
    return true;
}

void RoomKeyStore::deriveKeyForRoomAsync(QObject* context, const QString& roomCode,
                                         const QString& password,
                                         std::function<void(const EncryptionMetadata&)> done) {
    const CryptoEngine crypto(*m_crypto);
    QFuture<RoomKeyInfo> future = QtConcurrent::run([crypto, password]() {
        DerivedKey derived = crypto.deriveKey(password);
        RoomKeyInfo info;
        info.salt = CryptoEngine::toBase64(derived.salt);
        info.keyHash = crypto.createKeyHash(derived.key);
        info.key = std::move(derived.key);
        return info;
    });

    whenFinished(context, future, [this, roomCode, done](RoomKeyInfo info) {
        const EncryptionMetadata meta{info.salt, info.keyHash};
        store(roomCode, std::move(info));
        if (done) done(meta);
    });
}

void RoomKeyStore::unlockRoomAsync(QObject* context, const QString& roomCode, const QString& password,
                                   const QString& saltB64, const QString& expectedKeyHash,
                                   std::function<void(bool)> done) {
    whenFinished(context, m_crypto->verifyPasswordAsync(password, saltB64, expectedKeyHash),
                 [this, roomCode, saltB64, expectedKeyHash, done](QByteArray key) {
        const bool ok = !key.isEmpty();
        if (ok) store(roomCode, RoomKeyInfo{std::move(key), saltB64, expectedKeyHash});
        if (done) done(ok);
    });
}

bool RoomKeyStore::hasKeyForRoom(const QString& roomCode) const {
    return m_roomKeys.contains(roomCode);
}

EncryptionMetadata RoomKeyStore::metadataForRoom(const QString& roomCode) const {
    const auto it = m_roomKeys.constFind(roomCode);
    if (it == m_roomKeys.constEnd()) return {};
    return {it->salt, it->keyHash};
}

void RoomKeyStore::clearKeyForRoom(const QString& roomCode) {
    auto it = m_roomKeys.find(roomCode);
    if (it == m_roomKeys.end()) return;
    wipe(it.value());
    m_roomKeys.erase(it);
}

void RoomKeyStore::clearAllKeys() {
    for (auto it = m_roomKeys.begin(); it != m_roomKeys.end(); ++it)
        wipe(it.value());
    m_roomKeys.clear();
}

EncryptionResult RoomKeyStore::encryptBytes(const QString& roomCode, const QByteArray& data,
                                            CryptoError* error) const {
    const auto it = m_roomKeys.constFind(roomCode);
    if (it == m_roomKeys.constEnd()) {
        if (error) *error = CryptoError::MissingKey;
        return {};
    }
    if (error) *error = CryptoError::None;
    return m_crypto->encrypt(data, it->key);
}

QByteArray RoomKeyStore::decryptBytes(const QString& roomCode, const QByteArray& ciphertext,
                                      const QString& ivB64, CryptoError* error) const {
    const auto it = m_roomKeys.constFind(roomCode);
    if (it == m_roomKeys.constEnd()) {
        if (error) *error = CryptoError::MissingKey;
        return {};
    }
    return m_crypto->decrypt(ciphertext, it->key, ivB64, error);
}

const RoomKeyStore::RoomKeyInfo* RoomKeyStore::find(const QString& roomCode, CryptoError* error) const {
    const auto it = m_roomKeys.constFind(roomCode);
    if (it == m_roomKeys.constEnd()) {
        if (error) *error = CryptoError::MissingKey;
        return nullptr;
    }
    return &it.value();
}

QFuture<EncryptionResult> RoomKeyStore::encryptBytesAsync(const QString& roomCode,
                                                          const QByteArray& data) const {
    const RoomKeyInfo* info = find(roomCode, nullptr);
    if (!info) return QtConcurrent::run([]() { return EncryptionResult(); });
    return m_crypto->encryptAsync(data, info->key);
}

QFuture<DecryptionResult> RoomKeyStore::decryptBytesAsync(const QString& roomCode,
                                                          const QByteArray& ciphertext,
                                                          const QString& ivB64) const {
    const RoomKeyInfo* info = find(roomCode, nullptr);
    if (!info) {
        return QtConcurrent::run([]() {
            DecryptionResult r;
            r.error = CryptoError::MissingKey;
            return r;
        });
    }
    return m_crypto->decryptAsync(ciphertext, info->key, ivB64);
}

EncryptedFile RoomKeyStore::encryptFile(const QString& roomCode, const FilePayload& file,
                                        CryptoError* error) const {
    const RoomKeyInfo* info = find(roomCode, error);
    if (!info) return {};
    if (error) *error = CryptoError::None;
    return m_crypto->encryptFile(file, info->key);
}

FilePayload RoomKeyStore::decryptFile(const QString& roomCode, const EncryptedFile& file,
                                      CryptoError* error) const {
    const RoomKeyInfo* info = find(roomCode, error);
    if (!info) return {};
    return m_crypto->decryptFile(file, info->key, error);
}

QByteArray RoomKeyStore::createEncryptedPackage(const QString& roomCode, const QByteArray& data,
                                                const QJsonObject& metadata,
                                                CryptoError* error) const {
    const RoomKeyInfo* info = find(roomCode, error);
    if (!info) return {};
    if (error) *error = CryptoError::None;
    return m_crypto->createEncryptedPackage(data, info->key, metadata);
}

OpenedPackage RoomKeyStore::openEncryptedPackage(const QString& roomCode, const QByteArray& package,
                                                 CryptoError* error) const {
    const RoomKeyInfo* info = find(roomCode, error);
    if (!info) return {};
    return m_crypto->openEncryptedPackage(package, info->key, error);
}

EncryptedContent RoomKeyStore::encryptString(const QString& roomCode, const QString& text,
                                             CryptoError* error) const {
    const EncryptionResult r = encryptBytes(roomCode, text.toUtf8(), error);
    if (!r.isValid()) return {};
    return {CryptoEngine::toBase64(r.ciphertext), r.iv};
}

QString RoomKeyStore::decryptString(const QString& roomCode, const EncryptedContent& content,
                                    CryptoError* error) const {
    bool ok = false;
    const QByteArray ct = CryptoEngine::fromBase64(content.data, &ok);
    if (!ok) {
        if (error) *error = CryptoError::DecodeError;
        return {};
    }

    CryptoError err = CryptoError::None;
    const QByteArray plain = decryptBytes(roomCode, ct, content.iv, &err);
    if (error) *error = err;
    if (err != CryptoError::None) return {};
    return QString::fromUtf8(plain);
}

EncryptedContent RoomKeyStore::encryptJson(const QString& roomCode, const QJsonDocument& doc,
                                           CryptoError* error) const {
    const auto it = m_roomKeys.constFind(roomCode);
    if (it == m_roomKeys.constEnd()) {
        if (error) *error = CryptoError::MissingKey;
        return {};
    }
    const EncryptionResult r = m_crypto->encryptJson(doc, it->key);
    if (error) *error = CryptoError::None;
    return {CryptoEngine::toBase64(r.ciphertext), r.iv};
}

QJsonDocument RoomKeyStore::decryptJson(const QString& roomCode, const EncryptedContent& content,
                                        CryptoError* error) const {
    const auto it = m_roomKeys.constFind(roomCode);
    if (it == m_roomKeys.constEnd()) {
        if (error) *error = CryptoError::MissingKey;
        return {};
    }

    bool ok = false;
    const QByteArray ct = CryptoEngine::fromBase64(content.data, &ok);
    if (!ok) {
        if (error) *error = CryptoError::DecodeError;
        return {};
    }
    return m_crypto->decryptJson(ct, it->key, content.iv, error);
}
