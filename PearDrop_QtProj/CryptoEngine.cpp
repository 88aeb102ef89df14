#include "CryptoEngine.hpp"
#include <sodium.h>
#include <QCryptographicHash>
#include <QPasswordDigestor>
#include <QDateTime>
#include <QJsonParseError>
#include <QtConcurrent/QtConcurrentRun>
#include <QtEndian>
#include <stdexcept>

// shared with the browser clients; changing it orphans every existing room key hash
static const char kKeyVerificationMarker[] = "airshare-key-verification";
static const char kRoomCodeCharset[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";

CryptoEngine::CryptoEngine() {
    if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
    if (!crypto_aead_aes256gcm_is_available())
        throw std::runtime_error("AES-256-GCM is not supported on this CPU");
}

DerivedKey CryptoEngine::deriveKey(const QString& password, const QByteArray& salt) const {
    DerivedKey out;
    out.salt = salt.isEmpty() ? randomBytes(SaltBytes) : salt;
    out.key = QPasswordDigestor::deriveKeyPbkdf2(QCryptographicHash::Sha256,
                                                 password.toUtf8(), out.salt,
                                                 Pbkdf2Iterations, KeyBytes);
    return out;
}

QByteArray CryptoEngine::generateRandomKey() const {
    return randomBytes(KeyBytes);
}

QByteArray CryptoEngine::aeadSeal(const QByteArray& plaintext, const QByteArray& key,
                                  const unsigned char* nonce) const {
    QByteArray out;
    out.resize(plaintext.size() + crypto_aead_aes256gcm_ABYTES);

    unsigned long long clen = 0;
    crypto_aead_aes256gcm_encrypt(
        reinterpret_cast<unsigned char*>(out.data()), &clen,
        reinterpret_cast<const unsigned char*>(plaintext.constData()), plaintext.size(),
        nullptr, 0,
        nullptr, nonce,
        reinterpret_cast<const unsigned char*>(key.constData())
        );

    out.resize(int(clen));
    return out;
}

QString CryptoEngine::createKeyHash(const QByteArray& key) const {
    if (key.size() != KeyBytes) return {};

    // zero IV so the hash is reproducible per key
    unsigned char nonce[crypto_aead_aes256gcm_NPUBBYTES] = {};
    const QByteArray marker(kKeyVerificationMarker);
    return sha256Hex(aeadSeal(marker, key, nonce));
}

bool CryptoEngine::verifyPassword(const QString& password, const QString& saltB64,
                                  const QString& expectedHash, QByteArray* derivedKey) const {
    bool ok = false;
    const QByteArray salt = fromBase64(saltB64, &ok);
    if (!ok || salt.isEmpty()) return false;

    DerivedKey derived = deriveKey(password, salt);
    const QByteArray actual = createKeyHash(derived.key).toLatin1();
    const QByteArray expected = expectedHash.toLatin1();
    const bool match = !actual.isEmpty() && actual.size() == expected.size()
        && sodium_memcmp(actual.constData(), expected.constData(), actual.size()) == 0;

    if (match && derivedKey) *derivedKey = QByteArray(derived.key.constData(), derived.key.size());
    sodium_memzero(derived.key.data(), derived.key.size());
    return match;
}

EncryptionResult CryptoEngine::encrypt(const QByteArray& data, const QByteArray& key) const {
    if (key.size() != KeyBytes) return {};

    unsigned char nonce[crypto_aead_aes256gcm_NPUBBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    EncryptionResult result;
    result.ciphertext = aeadSeal(data, key, nonce);
    result.iv = toBase64(QByteArray(reinterpret_cast<const char*>(nonce), sizeof(nonce)));
    return result;
}

QByteArray CryptoEngine::decrypt(const QByteArray& ciphertext, const QByteArray& key,
                                 const QString& ivB64, CryptoError* error) const {
    auto fail = [error](CryptoError e) {
        if (error) *error = e;
        return QByteArray();
    };

    if (key.size() != KeyBytes) return fail(CryptoError::InvalidKey);

    bool ok = false;
    const QByteArray iv = fromBase64(ivB64, &ok);
    if (!ok || iv.size() != crypto_aead_aes256gcm_NPUBBYTES)
        return fail(CryptoError::DecodeError);

    if (ciphertext.size() < crypto_aead_aes256gcm_ABYTES)
        return fail(CryptoError::AuthenticationFailure);

    QByteArray out;
    out.resize(ciphertext.size() - crypto_aead_aes256gcm_ABYTES);

    unsigned long long plen = 0;
    if (crypto_aead_aes256gcm_decrypt(
            reinterpret_cast<unsigned char*>(out.data()), &plen,
            nullptr,
            reinterpret_cast<const unsigned char*>(ciphertext.constData()), ciphertext.size(),
            nullptr, 0,
            reinterpret_cast<const unsigned char*>(iv.constData()),
            reinterpret_cast<const unsigned char*>(key.constData())
            ) != 0) {
        return fail(CryptoError::AuthenticationFailure);
    }

    out.resize(int(plen));
    if (error) *error = CryptoError::None;
    return out;
}

EncryptionResult CryptoEngine::encryptString(const QString& text, const QByteArray& key) const {
    return encrypt(text.toUtf8(), key);
}

QString CryptoEngine::decryptString(const QByteArray& ciphertext, const QByteArray& key,
                                    const QString& ivB64, CryptoError* error) const {
    CryptoError err = CryptoError::None;
    const QByteArray plain = decrypt(ciphertext, key, ivB64, &err);
    if (error) *error = err;
    if (err != CryptoError::None) return {};
    return QString::fromUtf8(plain);
}

EncryptionResult CryptoEngine::encryptJson(const QJsonDocument& doc, const QByteArray& key) const {
    return encrypt(doc.toJson(QJsonDocument::Compact), key);
}

QJsonDocument CryptoEngine::decryptJson(const QByteArray& ciphertext, const QByteArray& key,
                                        const QString& ivB64, CryptoError* error) const {
    CryptoError err = CryptoError::None;
    const QByteArray plain = decrypt(ciphertext, key, ivB64, &err);
    if (err != CryptoError::None) {
        if (error) *error = err;
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(plain, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) *error = CryptoError::DecodeError;
        return {};
    }
    if (error) *error = CryptoError::None;
    return doc;
}

EncryptedFile CryptoEngine::encryptFile(const FilePayload& file, const QByteArray& key) const {
    const EncryptionResult r = encrypt(file.data, key);

    EncryptedFile out;
    out.originalName = file.name;
    out.originalType = file.mimeType;
    if (!r.isValid()) return out;
    out.file = FilePayload{file.name + QStringLiteral(".encrypted"),
                           QStringLiteral("application/octet-stream"), r.ciphertext};
    out.iv = r.iv;
    return out;
}

FilePayload CryptoEngine::decryptFile(const EncryptedFile& file, const QByteArray& key,
                                      CryptoError* error) const {
    CryptoError err = CryptoError::None;
    const QByteArray plain = decrypt(file.file.data, key, file.iv, &err);
    if (error) *error = err;
    if (err != CryptoError::None) return {};
    return FilePayload{file.originalName, file.originalType, plain};
}

bool CryptoEngine::encryptStream(QIODevice* in, const QByteArray& key,
                                 const std::function<bool(const EncryptedChunk&)>& sink,
                                 int chunkSize) const {
    if (!in || !in->isReadable() || chunkSize <= 0 || key.size() != KeyBytes) return false;

    QByteArray buffer(chunkSize, Qt::Uninitialized);
    int index = 0;
    for (;;) {
        qint64 filled = 0;
        while (filled < chunkSize) {
            const qint64 n = in->read(buffer.data() + filled, chunkSize - filled);
            if (n < 0) return false;
            if (n == 0) break;
            filled += n;
        }
        if (filled == 0) return true;

        const EncryptionResult r = encrypt(buffer.left(int(filled)), key);
        if (!sink(EncryptedChunk{index++, r.ciphertext, r.iv})) return false;
        if (filled < chunkSize) return true;
    }
}

QByteArray CryptoEngine::decryptChunks(const QList<EncryptedChunk>& chunks, const QByteArray& key,
                                       CryptoError* error) const {
    QByteArray out;
    for (const EncryptedChunk& c : chunks) {
        CryptoError err = CryptoError::None;
        const QByteArray plain = decrypt(c.ciphertext, key, c.iv, &err);
        if (err != CryptoError::None) {
            if (error) *error = err;
            return {};
        }
        out.append(plain);
    }
    if (error) *error = CryptoError::None;
    return out;
}

QByteArray CryptoEngine::createEncryptedPackage(const QByteArray& data, const QByteArray& key,
                                                const QJsonObject& metadata) const {
    const EncryptionResult r = encrypt(data, key);
    if (!r.isValid()) return {};

    QJsonObject header;
    header["iv"] = r.iv;
    if (!metadata.isEmpty()) header["metadata"] = metadata;
    header["timestamp"] = double(QDateTime::currentMSecsSinceEpoch());
    const QByteArray headerBytes = QJsonDocument(header).toJson(QJsonDocument::Compact);

    char len[4];
    qToLittleEndian<quint32>(quint32(headerBytes.size()), len);

    QByteArray out;
    out.reserve(4 + headerBytes.size() + r.ciphertext.size());
    out.append(len, 4);
    out.append(headerBytes);
    out.append(r.ciphertext);
    return out;
}

OpenedPackage CryptoEngine::openEncryptedPackage(const QByteArray& package, const QByteArray& key,
                                                 CryptoError* error) const {
    auto fail = [error](CryptoError e) {
        if (error) *error = e;
        return OpenedPackage();
    };

    if (package.size() < 4) return fail(CryptoError::DecodeError);
    const quint32 headerLen = qFromLittleEndian<quint32>(package.constData());
    if (headerLen > quint32(package.size() - 4)) return fail(CryptoError::DecodeError);

    QJsonParseError parseError;
    const QJsonDocument header = QJsonDocument::fromJson(package.mid(4, int(headerLen)), &parseError);
    if (parseError.error != QJsonParseError::NoError || !header.isObject())
        return fail(CryptoError::DecodeError);

    const QJsonObject h = header.object();
    CryptoError err = CryptoError::None;
    OpenedPackage out;
    out.data = decrypt(package.mid(4 + int(headerLen)), key, h.value("iv").toString(), &err);
    if (err != CryptoError::None) return fail(err);

    out.metadata = h.value("metadata").toObject();
    out.timestamp = qint64(h.value("timestamp").toDouble());
    if (error) *error = CryptoError::None;
    return out;
}

QByteArray CryptoEngine::wrapKey(const QByteArray& keyToWrap, const QByteArray& wrappingKey) const {
    if (keyToWrap.size() != KeyBytes || wrappingKey.size() != KeyBytes) return {};

    unsigned char nonce[crypto_aead_aes256gcm_NPUBBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    QByteArray out(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.append(aeadSeal(keyToWrap, wrappingKey, nonce));
    return out;
}

QByteArray CryptoEngine::unwrapKey(const QByteArray& wrapped, const QByteArray& unwrappingKey,
                                   CryptoError* error) const {
    if (wrapped.size() < IvBytes + TagBytes) {
        if (error) *error = CryptoError::DecodeError;
        return {};
    }

    CryptoError err = CryptoError::None;
    QByteArray key = decrypt(wrapped.mid(IvBytes), unwrappingKey, toBase64(wrapped.left(IvBytes)), &err);
    if (err == CryptoError::None && key.size() != KeyBytes) {
        sodium_memzero(key.data(), key.size());
        err = CryptoError::InvalidKey;
    }
    if (error) *error = err;
    if (err != CryptoError::None) return {};
    return key;
}

QFuture<DerivedKey> CryptoEngine::deriveKeyAsync(const QString& password, const QByteArray& salt) const {
    const CryptoEngine engine(*this);
    return QtConcurrent::run([engine, password, salt]() {
        return engine.deriveKey(password, salt);
    });
}

QFuture<QByteArray> CryptoEngine::verifyPasswordAsync(const QString& password, const QString& saltB64,
                                                      const QString& expectedHash) const {
    const CryptoEngine engine(*this);
    return QtConcurrent::run([engine, password, saltB64, expectedHash]() {
        QByteArray key;
        if (!engine.verifyPassword(password, saltB64, expectedHash, &key)) return QByteArray();
        return key;
    });
}

QFuture<EncryptionResult> CryptoEngine::encryptAsync(const QByteArray& data, const QByteArray& key) const {
    const CryptoEngine engine(*this);
    return QtConcurrent::run([engine, data, key]() {
        return engine.encrypt(data, key);
    });
}

QFuture<DecryptionResult> CryptoEngine::decryptAsync(const QByteArray& ciphertext, const QByteArray& key,
                                                     const QString& ivB64) const {
    const CryptoEngine engine(*this);
    return QtConcurrent::run([engine, ciphertext, key, ivB64]() {
        DecryptionResult r;
        r.data = engine.decrypt(ciphertext, key, ivB64, &r.error);
        return r;
    });
}

QFuture<QString> CryptoEngine::sha256HexAsync(const QByteArray& data) {
    return QtConcurrent::run([data]() { return sha256Hex(data); });
}

QByteArray CryptoEngine::randomBytes(int count) const {
    QByteArray out;
    out.resize(count);
    randombytes_buf(out.data(), size_t(count));
    return out;
}

QString CryptoEngine::generateRoomCode(int length) const {
    const int charsetSize = int(sizeof(kRoomCodeCharset)) - 1;
    QString code;
    code.reserve(length);
    for (int i = 0; i < length; ++i)
        code.append(QLatin1Char(kRoomCodeCharset[randombytes_uniform(uint32_t(charsetSize))]));
    return code;
}

QString CryptoEngine::toBase64(const QByteArray& data) {
    const size_t maxlen = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    QByteArray out;
    out.resize(int(maxlen));
    sodium_bin2base64(out.data(), out.size(),
                      reinterpret_cast<const unsigned char*>(data.constData()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    return QString::fromLatin1(out.constData());
}

QByteArray CryptoEngine::fromBase64(const QString& s, bool* ok) {
    QByteArray in = s.toLatin1();
    QByteArray out;
    out.resize(in.size());
    size_t bin_len = 0;
    if (sodium_base642bin(reinterpret_cast<unsigned char*>(out.data()), out.size(),
                          in.constData(), in.size(),
                          nullptr, &bin_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        if (ok) *ok = false;
        return {};
    }
    out.resize(int(bin_len));
    if (ok) *ok = true;
    return out;
}

QString CryptoEngine::sha256Hex(const QByteArray& data) {
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, reinterpret_cast<const unsigned char*>(data.constData()),
                       data.size());

    char hex[crypto_hash_sha256_BYTES * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), digest, sizeof(digest));
    return QString::fromLatin1(hex);
}

QString CryptoEngine::errorString(CryptoError error) {
    switch (error) {
    case CryptoError::None: return QStringLiteral("no error");
    case CryptoError::DecodeError: return QStringLiteral("malformed encoding");
    case CryptoError::AuthenticationFailure: return QStringLiteral("decryption authentication failure");
    case CryptoError::InvalidKey: return QStringLiteral("invalid key length");
    case CryptoError::MissingKey: return QStringLiteral("no encryption key for room");
    }
    return {};
}
