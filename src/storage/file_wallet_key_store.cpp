#include "storage/file_wallet_key_store.h"
#include "storage/biometric_authenticator.h"
#include "errors.h"
#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <utility>

namespace WalletCore {

static const char* CHECK_DOMAIN = "wallet-key-check";

FileWalletKeyStore::FileWalletKeyStore(const QString& filePath,
                                       BiometricAuthenticator* authenticator,
                                       int keyVersion,
                                       int pinKdfIterations)
    : m_filePath(filePath)
    , m_authenticator(authenticator)
    , m_keyVersion(keyVersion)
    , m_pinKdfIterations(pinKdfIterations)
    , m_modified(false)
{
}

FileWalletKeyStore::~FileWalletKeyStore()
{
    if (m_modified) {
        qWarning() << "FileWalletKeyStore: Unsaved changes in" << m_filePath;
    }
    wipeBiometricKeys();
}

bool FileWalletKeyStore::load()
{
    QFile file(m_filePath);

    if (!file.exists()) {
        qDebug() << "FileWalletKeyStore: File doesn't exist, starting fresh:" << m_filePath;
        m_salts.clear();
        wipeBiometricKeys();
        return true; // Not an error
    }

    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QString("Failed to open file: %1").arg(file.errorString());
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    OPENSSL_cleanse(data.data(), static_cast<size_t>(data.size()));

    if (parseError.error != QJsonParseError::NoError) {
        m_lastError = QString("JSON parse error: %1").arg(parseError.errorString());
        return false;
    }

    if (!doc.isObject()) {
        m_lastError = "Root element must be an object";
        return false;
    }

    QJsonObject root = doc.object();
    m_salts.clear();
    wipeBiometricKeys();

    QJsonObject salts = root["salts"].toObject();
    for (auto it = salts.begin(); it != salts.end(); ++it) {
        bool ok = false;
        int version = it.key().toInt(&ok);
        QJsonObject entryObj = it.value().toObject();

        if (!ok || !entryObj.contains("salt")) {
            qWarning() << "FileWalletKeyStore: Invalid salt entry for version" << it.key();
            continue;
        }

        SaltEntry entry;
        entry.salt = QByteArray::fromHex(entryObj["salt"].toString().toUtf8());
        entry.biometrics = entryObj["biometrics"].toBool();
        entry.check = QByteArray::fromHex(entryObj["check"].toString().toUtf8());

        if (entry.salt.size() != SALT_LENGTH) {
            qWarning() << "FileWalletKeyStore: Invalid salt for version" << version;
            continue;
        }

        m_salts[version] = entry;
    }

    QJsonObject keys = root["biometricKeys"].toObject();
    for (auto it = keys.begin(); it != keys.end(); ++it) {
        bool ok = false;
        int version = it.key().toInt(&ok);
        QByteArray key = QByteArray::fromHex(it.value().toString().toUtf8());

        if (!ok || key.size() != KEY_LENGTH) {
            qWarning() << "FileWalletKeyStore: Invalid biometric key entry for version" << it.key();
            continue;
        }

        m_biometricKeys[version] = key;
    }

    qDebug() << "FileWalletKeyStore: Loaded" << m_salts.size() << "salts and"
             << m_biometricKeys.size() << "biometric keys from" << m_filePath;
    m_modified = false;
    return true;
}

bool FileWalletKeyStore::save()
{
    QFileInfo fileInfo(m_filePath);
    QDir dir = fileInfo.absoluteDir();
    if (!dir.exists() && !QDir().mkpath(dir.absolutePath())) {
        m_lastError = QString("Failed to create directory: %1").arg(dir.absolutePath());
        return false;
    }

    QJsonObject salts;
    for (auto it = m_salts.begin(); it != m_salts.end(); ++it) {
        QJsonObject entryObj;
        entryObj["salt"] = QString::fromUtf8(it.value().salt.toHex());
        entryObj["biometrics"] = it.value().biometrics;
        if (!it.value().check.isEmpty()) {
            entryObj["check"] = QString::fromUtf8(it.value().check.toHex());
        }
        salts[QString::number(it.key())] = entryObj;
    }

    QJsonObject keys;
    for (auto it = m_biometricKeys.begin(); it != m_biometricKeys.end(); ++it) {
        keys[QString::number(it.key())] = QString::fromUtf8(it.value().toHex());
    }

    QJsonObject root;
    root["salts"] = salts;
    root["biometricKeys"] = keys;

    QByteArray json = QJsonDocument(root).toJson(QJsonDocument::Indented);

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QString("Failed to open file for writing: %1").arg(file.errorString());
        return false;
    }

    qint64 written = file.write(json);
    file.close();
    OPENSSL_cleanse(json.data(), static_cast<size_t>(json.size()));

    if (written != json.size()) {
        m_lastError = "Failed to write complete file";
        return false;
    }

    qDebug() << "FileWalletKeyStore: Saved" << m_salts.size() << "salts to" << m_filePath;
    m_modified = false;
    return true;
}

std::optional<QByteArray> FileWalletKeyStore::getSalt(int version)
{
    auto it = m_salts.constFind(version);
    if (it == m_salts.constEnd()) {
        return std::nullopt;
    }
    return it.value().salt;
}

bool FileWalletKeyStore::canUseBiometryBackedWalletKey()
{
    return m_authenticator && m_authenticator->isAvailable();
}

void FileWalletKeyStore::createAndStoreSalt(bool useBiometrics, int version)
{
    SaltEntry entry;
    entry.salt = QByteArray(SALT_LENGTH, 0);
    entry.biometrics = useBiometrics;

    if (RAND_bytes(reinterpret_cast<unsigned char*>(entry.salt.data()), SALT_LENGTH) != 1) {
        m_lastError = "RAND_bytes failed to generate salt";
        throw KeychainError(KeychainError::Reason::StorageFailure, m_lastError);
    }

    // A new salt invalidates every key derived from the old one
    if (m_biometricKeys.contains(version)) {
        OPENSSL_cleanse(m_biometricKeys[version].data(), static_cast<size_t>(m_biometricKeys[version].size()));
        m_biometricKeys.remove(version);
    }

    m_salts[version] = entry;
    m_modified = true;

    qDebug() << "FileWalletKeyStore: Created salt for version" << version
             << "biometrics:" << useBiometrics;
    persist();
}

WalletKey FileWalletKeyStore::getWalletKeyUsingPin(const QString& pin, int version)
{
    if (!m_salts.contains(version)) {
        m_lastError = QString("No salt found for version %1").arg(version);
        throw KeychainError(KeychainError::Reason::NotFound, m_lastError);
    }

    SaltEntry& entry = m_salts[version];
    QByteArray key = derivePinKey(pin, entry.salt);
    QByteArray check = checkValue(key);

    if (entry.check.isEmpty()) {
        // First derivation for this salt fixes the PIN
        entry.check = check;
        m_modified = true;
        try {
            persist();
        } catch (const KeychainError&) {
            OPENSSL_cleanse(key.data(), static_cast<size_t>(key.size()));
            throw;
        }
    } else if (entry.check.size() != check.size() ||
               CRYPTO_memcmp(entry.check.constData(), check.constData(),
                             static_cast<size_t>(check.size())) != 0) {
        OPENSSL_cleanse(key.data(), static_cast<size_t>(key.size()));
        m_lastError = "Wrong PIN";
        qWarning() << "FileWalletKeyStore: PIN check failed for version" << version;
        throw KeychainError(KeychainError::Reason::WrongPin, m_lastError);
    }

    return WalletKey(std::move(key));
}

std::optional<WalletKey> FileWalletKeyStore::getWalletKeyUsingBiometrics(int version)
{
    if (!canUseBiometryBackedWalletKey()) {
        m_lastError = "Biometrics not available on this device";
        throw KeychainError(KeychainError::Reason::BiometricsUnavailable, m_lastError);
    }

    auto it = m_biometricKeys.constFind(version);
    if (it == m_biometricKeys.constEnd()) {
        qDebug() << "FileWalletKeyStore: No biometric key stored for version" << version;
        return std::nullopt;
    }

    BiometricAuthenticator::Result result = m_authenticator->authenticate("Unlock your wallet");
    switch (result) {
        case BiometricAuthenticator::Result::Success:
            break;
        case BiometricAuthenticator::Result::Cancelled:
            m_lastError = "User cancelled biometric authentication";
            throw KeychainError(KeychainError::Reason::UserCancelled, m_lastError);
        case BiometricAuthenticator::Result::Failed:
            m_lastError = "Biometric authentication failed";
            throw KeychainError(KeychainError::Reason::AuthenticationFailed, m_lastError);
    }

    // Deep copy so the slot keeps its own buffer
    return WalletKey(QByteArray(it.value().constData(), it.value().size()));
}

void FileWalletKeyStore::storeWalletKey(const WalletKey& key, int version)
{
    if (!canUseBiometryBackedWalletKey()) {
        m_lastError = "Biometrics not available on this device";
        throw KeychainError(KeychainError::Reason::BiometricsUnavailable, m_lastError);
    }

    if (key.isEmpty()) {
        m_lastError = "Cannot store an empty wallet key";
        throw KeychainError(KeychainError::Reason::Other, m_lastError);
    }

    if (m_biometricKeys.contains(version)) {
        OPENSSL_cleanse(m_biometricKeys[version].data(), static_cast<size_t>(m_biometricKeys[version].size()));
    }
    m_biometricKeys[version] = QByteArray(key.bytes().constData(), key.size());
    m_modified = true;

    qDebug() << "FileWalletKeyStore: Stored biometric key for version" << version;
    persist();
}

bool FileWalletKeyStore::hasBiometricKey(int version) const
{
    return m_biometricKeys.contains(version);
}

bool FileWalletKeyStore::removeWalletKey(int version)
{
    if (!m_biometricKeys.contains(version)) {
        m_lastError = QString("No biometric key found for version %1").arg(version);
        return false;
    }

    OPENSSL_cleanse(m_biometricKeys[version].data(), static_cast<size_t>(m_biometricKeys[version].size()));
    m_biometricKeys.remove(version);
    m_modified = true;

    qDebug() << "FileWalletKeyStore: Removed biometric key for version" << version;
    return true;
}

void FileWalletKeyStore::clear()
{
    if (!m_salts.isEmpty() || !m_biometricKeys.isEmpty()) {
        m_salts.clear();
        wipeBiometricKeys();
        m_modified = true;
        qDebug() << "FileWalletKeyStore: Cleared all salts and keys";
    }
}

void FileWalletKeyStore::persist()
{
    if (!save()) {
        qCritical() << "FileWalletKeyStore: Failed to persist:" << m_lastError;
        throw KeychainError(KeychainError::Reason::StorageFailure, m_lastError);
    }
}

QByteArray FileWalletKeyStore::derivePinKey(const QString& pin, const QByteArray& salt)
{
    QByteArray pinBytes = pin.toUtf8();
    QByteArray key(KEY_LENGTH, 0);

    int result = PKCS5_PBKDF2_HMAC(
        pinBytes.constData(), static_cast<int>(pinBytes.size()),
        reinterpret_cast<const unsigned char*>(salt.constData()), static_cast<int>(salt.size()),
        m_pinKdfIterations,
        EVP_sha256(),
        KEY_LENGTH,
        reinterpret_cast<unsigned char*>(key.data())
    );
    OPENSSL_cleanse(pinBytes.data(), static_cast<size_t>(pinBytes.size()));

    if (result != 1) {
        OPENSSL_cleanse(key.data(), static_cast<size_t>(key.size()));
        m_lastError = "PBKDF2 derivation failed";
        throw KeychainError(KeychainError::Reason::Other, m_lastError);
    }

    return key;
}

QByteArray FileWalletKeyStore::checkValue(const QByteArray& key)
{
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(QByteArray(CHECK_DOMAIN));
    hash.addData(key);
    return hash.result();
}

void FileWalletKeyStore::wipeBiometricKeys()
{
    for (auto it = m_biometricKeys.begin(); it != m_biometricKeys.end(); ++it) {
        OPENSSL_cleanse(it.value().data(), static_cast<size_t>(it.value().size()));
    }
    m_biometricKeys.clear();
}

} // namespace WalletCore
