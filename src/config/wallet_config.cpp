#include "config/wallet_config.h"
#include "issuance/issuance_profile.h"
#include "storage/file_wallet_key_store.h"
#include "unlock/unlock_types.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QStandardPaths>

namespace WalletCore {

WalletConfig::WalletConfig()
    : m_storagePath(QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation))
                        .filePath("wallet-key-store.json"))
    , m_walletKeyVersion(FileWalletKeyStore::DEFAULT_KEY_VERSION)
    , m_pinKdfIterations(FileWalletKeyStore::DEFAULT_PIN_KDF_ITERATIONS)
    , m_maxBiometricAttempts(UnlockPolicy().maxBiometricAttempts)
    , m_autoInitialize(UnlockPolicy().autoInitialize)
    , m_logEnabled(false)
{
}

bool WalletConfig::load(const QString& filePath)
{
    QFile file(filePath);

    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QString("Failed to open config file %1: %2").arg(filePath, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        m_lastError = QString("JSON parse error: %1").arg(parseError.errorString());
        return false;
    }

    if (!doc.isObject()) {
        m_lastError = "Root element must be an object";
        return false;
    }

    if (!fromJson(doc.object())) {
        return false;
    }

    qDebug() << "WalletConfig: Loaded" << filePath;
    return true;
}

bool WalletConfig::fromJson(const QJsonObject& json)
{
    // Parse into a copy so a bad key leaves this config untouched
    WalletConfig parsed(*this);

    if (!parsed.readString(json, ConfigKeys::STORAGE_PATH, &parsed.m_storagePath) ||
        !parsed.readInt(json, ConfigKeys::WALLET_KEY_VERSION, 1, &parsed.m_walletKeyVersion) ||
        !parsed.readInt(json, ConfigKeys::PIN_KDF_ITERATIONS, MIN_PIN_KDF_ITERATIONS, &parsed.m_pinKdfIterations) ||
        !parsed.readInt(json, ConfigKeys::MAX_BIOMETRIC_ATTEMPTS, 1, &parsed.m_maxBiometricAttempts) ||
        !parsed.readBool(json, ConfigKeys::AUTO_INITIALIZE, &parsed.m_autoInitialize) ||
        !parsed.readBool(json, ConfigKeys::LOG_ENABLED, &parsed.m_logEnabled) ||
        !parsed.readString(json, ConfigKeys::LOG_FILE, &parsed.m_logFilePath) ||
        !parsed.readString(json, ConfigKeys::ISSUANCE_CLIENT_ID, &parsed.m_issuanceClientId) ||
        !parsed.readString(json, ConfigKeys::ISSUANCE_REDIRECT_URI, &parsed.m_issuanceRedirectUri)) {
        m_lastError = parsed.m_lastError;
        qWarning() << "WalletConfig: Rejected configuration:" << m_lastError;
        return false;
    }

    parsed.m_lastError.clear();
    *this = parsed;
    return true;
}

QJsonObject WalletConfig::toJson() const
{
    QJsonObject json;
    json[ConfigKeys::STORAGE_PATH] = m_storagePath;
    json[ConfigKeys::WALLET_KEY_VERSION] = m_walletKeyVersion;
    json[ConfigKeys::PIN_KDF_ITERATIONS] = m_pinKdfIterations;
    json[ConfigKeys::MAX_BIOMETRIC_ATTEMPTS] = m_maxBiometricAttempts;
    json[ConfigKeys::AUTO_INITIALIZE] = m_autoInitialize;
    json[ConfigKeys::LOG_ENABLED] = m_logEnabled;
    json[ConfigKeys::LOG_FILE] = m_logFilePath;
    if (!m_issuanceClientId.isEmpty()) {
        json[ConfigKeys::ISSUANCE_CLIENT_ID] = m_issuanceClientId;
    }
    if (!m_issuanceRedirectUri.isEmpty()) {
        json[ConfigKeys::ISSUANCE_REDIRECT_URI] = m_issuanceRedirectUri;
    }
    return json;
}

void WalletConfig::setLogging(bool enabled, const QString& filePath)
{
    m_logEnabled = enabled;
    m_logFilePath = filePath;
}

UnlockPolicy WalletConfig::unlockPolicy() const
{
    UnlockPolicy policy;
    policy.maxBiometricAttempts = m_maxBiometricAttempts;
    policy.autoInitialize = m_autoInitialize;
    return policy;
}

IssuanceProfile WalletConfig::applyTo(const IssuanceProfile& profile) const
{
    IssuanceProfile result = profile;
    if (!m_issuanceClientId.isEmpty()) {
        result.clientId = m_issuanceClientId;
    }
    if (!m_issuanceRedirectUri.isEmpty()) {
        result.redirectUri = m_issuanceRedirectUri;
    }
    return result;
}

bool WalletConfig::readInt(const QJsonObject& json, const QString& key, int minimum, int* out)
{
    if (!json.contains(key)) {
        return true;
    }

    QJsonValue value = json[key];
    if (!value.isDouble()) {
        m_lastError = QString("%1 must be a number").arg(key);
        return false;
    }

    int number = value.toInt(minimum - 1);
    if (number < minimum) {
        m_lastError = QString("%1 must be an integer >= %2").arg(key).arg(minimum);
        return false;
    }

    *out = number;
    return true;
}

bool WalletConfig::readBool(const QJsonObject& json, const QString& key, bool* out)
{
    if (!json.contains(key)) {
        return true;
    }

    if (!json[key].isBool()) {
        m_lastError = QString("%1 must be a boolean").arg(key);
        return false;
    }

    *out = json[key].toBool();
    return true;
}

bool WalletConfig::readString(const QJsonObject& json, const QString& key, QString* out)
{
    if (!json.contains(key)) {
        return true;
    }

    if (!json[key].isString()) {
        m_lastError = QString("%1 must be a string").arg(key);
        return false;
    }

    *out = json[key].toString();
    return true;
}

} // namespace WalletCore
